// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_SCANNER_HPP_
#define FNML_SCANNER_HPP_

#include "fwd.hpp"
#include "token.hpp"
namespace fnml {

using Token_List = ::rocket::cow_vector<Token>;

// Scans a whole text with whitespace tokens removed. Comments are kept. The
// list always ends with a `token_eof` token.
Token_List
scan(const ::rocket::cow_string& text, const Scan_Options& sopts = Scan_Options());

// Scans a whole text with every token kept. Concatenating the texts of all
// tokens reproduces the input exactly.
Token_List
scan_preserving(const ::rocket::cow_string& text, const Scan_Options& sopts = Scan_Options());

// A significant token, with the whitespace that follows it, and the
// indentation of the line where it starts, if it is the first token on that
// line.
struct Formatted_Token
  {
    Token token;
    ::rocket::cow_string trailing;
    ::rocket::cow_string indentation;
    bool starts_line = false;
  };

// Scans a whole text into formatted tokens. Leading whitespace before the
// first token is stored as the indentation of that token.
::rocket::cow_vector<Formatted_Token>
scan_formatted(const ::rocket::cow_string& text, const Scan_Options& sopts = Scan_Options());

// Puts formatted tokens back together.
::rocket::cow_string
reconstruct(const ::rocket::cow_vector<Formatted_Token>& tokens);

}  // namespace fnml
#endif
