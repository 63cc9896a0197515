// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_PARSER_HPP_
#define FNML_PARSER_HPP_

#include "fwd.hpp"
#include "scanner.hpp"
#include "namelist.hpp"
#include <cstdio>
namespace fnml {

// Builds a document from tokens without whitespace, as returned by `scan()`.
// Tokens before the first group are ignored. An `Error` is thrown if a group
// is malformed.
Namelist
parse_tokens(const Token_List& tokens);

// Scans and parses a whole document.
Namelist
parse_document(const ::rocket::cow_string& text, const Scan_Options& sopts = Scan_Options());

// This class parses a document, and optionally rewrites it with values from a
// patch in a single forward pass. All text that is not replaced, including
// whitespace and comments, is copied exactly. Variables and groups that only
// exist in the patch are appended in canonical form: new variables before the
// end of their group, and new groups after the end of the document.
class Streaming_Parser
  {
  private:
    Token_List m_tokens;

  public:
    // Scans `text`. Lexical errors are thrown as `Error`.
    explicit
    Streaming_Parser(const ::rocket::cow_string& text, const Scan_Options& sopts = Scan_Options());

  public:
    // Gets all tokens, including whitespace and comments.
    const Token_List&
    tokens() const noexcept
      { return this->m_tokens;  }

    // Parses the document.
    Namelist
    parse() const;

    // Writes the document with values from `patch` replaced, and returns the
    // patched document. If a patch value can't be written in place of an
    // assignment, an `Error` with `error_incompatible_patch` is thrown.
    Namelist
    parse_and_patch(::rocket::cow_string& str, const Namelist& patch,
                    const Format_Options& fopts = Format_Options()) const;

    Namelist
    parse_and_patch(::rocket::tinybuf& buf, const Namelist& patch,
                    const Format_Options& fopts = Format_Options()) const;

    Namelist
    parse_and_patch(::std::FILE* fp, const Namelist& patch,
                    const Format_Options& fopts = Format_Options()) const;
  };

}  // namespace fnml
#endif
