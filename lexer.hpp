// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_LEXER_HPP_
#define FNML_LEXER_HPP_

#include "fwd.hpp"
#include "token.hpp"
namespace fnml {

// This class splits source text into tokens, one at a time. Whitespace is
// always returned as separate tokens; it is up to the caller to drop them.
// Lexical errors (unterminated strings and malformed exponents) are thrown
// as `Error`. Other unexpected characters produce `token_invalid`, so the
// parser may report them in context.
class Lexer
  {
  private:
    ::rocket::cow_string m_text;
    Scan_Options m_sopts;
    size_t m_pos = 0;
    size_t m_tpos = 0;  // start of the current token
    ::std::int64_t m_line = 1;
    ::std::int64_t m_column = 1;

  public:
    explicit
    Lexer(const ::rocket::cow_string& text, const Scan_Options& sopts = Scan_Options());

  private:
    int
    do_peek(size_t k) const noexcept
      {
        size_t i = this->m_pos + k;
        return (i < this->m_text.size()) ? static_cast<unsigned char>(this->m_text[i]) : -1;
      }

    void
    do_advance(size_t n) noexcept;

    bool
    do_is_comment_char(int c) const noexcept;

    Token_Kind
    do_scan_number(const Token& tok);

    Token_Kind
    do_scan_dotted_word();

    Token_Kind
    do_scan_word();

    void
    do_scan_string(const Token& tok);

  public:
    // Gets the position of the next character.
    size_t
    offset() const noexcept
      { return this->m_pos;  }

    ::std::int64_t
    line() const noexcept
      { return this->m_line;  }

    ::std::int64_t
    column() const noexcept
      { return this->m_column;  }

    bool
    at_eof() const noexcept
      { return this->m_pos >= this->m_text.size();  }

    // Gets the next token. At the end of input, a `token_eof` token is
    // returned, and every subsequent call returns another one.
    Token
    next();
  };

}  // namespace fnml
#endif
