// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_TOKEN_HPP_
#define FNML_TOKEN_HPP_

#include "fwd.hpp"
namespace fnml {

enum Token_Kind : ::std::uint8_t
  {
    token_group_start      =  0,  // &
    token_group_start_alt  =  1,  // $
    token_group_end        =  2,  // /
    token_assign           =  3,  // =
    token_comma            =  4,  // ,
    token_lparen           =  5,  // (
    token_rparen           =  6,  // )
    token_colon            =  7,  // :
    token_percent          =  8,  // %
    token_plus             =  9,  // +
    token_minus            = 10,  // -
    token_star             = 11,  // *
    token_identifier       = 12,
    token_integer          = 13,
    token_real             = 14,
    token_complex          = 15,
    token_logical          = 16,
    token_string           = 17,
    token_comment          = 18,
    token_whitespace       = 19,
    token_eof              = 20,
    token_invalid          = 21,
  };

// Gets a static string that describes a token kind, such as `identifier`.
const char*
describe_token_kind(Token_Kind kind) noexcept;

// A token is a piece of source text. The raw lexeme is kept exactly as it
// appears in the source, so concatenating all tokens reproduces the input.
struct Token
  {
    Token_Kind kind = token_eof;
    ::rocket::cow_string text;
    ::std::int64_t line = 0;
    ::std::int64_t column = 0;

    bool
    is(Token_Kind k) const noexcept
      { return this->kind == k;  }

    // Checks whether this token opens a group (`&` or `$`).
    bool
    is_group_start() const noexcept
      { return (this->kind == token_group_start) || (this->kind == token_group_start_alt);  }

    // Checks whether this token carries no meaning to the parser.
    bool
    is_trivia() const noexcept
      { return (this->kind == token_whitespace) || (this->kind == token_comment);  }

    // Checks whether this token may be used as a name. Bare `t` and `f` are
    // scanned as logical literals but are valid names too.
    bool
    is_name() const noexcept;
  };

}  // namespace fnml
#endif
