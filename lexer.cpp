// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "lexer.hpp"
#include "error.hpp"
#include "utils.hpp"
namespace fnml {

const char*
describe_token_kind(Token_Kind kind) noexcept
  {
    switch(kind)
      {
      case token_group_start:
        return "`&`";

      case token_group_start_alt:
        return "`$`";

      case token_group_end:
        return "`/`";

      case token_assign:
        return "`=`";

      case token_comma:
        return "`,`";

      case token_lparen:
        return "`(`";

      case token_rparen:
        return "`)`";

      case token_colon:
        return "`:`";

      case token_percent:
        return "`%`";

      case token_plus:
        return "`+`";

      case token_minus:
        return "`-`";

      case token_star:
        return "`*`";

      case token_identifier:
        return "identifier";

      case token_integer:
        return "integer";

      case token_real:
        return "real";

      case token_complex:
        return "complex";

      case token_logical:
        return "logical";

      case token_string:
        return "string";

      case token_comment:
        return "comment";

      case token_whitespace:
        return "whitespace";

      case token_eof:
        return "end of input";

      case token_invalid:
        return "invalid character";

      default:
        return "unknown token";
      }
  }

bool
Token::
is_name() const noexcept
  {
    if(this->text.empty() || !(is_alpha(this->text[0]) || (this->text[0] == '_')))
      return false;

    return (this->kind == token_identifier) || (this->kind == token_logical);
  }

Lexer::
Lexer(const ::rocket::cow_string& text, const Scan_Options& sopts)
  : m_text(text), m_sopts(sopts)
  {
  }

void
Lexer::
do_advance(size_t n) noexcept
  {
    while((n != 0) && (this->m_pos < this->m_text.size())) {
      if(this->m_text[this->m_pos] == '\n') {
        this->m_line ++;
        this->m_column = 1;
      }
      else
        this->m_column ++;

      this->m_pos ++;
      n --;
    }
  }

bool
Lexer::
do_is_comment_char(int c) const noexcept
  {
    for(char d : this->m_sopts.comment_chars)
      if(c == static_cast<unsigned char>(d))
        return true;
    return false;
  }

Token_Kind
Lexer::
do_scan_number(const Token& tok)
  {
    bool real = false;

    // sign
    if(is_any(this->do_peek(0), '+', '-'))
      this->do_advance(1);

    // integral part
    while(is_digit(this->do_peek(0)))
      this->do_advance(1);

    // fractional part; the dot of `1.eq.` is not part of the number
    if(this->do_peek(0) == '.') {
      int next = this->do_peek(1);
      bool exp = is_any(next, 'e', 'E', 'd', 'D')
                 && (is_digit(this->do_peek(2))
                     || (is_any(this->do_peek(2), '+', '-') && is_digit(this->do_peek(3))));
      if(is_digit(next) || exp || !is_alpha(next)) {
        this->do_advance(1);
        real = true;

        while(is_digit(this->do_peek(0)))
          this->do_advance(1);
      }
    }

    // exponent, where `d` denotes double precision
    if(is_any(this->do_peek(0), 'e', 'E', 'd', 'D')) {
      size_t k = 1;
      if(is_any(this->do_peek(1), '+', '-'))
        k = 2;

      if(!is_digit(this->do_peek(k)))
        throw Error(error_invalid_exponent,
                    ::rocket::cow_string(this->m_text.data() + this->m_tpos,
                                         this->m_pos + k - this->m_tpos),
                    tok.line, tok.column);

      this->do_advance(k);
      real = true;

      while(is_digit(this->do_peek(0)))
        this->do_advance(1);
    }

    // kind suffix, such as `_8` or `_real64`
    if((this->do_peek(0) == '_') && is_alnum(this->do_peek(1))) {
      this->do_advance(1);
      real = true;

      while(is_alnum(this->do_peek(0)) || (this->do_peek(0) == '_'))
        this->do_advance(1);
    }

    return real ? token_real : token_integer;
  }

Token_Kind
Lexer::
do_scan_dotted_word()
  {
    // .true. .f. .and.
    size_t bpos = this->m_pos;
    this->do_advance(1);

    while(is_alnum(this->do_peek(0)) || (this->do_peek(0) == '_'))
      this->do_advance(1);

    if(this->do_peek(0) == '.')
      this->do_advance(1);

    if(is_any(to_lower(this->m_text[bpos + 1]), 't', 'f'))
      return token_logical;
    else
      return token_identifier;
  }

Token_Kind
Lexer::
do_scan_word()
  {
    size_t bpos = this->m_pos;
    this->do_advance(1);

    for(;;) {
      int c = this->do_peek(0);
      if(is_alnum(c) || (c == '_'))
        this->do_advance(1);
      else if(this->m_sopts.non_delimited_strings && is_any(c, '\'', '\"'))
        this->do_advance(1);
      else
        break;
    }

    const char* str = this->m_text.data() + bpos;
    size_t len = this->m_pos - bpos;
    if(ascii_iequals(str, len, "true") || ascii_iequals(str, len, "false")
       || ascii_iequals(str, len, "t") || ascii_iequals(str, len, "f"))
      return token_logical;
    else
      return token_identifier;
  }

void
Lexer::
do_scan_string(const Token& tok)
  {
    int quote = this->do_peek(0);
    this->do_advance(1);

    for(;;) {
      int c = this->do_peek(0);
      if((c < 0) || (c == '\n'))
        throw Error(error_unterminated_string,
                    ::rocket::cow_string(this->m_text.data() + this->m_tpos,
                                         this->m_pos - this->m_tpos),
                    tok.line, tok.column);

      if(c != quote) {
        this->do_advance(1);
        continue;
      }

      // A doubled quote denotes a literal quote.
      if(this->do_peek(1) == quote) {
        this->do_advance(2);
        continue;
      }

      this->do_advance(1);
      break;
    }
  }

Token
Lexer::
next()
  {
    Token tok;
    tok.line = this->m_line;
    tok.column = this->m_column;

    this->m_tpos = this->m_pos;
    int c = this->do_peek(0);
    if(c < 0) {
      tok.kind = token_eof;
      return tok;
    }

    if(is_blank(c)) {
      while(is_blank(this->do_peek(0)))
        this->do_advance(1);

      tok.kind = token_whitespace;
    }
    else if(this->do_is_comment_char(c)) {
      while((this->do_peek(0) >= 0) && (this->do_peek(0) != '\n'))
        this->do_advance(1);

      tok.kind = token_comment;
    }
    else
      switch(c)
        {
        case '&':
          this->do_advance(1);
          tok.kind = token_group_start;
          break;

        case '$':
          this->do_advance(1);
          tok.kind = token_group_start_alt;
          break;

        case '/':
          this->do_advance(1);
          tok.kind = token_group_end;
          break;

        case '=':
          this->do_advance(1);
          tok.kind = token_assign;
          break;

        case ',':
          this->do_advance(1);
          tok.kind = token_comma;
          break;

        case '(':
          this->do_advance(1);
          tok.kind = token_lparen;
          break;

        case ')':
          this->do_advance(1);
          tok.kind = token_rparen;
          break;

        case ':':
          this->do_advance(1);
          tok.kind = token_colon;
          break;

        case '%':
          this->do_advance(1);
          tok.kind = token_percent;
          break;

        case '*':
          this->do_advance(1);
          tok.kind = token_star;
          break;

        case '+':
        case '-':
          if(is_digit(this->do_peek(1))
             || ((this->do_peek(1) == '.') && is_digit(this->do_peek(2))))
            tok.kind = this->do_scan_number(tok);
          else if(is_alpha(this->do_peek(1))) {
            // -inf +nan
            this->do_advance(1);
            this->do_scan_word();
            tok.kind = token_identifier;
          }
          else {
            this->do_advance(1);
            tok.kind = (c == '+') ? token_plus : token_minus;
          }
          break;

        case '\'':
        case '\"':
          this->do_scan_string(tok);
          tok.kind = token_string;
          break;

        case '.':
          if(is_digit(this->do_peek(1)))
            tok.kind = this->do_scan_number(tok);
          else if(is_alpha(this->do_peek(1)))
            tok.kind = this->do_scan_dotted_word();
          else {
            this->do_advance(1);
            tok.kind = token_invalid;
          }
          break;

        default:
          if(is_digit(c))
            tok.kind = this->do_scan_number(tok);
          else if(is_alpha(c) || (c == '_'))
            tok.kind = this->do_scan_word();
          else {
            this->do_advance(1);
            tok.kind = token_invalid;
          }
          break;
        }

    tok.text.append(this->m_text.data() + this->m_tpos, this->m_pos - this->m_tpos);
    return tok;
  }

}  // namespace fnml
