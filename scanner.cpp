// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "scanner.hpp"
#include "lexer.hpp"
namespace fnml {

Token_List
scan(const ::rocket::cow_string& text, const Scan_Options& sopts)
  {
    Token_List tokens;
    Lexer lexer(text, sopts);

    for(;;) {
      Token tok = lexer.next();
      if(tok.kind == token_whitespace)
        continue;

      bool eof = tok.kind == token_eof;
      tokens.push_back(::std::move(tok));
      if(eof)
        return tokens;
    }
  }

Token_List
scan_preserving(const ::rocket::cow_string& text, const Scan_Options& sopts)
  {
    Token_List tokens;
    Lexer lexer(text, sopts);

    for(;;) {
      Token tok = lexer.next();
      bool eof = tok.kind == token_eof;
      tokens.push_back(::std::move(tok));
      if(eof)
        return tokens;
    }
  }

::rocket::cow_vector<Formatted_Token>
scan_formatted(const ::rocket::cow_string& text, const Scan_Options& sopts)
  {
    ::rocket::cow_vector<Formatted_Token> tokens;
    Lexer lexer(text, sopts);
    ::rocket::cow_string pending;
    bool at_line_start = true;

    for(;;) {
      Token tok = lexer.next();
      if(tok.kind == token_whitespace) {
        if(tokens.empty()) {
          // Keep it for the first token.
          pending.append(tok.text);
          continue;
        }

        tokens.mut(tokens.size() - 1).trailing.append(tok.text);

        // Whitespace after the last line break is the indentation of the
        // next token.
        size_t brk = tok.text.size();
        while((brk != 0) && (tok.text[brk - 1] != '\n'))
          brk --;

        pending.clear();
        if(brk != 0) {
          pending.append(tok.text.data() + brk, tok.text.size() - brk);
          at_line_start = true;
        }
        continue;
      }

      auto& ftok = tokens.emplace_back();
      ftok.token = tok;
      ftok.starts_line = at_line_start;
      if(at_line_start)
        ftok.indentation = pending;

      pending.clear();
      at_line_start = false;

      if(tok.kind == token_eof)
        return tokens;
    }
  }

::rocket::cow_string
reconstruct(const ::rocket::cow_vector<Formatted_Token>& tokens)
  {
    ::rocket::cow_string text;

    for(size_t k = 0;  k != tokens.size();  ++k) {
      const auto& ftok = tokens[k];
      if(k == 0)
        text.append(ftok.indentation);

      text.append(ftok.token.text);
      text.append(ftok.trailing);
    }
    return text;
  }

}  // namespace fnml
