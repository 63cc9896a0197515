// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "scanner.hpp"
#include "error.hpp"
#include <clocale>
#undef NDEBUG
#include <assert.h>

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");

    const ::rocket::cow_string text = &"  &data_nml  ! g\n    x = 1,  ! c\n    y = 2.0\n/\n";

    {
      auto tokens = ::fnml::scan(text);
      assert(tokens.size() == 13);
      assert(tokens[0].kind == ::fnml::token_group_start);
      assert(tokens[2].kind == ::fnml::token_comment);
      assert(tokens[2].text == "! g");
      assert(tokens[6].kind == ::fnml::token_comma);
      assert(tokens[7].kind == ::fnml::token_comment);
      assert(tokens[11].kind == ::fnml::token_group_end);
      assert(tokens[12].kind == ::fnml::token_eof);

      for(const auto& tok : tokens)
        assert(tok.kind != ::fnml::token_whitespace);
    }

    {
      auto tokens = ::fnml::scan_preserving(text);
      assert(tokens[0].kind == ::fnml::token_whitespace);
      assert(tokens[tokens.size() - 1].kind == ::fnml::token_eof);

      ::rocket::cow_string str;
      for(const auto& tok : tokens)
        str.append(tok.text);
      assert(str == text);
    }

    {
      auto tokens = ::fnml::scan_formatted(text);
      assert(tokens[0].token.kind == ::fnml::token_group_start);
      assert(tokens[0].starts_line);
      assert(tokens[0].indentation == "  ");
      assert(tokens[1].token.text == "data_nml");
      assert(!tokens[1].starts_line);
      assert(tokens[1].trailing == "  ");
      assert(tokens[3].token.text == "x");
      assert(tokens[3].starts_line);
      assert(tokens[3].indentation == "    ");
      assert(tokens[tokens.size() - 1].token.kind == ::fnml::token_eof);
      assert(::fnml::reconstruct(tokens) == text);
    }

    {
      auto tokens = ::fnml::scan(::rocket::cow_string());
      assert(tokens.size() == 1);
      assert(tokens[0].kind == ::fnml::token_eof);

      auto ftokens = ::fnml::scan_formatted(::rocket::cow_string(&"   "));
      assert(ftokens.size() == 1);
      assert(ftokens[0].indentation == "   ");
      assert(::fnml::reconstruct(ftokens) == "   ");
    }

    {
      bool thrown = false;
      try {
        ::fnml::scan(::rocket::cow_string(&"&g\n x = \"abc\n/"));
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_unterminated_string);
        assert(err.line() == 2);
        assert(err.column() == 6);
      }
      assert(thrown);
    }
  }
