// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "parser.hpp"
#include "error.hpp"
#include <clocale>
#undef NDEBUG
#include <assert.h>

static
::fnml::Error_Code
parse_error(const char* text)
  {
    try {
      ::fnml::parse_document(::rocket::cow_string(text));
    }
    catch(::fnml::Error& err) {
      return err.code();
    }
    return ::fnml::error_none;
  }

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");

    {
      auto nml = ::fnml::parse_document(&R"(
This text before the first group is ignored.
&Run_NML  ! the run
  Title = 'test run', steps = 10,
  dt = 1.5d-3   ! step
  verbose = .T.
  ratio = 3*0.5,
  vals = 1, , 3,
  z = (1.0, -2.0)
  empty =
  word = hello
/
)");
      assert(nml.size() == 1);
      const auto& grp = nml.at_group(&"run_nml");
      assert(grp.size() == 9);
      assert(grp.names()[0] == "title");
      assert(grp.at(&"title") == ::fnml::Value(&"test run"));
      assert(grp.at(&"steps") == ::fnml::Value(10));
      assert(grp.at(&"dt") == ::fnml::Value(1.5e-3));
      assert(*(grp.comment(&"dt")) == "step");
      assert(grp.comment(&"title") == nullptr);
      assert(grp.at(&"verbose") == ::fnml::Value(true));
      assert(grp.at(&"ratio") == ::fnml::Value(::fnml::V_array{ 0.5, 0.5, 0.5 }));
      assert(grp.at(&"vals") == ::fnml::Value(::fnml::V_array{ 1, ::fnml::Value(), 3 }));
      assert(grp.at(&"z") == ::fnml::Value(::fnml::V_complex(1.0, -2.0)));
      assert(grp.at(&"empty").is_null());
      assert(grp.at(&"word") == ::fnml::Value(&"hello"));
    }

    {
      // Repeat counts produce arrays even for a single run.
      auto nml = ::fnml::parse_document(&"&g a = 2*, b = 1*7 /");
      const auto& grp = nml.at_group(&"g");
      assert(grp.at(&"a") == ::fnml::Value(::fnml::V_array{ ::fnml::Value(), ::fnml::Value() }));
      assert(grp.at(&"b") == ::fnml::Value(::fnml::V_array{ 7 }));
    }

    {
      // Subscripts
      auto nml = ::fnml::parse_document(&R"(&g
  a(3) = 5
  b(0:2) = 1, 2, 3
  c(1:3) = 4, 5, 6
  m(1:2, 0:1) = 1, 2, 3, 4
  s(2, 3) = .false.
/)");
      const auto& grp = nml.at_group(&"g");
      assert(grp.at(&"a") == ::fnml::Value(5));
      assert(grp.start_indices(&"a")->size() == 1);
      assert((*grp.start_indices(&"a"))[0] == 3);

      assert(grp.at(&"b").as_array().size() == 3);
      assert((*grp.start_indices(&"b"))[0] == 0);

      assert(grp.at(&"c").is_array());
      assert(grp.start_indices(&"c") == nullptr);

      const auto& marr = grp.at(&"m").as_multi_array();
      assert(marr.dimensions.size() == 2);
      assert(marr.dimensions[0] == 2);
      assert(marr.dimensions[1] == 2);
      assert(marr.start_indices[1] == 0);
      assert(marr.values.size() == 4);
      grp.validate();

      assert(grp.at(&"s") == ::fnml::Value(false));
      assert(grp.start_indices(&"s")->size() == 2);
    }

    {
      // Derived types
      auto nml = ::fnml::parse_document(&R"(&g
  p%x = 1
  p%Y = 'two'
  q(2)%v = 3.5
  q(1)%v = 1.5
  r%inner%w = .true.
/)");
      const auto& grp = nml.at_group(&"g");
      const auto& p = grp.at(&"p").as_derived();
      assert(p.size() == 2);
      assert(p.at(&"x") == ::fnml::Value(1));
      assert(p.at(&"y") == ::fnml::Value(&"two"));

      const auto& q = grp.at(&"q").as_derived_array();
      assert(q.size() == 2);
      assert(q[0].at(&"v") == ::fnml::Value(1.5));
      assert(q[1].at(&"v") == ::fnml::Value(3.5));

      const auto& r = grp.at(&"r").as_derived();
      assert(r.at(&"inner").as_derived().at(&"w") == ::fnml::Value(true));
    }

    {
      // Group terminators
      auto nml = ::fnml::parse_document(&R"(
$first a = 1 $end
&second b = 2 &end
&third c = 3
&fourth d = 4 /
$fifth e = 5 $
)");
      assert(nml.size() == 5);
      assert(nml.group_names()[2] == "third");
      assert(nml.at_group(&"third").at(&"c") == ::fnml::Value(3));
      assert(nml.at_group(&"fourth").at(&"d") == ::fnml::Value(4));
      assert(nml.at_group(&"fifth").at(&"e") == ::fnml::Value(5));
    }

    {
      // A bare `$` closes a group before the next one.
      auto nml = ::fnml::parse_document(&"$g x=1 $\n$h y=2 $\n&k z=3 &\n&m w=4 /");
      assert(nml.size() == 4);
      assert(nml.group_names()[1] == "h");
      assert(nml.at_group(&"g").at(&"x") == ::fnml::Value(1));
      assert(nml.at_group(&"h").at(&"y") == ::fnml::Value(2));
      assert(nml.at_group(&"k").at(&"z") == ::fnml::Value(3));
      assert(nml.at_group(&"m").at(&"w") == ::fnml::Value(4));
    }

    {
      // A repeated group continues the existing one.
      auto nml = ::fnml::parse_document(&"&g a = 1 / &h / &G b = 2, a = 3 /");
      assert(nml.size() == 2);
      const auto& grp = nml.at_group(&"g");
      assert(grp.size() == 2);
      assert(grp.at(&"a") == ::fnml::Value(3));
      assert(nml.at_group(&"h").empty());
    }

    {
      // Names are case-insensitive; `t` and `f` may be names too.
      auto nml = ::fnml::parse_document(&"&g T = F, f = t /");
      const auto& grp = nml.at_group(&"g");
      assert(grp.at(&"t") == ::fnml::Value(false));
      assert(grp.at(&"f") == ::fnml::Value(true));
    }

    {
      auto tokens = ::fnml::scan(&"&g x = 1 /");
      auto nml = ::fnml::parse_tokens(tokens);
      assert(nml.at_group(&"g").at(&"x") == ::fnml::Value(1));

      ::fnml::Streaming_Parser parser(&"&g x = 1 /");
      assert(parser.tokens().size() == 11);
      assert(parser.parse() == nml);
    }

    {
      assert(parse_error("") == ::fnml::error_none);
      assert(parse_error("no groups at all") == ::fnml::error_none);
      assert(parse_error("&") == ::fnml::error_unexpected_eof);
      assert(parse_error("& 5 /") == ::fnml::error_unexpected_token);
      assert(parse_error("&g x = 1") == ::fnml::error_unexpected_eof);
      assert(parse_error("&g x 1 /") == ::fnml::error_unexpected_token);
      assert(parse_error("&g x = @ /") == ::fnml::error_invalid_token);
      assert(parse_error("&g x(1 /") == ::fnml::error_unexpected_eof);
      assert(parse_error("&g x(1:2:0) = 1, 2 /") == ::fnml::error_invalid_index);
      assert(parse_error("&g x = 'abc /") == ::fnml::error_unterminated_string);
      assert(parse_error("&g x = 1e /") == ::fnml::error_invalid_exponent);
      assert(parse_error("&g x = 0*1 /") == ::fnml::error_invalid_literal);
      assert(parse_error("&g x = 1048577*0 /") == ::fnml::error_invalid_literal);
      assert(parse_error("&g x = 9223372036854775807*0 /") == ::fnml::error_invalid_literal);
      assert(parse_error("&g a(1000000000)%b = 1 /") == ::fnml::error_invalid_index);
      assert(parse_error("&g a(0)%b = 1 /") == ::fnml::error_invalid_index);
      assert(parse_error("&g x = ((((1 /") == ::fnml::error_invalid_literal);
      assert(parse_error("&g x = (1.0, 2.0 /") == ::fnml::error_invalid_literal);
      assert(parse_error("&g = 1 /") == ::fnml::error_unexpected_token);
    }

    {
      bool thrown = false;
      try {
        ::fnml::parse_document(&"&g\n  x = 1\n  = 2\n/");
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_unexpected_token);
        assert(err.kind() == ::fnml::error_kind_syntax);
        assert(err.line() == 3);
        assert(err.column() == 3);
      }
      assert(thrown);
    }
  }
