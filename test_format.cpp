// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "format.hpp"
#include "value.hpp"
#include <cmath>
#include <clocale>
#undef NDEBUG
#include <assert.h>

static
::rocket::cow_string
real_text(double value, const ::fnml::Format_Options& fopts = ::fnml::Format_Options())
  {
    ::rocket::cow_string str;
    ::fnml::format_real(str, value, fopts);
    return str;
  }

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");

    {
      ::rocket::cow_string str;
      ::fnml::format_integer(str, -9223372036854775807 - 1);
      assert(str == "-9223372036854775808");
    }

    {
      assert(real_text(2.0) == "2.0");
      assert(real_text(0.0) == "0.0");
      assert(real_text(-0.001) == "-0.001");
      assert(real_text(123.456) == "123.456");
      assert(real_text(1.5e7) == "15000000.0");
      assert(real_text(1.0e-20) == "1e-20");
      assert(real_text(2.5e300) == "2.5e300");
      assert(real_text(NAN) == "nan");
      assert(real_text(HUGE_VAL) == "+inf");
      assert(real_text(-HUGE_VAL) == "-inf");

      // Formatted reals are never read back as integers.
      for(double value : { 1.0, 100.0, 1.0e15, 0.1, 1.0 / 3 }) {
        auto text = real_text(value);
        auto back = ::fnml::parse_value(text);
        assert(back.is_real());
        assert(back.as_real() == value);
      }
    }

    // The output doesn't depend on the decimal point of the locale.
    for(const char* name : { "de_DE.UTF-8", "de_DE", "fr_FR.UTF-8", "ru_RU.UTF-8" })
      if(::setlocale(LC_NUMERIC, name)) {
        assert(real_text(0.5) == "0.5");
        assert(real_text(-1234.25) == "-1234.25");
        assert(real_text(1.0e-20) == "1e-20");

        ::fnml::Format_Options fopts;
        fopts.float_precision = 2;
        assert(real_text(0.5, fopts) == "0.50");
        fopts.exponential = true;
        assert(real_text(1.5e7, fopts) == "1.50e7");

        ::rocket::cow_string str;
        ::fnml::format_value(str, ::fnml::V_array{ 0.5, 1.5 }, ::fnml::Format_Options());
        assert(str == "0.5, 1.5");
        ::setlocale(LC_NUMERIC, "C.UTF-8");
        break;
      }

    {
      ::fnml::Format_Options fopts;
      fopts.float_precision = 3;
      assert(real_text(2.0, fopts) == "2.000");
      fopts.float_precision = 0;
      assert(real_text(7.0, fopts) == "7.0");
    }

    {
      ::fnml::Format_Options fopts;
      fopts.exponential = true;
      assert(real_text(1.5e7, fopts) == "1.5e7");
      assert(real_text(2.5e-5, fopts) == "2.5e-5");
      assert(real_text(42.0, fopts) == "42.0");

      fopts.opts = ::fnml::option_fortran_double;
      assert(real_text(1.5e7, fopts) == "1.5d7");
      assert(::fnml::parse_value(real_text(1.5e7, fopts)) == ::fnml::Value(1.5e7));
    }

    {
      ::rocket::cow_string str;
      ::fnml::Format_Options fopts;
      ::fnml::format_complex(str, ::fnml::V_complex(1.0, 2.0), fopts);
      assert(str == "(1.0, 2.0)");

      fopts.opts = ::fnml::option_complex_math;
      str.clear();
      ::fnml::format_complex(str, ::fnml::V_complex(1.0, -2.0), fopts);
      assert(str == "1.0-2.0*i");
      str.clear();
      ::fnml::format_complex(str, ::fnml::V_complex(1.0, 2.0), fopts);
      assert(str == "1.0+2.0*i");
    }

    {
      ::rocket::cow_string str;
      ::fnml::format_character(str, &"it's", ::fnml::Format_Options());
      assert(str == "'it''s'");
      assert(::fnml::parse_value(str) == ::fnml::Value(&"it's"));
    }

    {
      // Repeat compaction
      ::fnml::V_array arr = { 1, 2, 2, 2, 3 };
      ::rocket::cow_string str;
      ::fnml::format_repeated(str, arr, ::fnml::Format_Options());
      assert(str == "1, 3*2, 3");
      assert(::fnml::parse_value_list(str) == ::fnml::Value(arr));

      auto elems = ::fnml::format_elements(arr, ::fnml::Format_Options());
      assert(elems.size() == 5);

      ::fnml::Format_Options fopts;
      fopts.opts = ::fnml::option_repeat_counts;
      elems = ::fnml::format_elements(arr, fopts);
      assert(elems.size() == 3);
      assert(elems[1] == "3*2");
    }

    {
      ::rocket::cow_string str;
      ::fnml::format_value(str, ::fnml::V_array{ 1.5, ::fnml::Value(), true }, ::fnml::Format_Options());
      assert(str == "1.5, , .true.");
    }
  }
