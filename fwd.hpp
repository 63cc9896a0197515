// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_FWD_HPP_
#define FNML_FWD_HPP_

#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/cow_hashmap.hpp>
#include <cstdint>
#include <cstddef>
namespace fnml {

struct Token;
struct Parser_Context;
class Error;
class Value;
class Group;
class Namelist;
class Index_Iterator;

// These are options for formatting. Multiple options can be OR'd.
enum Options : ::std::uint32_t
  {
    options_default        = 0,
    option_uppercase       = 0b00000001,  // `.TRUE.` and `&GROUP`
    option_fortran_double  = 0b00000010,  // `1.5d3` instead of `1.5e3`
    option_double_quotes   = 0b00000100,
    option_complex_math    = 0b00001000,  // `1.0+2.0*i` instead of `(1.0, 2.0)`
    option_repeat_counts   = 0b00010000,  // `3*0` instead of `0, 0, 0`
    option_end_comma       = 0b00100000,
    option_sort_groups     = 0b01000000,
    option_sort_variables  = 0b10000000,
  };

constexpr
Options
operator|(Options x, Options y) noexcept
  { return static_cast<Options>(static_cast<::std::uint32_t>(x) | y);  }

constexpr
Options
operator&(Options x, Options y) noexcept
  { return static_cast<Options>(static_cast<::std::uint32_t>(x) & y);  }

// This structure controls how values and documents are printed. The default
// values match what most Fortran compilers write.
struct Format_Options
  {
    Options opts = options_default;

    // number of significant digits after the decimal point; if negative, the
    // shortest representation that round-trips is chosen
    int float_precision = -1;

    // if `exponential` is set, reals whose magnitudes are outside
    // `[exp_min, exp_max]` are printed in exponential form
    bool exponential = false;
    double exp_min = 1.0e-4;
    double exp_max = 1.0e+6;

    // layout of documents
    int column_width = 72;
    ::rocket::cow_string indent = ::rocket::cow_string(&"    ");
    int default_start_index = 1;

    bool
    has(Options opt) const noexcept
      { return (this->opts & opt) != options_default;  }
  };

// This structure controls how text is split into tokens.
struct Scan_Options
  {
    // each character starts a comment that runs to the end of the line
    ::rocket::cow_string comment_chars = ::rocket::cow_string(&"!#");

    // allow quotes inside bare words such as `don't`
    bool non_delimited_strings = true;
  };

}  // namespace fnml
#endif
