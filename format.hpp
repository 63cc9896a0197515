// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_FORMAT_HPP_
#define FNML_FORMAT_HPP_

#include "fwd.hpp"
#include "value.hpp"
namespace fnml {

// These append the text of a scalar to `out`.
void
format_integer(::rocket::cow_string& out, V_integer value);

// A real number always has a decimal point or an exponent, so it will not be
// read back as an integer. Infinities are `+inf` and `-inf`; NaN is `nan`.
void
format_real(::rocket::cow_string& out, V_real value, const Format_Options& fopts);

void
format_complex(::rocket::cow_string& out, const V_complex& value, const Format_Options& fopts);

void
format_logical(::rocket::cow_string& out, V_logical value, const Format_Options& fopts);

// Quotes a string. The quote character is doubled if it appears inside.
void
format_character(::rocket::cow_string& out, const V_character& value,
                 const Format_Options& fopts);

// Appends the text of a value. Array elements are separated by `, `. A null
// value is empty. A derived type has no such form and is written as a
// placeholder.
void
format_value(::rocket::cow_string& out, const Value& value, const Format_Options& fopts);

// Formats array elements one by one. If `option_repeat_counts` is set, runs of
// equal elements are joined as `n*value`.
::rocket::cow_vector<::rocket::cow_string>
format_elements(const V_array& values, const Format_Options& fopts);

// Appends array elements with runs of equal elements joined as `n*value`, for
// example `1, 3*2, 3`. The result cannot be distinguished from the expanded
// array once it is parsed.
void
format_repeated(::rocket::cow_string& out, const V_array& values, const Format_Options& fopts);

}  // namespace fnml
#endif
