// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "format.hpp"
#include "utils.hpp"
#include <rocket/ascii_numput.hpp>
#include <rocket/xthrow.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
namespace fnml {
namespace {

void
do_sprintf(::rocket::cow_string& out, const char* format, int prec, double value)
  {
    char temp[400];
    int len = ::std::snprintf(temp, sizeof(temp), format, prec, value);
    if(len < 0)
      ::rocket::sprintf_and_throw<::std::invalid_argument>(
            "fnml::format_real: could not format `%g`", value);

    // The decimal point may be a comma in some locales.
    size_t bpos = out.size();
    out.append(temp, ::std::min(static_cast<size_t>(len), sizeof(temp) - 1));
    for(size_t k = bpos;  k != out.size();  ++k)
      if(out[k] == ',')
        out.mut_data()[k] = '.';
  }

// Removes `+` and leading zeroes from an exponent. `1.5e+07` becomes `1.5e7`.
void
do_tidy_exponent(::rocket::cow_string& str, size_t from)
  {
    ::rocket::cow_string res;
    size_t k = from;
    while((k != str.size()) && (str[k] != 'e'))
      k ++;

    if(k == str.size())
      return;

    res.append(str.data(), k + 1);
    k ++;
    if(str[k] == '-')
      res.push_back(str[k]);
    if(is_any(str[k], '+', '-'))
      k ++;

    while((k + 1 < str.size()) && (str[k] == '0'))
      k ++;

    res.append(str.data() + k, str.size() - k);
    str.swap(res);
  }

void
do_use_fortran_double(::rocket::cow_string& str, const Format_Options& fopts)
  {
    if(fopts.has(option_fortran_double))
      for(size_t k = 0;  k != str.size();  ++k)
        if(str[k] == 'e')
          str.mut_data()[k] = 'd';
  }

// These are the shortest decimal digits of a finite non-zero value, with
// no leading or trailing zeroes. The value is `0.digits * 10^(exp10 + 1)`.
struct Shortest_Digits
  {
    bool negative = false;
    ::rocket::cow_string digits;
    int exp10 = 0;
  };

void
do_get_shortest_digits(Shortest_Digits& sd, double value)
  {
    ::rocket::ascii_numput nump;
    nump.put_DED(value);

    // -1.2345e+06
    const char* str = nump.data();
    size_t len = nump.size();
    size_t k = 0;
    if(is_any(str[k], '+', '-')) {
      sd.negative = str[k] == '-';
      k ++;
    }

    int before_point = 0;
    bool seen_point = false;
    while((k != len) && (is_digit(str[k]) || (str[k] == '.'))) {
      if(str[k] == '.')
        seen_point = true;
      else if(sd.digits.empty() && (str[k] == '0')) {
        // leading zero
        if(seen_point)
          before_point --;
      }
      else {
        sd.digits.push_back(str[k]);
        if(!seen_point)
          before_point ++;
      }
      k ++;
    }

    int exp_part = 0;
    if((k != len) && is_any(str[k], 'e', 'E')) {
      k ++;
      bool exp_neg = false;
      if((k != len) && is_any(str[k], '+', '-')) {
        exp_neg = str[k] == '-';
        k ++;
      }
      while((k != len) && is_digit(str[k]))
        exp_part = exp_part * 10 + (str[k++] - '0');
      if(exp_neg)
        exp_part = -exp_part;
    }

    while(!sd.digits.empty() && (sd.digits.back() == '0'))
      sd.digits.pop_back();

    sd.exp10 = before_point + exp_part - 1;
  }

void
do_format_exponential(::rocket::cow_string& out, double value, const Format_Options& fopts)
  {
    ::rocket::cow_string str;
    if(fopts.float_precision >= 0) {
      do_sprintf(str, "%.*e", fopts.float_precision, value);
      do_tidy_exponent(str, 0);
    }
    else {
      // 1.5e7
      Shortest_Digits sd;
      do_get_shortest_digits(sd, value);
      if(sd.negative)
        str.push_back('-');
      str.push_back(sd.digits[0]);
      if(sd.digits.size() > 1) {
        str.push_back('.');
        str.append(sd.digits.data() + 1, sd.digits.size() - 1);
      }
      str.push_back('e');
      format_integer(str, sd.exp10);
    }

    do_use_fortran_double(str, fopts);
    out.append(str);
  }

}  // namespace

void
format_integer(::rocket::cow_string& out, V_integer value)
  {
    ::rocket::ascii_numput nump;
    nump.put_DI(value);
    out.append(nump.data(), nump.size());
  }

void
format_real(::rocket::cow_string& out, V_real value, const Format_Options& fopts)
  {
    if(::std::isnan(value)) {
      out.append("nan");
      return;
    }

    if(::std::isinf(value)) {
      out.append((value < 0) ? "-inf" : "+inf");
      return;
    }

    double mag = ::std::fabs(value);
    if(fopts.exponential && (mag != 0) && ((mag < fopts.exp_min) || (mag > fopts.exp_max)))
      return do_format_exponential(out, value, fopts);

    if(fopts.float_precision >= 0) {
      ::rocket::cow_string str;
      do_sprintf(str, "%.*f", fopts.float_precision, value);
      if(fopts.float_precision == 0)
        str.append(".0");
      out.append(str);
      return;
    }

    if(value == 0) {
      out.append(::std::signbit(value) ? "-0.0" : "0.0");
      return;
    }

    // Use the fewest significant digits. Moderate magnitudes are written in
    // fixed-point notation, like `123.456` and `0.001`.
    Shortest_Digits sd;
    do_get_shortest_digits(sd, value);
    if((sd.exp10 < -5) || (sd.exp10 >= 16))
      return do_format_exponential(out, value, fopts);

    if(sd.negative)
      out.push_back('-');

    size_t ndigits = sd.digits.size();
    if(sd.exp10 < 0) {
      // 0.00123
      out.append("0.");
      out.append(static_cast<size_t>(-1 - sd.exp10), '0');
      out.append(sd.digits);
      return;
    }

    // 1234.5
    size_t nint = static_cast<size_t>(sd.exp10) + 1;
    if(ndigits > nint) {
      out.append(sd.digits.data(), nint);
      out.push_back('.');
      out.append(sd.digits.data() + nint, ndigits - nint);
    }
    else {
      out.append(sd.digits);
      out.append(nint - ndigits, '0');
      out.append(".0");
    }
  }

void
format_complex(::rocket::cow_string& out, const V_complex& value, const Format_Options& fopts)
  {
    if(fopts.has(option_complex_math)) {
      // 1.0+2.0*i
      format_real(out, value.real(), fopts);
      if(!(value.imag() < 0))
        out.push_back('+');
      format_real(out, value.imag(), fopts);
      out.append("*i");
      return;
    }

    // (1.0, 2.0)
    out.push_back('(');
    format_real(out, value.real(), fopts);
    out.append(", ");
    format_real(out, value.imag(), fopts);
    out.push_back(')');
  }

void
format_logical(::rocket::cow_string& out, V_logical value, const Format_Options& fopts)
  {
    if(fopts.has(option_uppercase))
      out.append(value ? ".TRUE." : ".FALSE.");
    else
      out.append(value ? ".true." : ".false.");
  }

void
format_character(::rocket::cow_string& out, const V_character& value,
                 const Format_Options& fopts)
  {
    char quote = fopts.has(option_double_quotes) ? '\"' : '\'';
    out.push_back(quote);
    for(char c : value) {
      out.push_back(c);
      if(c == quote)
        out.push_back(quote);
    }
    out.push_back(quote);
  }

void
format_value(::rocket::cow_string& out, const Value& value, const Format_Options& fopts)
  {
    switch(value.type())
      {
      case t_null:
        break;

      case t_integer:
        format_integer(out, value.as_integer());
        break;

      case t_real:
        format_real(out, value.as_real(), fopts);
        break;

      case t_complex:
        format_complex(out, value.as_complex(), fopts);
        break;

      case t_logical:
        format_logical(out, value.as_logical(), fopts);
        break;

      case t_character:
        format_character(out, value.as_character(), fopts);
        break;

      case t_array:
      case t_multi_array:
        {
          auto elems = format_elements(value.as_array(), fopts);
          for(size_t k = 0;  k != elems.size();  ++k) {
            if(k != 0)
              out.append(", ");
            out.append(elems[k]);
          }
        }
        break;

      case t_derived:
        out.append("<derived_type>");
        break;

      case t_derived_array:
        out.append("<derived_type_array>");
        break;

      default:
        ::rocket::sprintf_and_throw<::std::invalid_argument>(
              "fnml::format_value: unknown type enumeration `%d`",
              static_cast<int>(value.type()));
      }
  }

::rocket::cow_vector<::rocket::cow_string>
format_elements(const V_array& values, const Format_Options& fopts)
  {
    ::rocket::cow_vector<::rocket::cow_string> elems;
    size_t k = 0;
    while(k != values.size()) {
      size_t run = 1;
      if(fopts.has(option_repeat_counts))
        while((k + run != values.size()) && (values[k + run] == values[k]))
          run ++;

      auto& elem = elems.emplace_back();
      if(run > 1) {
        format_integer(elem, static_cast<V_integer>(run));
        elem.push_back('*');
      }
      format_value(elem, values[k], fopts);
      k += run;
    }

    // A trailing null would look like a trailing separator, so write it as a
    // repeated null.
    if(!elems.empty() && elems.back().empty())
      elems.mut(elems.size() - 1) = ::rocket::cow_string(&"1*");
    return elems;
  }

void
format_repeated(::rocket::cow_string& out, const V_array& values, const Format_Options& fopts)
  {
    Format_Options ropts = fopts;
    ropts.opts = ropts.opts | option_repeat_counts;

    auto elems = format_elements(values, ropts);
    for(size_t k = 0;  k != elems.size();  ++k) {
      if(k != 0)
        out.append(", ");
      out.append(elems[k]);
    }
  }

}  // namespace fnml
