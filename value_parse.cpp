// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "value.hpp"
#include "error.hpp"
#include "utils.hpp"
#include <rocket/ascii_numget.hpp>
#include <rocket/ascii_numput.hpp>
#include <cmath>
#include <climits>
namespace fnml {
namespace {

[[noreturn]]
void
do_throw_literal(const ::rocket::cow_string& text, const char* what)
  {
    ::rocket::cow_string msg;
    msg.push_back('`');
    msg.append(text);
    msg.append("` is not a valid ");
    msg.append(what);
    throw Error(error_invalid_literal, msg);
  }

// Removes a kind suffix such as `_8` or `_dp`.
size_t
do_strip_kind(const char* str, size_t len) noexcept
  {
    for(size_t k = 0;  k != len;  ++k)
      if(str[k] == '_')
        return k;
    return len;
  }

bool
do_looks_like_integer(const char* str, size_t len) noexcept
  {
    len = do_strip_kind(str, len);
    size_t k = 0;
    if((len != 0) && is_any(str[0], '+', '-'))
      k = 1;

    if(k == len)
      return false;

    while(k != len)
      if(!is_digit(str[k++]))
        return false;
    return true;
  }

bool
do_try_integer(V_integer& out, const char* str, size_t len)
  {
    len = do_strip_kind(str, len);
    if(!do_looks_like_integer(str, len))
      return false;

    // The sign is consumed here so only digits are left for `parse_I()`.
    if(str[0] == '+') {
      str ++;
      len --;
    }

    ::rocket::ascii_numget numg;
    if(numg.parse_I(str, len) != len)
      return false;

    numg.cast_I(out, INT64_MIN, INT64_MAX);
    if(numg.overflowed())
      return false;

    return true;
  }

bool
do_try_real(V_real& out, const char* str, size_t len)
  {
    len = do_strip_kind(str, len);
    if((len == 0) || do_looks_like_integer(str, len))
      return false;

    // infinities and NaNs
    if(ascii_iequals(str, len, "inf") || ascii_iequals(str, len, "+inf")
       || ascii_iequals(str, len, "infinity") || ascii_iequals(str, len, "+infinity")) {
      out = HUGE_VAL;
      return true;
    }

    if(ascii_iequals(str, len, "-inf") || ascii_iequals(str, len, "-infinity")) {
      out = -HUGE_VAL;
      return true;
    }

    if(ascii_iequals(str, len, "nan") || ascii_iequals(str, len, "+nan")
       || ascii_iequals(str, len, "-nan")) {
      out = ::std::nan("");
      return true;
    }

    // Rebuild the number in a canonical form, for example, `-.5d3` becomes
    // `-0.5e3`. Anything that doesn't match the grammar is rejected.
    ::rocket::cow_string norm;
    size_t k = 0;
    if(is_any(str[k], '+', '-')) {
      if(str[k] == '-')
        norm.push_back('-');
      k ++;
    }

    size_t ndigits = 0;
    size_t bpos = k;
    while((k != len) && is_digit(str[k]))
      k ++;

    ndigits += k - bpos;
    if(k == bpos)
      norm.push_back('0');
    else
      norm.append(str + bpos, k - bpos);

    norm.push_back('.');
    if((k != len) && (str[k] == '.')) {
      k ++;
      bpos = k;
      while((k != len) && is_digit(str[k]))
        k ++;

      ndigits += k - bpos;
      norm.append(str + bpos, k - bpos);
    }
    norm.push_back('0');

    if(ndigits == 0)
      return false;

    if((k != len) && is_any(str[k], 'e', 'E', 'd', 'D')) {
      norm.push_back('e');
      k ++;
      if((k != len) && is_any(str[k], '+', '-'))
        norm.push_back(str[k++]);

      bpos = k;
      while((k != len) && is_digit(str[k]))
        k ++;

      if(k == bpos)
        return false;

      norm.append(str + bpos, k - bpos);
    }

    if(k != len)
      return false;

    ::rocket::ascii_numget numg;
    if(numg.parse_D(norm.data(), norm.size()) != norm.size())
      return false;

    numg.cast_D(out, -HUGE_VAL, HUGE_VAL);
    return true;
  }

bool
do_try_logical(V_logical& out, const char* str, size_t len)
  {
    if(ascii_iequals(str, len, ".true.") || ascii_iequals(str, len, ".t.")
       || ascii_iequals(str, len, "true") || ascii_iequals(str, len, "t")) {
      out = true;
      return true;
    }

    if(ascii_iequals(str, len, ".false.") || ascii_iequals(str, len, ".f.")
       || ascii_iequals(str, len, "false") || ascii_iequals(str, len, "f")) {
      out = false;
      return true;
    }

    // Compilers accept anything like `.tRuE_or_not`.
    if((len >= 2) && (str[0] == '.') && is_any(to_lower(str[1]), 't', 'f')) {
      out = to_lower(str[1]) == 't';
      return true;
    }

    return false;
  }

bool
do_try_complex_part(double& out, const char* str, size_t len)
  {
    while((len != 0) && is_blank(str[0])) {
      str ++;
      len --;
    }

    while((len != 0) && is_blank(str[len - 1]))
      len --;

    V_integer ival;
    if(do_try_integer(ival, str, len)) {
      out = static_cast<double>(ival);
      return true;
    }

    return do_try_real(out, str, len);
  }

bool
do_try_complex(V_complex& out, const char* str, size_t len)
  {
    if((len < 2) || (str[0] != '(') || (str[len - 1] != ')'))
      return false;

    // There must be exactly one comma.
    size_t comma = 0;
    size_t ncommas = 0;
    for(size_t k = 1;  k != len - 1;  ++k)
      if(str[k] == ',') {
        comma = k;
        ncommas ++;
      }

    if(ncommas != 1)
      return false;

    double re, im;
    if(!do_try_complex_part(re, str + 1, comma - 1))
      return false;

    if(!do_try_complex_part(im, str + comma + 1, len - comma - 2))
      return false;

    out = V_complex(re, im);
    return true;
  }

::rocket::cow_string
do_unquote(const char* str, size_t len)
  {
    ::rocket::cow_string res;
    if((len < 2) || !is_any(str[0], '\'', '\"') || (str[len - 1] != str[0])) {
      // Bare text is taken verbatim.
      res.append(str, len);
      return res;
    }

    char quote = str[0];
    for(size_t k = 1;  k < len - 1;  ++k) {
      res.push_back(str[k]);
      if((str[k] == quote) && (k + 1 < len - 1) && (str[k + 1] == quote))
        k ++;
    }
    return res;
  }

// Splits a list at commas that are outside quotes and parentheses. An empty
// text yields no items.
::rocket::cow_vector<::rocket::cow_string>
do_split_list(const ::rocket::cow_string& text)
  {
    ::rocket::cow_vector<::rocket::cow_string> items;
    ::rocket::cow_string cur;
    char quote = 0;
    int depth = 0;

    for(char c : text) {
      if(quote) {
        if(c == quote)
          quote = 0;
      }
      else if(is_any(c, '\'', '\"'))
        quote = c;
      else if(c == '(')
        depth ++;
      else if((c == ')') && (depth > 0))
        depth --;
      else if((c == ',') && (depth == 0)) {
        items.push_back(ascii_trim(cur));
        cur.clear();
        continue;
      }
      cur.push_back(c);
    }

    if(!items.empty() || !ascii_trim(cur).empty())
      items.push_back(ascii_trim(cur));
    return items;
  }

// Finds the star of a repeat expression such as `3*1.0`.
size_t
do_find_repeat_star(const ::rocket::cow_string& text) noexcept
  {
    size_t k = 0;
    while((k != text.size()) && is_digit(text[k]))
      k ++;

    if((k == 0) || (k == text.size()) || (text[k] != '*'))
      return SIZE_MAX;

    return k;
  }

void
do_check_limits(const Value& value, const Value_Constraints& limits)
  {
    ::rocket::cow_string msg;

    switch(value.type())
      {
      case t_integer:
        if(limits.min_integer && (value.as_integer() < *(limits.min_integer)))
          msg.append("integer below minimum");
        else if(limits.max_integer && (value.as_integer() > *(limits.max_integer)))
          msg.append("integer above maximum");
        break;

      case t_real:
        if(limits.min_real && (value.as_real() < *(limits.min_real)))
          msg.append("real below minimum");
        else if(limits.max_real && (value.as_real() > *(limits.max_real)))
          msg.append("real above maximum");
        break;

      case t_character:
        if(limits.max_length && (value.as_character().size() > *(limits.max_length)))
          msg.append("string too long");
        break;

      case t_array:
      case t_multi_array:
        if(limits.max_array_size && (value.as_array().size() > *(limits.max_array_size)))
          msg.append("array too large");
        else
          for(const auto& elem : value.as_array())
            do_check_limits(elem, limits);
        break;

      case t_derived:
        for(auto it = value.as_derived().begin();  it != value.as_derived().end();  ++it)
          do_check_limits(it->second, limits);
        break;

      case t_derived_array:
        for(const auto& elem : value.as_derived_array())
          for(auto it = elem.begin();  it != elem.end();  ++it)
            do_check_limits(it->second, limits);
        break;

      default:
        break;
      }

    if(!msg.empty()) {
      msg.append(": ");
      msg.append(value.summary());
      throw Error(error_invalid_literal, msg);
    }
  }

}  // namespace

Value
parse_integer(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    V_integer val;
    if(!do_try_integer(val, str.data(), str.size()))
      do_throw_literal(str, "integer");
    return val;
  }

Value
parse_real(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    V_real val;
    if(!do_try_real(val, str.data(), str.size()))
      do_throw_literal(str, "real number");
    return val;
  }

Value
parse_complex(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    V_complex val;
    if(!do_try_complex(val, str.data(), str.size()))
      do_throw_literal(str, "complex number");
    return val;
  }

Value
parse_logical(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    V_logical val;
    if(!do_try_logical(val, str.data(), str.size()))
      do_throw_literal(str, "logical value");
    return val;
  }

Value
parse_character(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    return do_unquote(str.data(), str.size());
  }

Value
parse_value(const ::rocket::cow_string& text, Type hint)
  {
    ::rocket::cow_string str = ascii_trim(text);
    if(str.empty())
      return nullptr;

    switch(hint)
      {
      case t_null:
        break;

      case t_integer:
        return parse_integer(str);

      case t_real:
        return parse_real(str);

      case t_complex:
        return parse_complex(str);

      case t_logical:
        return parse_logical(str);

      case t_character:
        return parse_character(str);

      case t_array:
        return parse_value_list(str);

      default:
        do_throw_literal(str, describe_type(hint));
      }

    // The order matters: `t` is a logical value, and `1d0` is a real number.
    V_logical lval;
    if(do_try_logical(lval, str.data(), str.size()))
      return lval;

    V_complex cval;
    if(do_try_complex(cval, str.data(), str.size()))
      return cval;

    V_real rval;
    if(do_try_real(rval, str.data(), str.size()))
      return rval;

    V_integer ival;
    if(do_try_integer(ival, str.data(), str.size()))
      return ival;

    return do_unquote(str.data(), str.size());
  }

Value
parse_repeat(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    size_t star = do_find_repeat_star(str);
    if(star == SIZE_MAX)
      do_throw_literal(str, "repeat expression");

    V_integer count;
    if(!do_try_integer(count, str.data(), star) || (count <= 0) || (count > repeat_count_max))
      do_throw_literal(str, "repeat expression");

    Value elem = parse_value(::rocket::cow_string(str.data() + star + 1, str.size() - star - 1));
    V_array arr;
    arr.reserve(static_cast<size_t>(count));
    for(V_integer k = 0;  k != count;  ++k)
      arr.push_back(elem);
    return arr;
  }

Value
parse_value_list(const ::rocket::cow_string& text)
  {
    auto items = do_split_list(text);
    if(items.empty())
      return nullptr;

    V_array arr;
    bool repeated = false;
    for(const auto& item : items) {
      if(do_find_repeat_star(item) != SIZE_MAX) {
        Value run = parse_repeat(item);
        for(const auto& elem : run.as_array())
          arr.push_back(elem);
        repeated = true;
      }
      else
        arr.push_back(parse_value(item));
    }

    if((arr.size() == 1) && !repeated)
      return arr[0];
    return arr;
  }

bool
looks_like_integer(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    return do_looks_like_integer(str.data(), str.size());
  }

bool
looks_like_real(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    V_real val;
    return do_try_real(val, str.data(), str.size());
  }

Type
infer_type(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    if(str.empty())
      return t_null;

    if(is_any(str[0], '\'', '\"'))
      return t_character;

    V_logical lval;
    if(do_try_logical(lval, str.data(), str.size()))
      return t_logical;

    if((str[0] == '(') && (str[str.size() - 1] == ')'))
      return t_complex;

    if((do_split_list(str).size() > 1) || (do_find_repeat_star(str) != SIZE_MAX))
      return t_array;

    if(looks_like_integer(str))
      return t_integer;

    if(looks_like_real(str))
      return t_real;

    return t_character;
  }

void
validate_value(const Value& value, const Value_Constraints& limits)
  {
    do_check_limits(value, limits);
  }

}  // namespace fnml
