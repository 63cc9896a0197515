// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_UTILS_HPP_
#define FNML_UTILS_HPP_

#include "fwd.hpp"
#include <cstring>
namespace fnml {

constexpr ROCKET_ALWAYS_INLINE
bool
is_within(int c, int lo, int hi) noexcept
  {
    return (c >= lo) && (c <= hi);
  }

template<typename... Ts>
constexpr ROCKET_ALWAYS_INLINE
bool
is_any(int c, Ts... accept_set) noexcept
  {
    return (... || (c == accept_set));
  }

constexpr ROCKET_ALWAYS_INLINE
bool
is_digit(int c) noexcept
  {
    return is_within(c, '0', '9');
  }

constexpr ROCKET_ALWAYS_INLINE
bool
is_alpha(int c) noexcept
  {
    return is_within(c | 0x20, 'a', 'z');
  }

constexpr ROCKET_ALWAYS_INLINE
bool
is_alnum(int c) noexcept
  {
    return is_alpha(c) || is_digit(c);
  }

constexpr ROCKET_ALWAYS_INLINE
bool
is_blank(int c) noexcept
  {
    return is_any(c, ' ', '\t', '\r', '\n', '\f', '\v');
  }

constexpr ROCKET_ALWAYS_INLINE
char
to_lower(char c) noexcept
  {
    return is_within(c, 'A', 'Z') ? static_cast<char>(c | 0x20) : c;
  }

constexpr ROCKET_ALWAYS_INLINE
char
to_upper(char c) noexcept
  {
    return is_within(c, 'a', 'z') ? static_cast<char>(c & ~0x20) : c;
  }

// Converts a string to lowercase. Names are stored in lowercase.
inline
::rocket::cow_string
ascii_lower(const ::rocket::cow_string& str)
  {
    ::rocket::cow_string res;
    res.reserve(str.size());
    for(char c : str)
      res.push_back(to_lower(c));
    return res;
  }

inline
::rocket::cow_string
ascii_upper(const ::rocket::cow_string& str)
  {
    ::rocket::cow_string res;
    res.reserve(str.size());
    for(char c : str)
      res.push_back(to_upper(c));
    return res;
  }

// Compares a string with a lowercase literal, case-insensitively.
inline
bool
ascii_iequals(const char* str, size_t len, const char* lower)
  {
    size_t n = ::std::strlen(lower);
    if(len != n)
      return false;

    for(size_t k = 0;  k != n;  ++k)
      if(to_lower(str[k]) != lower[k])
        return false;
    return true;
  }

inline
bool
ascii_iequals(const ::rocket::cow_string& str, const char* lower)
  {
    return ascii_iequals(str.data(), str.size(), lower);
  }

// Removes leading and trailing whitespace.
inline
::rocket::cow_string
ascii_trim(const ::rocket::cow_string& str)
  {
    size_t bpos = 0;
    size_t epos = str.size();
    while((bpos != epos) && is_blank(str[bpos]))
      bpos ++;
    while((bpos != epos) && is_blank(str[epos - 1]))
      epos --;
    return ::rocket::cow_string(str.data() + bpos, epos - bpos);
  }

}  // namespace fnml
#endif
