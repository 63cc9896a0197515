// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "findex.hpp"
#include "value.hpp"
#include "error.hpp"
#include "utils.hpp"
#include <algorithm>
namespace fnml {
namespace {

[[noreturn]]
void
do_throw_index(const ::rocket::cow_string& text, const char* what)
  {
    ::rocket::cow_string msg;
    msg.push_back('`');
    msg.append(text);
    msg.append("`: ");
    msg.append(what);
    throw Error(error_invalid_index, msg);
  }

::std::optional<::std::int64_t>
do_parse_component(const ::rocket::cow_string& text, const ::rocket::cow_string& whole)
  {
    ::rocket::cow_string str = ascii_trim(text);
    if(str.empty())
      return ::std::nullopt;

    size_t k = 0;
    if(is_any(str[0], '+', '-'))
      k ++;

    if(k == str.size())
      do_throw_index(whole, "index is not an integer");

    while(k != str.size())
      if(!is_digit(str[k++]))
        do_throw_index(whole, "index is not an integer");

    return parse_integer(str).as_integer();
  }

}  // namespace

::std::optional<size_t>
Index_Bound::
size(::std::int64_t default_start, ::std::int64_t default_end) const noexcept
  {
    ::std::int64_t s = this->start ? *(this->start) : default_start;
    ::std::int64_t e = this->end ? *(this->end) : default_end;
    ::std::int64_t st = this->effective_stride();

    if(st == 0)
      return ::std::nullopt;

    if(st > 0)
      return (e >= s) ? static_cast<size_t>((e - s) / st + 1) : 0;
    else
      return (s >= e) ? static_cast<size_t>((s - e) / -st + 1) : 0;
  }

Index_Iterator::
Index_Iterator(const Index_Bounds& bounds, ::std::optional<::std::int64_t> global_start)
  : m_bounds(bounds)
  {
    ::std::int64_t origin = global_start ? *global_start : 1;

    for(const auto& bound : bounds) {
      ::std::int64_t start = bound.effective_start(origin);
      ::std::int64_t end = bound.end ? *(bound.end) : start;
      ::std::int64_t stride = bound.effective_stride();

      if(stride == 0)
        throw Error(error_invalid_index, ::rocket::cow_string(&"stride must not be zero"));

      this->m_start.push_back(start);
      this->m_end.push_back(end);
      this->m_stride.push_back(stride);
      this->m_first.push_back(global_start ? ::std::min(start, *global_start) : start);
    }

    this->reset();
  }

void
Index_Iterator::
reset()
  {
    this->m_current = this->m_start;
    this->m_exhausted = this->m_bounds.empty();

    // An empty range in any dimension yields nothing.
    for(size_t k = 0;  k != this->m_bounds.size();  ++k)
      if((this->m_stride[k] > 0) ? (this->m_start[k] > this->m_end[k])
                                 : (this->m_start[k] < this->m_end[k]))
        this->m_exhausted = true;
  }

bool
Index_Iterator::
next(Index_Vector& out)
  {
    if(this->m_exhausted)
      return false;

    out = this->m_current;

    // Advance the first dimension and carry into the next ones.
    for(size_t k = 0;  k != this->m_current.size();  ++k) {
      ::std::int64_t& cur = this->m_current.mut(k);
      cur += this->m_stride[k];

      if((this->m_stride[k] > 0) ? (cur <= this->m_end[k]) : (cur >= this->m_end[k]))
        return true;

      cur = this->m_start[k];
    }

    this->m_exhausted = true;
    return true;
  }

::rocket::cow_vector<Index_Vector>
Index_Iterator::
collect()
  {
    ::rocket::cow_vector<Index_Vector> all;
    Index_Vector indices;
    while(this->next(indices))
      all.push_back(indices);
    return all;
  }

size_t
Index_Iterator::
to_linear_index(const Index_Vector& indices, const ::rocket::cow_vector<size_t>& extents) const
  {
    if((indices.size() != extents.size()) || (indices.size() != this->m_first.size()))
      throw Error(error_dimension_mismatch,
                  ::rocket::cow_string(&"number of indices does not match number of dimensions"));

    size_t linear = 0;
    size_t mult = 1;
    for(size_t k = 0;  k != indices.size();  ++k) {
      ::std::int64_t off = indices[k] - this->m_first[k];
      if((off < 0) || (static_cast<size_t>(off) >= extents[k]))
        throw Error(error_invalid_index, ::rocket::cow_string(&"index out of bounds"));

      linear += static_cast<size_t>(off) * mult;
      mult *= extents[k];
    }
    return linear;
  }

Index_Vector
Index_Iterator::
from_linear_index(size_t linear, const ::rocket::cow_vector<size_t>& extents) const
  {
    if(extents.size() != this->m_first.size())
      throw Error(error_dimension_mismatch,
                  ::rocket::cow_string(&"number of extents does not match number of dimensions"));

    Index_Vector indices;
    for(size_t k = 0;  k != extents.size();  ++k) {
      if(extents[k] == 0)
        throw Error(error_invalid_index, ::rocket::cow_string(&"dimension has no extent"));

      indices.push_back(this->m_first[k] + static_cast<::std::int64_t>(linear % extents[k]));
      linear /= extents[k];
    }

    if(linear != 0)
      throw Error(error_invalid_index, ::rocket::cow_string(&"linear index out of bounds"));

    return indices;
  }

Index_Bound
parse_index_bound(const ::rocket::cow_string& text)
  {
    ::rocket::cow_string str = ascii_trim(text);
    if(str.empty())
      do_throw_index(str, "empty index");

    // Split at colons.
    ::rocket::cow_vector<::rocket::cow_string> parts;
    parts.emplace_back();
    for(char c : str)
      if(c == ':')
        parts.emplace_back();
      else
        parts.mut(parts.size() - 1).push_back(c);

    if(parts.size() > 3)
      do_throw_index(str, "too many components");

    Index_Bound bound;
    if(parts.size() == 1) {
      // a single index
      bound.start = do_parse_component(parts[0], str);
      bound.end = bound.start;
      return bound;
    }

    bound.start = do_parse_component(parts[0], str);
    bound.end = do_parse_component(parts[1], str);
    if(parts.size() == 3) {
      bound.stride = do_parse_component(parts[2], str);
      if(bound.stride && (*(bound.stride) == 0))
        do_throw_index(str, "stride must not be zero");
    }
    return bound;
  }

Index_Bounds
parse_index_spec(const ::rocket::cow_string& text)
  {
    Index_Bounds bounds;
    ::rocket::cow_string cur;
    for(char c : text)
      if(c == ',') {
        bounds.push_back(parse_index_bound(cur));
        cur.clear();
      }
      else
        cur.push_back(c);

    bounds.push_back(parse_index_bound(cur));
    return bounds;
  }

}  // namespace fnml
