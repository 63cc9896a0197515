// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "findex.hpp"
#include "error.hpp"
#include <clocale>
#undef NDEBUG
#include <assert.h>

static
bool
same(const ::fnml::Index_Vector& lhs, ::std::initializer_list<::std::int64_t> rhs)
  {
    if(lhs.size() != rhs.size())
      return false;

    size_t k = 0;
    for(auto value : rhs)
      if(lhs[k++] != value)
        return false;
    return true;
  }

static
::fnml::Error_Code
index_error(const char* text)
  {
    try {
      ::fnml::parse_index_spec(::rocket::cow_string(text));
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
      // Column-major enumeration
      ::fnml::Index_Bounds bounds = { ::fnml::Index_Bound::range(1, 2),
                                      ::fnml::Index_Bound::range(1, 3) };
      ::fnml::Index_Iterator iter(bounds);
      auto all = iter.collect();
      assert(all.size() == 6);
      assert(same(all[0], { 1, 1 }));
      assert(same(all[1], { 2, 1 }));
      assert(same(all[2], { 1, 2 }));
      assert(same(all[3], { 2, 2 }));
      assert(same(all[4], { 1, 3 }));
      assert(same(all[5], { 2, 3 }));
      assert(iter.exhausted());

      ::fnml::Index_Vector out;
      assert(!iter.next(out));
      assert(out.empty());

      iter.reset();
      assert(!iter.exhausted());
      assert(same(iter.current(), { 1, 1 }));
      assert(iter.next(out));
      assert(same(out, { 1, 1 }));
      assert(same(iter.current(), { 2, 1 }));
    }

    {
      ::fnml::Index_Bounds bounds = { ::fnml::Index_Bound::range(10, 1, -3) };
      ::fnml::Index_Iterator iter(bounds);
      auto all = iter.collect();
      assert(all.size() == 4);
      assert(same(all[0], { 10 }));
      assert(same(all[3], { 1 }));
      assert(bounds[0].size(1, 1) == 4);
    }

    {
      // An empty range yields nothing.
      ::fnml::Index_Bounds bounds = { ::fnml::Index_Bound::range(1, 2),
                                      ::fnml::Index_Bound::range(3, 1) };
      ::fnml::Index_Iterator iter(bounds);
      assert(iter.exhausted());
      assert(iter.collect().empty());
      assert(bounds[1].size(1, 1) == 0);
    }

    {
      ::fnml::Index_Bound bound;
      bound.stride = 0;
      assert(!bound.size(1, 5));

      bool thrown = false;
      try {
        ::fnml::Index_Bounds bounds = { bound };
        ::fnml::Index_Iterator iter(bounds);
        assert(false);
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_invalid_index);
      }
      assert(thrown);
    }

    {
      // The origin is the lesser of the start and the global start.
      ::fnml::Index_Bounds bounds = { ::fnml::Index_Bound::range(2, 3),
                                      ::fnml::Index_Bound::implicit() };
      ::fnml::Index_Iterator iter(bounds, 0);
      assert(same(iter.first(), { 0, 0 }));
      assert(same(iter.start(), { 2, 0 }));
      assert(iter.collect().size() == 2);

      ::rocket::cow_vector<size_t> extents = { 4, 2 };
      assert(iter.to_linear_index({ 0, 0 }, extents) == 0);
      assert(iter.to_linear_index({ 3, 0 }, extents) == 3);
      assert(iter.to_linear_index({ 2, 1 }, extents) == 6);
      assert(same(iter.from_linear_index(6, extents), { 2, 1 }));

      bool thrown = false;
      try {
        iter.to_linear_index({ 4, 0 }, extents);
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_invalid_index);
      }
      assert(thrown);

      thrown = false;
      try {
        iter.to_linear_index({ 1 }, extents);
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_dimension_mismatch);
      }
      assert(thrown);

      thrown = false;
      try {
        iter.from_linear_index(8, extents);
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_invalid_index);
      }
      assert(thrown);
    }

    {
      auto bound = ::fnml::parse_index_bound(&":");
      assert(!bound.start && !bound.end && !bound.stride);

      bound = ::fnml::parse_index_bound(&" 5 ");
      assert(bound.start == 5);
      assert(bound.end == 5);

      bound = ::fnml::parse_index_bound(&"1:10:2");
      assert(bound.start == 1);
      assert(bound.end == 10);
      assert(bound.stride == 2);
      assert(bound.size(1, 1) == 5);

      bound = ::fnml::parse_index_bound(&"-3:");
      assert(bound.start == -3);
      assert(!bound.end);
      assert(bound.size(1, 0) == 4);

      auto bounds = ::fnml::parse_index_spec(&"1:3, 2");
      assert(bounds.size() == 2);
      assert(bounds[1].start == 2);

      assert(index_error("1:2:0") == ::fnml::error_invalid_index);
      assert(index_error("1:2:3:4") == ::fnml::error_invalid_index);
      assert(index_error("a") == ::fnml::error_invalid_index);
      assert(index_error("1,") == ::fnml::error_invalid_index);
      assert(index_error("1:2, 3") == ::fnml::error_none);
    }
  }
