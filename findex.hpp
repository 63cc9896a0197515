// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_FINDEX_HPP_
#define FNML_FINDEX_HPP_

#include "fwd.hpp"
#include <optional>
namespace fnml {

using Index_Vector = ::rocket::cow_vector<::std::int64_t>;

// The bounds of one dimension in an index specification such as `1:10:2`.
// All components are optional, so `:` denotes the whole dimension.
struct Index_Bound
  {
    ::std::optional<::std::int64_t> start;
    ::std::optional<::std::int64_t> end;
    ::std::optional<::std::int64_t> stride;

    static
    Index_Bound
    range(::std::int64_t start, ::std::int64_t end, ::std::int64_t stride = 1)
      {
        Index_Bound bound;
        bound.start = start;
        bound.end = end;
        bound.stride = stride;
        return bound;
      }

    static
    Index_Bound
    single(::std::int64_t index)
      {
        Index_Bound bound;
        bound.start = index;
        bound.end = index;
        return bound;
      }

    static
    Index_Bound
    implicit()
      {
        return Index_Bound();
      }

    ::std::int64_t
    effective_start(::std::int64_t default_start) const noexcept
      { return this->start ? *(this->start) : default_start;  }

    ::std::int64_t
    effective_stride() const noexcept
      { return this->stride ? *(this->stride) : 1;  }

    // Gets the number of indices within this range. If the stride is zero,
    // there is no size.
    ::std::optional<size_t>
    size(::std::int64_t default_start, ::std::int64_t default_end) const noexcept;
  };

using Index_Bounds = ::rocket::cow_vector<Index_Bound>;

// This class enumerates multi-dimensional indices in column-major order,
// where the first index varies fastest. For `(1:2, 1:3)` the sequence is
// `(1,1) (2,1) (1,2) (2,2) (1,3) (2,3)`.
class Index_Iterator
  {
  private:
    Index_Bounds m_bounds;
    Index_Vector m_start;
    Index_Vector m_end;
    Index_Vector m_stride;
    Index_Vector m_first;
    Index_Vector m_current;
    bool m_exhausted = false;

  public:
    // Creates an iterator. A dimension without a start begins at
    // `global_start` (or 1 if not given); a dimension without an end contains
    // only its start. If `global_start` is given, the origin of each
    // dimension is the lesser of its start and `global_start`.
    explicit
    Index_Iterator(const Index_Bounds& bounds,
                   ::std::optional<::std::int64_t> global_start = ::std::nullopt);

  public:
    const Index_Bounds&
    bounds() const noexcept
      { return this->m_bounds;  }

    // Gets the origin of each dimension.
    const Index_Vector&
    first() const noexcept
      { return this->m_first;  }

    const Index_Vector&
    start() const noexcept
      { return this->m_start;  }

    const Index_Vector&
    current() const noexcept
      { return this->m_current;  }

    bool
    exhausted() const noexcept
      { return this->m_exhausted;  }

    // Rewinds to the first index.
    void
    reset();

    // Stores the current index into `out` and moves to the next one. If all
    // indices have been enumerated, `false` is returned and `out` is not
    // modified.
    bool
    next(Index_Vector& out);

    // Collects all remaining indices.
    ::rocket::cow_vector<Index_Vector>
    collect();

    // Converts an index to a position in column-major storage. An `Error`
    // with `error_invalid_index` is thrown if any component is outside
    // `[origin, origin + extent)`.
    size_t
    to_linear_index(const Index_Vector& indices, const ::rocket::cow_vector<size_t>& extents) const;

    // Converts a position in column-major storage back to an index.
    Index_Vector
    from_linear_index(size_t linear, const ::rocket::cow_vector<size_t>& extents) const;
  };

// Parses one dimension such as `:`, `5`, `1:10` or `1:10:2`. An `Error` with
// `error_invalid_index` is thrown for a zero stride, more than three
// components, or components that are not integers.
Index_Bound
parse_index_bound(const ::rocket::cow_string& text);

// Parses a comma-separated index specification such as `1:3, 2`.
Index_Bounds
parse_index_spec(const ::rocket::cow_string& text);

}  // namespace fnml
#endif
