// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_MERGE_HPP_
#define FNML_MERGE_HPP_

#include "fwd.hpp"
#include "value.hpp"
namespace fnml {

// These are strategies for merging groups and documents.
enum Merge_Strategy : ::std::uint8_t
  {
    merge_replace        = 0,  // overwrite existing values
    merge_update         = 1,  // same as `merge_replace`
    merge_append         = 2,  // append to existing values; see `append_values()`
    merge_skip_existing  = 3,  // only add names that don't exist
  };

// Gets the name of a strategy, such as `replace`.
const char*
describe_merge_strategy(Merge_Strategy strategy) noexcept;

// Merges a patch value onto an existing one, as `apply_patch()` does:
//
// * A scalar or a derived type from the patch replaces the existing value,
//   except that two derived types are merged field by field, with fields
//   from the patch taking precedence.
// * An array from the patch replaces an existing array.
// * An array from the patch is appended to an existing scalar.
Value
merge_values(const Value& existing, const Value& incoming);

// Appends a value to an existing one. Two arrays are concatenated; a scalar is
// pushed onto an existing array; two scalars become an array of two. A null
// value is replaced.
Value
append_values(const Value& existing, const Value& incoming);

// Combines two values with a strategy. For `merge_skip_existing`, the
// existing value is returned.
Value
merge_with_strategy(const Value& existing, const Value& incoming, Merge_Strategy strategy);

}  // namespace fnml
#endif
