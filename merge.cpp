// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "merge.hpp"
#include <rocket/xthrow.hpp>
namespace fnml {
namespace {

bool
do_is_scalar(const Value& value) noexcept
  {
    switch(value.type())
      {
      case t_integer:
      case t_real:
      case t_complex:
      case t_logical:
      case t_character:
        return true;

      default:
        return false;
      }
  }

}  // namespace

const char*
describe_merge_strategy(Merge_Strategy strategy) noexcept
  {
    switch(strategy)
      {
      case merge_replace:
        return "replace";

      case merge_update:
        return "update";

      case merge_append:
        return "append";

      case merge_skip_existing:
        return "skip_existing";

      default:
        return "[unknown]";
      }
  }

Value
merge_values(const Value& existing, const Value& incoming)
  {
    if(existing.is_derived() && incoming.is_derived()) {
      V_derived fields = existing.as_derived();
      for(auto it = incoming.as_derived().begin();  it != incoming.as_derived().end();  ++it)
        fields.try_emplace(it->first).first->second = it->second;
      return fields;
    }

    if(!incoming.is_array())
      return incoming;

    if(do_is_scalar(existing)) {
      // The existing scalar becomes the first element.
      V_array arr;
      arr.reserve(incoming.as_array().size() + 1);
      arr.push_back(existing);
      for(const auto& elem : incoming.as_array())
        arr.push_back(elem);
      return arr;
    }

    return incoming;
  }

Value
append_values(const Value& existing, const Value& incoming)
  {
    if(existing.is_array()) {
      V_array arr = existing.as_array();
      if(incoming.is_array()) {
        for(const auto& elem : incoming.as_array())
          arr.push_back(elem);
      }
      else
        arr.push_back(incoming);
      return arr;
    }

    if(do_is_scalar(existing) && incoming.is_array()) {
      V_array arr;
      arr.push_back(existing);
      for(const auto& elem : incoming.as_array())
        arr.push_back(elem);
      return arr;
    }

    if(do_is_scalar(existing) && do_is_scalar(incoming)) {
      V_array arr;
      arr.push_back(existing);
      arr.push_back(incoming);
      return arr;
    }

    return incoming;
  }

Value
merge_with_strategy(const Value& existing, const Value& incoming, Merge_Strategy strategy)
  {
    switch(strategy)
      {
      case merge_replace:
      case merge_update:
        return incoming;

      case merge_append:
        return append_values(existing, incoming);

      case merge_skip_existing:
        return existing;

      default:
        ::rocket::sprintf_and_throw<::std::invalid_argument>(
              "fnml::merge_with_strategy: unknown strategy `%d`",
              static_cast<int>(strategy));
      }
  }

}  // namespace fnml
