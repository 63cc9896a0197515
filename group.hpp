// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_GROUP_HPP_
#define FNML_GROUP_HPP_

#include "fwd.hpp"
#include "value.hpp"
#include "merge.hpp"
#include "findex.hpp"
#include <optional>
namespace fnml {

// A group is a named list of variables, such as `&time_nml dt = 0.5 /`.
// Names are case-insensitive and are stored in lowercase. Variables are
// written in the order in which they were first inserted.
class Group
  {
  public:
    using Value_Map    = ::rocket::cow_hashmap<::rocket::cow_string, Value,
                                                ::rocket::cow_string::hash>;
    using Index_Map    = ::rocket::cow_hashmap<::rocket::cow_string, Index_Vector,
                                                ::rocket::cow_string::hash>;
    using Comment_Map  = ::rocket::cow_hashmap<::rocket::cow_string, ::rocket::cow_string,
                                                ::rocket::cow_string::hash>;

  private:
    ::rocket::cow_string m_name;
    ::rocket::cow_vector<::rocket::cow_string> m_order;
    Value_Map m_vars;
    Index_Map m_starts;
    Comment_Map m_comments;

  public:
    Group() noexcept = default;

    explicit
    Group(const ::rocket::cow_string& name);

  public:
    const ::rocket::cow_string&
    name() const noexcept
      { return this->m_name;  }

    void
    set_name(const ::rocket::cow_string& name);

    // Gets variable names in order.
    const ::rocket::cow_vector<::rocket::cow_string>&
    names() const noexcept
      { return this->m_order;  }

    size_t
    size() const noexcept
      { return this->m_order.size();  }

    bool
    empty() const noexcept
      { return this->m_order.empty();  }

    bool
    contains(const ::rocket::cow_string& name) const;

    // Gets a variable. If it doesn't exist, a null pointer is returned.
    const Value*
    find(const ::rocket::cow_string& name) const;

    Value*
    mut_find(const ::rocket::cow_string& name);

    // Gets a variable. If it doesn't exist, an `Error` with
    // `error_variable_not_found` is thrown.
    const Value&
    at(const ::rocket::cow_string& name) const;

    // Sets a variable. If a variable with the same name exists, its value is
    // replaced, and its position is kept. A reference to the stored value is
    // returned.
    Value&
    insert(const ::rocket::cow_string& name, const Value& value);

    // Removes a variable with its start indices and comment. If it doesn't
    // exist, `false` is returned.
    bool
    erase(const ::rocket::cow_string& name);

    void
    clear() noexcept;

    // Gets or sets the first index of each dimension of an array variable, if
    // it is not the default. For a scalar, these are its subscripts.
    const Index_Vector*
    start_indices(const ::rocket::cow_string& name) const;

    void
    set_start_indices(const ::rocket::cow_string& name, const Index_Vector& starts);

    // Gets or sets the inline comment of a variable, without its `!`.
    const ::rocket::cow_string*
    comment(const ::rocket::cow_string& name) const;

    void
    set_comment(const ::rocket::cow_string& name, const ::rocket::cow_string& text);

    // Gets a variable as a specific type. If the variable doesn't exist or
    // can't be converted, `nullopt` is returned.
    ::std::optional<V_integer>
    get_integer(const ::rocket::cow_string& name) const;

    ::std::optional<V_real>
    get_real(const ::rocket::cow_string& name) const;

    ::std::optional<V_logical>
    get_logical(const ::rocket::cow_string& name) const;

    ::std::optional<V_character>
    get_character(const ::rocket::cow_string& name) const;

    // Merges all variables from `patch` with `merge_values()`. Start indices
    // and comments from `patch` are copied.
    void
    apply_patch(const Group& patch);

    // Merges all variables from `other` with a strategy.
    void
    merge_with(const Group& other, Merge_Strategy strategy);

    // Gets variables of this group that are absent from `base`, or differ.
    // Applying the result onto `base` yields this group.
    Group
    diff_from(const Group& base) const;

    // Checks that all elements of an array have the same type, ignoring nulls,
    // and that the size of a multi-dimensional array matches its dimensions.
    // An `Error` is thrown on the first failure.
    void
    validate() const;

    // Compares names, values, start indices and comments.
    bool
    equals(const Group& other) const;

    // Prints the variables of this group, one assignment per line, without the
    // enclosing `&name` and `/`.
    void
    print_to(::rocket::cow_string& str, const Format_Options& fopts = Format_Options()) const;

    ::rocket::cow_string
    to_string(const Format_Options& fopts = Format_Options()) const;

    void
    print_to_stderr(const Format_Options& fopts = Format_Options()) const;
  };

// Prints the assignments of a variable, each on its own line beginning with
// `fopts.indent`. Most variables take one assignment; derived types take one
// per field. `starts` and `comment` may be null.
void
format_variable(::rocket::cow_string& out, const ::rocket::cow_string& name, const Value& value,
                const Index_Vector* starts, const ::rocket::cow_string* comment,
                const Format_Options& fopts);

inline
bool
operator==(const Group& lhs, const Group& rhs)
  {
    return lhs.equals(rhs);
  }

inline
bool
operator!=(const Group& lhs, const Group& rhs)
  {
    return !lhs.equals(rhs);
  }

}  // namespace fnml
#endif
