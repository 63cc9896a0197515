// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_NAMELIST_HPP_
#define FNML_NAMELIST_HPP_

#include "fwd.hpp"
#include "group.hpp"
#include "error.hpp"
#include <rocket/tinyfmt.hpp>
#include <cstdio>
namespace fnml {

// A namelist document is a list of groups. Group names are case-insensitive
// and are stored in lowercase. Groups are written in the order in which they
// were first inserted.
class Namelist
  {
  public:
    using Group_Map = ::rocket::cow_hashmap<::rocket::cow_string, Group,
                                             ::rocket::cow_string::hash>;

  private:
    ::rocket::cow_vector<::rocket::cow_string> m_order;
    Group_Map m_groups;

  public:
    Namelist() noexcept = default;

  public:
    // Gets group names in order.
    const ::rocket::cow_vector<::rocket::cow_string>&
    group_names() const noexcept
      { return this->m_order;  }

    size_t
    size() const noexcept
      { return this->m_order.size();  }

    bool
    empty() const noexcept
      { return this->m_order.empty();  }

    bool
    contains_group(const ::rocket::cow_string& name) const;

    // Gets a group. If it doesn't exist, a null pointer is returned.
    const Group*
    find_group(const ::rocket::cow_string& name) const;

    Group*
    mut_find_group(const ::rocket::cow_string& name);

    // Gets a group. If it doesn't exist, an `Error` with
    // `error_group_not_found` is thrown.
    const Group&
    at_group(const ::rocket::cow_string& name) const;

    // Gets a group, creating an empty one if it doesn't exist.
    Group&
    insert_group(const ::rocket::cow_string& name);

    // Stores a group, replacing an existing one with the same name, whose
    // position is kept.
    Group&
    insert_group(const Group& group);

    // Removes a group. If it doesn't exist, `false` is returned.
    bool
    erase_group(const ::rocket::cow_string& name);

    // Renames a group, keeping its position. An `Error` is thrown if no group
    // has the old name (`error_group_not_found`), or if another group has the
    // new name (`error_duplicate_name`).
    void
    rename_group(const ::rocket::cow_string& old_name, const ::rocket::cow_string& new_name);

    void
    clear() noexcept;

    // Applies another document as a patch. Variables of existing groups are
    // merged with `Group::apply_patch()`, and new groups are appended.
    void
    apply_patch(const Namelist& patch);

    // Applies only some groups of a patch. If `include` is not empty, only
    // groups named there are applied. Groups named in `exclude` are never
    // applied.
    void
    apply_selective_patch(const Namelist& patch,
                          const ::rocket::cow_vector<::rocket::cow_string>& include,
                          const ::rocket::cow_vector<::rocket::cow_string>& exclude);

    // Merges another document with a strategy. New groups are appended.
    void
    merge_with(const Namelist& other, Merge_Strategy strategy);

    // Gets variables of this document that are absent from `base`, or differ,
    // as a patch.
    Namelist
    diff_from(const Namelist& base) const;

    // Validates all groups. See `Group::validate()`.
    void
    validate() const;

    bool
    equals(const Namelist& other) const;

    // Parses a document and replaces the contents of this object with it.
    // Errors are stored into the `Parser_Context`. If an error occurs, this
    // object is left intact.
    void
    parse_with(Parser_Context& ctx, const ::rocket::cow_string& str,
               const Scan_Options& sopts = Scan_Options());

    void
    parse_with(Parser_Context& ctx, ::rocket::tinybuf& buf,
               const Scan_Options& sopts = Scan_Options());

    void
    parse_with(Parser_Context& ctx, ::std::FILE* fp,
               const Scan_Options& sopts = Scan_Options());

    bool
    parse(const ::rocket::cow_string& str, const Scan_Options& sopts = Scan_Options());

    bool
    parse(::rocket::tinybuf& buf, const Scan_Options& sopts = Scan_Options());

    bool
    parse(::std::FILE* fp, const Scan_Options& sopts = Scan_Options());

    // Prints this document. Groups are separated by blank lines.
    void
    print_to(::rocket::tinybuf& buf, const Format_Options& fopts = Format_Options()) const;

    void
    print_to(::rocket::cow_string& str, const Format_Options& fopts = Format_Options()) const;

    void
    print_to(::std::FILE* fp, const Format_Options& fopts = Format_Options()) const;

    ::rocket::cow_string
    to_string(const Format_Options& fopts = Format_Options()) const;

    void
    print_to_stderr(const Format_Options& fopts = Format_Options()) const;
  };

inline
bool
operator==(const Namelist& lhs, const Namelist& rhs)
  {
    return lhs.equals(rhs);
  }

inline
bool
operator!=(const Namelist& lhs, const Namelist& rhs)
  {
    return !lhs.equals(rhs);
  }

inline
::rocket::tinyfmt&
operator<<(::rocket::tinyfmt& fmt, const Namelist& nml)
  {
    nml.print_to(fmt.mut_buf());
    return fmt;
  }

// Reads all text from a stream. An `Error` with `error_io` is thrown on
// failure.
::rocket::cow_string
read_all(::rocket::tinybuf& buf);

::rocket::cow_string
read_all(::std::FILE* fp);

}  // namespace fnml
#endif
