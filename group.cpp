// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "group.hpp"
#include "format.hpp"
#include "error.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstdio>
namespace fnml {
namespace {

::rocket::cow_vector<::rocket::cow_string>
do_sorted_keys(const V_derived& fields)
  {
    ::rocket::cow_vector<::rocket::cow_string> keys;
    for(auto it = fields.begin();  it != fields.end();  ++it)
      keys.push_back(it->first);

    ::std::sort(keys.mut_begin(), keys.mut_end());
    return keys;
  }

void
do_append_index(::rocket::cow_string& str, ::std::int64_t index)
  {
    format_integer(str, index);
  }

// Appends elements after `head`, which is the part up to and including `= `.
// Long lines are broken after commas, and continuation lines are aligned with
// the first element.
void
do_append_wrapped(::rocket::cow_string& line, size_t head_width,
                  const ::rocket::cow_vector<::rocket::cow_string>& elems,
                  const Format_Options& fopts)
  {
    size_t width = head_width;
    for(size_t k = 0;  k != elems.size();  ++k) {
      const auto& elem = elems[k];
      if(k == 0) {
        line.append(elem);
        width += elem.size();
        continue;
      }

      if((fopts.column_width > 0) && (width + 2 + elem.size() > static_cast<size_t>(fopts.column_width))) {
        line.append(",\n");
        line.append(head_width, ' ');
        line.append(elem);
        width = head_width + elem.size();
        continue;
      }

      line.append(", ");
      line.append(elem);
      width += 2 + elem.size();
    }
  }

// Composes assignments of a variable without indentation or comments. Each
// assignment is pushed as an element of `out`.
void
do_compose(::rocket::cow_vector<::rocket::cow_string>& out, const ::rocket::cow_string& name,
           const Value& value, const Index_Vector* starts, const Format_Options& fopts)
  {
    size_t indent = fopts.indent.size();

    switch(value.type())
      {
      case t_array:
        {
          const auto& arr = value.as_array();
          auto& line = out.emplace_back(name);
          if(arr.empty()) {
            line.append(" =");
            break;
          }

          // name(1:3) = 1, 2, 3
          ::std::int64_t start = fopts.default_start_index;
          if(starts && !starts->empty())
            start = (*starts)[0];

          // A single element is written as `name(1:1)`, as `name(1)` would
          // denote a scalar.
          line.push_back('(');
          do_append_index(line, start);
          line.push_back(':');
          do_append_index(line, start + static_cast<::std::int64_t>(arr.size()) - 1);
          line.append(") = ");
          do_append_wrapped(line, indent + line.size(), format_elements(arr, fopts), fopts);
        }
        break;

      case t_multi_array:
        {
          // name(1:2, 1:3) = 1, 2, 3, 4, 5, 6
          const auto& marr = value.as_multi_array();
          auto& line = out.emplace_back(name);
          line.push_back('(');
          for(size_t k = 0;  k != marr.dimensions.size();  ++k) {
            if(k != 0)
              line.append(", ");

            ::std::int64_t start = fopts.default_start_index;
            if(k < marr.start_indices.size())
              start = marr.start_indices[k];

            do_append_index(line, start);
            line.push_back(':');
            do_append_index(line, start + static_cast<::std::int64_t>(marr.dimensions[k]) - 1);
          }
          line.append(") = ");
          do_append_wrapped(line, indent + line.size(), format_elements(marr.values, fopts), fopts);
        }
        break;

      case t_derived:
        {
          // name%field = value
          const auto& fields = value.as_derived();
          for(const auto& key : do_sorted_keys(fields)) {
            ::rocket::cow_string path = name;
            path.push_back('%');
            path.append(key);
            do_compose(out, path, fields.at(key), nullptr, fopts);
          }
        }
        break;

      case t_derived_array:
        {
          // name(1)%field = value
          const auto& elems = value.as_derived_array();
          ::std::int64_t start = fopts.default_start_index;
          if(starts && !starts->empty())
            start = (*starts)[0];

          for(size_t k = 0;  k != elems.size();  ++k)
            for(const auto& key : do_sorted_keys(elems[k])) {
              ::rocket::cow_string path = name;
              path.push_back('(');
              do_append_index(path, start + static_cast<::std::int64_t>(k));
              path.append(")%");
              path.append(key);
              do_compose(out, path, elems[k].at(key), nullptr, fopts);
            }
        }
        break;

      default:
        {
          // name = value
          // name(3) = value
          auto& line = out.emplace_back(name);
          if(starts && !starts->empty()) {
            line.push_back('(');
            for(size_t k = 0;  k != starts->size();  ++k) {
              if(k != 0)
                line.append(", ");
              do_append_index(line, (*starts)[k]);
            }
            line.push_back(')');
          }

          line.append(" =");
          if(!value.is_null()) {
            line.push_back(' ');
            format_value(line, value, fopts);
          }
        }
        break;
      }
  }

void
do_check_array(const V_array& arr, const ::rocket::cow_string& group,
               const ::rocket::cow_string& name)
  {
    const Value* first = nullptr;
    for(const auto& elem : arr) {
      if(elem.is_null())
        continue;

      if(!first) {
        first = &elem;
        continue;
      }

      if(elem.type() != first->type()) {
        ::rocket::cow_string msg;
        msg.append(elem.summary());
        msg.append(" differs from ");
        msg.append(first->summary());
        throw Error(error_inconsistent_array, msg, group, name);
      }
    }
  }

}  // namespace

void
format_variable(::rocket::cow_string& out, const ::rocket::cow_string& name, const Value& value,
                const Index_Vector* starts, const ::rocket::cow_string* comment,
                const Format_Options& fopts)
  {
    ::rocket::cow_string shown = fopts.has(option_uppercase) ? ascii_upper(name) : name;
    ::rocket::cow_vector<::rocket::cow_string> assigns;
    do_compose(assigns, shown, value, starts, fopts);

    for(size_t k = 0;  k != assigns.size();  ++k) {
      out.append(fopts.indent);
      out.append(assigns[k]);
      if(fopts.has(option_end_comma))
        out.push_back(',');

      // The comment goes after the last line.
      if(comment && !comment->empty() && (k + 1 == assigns.size())) {
        out.append("  ");
        if((*comment)[0] != '!')
          out.append("! ");
        out.append(*comment);
      }
      out.push_back('\n');
    }
  }

Group::
Group(const ::rocket::cow_string& name)
  : m_name(ascii_lower(name))
  {
  }

void
Group::
set_name(const ::rocket::cow_string& name)
  {
    this->m_name = ascii_lower(name);
  }

bool
Group::
contains(const ::rocket::cow_string& name) const
  {
    return this->m_vars.find(ascii_lower(name)) != this->m_vars.end();
  }

const Value*
Group::
find(const ::rocket::cow_string& name) const
  {
    auto it = this->m_vars.find(ascii_lower(name));
    if(it == this->m_vars.end())
      return nullptr;
    return &(it->second);
  }

Value*
Group::
mut_find(const ::rocket::cow_string& name)
  {
    auto key = ascii_lower(name);
    if(this->m_vars.find(key) == this->m_vars.end())
      return nullptr;
    return &(this->m_vars.try_emplace(key).first->second);
  }

const Value&
Group::
at(const ::rocket::cow_string& name) const
  {
    auto it = this->m_vars.find(ascii_lower(name));
    if(it == this->m_vars.end())
      throw Error(error_variable_not_found, ::rocket::cow_string(), this->m_name, ascii_lower(name));
    return it->second;
  }

Value&
Group::
insert(const ::rocket::cow_string& name, const Value& value)
  {
    auto key = ascii_lower(name);
    auto r = this->m_vars.try_emplace(key);
    if(r.second)
      this->m_order.push_back(key);

    r.first->second = value;
    return r.first->second;
  }

bool
Group::
erase(const ::rocket::cow_string& name)
  {
    auto key = ascii_lower(name);
    if(this->m_vars.erase(key) == 0)
      return false;

    this->m_starts.erase(key);
    this->m_comments.erase(key);

    ::rocket::cow_vector<::rocket::cow_string> order;
    for(const auto& other : this->m_order)
      if(other != key)
        order.push_back(other);
    this->m_order.swap(order);
    return true;
  }

void
Group::
clear() noexcept
  {
    this->m_order.clear();
    this->m_vars.clear();
    this->m_starts.clear();
    this->m_comments.clear();
  }

const Index_Vector*
Group::
start_indices(const ::rocket::cow_string& name) const
  {
    auto it = this->m_starts.find(ascii_lower(name));
    if(it == this->m_starts.end())
      return nullptr;
    return &(it->second);
  }

void
Group::
set_start_indices(const ::rocket::cow_string& name, const Index_Vector& starts)
  {
    auto key = ascii_lower(name);
    if(starts.empty())
      this->m_starts.erase(key);
    else
      this->m_starts.try_emplace(key).first->second = starts;
  }

const ::rocket::cow_string*
Group::
comment(const ::rocket::cow_string& name) const
  {
    auto it = this->m_comments.find(ascii_lower(name));
    if(it == this->m_comments.end())
      return nullptr;
    return &(it->second);
  }

void
Group::
set_comment(const ::rocket::cow_string& name, const ::rocket::cow_string& text)
  {
    auto key = ascii_lower(name);
    if(text.empty())
      this->m_comments.erase(key);
    else
      this->m_comments.try_emplace(key).first->second = text;
  }

::std::optional<V_integer>
Group::
get_integer(const ::rocket::cow_string& name) const
  {
    auto value = this->find(name);
    if(!value || !value->can_convert_to(t_integer))
      return ::std::nullopt;
    return value->as_integer();
  }

::std::optional<V_real>
Group::
get_real(const ::rocket::cow_string& name) const
  {
    auto value = this->find(name);
    if(!value || !value->can_convert_to(t_real))
      return ::std::nullopt;
    return value->as_real();
  }

::std::optional<V_logical>
Group::
get_logical(const ::rocket::cow_string& name) const
  {
    auto value = this->find(name);
    if(!value || !value->is_logical())
      return ::std::nullopt;
    return value->as_logical();
  }

::std::optional<V_character>
Group::
get_character(const ::rocket::cow_string& name) const
  {
    auto value = this->find(name);
    if(!value || !value->is_character())
      return ::std::nullopt;
    return value->as_character();
  }

void
Group::
apply_patch(const Group& patch)
  {
    for(const auto& name : patch.m_order) {
      const Value& incoming = patch.m_vars.at(name);
      auto existing = this->find(name);
      if(existing)
        this->insert(name, merge_values(*existing, incoming));
      else
        this->insert(name, incoming);

      if(auto starts = patch.start_indices(name))
        this->set_start_indices(name, *starts);

      if(auto text = patch.comment(name))
        this->set_comment(name, *text);
    }
  }

void
Group::
merge_with(const Group& other, Merge_Strategy strategy)
  {
    for(const auto& name : other.m_order) {
      const Value& incoming = other.m_vars.at(name);
      auto existing = this->find(name);
      if(existing && (strategy == merge_skip_existing))
        continue;

      if(existing)
        this->insert(name, merge_with_strategy(*existing, incoming, strategy));
      else
        this->insert(name, incoming);

      if(auto starts = other.start_indices(name))
        this->set_start_indices(name, *starts);

      if(auto text = other.comment(name))
        this->set_comment(name, *text);
    }
  }

Group
Group::
diff_from(const Group& base) const
  {
    Group patch(this->m_name);
    for(const auto& name : this->m_order) {
      const Value& value = this->m_vars.at(name);
      auto other = base.find(name);
      if(other && other->equals(value))
        continue;

      patch.insert(name, value);
      if(auto starts = this->start_indices(name))
        patch.set_start_indices(name, *starts);
      if(auto text = this->comment(name))
        patch.set_comment(name, *text);
    }
    return patch;
  }

void
Group::
validate() const
  {
    for(const auto& name : this->m_order) {
      const Value& value = this->m_vars.at(name);
      if(value.is_array())
        do_check_array(value.as_array(), this->m_name, name);

      if(value.is_multi_array()) {
        const auto& marr = value.as_multi_array();
        size_t count = 1;
        for(size_t dim : marr.dimensions)
          count *= dim;

        if(count != marr.values.size()) {
          ::rocket::cow_string msg;
          msg.append("expecting ");
          format_integer(msg, static_cast<V_integer>(count));
          msg.append(" elements, got ");
          format_integer(msg, static_cast<V_integer>(marr.values.size()));
          throw Error(error_dimension_mismatch, msg, this->m_name, name);
        }

        do_check_array(marr.values, this->m_name, name);
      }
    }
  }

bool
Group::
equals(const Group& other) const
  {
    if(this->m_order.size() != other.m_order.size())
      return false;

    for(size_t k = 0;  k != this->m_order.size();  ++k) {
      const auto& name = this->m_order[k];
      if(name != other.m_order[k])
        return false;

      if(!this->m_vars.at(name).equals(other.m_vars.at(name)))
        return false;

      auto lstarts = this->start_indices(name);
      auto rstarts = other.start_indices(name);
      if(!lstarts != !rstarts)
        return false;

      if(lstarts) {
        if(lstarts->size() != rstarts->size())
          return false;

        for(size_t i = 0;  i != lstarts->size();  ++i)
          if((*lstarts)[i] != (*rstarts)[i])
            return false;
      }

      auto lcomment = this->comment(name);
      auto rcomment = other.comment(name);
      if(!lcomment != !rcomment)
        return false;

      if(lcomment && (*lcomment != *rcomment))
        return false;
    }
    return true;
  }

void
Group::
print_to(::rocket::cow_string& str, const Format_Options& fopts) const
  {
    auto order = this->m_order;
    if(fopts.has(option_sort_variables))
      ::std::sort(order.mut_begin(), order.mut_end());

    for(const auto& name : order)
      format_variable(str, name, this->m_vars.at(name), this->start_indices(name),
                      this->comment(name), fopts);
  }

::rocket::cow_string
Group::
to_string(const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    this->print_to(str, fopts);
    return str;
  }

void
Group::
print_to_stderr(const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    this->print_to(str, fopts);
    ::std::fprintf(stderr, "%s", str.c_str());
  }

}  // namespace fnml
