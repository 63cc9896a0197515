// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "namelist.hpp"
#include "parser.hpp"
#include "utils.hpp"
#include <rocket/tinybuf.hpp>
#include <algorithm>
namespace fnml {
namespace {

bool
do_name_listed(const ::rocket::cow_vector<::rocket::cow_string>& names,
               const ::rocket::cow_string& name)
  {
    for(const auto& other : names)
      if(ascii_lower(other) == name)
        return true;
    return false;
  }

void
do_parse_text(Namelist& nml, Parser_Context& ctx, const ::rocket::cow_string& str,
              const Scan_Options& sopts)
  {
    ctx.code = error_none;
    ctx.error = nullptr;
    ctx.line = 0;
    ctx.column = 0;

    try {
      Namelist result = parse_document(str, sopts);
      nml = ::std::move(result);
    }
    catch(Error& err) {
      ctx.code = err.code();
      ctx.error = describe_error_code(err.code());
      ctx.line = err.line();
      ctx.column = err.column();
    }
  }

void
do_record_io_error(Parser_Context& ctx, const Error& err)
  {
    ctx.code = err.code();
    ctx.error = describe_error_code(err.code());
    ctx.line = 0;
    ctx.column = 0;
  }

}  // namespace

::rocket::cow_string
read_all(::rocket::tinybuf& buf)
  {
    ::rocket::cow_string str;
    char temp[4096];
    size_t n;
    while((n = buf.getn(temp, sizeof(temp))) != 0)
      str.append(temp, n);
    return str;
  }

::rocket::cow_string
read_all(::std::FILE* fp)
  {
    ::rocket::cow_string str;
    char temp[4096];
    size_t n;
    while((n = ::std::fread(temp, 1, sizeof(temp), fp)) != 0)
      str.append(temp, n);

    if(::std::ferror(fp))
      throw Error(error_io, ::rocket::cow_string(&"could not read from stream"));
    return str;
  }

bool
Namelist::
contains_group(const ::rocket::cow_string& name) const
  {
    return this->m_groups.find(ascii_lower(name)) != this->m_groups.end();
  }

const Group*
Namelist::
find_group(const ::rocket::cow_string& name) const
  {
    auto it = this->m_groups.find(ascii_lower(name));
    if(it == this->m_groups.end())
      return nullptr;
    return &(it->second);
  }

Group*
Namelist::
mut_find_group(const ::rocket::cow_string& name)
  {
    auto key = ascii_lower(name);
    if(this->m_groups.find(key) == this->m_groups.end())
      return nullptr;
    return &(this->m_groups.try_emplace(key).first->second);
  }

const Group&
Namelist::
at_group(const ::rocket::cow_string& name) const
  {
    auto it = this->m_groups.find(ascii_lower(name));
    if(it == this->m_groups.end())
      throw Error(error_group_not_found, ::rocket::cow_string(), ascii_lower(name),
                  ::rocket::cow_string());
    return it->second;
  }

Group&
Namelist::
insert_group(const ::rocket::cow_string& name)
  {
    auto key = ascii_lower(name);
    auto r = this->m_groups.try_emplace(key, key);
    if(r.second)
      this->m_order.push_back(key);
    return r.first->second;
  }

Group&
Namelist::
insert_group(const Group& group)
  {
    Group& stored = this->insert_group(group.name());
    stored = group;
    return stored;
  }

bool
Namelist::
erase_group(const ::rocket::cow_string& name)
  {
    auto key = ascii_lower(name);
    if(this->m_groups.erase(key) == 0)
      return false;

    ::rocket::cow_vector<::rocket::cow_string> order;
    for(const auto& other : this->m_order)
      if(other != key)
        order.push_back(other);
    this->m_order.swap(order);
    return true;
  }

void
Namelist::
rename_group(const ::rocket::cow_string& old_name, const ::rocket::cow_string& new_name)
  {
    auto okey = ascii_lower(old_name);
    auto nkey = ascii_lower(new_name);
    auto it = this->m_groups.find(okey);
    if(it == this->m_groups.end())
      throw Error(error_group_not_found, ::rocket::cow_string(), okey, ::rocket::cow_string());

    if(nkey == okey)
      return;

    if(this->m_groups.find(nkey) != this->m_groups.end())
      throw Error(error_duplicate_name, nkey, nkey, ::rocket::cow_string());

    Group group = it->second;
    group.set_name(nkey);
    this->m_groups.erase(okey);
    this->m_groups.try_emplace(nkey, ::std::move(group));

    for(size_t k = 0;  k != this->m_order.size();  ++k)
      if(this->m_order[k] == okey)
        this->m_order.mut(k) = nkey;
  }

void
Namelist::
clear() noexcept
  {
    this->m_order.clear();
    this->m_groups.clear();
  }

void
Namelist::
apply_patch(const Namelist& patch)
  {
    for(const auto& name : patch.m_order)
      this->insert_group(name).apply_patch(patch.m_groups.at(name));
  }

void
Namelist::
apply_selective_patch(const Namelist& patch,
                      const ::rocket::cow_vector<::rocket::cow_string>& include,
                      const ::rocket::cow_vector<::rocket::cow_string>& exclude)
  {
    for(const auto& name : patch.m_order) {
      if(!include.empty() && !do_name_listed(include, name))
        continue;

      if(do_name_listed(exclude, name))
        continue;

      this->insert_group(name).apply_patch(patch.m_groups.at(name));
    }
  }

void
Namelist::
merge_with(const Namelist& other, Merge_Strategy strategy)
  {
    for(const auto& name : other.m_order)
      this->insert_group(name).merge_with(other.m_groups.at(name), strategy);
  }

Namelist
Namelist::
diff_from(const Namelist& base) const
  {
    Namelist patch;
    for(const auto& name : this->m_order) {
      Group empty(name);
      auto other = base.find_group(name);
      Group diff = this->m_groups.at(name).diff_from(other ? *other : empty);
      if(!diff.empty())
        patch.insert_group(diff);
    }
    return patch;
  }

void
Namelist::
validate() const
  {
    for(const auto& name : this->m_order)
      this->m_groups.at(name).validate();
  }

bool
Namelist::
equals(const Namelist& other) const
  {
    if(this->m_order.size() != other.m_order.size())
      return false;

    for(size_t k = 0;  k != this->m_order.size();  ++k) {
      const auto& name = this->m_order[k];
      if(name != other.m_order[k])
        return false;

      if(!this->m_groups.at(name).equals(other.m_groups.at(name)))
        return false;
    }
    return true;
  }

void
Namelist::
parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, const Scan_Options& sopts)
  {
    do_parse_text(*this, ctx, str, sopts);
  }

void
Namelist::
parse_with(Parser_Context& ctx, ::rocket::tinybuf& buf, const Scan_Options& sopts)
  {
    ::rocket::cow_string str = read_all(buf);
    do_parse_text(*this, ctx, str, sopts);
  }

void
Namelist::
parse_with(Parser_Context& ctx, ::std::FILE* fp, const Scan_Options& sopts)
  {
    ::rocket::cow_string str;
    try {
      str = read_all(fp);
    }
    catch(Error& err) {
      do_record_io_error(ctx, err);
      return;
    }
    do_parse_text(*this, ctx, str, sopts);
  }

bool
Namelist::
parse(const ::rocket::cow_string& str, const Scan_Options& sopts)
  {
    Parser_Context ctx;
    do_parse_text(*this, ctx, str, sopts);
    return !ctx.error;
  }

bool
Namelist::
parse(::rocket::tinybuf& buf, const Scan_Options& sopts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, buf, sopts);
    return !ctx.error;
  }

bool
Namelist::
parse(::std::FILE* fp, const Scan_Options& sopts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, fp, sopts);
    return !ctx.error;
  }

void
Namelist::
print_to(::rocket::tinybuf& buf, const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    this->print_to(str, fopts);
    buf.putn(str.data(), str.size());
  }

void
Namelist::
print_to(::rocket::cow_string& str, const Format_Options& fopts) const
  {
    auto order = this->m_order;
    if(fopts.has(option_sort_groups))
      ::std::sort(order.mut_begin(), order.mut_end());

    for(size_t k = 0;  k != order.size();  ++k) {
      // &group
      //     x = 1
      // /
      if(k != 0)
        str.push_back('\n');

      str.push_back('&');
      str.append(fopts.has(option_uppercase) ? ascii_upper(order[k]) : order[k]);
      str.push_back('\n');
      this->m_groups.at(order[k]).print_to(str, fopts);
      str.append("/\n");
    }
  }

void
Namelist::
print_to(::std::FILE* fp, const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    this->print_to(str, fopts);
    if(::std::fwrite(str.data(), 1, str.size(), fp) != str.size())
      throw Error(error_io, ::rocket::cow_string(&"could not write namelist"));
  }

::rocket::cow_string
Namelist::
to_string(const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    this->print_to(str, fopts);
    return str;
  }

void
Namelist::
print_to_stderr(const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    this->print_to(str, fopts);
    ::std::fprintf(stderr, "%s", str.c_str());
  }

}  // namespace fnml
