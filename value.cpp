// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "value.hpp"
#include "format.hpp"
#include "error.hpp"
#include <rocket/tinybuf.hpp>
#include <rocket/ascii_numput.hpp>
#include <rocket/xthrow.hpp>
#include <algorithm>
#include <cmath>
#include <climits>
template class ::rocket::variant<FNML_TYPES_7C1E03A9_(::fnml::V)>;
template class ::rocket::cow_vector<::fnml::Value>;
template class ::rocket::cow_hashmap<::rocket::cow_string, ::fnml::Value,
    ::rocket::cow_string::hash>;
namespace fnml {
namespace {

[[noreturn]]
void
do_throw_conversion(const Value& value, Type target)
  {
    ::rocket::cow_string msg;
    msg.append("cannot convert ");
    msg.append(value.summary());
    msg.append(" to ");
    msg.append(describe_type(target));
    throw Error(error_type_conversion, msg);
  }

bool
do_real_is_integral(double val) noexcept
  {
    // The upper bound is exclusive as 2^63 is not representable.
    return ::std::isfinite(val) && (::std::trunc(val) == val)
           && (val >= -0x1p63) && (val < 0x1p63);
  }

bool
do_derived_equals(const V_derived& lhs, const V_derived& rhs) noexcept
  {
    if(lhs.size() != rhs.size())
      return false;

    for(auto it = lhs.begin();  it != lhs.end();  ++it) {
      auto other = rhs.find(it->first);
      if(other == rhs.end())
        return false;

      if(!it->second.equals(other->second))
        return false;
    }
    return true;
  }

template<typename xVector>
bool
do_vector_equals(const xVector& lhs, const xVector& rhs) noexcept
  {
    if(lhs.size() != rhs.size())
      return false;

    for(size_t k = 0;  k != lhs.size();  ++k)
      if(!(lhs[k] == rhs[k]))
        return false;
    return true;
  }

bool
do_derived_array_equals(const V_derived_array& lhs, const V_derived_array& rhs) noexcept
  {
    if(lhs.size() != rhs.size())
      return false;

    for(size_t k = 0;  k != lhs.size();  ++k)
      if(!do_derived_equals(lhs[k], rhs[k]))
        return false;
    return true;
  }

void
do_append_double(::rocket::cow_string& str, const char* format, double val)
  {
    char temp[64];
    int len = ::std::snprintf(temp, sizeof(temp), format, val);
    if(len <= 0)
      return;

    // The decimal point may be a comma in some locales.
    size_t bpos = str.size();
    str.append(temp, ::std::min(static_cast<size_t>(len), sizeof(temp) - 1));
    for(size_t k = bpos;  k != str.size();  ++k)
      if(str[k] == ',')
        str.mut_data()[k] = '.';
  }

}  // namespace

const char*
describe_type(Type type) noexcept
  {
    switch(type)
      {
      case t_null:
        return "null";

      case t_integer:
        return "integer";

      case t_real:
        return "real";

      case t_complex:
        return "complex";

      case t_logical:
        return "logical";

      case t_character:
        return "character";

      case t_array:
        return "array";

      case t_multi_array:
        return "multi_array";

      case t_derived:
        return "derived_type";

      case t_derived_array:
        return "derived_type_array";

      default:
        return "[unknown]";
      }
  }

V_integer
Value::
as_integer() const
  {
    if(auto psi = this->m_stor.ptr<V_integer>())
      return *psi;

    if(auto psr = this->m_stor.ptr<V_real>())
      if(do_real_is_integral(*psr))
        return static_cast<V_integer>(*psr);

    do_throw_conversion(*this, t_integer);
  }

V_real
Value::
as_real() const
  {
    if(auto psr = this->m_stor.ptr<V_real>())
      return *psr;

    if(auto psi = this->m_stor.ptr<V_integer>())
      return static_cast<V_real>(*psi);

    do_throw_conversion(*this, t_real);
  }

V_complex
Value::
as_complex() const
  {
    if(auto psc = this->m_stor.ptr<V_complex>())
      return *psc;

    if(auto psr = this->m_stor.ptr<V_real>())
      return V_complex(*psr, 0.0);

    if(auto psi = this->m_stor.ptr<V_integer>())
      return V_complex(static_cast<double>(*psi), 0.0);

    do_throw_conversion(*this, t_complex);
  }

V_logical
Value::
as_logical() const
  {
    if(auto psl = this->m_stor.ptr<V_logical>())
      return *psl;

    do_throw_conversion(*this, t_logical);
  }

const V_character&
Value::
as_character() const
  {
    if(auto pss = this->m_stor.ptr<V_character>())
      return *pss;

    do_throw_conversion(*this, t_character);
  }

const V_array&
Value::
as_array() const
  {
    if(auto psa = this->m_stor.ptr<V_array>())
      return *psa;

    if(auto psm = this->m_stor.ptr<V_multi_array>())
      return psm->values;

    do_throw_conversion(*this, t_array);
  }

bool
Value::
can_convert_to(Type target) const noexcept
  {
    if(this->type() == target)
      return true;

    switch(this->type())
      {
      case t_integer:
        return (target == t_real) || (target == t_complex);

      case t_real:
        if(target == t_integer)
          return do_real_is_integral(this->m_stor.as<V_real>());
        else
          return target == t_complex;

      case t_multi_array:
        return target == t_array;

      default:
        return false;
      }
  }

bool
Value::
equals(const Value& other) const noexcept
  {
    if(this->type() != other.type())
      return false;

    switch(this->type())
      {
      case t_null:
        return true;

      case t_integer:
        return this->m_stor.as<V_integer>() == other.m_stor.as<V_integer>();

      case t_real:
        return this->m_stor.as<V_real>() == other.m_stor.as<V_real>();

      case t_complex:
        return this->m_stor.as<V_complex>() == other.m_stor.as<V_complex>();

      case t_logical:
        return this->m_stor.as<V_logical>() == other.m_stor.as<V_logical>();

      case t_character:
        return this->m_stor.as<V_character>() == other.m_stor.as<V_character>();

      case t_array:
        return do_vector_equals(this->m_stor.as<V_array>(), other.m_stor.as<V_array>());

      case t_multi_array:
        {
          const auto& lhs = this->m_stor.as<V_multi_array>();
          const auto& rhs = other.m_stor.as<V_multi_array>();
          return do_vector_equals(lhs.dimensions, rhs.dimensions)
                 && do_vector_equals(lhs.start_indices, rhs.start_indices)
                 && do_vector_equals(lhs.values, rhs.values);
        }

      case t_derived:
        return do_derived_equals(this->m_stor.as<V_derived>(), other.m_stor.as<V_derived>());

      case t_derived_array:
        return do_derived_array_equals(this->m_stor.as<V_derived_array>(),
                                       other.m_stor.as<V_derived_array>());

      default:
        return false;
      }
  }

::rocket::cow_string
Value::
summary() const
  {
    ::rocket::cow_string str;
    ::rocket::ascii_numput nump;

    switch(this->type())
      {
      case t_null:
        str.append("null");
        break;

      case t_integer:
        nump.put_DI(this->m_stor.as<V_integer>());
        str.append("integer(");
        str.append(nump.data(), nump.size());
        str.push_back(')');
        break;

      case t_real:
        str.append("real(");
        do_append_double(str, "%.6f", this->m_stor.as<V_real>());
        str.push_back(')');
        break;

      case t_complex:
        str.append("complex(");
        do_append_double(str, "%.3f", this->m_stor.as<V_complex>().real());
        str.append(", ");
        do_append_double(str, "%.3f", this->m_stor.as<V_complex>().imag());
        str.push_back(')');
        break;

      case t_logical:
        str.append("logical(");
        str.append(this->m_stor.as<V_logical>() ? "true" : "false");
        str.push_back(')');
        break;

      case t_character:
        {
          // Long strings are truncated.
          const auto& val = this->m_stor.as<V_character>();
          str.append("character(\"");
          if(val.size() > 20) {
            str.append(val.data(), 17);
            str.append("...");
          }
          else
            str.append(val);
          str.append("\")");
        }
        break;

      case t_array:
        nump.put_DI(static_cast<::std::int64_t>(this->m_stor.as<V_array>().size()));
        str.append("array[");
        str.append(nump.data(), nump.size());
        str.push_back(']');
        break;

      case t_multi_array:
        {
          const auto& dims = this->m_stor.as<V_multi_array>().dimensions;
          str.append("multi_array[");
          for(size_t k = 0;  k != dims.size();  ++k) {
            if(k != 0)
              str.push_back('x');
            nump.put_DI(static_cast<::std::int64_t>(dims[k]));
            str.append(nump.data(), nump.size());
          }
          str.push_back(']');
        }
        break;

      case t_derived:
        nump.put_DI(static_cast<::std::int64_t>(this->m_stor.as<V_derived>().size()));
        str.append("derived_type(");
        str.append(nump.data(), nump.size());
        str.append(" fields)");
        break;

      case t_derived_array:
        nump.put_DI(static_cast<::std::int64_t>(this->m_stor.as<V_derived_array>().size()));
        str.append("derived_type_array[");
        str.append(nump.data(), nump.size());
        str.push_back(']');
        break;

      default:
        ::rocket::sprintf_and_throw<::std::invalid_argument>(
              "fnml::Value: unknown type enumeration `%d`",
              static_cast<int>(this->m_stor.index()));
      }

    return str;
  }

void
Value::
print_to(::rocket::tinybuf& buf, const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    format_value(str, *this, fopts);
    buf.putn(str.data(), str.size());
  }

void
Value::
print_to(::rocket::cow_string& str, const Format_Options& fopts) const
  {
    format_value(str, *this, fopts);
  }

void
Value::
print_to(::std::FILE* fp, const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    format_value(str, *this, fopts);
    if(::std::fwrite(str.data(), 1, str.size(), fp) != str.size())
      throw Error(error_io, ::rocket::cow_string(&"could not write value"));
  }

::rocket::cow_string
Value::
to_string(const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    format_value(str, *this, fopts);
    return str;
  }

void
Value::
print_to_stderr(const Format_Options& fopts) const
  {
    ::rocket::cow_string str;
    format_value(str, *this, fopts);
    ::std::fprintf(stderr, "%s\n", str.c_str());
  }

}  // namespace fnml
