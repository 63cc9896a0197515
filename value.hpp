// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_VALUE_HPP_
#define FNML_VALUE_HPP_

#include "fwd.hpp"
#include <rocket/variant.hpp>
#include <rocket/tinyfmt.hpp>
#include <complex>
#include <optional>
#include <cstdio>
namespace fnml {

// Define aliases and enumerators for data types.
using V_null           = ::std::nullptr_t;
using V_integer        = ::std::int64_t;
using V_real           = double;
using V_complex        = ::std::complex<double>;
using V_logical        = bool;
using V_character      = ::rocket::cow_string;
using V_array          = ::rocket::cow_vector<Value>;
using V_derived        = ::rocket::cow_hashmap<::rocket::cow_string, Value,
                                                ::rocket::cow_string::hash>;
using V_derived_array  = ::rocket::cow_vector<V_derived>;

// A multi-dimensional array. Elements are stored in column-major order, so
// the first subscript varies fastest. The number of elements shall equal the
// product of all dimensions, but this is only checked by validation.
struct V_multi_array
  {
    V_array values;
    ::rocket::cow_vector<size_t> dimensions;
    ::rocket::cow_vector<::std::int64_t> start_indices;
  };

// Expand a sequence of alternatives without a trailing comma.
#define FNML_TYPES_7C1E03A9_(U)  \
    /*  0 */  U##_null  \
    /*  1 */, U##_integer  \
    /*  2 */, U##_real  \
    /*  3 */, U##_complex  \
    /*  4 */, U##_logical  \
    /*  5 */, U##_character  \
    /*  6 */, U##_array  \
    /*  7 */, U##_multi_array  \
    /*  8 */, U##_derived  \
    /*  9 */, U##_derived_array

// Define type enumerators such as `t_null`, `t_integer`, `t_real`, and so on.
enum Type : ::std::uint8_t {FNML_TYPES_7C1E03A9_(t)};
using Variant = ::rocket::variant<FNML_TYPES_7C1E03A9_(V)>;

// Gets the name of a type, such as `integer` or `derived_type`.
const char*
describe_type(Type type) noexcept;

// This class stores a value of a namelist variable, which can be a scalar,
// an array, or a derived type. Values are copy-on-write.
class Value
  {
  private:
    Variant m_stor;

  public:
    // Initializes a null value. A null value denotes absence, such as the
    // empty element in `1, , 3`.
    constexpr Value(V_null = nullptr) noexcept { }

    // Gets the type of the stored value.
    constexpr
    Type
    type() const noexcept
      { return static_cast<Type>(this->m_stor.index());  }

    const char*
    type_name() const noexcept
      { return describe_type(this->type());  }

    // Swaps two values in a smart way.
    Value&
    swap(Value& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

    // Checks whether the stored value is null.
    bool
    is_null() const noexcept
      { return this->m_stor.index() == t_null;  }

    // Sets a null value.
    void
    clear() noexcept
      { this->m_stor.emplace<V_null>();  }

    Value&
    operator=(V_null) & noexcept
      {
        this->clear();
        return *this;
      }

    // Initializes an integer. Only conversions from signed types are provided.
    Value(int val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Value(long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Value(long long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    bool
    is_integer() const noexcept
      { return this->m_stor.index() == t_integer;  }

    // Gets an integer. A real number without a fractional part is converted.
    // Other values cause an `Error`, and there is no effect.
    V_integer
    as_integer() const;

    // Gets or creates an integer. If the stored value is not an integer, it is
    // overwritten with zero, and a reference to the new value is returned.
    V_integer&
    mut_integer() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_integer>())
          return *ptr;
        else
          return this->m_stor.emplace<V_integer>();
      }

    Value&
    operator=(int val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    Value&
    operator=(long val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    Value&
    operator=(long long val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    // Initialize a real number.
    Value(float val) noexcept
      {
        this->m_stor.emplace<V_real>(val);
      }

    Value(double val) noexcept
      {
        this->m_stor.emplace<V_real>(val);
      }

    bool
    is_real() const noexcept
      { return this->m_stor.index() == t_real;  }

    // Checks whether the stored value is an integer or a real number.
    bool
    is_numeric() const noexcept
      { return (this->m_stor.index() == t_integer) || (this->m_stor.index() == t_real);  }

    // Gets a real number. An integer is converted, despite potential precision
    // loss. Other values cause an `Error`, and there is no effect.
    V_real
    as_real() const;

    V_real&
    mut_real() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_real>())
          return *ptr;
        else if(auto psi = this->m_stor.ptr<V_integer>())
          return this->m_stor.emplace<V_real>(static_cast<V_real>(*psi));
        else
          return this->m_stor.emplace<V_real>();
      }

    Value&
    operator=(float val) & noexcept
      {
        this->mut_real() = val;
        return *this;
      }

    Value&
    operator=(double val) & noexcept
      {
        this->mut_real() = val;
        return *this;
      }

    // Initializes a complex number.
    Value(const V_complex& val) noexcept
      {
        this->m_stor.emplace<V_complex>(val);
      }

    bool
    is_complex() const noexcept
      { return this->m_stor.index() == t_complex;  }

    // Gets a complex number. An integer or a real number is converted with a
    // zero imaginary part. Other values cause an `Error`.
    V_complex
    as_complex() const;

    V_complex&
    mut_complex() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_complex>())
          return *ptr;
        else
          return this->m_stor.emplace<V_complex>();
      }

    Value&
    operator=(const V_complex& val) & noexcept
      {
        this->mut_complex() = val;
        return *this;
      }

    // Initializes a logical value.
    Value(bool val) noexcept
      {
        this->m_stor.emplace<V_logical>(val);
      }

    bool
    is_logical() const noexcept
      { return this->m_stor.index() == t_logical;  }

    // Gets a logical value. Other values cause an `Error`.
    V_logical
    as_logical() const;

    V_logical&
    mut_logical() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_logical>())
          return *ptr;
        else
          return this->m_stor.emplace<V_logical>();
      }

    Value&
    operator=(bool val) & noexcept
      {
        this->mut_logical() = val;
        return *this;
      }

    // Initializes a character string.
    Value(const ::rocket::cow_string& val) noexcept
      {
        this->m_stor.emplace<V_character>(val);
      }

    template<size_t N>
    Value(const char (*val)[N]) noexcept
      {
        this->m_stor.emplace<V_character>(val);
      }

    bool
    is_character() const noexcept
      { return this->m_stor.index() == t_character;  }

    // Gets a character string. Other values cause an `Error`.
    const V_character&
    as_character() const;

    V_character&
    mut_character() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_character>())
          return *ptr;
        else
          return this->m_stor.emplace<V_character>();
      }

    Value&
    operator=(const ::rocket::cow_string& val) & noexcept
      {
        this->mut_character() = val;
        return *this;
      }

    template<size_t N>
    Value&
    operator=(const char (*val)[N]) & noexcept
      {
        this->mut_character() = val;
        return *this;
      }

    // Initializes an array.
    Value(const V_array& val) noexcept
      {
        this->m_stor.emplace<V_array>(val);
      }

    bool
    is_array() const noexcept
      { return this->m_stor.index() == t_array;  }

    // Gets an array. For a multi-dimensional array, its elements are returned
    // in column-major order. Other values cause an `Error`.
    const V_array&
    as_array() const;

    V_array&
    mut_array() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_array>())
          return *ptr;
        else
          return this->m_stor.emplace<V_array>();
      }

    Value&
    operator=(const V_array& val) & noexcept
      {
        this->mut_array() = val;
        return *this;
      }

    // Initializes a multi-dimensional array.
    Value(const V_multi_array& val) noexcept
      {
        this->m_stor.emplace<V_multi_array>(val);
      }

    bool
    is_multi_array() const noexcept
      { return this->m_stor.index() == t_multi_array;  }

    const V_multi_array&
    as_multi_array() const
      { return this->m_stor.as<V_multi_array>();  }

    V_multi_array&
    mut_multi_array() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_multi_array>())
          return *ptr;
        else
          return this->m_stor.emplace<V_multi_array>();
      }

    // Initializes a derived type, whose fields are unordered.
    Value(const V_derived& val) noexcept
      {
        this->m_stor.emplace<V_derived>(val);
      }

    bool
    is_derived() const noexcept
      { return this->m_stor.index() == t_derived;  }

    const V_derived&
    as_derived() const
      { return this->m_stor.as<V_derived>();  }

    V_derived&
    mut_derived() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_derived>())
          return *ptr;
        else
          return this->m_stor.emplace<V_derived>();
      }

    Value&
    operator=(const V_derived& val) & noexcept
      {
        this->mut_derived() = val;
        return *this;
      }

    // Initializes an array of derived types.
    Value(const V_derived_array& val) noexcept
      {
        this->m_stor.emplace<V_derived_array>(val);
      }

    bool
    is_derived_array() const noexcept
      { return this->m_stor.index() == t_derived_array;  }

    const V_derived_array&
    as_derived_array() const
      { return this->m_stor.as<V_derived_array>();  }

    V_derived_array&
    mut_derived_array() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_derived_array>())
          return *ptr;
        else
          return this->m_stor.emplace<V_derived_array>();
      }

    // Checks whether `as_integer()`, `as_real()` and so on would succeed for
    // `target`, without performing the conversion.
    bool
    can_convert_to(Type target) const noexcept;

    // Compares two values structurally. Real numbers are compared by value,
    // so a NaN never equals anything.
    bool
    equals(const Value& other) const noexcept;

    // Gets a short description for diagnostics, such as `integer(42)` or
    // `array[3]`.
    ::rocket::cow_string
    summary() const;

    // Print this value as it would appear on the right-hand side of an
    // assignment. A derived type has no such form and is printed as a
    // placeholder.
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
void
swap(Value& lhs, Value& rhs) noexcept
  {
    lhs.swap(rhs);
  }

inline
bool
operator==(const Value& lhs, const Value& rhs) noexcept
  {
    return lhs.equals(rhs);
  }

inline
bool
operator!=(const Value& lhs, const Value& rhs) noexcept
  {
    return !lhs.equals(rhs);
  }

inline
::rocket::tinyfmt&
operator<<(::rocket::tinyfmt& fmt, const Value& value)
  {
    value.print_to(fmt.mut_buf());
    return fmt;
  }

// Values are reference-counting so all these will not throw exceptions. It is
// recommended that they be passed by value or by const reference.
static_assert(::std::is_nothrow_copy_constructible<Value>::value, "");
static_assert(::std::is_nothrow_copy_assignable<Value>::value, "");
static_assert(::std::is_nothrow_move_constructible<Value>::value, "");
static_assert(::std::is_nothrow_move_assignable<Value>::value, "");

// Parses the text of a literal. If `hint` is `t_null`, the type is detected
// in this order: logical, complex, real, integer, and character, which always
// succeeds. Otherwise, the parser for `hint` is used, and an `Error` is thrown
// if the text is not valid for it. Surrounding whitespace is ignored, and an
// empty text yields null.
Value
parse_value(const ::rocket::cow_string& text, Type hint = t_null);

// These parse literals of a specific type, and throw `Error` with
// `error_invalid_literal` on failure.
Value
parse_integer(const ::rocket::cow_string& text);

Value
parse_real(const ::rocket::cow_string& text);

Value
parse_complex(const ::rocket::cow_string& text);

Value
parse_logical(const ::rocket::cow_string& text);

Value
parse_character(const ::rocket::cow_string& text);

// Parses a comma-separated list of values, such as `1, 2*3, , 'x'`. Commas
// inside quotes and parentheses do not separate values. A single value is
// returned as is; multiple values are returned as an array.
Value
parse_value_list(const ::rocket::cow_string& text);

// These are limits of repeat counts such as `3*0.5`, and of element indices
// of derived type arrays such as `a(3)%b`, beyond which input is rejected.
constexpr V_integer repeat_count_max = 1048576;
constexpr V_integer derived_index_max = 65536;

// Parses a repeat expression such as `3*0.5` into an array. The value after
// `*` may be omitted to denote nulls. The count shall be positive and no
// greater than `repeat_count_max`.
Value
parse_repeat(const ::rocket::cow_string& text);

// Guesses the type of a literal without parsing it completely.
Type
infer_type(const ::rocket::cow_string& text);

// Checks whether a text is an optional sign followed by digits, with an
// optional kind suffix.
bool
looks_like_integer(const ::rocket::cow_string& text);

// Checks whether a text is a real literal that is not an integer.
bool
looks_like_real(const ::rocket::cow_string& text);

// Limits that can be imposed on parsed values.
struct Value_Constraints
  {
    ::std::optional<V_integer> min_integer;
    ::std::optional<V_integer> max_integer;
    ::std::optional<V_real> min_real;
    ::std::optional<V_real> max_real;
    ::std::optional<size_t> max_length;
    ::std::optional<size_t> max_array_size;
  };

// Checks a value against constraints. Elements of arrays are checked
// recursively. An `Error` with `error_invalid_literal` is thrown on the first
// violation.
void
validate_value(const Value& value, const Value_Constraints& limits);

}  // namespace fnml

extern template
class ::rocket::variant<FNML_TYPES_7C1E03A9_(::fnml::V)>;

extern template
class ::rocket::cow_vector<::fnml::Value>;

extern template
class ::rocket::cow_hashmap<::rocket::cow_string, ::fnml::Value,
  ::rocket::cow_string::hash>;
#endif
