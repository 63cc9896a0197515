// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_ERROR_HPP_
#define FNML_ERROR_HPP_

#include "fwd.hpp"
#include <exception>
namespace fnml {

enum Error_Kind : ::std::uint8_t
  {
    error_kind_io          = 0,
    error_kind_lexical     = 1,
    error_kind_syntax      = 2,
    error_kind_value       = 3,
    error_kind_structural  = 4,
    error_kind_patch       = 5,
  };

enum Error_Code : ::std::uint8_t
  {
    error_none                 =  0,
    error_io                   =  1,
    error_file_exists          =  2,
    error_unterminated_string  =  3,
    error_invalid_exponent     =  4,
    error_invalid_token        =  5,
    error_unexpected_eof       =  6,
    error_unexpected_token     =  7,
    error_type_conversion      =  8,
    error_invalid_literal      =  9,
    error_invalid_index        = 10,
    error_dimension_mismatch   = 11,
    error_inconsistent_array   = 12,
    error_duplicate_name       = 13,
    error_group_not_found      = 14,
    error_variable_not_found   = 15,
    error_incompatible_patch   = 16,
    error_missing_template     = 17,
  };

// Gets the kind of an error code.
Error_Kind
error_kind_of(Error_Code code) noexcept;

// Gets a static string that describes an error code.
const char*
describe_error_code(Error_Code code) noexcept;

// This is the exception class for all errors that are reported by this
// library, except for programming errors such as invalid enumerations. An
// error carries either a source position (if it is raised by the lexer or
// parser) or the names of the group and variable that are involved (if it is
// raised by a document operation). The message is composed on construction.
class Error
  : public ::std::exception
  {
  private:
    Error_Code m_code;
    ::std::int64_t m_line = 0;
    ::std::int64_t m_column = 0;
    ::rocket::cow_string m_group;
    ::rocket::cow_string m_variable;
    ::rocket::cow_string m_detail;
    ::rocket::cow_string m_what;

  public:
    // Creates an error without any context.
    Error(Error_Code code, const ::rocket::cow_string& detail);

    // Creates an error at a source position.
    Error(Error_Code code, const ::rocket::cow_string& detail, ::std::int64_t line,
          ::std::int64_t column);

    // Creates an error about a group or a variable. Either name may be empty.
    Error(Error_Code code, const ::rocket::cow_string& detail,
          const ::rocket::cow_string& group, const ::rocket::cow_string& variable);

    Error(const Error&) = default;
    Error& operator=(const Error&) & = default;
    ~Error() override;

  private:
    void
    do_compose_message();

  public:
    const char*
    what() const noexcept override
      { return this->m_what.c_str();  }

    Error_Code
    code() const noexcept
      { return this->m_code;  }

    Error_Kind
    kind() const noexcept
      { return error_kind_of(this->m_code);  }

    // Gets the source position, or zero if the error is not from a parser.
    ::std::int64_t
    line() const noexcept
      { return this->m_line;  }

    ::std::int64_t
    column() const noexcept
      { return this->m_column;  }

    const ::rocket::cow_string&
    group() const noexcept
      { return this->m_group;  }

    const ::rocket::cow_string&
    variable() const noexcept
      { return this->m_variable;  }

    // Gets the message without any context.
    const ::rocket::cow_string&
    detail() const noexcept
      { return this->m_detail;  }

    // Lexical and syntax errors abort the current parse. Other errors can be
    // handled by the caller, for example by falling back to a default value.
    bool
    is_recoverable() const noexcept
      { return (this->kind() != error_kind_lexical) && (this->kind() != error_kind_syntax);  }
  };

// This structure provides storage for parser states. It need not be
// initialized before `parse_with()`.
struct Parser_Context
  {
    // if no error, `error_none`; otherwise, the code of the error
    Error_Code code;

    // if no error, a null pointer; otherwise, a static string about the error
    const char* error;

    // position of the error, if any
    ::std::int64_t line;
    ::std::int64_t column;
  };

}  // namespace fnml
#endif
