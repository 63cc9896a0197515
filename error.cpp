// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "error.hpp"
#include <rocket/ascii_numput.hpp>
namespace fnml {

Error_Kind
error_kind_of(Error_Code code) noexcept
  {
    switch(code)
      {
      case error_none:
      case error_io:
      case error_file_exists:
        return error_kind_io;

      case error_unterminated_string:
      case error_invalid_exponent:
      case error_invalid_token:
        return error_kind_lexical;

      case error_unexpected_eof:
      case error_unexpected_token:
        return error_kind_syntax;

      case error_type_conversion:
      case error_invalid_literal:
      case error_invalid_index:
      case error_dimension_mismatch:
      case error_inconsistent_array:
        return error_kind_value;

      case error_duplicate_name:
      case error_group_not_found:
      case error_variable_not_found:
        return error_kind_structural;

      case error_incompatible_patch:
      case error_missing_template:
        return error_kind_patch;

      default:
        return error_kind_io;
      }
  }

const char*
describe_error_code(Error_Code code) noexcept
  {
    switch(code)
      {
      case error_none:
        return "no error";

      case error_io:
        return "input/output error";

      case error_file_exists:
        return "file already exists";

      case error_unterminated_string:
        return "unterminated string literal";

      case error_invalid_exponent:
        return "invalid exponent in number";

      case error_invalid_token:
        return "invalid token";

      case error_unexpected_eof:
        return "unexpected end of input";

      case error_unexpected_token:
        return "unexpected token";

      case error_type_conversion:
        return "type conversion failed";

      case error_invalid_literal:
        return "invalid literal";

      case error_invalid_index:
        return "invalid array index";

      case error_dimension_mismatch:
        return "dimension mismatch";

      case error_inconsistent_array:
        return "inconsistent array element types";

      case error_duplicate_name:
        return "duplicate name";

      case error_group_not_found:
        return "group not found";

      case error_variable_not_found:
        return "variable not found";

      case error_incompatible_patch:
        return "incompatible patch";

      case error_missing_template:
        return "missing template";

      default:
        return "unknown error";
      }
  }

Error::
Error(Error_Code code, const ::rocket::cow_string& detail)
  : m_code(code), m_detail(detail)
  {
    this->do_compose_message();
  }

Error::
Error(Error_Code code, const ::rocket::cow_string& detail, ::std::int64_t line,
      ::std::int64_t column)
  : m_code(code), m_line(line), m_column(column), m_detail(detail)
  {
    this->do_compose_message();
  }

Error::
Error(Error_Code code, const ::rocket::cow_string& detail,
      const ::rocket::cow_string& group, const ::rocket::cow_string& variable)
  : m_code(code), m_group(group), m_variable(variable), m_detail(detail)
  {
    this->do_compose_message();
  }

Error::
~Error()
  {
  }

void
Error::
do_compose_message()
  {
    // fnml: <description>: <detail> (at line 3, column 7)
    this->m_what.append("fnml: ");
    this->m_what.append(describe_error_code(this->m_code));

    if(!this->m_detail.empty()) {
      this->m_what.append(": ");
      this->m_what.append(this->m_detail);
    }

    if(this->m_line > 0) {
      ::rocket::ascii_numput nump;
      nump.put_DI(this->m_line);
      this->m_what.append(" (at line ");
      this->m_what.append(nump.data(), nump.size());
      nump.put_DI(this->m_column);
      this->m_what.append(", column ");
      this->m_what.append(nump.data(), nump.size());
      this->m_what.push_back(')');
    }

    if(!this->m_group.empty()) {
      this->m_what.append(" (in group `");
      this->m_what.append(this->m_group);
      this->m_what.push_back('`');

      if(!this->m_variable.empty()) {
        this->m_what.append(", variable `");
        this->m_what.append(this->m_variable);
        this->m_what.push_back('`');
      }
      this->m_what.push_back(')');
    }
    else if(!this->m_variable.empty()) {
      this->m_what.append(" (variable `");
      this->m_what.append(this->m_variable);
      this->m_what.append("`)");
    }
  }

}  // namespace fnml
