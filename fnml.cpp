// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "fnml.hpp"
#include <rocket/tinybuf.hpp>
#include <memory>
#include <cerrno>
#include <cstring>
namespace fnml {
namespace {

using unique_FILE = ::std::unique_ptr<::std::FILE, int (*)(::std::FILE*)>;

[[noreturn]]
void
do_throw_file_error(Error_Code code, const char* path, int err)
  {
    ::rocket::cow_string detail;
    detail.append(path);
    detail.append(": ");
    detail.append(::std::strerror(err));
    throw Error(code, detail);
  }

unique_FILE
do_open_for_reading(const char* path)
  {
    unique_FILE fp(::std::fopen(path, "rb"), ::std::fclose);
    if(!fp)
      do_throw_file_error(error_io, path, errno);
    return fp;
  }

unique_FILE
do_open_for_writing(const char* path, bool force)
  {
    unique_FILE fp(::std::fopen(path, force ? "wb" : "wbx"), ::std::fclose);
    if(!fp)
      do_throw_file_error((errno == EEXIST) ? error_file_exists : error_io, path, errno);
    return fp;
  }

::rocket::cow_string
do_read_file(const char* path)
  {
    auto fp = do_open_for_reading(path);
    return read_all(fp.get());
  }

void
do_write_file(const char* path, const ::rocket::cow_string& text, bool force)
  {
    auto fp = do_open_for_writing(path, force);
    if(::std::fwrite(text.data(), 1, text.size(), fp.get()) != text.size())
      do_throw_file_error(error_io, path, errno);

    // Errors are only reported by `fclose()` if buffered data can't be
    // flushed.
    if(::std::fclose(fp.release()) != 0)
      do_throw_file_error(error_io, path, errno);
  }

}  // namespace

Namelist
reads(const ::rocket::cow_string& text, const Scan_Options& sopts)
  {
    return parse_document(text, sopts);
  }

Namelist
read(const char* path, const Scan_Options& sopts)
  {
    return parse_document(do_read_file(path), sopts);
  }

void
write(const Namelist& nml, const char* path, const Format_Options& fopts, bool force)
  {
    ::rocket::cow_string text;
    nml.print_to(text, fopts);
    do_write_file(path, text, force);
  }

::rocket::cow_string
patch(const ::rocket::cow_string& text, const Namelist& patch, const Format_Options& fopts,
      const Scan_Options& sopts)
  {
    ::rocket::cow_string str;
    Streaming_Parser parser(text, sopts);
    parser.parse_and_patch(str, patch, fopts);
    return str;
  }

Namelist
patch_to(const ::rocket::cow_string& text, const Namelist& patch, ::rocket::tinybuf& buf,
         const Format_Options& fopts, const Scan_Options& sopts)
  {
    Streaming_Parser parser(text, sopts);
    return parser.parse_and_patch(buf, patch, fopts);
  }

Namelist
patch_to(const ::rocket::cow_string& text, const Namelist& patch, ::std::FILE* fp,
         const Format_Options& fopts, const Scan_Options& sopts)
  {
    Streaming_Parser parser(text, sopts);
    return parser.parse_and_patch(fp, patch, fopts);
  }

Namelist
patch_file(const char* in_path, const Namelist& patch, const char* out_path,
           const Format_Options& fopts, const Scan_Options& sopts)
  {
    // Read the whole file first, as it may be overwritten.
    Streaming_Parser parser(do_read_file(in_path), sopts);
    ::rocket::cow_string str;
    Namelist result = parser.parse_and_patch(str, patch, fopts);

    if(!out_path || !*out_path)
      out_path = in_path;

    do_write_file(out_path, str, true);
    return result;
  }

Namelist
patch_with_template(const char* template_path, const Namelist& patch, const char* out_path,
                    const Format_Options& fopts, bool force)
  {
    if(!template_path || !*template_path)
      throw Error(error_missing_template, ::rocket::cow_string(&"no template file given"));

    if(!out_path || !*out_path)
      throw Error(error_missing_template, ::rocket::cow_string(&"no output file given"));

    Streaming_Parser parser(do_read_file(template_path));
    ::rocket::cow_string str;
    Namelist result = parser.parse_and_patch(str, patch, fopts);
    do_write_file(out_path, str, force);
    return result;
  }

}  // namespace fnml
