// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef FNML_FNML_HPP_
#define FNML_FNML_HPP_

#include "fwd.hpp"
#include "error.hpp"
#include "token.hpp"
#include "lexer.hpp"
#include "scanner.hpp"
#include "value.hpp"
#include "format.hpp"
#include "findex.hpp"
#include "merge.hpp"
#include "group.hpp"
#include "namelist.hpp"
#include "parser.hpp"
namespace fnml {

// Parses a document from a string.
Namelist
reads(const ::rocket::cow_string& text, const Scan_Options& sopts = Scan_Options());

// Parses a document from a file. An `Error` with `error_io` is thrown if the
// file can't be read.
Namelist
read(const char* path, const Scan_Options& sopts = Scan_Options());

// Writes a document to a file in canonical form. An existing file is only
// overwritten if `force` is set; otherwise an `Error` with `error_file_exists`
// is thrown.
void
write(const Namelist& nml, const char* path, const Format_Options& fopts = Format_Options(),
      bool force = false);

// Patches the text of a document, keeping its formatting, and returns the
// patched text.
::rocket::cow_string
patch(const ::rocket::cow_string& text, const Namelist& patch,
      const Format_Options& fopts = Format_Options(), const Scan_Options& sopts = Scan_Options());

// Patches the text of a document and writes it to a stream. The patched
// document is returned.
Namelist
patch_to(const ::rocket::cow_string& text, const Namelist& patch, ::rocket::tinybuf& buf,
         const Format_Options& fopts = Format_Options(), const Scan_Options& sopts = Scan_Options());

Namelist
patch_to(const ::rocket::cow_string& text, const Namelist& patch, ::std::FILE* fp,
         const Format_Options& fopts = Format_Options(), const Scan_Options& sopts = Scan_Options());

// Patches a file. If `out_path` is null or empty, `in_path` is rewritten.
// The patched document is returned.
Namelist
patch_file(const char* in_path, const Namelist& patch, const char* out_path = nullptr,
           const Format_Options& fopts = Format_Options(), const Scan_Options& sopts = Scan_Options());

// Creates `out_path` from a template file with values from `patch`. An
// `Error` with `error_missing_template` is thrown if no template is given.
// The output file is only overwritten if `force` is set.
Namelist
patch_with_template(const char* template_path, const Namelist& patch, const char* out_path,
                    const Format_Options& fopts = Format_Options(), bool force = false);

}  // namespace fnml
#endif
