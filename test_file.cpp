// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "fnml.hpp"
#include <clocale>
#include <cstdio>
#undef NDEBUG
#include <assert.h>

static
::rocket::cow_string
slurp(const char* path)
  {
    ::std::FILE* fp = ::std::fopen(path, "rb");
    assert(fp);
    auto str = ::fnml::read_all(fp);
    ::std::fclose(fp);
    return str;
  }

static
::fnml::Error_Code
file_error(void (*func)())
  {
    try {
      func();
    }
    catch(::fnml::Error& err) {
      return err.code();
    }
    return ::fnml::error_none;
  }

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");

    const char* path = "fnml_test_file.nml";
    const char* out_path = "fnml_test_file_out.nml";
    ::std::remove(path);
    ::std::remove(out_path);

    {
      auto nml = ::fnml::reads(&"&g x = 1, y = 'two' /");
      assert(nml.at_group(&"g").at(&"y") == ::fnml::Value(&"two"));

      ::fnml::write(nml, path);
      assert(slurp(path) == "&g\n    x = 1\n    y = 'two'\n/\n");
      assert(::fnml::read(path) == nml);

      // Existing files are not overwritten by default.
      bool thrown = false;
      try {
        ::fnml::write(nml, path);
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_file_exists);
        assert(err.kind() == ::fnml::error_kind_io);
      }
      assert(thrown);

      nml.insert_group(&"h");
      ::fnml::write(nml, path, ::fnml::Format_Options(), true);
      assert(::fnml::read(path).size() == 2);
    }

    {
      assert(file_error([] { ::fnml::read("fnml_no_such_dir/none.nml");  }) == ::fnml::error_io);
      assert(file_error([] { ::fnml::patch_with_template("", ::fnml::Namelist(), "x.nml");  })
             == ::fnml::error_missing_template);
      assert(file_error([] { ::fnml::patch_with_template(nullptr, ::fnml::Namelist(), "x.nml");  })
             == ::fnml::error_missing_template);
    }

    {
      ::fnml::Namelist patch;
      patch.insert_group(&"g").insert(&"x", 42);

      auto str = ::fnml::patch(&"&g  x = 1  ! keep\n/\n", patch);
      assert(str == "&g  x = 42  ! keep\n/\n");

      ::std::FILE* fp = ::std::tmpfile();
      assert(fp);
      auto result = ::fnml::patch_to(&"&g x = 1 /", patch, fp);
      assert(result.at_group(&"g").at(&"x") == ::fnml::Value(42));
      ::std::rewind(fp);
      assert(::fnml::read_all(fp) == "&g x = 42 /");
      ::std::fclose(fp);
    }

    {
      ::std::FILE* fp = ::std::fopen(path, "wb");
      assert(fp);
      ::std::fputs("! template\n&g\n  x = 1\n/\n", fp);
      ::std::fclose(fp);

      ::fnml::Namelist patch;
      patch.insert_group(&"g").insert(&"x", 2);

      auto result = ::fnml::patch_with_template(path, patch, out_path);
      assert(result.at_group(&"g").at(&"x") == ::fnml::Value(2));
      assert(slurp(out_path) == "! template\n&g\n  x = 2\n/\n");
      assert(slurp(path) == "! template\n&g\n  x = 1\n/\n");

      assert(file_error([] {
               ::fnml::patch_with_template("fnml_test_file.nml", ::fnml::Namelist(),
                                           "fnml_test_file_out.nml");
             }) == ::fnml::error_file_exists);

      // In place
      patch.insert_group(&"g").insert(&"x", 3);
      ::fnml::patch_file(path, patch);
      assert(slurp(path) == "! template\n&g\n  x = 3\n/\n");

      ::fnml::patch_file(path, patch, out_path);
      assert(slurp(out_path) == slurp(path));
    }

    ::std::remove(path);
    ::std::remove(out_path);
  }
