// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "group.hpp"
#include "error.hpp"
#include <clocale>
#undef NDEBUG
#include <assert.h>

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");

    {
      ::fnml::Group grp(&"Time_NML");
      assert(grp.name() == "time_nml");
      assert(grp.empty());

      grp.insert(&"DT", 0.5);
      grp.insert(&"steps", 100);
      grp.insert(&"dt", 0.25);
      assert(grp.size() == 2);
      assert(grp.names()[0] == "dt");
      assert(grp.names()[1] == "steps");
      assert(grp.contains(&"Dt"));
      assert(grp.at(&"dt") == ::fnml::Value(0.25));
      assert(grp.find(&"missing") == nullptr);

      assert(grp.get_real(&"dt") == 0.25);
      assert(grp.get_real(&"steps") == 100.0);
      assert(grp.get_integer(&"steps") == 100);
      assert(!grp.get_integer(&"dt"));
      assert(!grp.get_logical(&"steps"));
      assert(!grp.get_character(&"missing"));

      bool thrown = false;
      try {
        grp.at(&"missing");
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_variable_not_found);
        assert(err.kind() == ::fnml::error_kind_structural);
        assert(err.group() == "time_nml");
        assert(err.variable() == "missing");
        assert(err.is_recoverable());
      }
      assert(thrown);

      grp.set_comment(&"dt", &"seconds");
      grp.set_start_indices(&"steps", { 3 });
      assert(grp.erase(&"DT"));
      assert(!grp.erase(&"dt"));
      assert(grp.size() == 1);
      assert(grp.comment(&"dt") == nullptr);
      assert(grp.start_indices(&"steps")->size() == 1);

      grp.clear();
      assert(grp.empty());
      assert(grp.start_indices(&"steps") == nullptr);
    }

    {
      ::fnml::Group grp(&"g");
      grp.insert(&"x", 1);
      grp.insert(&"arr", ::fnml::V_array{ 1, 2, 3 });
      grp.insert(&"flag", true);
      grp.insert(&"name", &"abc");
      grp.insert(&"empty", ::fnml::V_array());
      grp.insert(&"nothing", ::fnml::Value());
      grp.set_comment(&"x", &"the answer");

      auto str = grp.to_string();
      assert(str ==
          "    x = 1  ! the answer\n"
          "    arr(1:3) = 1, 2, 3\n"
          "    flag = .true.\n"
          "    name = 'abc'\n"
          "    empty =\n"
          "    nothing =\n");

      ::fnml::Format_Options fopts;
      fopts.opts = ::fnml::option_uppercase | ::fnml::option_end_comma | ::fnml::option_sort_variables;
      fopts.indent = &"  ";
      str = grp.to_string(fopts);
      assert(str ==
          "  ARR(1:3) = 1, 2, 3,\n"
          "  EMPTY =,\n"
          "  FLAG = .TRUE.,\n"
          "  NAME = 'abc',\n"
          "  NOTHING =,\n"
          "  X = 1,  ! the answer\n");
    }

    {
      ::rocket::cow_string str;
      ::fnml::Index_Vector starts = { 0 };
      ::fnml::format_variable(str, &"a", ::fnml::V_array{ 5, 6 }, &starts, nullptr,
                              ::fnml::Format_Options());
      assert(str == "    a(0:1) = 5, 6\n");

      str.clear();
      ::fnml::format_variable(str, &"a", ::fnml::V_array{ 5 }, nullptr, nullptr,
                              ::fnml::Format_Options());
      assert(str == "    a(1:1) = 5\n");

      str.clear();
      starts = { 2, 3 };
      ::fnml::format_variable(str, &"s", 1.5, &starts, nullptr, ::fnml::Format_Options());
      assert(str == "    s(2, 3) = 1.5\n");

      ::fnml::V_multi_array marr;
      marr.values = { 1, 2, 3, 4, 5, 6 };
      marr.dimensions = { 2, 3 };
      marr.start_indices = { 1, 0 };
      str.clear();
      ::fnml::format_variable(str, &"m", marr, nullptr, nullptr, ::fnml::Format_Options());
      assert(str == "    m(1:2, 0:2) = 1, 2, 3, 4, 5, 6\n");

      ::fnml::V_derived fields;
      fields.try_emplace(&"z", 1);
      fields.try_emplace(&"a", &"x");
      str.clear();
      ::fnml::format_variable(str, &"t", fields, nullptr, nullptr, ::fnml::Format_Options());
      assert(str == "    t%a = 'x'\n    t%z = 1\n");

      ::fnml::V_derived_array elems;
      elems.push_back(fields);
      elems.push_back(fields);
      str.clear();
      ::fnml::format_variable(str, &"t", elems, nullptr, nullptr, ::fnml::Format_Options());
      assert(str == "    t(1)%a = 'x'\n    t(1)%z = 1\n    t(2)%a = 'x'\n    t(2)%z = 1\n");
    }

    {
      // Long arrays are wrapped.
      ::fnml::V_array arr;
      for(int k = 0;  k != 30;  ++k)
        arr.push_back(1000 + k);

      ::rocket::cow_string str;
      ::fnml::Format_Options fopts;
      fopts.column_width = 40;
      ::fnml::format_variable(str, &"v", arr, nullptr, nullptr, fopts);
      assert(str.size() > 40);

      size_t width = 0;
      size_t lines = 0;
      for(char c : str)
        if(c == '\n') {
          assert(width <= 40);
          width = 0;
          lines ++;
        }
        else
          width ++;
      assert(lines > 1);
      assert(::rocket::cow_string(str.data(), 20) == "    v(1:30) = 1000, ");
      assert(str.find(",\n              1") != ::rocket::cow_string::npos);
    }

    {
      ::fnml::Group base(&"g");
      base.insert(&"x", 5);
      base.insert(&"y", &"keep");

      ::fnml::Group patch(&"g");
      patch.insert(&"x", ::fnml::V_array{ 1, 2 });
      patch.insert(&"z", true);
      patch.set_comment(&"z", &"new");

      ::fnml::Group grp = base;
      grp.apply_patch(patch);
      assert(grp.size() == 3);
      assert(grp.at(&"x") == ::fnml::Value(::fnml::V_array{ 5, 1, 2 }));
      assert(grp.at(&"y") == ::fnml::Value(&"keep"));
      assert(*(grp.comment(&"z")) == "new");

      grp = base;
      grp.merge_with(patch, ::fnml::merge_replace);
      assert(grp.at(&"x") == ::fnml::Value(::fnml::V_array{ 1, 2 }));

      grp = base;
      grp.merge_with(patch, ::fnml::merge_append);
      assert(grp.at(&"x") == ::fnml::Value(::fnml::V_array{ 5, 1, 2 }));

      grp = base;
      grp.merge_with(patch, ::fnml::merge_skip_existing);
      assert(grp.at(&"x") == ::fnml::Value(5));
      assert(grp.at(&"z") == ::fnml::Value(true));
      assert(*(grp.comment(&"z")) == "new");

      auto diff = grp.diff_from(base);
      assert(diff.size() == 1);
      assert(diff.contains(&"z"));

      ::fnml::Group copy = base;
      copy.apply_patch(diff);
      assert(copy == grp);
      assert(copy != base);
    }

    {
      ::fnml::Group grp(&"g");
      grp.insert(&"ok", ::fnml::V_array{ 1, ::fnml::Value(), 3 });
      grp.validate();

      grp.insert(&"bad", ::fnml::V_array{ ::fnml::Value(), 1, &"x" });
      bool thrown = false;
      try {
        grp.validate();
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_inconsistent_array);
        assert(err.variable() == "bad");
      }
      assert(thrown);

      grp.erase(&"bad");
      ::fnml::V_multi_array marr;
      marr.values = { 1, 2, 3 };
      marr.dimensions = { 2, 2 };
      grp.insert(&"m", marr);
      thrown = false;
      try {
        grp.validate();
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_dimension_mismatch);
      }
      assert(thrown);
    }
  }
