// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "namelist.hpp"
#include "error.hpp"
#include <clocale>
#include <cstdio>
#undef NDEBUG
#include <assert.h>

static
::fnml::Namelist
sample()
  {
    ::fnml::Namelist nml;
    auto& time = nml.insert_group(&"time_nml");
    time.insert(&"dt", 0.5);
    time.insert(&"nsteps", 100);
    time.insert(&"title", &"it's a run");
    time.set_comment(&"dt", &"seconds");

    auto& grid = nml.insert_group(&"Grid_NML");
    grid.insert(&"nx", ::fnml::V_array{ 10, 20, 30 });
    grid.insert(&"origin", ::fnml::V_complex(0.5, -1.0));
    grid.insert(&"periodic", ::fnml::V_array{ true, false });
    grid.insert(&"offset", ::fnml::V_array{ 1.5, 2.5 });
    grid.set_start_indices(&"offset", { 0 });
    grid.insert(&"cell", 7);
    grid.set_start_indices(&"cell", { 2, 3 });

    ::fnml::V_multi_array marr;
    marr.values = { 1, 2, 3, 4, 5, 6 };
    marr.dimensions = { 2, 3 };
    marr.start_indices = { 1, 1 };
    grid.insert(&"mask", marr);

    ::fnml::V_derived fields;
    fields.try_emplace(&"name", &"sensor");
    fields.try_emplace(&"depth", -3.25);
    grid.insert(&"probe", fields);

    ::fnml::V_derived_array elems;
    elems.push_back(fields);
    elems.push_back(fields);
    grid.insert(&"probes", elems);
    return nml;
  }

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");

    {
      auto nml = sample();
      assert(nml.size() == 2);
      assert(nml.group_names()[1] == "grid_nml");
      assert(nml.contains_group(&"GRID_nml"));
      assert(nml.find_group(&"none") == nullptr);
      assert(nml.at_group(&"time_nml").at(&"nsteps") == ::fnml::Value(100));

      bool thrown = false;
      try {
        nml.at_group(&"none");
      }
      catch(::fnml::Error& err) {
        thrown = true;
        assert(err.code() == ::fnml::error_group_not_found);
        assert(err.group() == "none");
      }
      assert(thrown);

      // Inserting an existing group returns it.
      nml.insert_group(&"TIME_NML").insert(&"extra", 1);
      assert(nml.size() == 2);
      assert(nml.at_group(&"time_nml").size() == 4);

      // Replacing a group keeps its position.
      ::fnml::Group time(&"time_nml");
      time.insert(&"dt", 1.0);
      nml.insert_group(time);
      assert(nml.group_names()[0] == "time_nml");
      assert(nml.at_group(&"time_nml").size() == 1);

      nml.rename_group(&"grid_nml", &"Mesh_NML");
      assert(nml.group_names()[1] == "mesh_nml");
      assert(nml.at_group(&"mesh_nml").name() == "mesh_nml");
      assert(!nml.contains_group(&"grid_nml"));

      bool renamed = false;
      try {
        nml.rename_group(&"mesh_nml", &"time_nml");
        renamed = true;
      }
      catch(::fnml::Error& err) {
        assert(err.code() == ::fnml::error_duplicate_name);
      }
      assert(!renamed);

      try {
        nml.rename_group(&"grid_nml", &"other");
        renamed = true;
      }
      catch(::fnml::Error& err) {
        assert(err.code() == ::fnml::error_group_not_found);
      }
      assert(!renamed);

      assert(nml.erase_group(&"Time_Nml"));
      assert(!nml.erase_group(&"time_nml"));
      assert(nml.size() == 1);
      nml.validate();
    }

    {
      ::fnml::Namelist nml;
      nml.insert_group(&"b").insert(&"x", 1);
      nml.insert_group(&"a").insert(&"y", &"s");

      assert(nml.to_string() ==
          "&b\n"
          "    x = 1\n"
          "/\n"
          "\n"
          "&a\n"
          "    y = 's'\n"
          "/\n");

      ::fnml::Format_Options fopts;
      fopts.opts = ::fnml::option_sort_groups | ::fnml::option_uppercase;
      assert(nml.to_string(fopts) ==
          "&A\n"
          "    Y = 's'\n"
          "/\n"
          "\n"
          "&B\n"
          "    X = 1\n"
          "/\n");

      ::std::FILE* fp = ::std::tmpfile();
      assert(fp);
      nml.print_to(fp);
      ::std::rewind(fp);
      ::fnml::Namelist back;
      assert(back.parse(fp));
      assert(back == nml);
      ::std::fclose(fp);
    }

    {
      // Round trip
      auto nml = sample();
      auto text = nml.to_string();

      ::fnml::Namelist back;
      assert(back.parse(text));
      assert(back == nml);
      assert(back.to_string() == text);
    }

    {
      // Arrays of one element and arrays ending with a null survive a round
      // trip.
      ::fnml::Namelist nml;
      auto& grp = nml.insert_group(&"g");
      grp.insert(&"one", ::fnml::V_array{ 5 });
      grp.insert(&"tail", ::fnml::V_array{ 1, ::fnml::Value() });
      grp.insert(&"nulls", ::fnml::V_array{ ::fnml::Value(), ::fnml::Value() });
      grp.insert(&"lone", ::fnml::V_array{ ::fnml::Value() });

      auto text = nml.to_string();
      assert(text ==
          "&g\n"
          "    one(1:1) = 5\n"
          "    tail(1:2) = 1, 1*\n"
          "    nulls(1:2) = , 1*\n"
          "    lone(1:1) = 1*\n"
          "/\n");

      ::fnml::Namelist back;
      assert(back.parse(text));
      assert(back == nml);
      assert(back.at_group(&"g").start_indices(&"one") == nullptr);
    }

    {
      ::fnml::Namelist base;
      base.insert_group(&"g").insert(&"x", 5);

      ::fnml::Namelist patch;
      patch.insert_group(&"g").insert(&"x", ::fnml::V_array{ 1, 2 });
      patch.insert_group(&"h").insert(&"y", true);
      patch.insert_group(&"k").insert(&"z", 0);

      auto nml = base;
      nml.apply_patch(patch);
      assert(nml.size() == 3);
      assert(nml.at_group(&"g").at(&"x") == ::fnml::Value(::fnml::V_array{ 5, 1, 2 }));
      assert(nml.group_names()[2] == "k");

      nml = base;
      nml.apply_selective_patch(patch, { &"G", &"k" }, { &"k" });
      assert(nml.size() == 1);
      assert(nml.at_group(&"g").at(&"x").is_array());

      nml = base;
      nml.apply_selective_patch(patch, { }, { &"g" });
      assert(nml.size() == 3);
      assert(nml.at_group(&"g").at(&"x") == ::fnml::Value(5));

      nml = base;
      nml.merge_with(patch, ::fnml::merge_skip_existing);
      assert(nml.at_group(&"g").at(&"x") == ::fnml::Value(5));
      assert(nml.contains_group(&"h"));

      nml = base;
      nml.merge_with(patch, ::fnml::merge_replace);
      auto diff = nml.diff_from(base);
      assert(diff.size() == 3);
      auto copy = base;
      copy.apply_patch(diff);
      assert(copy.at_group(&"g").at(&"x") == ::fnml::Value(::fnml::V_array{ 5, 1, 2 }));
      assert(nml.diff_from(nml).empty());
    }

    {
      // Errors are stored into the context, and the object is left intact.
      auto nml = sample();
      ::fnml::Parser_Context ctx;
      nml.parse_with(ctx, &"&g\n  x = 'oops\n/\n");
      assert(ctx.code == ::fnml::error_unterminated_string);
      assert(ctx.error != nullptr);
      assert(ctx.line == 2);
      assert(ctx.column == 7);
      assert(nml == sample());

      nml.parse_with(ctx, &"&g x = 1 ");
      assert(ctx.code == ::fnml::error_unexpected_eof);
      assert(!nml.parse(&"&g x = 1 "));
      assert(nml.size() == 2);

      nml.parse_with(ctx, &"&g x = 1 /");
      assert(ctx.code == ::fnml::error_none);
      assert(ctx.error == nullptr);
      assert(nml.size() == 1);

      ::std::FILE* fp = ::std::tmpfile();
      assert(fp);
      ::std::fputs("$other y = 2 $end", fp);
      ::std::rewind(fp);
      assert(nml.parse(fp));
      ::std::fclose(fp);
      assert(nml.at_group(&"other").at(&"y") == ::fnml::Value(2));
    }
  }
