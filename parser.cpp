// This file is part of FNML.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "parser.hpp"
#include "format.hpp"
#include "findex.hpp"
#include "error.hpp"
#include "utils.hpp"
#include <rocket/tinybuf.hpp>
#include <rocket/xthrow.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>
namespace fnml {
namespace {

// One component of a variable reference such as `a(2)%b`.
struct Path_Part
  {
    ::rocket::cow_string name;
    bool has_index = false;
    ::rocket::cow_string index;
    const Token* at = nullptr;
  };

using Path = ::std::vector<Path_Part>;
using Span = ::std::vector<const Token*>;
using Name_Set = ::rocket::cow_hashmap<::rocket::cow_string, bool, ::rocket::cow_string::hash>;

[[noreturn]]
void
do_throw_at(Error_Code code, const Token& tok, const char* expecting)
  {
    ::rocket::cow_string msg;
    if(expecting) {
      msg.append("expecting ");
      msg.append(expecting);
      msg.append(", got ");
    }
    msg.append(describe_token_kind(tok.kind));
    if((tok.kind != token_eof) && !tok.text.empty()) {
      msg.append(" `");
      msg.append(tok.text);
      msg.push_back('`');
    }
    throw Error(code, msg, tok.line, tok.column);
  }

[[noreturn]]
void
do_throw_unexpected(const Token& tok, const char* expecting)
  {
    if(tok.kind == token_eof)
      do_throw_at(error_unexpected_eof, tok, expecting);
    else if(tok.kind == token_invalid)
      do_throw_at(error_invalid_token, tok, nullptr);
    else
      do_throw_at(error_unexpected_token, tok, expecting);
  }

bool
do_starts_reference(Token_Kind kind) noexcept
  {
    return is_any(kind, token_assign, token_lparen, token_percent);
  }

bool
do_is_end_keyword(const Token& tok)
  {
    return tok.is_name() && ascii_iequals(tok.text, "end");
  }

::rocket::cow_string
do_path_key(const Path& path)
  {
    ::rocket::cow_string key;
    for(const auto& part : path) {
      if(!key.empty())
        key.push_back('%');
      key.append(part.name);
      if(part.has_index) {
        key.push_back('(');
        key.append(part.index);
        key.push_back(')');
      }
    }
    return key;
  }

// Converts a list item to a value. Most items consist of a single token.
// An item of multiple tokens is either a complex number such as `(1.0, 2.0)`
// or a bare string of multiple words.
Value
do_build_scalar(const Span& item)
  {
    if(item.size() == 1) {
      const Token& tok = *(item[0]);
      switch(tok.kind)
        {
        case token_string:
          return parse_character(tok.text);

        case token_logical:
          return parse_logical(tok.text);

        case token_integer:
        case token_real:
        case token_complex:
        case token_identifier:
          return parse_value(tok.text);

        default:
          do_throw_unexpected(tok, "value");
        }
    }

    if(item[0]->kind == token_lparen) {
      ::rocket::cow_string text;
      for(auto ptok : item)
        text.append(ptok->text);

      Value value = parse_value(text);
      if(!value.is_complex())
        throw Error(error_invalid_literal, text, item[0]->line, item[0]->column);
      return value;
    }

    ::rocket::cow_string text;
    for(auto ptok : item) {
      if(!text.empty())
        text.push_back(' ');
      text.append(ptok->text);
    }
    return parse_value(text);
  }

// Converts the tokens on the right-hand side of an assignment to a value.
// Items are separated by commas outside parentheses. `n*value` repeats a
// value and `n*` repeats a null.
Value
do_build_value(const Span& span)
  {
    if(span.empty())
      return nullptr;

    ::std::vector<Span> items(1);
    int depth = 0;
    for(auto ptok : span) {
      if(ptok->kind == token_lparen)
        depth ++;
      else if((ptok->kind == token_rparen) && (depth > 0))
        depth --;
      else if((ptok->kind == token_comma) && (depth == 0)) {
        items.emplace_back();
        continue;
      }
      items.back().push_back(ptok);
    }

    V_array arr;
    bool repeated = false;
    for(const auto& item : items) {
      if(item.empty()) {
        arr.emplace_back();
        continue;
      }

      if((item.size() >= 2) && (item[0]->kind == token_integer) && (item[1]->kind == token_star)) {
        V_integer count = parse_integer(item[0]->text).as_integer();
        if((count <= 0) || (count > repeat_count_max))
          throw Error(error_invalid_literal, item[0]->text, item[0]->line, item[0]->column);

        Value elem;
        if(item.size() > 2)
          elem = do_build_scalar(Span(item.begin() + 2, item.end()));

        for(V_integer k = 0;  k != count;  ++k)
          arr.push_back(elem);
        repeated = true;
        continue;
      }

      arr.push_back(do_build_scalar(item));
    }

    if((arr.size() == 1) && !repeated)
      return arr[0];
    return arr;
  }

Index_Bounds
do_parse_bounds(const Path_Part& part)
  {
    try {
      return parse_index_spec(part.index);
    }
    catch(Error& err) {
      throw Error(err.code(), err.detail(), part.at->line, part.at->column);
    }
  }

// Stores `value` into a derived type, following `path` from `k`.
void
do_assign_path(Value& target, const Path& path, size_t k, const Value& value)
  {
    if(k + 1 == path.size()) {
      target = value;
      return;
    }

    const auto& part = path[k];
    if(part.has_index) {
      // a(2)%b
      auto bounds = do_parse_bounds(part);
      if((bounds.size() != 1) || !bounds[0].start || (*(bounds[0].start) < 1)
         || (*(bounds[0].start) > derived_index_max))
        throw Error(error_invalid_index, part.index, part.at->line, part.at->column);

      size_t index = static_cast<size_t>(*(bounds[0].start));
      auto& elems = target.mut_derived_array();
      if(elems.size() < index)
        elems.resize(index);

      Value& field = elems.mut(index - 1).try_emplace(path[k + 1].name).first->second;
      do_assign_path(field, path, k + 1, value);
      return;
    }

    // a%b
    Value& field = target.mut_derived().try_emplace(path[k + 1].name).first->second;
    do_assign_path(field, path, k + 1, value);
  }

// Stores the value of an assignment into a group. Subscripts of a plain
// variable are kept as its start indices; bounds of more than one dimension
// make a multi-dimensional array.
void
do_store(Group& group, const Path& path, const Value& value)
  {
    const auto& root = path[0];

    if(path.size() > 1) {
      Value target;
      if(auto existing = group.find(root.name))
        target = *existing;

      do_assign_path(target, path, 0, value);
      group.insert(root.name, target);
      return;
    }

    if(!root.has_index) {
      group.insert(root.name, value);
      return;
    }

    auto bounds = do_parse_bounds(root);
    bool fully_bounded = (bounds.size() >= 2) && value.is_array();
    for(const auto& bound : bounds)
      if(!bound.start || !bound.end || (bound.effective_stride() != 1))
        fully_bounded = false;

    if(fully_bounded) {
      // a(1:2, 1:3) = ...
      V_multi_array marr;
      for(const auto& bound : bounds) {
        auto size = bound.size(1, 1);
        marr.dimensions.push_back(size ? *size : 0);
        marr.start_indices.push_back(*(bound.start));
      }

      if(value.is_array())
        marr.values = value.as_array();
      else
        marr.values.push_back(value);

      group.insert(root.name, marr);
      group.set_start_indices(root.name, Index_Vector());
      return;
    }

    // A range over a single value, such as `a(1:1) = 5`, denotes an array.
    Value stored = value;
    if((bounds.size() == 1) && (root.index.find(':') != ::rocket::cow_string::npos)
       && !value.is_array() && !value.is_null())
      stored = V_array{ value };

    // a(3) = ...
    // a(0:2) = ...
    Index_Vector starts;
    bool default_origin = true;
    for(const auto& bound : bounds) {
      starts.push_back(bound.effective_start(1));
      if(bound.effective_start(1) != 1)
        default_origin = false;
    }

    group.insert(root.name, stored);
    if(stored.is_array() && default_origin)
      group.set_start_indices(root.name, Index_Vector());
    else
      group.set_start_indices(root.name, starts);
  }

// This is the structural parser. It works on significant tokens only.
// Comments are looked up when a value ends on the same line.
class Structure_Parser
  {
  private:
    Span m_sig;
    ::std::vector<const Token*> m_comments;  // comment after each token, if any
    size_t m_pos = 0;
    Namelist m_nml;

  public:
    explicit
    Structure_Parser(const Token_List& tokens)
      {
        for(const auto& tok : tokens) {
          if(tok.kind == token_whitespace)
            continue;

          if(tok.kind == token_comment) {
            if(!this->m_sig.empty() && !this->m_comments.back()
               && (this->m_sig.back()->line == tok.line))
              this->m_comments.back() = &tok;
            continue;
          }

          this->m_sig.push_back(&tok);
          this->m_comments.push_back(nullptr);
        }

        if(this->m_sig.empty() || (this->m_sig.back()->kind != token_eof))
          ::rocket::sprintf_and_throw<::std::invalid_argument>(
                "fnml::parse_tokens: token list not terminated");
      }

  private:
    const Token&
    do_peek(size_t k = 0) const noexcept
      {
        size_t i = ::std::min(this->m_pos + k, this->m_sig.size() - 1);
        return *(this->m_sig[i]);
      }

    void
    do_parse_path(Path& path)
      {
        for(;;) {
          const Token& tok = this->do_peek();
          if(!tok.is_name())
            do_throw_unexpected(tok, "variable name");

          auto& part = path.emplace_back();
          part.name = ascii_lower(tok.text);
          part.at = &tok;
          this->m_pos ++;

          if(this->do_peek().kind == token_lparen) {
            // Collect the subscript text without parentheses.
            part.has_index = true;
            this->m_pos ++;
            int depth = 1;
            for(;;) {
              const Token& sub = this->do_peek();
              if(sub.kind == token_eof)
                do_throw_unexpected(sub, "`)`");

              this->m_pos ++;
              if(sub.kind == token_lparen)
                depth ++;
              else if((sub.kind == token_rparen) && (-- depth == 0))
                break;
              part.index.append(sub.text);
            }
          }

          if(this->do_peek().kind != token_percent)
            return;

          this->m_pos ++;
        }
      }

    bool
    do_at_value_end() const
      {
        const Token& tok = this->do_peek();
        switch(tok.kind)
          {
          case token_eof:
          case token_group_end:
          case token_group_start:
          case token_group_start_alt:
            return true;

          default:
            return tok.is_name() && do_starts_reference(this->do_peek(1).kind);
          }
      }

    void
    do_parse_assignment(Group& group)
      {
        Path path;
        this->do_parse_path(path);

        if(this->do_peek().kind != token_assign)
          do_throw_unexpected(this->do_peek(), "`=`");

        this->m_pos ++;

        Span span;
        int depth = 0;
        while(!this->do_at_value_end() || (depth != 0)) {
          const Token& tok = this->do_peek();
          if(tok.kind == token_eof)
            break;

          if((tok.kind == token_comma) && (depth == 0)) {
            // A trailing comma ends the list.
            this->m_pos ++;
            if(this->do_at_value_end())
              break;

            span.push_back(&tok);
            continue;
          }

          if(is_any(tok.kind, token_invalid, token_assign))
            do_throw_unexpected(tok, "value");

          if(tok.kind == token_lparen)
            depth ++;
          else if((tok.kind == token_rparen) && (depth > 0))
            depth --;

          span.push_back(&tok);
          this->m_pos ++;
        }

        do_store(group, path, do_build_value(span));

        // Keep a comment after the value on the same line.
        const Token* comment = this->m_comments[this->m_pos - 1];
        if(comment && (path.size() == 1)) {
          size_t k = 1;
          while((k < comment->text.size()) && is_blank(comment->text[k]))
            k ++;
          group.set_comment(path[0].name,
                            ::rocket::cow_string(comment->text.data() + k, comment->text.size() - k));
        }
      }

    void
    do_parse_group()
      {
        const Token& name = this->do_peek();
        if(!name.is_name())
          do_throw_unexpected(name, "group name");

        this->m_pos ++;

        // A repeated group continues the existing one.
        Group group(name.text);
        if(auto existing = this->m_nml.find_group(name.text))
          group = *existing;

        for(;;) {
          const Token& tok = this->do_peek();
          if(tok.kind == token_eof)
            do_throw_at(error_unexpected_eof, tok, "`/`");

          if(tok.kind == token_group_end) {
            this->m_pos ++;
            break;
          }

          if(tok.is_group_start()) {
            // `$end` or `&end` closes a group. A bare `&` or `$` closes it at
            // the end of input or before the next group. Otherwise it begins
            // the next group.
            if(do_is_end_keyword(this->do_peek(1)))
              this->m_pos += 2;
            else if((this->do_peek(1).kind == token_eof) || this->do_peek(1).is_group_start())
              this->m_pos ++;
            break;
          }

          if(tok.kind == token_comma) {
            this->m_pos ++;
            continue;
          }

          if(!tok.is_name())
            do_throw_unexpected(tok, "variable name");

          this->do_parse_assignment(group);
        }

        this->m_nml.insert_group(group);
      }

  public:
    Namelist
    parse()
      {
        bool seen_group = false;
        while(this->do_peek().kind != token_eof) {
          const Token& tok = this->do_peek();
          if(tok.is_group_start()) {
            this->m_pos ++;
            this->do_parse_group();
            seen_group = true;
            continue;
          }

          // Text before the first group is ignored silently.
          if(seen_group)
            ::std::fprintf(stderr, "WARNING: fnml: skipping %s `%s` outside groups at line %lld\n",
                           describe_token_kind(tok.kind), tok.text.c_str(),
                           static_cast<long long>(tok.line));
          this->m_pos ++;
        }
        return ::std::move(this->m_nml);
      }
  };

struct Unified_Sink
  {
    ::rocket::cow_string* str = nullptr;
    ::rocket::tinybuf* buf = nullptr;
    ::std::FILE* fp = nullptr;
    int last = -1;

    Unified_Sink(::rocket::cow_string* s) : str(s)  { }
    Unified_Sink(::rocket::tinybuf* b) : buf(b)  { }
    Unified_Sink(::std::FILE* f) : fp(f)  { }

    void
    putn(const char* s, size_t n)
      {
        if(n == 0)
          return;

        if(this->str)
          this->str->append(s, n);
        else if(this->buf)
          this->buf->putn(s, n);
        else if(this->fp) {
          if(::std::fwrite(s, 1, n, this->fp) != n)
            throw Error(error_io, ::rocket::cow_string(&"could not write patched text"));
        }
        else
          ROCKET_UNREACHABLE();

        this->last = static_cast<unsigned char>(s[n - 1]);
      }

    void
    puts(const ::rocket::cow_string& s)
      {
        this->putn(s.data(), s.size());
      }

    // Starts a new line, unless nothing has been written or the last line
    // has been terminated.
    void
    break_line()
      {
        if((this->last >= 0) && (this->last != '\n'))
          this->putn("\n", 1);
      }
  };

// Finds a value within a derived type following `path`. A null pointer is
// returned if there is no such field.
const Value*
do_lookup_path(const Value* root, const Path& path)
  {
    const Value* cur = root;
    for(size_t k = 0;  (k + 1 < path.size()) && cur;  ++k) {
      const auto& part = path[k];
      const V_derived* fields = nullptr;

      if(part.has_index) {
        if(!cur->is_derived_array())
          return nullptr;

        auto bounds = do_parse_bounds(part);
        if((bounds.size() != 1) || !bounds[0].start)
          return nullptr;

        ::std::int64_t index = *(bounds[0].start);
        const auto& elems = cur->as_derived_array();
        if((index < 1) || (static_cast<size_t>(index) > elems.size()))
          return nullptr;

        fields = &(elems[static_cast<size_t>(index - 1)]);
      }
      else {
        if(!cur->is_derived())
          return nullptr;

        fields = &(cur->as_derived());
      }

      auto it = fields->find(path[k + 1].name);
      cur = (it == fields->end()) ? nullptr : &(it->second);
    }
    return cur;
  }

// Merges elements of two derived type arrays field by field. Fields from
// `incoming` take precedence.
V_derived_array
do_merge_elements(const V_derived_array& existing, const V_derived_array& incoming)
  {
    V_derived_array elems = existing;
    if(elems.size() < incoming.size())
      elems.resize(incoming.size());

    for(size_t k = 0;  k != incoming.size();  ++k)
      for(auto it = incoming[k].begin();  it != incoming[k].end();  ++it)
        elems.mut(k).try_emplace(it->first).first->second = it->second;
    return elems;
  }

// This is the single-pass rewriter. The token list includes whitespace and
// comments.
class Patch_Writer
  {
  private:
    const Token_List& m_toks;
    const Namelist& m_patch;
    const Format_Options& m_fopts;
    Unified_Sink& m_sink;
    size_t m_pos = 0;
    Namelist m_result;

    // state of the current group
    const Group* m_pgroup = nullptr;
    bool m_append = false;
    Name_Set m_touched;
    Name_Set m_touched_paths;

  public:
    Patch_Writer(const Token_List& toks, const Namelist& patch, const Format_Options& fopts,
                 Unified_Sink& sink)
      : m_toks(toks), m_patch(patch), m_fopts(fopts), m_sink(sink)
      {
        if(this->m_toks.empty() || (this->m_toks[this->m_toks.size() - 1].kind != token_eof))
          ::rocket::sprintf_and_throw<::std::invalid_argument>(
                "fnml::Streaming_Parser: token list not terminated");
      }

  private:
    const Token&
    do_tok(size_t i) const noexcept
      {
        return this->m_toks[::std::min(i, this->m_toks.size() - 1)];
      }

    // Gets the index of the first significant token at or after `i`.
    size_t
    do_next_sig(size_t i) const noexcept
      {
        while((i < this->m_toks.size() - 1) && this->m_toks[i].is_trivia())
          i ++;
        return i;
      }

    void
    do_copy(size_t i)
      {
        this->m_sink.puts(this->m_toks[i].text);
      }

    void
    do_copy_trivia()
      {
        while(this->do_tok(this->m_pos).is_trivia())
          this->do_copy(this->m_pos ++);
      }

    bool
    do_is_reference_start(size_t i) const
      {
        return this->do_tok(i).is_name()
               && do_starts_reference(this->do_tok(this->do_next_sig(i + 1)).kind);
      }

    // Checks whether a value ends before token `i`, which is significant.
    bool
    do_at_value_end(size_t i) const
      {
        const Token& tok = this->do_tok(i);
        switch(tok.kind)
          {
          case token_eof:
          case token_group_end:
          case token_group_start:
          case token_group_start_alt:
            return true;

          case token_comma:
            // trailing comma
            return this->do_at_value_end(this->do_next_sig(i + 1))
                   && (this->do_tok(this->do_next_sig(i + 1)).kind != token_comma);

          default:
            return this->do_is_reference_start(i);
          }
      }

    void
    do_copy_path(Path& path)
      {
        for(;;) {
          const Token& tok = this->do_tok(this->m_pos);
          if(!tok.is_name())
            do_throw_unexpected(tok, "variable name");

          auto& part = path.emplace_back();
          part.name = ascii_lower(tok.text);
          part.at = &tok;
          this->do_copy(this->m_pos ++);

          // Subscripts are copied verbatim.
          if(this->do_tok(this->do_next_sig(this->m_pos)).kind == token_lparen) {
            this->do_copy_trivia();
            this->do_copy(this->m_pos ++);
            part.has_index = true;

            int depth = 1;
            for(;;) {
              const Token& sub = this->do_tok(this->m_pos);
              if(sub.kind == token_eof)
                do_throw_unexpected(sub, "`)`");

              this->do_copy(this->m_pos ++);
              if(sub.kind == token_lparen)
                depth ++;
              else if((sub.kind == token_rparen) && (-- depth == 0))
                break;
              else if(!sub.is_trivia())
                part.index.append(sub.text);
            }
          }

          if(this->do_tok(this->do_next_sig(this->m_pos)).kind != token_percent)
            return;

          this->do_copy_trivia();
          this->do_copy(this->m_pos ++);
          this->do_copy_trivia();
        }
      }

    void
    do_patch_assignment(Group& group)
      {
        Path path;
        this->do_copy_path(path);

        this->do_copy_trivia();
        if(this->do_tok(this->m_pos).kind != token_assign)
          do_throw_unexpected(this->do_tok(this->m_pos), "`=`");

        this->do_copy(this->m_pos ++);

        // Find the end of the value.
        Span span;
        size_t first_sig = SIZE_MAX;
        size_t end = this->m_pos;
        int depth = 0;
        size_t i = this->do_next_sig(this->m_pos);
        while((depth != 0) || !this->do_at_value_end(i)) {
          const Token& tok = this->do_tok(i);
          if(tok.kind == token_eof)
            break;

          if(is_any(tok.kind, token_invalid, token_assign))
            do_throw_unexpected(tok, "value");

          if(tok.kind == token_lparen)
            depth ++;
          else if((tok.kind == token_rparen) && (depth > 0))
            depth --;

          if(first_sig == SIZE_MAX)
            first_sig = i;

          span.push_back(&tok);
          end = i + 1;
          i = this->do_next_sig(i + 1);
        }

        // Is there a replacement?
        const Value* pvalue = nullptr;
        if(this->m_pgroup)
          if(auto root = this->m_pgroup->find(path[0].name)) {
            if((path.size() > 1) && !root->is_derived() && !root->is_derived_array())
              throw Error(error_incompatible_patch,
                          ::rocket::cow_string(&"plain value can't replace a derived type field"),
                          group.name(), path[0].name);

            pvalue = do_lookup_path(root, path);
          }

        if(!pvalue) {
          // Keep the original text.
          while(this->m_pos != end)
            this->do_copy(this->m_pos ++);

          do_store(group, path, do_build_value(span));
          return;
        }

        if(pvalue->is_derived() || pvalue->is_derived_array())
          throw Error(error_incompatible_patch,
                      ::rocket::cow_string(&"derived type can't replace a plain value"),
                      group.name(), do_path_key(path));

        // Keep whitespace between `=` and the value, then write the new value
        // in place of the old one.
        if(first_sig != SIZE_MAX)
          while(this->m_pos != first_sig)
            this->do_copy(this->m_pos ++);
        else if(!pvalue->is_null())
          this->m_sink.putn(" ", 1);

        ::rocket::cow_string text;
        format_value(text, *pvalue, this->m_fopts);
        this->m_sink.puts(text);
        this->m_pos = end;

        this->m_touched.try_emplace(path[0].name, true);
        this->m_touched_paths.try_emplace(do_path_key(path), true);
        do_store(group, path, *pvalue);
      }

    // Gets fields that have not been written, where `prefix` is `name` or
    // `name(i)`.
    V_derived
    do_untouched_fields(const ::rocket::cow_string& prefix, const V_derived& fields) const
      {
        V_derived res;
        for(auto it = fields.begin();  it != fields.end();  ++it) {
          ::rocket::cow_string key = prefix;
          key.push_back('%');
          key.append(it->first);
          if(this->m_touched_paths.find(key) == this->m_touched_paths.end())
            res.try_emplace(it->first, it->second);
        }
        return res;
      }

    // Writes variables from the patch that have not been seen in the current
    // group.
    void
    do_append_new_variables(Group& group)
      {
        if(!this->m_pgroup || !this->m_append)
          return;

        for(const auto& name : this->m_pgroup->names()) {
          const Value& value = this->m_pgroup->at(name);
          Value extra = value;

          if(this->m_touched.find(name) != this->m_touched.end()) {
            // Only fields of a derived type, or of elements of a derived type
            // array, may be left.
            if(value.is_derived()) {
              V_derived fields = this->do_untouched_fields(name, value.as_derived());
              if(fields.empty())
                continue;

              extra = fields;
            }
            else if(value.is_derived_array()) {
              V_derived_array elems;
              bool any = false;
              for(size_t k = 0;  k != value.as_derived_array().size();  ++k) {
                // name(2)
                ::rocket::cow_string prefix = name;
                prefix.push_back('(');
                format_integer(prefix, static_cast<V_integer>(k + 1));
                prefix.push_back(')');

                elems.push_back(this->do_untouched_fields(prefix, value.as_derived_array()[k]));
                if(!elems.back().empty())
                  any = true;
              }

              if(!any)
                continue;

              extra = elems;
            }
            else
              continue;
          }

          ::rocket::cow_string text;
          format_variable(text, name, extra, this->m_pgroup->start_indices(name),
                          this->m_pgroup->comment(name), this->m_fopts);
          this->m_sink.break_line();
          this->m_sink.puts(text);

          auto existing = group.find(name);
          if(!existing)
            group.insert(name, extra);
          else if(existing->is_derived_array() && extra.is_derived_array())
            group.insert(name, do_merge_elements(existing->as_derived_array(),
                                                 extra.as_derived_array()));
          else
            group.insert(name, merge_values(*existing, extra));
          if(auto starts = this->m_pgroup->start_indices(name))
            group.set_start_indices(name, *starts);
          if(auto comment = this->m_pgroup->comment(name))
            group.set_comment(name, *comment);
        }
      }

    void
    do_patch_group()
      {
        // `&` has been copied.
        this->do_copy_trivia();
        const Token& name = this->do_tok(this->m_pos);
        if(!name.is_name())
          do_throw_unexpected(name, "group name");

        this->do_copy(this->m_pos ++);

        // New variables are only appended to the first occurrence of a group.
        Group group(name.text);
        this->m_append = true;
        if(auto existing = this->m_result.find_group(name.text)) {
          group = *existing;
          this->m_append = false;
        }

        this->m_pgroup = this->m_patch.find_group(name.text);
        this->m_touched.clear();
        this->m_touched_paths.clear();

        for(;;) {
          const Token& tok = this->do_tok(this->m_pos);
          if(tok.kind == token_eof)
            do_throw_at(error_unexpected_eof, tok, "`/`");

          if(tok.is_trivia() || (tok.kind == token_comma)) {
            this->do_copy(this->m_pos ++);
            continue;
          }

          if(tok.kind == token_group_end) {
            this->do_append_new_variables(group);
            this->do_copy(this->m_pos ++);
            break;
          }

          if(tok.is_group_start()) {
            size_t next = this->do_next_sig(this->m_pos + 1);
            this->do_append_new_variables(group);
            if(do_is_end_keyword(this->do_tok(next))) {
              // $end
              while(this->m_pos <= next)
                this->do_copy(this->m_pos ++);
            }
            else if((this->do_tok(next).kind == token_eof) || this->do_tok(next).is_group_start())
              this->do_copy(this->m_pos ++);
            break;
          }

          if(!tok.is_name())
            do_throw_unexpected(tok, "variable name");

          this->do_patch_assignment(group);
        }

        this->m_result.insert_group(group);
        this->m_pgroup = nullptr;
      }

    // Writes groups from the patch that have not been seen.
    void
    do_append_new_groups()
      {
        for(const auto& name : this->m_patch.group_names()) {
          if(this->m_result.contains_group(name))
            continue;

          // Separate it from previous text with a blank line.
          const Group& group = this->m_patch.at_group(name);
          ::rocket::cow_string text;
          if(this->m_sink.last >= 0)
            text.push_back('\n');

          text.push_back('&');
          text.append(this->m_fopts.has(option_uppercase) ? ascii_upper(name) : name);
          text.push_back('\n');
          group.print_to(text, this->m_fopts);
          text.append("/\n");

          this->m_sink.break_line();
          this->m_sink.puts(text);
          this->m_result.insert_group(group);
        }
      }

  public:
    Namelist
    run()
      {
        while(this->do_tok(this->m_pos).kind != token_eof) {
          const Token& tok = this->do_tok(this->m_pos);
          this->do_copy(this->m_pos ++);
          if(tok.is_group_start())
            this->do_patch_group();
        }

        this->do_append_new_groups();
        return ::std::move(this->m_result);
      }
  };

}  // namespace

Namelist
parse_tokens(const Token_List& tokens)
  {
    Structure_Parser parser(tokens);
    return parser.parse();
  }

Namelist
parse_document(const ::rocket::cow_string& text, const Scan_Options& sopts)
  {
    return parse_tokens(scan(text, sopts));
  }

Streaming_Parser::
Streaming_Parser(const ::rocket::cow_string& text, const Scan_Options& sopts)
  : m_tokens(scan_preserving(text, sopts))
  {
  }

Namelist
Streaming_Parser::
parse() const
  {
    return parse_tokens(this->m_tokens);
  }

Namelist
Streaming_Parser::
parse_and_patch(::rocket::cow_string& str, const Namelist& patch, const Format_Options& fopts) const
  {
    Unified_Sink usink(&str);
    Patch_Writer writer(this->m_tokens, patch, fopts, usink);
    return writer.run();
  }

Namelist
Streaming_Parser::
parse_and_patch(::rocket::tinybuf& buf, const Namelist& patch, const Format_Options& fopts) const
  {
    Unified_Sink usink(&buf);
    Patch_Writer writer(this->m_tokens, patch, fopts, usink);
    return writer.run();
  }

Namelist
Streaming_Parser::
parse_and_patch(::std::FILE* fp, const Namelist& patch, const Format_Options& fopts) const
  {
    Unified_Sink usink(fp);
    Patch_Writer writer(this->m_tokens, patch, fopts, usink);
    return writer.run();
  }

}  // namespace fnml
