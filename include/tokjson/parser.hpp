#pragma once

#include <tokjson/error.hpp>
#include <tokjson/token.hpp>
#include <tokjson/value.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace tokjson {

struct parse_options {
  // Containers nested deeper than this fail with nesting_too_deep.
  std::size_t max_depth{256};
  // Reject tokens left over after the root value.
  bool require_eof{true};
};

struct parse_result {
  value val;
  error err;
};

// Recursive-descent parser over a token sequence. The cursor only moves
// forward; string payloads are moved out of the tokens as they are consumed,
// so parse() is meant to be called once per parser.
class parser {
public:
  explicit parser(token_sequence tokens, parse_options opt = {})
      : toks_(std::move(tokens)), opt_(opt) {}

  parse_result parse() {
    parse_result r;
    r.val = parse_value(0, r.err);
    if (!r.err && opt_.require_eof) {
      if (const token* t = peek()) set_error(r.err, error_code::trailing_tokens, t->position());
    }
    if (r.err) r.val = nullptr;
    return r;
  }

private:
  token_sequence toks_;
  parse_options opt_;
  std::size_t i_{0};

  const token* peek() const noexcept {
    return i_ < toks_.tokens.size() ? &toks_.tokens[i_] : nullptr;
  }

  token& advance() noexcept { return toks_.tokens[i_++]; }

  void set_error(error& e, error_code code, const source_position& at) const noexcept {
    if (e) return;
    e.code = code;
    e.offset = at.offset;
    e.line = at.line;
    e.column = at.column;
  }

  value parse_value(std::size_t depth, error& e) {
    const token* t = peek();
    if (!t) {
      set_error(e, error_code::unexpected_eof, toks_.end);
      return nullptr;
    }

    switch (t->kind()) {
      case token_kind::object_begin: return parse_object(depth + 1, e);
      case token_kind::array_begin: return parse_array(depth + 1, e);
      case token_kind::string: return value(advance().take_string());
      case token_kind::number: return value(advance().as_number());
      case token_kind::boolean: return value(advance().as_bool());
      case token_kind::null:
        advance();
        return nullptr;
      default:
        set_error(e, error_code::unexpected_token, t->position());
        return nullptr;
    }
  }

  value parse_object(std::size_t depth, error& e) {
    const token& open = advance();
    if (depth > opt_.max_depth) {
      set_error(e, error_code::nesting_too_deep, open.position());
      return nullptr;
    }

    value::object o;
    const token* t = peek();
    if (t && t->kind() == token_kind::object_end) {
      advance();
      return value(std::move(o));
    }

    while (true) {
      t = peek();
      if (!t) {
        set_error(e, error_code::object_not_closed, toks_.end);
        return nullptr;
      }
      if (t->kind() != token_kind::string) {
        set_error(e, error_code::expected_key_string, t->position());
        return nullptr;
      }
      std::string key = advance().take_string();

      t = peek();
      if (!t) {
        set_error(e, error_code::object_not_closed, toks_.end);
        return nullptr;
      }
      if (t->kind() != token_kind::colon) {
        set_error(e, error_code::expected_colon, t->position());
        return nullptr;
      }
      advance();

      value v = parse_value(depth, e);
      if (e) return nullptr;
      o.insert_or_assign(std::move(key), std::move(v));

      t = peek();
      if (!t) {
        set_error(e, error_code::object_not_closed, toks_.end);
        return nullptr;
      }
      if (t->kind() == token_kind::object_end) {
        advance();
        return value(std::move(o));
      }
      if (t->kind() != token_kind::comma) {
        set_error(e, error_code::expected_comma_or_object_end, t->position());
        return nullptr;
      }
      advance();

      t = peek();
      if (t && t->kind() == token_kind::object_end) {
        set_error(e, error_code::trailing_comma, t->position());
        return nullptr;
      }
    }
  }

  value parse_array(std::size_t depth, error& e) {
    const token& open = advance();
    if (depth > opt_.max_depth) {
      set_error(e, error_code::nesting_too_deep, open.position());
      return nullptr;
    }

    value::array a;
    const token* t = peek();
    if (t && t->kind() == token_kind::array_end) {
      advance();
      return value(std::move(a));
    }

    while (true) {
      if (!peek()) {
        set_error(e, error_code::array_not_closed, toks_.end);
        return nullptr;
      }
      value elem = parse_value(depth, e);
      if (e) return nullptr;
      a.emplace_back(std::move(elem));

      t = peek();
      if (!t) {
        set_error(e, error_code::array_not_closed, toks_.end);
        return nullptr;
      }
      if (t->kind() == token_kind::array_end) {
        advance();
        return value(std::move(a));
      }
      if (t->kind() != token_kind::comma) {
        set_error(e, error_code::expected_comma_or_array_end, t->position());
        return nullptr;
      }
      advance();

      t = peek();
      if (t && t->kind() == token_kind::array_end) {
        set_error(e, error_code::trailing_comma, t->position());
        return nullptr;
      }
    }
  }
};

inline parse_result parse(token_sequence tokens, parse_options opt = {}) {
  parser p(std::move(tokens), opt);
  return p.parse();
}

} // namespace tokjson
