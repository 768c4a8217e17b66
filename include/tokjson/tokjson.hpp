#pragma once

// tokjson: a small, header-only C++17 JSON reader.
// Two stages: tokenize() turns text into a token_sequence, parser turns the
// tokens into a value tree. Errors carry a code and the source position.

#include <tokjson/error.hpp>
#include <tokjson/parser.hpp>
#include <tokjson/token.hpp>
#include <tokjson/tokenizer.hpp>
#include <tokjson/value.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tokjson {

class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e)
      : std::runtime_error("tokjson: " + describe(e)), err_(e) {}

  const error& err() const noexcept { return err_; }
  error_code code() const noexcept { return err_.code; }

private:
  error err_;
};

inline parse_result parse(std::string_view json, parse_options opt = {}, tokenize_options lex = {}) {
  tokenize_result t = tokenize(json, lex);
  if (t.err) {
    parse_result r;
    r.err = t.err;
    return r;
  }
  return parse(std::move(t.tokens), opt);
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}, tokenize_options lex = {}) {
  auto r = parse(json, opt, lex);
  if (r.err) throw parse_error(r.err);
  return std::move(r.val);
}

} // namespace tokjson
