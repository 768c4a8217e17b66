#pragma once

#include <cstddef>
#include <string>

namespace tokjson {

enum class error_code {
  ok = 0,
  // tokenizer
  unexpected_character,
  invalid_escape,
  invalid_number,
  invalid_literal,
  unterminated_string,
  // parser
  unexpected_eof,
  unexpected_token,
  expected_key_string,
  expected_colon,
  expected_comma_or_object_end,
  expected_comma_or_array_end,
  object_not_closed,
  array_not_closed,
  trailing_comma,
  trailing_tokens,
  nesting_too_deep
};

// Source position of the offending character or token.
// `offset` is a byte offset, `line` and `column` are 1-based.
struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline const char* error_message(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_character: return "unexpected character";
    case error_code::invalid_escape: return "invalid escape sequence";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_literal: return "expected 'true', 'false' or 'null'";
    case error_code::unterminated_string: return "unterminated string";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::unexpected_token: return "unexpected token";
    case error_code::expected_key_string: return "object key must be a string";
    case error_code::expected_colon: return "expected ':' after object key";
    case error_code::expected_comma_or_object_end: return "expected ',' or '}'";
    case error_code::expected_comma_or_array_end: return "expected ',' or ']'";
    case error_code::object_not_closed: return "object not closed";
    case error_code::array_not_closed: return "array not closed";
    case error_code::trailing_comma: return "trailing comma";
    case error_code::trailing_tokens: return "unexpected data after the root value";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown error";
}

inline std::string describe(const error& e) {
  std::string out = error_message(e.code);
  if (!e) return out;
  out += " at line ";
  out += std::to_string(e.line);
  out += ", column ";
  out += std::to_string(e.column);
  out += " (offset ";
  out += std::to_string(e.offset);
  out += ')';
  return out;
}

} // namespace tokjson
