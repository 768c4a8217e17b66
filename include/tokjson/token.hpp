#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tokjson {

enum class token_kind {
  object_begin, // {
  object_end,   // }
  array_begin,  // [
  array_end,    // ]
  colon,        // :
  comma,        // ,
  string,
  number,
  boolean,
  null
};

struct source_position {
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

class token {
public:
  token(token_kind k, source_position pos, std::size_t length) noexcept
      : kind_(k), pos_(pos), length_(length), data_(std::monostate{}) {}

  static token string(std::string s, source_position pos, std::size_t length) {
    token t(token_kind::string, pos, length);
    t.data_ = std::move(s);
    return t;
  }

  static token number(double d, source_position pos, std::size_t length) {
    token t(token_kind::number, pos, length);
    t.data_ = d;
    return t;
  }

  static token boolean(bool b, source_position pos, std::size_t length) {
    token t(token_kind::boolean, pos, length);
    t.data_ = b;
    return t;
  }

  token_kind kind() const noexcept { return kind_; }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  double as_number() const { return std::get<double>(data_); }
  bool as_bool() const { return std::get<bool>(data_); }

  // Moves the decoded text out; the token is consumed by the parser afterwards.
  std::string take_string() { return std::move(std::get<std::string>(data_)); }

  const source_position& position() const noexcept { return pos_; }
  std::size_t offset() const noexcept { return pos_.offset; }
  std::size_t line() const noexcept { return pos_.line; }
  std::size_t column() const noexcept { return pos_.column; }
  std::size_t length() const noexcept { return length_; }

private:
  token_kind kind_;
  source_position pos_;
  std::size_t length_;
  std::variant<std::monostate, bool, double, std::string> data_;
};

struct token_sequence {
  std::vector<token> tokens;
  // Position one past the last input character; end-of-input errors point here.
  source_position end;

  std::size_t size() const noexcept { return tokens.size(); }
  bool empty() const noexcept { return tokens.empty(); }
  const token& operator[](std::size_t i) const { return tokens[i]; }
};

} // namespace tokjson
