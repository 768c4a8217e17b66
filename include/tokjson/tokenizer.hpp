#pragma once

#include <tokjson/error.hpp>
#include <tokjson/token.hpp>

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tokjson {

// Config: floating-point parsing backend.
// Override by defining TOKJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef TOKJSON_USE_FROM_CHARS_DOUBLE
  #define TOKJSON_USE_FROM_CHARS_DOUBLE 0
#endif

struct tokenize_options {
  // Require `true`/`false`/`null` to be followed by whitespace, a structural
  // character or end of input. When off, `truex` scans as `true` then fails on `x`.
  bool literal_boundary_check{true};
};

struct tokenize_result {
  token_sequence tokens;
  error err;
};

namespace detail {

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool is_number_char(char c) noexcept {
  return is_digit(c) || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-';
}

inline bool is_structural(char c) noexcept {
  return c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',';
}

// Parses the whole of `run` as a double. Returns false unless every character is consumed.
inline bool parse_double(std::string_view run, double& out) {
  if (run.empty()) return false;
#if defined(TOKJSON_USE_FROM_CHARS_DOUBLE) && TOKJSON_USE_FROM_CHARS_DOUBLE
#if defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* first = run.data();
    const char* last = run.data() + run.size();
    auto r = std::from_chars(first, last, v, std::chars_format::general);
    if (r.ec == std::errc{} && r.ptr == last) {
      out = v;
      return true;
    }
    // Out-of-range and anything from_chars rejects fall through to strtod.
  }
#endif
#endif

  // run is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  char* end = nullptr;
  if (run.size() < kStackCap) {
    char buf[kStackCap];
    std::memcpy(buf, run.data(), run.size());
    buf[run.size()] = '\0';
    out = std::strtod(buf, &end);
    return end == buf + run.size();
  }
  const std::string owned(run);
  out = std::strtod(owned.c_str(), &end);
  return end == owned.c_str() + owned.size();
}

} // namespace detail

class tokenizer {
public:
  explicit tokenizer(std::string_view text, tokenize_options opt = {}) noexcept
      : s_(text), opt_(opt) {}

  tokenize_result run() {
    tokenize_result r;
    while (i_ < s_.size()) {
      const char c = s_[i_];
      if (detail::is_ws(c)) {
        advance();
        continue;
      }
      if (!scan_one(c, r)) {
        r.tokens.tokens.clear();
        return r;
      }
    }
    r.tokens.end = position();
    return r;
  }

private:
  std::string_view s_;
  tokenize_options opt_;
  std::size_t i_{0};
  std::size_t line_{1};
  std::size_t col_{1};

  source_position position() const noexcept { return source_position{i_, line_, col_}; }

  bool at_end() const noexcept { return i_ >= s_.size(); }

  char peek() const noexcept { return s_[i_]; }

  char advance() noexcept {
    const char c = s_[i_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  void set_error(error& e, error_code code, source_position at) const noexcept {
    if (e) return;
    e.code = code;
    e.offset = at.offset;
    e.line = at.line;
    e.column = at.column;
  }

  bool scan_one(char c, tokenize_result& r) {
    auto& out = r.tokens.tokens;
    const source_position start = position();
    switch (c) {
      case '{': advance(); out.emplace_back(token_kind::object_begin, start, 1); return true;
      case '}': advance(); out.emplace_back(token_kind::object_end, start, 1); return true;
      case '[': advance(); out.emplace_back(token_kind::array_begin, start, 1); return true;
      case ']': advance(); out.emplace_back(token_kind::array_end, start, 1); return true;
      case ':': advance(); out.emplace_back(token_kind::colon, start, 1); return true;
      case ',': advance(); out.emplace_back(token_kind::comma, start, 1); return true;
      case '"': return scan_string(r);
      case 't': return scan_literal("true", token_kind::boolean, true, r);
      case 'f': return scan_literal("false", token_kind::boolean, false, r);
      case 'n': return scan_literal("null", token_kind::null, false, r);
      default:
        if (c == '-' || detail::is_digit(c)) return scan_number(r);
        set_error(r.err, error_code::unexpected_character, start);
        return false;
    }
  }

  bool scan_string(tokenize_result& r) {
    const source_position quote = position();
    advance(); // opening quote

    std::string out;
    std::size_t chunk_begin = i_;
    while (!at_end()) {
      const char c = peek();
      if (c == '"') {
        if (i_ > chunk_begin) out.append(s_.data() + chunk_begin, i_ - chunk_begin);
        advance();
        r.tokens.tokens.push_back(token::string(std::move(out), quote, i_ - quote.offset));
        return true;
      }
      if (c != '\\') {
        advance();
        continue;
      }

      if (i_ > chunk_begin) out.append(s_.data() + chunk_begin, i_ - chunk_begin);
      const source_position esc_pos = position();
      advance();
      if (at_end()) break;
      const char esc = advance();
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        default:
          // \uXXXX is not decoded and lands here as well.
          set_error(r.err, error_code::invalid_escape, esc_pos);
          return false;
      }
      chunk_begin = i_;
    }

    set_error(r.err, error_code::unterminated_string, quote);
    return false;
  }

  bool scan_number(tokenize_result& r) {
    const source_position start = position();
    while (!at_end() && detail::is_number_char(peek())) advance();

    const std::string_view run = s_.substr(start.offset, i_ - start.offset);
    double d = 0.0;
    if (!detail::parse_double(run, d)) {
      set_error(r.err, error_code::invalid_number, start);
      return false;
    }
    r.tokens.tokens.push_back(token::number(d, start, run.size()));
    return true;
  }

  bool scan_literal(std::string_view lit, token_kind kind, bool b, tokenize_result& r) {
    const source_position start = position();
    // Fixed-count collection: a short input collects fewer characters and fails the compare.
    std::size_t n = 0;
    while (n < lit.size() && !at_end()) {
      advance();
      ++n;
    }
    if (s_.substr(start.offset, n) != lit) {
      set_error(r.err, error_code::invalid_literal, start);
      return false;
    }
    if (opt_.literal_boundary_check && !at_end()) {
      const char next = peek();
      if (!detail::is_ws(next) && !detail::is_structural(next)) {
        set_error(r.err, error_code::invalid_literal, start);
        return false;
      }
    }

    if (kind == token_kind::boolean) {
      r.tokens.tokens.push_back(token::boolean(b, start, n));
    } else {
      r.tokens.tokens.emplace_back(kind, start, n);
    }
    return true;
  }
};

inline tokenize_result tokenize(std::string_view text, tokenize_options opt = {}) {
  tokenizer t(text, opt);
  return t.run();
}

} // namespace tokjson
