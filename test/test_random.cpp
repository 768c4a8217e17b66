#include "test_common.hpp"

#include <string>
#include <vector>

using namespace tokjson;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

// Test-side writer: produces JSON text for a tree, with random whitespace and
// escape choices, so the reader can be checked against the tree.
void write_ws(rng& r, std::string& out) {
  static const char kWs[] = {' ', '\t', '\n', '\r'};
  const std::size_t n = r.range(3);
  for (std::size_t i = 0; i < n; ++i) out.push_back(kWs[r.range(4)]);
}

void write_string(rng& r, std::string& out, const std::string& s) {
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\r': out += "\\r"; break;
      case '\n':
        // Raw newlines are copied verbatim by the tokenizer.
        out += r.coin() ? "\\n" : "\n";
        break;
      case '\t': out += r.coin() ? "\\t" : "\t"; break;
      case '/': out += r.coin() ? "\\/" : "/"; break;
      default: out.push_back(c); break;
    }
  }
  out.push_back('"');
}

void write_number(std::string& out, double d) {
  // Generated numbers are multiples of 1/4, so the text is exact.
  const bool neg = d < 0.0;
  const double mag = neg ? -d : d;
  const auto whole = static_cast<std::int64_t>(mag);
  const auto quarters = static_cast<int>((mag - static_cast<double>(whole)) * 4.0);
  if (neg) out.push_back('-');
  out += std::to_string(whole);
  static const char* const kFrac[] = {"", ".25", ".5", ".75"};
  out += kFrac[quarters];
}

void write_value(rng& r, std::string& out, const value& v) {
  write_ws(r, out);
  switch (v.type()) {
    case value::kind::null: out += "null"; break;
    case value::kind::boolean: out += v.as_bool() ? "true" : "false"; break;
    case value::kind::number: write_number(out, v.as_number()); break;
    case value::kind::string: write_string(r, out, v.as_string()); break;
    case value::kind::array: {
      out.push_back('[');
      const auto& a = v.as_array();
      for (std::size_t i = 0; i < a.size(); ++i) {
        if (i) out.push_back(',');
        write_value(r, out, a[i]);
      }
      write_ws(r, out);
      out.push_back(']');
      break;
    }
    case value::kind::object: {
      out.push_back('{');
      bool first = true;
      for (const auto& kv : v.as_object()) {
        if (!first) out.push_back(',');
        first = false;
        write_ws(r, out);
        write_string(r, out, kv.first);
        write_ws(r, out);
        out.push_back(':');
        write_value(r, out, kv.second);
      }
      write_ws(r, out);
      out.push_back('}');
      break;
    }
  }
  write_ws(r, out);
}

std::string random_string(rng& r, std::size_t max_len) {
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    const std::uint32_t pick = r.next_u32() % 16u;
    switch (pick) {
      case 0: out.push_back('"'); break;
      case 1: out.push_back('\\'); break;
      case 2: out.push_back('\n'); break;
      case 3: out.push_back('\t'); break;
      case 4: out.push_back('/'); break;
      default: {
        // printable ASCII
        char c = static_cast<char>(' ' + (r.next_u32() % 95u));
        out.push_back(c);
        break;
      }
    }
  }
  return out;
}

value random_value(rng& r, int depth);

value random_array(rng& r, int depth) {
  value::array a;
  const std::size_t n = r.range(8);
  a.reserve(n);
  for (std::size_t i = 0; i < n; ++i) a.emplace_back(random_value(r, depth - 1));
  return value(std::move(a));
}

value random_object(rng& r, int depth) {
  value::object o;
  const std::size_t n = r.range(8);
  for (std::size_t i = 0; i < n; ++i) {
    o.insert_or_assign(random_string(r, 10), random_value(r, depth - 1));
  }
  return value(std::move(o));
}

value random_number(rng& r) {
  const double whole = static_cast<double>(static_cast<std::int32_t>(r.next_u32()));
  const double frac = static_cast<double>(r.range(4)) / 4.0;
  return value(whole < 0.0 ? whole - frac : whole + frac);
}

value random_value(rng& r, int depth) {
  const std::uint32_t k = r.next_u32() % (depth <= 0 ? 4u : 6u);
  switch (k) {
    case 0: return value(nullptr);
    case 1: return value(r.coin());
    case 2: return random_number(r);
    case 3: return value(random_string(r, 20));
    case 4: return random_array(r, depth);
    default: return random_object(r, depth);
  }
}

} // namespace

static void test_random_documents_read_back() {
  rng r;
  for (int iter = 0; iter < 500; ++iter) {
    const value want = random_value(r, 4);
    std::string text;
    write_value(r, text, want);

    auto got = parse(text);
    if (got.err) {
      const std::string msg = describe(got.err) + "\n  input: " + text;
      tokjson_test::fail("!got.err", __FILE__, __LINE__, msg.c_str());
    }
    TOKJSON_CHECK(got.val == want);
  }
}

static void test_random_corruption_never_yields_partial_tree() {
  rng r;
  r.s = 0xD1B54A32D192ED03ull;
  static const char kNoise[] = {'{', '}', '[', ']', ':', ',', '"', '\\', 'x', '-', '.', 'e', '0', 't', ' '};
  for (int iter = 0; iter < 500; ++iter) {
    std::string text;
    write_value(r, text, random_value(r, 3));
    if (text.empty()) continue;

    const std::size_t edits = 1 + r.range(3);
    for (std::size_t k = 0; k < edits; ++k) {
      const std::size_t pos = r.range(text.size());
      switch (r.range(3)) {
        case 0: text[pos] = kNoise[r.range(sizeof(kNoise))]; break;
        case 1: text.erase(pos, 1); break;
        default: text.insert(pos, 1, kNoise[r.range(sizeof(kNoise))]); break;
      }
      if (text.empty()) break;
    }

    auto got = parse(text);
    if (got.err) {
      TOKJSON_CHECK(got.val.is_null());
      TOKJSON_CHECK(got.err.offset <= text.size());
      TOKJSON_CHECK(got.err.line >= 1);
      TOKJSON_CHECK(got.err.column >= 1);
    }
  }
}

void test_random() {
  test_random_documents_read_back();
  test_random_corruption_never_yields_partial_tree();
}
