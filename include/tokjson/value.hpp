#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tokjson {

class value {
public:
  using array = std::vector<value>;
  // Keys are unique; inserting an existing key replaces its value.
  using object = std::map<std::string, value, std::less<>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}
  value(double d) : data_(d) {}
  value(int i) : data_(static_cast<double>(i)) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::array;
      case 5: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  double as_number() const { return std::get<double>(data_); }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }
  std::string& as_string() { return std::get<std::string>(data_); }

  // Element count of an array or object, 0 for scalars.
  std::size_t size() const noexcept {
    if (const auto* a = std::get_if<array>(&data_)) return a->size();
    if (const auto* o = std::get_if<object>(&data_)) return o->size();
    return 0;
  }

  const value* find(std::string_view key) const noexcept {
    const auto* o = std::get_if<object>(&data_);
    if (!o) return nullptr;
    auto it = o->find(key);
    return it == o->end() ? nullptr : &it->second;
  }

  value* find(std::string_view key) noexcept {
    auto* o = std::get_if<object>(&data_);
    if (!o) return nullptr;
    auto it = o->find(key);
    return it == o->end() ? nullptr : &it->second;
  }

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 number, 3 string, 4 array, 5 object
  std::variant<std::monostate, bool, double, std::string, array, object> data_;
};

} // namespace tokjson
