#include "cborkit/wire/value.hpp"

#include <bit>
#include <type_traits>
#include <utility>

namespace cborkit::wire {

bool same_float(double lhs, double rhs) noexcept {
  return std::bit_cast<std::uint64_t>(lhs) == std::bit_cast<std::uint64_t>(rhs);
}

Value::Value(Unsigned v) : storage_(v) {}
Value::Value(Negative v) : storage_(v) {}
Value::Value(Bytes v) : storage_(std::move(v)) {}
Value::Value(Text v) : storage_(std::move(v)) {}
Value::Value(Array v) : storage_(std::move(v)) {}
Value::Value(Map v) : storage_(std::move(v)) {}
Value::Value(Float v) : storage_(v) {}
Value::Value(Bool v) : storage_(v) {}
Value::Value(Null v) : storage_(v) {}
Value::Value(Undefined v) : storage_(v) {}

major_type Value::kind() const noexcept {
  return std::visit(
    [](const auto& v) -> major_type {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Unsigned>) {
        return major_type::unsigned_integer;
      } else if constexpr (std::is_same_v<T, Negative>) {
        return major_type::negative_integer;
      } else if constexpr (std::is_same_v<T, Bytes>) {
        return major_type::byte_string;
      } else if constexpr (std::is_same_v<T, Text>) {
        return major_type::text_string;
      } else if constexpr (std::is_same_v<T, Array>) {
        return major_type::array;
      } else if constexpr (std::is_same_v<T, Map>) {
        return major_type::map;
      } else {
        return major_type::simple;
      }
    },
    storage_);
}

const Value* Value::find(std::string_view key) const noexcept {
  const auto* entries = get_if<Map>();
  if (!entries) {
    return nullptr;
  }
  for (const auto& entry : *entries) {
    const auto* k = entry.key.get_if<Text>();
    if (k && k->value == key) {
      return &entry.value;
    }
  }
  return nullptr;
}

Value Value::uint64(std::uint64_t value) {
  return Value(Unsigned{value});
}

Value Value::negative(std::uint64_t magnitude) {
  return Value(Negative{magnitude});
}

Value Value::integer(std::int64_t value) {
  if (value >= 0) {
    return Value(Unsigned{static_cast<std::uint64_t>(value)});
  }
  // -1 - value 在 int64 范围内不会溢出（value=INT64_MIN 时得到 INT64_MAX）。
  return Value(Negative{static_cast<std::uint64_t>(-1 - value)});
}

Value Value::bytes(std::vector<byte> value) {
  return Value(Bytes{std::move(value)});
}

Value Value::text(std::string value) {
  return Value(Text{std::move(value)});
}

Value Value::array(std::vector<Value> values) {
  return Value(Array{std::move(values)});
}

Value Value::map(std::vector<Entry> entries) {
  return Value(Map{std::move(entries)});
}

Value Value::floating(double value) {
  return Value(Float{value});
}

Value Value::boolean(bool value) {
  return Value(Bool{value});
}

Value Value::null() {
  return Value(Null{});
}

Value Value::undefined() {
  return Value(Undefined{});
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      if (!b) {
        return false;
      }
      if constexpr (std::is_same_v<T, Float>) {
        return same_float(a.value, b->value);
      } else {
        return a == *b;
      }
    },
    lhs.storage_);
}

}  // namespace cborkit::wire
