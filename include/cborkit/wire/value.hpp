#pragma once

#include "cborkit/wire/format.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cborkit::wire {

class Value;
struct Entry;

using Array = std::vector<Value>;
using Map = std::vector<Entry>;

struct Unsigned final {
  std::uint64_t value{0};
  friend bool operator==(const Unsigned&, const Unsigned&) = default;
};

// 负整数按线上格式拆分存储：实际值 = -1 - magnitude，可覆盖 [-2^64, -1]。
struct Negative final {
  std::uint64_t magnitude{0};
  friend bool operator==(const Negative&, const Negative&) = default;
};

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

// 必须是合法 UTF-8，编码端不重复校验。
struct Text final {
  std::string value;
  friend bool operator==(const Text&, const Text&) = default;
};

struct Float final {
  double value{0.0};
};

struct Bool final {
  bool value{false};
  friend bool operator==(const Bool&, const Bool&) = default;
};

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct Undefined final {
  friend bool operator==(const Undefined&, const Undefined&) = default;
};

/**
 * @brief 浮点“同值”判定：位模式相同即相等。
 *
 * 因此两个位模式一致的 NaN 相等，+0 与 -0 不相等。
 */
[[nodiscard]] bool same_float(double lhs, double rhs) noexcept;

/**
 * @brief CBOR 数据值（强类型 variant，支持嵌套 Array/Map）。
 *
 * 约定：
 * - Map 保留插入顺序，编码时按该顺序输出；解码不假设键的顺序；
 * - Record（结构体）在 Value 层就是 Map，字段名绑定见 cborkit/serde；
 * - 相等比较：字符串按字节，浮点按位模式（见 same_float）。
 */
class Value final {
 public:
  using storage_type =
    std::variant<Unsigned, Negative, Bytes, Text, Array, Map, Float, Bool, Null, Undefined>;

  Value() = delete;

  explicit Value(Unsigned v);
  explicit Value(Negative v);
  explicit Value(Bytes v);
  explicit Value(Text v);
  explicit Value(Array v);
  explicit Value(Map v);
  explicit Value(Float v);
  explicit Value(Bool v);
  explicit Value(Null v);
  explicit Value(Undefined v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  /**
   * @brief 该值在线上对应的主类型（Float/Bool/Null/Undefined 均为 simple）。
   */
  [[nodiscard]] major_type kind() const noexcept;

  /**
   * @brief 在 Map 中查找第一个键为 text 且等于 key 的条目值；非 Map 或未找到返回 nullptr。
   */
  [[nodiscard]] const Value* find(std::string_view key) const noexcept;

  static Value uint64(std::uint64_t value);
  static Value negative(std::uint64_t magnitude);
  static Value integer(std::int64_t value);
  static Value bytes(std::vector<byte> value);
  static Value text(std::string value);
  static Value array(std::vector<Value> values);
  static Value map(std::vector<Entry> entries);
  static Value floating(double value);
  static Value boolean(bool value);
  static Value null();
  static Value undefined();

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

struct Entry final {
  Value key;
  Value value;

  friend bool operator==(const Entry& lhs, const Entry& rhs) noexcept {
    return lhs.key == rhs.key && lhs.value == rhs.value;
  }
};

}  // namespace cborkit::wire
