#pragma once

#include "cborkit/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cborkit::wire {

using byte = cborkit::core::byte;
using bytes_view = cborkit::core::bytes_view;

/**
 * @brief CBOR 数据项的 3-bit 主类型（RFC 8949 §3.1）。
 *
 * 每个数据项以一个“首字节”开头：
 * - 高 3 位：major_type
 * - 低 5 位：additional info（长度模式 / 小整数 / simple 值）
 */
enum class major_type : std::uint8_t {
  unsigned_integer = 0,
  negative_integer = 1,
  byte_string = 2,
  text_string = 3,
  array = 4,
  map = 5,
  tag = 6,  // 仅用于识别并拒绝，本库不支持 tag
  simple = 7,
};

// additional info 的长度模式：0..23 直接内联，24..27 后随 1/2/4/8 字节大端参数。
inline constexpr std::uint8_t kMaxInlineArgument = 23;
inline constexpr std::uint8_t kInfoUint8 = 24;
inline constexpr std::uint8_t kInfoUint16 = 25;
inline constexpr std::uint8_t kInfoUint32 = 26;
inline constexpr std::uint8_t kInfoUint64 = 27;
inline constexpr std::uint8_t kInfoIndefinite = 31;  // 28..30 保留

// major type 7 的保留取值。
inline constexpr std::uint8_t kSimpleFalse = 20;
inline constexpr std::uint8_t kSimpleTrue = 21;
inline constexpr std::uint8_t kSimpleNull = 22;
inline constexpr std::uint8_t kSimpleUndefined = 23;
inline constexpr std::uint8_t kSimpleHalf = kInfoUint16;
inline constexpr std::uint8_t kSimpleSingle = kInfoUint32;
inline constexpr std::uint8_t kSimpleDouble = kInfoUint64;

inline constexpr byte kBreakByte = 0xFF;

/**
 * @brief 解析后的首部：主类型 + additional info + 参数值。
 *
 * argument 的含义随主类型变化：
 * - 0/1：整数的量值（type 1 实际值为 -1 - argument）
 * - 2/3：字节数；4：元素个数；5：键值对个数
 * - 7：half/single/double 时为原始位模式，其余为 simple 值本身
 */
struct Head final {
  major_type major{major_type::unsigned_integer};
  std::uint8_t info{0};
  std::uint64_t argument{0};

  [[nodiscard]] bool indefinite() const noexcept { return info == kInfoIndefinite; }
  friend bool operator==(const Head&, const Head&) = default;
};

[[nodiscard]] constexpr byte make_initial_byte(major_type major, std::uint8_t info) noexcept {
  return static_cast<byte>((static_cast<std::uint8_t>(major) << 5) | (info & 0x1Fu));
}

[[nodiscard]] constexpr major_type major_of(byte initial) noexcept {
  return static_cast<major_type>(initial >> 5);
}

[[nodiscard]] constexpr std::uint8_t info_of(byte initial) noexcept {
  return static_cast<std::uint8_t>(initial & 0x1Fu);
}

/**
 * @brief 表示 argument 所需的最短额外字节数（0/1/2/4/8）。
 *
 * 编码时总是选择最短形式：23 占 0 字节，24 需 1 字节，256 需 2 字节...
 */
[[nodiscard]] constexpr std::size_t argument_size(std::uint64_t argument) noexcept {
  if (argument <= kMaxInlineArgument) {
    return 0;
  }
  if (argument <= 0xFFu) {
    return 1;
  }
  if (argument <= 0xFFFFu) {
    return 2;
  }
  if (argument <= 0xFFFF'FFFFu) {
    return 4;
  }
  return 8;
}

/**
 * @brief 首字节 + 参数字节的总长度（1/2/3/5/9）。
 */
[[nodiscard]] constexpr std::size_t head_size(std::uint64_t argument) noexcept {
  return 1 + argument_size(argument);
}

/**
 * @brief 与 argument_size 对应的 additional info 取值。
 */
[[nodiscard]] constexpr std::uint8_t info_for(std::uint64_t argument) noexcept {
  switch (argument_size(argument)) {
    case 0:
      return static_cast<std::uint8_t>(argument);
    case 1:
      return kInfoUint8;
    case 2:
      return kInfoUint16;
    case 4:
      return kInfoUint32;
    default:
      return kInfoUint64;
  }
}

[[nodiscard]] std::string_view major_type_name(major_type major) noexcept;

/**
 * @brief IEEE-754 半精度位模式 -> double（总是精确）。
 */
[[nodiscard]] double half_to_double(std::uint16_t bits) noexcept;

/**
 * @brief 若 value 可被半精度无损表示则写出位模式并返回 true。
 *
 * NaN 只有在 payload 低位全 0 时才会被收窄，保证位模式往返不变。
 */
[[nodiscard]] bool double_to_half_exact(double value, std::uint16_t& bits) noexcept;

/**
 * @brief 若 value 可被单精度无损表示则写出 float 并返回 true。
 */
[[nodiscard]] bool double_to_single_exact(double value, float& out) noexcept;

}  // namespace cborkit::wire
