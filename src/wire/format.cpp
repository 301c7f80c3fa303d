#include "cborkit/wire/format.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>

namespace cborkit::wire {
namespace {

constexpr std::uint64_t kDoubleSignMask = 0x8000'0000'0000'0000ull;
constexpr std::uint64_t kDoubleMantissaMask = 0x000F'FFFF'FFFF'FFFFull;
constexpr int kDoubleExponentBias = 1023;

constexpr bool low_bits_zero(std::uint64_t v, unsigned bits) noexcept {
  return (v & ((std::uint64_t{1} << bits) - 1u)) == 0;
}

}  // namespace

std::string_view major_type_name(major_type major) noexcept {
  switch (major) {
    case major_type::unsigned_integer:
      return "unsigned integer";
    case major_type::negative_integer:
      return "negative integer";
    case major_type::byte_string:
      return "byte string";
    case major_type::text_string:
      return "text string";
    case major_type::array:
      return "array";
    case major_type::map:
      return "map";
    case major_type::tag:
      return "tag";
    case major_type::simple:
      return "simple/float";
  }
  return "unknown";
}

double half_to_double(std::uint16_t bits) noexcept {
  const bool negative = (bits & 0x8000u) != 0;
  const int exponent = (bits >> 10) & 0x1F;
  const std::uint64_t mantissa = bits & 0x03FFu;

  if (exponent == 0x1F) {
    // Inf/NaN：直接拼 double 位模式，保留 NaN payload。
    const std::uint64_t out = (negative ? kDoubleSignMask : 0u) | 0x7FF0'0000'0000'0000ull | (mantissa << 42);
    return std::bit_cast<double>(out);
  }

  double value = 0.0;
  if (exponent == 0) {
    value = std::ldexp(static_cast<double>(mantissa), -24);
  } else {
    value = std::ldexp(static_cast<double>(mantissa + 1024u), exponent - 25);
  }
  return negative ? -value : value;
}

bool double_to_half_exact(double value, std::uint16_t& bits) noexcept {
  const auto raw = std::bit_cast<std::uint64_t>(value);
  const auto sign = static_cast<std::uint16_t>((raw & kDoubleSignMask) != 0 ? 0x8000u : 0u);
  const int biased = static_cast<int>((raw >> 52) & 0x7FFu);
  const std::uint64_t mantissa = raw & kDoubleMantissaMask;

  if (biased == 0x7FF) {
    if (mantissa == 0) {
      bits = static_cast<std::uint16_t>(sign | 0x7C00u);
      return true;
    }
    if (!low_bits_zero(mantissa, 42)) {
      return false;
    }
    bits = static_cast<std::uint16_t>(sign | 0x7C00u | static_cast<std::uint16_t>(mantissa >> 42));
    return true;
  }
  if (biased == 0) {
    if (mantissa != 0) {
      return false;  // double 次正规数远小于半精度可表示范围
    }
    bits = sign;
    return true;
  }

  const int exponent = biased - kDoubleExponentBias;
  if (exponent > 15) {
    return false;
  }
  if (exponent >= -14) {
    if (!low_bits_zero(mantissa, 42)) {
      return false;
    }
    bits = static_cast<std::uint16_t>(sign | static_cast<std::uint16_t>((exponent + 15) << 10) |
                                      static_cast<std::uint16_t>(mantissa >> 42));
    return true;
  }
  if (exponent >= -24) {
    // 半精度次正规数：value = m * 2^-24
    const std::uint64_t full = mantissa | (std::uint64_t{1} << 52);
    const auto shift = static_cast<unsigned>(28 - exponent);
    if (!low_bits_zero(full, shift)) {
      return false;
    }
    bits = static_cast<std::uint16_t>(sign | static_cast<std::uint16_t>(full >> shift));
    return true;
  }
  return false;
}

bool double_to_single_exact(double value, float& out) noexcept {
  if (std::isnan(value)) {
    const auto raw = std::bit_cast<std::uint64_t>(value);
    const std::uint64_t mantissa = raw & kDoubleMantissaMask;
    if (!low_bits_zero(mantissa, 29)) {
      return false;
    }
    const std::uint32_t sign = (raw & kDoubleSignMask) != 0 ? 0x8000'0000u : 0u;
    out = std::bit_cast<float>(sign | 0x7F80'0000u | static_cast<std::uint32_t>(mantissa >> 29));
    return true;
  }
  if (std::isfinite(value) && std::fabs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
    return false;
  }
  const auto narrowed = static_cast<float>(value);
  if (static_cast<double>(narrowed) != value) {
    return false;
  }
  out = narrowed;
  return true;
}

}  // namespace cborkit::wire
