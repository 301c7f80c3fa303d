#include "cborkit/wire/writer.hpp"

#include <bit>

namespace cborkit::wire {

std::size_t encoded_double_size(double value, const EncodeOptions& options) noexcept {
  if (options.minimal_floats) {
    std::uint16_t half = 0;
    if (double_to_half_exact(value, half)) {
      return 3;
    }
    float single = 0.0f;
    if (double_to_single_exact(value, single)) {
      return 5;
    }
  }
  return 9;
}

Writer::Writer(std::vector<byte>& out, EncodeOptions options) noexcept
  : out_(&out), options_(options), start_(out.size()) {}

void Writer::put(byte b) {
  out_->push_back(b);
}

void Writer::put_be(std::uint64_t value, std::size_t bytes) {
  for (std::size_t i = 0; i < bytes; ++i) {
    const auto shift = static_cast<unsigned>(8u * (bytes - 1u - i));
    put(static_cast<byte>((value >> shift) & 0xFFu));
  }
}

void Writer::write_head(major_type major, std::uint64_t argument) {
  put(make_initial_byte(major, info_for(argument)));
  put_be(argument, argument_size(argument));
}

void Writer::write_unsigned(std::uint64_t value) {
  write_head(major_type::unsigned_integer, value);
}

void Writer::write_negative(std::uint64_t magnitude) {
  write_head(major_type::negative_integer, magnitude);
}

void Writer::write_integer(std::int64_t value) {
  if (value >= 0) {
    write_unsigned(static_cast<std::uint64_t>(value));
  } else {
    write_negative(static_cast<std::uint64_t>(-1 - value));
  }
}

void Writer::write_bytes(bytes_view value) {
  write_head(major_type::byte_string, value.size());
  out_->insert(out_->end(), value.begin(), value.end());
}

void Writer::write_text(std::string_view value) {
  write_head(major_type::text_string, value.size());
  const auto* data = reinterpret_cast<const byte*>(value.data());
  out_->insert(out_->end(), data, data + value.size());
}

void Writer::write_array_header(std::uint64_t count) {
  write_head(major_type::array, count);
}

void Writer::write_map_header(std::uint64_t count) {
  write_head(major_type::map, count);
}

void Writer::write_bool(bool value) {
  put(make_initial_byte(major_type::simple, value ? kSimpleTrue : kSimpleFalse));
}

void Writer::write_null() {
  put(make_initial_byte(major_type::simple, kSimpleNull));
}

void Writer::write_undefined() {
  put(make_initial_byte(major_type::simple, kSimpleUndefined));
}

void Writer::write_double(double value) {
  if (options_.minimal_floats) {
    std::uint16_t half = 0;
    if (double_to_half_exact(value, half)) {
      write_half_bits(half);
      return;
    }
    float single = 0.0f;
    if (double_to_single_exact(value, single)) {
      write_single(single);
      return;
    }
  }
  put(make_initial_byte(major_type::simple, kSimpleDouble));
  put_be(std::bit_cast<std::uint64_t>(value), 8);
}

void Writer::write_single(float value) {
  put(make_initial_byte(major_type::simple, kSimpleSingle));
  put_be(std::bit_cast<std::uint32_t>(value), 4);
}

void Writer::write_half_bits(std::uint16_t bits) {
  put(make_initial_byte(major_type::simple, kSimpleHalf));
  put_be(bits, 2);
}

void Writer::begin_indefinite_array() {
  put(make_initial_byte(major_type::array, kInfoIndefinite));
}

void Writer::begin_indefinite_map() {
  put(make_initial_byte(major_type::map, kInfoIndefinite));
}

void Writer::begin_indefinite_bytes() {
  put(make_initial_byte(major_type::byte_string, kInfoIndefinite));
}

void Writer::begin_indefinite_text() {
  put(make_initial_byte(major_type::text_string, kInfoIndefinite));
}

void Writer::write_break() {
  put(kBreakByte);
}

}  // namespace cborkit::wire
