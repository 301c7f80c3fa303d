#pragma once

#include "cborkit/wire/format.hpp"
#include "cborkit/wire/options.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace cborkit::wire {

/**
 * @brief 写出一个 double 所需的字节数（含首字节），与 Writer::write_double 一致。
 */
[[nodiscard]] std::size_t encoded_double_size(double value, const EncodeOptions& options = {}) noexcept;

/**
 * @brief CBOR 基础写入器：把首部/标量追加到调用方持有的 std::vector。
 *
 * 约定：
 * - 所有写入都会成功（内存耗尽属于宿主进程的致命错误）；
 * - 长度/整数总是按最短形式输出；
 * - Writer 不跟踪容器结构，header 之后写入多少个元素由调用方负责。
 */
class Writer final {
 public:
  explicit Writer(std::vector<byte>& out, EncodeOptions options = {}) noexcept;

  // 本 Writer 构造以来追加的字节数。
  [[nodiscard]] std::size_t written() const noexcept { return out_->size() - start_; }

  void write_head(major_type major, std::uint64_t argument);

  void write_unsigned(std::uint64_t value);
  void write_negative(std::uint64_t magnitude);
  void write_integer(std::int64_t value);

  void write_bytes(bytes_view value);
  void write_text(std::string_view value);

  void write_array_header(std::uint64_t count);
  void write_map_header(std::uint64_t count);

  void write_bool(bool value);
  void write_null();
  void write_undefined();

  void write_double(double value);
  void write_single(float value);
  void write_half_bits(std::uint16_t bits);

  // indefinite-length 扩展：Value 编码从不使用，供流式生产者手工拼装。
  void begin_indefinite_array();
  void begin_indefinite_map();
  void begin_indefinite_bytes();
  void begin_indefinite_text();
  void write_break();

 private:
  void put(byte b);
  void put_be(std::uint64_t value, std::size_t bytes);

  std::vector<byte>* out_;
  EncodeOptions options_{};
  std::size_t start_{0};
};

}  // namespace cborkit::wire
