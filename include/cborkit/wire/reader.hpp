#pragma once

#include "cborkit/wire/error.hpp"
#include "cborkit/wire/format.hpp"
#include "cborkit/wire/options.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cborkit::wire {

/**
 * @brief 严格 UTF-8 校验（拒绝 overlong、代理区与超过 U+10FFFF 的码点）。
 */
[[nodiscard]] bool valid_utf8(bytes_view text) noexcept;

/**
 * @brief CBOR 基础读取器：在只读输入上推进游标，按调用方期望的形状读取。
 *
 * 约定：
 * - 所有读取返回 std::error_code；失败时 failure() 记录首个错误的诊断信息；
 * - 每次读取恰好消耗其首部声明的字节数，不回溯；
 * - 在读取 payload 或预留容器空间之前先校验剩余字节，截断输入总是得到
 *   errc::unexpected_eof，且不会因伪造的长度字段触发超大分配；
 * - 失败后 Reader 的游标状态不再有意义，应丢弃。
 */
class Reader final {
 public:
  explicit Reader(bytes_view in, DecodeOptions options = {}) noexcept;

  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] bool at_end() const noexcept { return pos_ >= in_.size(); }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

  [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }
  [[nodiscard]] const DecodeFailure& failure() const noexcept { return failure_; }

  // 读取一个首部；break 字节、保留的 additional info 以及被禁用的 indefinite 均在此拒绝。
  std::error_code read_head(Head& out) noexcept;
  std::error_code peek_head(Head& out) noexcept;

  // 读取首部并要求主类型为 expected，否则 type_mismatch。
  std::error_code expect_head(major_type expected, Head& out) noexcept;

  /**
   * @brief 校验 array/map 首部并给出元素个数（indefinite 时为 nullopt）。
   *
   * 非 indefinite 时会检查 max_collection_size，并保证剩余字节足以容纳每个元素至少 1 字节。
   */
  std::error_code container_count(const Head& head, std::optional<std::uint64_t>& count) noexcept;

  // 读取 byte/text string 的 payload（head 已读），含 indefinite 分块拼接与 UTF-8 校验。
  std::error_code read_payload(const Head& head, std::vector<byte>& out);
  std::error_code read_payload(const Head& head, std::string& out);

  std::error_code read_integer(bool& negative, std::uint64_t& magnitude) noexcept;

  template <std::unsigned_integral T>
  std::error_code read_uint(T& out) noexcept {
    bool negative = false;
    std::uint64_t magnitude = 0;
    auto ec = read_integer(negative, magnitude);
    if (ec) {
      return ec;
    }
    if (negative) {
      return fail_type(major_type::unsigned_integer, major_type::negative_integer);
    }
    if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
      return fail(errc::overflow);
    }
    out = static_cast<T>(magnitude);
    return {};
  }

  template <std::signed_integral T>
  std::error_code read_int(T& out) noexcept {
    bool negative = false;
    std::uint64_t magnitude = 0;
    auto ec = read_integer(negative, magnitude);
    if (ec) {
      return ec;
    }
    // 负数：value = -1 - magnitude，magnitude <= max(T) 时恰好不低于 min(T)。
    if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
      return fail(errc::overflow);
    }
    const auto m = static_cast<T>(magnitude);
    out = negative ? static_cast<T>(-1 - m) : m;
    return {};
  }

  std::error_code read_bool(bool& out) noexcept;
  std::error_code read_null() noexcept;
  std::error_code read_double(double& out) noexcept;
  std::error_code read_float(float& out) noexcept;
  std::error_code read_text(std::string& out);
  std::error_code read_bytes(std::vector<byte>& out);

  std::error_code read_array_header(std::optional<std::uint64_t>& count) noexcept;
  std::error_code read_map_header(std::optional<std::uint64_t>& count) noexcept;

  // 仅窥视下一个字节是否为 break，不消耗输入。
  std::error_code at_break(bool& out) noexcept;
  std::error_code read_break() noexcept;

  // 下一个字节是否为 null（不消耗输入，输入耗尽时返回 false）。
  [[nodiscard]] bool next_is_null() const noexcept;

  /**
   * @brief 跳过一个完整的数据项（含嵌套容器），遵守深度/长度上限。
   */
  std::error_code skip_value() noexcept;

  // 进入/离开一层容器；超过 max_depth 返回 depth_exceeded。
  std::error_code enter() noexcept;
  void leave() noexcept;

  // 记录失败并返回对应错误码（仅保留首个失败）。
  std::error_code fail(errc e) noexcept;
  std::error_code fail_type(major_type expected, major_type actual) noexcept;

  // 输出调试日志（spdlog debug 级别）。
  void log_failure(std::string_view context) const;
  void log_skipped_field(std::string_view key) const;
  void log_defaulted_field(std::string_view key) const;

 private:
  std::error_code read_argument(std::uint8_t info, std::uint64_t& out) noexcept;
  std::error_code take(std::size_t n, bytes_view& out) noexcept;
  std::error_code check_string_length(std::uint64_t total) noexcept;
  std::error_code read_simple_float(const Head& head, double& out) noexcept;

  template <class Sink>
  std::error_code read_chunks(const Head& head, Sink& sink);

  bytes_view in_{};
  std::size_t pos_{0};
  std::size_t head_pos_{0};
  std::size_t depth_{0};
  DecodeOptions options_{};
  DecodeFailure failure_{};
};

}  // namespace cborkit::wire
