#pragma once

#include "cborkit/wire/format.hpp"

#include <cstddef>
#include <optional>
#include <system_error>

namespace cborkit::wire {

/**
 * @brief 编解码错误码（cborkit.wire 错误域）。
 *
 * 编码路径没有错误状态；以下均为解码失败的原因。
 */
enum class errc : int {
  ok = 0,
  unexpected_eof = 1,           // 输入短于首部/长度字段声明的字节数
  invalid_utf8 = 2,             // text string 不是合法 UTF-8
  type_mismatch = 3,            // 主类型与调用方期望的形状不符
  overflow = 4,                 // 数值放不进目标宽度（或浮点收窄会丢精度）
  unknown_field = 5,            // strict 模式下出现未知字段
  missing_field = 6,            // Record 缺少非 optional 字段
  length_mismatch = 7,          // 定长目标（std::array）与元素个数不符
  invalid_additional_info = 8,  // additional info 为保留值 28..30 或不允许 31
  invalid_simple = 9,           // 未分配的 simple 值
  unexpected_break = 10,        // break 出现在非 indefinite 容器内
  indefinite_not_allowed = 11,  // DecodeOptions 禁用了 indefinite-length
  unsupported_tag = 12,         // 主类型 6（tag）不受支持
  depth_exceeded = 13,          // 超过调用方设置的嵌套深度
  limit_exceeded = 14,          // 超过调用方设置的字符串/集合上限
  trailing_bytes = 15,          // 完整解码后仍有剩余字节
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 解码失败的诊断信息。
 *
 * - offset：出错数据项首字节在输入中的偏移；
 * - expected/actual：仅 type_mismatch 时有值（整数目标的 expected 记为 unsigned_integer，
 *   浮点/布尔目标记为 simple）。
 */
struct DecodeFailure final {
  std::error_code ec{};
  std::size_t offset{0};
  std::optional<major_type> expected{};
  std::optional<major_type> actual{};
};

}  // namespace cborkit::wire

namespace std {
template <>
struct is_error_code_enum<cborkit::wire::errc> : true_type {};
}  // namespace std
