#pragma once

#include <system_error>

namespace cborkit::core {

/**
 * @brief 工具层错误码（hex 解析等非编解码路径）。
 *
 * 约定：
 * - 所有可失败接口都返回 std::error_code，不走异常路径；
 * - 编解码相关的错误码在 cborkit::wire::errc 中单独定义。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace cborkit::core

namespace std {
template <>
struct is_error_code_enum<cborkit::core::errc> : true_type {};
}  // namespace std
