#pragma once

#include <cstddef>
#include <cstdint>

namespace cborkit::wire {

/**
 * @brief Record 解码时遇到未知键的处理策略。
 *
 * - lenient：跳过未知键及其值（默认）
 * - strict：返回 errc::unknown_field
 */
enum class FieldPolicy : std::uint8_t {
  lenient = 0,
  strict = 1,
};

struct EncodeOptions final {
  // 浮点尽量用 half/single 输出（仅在位模式可无损往返时收窄），默认总是输出 double。
  bool minimal_floats{false};
};

/**
 * @brief 解码选项。
 *
 * 说明：
 * - 上限类字段为 0 表示不限制；核心本身不施加人为上限，由调用方按需收紧；
 * - 不可信输入建议设置 max_depth，避免极深嵌套耗尽调用栈。
 *
 * 约定：
 * - 容器解码按嵌套层级递归，max_depth 为 0 时递归深度只受输入本身约束；
 *   例如两百万层单元素数组（约 2MB 的合法输入）足以让默认栈溢出并使进程崩溃。
 *   解码来源不受控的数据时必须设置一个非 0 的 max_depth（通常几百层即可）。
 */
struct DecodeOptions final {
  // 容器嵌套深度上限（顶层容器为第 1 层）；0 表示不限制，见上方关于栈深度的约定。
  std::size_t max_depth{0};

  // 单个 array/map 的元素（键值对）个数上限。
  std::uint64_t max_collection_size{0};

  // 单个 byte/text string 的字节数上限（indefinite 字符串按拼接后总长计算）。
  std::uint64_t max_string_length{0};

  bool validate_utf8{true};
  bool allow_indefinite{true};

  FieldPolicy unknown_fields{FieldPolicy::lenient};

  // Record 缺少非 optional 字段时保留该成员的默认值，而不是返回 errc::missing_field。
  bool default_missing_fields{false};
};

}  // namespace cborkit::wire
