#pragma once

#include "cborkit/core/common.hpp"
#include "cborkit/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cborkit::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 从 RFC 附录或抓包日志里复制 “a2 61 61 01 ...” 之类的字符串，解析为 bytes；
 * - 将编码结果以 hexdump 形式输出，对照首部/长度字段人工排查。
 */

struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制），超出部分以一行截断提示结尾。
    std::size_t max_bytes{256};

    // 行首偏移（0000:）。
    bool show_offset{true};

    // ASCII 侧栏（不可打印字符显示为 '.'）。
    bool show_ascii{false};

    // ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

/**
 * @brief 将 bytes 以多行 hexdump 形式格式化。
 */
[[nodiscard]] std::string hex_dump(core::bytes_view bytes, HexDumpOptions options = {});

/**
 * @brief 紧凑 16 进制串（小写，无分隔符），例如 "a16161f5"。
 */
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes（out 先被清空）。
 *
 * 支持：
 * - 大小写 hex；
 * - 空白与常见标点作为分隔符；
 * - 每个字节前可选的 0x/0X 前缀。
 *
 * 出现非法字符或 nibble 个数为奇数时返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text, std::vector<core::byte> &out);

} // namespace cborkit::utils
