#pragma once

#include "cborkit/wire/value.hpp"

#include <cstddef>
#include <string>

namespace cborkit::utils {

/**
 * @brief Value 的 RFC 8949 §8 诊断表示（调试/日志用途）。
 *
 * 例如：{"id": 7, "tags": ["a", h'01ff'], "ok": true, "ratio": 1.5}
 *
 * 说明：
 * - 在不触发任何截断时，输出就是标准诊断记法；
 * - 截断时以 "..." 标记，此时输出仅供阅读，不再是合法诊断记法；
 * - 浮点按最短可往返的十进制输出，整数值补 ".0"，特殊值为 NaN / Infinity / -Infinity。
 */
struct DiagnosticOptions final {
    // 容器递归最大深度（0 表示只输出根节点，更深的容器显示为 [...] / {...}）。
    std::size_t max_depth{16};

    // 单个 array/map 最多输出的元素数（0 表示不限制）。
    std::size_t max_items{128};

    // byte/text string 最多输出的字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // 容器是否多行缩进输出。
    bool multiline{false};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string to_diagnostic(const wire::Value &value, DiagnosticOptions options = {});

} // namespace cborkit::utils
