#pragma once

#include "cborkit/core/common.hpp"
#include "cborkit/wire/codec.hpp"
#include "cborkit/wire/options.hpp"
#include "cborkit/wire/value.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

namespace cborkit::utils {

/**
 * @brief Value 编解码的薄封装：减少样板代码，不改变底层语义。
 */

struct DecodeValueResult final {
    // 解码得到的 Value（成功时有效）。
    wire::Value value{wire::Value::null()};

    // 消耗的输入字节数。
    std::size_t consumed{0};

    // 是否完整消耗输入缓冲区（consumed == in.size()），false 表示后面还有数据。
    bool fully_consumed{false};
};

/**
 * @brief 解码输入开头的一个 Value，返回 {ec, result}。
 */
[[nodiscard]] std::pair<std::error_code, DecodeValueResult>
decode_value(core::bytes_view in, const wire::DecodeOptions &options = {});

/**
 * @brief 若输入为空则返回 {ok, nullopt}；否则等价于 decode_value。
 */
[[nodiscard]] std::pair<std::error_code, std::optional<DecodeValueResult>>
decode_value_if_any(core::bytes_view in, const wire::DecodeOptions &options = {});

/**
 * @brief 把多个 Value 首尾相接编码（CBOR sequence，无外层容器）。
 */
[[nodiscard]] std::vector<core::byte> encode_sequence(std::span<const wire::Value> values,
                                                      const wire::EncodeOptions &options = {});

/**
 * @brief 解码首尾相接的多个 Value，直到输入耗尽；任一项失败则整体失败。
 *
 * 失败时 failure（若非空）中的 offset 为相对整个输入的偏移。
 */
[[nodiscard]] std::pair<std::error_code, std::vector<wire::Value>>
decode_sequence(core::bytes_view in,
                const wire::DecodeOptions &options = {},
                wire::DecodeFailure *failure = nullptr);

} // namespace cborkit::utils
