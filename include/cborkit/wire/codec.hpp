#pragma once

#include "cborkit/wire/error.hpp"
#include "cborkit/wire/options.hpp"
#include "cborkit/wire/reader.hpp"
#include "cborkit/wire/value.hpp"
#include "cborkit/wire/writer.hpp"

#include <cstddef>
#include <string_view>
#include <system_error>
#include <vector>

namespace cborkit::wire {

/**
 * @brief 计算 Value 编码后的字节数（含所有首部与 payload）。
 */
[[nodiscard]] std::size_t encoded_size(const Value& value, const EncodeOptions& options = {}) noexcept;

/**
 * @brief 编码 Value 并追加到 out（内部先按 encoded_size 一次性 reserve）。
 *
 * 编码没有错误路径：任何合法构造的 Value 都能编码；嵌套深度不设上限。
 */
void encode(const Value& value, std::vector<byte>& out, const EncodeOptions& options = {});

/**
 * @brief 编码 Value，返回独立持有的字节缓冲。
 */
[[nodiscard]] std::vector<byte> encode(const Value& value, const EncodeOptions& options = {});

// 组合用：在已有 Writer/Reader 上写入/读取一个完整的 Value。
void write_value(Writer& w, const Value& value);
std::error_code read_value(Reader& r, Value& out);

/**
 * @brief 从输入缓冲区解码一个 Value（流式 API）。
 *
 * 成功时：
 * - out 被填充
 * - consumed 为消耗的输入字节数（可用于从流中“吃掉”已解析部分）
 *
 * 失败时：
 * - 返回非零 error_code，out 保持不变，consumed 置 0
 * - failure 非空时写入诊断信息（偏移、期望/实际主类型）
 */
std::error_code decode_one(bytes_view in,
                           Value& out,
                           std::size_t& consumed,
                           const DecodeOptions& options = {},
                           DecodeFailure* failure = nullptr);

/**
 * @brief 解码整个缓冲区：恰好一个 Value，剩余字节返回 errc::trailing_bytes。
 */
std::error_code decode(bytes_view in, Value& out, const DecodeOptions& options = {}, DecodeFailure* failure = nullptr);

/**
 * @brief 在编码后的 map 中按 text 键查找字段，只解码命中的值，其余值被跳过。
 *
 * 未找到时返回 ok 且 found=false；非 text 键会连同其值一起跳过。
 */
std::error_code extract_field(bytes_view in,
                              std::string_view key,
                              Value& out,
                              bool& found,
                              const DecodeOptions& options = {},
                              DecodeFailure* failure = nullptr);

}  // namespace cborkit::wire
