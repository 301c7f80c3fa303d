#include "cborkit/utils/value_helpers.hpp"

namespace cborkit::utils {

std::pair<std::error_code, DecodeValueResult>
decode_value(core::bytes_view in, const wire::DecodeOptions &options) {
    DecodeValueResult result{};
    const auto ec = wire::decode_one(in, result.value, result.consumed, options);
    if (ec) {
        return {ec, DecodeValueResult{}};
    }
    result.fully_consumed = (result.consumed == in.size());
    return {std::error_code{}, std::move(result)};
}

std::pair<std::error_code, std::optional<DecodeValueResult>>
decode_value_if_any(core::bytes_view in, const wire::DecodeOptions &options) {
    if (in.empty()) {
        return {std::error_code{}, std::nullopt};
    }
    auto [ec, result] = decode_value(in, options);
    if (ec) {
        return {ec, std::nullopt};
    }
    return {std::error_code{}, std::move(result)};
}

std::vector<core::byte> encode_sequence(std::span<const wire::Value> values,
                                        const wire::EncodeOptions &options) {
    std::size_t total = 0;
    for (const auto &v : values) {
        total += wire::encoded_size(v, options);
    }
    std::vector<core::byte> out;
    out.reserve(total);
    for (const auto &v : values) {
        wire::encode(v, out, options);
    }
    return out;
}

std::pair<std::error_code, std::vector<wire::Value>>
decode_sequence(core::bytes_view in, const wire::DecodeOptions &options, wire::DecodeFailure *failure) {
    std::vector<wire::Value> values;
    std::size_t offset = 0;
    while (offset < in.size()) {
        wire::Value v = wire::Value::null();
        std::size_t consumed = 0;
        const auto ec = wire::decode_one(in.subspan(offset), v, consumed, options, failure);
        if (ec) {
            if (failure) {
                failure->offset += offset;
            }
            return {ec, {}};
        }
        values.push_back(std::move(v));
        offset += consumed;
    }
    return {std::error_code{}, std::move(values)};
}

} // namespace cborkit::utils
