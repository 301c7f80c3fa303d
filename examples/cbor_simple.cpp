#include <cborkit/core/log.hpp>
#include <cborkit/serde/serde.hpp>
#include <cborkit/utils/diagnostic.hpp>
#include <cborkit/utils/hex.hpp>
#include <cborkit/wire/codec.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace {

struct Reading {
    std::uint64_t id{0};
    std::string sensor;
    double value{0.0};
    std::optional<std::string> unit;
    std::vector<bool> flags;

    static constexpr auto cbor_fields() {
        using cborkit::serde::field;
        return std::make_tuple(field("id", &Reading::id),
                               field("sensor", &Reading::sensor),
                               field("value", &Reading::value),
                               field("unit", &Reading::unit),
                               field("flags", &Reading::flags));
    }
};

} // namespace

int main() {
    using namespace cborkit;

    // 解码失败时输出偏移与原因
    core::set_log_level(core::LogLevel::debug);

    std::cout << "=== CBOR 编解码简单示例 ===\n\n";

    // 1) 结构体 <-> 字节
    const Reading reading{17, "temp-03", 21.5, "C", {true, false, true}};
    const auto encoded = serde::encode(reading);
    std::cout << "编码成功: " << encoded.size() << " 字节\n";
    std::cout << utils::hex_dump(encoded);

    Reading decoded;
    auto ec = serde::decode(encoded, decoded);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "解码成功: id=" << decoded.id << " sensor=" << decoded.sensor
              << " value=" << decoded.value << " unit=" << decoded.unit.value_or("-") << "\n\n";

    // 2) 不预先知道结构时解码为 Value，用诊断记法查看
    wire::Value value = wire::Value::null();
    ec = wire::decode(encoded, value);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "诊断记法: " << utils::to_diagnostic(value) << "\n\n";

    // 3) 截断输入：返回 unexpected_eof，不会越界读取
    const wire::bytes_view truncated(encoded.data(), encoded.size() - 3);
    wire::DecodeFailure failure;
    ec = wire::decode(truncated, value, {}, &failure);
    std::cout << "截断输入: " << ec.message() << " (offset " << failure.offset << ")\n";

    // 4) strict 模式拒绝未知字段
    if (auto *entries = value.get_if<wire::Map>()) {
        entries->push_back(wire::Entry{wire::Value::text("extra"), wire::Value::uint64(1)});
    }
    wire::DecodeOptions strict;
    strict.unknown_fields = wire::FieldPolicy::strict;
    ec = serde::decode(wire::encode(value), decoded, strict);
    std::cout << "strict 模式: " << ec.message() << "\n";

    return 0;
}
