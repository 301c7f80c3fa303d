#include "cborkit/utils/hex.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string_view>

namespace cborkit::utils {
namespace {

constexpr std::string_view kDigits = "0123456789abcdef";

constexpr const char *kReset = "\033[0m";
constexpr const char *kDim = "\033[2m";
constexpr const char *kBytes = "\033[1;33m";
constexpr const char *kAscii = "\033[1;32m";
constexpr const char *kTruncated = "\033[1;31m";

[[nodiscard]] const char *color_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

void append_byte_(std::string &out, core::byte b) {
    out.push_back(kDigits[(b >> 4) & 0x0F]);
    out.push_back(kDigits[b & 0x0F]);
}

void append_offset_(std::string &out, std::size_t offset) {
    std::array<char, 16> digits{};
    std::size_t n = 0;
    do {
        digits[n++] = kDigits[offset & 0x0F];
        offset >>= 4;
    } while (offset != 0 && n < digits.size());
    for (std::size_t i = n; i < 4; ++i) {
        out.push_back('0');
    }
    while (n > 0) {
        out.push_back(digits[--n]);
    }
}

// -1 表示非 hex 字符。
[[nodiscard]] int nibble_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    constexpr std::string_view kPunct = ",;:-_|/\\[](){}<>'\"";
    return kPunct.find(static_cast<char>(c)) != std::string_view::npos;
}

} // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const bool color = options.enable_color;
    const std::size_t total = bytes.size();
    const std::size_t shown = options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
    const std::size_t per_line = options.bytes_per_line == 0 ? 16 : options.bytes_per_line;

    std::string out;
    out.reserve((shown / per_line + 2) * (per_line * 4 + 16));

    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const auto line = bytes.subspan(offset, std::min(per_line, shown - offset));

        if (options.show_offset) {
            out += color_(color, kDim);
            append_offset_(out, offset);
            out += ": ";
            out += color_(color, kReset);
        }

        out += color_(color, kBytes);
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (i != 0) {
                out.push_back(' ');
            }
            append_byte_(out, line[i]);
        }
        out += color_(color, kReset);

        if (options.show_ascii) {
            // 末行补齐到整行宽度，保证 ASCII 列对齐。
            out.append((per_line - line.size()) * 3 + 2, ' ');
            out += color_(color, kAscii);
            for (const auto b : line) {
                out.push_back(b >= 0x20 && b <= 0x7E ? static_cast<char>(b) : '.');
            }
            out += color_(color, kReset);
        }
        out.push_back('\n');
    }

    if (shown < total) {
        out += color_(color, kTruncated);
        out += "... (truncated, total=" + std::to_string(total) + " bytes)";
        out += color_(color, kReset);
        out.push_back('\n');
    }
    return out;
}

std::string to_hex(core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        append_byte_(out, b);
    }
    return out;
}

std::error_code parse_hex(std::string_view text, std::vector<core::byte> &out) {
    out.clear();

    int high = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_separator_(c)) {
            continue;
        }

        // 0x 前缀只允许出现在字节边界上。
        if (high < 0 && c == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const int v = nibble_(c);
        if (v < 0) {
            return core::make_error_code(core::errc::invalid_argument);
        }
        if (high < 0) {
            high = v;
            continue;
        }
        out.push_back(static_cast<core::byte>((high << 4) | v));
        high = -1;
    }

    if (high >= 0) {
        return core::make_error_code(core::errc::invalid_argument);
    }
    return {};
}

} // namespace cborkit::utils
