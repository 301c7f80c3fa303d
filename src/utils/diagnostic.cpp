#include "cborkit/utils/diagnostic.hpp"

#include "cborkit/utils/hex.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cborkit::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *number = "\033[1;33m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *keyword = "\033[1;35m";
    static constexpr const char *dim = "\033[2m";
};

class DiagnosticWriter final {
public:
    explicit DiagnosticWriter(const DiagnosticOptions &options) : options_(options) {}

    void value(const wire::Value &v, std::size_t depth);

    [[nodiscard]] std::string take() { return std::move(out_); }

private:
    void colored(const char *code, std::string_view text) {
        if (options_.enable_color) {
            out_ += code;
        }
        out_ += text;
        if (options_.enable_color) {
            out_ += Ansi::reset;
        }
    }

    void newline(std::size_t depth) {
        out_.push_back('\n');
        out_.append(depth * options_.indent_spaces, ' ');
    }

    [[nodiscard]] std::size_t limit(std::size_t total, std::size_t max) const noexcept {
        return max == 0 ? total : std::min(total, max);
    }

    void negative(std::uint64_t magnitude);
    void floating(double d);
    void bytes(const std::vector<wire::byte> &b);
    void text(const std::string &s);

    template <class Container, class Fn>
    void container(const Container &items, char open, char close, std::size_t depth, Fn &&each);

    const DiagnosticOptions &options_;
    std::string out_;
};

void DiagnosticWriter::negative(std::uint64_t magnitude) {
    // 实际值为 -1 - magnitude；magnitude = 2^64-1 时绝对值超出 uint64。
    if (magnitude == std::numeric_limits<std::uint64_t>::max()) {
        colored(Ansi::number, "-18446744073709551616");
        return;
    }
    colored(Ansi::number, "-" + std::to_string(magnitude + 1));
}

void DiagnosticWriter::floating(double d) {
    if (std::isnan(d)) {
        colored(Ansi::number, "NaN");
        return;
    }
    if (std::isinf(d)) {
        colored(Ansi::number, d > 0 ? "Infinity" : "-Infinity");
        return;
    }
    std::array<char, 64> buf{};
    const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    std::string s(buf.data(), ec == std::errc{} ? end : buf.data());
    if (s.find_first_of(".e") == std::string::npos) {
        s += ".0";
    }
    colored(Ansi::number, s);
}

void DiagnosticWriter::bytes(const std::vector<wire::byte> &b) {
    const auto n = limit(b.size(), options_.max_payload_bytes);
    std::string s = "h'" + to_hex(wire::bytes_view{b.data(), n});
    if (n < b.size()) {
        s += "...";
    }
    s += "'";
    colored(Ansi::string, s);
}

void DiagnosticWriter::text(const std::string &s) {
    const auto n = limit(s.size(), options_.max_payload_bytes);
    std::string escaped = "\"";
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '"':
            escaped += "\\\"";
            break;
        case '\\':
            escaped += "\\\\";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            escaped += "\\r";
            break;
        case '\t':
            escaped += "\\t";
            break;
        default:
            if (c < 0x20) {
                constexpr std::string_view kDigits = "0123456789abcdef";
                escaped += "\\u00";
                escaped.push_back(kDigits[c >> 4]);
                escaped.push_back(kDigits[c & 0x0F]);
            } else {
                escaped.push_back(static_cast<char>(c));
            }
        }
    }
    if (n < s.size()) {
        escaped += "...";
    }
    escaped += "\"";
    colored(Ansi::string, escaped);
}

template <class Container, class Fn>
void DiagnosticWriter::container(const Container &items, char open, char close, std::size_t depth, Fn &&each) {
    out_.push_back(open);
    if (items.empty()) {
        out_.push_back(close);
        return;
    }
    if (depth >= options_.max_depth) {
        colored(Ansi::dim, "...");
        out_.push_back(close);
        return;
    }

    const auto n = limit(items.size(), options_.max_items);
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            out_.push_back(',');
            if (!options_.multiline) {
                out_.push_back(' ');
            }
        }
        if (options_.multiline) {
            newline(depth + 1);
        }
        each(items[i]);
    }
    if (n < items.size()) {
        out_ += options_.multiline ? "," : ", ";
        if (options_.multiline) {
            newline(depth + 1);
        }
        colored(Ansi::dim, "...");
    }
    if (options_.multiline) {
        newline(depth);
    }
    out_.push_back(close);
}

void DiagnosticWriter::value(const wire::Value &v, std::size_t depth) {
    std::visit(
        [&](const auto &item) {
            using T = std::decay_t<decltype(item)>;
            if constexpr (std::is_same_v<T, wire::Unsigned>) {
                colored(Ansi::number, std::to_string(item.value));
            } else if constexpr (std::is_same_v<T, wire::Negative>) {
                negative(item.magnitude);
            } else if constexpr (std::is_same_v<T, wire::Bytes>) {
                bytes(item.value);
            } else if constexpr (std::is_same_v<T, wire::Text>) {
                text(item.value);
            } else if constexpr (std::is_same_v<T, wire::Array>) {
                container(item, '[', ']', depth, [&](const wire::Value &child) { value(child, depth + 1); });
            } else if constexpr (std::is_same_v<T, wire::Map>) {
                container(item, '{', '}', depth, [&](const wire::Entry &entry) {
                    value(entry.key, depth + 1);
                    out_ += ": ";
                    value(entry.value, depth + 1);
                });
            } else if constexpr (std::is_same_v<T, wire::Float>) {
                floating(item.value);
            } else if constexpr (std::is_same_v<T, wire::Bool>) {
                colored(Ansi::keyword, item.value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, wire::Null>) {
                colored(Ansi::keyword, "null");
            } else {
                colored(Ansi::keyword, "undefined");
            }
        },
        v.storage());
}

} // namespace

std::string to_diagnostic(const wire::Value &value, DiagnosticOptions options) {
    DiagnosticWriter writer(options);
    writer.value(value, 0);
    return writer.take();
}

} // namespace cborkit::utils
