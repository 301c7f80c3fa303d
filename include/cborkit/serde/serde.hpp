#pragma once

#include "cborkit/wire/codec.hpp"
#include "cborkit/wire/error.hpp"
#include "cborkit/wire/options.hpp"
#include "cborkit/wire/reader.hpp"
#include "cborkit/wire/value.hpp"
#include "cborkit/wire/writer.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief 类型到 CBOR 的静态绑定（header-only）。
 *
 * 每个可编码类型 T 由 codec<T> 提供两个静态函数：
 *   static void write(wire::Writer&, const T&);
 *   static std::error_code read(wire::Reader&, T&);
 *
 * 已内置：bool、整数、枚举（按底层整数）、float（single）、double、std::string、
 * std::vector<byte>（byte string）、std::vector<T>、std::array<T, N>、std::optional<T>（null）、
 * std::map<K, V>、std::variant<Ts...>（[下标, 值]）、std::monostate（null）、wire::Value，
 * 以及声明了 cbor_fields() 的 Record。
 *
 * Record 用法：
 *   struct Point {
 *     std::int32_t x{0};
 *     std::int32_t y{0};
 *     static constexpr auto cbor_fields() {
 *       return std::make_tuple(cborkit::serde::field("x", &Point::x), cborkit::serde::field("y", &Point::y));
 *     }
 *   };
 *
 * Record 编码为以字段名为 text 键的 map，按声明顺序输出；解码不假设键顺序。
 */
namespace cborkit::serde {

using wire::Reader;
using wire::Writer;

template <class T>
struct codec;

template <class T>
concept Codable = requires(Writer& w, Reader& r, const T& in, T& out) {
  codec<T>::write(w, in);
  { codec<T>::read(r, out) } -> std::same_as<std::error_code>;
};

/**
 * @brief Record 字段描述：名字 + 成员指针。
 */
template <class Owner, class Member>
struct Field final {
  std::string_view name;
  Member Owner::*member;
};

template <class Owner, class Member>
[[nodiscard]] constexpr Field<Owner, Member> field(std::string_view name, Member Owner::*member) noexcept {
  return Field<Owner, Member>{name, member};
}

template <class T>
concept Record = std::is_class_v<T> && requires { T::cbor_fields(); };

// 可作为解码临时对象构造的类型：可默认构造，或为没有默认构造的 wire::Value。
template <class T>
concept Decodable = Codable<T> && (std::default_initializable<T> || std::same_as<T, wire::Value>);

namespace detail {

// 解码用的临时对象；wire::Value 没有默认构造，以 null 起步。
template <class T>
[[nodiscard]] T make_default() {
  if constexpr (std::same_as<T, wire::Value>) {
    return wire::Value::null();
  } else {
    return T{};
  }
}

template <class T>
inline constexpr bool is_optional_v = false;

template <class T>
inline constexpr bool is_optional_v<std::optional<T>> = true;

// 依次读取定长或 indefinite 容器中的元素，fn(index) 负责读取一个元素。
template <class Fn>
std::error_code read_elements(Reader& r, const std::optional<std::uint64_t>& count, Fn&& fn) {
  if (count) {
    for (std::uint64_t i = 0; i < *count; ++i) {
      auto ec = fn(i);
      if (ec) {
        return ec;
      }
    }
    return {};
  }
  for (std::uint64_t i = 0;; ++i) {
    bool done = false;
    auto ec = r.at_break(done);
    if (ec) {
      return ec;
    }
    if (done) {
      return r.read_break();
    }
    ec = fn(i);
    if (ec) {
      return ec;
    }
  }
}

}  // namespace detail

template <>
struct codec<bool> {
  static void write(Writer& w, bool v) { w.write_bool(v); }
  static std::error_code read(Reader& r, bool& out) { return r.read_bool(out); }
};

template <class T>
  requires(std::unsigned_integral<T> && !std::same_as<T, bool>)
struct codec<T> {
  static void write(Writer& w, T v) { w.write_unsigned(static_cast<std::uint64_t>(v)); }
  static std::error_code read(Reader& r, T& out) { return r.read_uint(out); }
};

template <std::signed_integral T>
struct codec<T> {
  static void write(Writer& w, T v) { w.write_integer(static_cast<std::int64_t>(v)); }
  static std::error_code read(Reader& r, T& out) { return r.read_int(out); }
};

template <class T>
  requires std::is_enum_v<T>
struct codec<T> {
  using underlying = std::underlying_type_t<T>;

  static void write(Writer& w, T v) { codec<underlying>::write(w, static_cast<underlying>(v)); }

  static std::error_code read(Reader& r, T& out) {
    underlying raw{};
    auto ec = codec<underlying>::read(r, raw);
    if (ec) {
      return ec;
    }
    out = static_cast<T>(raw);
    return {};
  }
};

template <>
struct codec<float> {
  static void write(Writer& w, float v) { w.write_single(v); }
  static std::error_code read(Reader& r, float& out) { return r.read_float(out); }
};

template <>
struct codec<double> {
  static void write(Writer& w, double v) { w.write_double(v); }
  static std::error_code read(Reader& r, double& out) { return r.read_double(out); }
};

template <>
struct codec<std::string> {
  static void write(Writer& w, const std::string& v) { w.write_text(v); }
  static std::error_code read(Reader& r, std::string& out) { return r.read_text(out); }
};

template <>
struct codec<std::vector<wire::byte>> {
  static void write(Writer& w, const std::vector<wire::byte>& v) {
    w.write_bytes(wire::bytes_view{v.data(), v.size()});
  }
  static std::error_code read(Reader& r, std::vector<wire::byte>& out) { return r.read_bytes(out); }
};

template <>
struct codec<wire::Value> {
  static void write(Writer& w, const wire::Value& v) { wire::write_value(w, v); }
  static std::error_code read(Reader& r, wire::Value& out) { return wire::read_value(r, out); }
};

template <class T>
struct codec<std::optional<T>> {
  static void write(Writer& w, const std::optional<T>& v) {
    if (v) {
      codec<T>::write(w, *v);
    } else {
      w.write_null();
    }
  }

  static std::error_code read(Reader& r, std::optional<T>& out) {
    if (r.next_is_null()) {
      auto ec = r.read_null();
      if (ec) {
        return ec;
      }
      out.reset();
      return {};
    }
    auto inner = detail::make_default<T>();
    auto ec = codec<T>::read(r, inner);
    if (ec) {
      return ec;
    }
    out = std::move(inner);
    return {};
  }
};

template <class T>
struct codec<std::vector<T>> {
  static void write(Writer& w, const std::vector<T>& v) {
    w.write_array_header(v.size());
    for (const auto& item : v) {
      codec<T>::write(w, item);
    }
  }

  static std::error_code read(Reader& r, std::vector<T>& out) {
    std::optional<std::uint64_t> count;
    auto ec = r.read_array_header(count);
    if (ec) {
      return ec;
    }
    ec = r.enter();
    if (ec) {
      return ec;
    }
    out.clear();
    if (count) {
      out.reserve(static_cast<std::size_t>(*count));
    }
    ec = detail::read_elements(r, count, [&](std::uint64_t) {
      auto item = detail::make_default<T>();
      auto item_ec = codec<T>::read(r, item);
      if (!item_ec) {
        out.push_back(std::move(item));
      }
      return item_ec;
    });
    if (ec) {
      return ec;
    }
    r.leave();
    return {};
  }
};

// 定长数组：元素个数必须与 N 一致，否则 errc::length_mismatch。
template <class T, std::size_t N>
struct codec<std::array<T, N>> {
  static void write(Writer& w, const std::array<T, N>& v) {
    w.write_array_header(N);
    for (const auto& item : v) {
      codec<T>::write(w, item);
    }
  }

  static std::error_code read(Reader& r, std::array<T, N>& out) {
    std::optional<std::uint64_t> count;
    auto ec = r.read_array_header(count);
    if (ec) {
      return ec;
    }
    if (count && *count != N) {
      return r.fail(wire::errc::length_mismatch);
    }
    ec = r.enter();
    if (ec) {
      return ec;
    }
    std::size_t filled = 0;
    ec = detail::read_elements(r, count, [&](std::uint64_t i) -> std::error_code {
      if (i >= N) {
        return r.fail(wire::errc::length_mismatch);
      }
      ++filled;
      return codec<T>::read(r, out[static_cast<std::size_t>(i)]);
    });
    if (ec) {
      return ec;
    }
    if (filled != N) {
      return r.fail(wire::errc::length_mismatch);
    }
    r.leave();
    return {};
  }
};

// 重复键：后出现者覆盖先出现者。
template <class K, class V, class Compare, class Alloc>
struct codec<std::map<K, V, Compare, Alloc>> {
  using map_type = std::map<K, V, Compare, Alloc>;

  static void write(Writer& w, const map_type& v) {
    w.write_map_header(v.size());
    for (const auto& [key, value] : v) {
      codec<K>::write(w, key);
      codec<V>::write(w, value);
    }
  }

  static std::error_code read(Reader& r, map_type& out) {
    std::optional<std::uint64_t> count;
    auto ec = r.read_map_header(count);
    if (ec) {
      return ec;
    }
    ec = r.enter();
    if (ec) {
      return ec;
    }
    out.clear();
    ec = detail::read_elements(r, count, [&](std::uint64_t) {
      auto key = detail::make_default<K>();
      auto entry_ec = codec<K>::read(r, key);
      if (entry_ec) {
        return entry_ec;
      }
      auto value = detail::make_default<V>();
      entry_ec = codec<V>::read(r, value);
      if (entry_ec) {
        return entry_ec;
      }
      out.insert_or_assign(std::move(key), std::move(value));
      return entry_ec;
    });
    if (ec) {
      return ec;
    }
    r.leave();
    return {};
  }
};

template <>
struct codec<std::monostate> {
  static void write(Writer& w, std::monostate) { w.write_null(); }
  static std::error_code read(Reader& r, std::monostate&) { return r.read_null(); }
};

/**
 * @brief 和类型绑定：编码为二元数组 [备选下标, 值]。
 *
 * 约定：
 * - 元素个数不为 2（含 indefinite 数组）时报 errc::length_mismatch；
 * - 下标不是无符号整数报 errc::type_mismatch，超出备选个数报 errc::overflow。
 */
template <class... Ts>
struct codec<std::variant<Ts...>> {
  using variant_type = std::variant<Ts...>;

  static void write(Writer& w, const variant_type& v) {
    w.write_array_header(2);
    w.write_unsigned(static_cast<std::uint64_t>(v.index()));
    std::visit([&](const auto& alt) { codec<std::remove_cvref_t<decltype(alt)>>::write(w, alt); }, v);
  }

  static std::error_code read(Reader& r, variant_type& out) {
    std::optional<std::uint64_t> count;
    auto ec = r.read_array_header(count);
    if (ec) {
      return ec;
    }
    if (count && *count != 2) {
      return r.fail(wire::errc::length_mismatch);
    }
    ec = r.enter();
    if (ec) {
      return ec;
    }

    const bool indefinite = !count;
    if (indefinite) {
      ec = expect_element(r);
      if (ec) {
        return ec;
      }
    }
    std::uint64_t index = 0;
    ec = r.read_uint(index);
    if (ec) {
      return ec;
    }
    if (index >= sizeof...(Ts)) {
      return r.fail(wire::errc::overflow);
    }
    if (indefinite) {
      ec = expect_element(r);
      if (ec) {
        return ec;
      }
    }
    ec = read_alternative(r, out, index, std::index_sequence_for<Ts...>{});
    if (ec) {
      return ec;
    }
    if (indefinite) {
      bool done = false;
      ec = r.at_break(done);
      if (ec) {
        return ec;
      }
      if (!done) {
        return r.fail(wire::errc::length_mismatch);
      }
      ec = r.read_break();
      if (ec) {
        return ec;
      }
    }
    r.leave();
    return {};
  }

 private:
  static std::error_code expect_element(Reader& r) {
    bool done = false;
    auto ec = r.at_break(done);
    if (ec) {
      return ec;
    }
    return done ? r.fail(wire::errc::length_mismatch) : std::error_code{};
  }

  template <std::size_t... I>
  static std::error_code read_alternative(Reader& r,
                                          variant_type& out,
                                          std::uint64_t index,
                                          std::index_sequence<I...>) {
    std::error_code ec;
    (void)((index == I ? (ec = read_as<I>(r, out), true) : false) || ...);
    return ec;
  }

  template <std::size_t I>
  static std::error_code read_as(Reader& r, variant_type& out) {
    using alternative = std::variant_alternative_t<I, variant_type>;
    auto value = detail::make_default<alternative>();
    auto ec = codec<alternative>::read(r, value);
    if (ec) {
      return ec;
    }
    out.template emplace<I>(std::move(value));
    return {};
  }
};

/**
 * @brief Record 绑定。
 *
 * 说明：
 * - 未知键按 DecodeOptions::unknown_fields 处理（lenient 跳过，strict 报 unknown_field）；
 * - 缺失的 std::optional 字段置为 nullopt；缺失的其他字段报 missing_field，
 *   DecodeOptions::default_missing_fields 打开时改为保留成员默认值（解码目标总是新构造的对象）；
 * - 同名键重复出现时后者覆盖前者。
 */
template <Record T>
struct codec<T> {
  static void write(Writer& w, const T& v) {
    const auto fields = T::cbor_fields();
    w.write_map_header(std::tuple_size_v<std::remove_cvref_t<decltype(fields)>>);
    std::apply(
      [&](const auto&... f) {
        (write_field(w, v, f), ...);
      },
      fields);
  }

  static std::error_code read(Reader& r, T& out) {
    constexpr auto kFieldCount = std::tuple_size_v<std::remove_cvref_t<decltype(T::cbor_fields())>>;
    const auto fields = T::cbor_fields();

    std::optional<std::uint64_t> count;
    auto ec = r.read_map_header(count);
    if (ec) {
      return ec;
    }
    ec = r.enter();
    if (ec) {
      return ec;
    }

    std::array<bool, kFieldCount> seen{};
    ec = detail::read_elements(r, count, [&](std::uint64_t) { return read_entry(r, out, fields, seen); });
    if (ec) {
      return ec;
    }

    ec = finish_missing(r, out, fields, seen, std::make_index_sequence<kFieldCount>{});
    if (ec) {
      return ec;
    }
    r.leave();
    return {};
  }

 private:
  template <class Member>
  static void write_field(Writer& w, const T& v, const Field<T, Member>& f) {
    w.write_text(f.name);
    codec<Member>::write(w, v.*(f.member));
  }

  template <class Fields, std::size_t N>
  static std::error_code read_entry(Reader& r, T& out, const Fields& fields, std::array<bool, N>& seen) {
    wire::Head key_head{};
    auto ec = r.peek_head(key_head);
    if (ec) {
      return ec;
    }

    if (key_head.major != wire::major_type::text_string) {
      if (r.options().unknown_fields == wire::FieldPolicy::strict) {
        return r.fail(wire::errc::unknown_field);
      }
      ec = r.skip_value();
      if (ec) {
        return ec;
      }
      return r.skip_value();
    }

    std::string key;
    ec = r.read_text(key);
    if (ec) {
      return ec;
    }

    bool matched = false;
    ec = read_matching(r, out, fields, seen, key, matched, std::make_index_sequence<N>{});
    if (ec || matched) {
      return ec;
    }

    if (r.options().unknown_fields == wire::FieldPolicy::strict) {
      return r.fail(wire::errc::unknown_field);
    }
    r.log_skipped_field(key);
    return r.skip_value();
  }

  template <class Fields, std::size_t N, std::size_t... I>
  static std::error_code read_matching(Reader& r,
                                       T& out,
                                       const Fields& fields,
                                       std::array<bool, N>& seen,
                                       std::string_view key,
                                       bool& matched,
                                       std::index_sequence<I...>) {
    std::error_code ec;
    (void)((std::get<I>(fields).name == key
              ? (matched = true, seen[I] = true, ec = read_member(r, out, std::get<I>(fields)), true)
              : false) ||
           ...);
    return ec;
  }

  template <class Member>
  static std::error_code read_member(Reader& r, T& out, const Field<T, Member>& f) {
    return codec<Member>::read(r, out.*(f.member));
  }

  template <class Fields, std::size_t N, std::size_t... I>
  static std::error_code finish_missing(Reader& r,
                                        T& out,
                                        const Fields& fields,
                                        const std::array<bool, N>& seen,
                                        std::index_sequence<I...>) {
    std::error_code ec;
    (void)((seen[I] ? false : (ec = reset_missing(r, out, std::get<I>(fields)), static_cast<bool>(ec))) || ...);
    return ec;
  }

  template <class Member>
  static std::error_code reset_missing(Reader& r, T& out, const Field<T, Member>& f) {
    if constexpr (detail::is_optional_v<Member>) {
      (out.*(f.member)).reset();
      return {};
    } else {
      if (r.options().default_missing_fields) {
        r.log_defaulted_field(f.name);
        return {};
      }
      return r.fail(wire::errc::missing_field);
    }
  }
};

/**
 * @brief 编码任意可编码类型，结果追加到 out。
 */
template <Codable T>
void encode(const T& value, std::vector<wire::byte>& out, const wire::EncodeOptions& options = {}) {
  Writer w(out, options);
  codec<T>::write(w, value);
}

template <Codable T>
[[nodiscard]] std::vector<wire::byte> encode(const T& value, const wire::EncodeOptions& options = {}) {
  std::vector<wire::byte> out;
  encode(value, out, options);
  return out;
}

/**
 * @brief 从输入开头解码一个 T（流式 API）。
 *
 * 失败时 out 保持不变，consumed 置 0。
 */
template <Decodable T>
std::error_code decode_one(wire::bytes_view in,
                           T& out,
                           std::size_t& consumed,
                           const wire::DecodeOptions& options = {},
                           wire::DecodeFailure* failure = nullptr) {
  Reader r(in, options);
  auto decoded = detail::make_default<T>();
  auto ec = codec<T>::read(r, decoded);
  if (ec) {
    r.log_failure("cbor serde decode");
    if (failure) {
      *failure = r.failure();
    }
    consumed = 0;
    return ec;
  }
  out = std::move(decoded);
  consumed = r.consumed();
  return {};
}

/**
 * @brief 解码整个缓冲区为 T；剩余字节返回 errc::trailing_bytes。
 */
template <Decodable T>
std::error_code decode(wire::bytes_view in,
                       T& out,
                       const wire::DecodeOptions& options = {},
                       wire::DecodeFailure* failure = nullptr) {
  auto decoded = detail::make_default<T>();
  std::size_t consumed = 0;
  auto ec = decode_one(in, decoded, consumed, options, failure);
  if (ec) {
    return ec;
  }
  if (consumed != in.size()) {
    ec = wire::make_error_code(wire::errc::trailing_bytes);
    if (failure) {
      *failure = wire::DecodeFailure{ec, consumed, std::nullopt, std::nullopt};
    }
    return ec;
  }
  out = std::move(decoded);
  return {};
}

template <Decodable T>
[[nodiscard]] std::pair<std::error_code, T> decode(wire::bytes_view in, const wire::DecodeOptions& options = {}) {
  std::pair<std::error_code, T> result{std::error_code{}, detail::make_default<T>()};
  result.first = decode(in, result.second, options);
  return result;
}

}  // namespace cborkit::serde
