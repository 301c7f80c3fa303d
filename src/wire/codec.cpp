#include "cborkit/wire/codec.hpp"

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cborkit::wire {
namespace {

std::size_t encoded_size_impl(const Value& value, const EncodeOptions& options) noexcept {
  return std::visit(
    [&](const auto& v) -> std::size_t {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Unsigned>) {
        return head_size(v.value);
      } else if constexpr (std::is_same_v<T, Negative>) {
        return head_size(v.magnitude);
      } else if constexpr (std::is_same_v<T, Bytes> || std::is_same_v<T, Text>) {
        return head_size(v.value.size()) + v.value.size();
      } else if constexpr (std::is_same_v<T, Array>) {
        std::size_t total = head_size(v.size());
        for (const auto& child : v) {
          total += encoded_size_impl(child, options);
        }
        return total;
      } else if constexpr (std::is_same_v<T, Map>) {
        std::size_t total = head_size(v.size());
        for (const auto& entry : v) {
          total += encoded_size_impl(entry.key, options);
          total += encoded_size_impl(entry.value, options);
        }
        return total;
      } else if constexpr (std::is_same_v<T, Float>) {
        return encoded_double_size(v.value, options);
      } else {
        // Bool / Null / Undefined：单字节 simple 值
        return 1;
      }
    },
    value.storage());
}

std::error_code read_simple(Reader& r, const Head& head, Value& out) noexcept {
  switch (head.info) {
    case kSimpleFalse:
      out = Value::boolean(false);
      return {};
    case kSimpleTrue:
      out = Value::boolean(true);
      return {};
    case kSimpleNull:
      out = Value::null();
      return {};
    case kSimpleUndefined:
      out = Value::undefined();
      return {};
    case kSimpleHalf:
      out = Value::floating(half_to_double(static_cast<std::uint16_t>(head.argument)));
      return {};
    case kSimpleSingle:
      out = Value::floating(static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(head.argument))));
      return {};
    case kSimpleDouble:
      out = Value::floating(std::bit_cast<double>(head.argument));
      return {};
    default:
      return r.fail(errc::invalid_simple);
  }
}

std::error_code read_array(Reader& r, const Head& head, Value& out) {
  std::optional<std::uint64_t> count;
  auto ec = r.container_count(head, count);
  if (ec) {
    return ec;
  }
  ec = r.enter();
  if (ec) {
    return ec;
  }

  Array items;
  if (count) {
    items.reserve(static_cast<std::size_t>(*count));
    for (std::uint64_t i = 0; i < *count; ++i) {
      Value child = Value::null();  // 占位，随后被覆盖
      ec = read_value(r, child);
      if (ec) {
        return ec;
      }
      items.push_back(std::move(child));
    }
  } else {
    for (;;) {
      bool done = false;
      ec = r.at_break(done);
      if (ec) {
        return ec;
      }
      if (done) {
        ec = r.read_break();
        if (ec) {
          return ec;
        }
        break;
      }
      Value child = Value::null();
      ec = read_value(r, child);
      if (ec) {
        return ec;
      }
      items.push_back(std::move(child));
    }
  }

  r.leave();
  out = Value(std::move(items));
  return {};
}

std::error_code read_entry(Reader& r, Map& entries) {
  Value key = Value::null();
  auto ec = read_value(r, key);
  if (ec) {
    return ec;
  }
  Value value = Value::null();
  ec = read_value(r, value);
  if (ec) {
    return ec;
  }
  entries.push_back(Entry{std::move(key), std::move(value)});
  return {};
}

std::error_code read_map(Reader& r, const Head& head, Value& out) {
  std::optional<std::uint64_t> count;
  auto ec = r.container_count(head, count);
  if (ec) {
    return ec;
  }
  ec = r.enter();
  if (ec) {
    return ec;
  }

  Map entries;
  if (count) {
    entries.reserve(static_cast<std::size_t>(*count));
    for (std::uint64_t i = 0; i < *count; ++i) {
      ec = read_entry(r, entries);
      if (ec) {
        return ec;
      }
    }
  } else {
    for (;;) {
      bool done = false;
      ec = r.at_break(done);
      if (ec) {
        return ec;
      }
      if (done) {
        ec = r.read_break();
        if (ec) {
          return ec;
        }
        break;
      }
      ec = read_entry(r, entries);
      if (ec) {
        return ec;
      }
    }
  }

  r.leave();
  out = Value(std::move(entries));
  return {};
}

}  // namespace

std::size_t encoded_size(const Value& value, const EncodeOptions& options) noexcept {
  return encoded_size_impl(value, options);
}

void write_value(Writer& w, const Value& value) {
  std::visit(
    [&](const auto& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Unsigned>) {
        w.write_unsigned(v.value);
      } else if constexpr (std::is_same_v<T, Negative>) {
        w.write_negative(v.magnitude);
      } else if constexpr (std::is_same_v<T, Bytes>) {
        w.write_bytes(bytes_view{v.value.data(), v.value.size()});
      } else if constexpr (std::is_same_v<T, Text>) {
        w.write_text(v.value);
      } else if constexpr (std::is_same_v<T, Array>) {
        w.write_array_header(v.size());
        for (const auto& child : v) {
          write_value(w, child);
        }
      } else if constexpr (std::is_same_v<T, Map>) {
        w.write_map_header(v.size());
        for (const auto& entry : v) {
          write_value(w, entry.key);
          write_value(w, entry.value);
        }
      } else if constexpr (std::is_same_v<T, Float>) {
        w.write_double(v.value);
      } else if constexpr (std::is_same_v<T, Bool>) {
        w.write_bool(v.value);
      } else if constexpr (std::is_same_v<T, Null>) {
        w.write_null();
      } else {
        w.write_undefined();
      }
    },
    value.storage());
}

std::error_code read_value(Reader& r, Value& out) {
  Head head{};
  auto ec = r.read_head(head);
  if (ec) {
    return ec;
  }

  switch (head.major) {
    case major_type::unsigned_integer:
      out = Value::uint64(head.argument);
      return {};
    case major_type::negative_integer:
      out = Value::negative(head.argument);
      return {};
    case major_type::byte_string: {
      std::vector<byte> payload;
      ec = r.read_payload(head, payload);
      if (ec) {
        return ec;
      }
      out = Value::bytes(std::move(payload));
      return {};
    }
    case major_type::text_string: {
      std::string payload;
      ec = r.read_payload(head, payload);
      if (ec) {
        return ec;
      }
      out = Value::text(std::move(payload));
      return {};
    }
    case major_type::array:
      return read_array(r, head, out);
    case major_type::map:
      return read_map(r, head, out);
    case major_type::tag:
      return r.fail(errc::unsupported_tag);
    case major_type::simple:
      return read_simple(r, head, out);
  }
  return r.fail(errc::invalid_additional_info);
}

void encode(const Value& value, std::vector<byte>& out, const EncodeOptions& options) {
  out.reserve(out.size() + encoded_size(value, options));
  Writer w(out, options);
  write_value(w, value);
}

std::vector<byte> encode(const Value& value, const EncodeOptions& options) {
  std::vector<byte> out;
  encode(value, out, options);
  return out;
}

std::error_code decode_one(bytes_view in,
                           Value& out,
                           std::size_t& consumed,
                           const DecodeOptions& options,
                           DecodeFailure* failure) {
  Reader r(in, options);
  Value decoded = Value::null();
  auto ec = read_value(r, decoded);
  if (ec) {
    r.log_failure("cbor decode");
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

std::error_code decode(bytes_view in, Value& out, const DecodeOptions& options, DecodeFailure* failure) {
  Value decoded = Value::null();
  std::size_t consumed = 0;
  auto ec = decode_one(in, decoded, consumed, options, failure);
  if (ec) {
    return ec;
  }
  if (consumed != in.size()) {
    ec = make_error_code(errc::trailing_bytes);
    if (failure) {
      *failure = DecodeFailure{ec, consumed, std::nullopt, std::nullopt};
    }
    return ec;
  }
  out = std::move(decoded);
  return {};
}

std::error_code extract_field(bytes_view in,
                              std::string_view key,
                              Value& out,
                              bool& found,
                              const DecodeOptions& options,
                              DecodeFailure* failure) {
  Reader r(in, options);
  found = false;

  const auto finish = [&](std::error_code ec) {
    if (ec) {
      r.log_failure("cbor extract_field");
      if (failure) {
        *failure = r.failure();
      }
    }
    return ec;
  };

  std::optional<std::uint64_t> count;
  auto ec = r.read_map_header(count);
  if (ec) {
    return finish(ec);
  }

  for (std::uint64_t i = 0; !count || i < *count; ++i) {
    if (!count) {
      bool done = false;
      ec = r.at_break(done);
      if (ec || done) {
        return finish(ec);
      }
    }

    Head key_head{};
    ec = r.peek_head(key_head);
    if (ec) {
      return finish(ec);
    }
    if (key_head.major == major_type::text_string) {
      std::string name;
      ec = r.read_text(name);
      if (ec) {
        return finish(ec);
      }
      if (name == key) {
        Value value = Value::null();
        ec = read_value(r, value);
        if (ec) {
          return finish(ec);
        }
        out = std::move(value);
        found = true;
        return {};
      }
    } else {
      ec = r.skip_value();
      if (ec) {
        return finish(ec);
      }
    }

    ec = r.skip_value();
    if (ec) {
      return finish(ec);
    }
  }
  return {};
}

}  // namespace cborkit::wire
