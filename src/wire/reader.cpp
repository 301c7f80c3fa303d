#include "cborkit/wire/reader.hpp"

#include "../core/logger.hpp"

#include <bit>
#include <cstdint>

namespace cborkit::wire {

bool valid_utf8(bytes_view text) noexcept {
  std::size_t i = 0;
  const std::size_t n = text.size();
  while (i < n) {
    const auto c = static_cast<std::uint8_t>(text[i]);
    if (c < 0x80u) {
      ++i;
      continue;
    }

    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if ((c & 0xE0u) == 0xC0u) {
      extra = 1;
      cp = c & 0x1Fu;
      min_cp = 0x80u;
    } else if ((c & 0xF0u) == 0xE0u) {
      extra = 2;
      cp = c & 0x0Fu;
      min_cp = 0x800u;
    } else if ((c & 0xF8u) == 0xF0u) {
      extra = 3;
      cp = c & 0x07u;
      min_cp = 0x10000u;
    } else {
      return false;  // 孤立的续字节或 0xF8 以上的前导字节
    }

    if (n - i - 1 < extra) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<std::uint8_t>(text[i + k]);
      if ((cc & 0xC0u) != 0x80u) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3Fu);
    }
    if (cp < min_cp || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

Reader::Reader(bytes_view in, DecodeOptions options) noexcept : in_(in), options_(options) {}

std::error_code Reader::fail(errc e) noexcept {
  const auto ec = make_error_code(e);
  if (!failure_.ec) {
    failure_.ec = ec;
    failure_.offset = head_pos_;
  }
  return ec;
}

std::error_code Reader::fail_type(major_type expected, major_type actual) noexcept {
  if (!failure_.ec) {
    failure_.expected = expected;
    failure_.actual = actual;
  }
  return fail(errc::type_mismatch);
}

std::error_code Reader::take(std::size_t n, bytes_view& out) noexcept {
  if (n > remaining()) {
    return fail(errc::unexpected_eof);
  }
  out = in_.subspan(pos_, n);
  pos_ += n;
  return {};
}

std::error_code Reader::read_argument(std::uint8_t info, std::uint64_t& out) noexcept {
  const std::size_t n = std::size_t{1} << (info - kInfoUint8);  // 24..27 -> 1/2/4/8
  bytes_view raw{};
  auto ec = take(n, raw);
  if (ec) {
    return ec;
  }
  std::uint64_t v = 0;
  for (const auto b : raw) {
    v = (v << 8) | static_cast<std::uint64_t>(b);
  }
  out = v;
  return {};
}

std::error_code Reader::read_head(Head& out) noexcept {
  head_pos_ = pos_;
  if (at_end()) {
    return fail(errc::unexpected_eof);
  }
  const byte initial = in_[pos_++];
  if (initial == kBreakByte) {
    return fail(errc::unexpected_break);
  }

  Head head{};
  head.major = major_of(initial);
  head.info = info_of(initial);

  if (head.info <= kMaxInlineArgument) {
    head.argument = head.info;
  } else if (head.info <= kInfoUint64) {
    auto ec = read_argument(head.info, head.argument);
    if (ec) {
      return ec;
    }
  } else if (head.info < kInfoIndefinite) {
    return fail(errc::invalid_additional_info);
  } else {
    switch (head.major) {
      case major_type::byte_string:
      case major_type::text_string:
      case major_type::array:
      case major_type::map:
        if (!options_.allow_indefinite) {
          return fail(errc::indefinite_not_allowed);
        }
        break;
      default:
        return fail(errc::invalid_additional_info);
    }
  }

  out = head;
  return {};
}

std::error_code Reader::peek_head(Head& out) noexcept {
  const auto saved = pos_;
  auto ec = read_head(out);
  pos_ = saved;
  return ec;
}

std::error_code Reader::expect_head(major_type expected, Head& out) noexcept {
  auto ec = read_head(out);
  if (ec) {
    return ec;
  }
  if (out.major != expected) {
    return fail_type(expected, out.major);
  }
  return {};
}

std::error_code Reader::container_count(const Head& head, std::optional<std::uint64_t>& count) noexcept {
  if (head.indefinite()) {
    count.reset();
    return {};
  }
  if (options_.max_collection_size != 0 && head.argument > options_.max_collection_size) {
    return fail(errc::limit_exceeded);
  }
  // 每个元素至少占 1 字节：提前识别伪造的超大 count。
  const std::size_t per_element = head.major == major_type::map ? 2 : 1;
  if (head.argument > remaining() / per_element) {
    return fail(errc::unexpected_eof);
  }
  count = head.argument;
  return {};
}

std::error_code Reader::check_string_length(std::uint64_t total) noexcept {
  if (options_.max_string_length != 0 && total > options_.max_string_length) {
    return fail(errc::limit_exceeded);
  }
  return {};
}

template <class Sink>
std::error_code Reader::read_chunks(const Head& head, Sink& sink) {
  const bool check_utf8 = head.major == major_type::text_string && options_.validate_utf8;

  if (!head.indefinite()) {
    auto ec = check_string_length(head.argument);
    if (ec) {
      return ec;
    }
    if (head.argument > remaining()) {
      return fail(errc::unexpected_eof);
    }
    bytes_view chunk{};
    ec = take(static_cast<std::size_t>(head.argument), chunk);
    if (ec) {
      return ec;
    }
    if (check_utf8 && !valid_utf8(chunk)) {
      return fail(errc::invalid_utf8);
    }
    sink.insert(sink.end(), chunk.begin(), chunk.end());
    return {};
  }

  // indefinite：若干同主类型的定长分块，以 break 结束；每个 text 分块需各自是合法 UTF-8。
  std::uint64_t total = 0;
  for (;;) {
    bool done = false;
    auto ec = at_break(done);
    if (ec) {
      return ec;
    }
    if (done) {
      ++pos_;
      return {};
    }

    Head part{};
    ec = read_head(part);
    if (ec) {
      return ec;
    }
    if (part.major != head.major) {
      return fail_type(head.major, part.major);
    }
    if (part.indefinite()) {
      return fail(errc::invalid_additional_info);
    }
    if (part.argument > remaining()) {
      return fail(errc::unexpected_eof);
    }
    total += part.argument;
    ec = check_string_length(total);
    if (ec) {
      return ec;
    }

    bytes_view chunk{};
    ec = take(static_cast<std::size_t>(part.argument), chunk);
    if (ec) {
      return ec;
    }
    if (check_utf8 && !valid_utf8(chunk)) {
      return fail(errc::invalid_utf8);
    }
    sink.insert(sink.end(), chunk.begin(), chunk.end());
  }
}

std::error_code Reader::read_payload(const Head& head, std::vector<byte>& out) {
  out.clear();
  return read_chunks(head, out);
}

std::error_code Reader::read_payload(const Head& head, std::string& out) {
  out.clear();
  return read_chunks(head, out);
}

std::error_code Reader::read_integer(bool& negative, std::uint64_t& magnitude) noexcept {
  Head head{};
  auto ec = read_head(head);
  if (ec) {
    return ec;
  }
  switch (head.major) {
    case major_type::unsigned_integer:
      negative = false;
      break;
    case major_type::negative_integer:
      negative = true;
      break;
    default:
      return fail_type(major_type::unsigned_integer, head.major);
  }
  magnitude = head.argument;
  return {};
}

std::error_code Reader::read_bool(bool& out) noexcept {
  Head head{};
  auto ec = expect_head(major_type::simple, head);
  if (ec) {
    return ec;
  }
  switch (head.info) {
    case kSimpleFalse:
      out = false;
      return {};
    case kSimpleTrue:
      out = true;
      return {};
    default:
      return fail_type(major_type::simple, major_type::simple);
  }
}

std::error_code Reader::read_null() noexcept {
  Head head{};
  auto ec = expect_head(major_type::simple, head);
  if (ec) {
    return ec;
  }
  if (head.info != kSimpleNull) {
    return fail_type(major_type::simple, major_type::simple);
  }
  return {};
}

std::error_code Reader::read_simple_float(const Head& head, double& out) noexcept {
  switch (head.info) {
    case kSimpleHalf:
      out = half_to_double(static_cast<std::uint16_t>(head.argument));
      return {};
    case kSimpleSingle:
      out = static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(head.argument)));
      return {};
    case kSimpleDouble:
      out = std::bit_cast<double>(head.argument);
      return {};
    default:
      return fail_type(major_type::simple, head.major);
  }
}

std::error_code Reader::read_double(double& out) noexcept {
  Head head{};
  auto ec = expect_head(major_type::simple, head);
  if (ec) {
    return ec;
  }
  return read_simple_float(head, out);
}

std::error_code Reader::read_float(float& out) noexcept {
  Head head{};
  auto ec = expect_head(major_type::simple, head);
  if (ec) {
    return ec;
  }
  if (head.info == kSimpleSingle) {
    out = std::bit_cast<float>(static_cast<std::uint32_t>(head.argument));
    return {};
  }
  double wide = 0.0;
  ec = read_simple_float(head, wide);
  if (ec) {
    return ec;
  }
  // half 总能被 float 精确表示；double 仅在无损时接受。
  if (!double_to_single_exact(wide, out)) {
    return fail(errc::overflow);
  }
  return {};
}

std::error_code Reader::read_text(std::string& out) {
  Head head{};
  auto ec = expect_head(major_type::text_string, head);
  if (ec) {
    return ec;
  }
  return read_payload(head, out);
}

std::error_code Reader::read_bytes(std::vector<byte>& out) {
  Head head{};
  auto ec = expect_head(major_type::byte_string, head);
  if (ec) {
    return ec;
  }
  return read_payload(head, out);
}

std::error_code Reader::read_array_header(std::optional<std::uint64_t>& count) noexcept {
  Head head{};
  auto ec = expect_head(major_type::array, head);
  if (ec) {
    return ec;
  }
  return container_count(head, count);
}

std::error_code Reader::read_map_header(std::optional<std::uint64_t>& count) noexcept {
  Head head{};
  auto ec = expect_head(major_type::map, head);
  if (ec) {
    return ec;
  }
  return container_count(head, count);
}

std::error_code Reader::at_break(bool& out) noexcept {
  if (at_end()) {
    head_pos_ = pos_;
    return fail(errc::unexpected_eof);
  }
  out = in_[pos_] == kBreakByte;
  return {};
}

std::error_code Reader::read_break() noexcept {
  bool done = false;
  auto ec = at_break(done);
  if (ec) {
    return ec;
  }
  if (!done) {
    head_pos_ = pos_;
    return fail(errc::type_mismatch);
  }
  ++pos_;
  return {};
}

bool Reader::next_is_null() const noexcept {
  return !at_end() && in_[pos_] == make_initial_byte(major_type::simple, kSimpleNull);
}

std::error_code Reader::enter() noexcept {
  if (options_.max_depth != 0 && depth_ >= options_.max_depth) {
    return fail(errc::depth_exceeded);
  }
  ++depth_;
  return {};
}

void Reader::leave() noexcept {
  if (depth_ > 0) {
    --depth_;
  }
}

std::error_code Reader::skip_value() noexcept {
  Head head{};
  auto ec = read_head(head);
  if (ec) {
    return ec;
  }

  switch (head.major) {
    case major_type::unsigned_integer:
    case major_type::negative_integer:
    case major_type::simple:
      // 参数（含 half/single/double 的位模式）已随首部读入。
      return {};
    case major_type::tag:
      return fail(errc::unsupported_tag);
    case major_type::byte_string:
    case major_type::text_string: {
      if (!head.indefinite()) {
        bytes_view ignored{};
        if (head.argument > remaining()) {
          return fail(errc::unexpected_eof);
        }
        return take(static_cast<std::size_t>(head.argument), ignored);
      }
      for (;;) {
        bool done = false;
        ec = at_break(done);
        if (ec) {
          return ec;
        }
        if (done) {
          ++pos_;
          return {};
        }
        Head part{};
        ec = read_head(part);
        if (ec) {
          return ec;
        }
        if (part.major != head.major) {
          return fail_type(head.major, part.major);
        }
        if (part.indefinite()) {
          return fail(errc::invalid_additional_info);
        }
        if (part.argument > remaining()) {
          return fail(errc::unexpected_eof);
        }
        bytes_view ignored{};
        ec = take(static_cast<std::size_t>(part.argument), ignored);
        if (ec) {
          return ec;
        }
      }
    }
    case major_type::array:
    case major_type::map: {
      std::optional<std::uint64_t> count;
      ec = container_count(head, count);
      if (ec) {
        return ec;
      }
      ec = enter();
      if (ec) {
        return ec;
      }
      const std::uint64_t per_element = head.major == major_type::map ? 2 : 1;
      if (count) {
        for (std::uint64_t i = 0; i < *count * per_element; ++i) {
          ec = skip_value();
          if (ec) {
            return ec;
          }
        }
      } else {
        for (;;) {
          bool done = false;
          ec = at_break(done);
          if (ec) {
            return ec;
          }
          if (done) {
            ++pos_;
            break;
          }
          for (std::uint64_t i = 0; i < per_element; ++i) {
            ec = skip_value();
            if (ec) {
              return ec;
            }
          }
        }
      }
      leave();
      return {};
    }
  }
  return fail(errc::invalid_additional_info);
}

void Reader::log_failure(std::string_view context) const {
  if (!failure_.ec) {
    return;
  }
  if (failure_.expected && failure_.actual) {
    core::detail::library_logger()->debug("{}: {} at offset {} (expected {}, got {})",
                  context,
                  failure_.ec.message(),
                  failure_.offset,
                  major_type_name(*failure_.expected),
                  major_type_name(*failure_.actual));
    return;
  }
  core::detail::library_logger()->debug("{}: {} at offset {}", context, failure_.ec.message(), failure_.offset);
}

void Reader::log_skipped_field(std::string_view key) const {
  core::detail::library_logger()->trace("cbor record: skipping unknown field \"{}\" at offset {}", key, head_pos_);
}

void Reader::log_defaulted_field(std::string_view key) const {
  core::detail::library_logger()->trace("cbor record: field \"{}\" missing, keeping default", key);
}

}  // namespace cborkit::wire
