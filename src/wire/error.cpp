#include "cborkit/wire/error.hpp"

#include <string>

namespace cborkit::wire {
namespace {

class wire_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "cborkit.wire"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_eof:
        return "unexpected end of input";
      case errc::invalid_utf8:
        return "invalid utf-8 in text string";
      case errc::type_mismatch:
        return "major type mismatch";
      case errc::overflow:
        return "value does not fit target type";
      case errc::unknown_field:
        return "unknown record field";
      case errc::missing_field:
        return "missing record field";
      case errc::length_mismatch:
        return "collection length mismatch";
      case errc::invalid_additional_info:
        return "invalid additional info";
      case errc::invalid_simple:
        return "unsupported simple value";
      case errc::unexpected_break:
        return "unexpected break marker";
      case errc::indefinite_not_allowed:
        return "indefinite length not allowed";
      case errc::unsupported_tag:
        return "tags are not supported";
      case errc::depth_exceeded:
        return "nesting depth exceeded";
      case errc::limit_exceeded:
        return "size limit exceeded";
      case errc::trailing_bytes:
        return "trailing bytes after item";
      default:
        return "unknown cborkit.wire error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static wire_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace cborkit::wire
