#include "cborkit/core/error.hpp"
#include "cborkit/wire/error.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

void test_core_category() {
  using cborkit::core::errc;

  const auto ec = cborkit::core::make_error_code(errc::invalid_argument);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "cborkit.core");
  TEST_EXPECT_EQ(ec.message(), "invalid argument");
  TEST_EXPECT_EQ(cborkit::core::make_error_code(errc::ok).message(), "ok");
  TEST_EXPECT(!cborkit::core::make_error_code(errc::ok));

  std::error_code unknown(9999, cborkit::core::error_category());
  TEST_EXPECT_EQ(unknown.message(), "unknown cborkit.core error");

  // is_error_code_enum 注册后可以直接与 error_code 比较。
  std::error_code converted = errc::invalid_argument;
  TEST_EXPECT(converted == errc::invalid_argument);
}

void test_wire_category() {
  using cborkit::wire::errc;
  using cborkit::wire::make_error_code;

  const auto eof = make_error_code(errc::unexpected_eof);
  TEST_EXPECT_EQ(std::string_view(eof.category().name()), "cborkit.wire");
  TEST_EXPECT_EQ(eof.message(), "unexpected end of input");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_utf8).message(), "invalid utf-8 in text string");
  TEST_EXPECT_EQ(make_error_code(errc::type_mismatch).message(), "major type mismatch");
  TEST_EXPECT_EQ(make_error_code(errc::overflow).message(), "value does not fit target type");
  TEST_EXPECT_EQ(make_error_code(errc::unknown_field).message(), "unknown record field");
  TEST_EXPECT_EQ(make_error_code(errc::trailing_bytes).message(), "trailing bytes after item");

  std::error_code unknown(9999, cborkit::wire::error_category());
  TEST_EXPECT_EQ(unknown.message(), "unknown cborkit.wire error");

  // 不同错误域的同值错误码互不相等。
  TEST_EXPECT(make_error_code(errc::unexpected_eof) != cborkit::core::make_error_code(cborkit::core::errc::invalid_argument));
}

}  // namespace

int main() {
  test_core_category();
  test_wire_category();
  return ::cborkit::tests::run_and_report();
}
