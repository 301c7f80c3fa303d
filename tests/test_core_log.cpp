#include "cborkit/core/log.hpp"
#include "cborkit/serde/serde.hpp"
#include "cborkit/wire/codec.hpp"

#include "test_main.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace {

using cborkit::core::LogLevel;
using cborkit::core::ScopedLogLevel;
using cborkit::core::log_level;
using cborkit::core::set_log_level;

struct Sample {
  std::uint32_t id{0};

  static constexpr auto cbor_fields() { return std::make_tuple(cborkit::serde::field("id", &Sample::id)); }
};

std::ostringstream& captured() {
  static std::ostringstream oss;
  return oss;
}

// 必须在库第一次取 logger 之前注册，库会复用同名 logger。
void install_capture_logger() {
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured());
  auto logger = std::make_shared<spdlog::logger>("cborkit", sink);
  logger->set_pattern("%l %v");
  spdlog::register_logger(logger);
}

void test_log_level_roundtrip() {
  for (const auto level : {LogLevel::trace,
                           LogLevel::debug,
                           LogLevel::info,
                           LogLevel::warn,
                           LogLevel::error,
                           LogLevel::critical,
                           LogLevel::off}) {
    set_log_level(level);
    TEST_EXPECT_EQ(log_level(), level);
  }
}

void test_library_logger_does_not_touch_global_level() {
  spdlog::set_level(spdlog::level::warn);
  set_log_level(LogLevel::trace);
  TEST_EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
  TEST_EXPECT_EQ(log_level(), LogLevel::trace);
}

void test_scoped_log_level_restores() {
  set_log_level(LogLevel::warn);
  {
    ScopedLogLevel scoped(LogLevel::debug);
    TEST_EXPECT_EQ(log_level(), LogLevel::debug);
  }
  TEST_EXPECT_EQ(log_level(), LogLevel::warn);
}

void test_decode_failure_logged_at_debug() {
  // 第二个元素声明 2 字节的 text，只剩 1 字节。
  const std::vector<std::uint8_t> truncated{0x82, 0x01, 0x62, 0x61};
  auto value = cborkit::wire::Value::null();

  captured().str("");
  {
    ScopedLogLevel scoped(LogLevel::info);
    TEST_EXPECT(static_cast<bool>(cborkit::wire::decode(truncated, value)));
  }
  TEST_EXPECT(captured().str().empty());

  {
    ScopedLogLevel scoped(LogLevel::debug);
    TEST_EXPECT(static_cast<bool>(cborkit::wire::decode(truncated, value)));
  }
  const auto text = captured().str();
  TEST_EXPECT(text.find("debug") != std::string::npos);
  TEST_EXPECT(text.find("unexpected end of input") != std::string::npos);
  TEST_EXPECT(text.find("offset 2") != std::string::npos);
}

void test_skipped_field_logged_at_trace() {
  // {"id": 1, "extra": true}
  const std::vector<std::uint8_t> bytes{0xa2, 0x62, 'i', 'd', 0x01, 0x65, 'e', 'x', 't', 'r', 'a', 0xf5};
  Sample out{};

  captured().str("");
  {
    ScopedLogLevel scoped(LogLevel::trace);
    TEST_EXPECT_OK(cborkit::serde::decode(bytes, out));
  }
  TEST_EXPECT_EQ(out.id, 1u);
  TEST_EXPECT(captured().str().find("skipping unknown field \"extra\"") != std::string::npos);
}

}  // namespace

int main() {
  install_capture_logger();
  test_log_level_roundtrip();
  test_library_logger_does_not_touch_global_level();
  test_scoped_log_level_restores();
  test_decode_failure_logged_at_debug();
  test_skipped_field_logged_at_trace();
  return ::cborkit::tests::run_and_report();
}
