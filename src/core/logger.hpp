#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace cborkit::core::detail {

inline constexpr const char *kLoggerName = "cborkit";

// 库内唯一的 logger 入口（线程安全的惰性初始化）。
[[nodiscard]] const std::shared_ptr<spdlog::logger> &library_logger();

} // namespace cborkit::core::detail
