#pragma once

#include <cstdint>

namespace cborkit::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 库内日志统一写入名为 "cborkit" 的 spdlog logger（首次使用时创建，输出到 stderr），
 *   spdlog 类型不暴露到 public headers；
 * - 若业务侧在首次使用前已注册同名 logger，则直接复用（可自定义 sink/pattern）；
 * - 解码失败以 debug 级别记录（含偏移与错误信息），跳过未知字段以 trace 级别记录，
 *   编码路径不打日志；
 * - 默认级别为 info，即上述日志默认不输出。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

// 只影响 "cborkit" logger，不改动 spdlog 全局级别。
void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief 作用域内临时切换日志级别，析构时恢复原级别。
 */
class ScopedLogLevel final {
public:
    explicit ScopedLogLevel(LogLevel level) noexcept : previous_(log_level()) {
        set_log_level(level);
    }
    ~ScopedLogLevel() { set_log_level(previous_); }

    ScopedLogLevel(const ScopedLogLevel &) = delete;
    ScopedLogLevel &operator=(const ScopedLogLevel &) = delete;

private:
    LogLevel previous_;
};

} // namespace cborkit::core
