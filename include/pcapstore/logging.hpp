#pragma once

#include <memory>
#include <utility>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

// PCAPSTORE_LOG_TRACE -> spdlog::trace
// PCAPSTORE_LOG_DEBUG -> spdlog::debug  (rotation, index samples, segment opens)
// PCAPSTORE_LOG_INFO  -> spdlog::info   (store create/open/close)
// PCAPSTORE_LOG_WARN  -> spdlog::warn   (checksum mismatch, skipped segment, index fallback)
// PCAPSTORE_LOG_ERROR -> spdlog::err    (failures that cannot be returned, e.g. in destructors)

namespace pcapstore {

namespace detail {

inline constexpr const char* logger_name = "pcapstore";
inline constexpr const char* logger_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

inline std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
    auto result = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
    result->set_pattern(logger_pattern);
    result->set_level(spdlog::level::warn);
    return result;
}

inline std::shared_ptr<spdlog::logger>& logger() {
    static std::shared_ptr<spdlog::logger> store_logger = make_default_logger();
    return store_logger;
}

} // namespace detail

/**
 * @brief Get the library logger
 *
 * Created on first use with a colored stderr sink at warn level.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    return detail::logger();
}

/**
 * @brief Replace the library logger (e.g. to route into an application's sinks)
 *
 * Passing nullptr installs a logger that discards everything. Call before any store is
 * opened; the logger is not swapped atomically with respect to concurrent log calls.
 */
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    if (!replacement) {
        replacement = std::make_shared<spdlog::logger>(
            detail::logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    detail::logger() = std::move(replacement);
}

inline void set_log_level(spdlog::level::level_enum level) {
    detail::logger()->set_level(level);
}

} // namespace pcapstore

#define PCAPSTORE_LOG_TRACE(...) ::pcapstore::detail::logger()->trace(__VA_ARGS__)
#define PCAPSTORE_LOG_DEBUG(...) ::pcapstore::detail::logger()->debug(__VA_ARGS__)
#define PCAPSTORE_LOG_INFO(...) ::pcapstore::detail::logger()->info(__VA_ARGS__)
#define PCAPSTORE_LOG_WARN(...) ::pcapstore::detail::logger()->warn(__VA_ARGS__)
#define PCAPSTORE_LOG_ERROR(...) ::pcapstore::detail::logger()->error(__VA_ARGS__)
