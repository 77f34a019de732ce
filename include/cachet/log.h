#ifndef CACHET_LOG_H
#define CACHET_LOG_H

#include <atomic>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

/// @brief Library logger.
/// @details The library logs through a single named spdlog logger. Hosts that already
///          have a logging setup can hand theirs over with `set_logger()`.
namespace cachet::log {

constexpr const char* LOGGER_NAME = "cachet";

namespace detail {

inline std::shared_ptr<spdlog::logger> make_default_logger()
{
    // Reuse a logger the host registered under our name, otherwise log to stderr.
    if (auto registered = spdlog::get(LOGGER_NAME)) {
        return registered;
    }
    return std::make_shared<spdlog::logger>(LOGGER_NAME, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

inline std::shared_ptr<spdlog::logger>& logger_instance()
{
    static std::shared_ptr<spdlog::logger> instance = make_default_logger();
    return instance;
}

}  // namespace detail

/// @brief Get the logger used by the library.
inline std::shared_ptr<spdlog::logger> logger()
{
    return std::atomic_load(&detail::logger_instance());
}

/// @brief Replace the logger used by the library.
/// @param new_logger The logger to use from now on. Passing `nullptr` restores the default logger.
inline void set_logger(std::shared_ptr<spdlog::logger> new_logger)
{
    if (!new_logger) {
        new_logger = detail::make_default_logger();
    }
    std::atomic_store(&detail::logger_instance(), std::move(new_logger));
}

}  // namespace cachet::log

#endif
