#ifndef RELAUNCH_UTILS_LOGGING_HPP
#define RELAUNCH_UTILS_LOGGING_HPP

#include <exception>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace relaunch {
namespace utils {

/// Name of the spdlog logger all relaunch components write to.
inline constexpr const char* kLoggerName = "relaunch";

/**
 * @brief Returns the shared "relaunch" logger.
 *
 * If the host application already registered a logger under kLoggerName
 * (for example to route everything into its own sinks) that logger is used.
 * Otherwise a stderr color logger is created on first use.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Flattens an exception and every exception nested inside it into a
 * single "outer: inner: innermost" string.
 */
std::string describeNested(const std::exception& e);

} // namespace utils
} // namespace relaunch

#define RLOG_DEBUG(...)    ::relaunch::utils::logger()->debug(__VA_ARGS__)
#define RLOG_INFO(...)     ::relaunch::utils::logger()->info(__VA_ARGS__)
#define RLOG_WARN(...)     ::relaunch::utils::logger()->warn(__VA_ARGS__)
#define RLOG_ERROR(...)    ::relaunch::utils::logger()->error(__VA_ARGS__)
#define RLOG_CRITICAL(...) ::relaunch::utils::logger()->critical(__VA_ARGS__)

#endif // RELAUNCH_UTILS_LOGGING_HPP
