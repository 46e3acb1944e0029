#include "relaunch/utils/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace relaunch {
namespace utils {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex loggerMutex;
    std::lock_guard<std::mutex> lock(loggerMutex);

    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    try {
        return spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex&) {
        // Registered by the host since the lookup above.
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        throw;
    }
}

namespace {

void appendNested(const std::exception& e, std::string& out) {
    if (!out.empty()) {
        out += ": ";
    }
    out += e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        appendNested(inner, out);
    } catch (...) {
        out += ": <non-standard exception>";
    }
}

} // namespace

std::string describeNested(const std::exception& e) {
    std::string description;
    appendNested(e, description);
    return description;
}

} // namespace utils
} // namespace relaunch
