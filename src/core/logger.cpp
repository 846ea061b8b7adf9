#include "delguard/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace delguard {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
}

void Logger::init(std::string_view name, std::string_view level) {
    // Re-initialising with the same name must reuse the registered logger,
    // spdlog refuses duplicate registrations.
    g_logger = spdlog::get(std::string(name));
    if (!g_logger) {
        g_logger = spdlog::stderr_color_mt(std::string(name));
    }
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    if (!g_logger) {
        init("delguard", level);
        return;
    }
    if (level == "trace") g_logger->set_level(spdlog::level::trace);
    else if (level == "debug") g_logger->set_level(spdlog::level::debug);
    else if (level == "info") g_logger->set_level(spdlog::level::info);
    else if (level == "warn") g_logger->set_level(spdlog::level::warn);
    else if (level == "error") g_logger->set_level(spdlog::level::err);
    else if (level == "critical") g_logger->set_level(spdlog::level::critical);
    else if (level == "off") g_logger->set_level(spdlog::level::off);
    else g_logger->set_level(spdlog::level::warn);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace delguard
