#include "agentbox/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace agentbox {

namespace {

std::once_flag g_logger_once;

void CreateLogger() {
    // Reuse a logger the application registered under our name
    if (spdlog::get(kLoggerName)) {
        return;
    }
    auto logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
    logger->set_level(spdlog::level::info);
}

} // namespace

void InitLogger() {
    std::call_once(g_logger_once, CreateLogger);
}

void SetLogLevel(spdlog::level::level_enum level) {
    detail::Logger()->set_level(level);
}

namespace detail {

std::shared_ptr<spdlog::logger> Logger() {
    InitLogger();
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        // Application dropped our logger from the registry; fall back
        return spdlog::default_logger();
    }
    return logger;
}

} // namespace detail

} // namespace agentbox
