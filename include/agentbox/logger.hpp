#ifndef AGENTBOX_LOGGER_HPP
#define AGENTBOX_LOGGER_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace agentbox {

// Name of the library's spdlog logger
inline constexpr const char* kLoggerName = "agentbox";

// Create the library logger with a colored console sink (idempotent)
void InitLogger();

// Set the library logger's level
void SetLogLevel(spdlog::level::level_enum level);

namespace detail {

// Library logger, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> Logger();

} // namespace detail

} // namespace agentbox

#endif // AGENTBOX_LOGGER_HPP
