#pragma once

#include <spdlog/spdlog.h>
#include <optional>
#include <string>

namespace mcprt {

/**
 * @brief Map a --log-level value to a spdlog level
 * @param name One of trace, debug, info, warn, error, critical, off
 * @return Level, or std::nullopt for an unknown name
 */
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Install the default logger writing to stderr
 *
 * stdout carries protocol frames only, so every log line must go elsewhere.
 */
void init_logging(spdlog::level::level_enum level);

} // namespace mcprt
