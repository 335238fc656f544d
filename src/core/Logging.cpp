#include "Logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <map>

namespace mcprt {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };

    auto it = levels.find(name);
    if (it == levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("mcp");
    if (!logger) {
        logger = spdlog::stderr_color_mt("mcp");
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

} // namespace mcprt
