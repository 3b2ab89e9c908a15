#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string>

namespace mcpgate {

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical)
 * @return Level, or std::nullopt for unknown names
 */
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Install the default diagnostic logger
 *
 * Always logs to stderr; stdout stays reserved for relayed frames.
 *
 * @param level Level name accepted by parse_log_level
 * @param log_file Additional file sink (empty: none)
 * @throws std::invalid_argument for unknown level names
 */
void configure_logging(const std::string& level, const std::string& log_file = "");

} // namespace mcpgate
