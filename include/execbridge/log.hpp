#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

#include "execbridge/result.hpp"

namespace execbridge {

/// @brief Name of the spdlog logger used by the engine.
inline constexpr std::string_view kLoggerName = "execbridge";

/// @brief Engine logger (stderr, colored), registered with spdlog on first use.
///
/// Embedders may register their own logger under kLoggerName before the first
/// engine call to redirect output.
std::shared_ptr<spdlog::logger> logger();

/// @brief Change the engine logger's level.
void set_log_level(spdlog::level::level_enum level);

/// @brief Parse trace|debug|info|warn|error|critical|off.
Result<spdlog::level::level_enum> parse_log_level(std::string_view name);

}  // namespace execbridge
