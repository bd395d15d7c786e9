#include "execbridge/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <string>
#include <utility>

namespace execbridge {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    std::string name(kLoggerName);
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(name);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
    return created;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

Result<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> kLevels{{
      {"trace", spdlog::level::trace},
      {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},
      {"warning", spdlog::level::warn},
      {"error", spdlog::level::err},
      {"critical", spdlog::level::critical},
      {"off", spdlog::level::off},
  }};
  for (const auto& [label, level] : kLevels) {
    if (label == name) {
      return level;
    }
  }
  return fail(errc::invalid_config, "unknown log level '" + std::string(name) + "'");
}

}  // namespace execbridge
