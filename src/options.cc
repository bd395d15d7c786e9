#include "execbridge/options.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "execbridge/log.hpp"

namespace execbridge {

namespace {

std::string get_env(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

Result<std::chrono::milliseconds> parse_millis(const char* name, std::string_view text) {
  long long value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return fail(errc::invalid_config, std::string(name) + ": not a number: '" +
                                          std::string(text) + "'");
  }
  return std::chrono::milliseconds(value);
}

Result<void> apply_millis(const char* name, std::chrono::milliseconds& field) {
  auto text = get_env(name);
  if (text.empty()) {
    return {};
  }
  auto value = parse_millis(name, text);
  if (!value) {
    return std::unexpected(value.error());
  }
  field = *value;
  return {};
}

Result<void> check_positive(const char* name, std::chrono::milliseconds value) {
  if (value.count() <= 0) {
    return fail(errc::invalid_config,
                std::string(name) + " must be positive, got " + std::to_string(value.count()));
  }
  return {};
}

}  // namespace

Result<EngineOptions> EngineOptions::from_env() {
  EngineOptions options;

  if (auto program = get_env("EXECBRIDGE_INTERPRETER"); !program.empty()) {
    options.interpreter.program = program;
  }

  struct Field {
    const char* name;
    std::chrono::milliseconds* target;
  };
  const Field fields[] = {
      {"EXECBRIDGE_GRACE_WINDOW_MS", &options.grace_window},
      {"EXECBRIDGE_IDLE_TIMEOUT_MS", &options.idle_timeout},
      {"EXECBRIDGE_SWEEP_INTERVAL_MS", &options.sweep_interval},
      {"EXECBRIDGE_AWAITING_INPUT_MS", &options.awaiting_input_after},
  };
  for (const auto& field : fields) {
    if (auto applied = apply_millis(field.name, *field.target); !applied) {
      return std::unexpected(applied.error());
    }
  }

  if (auto level = get_env("EXECBRIDGE_LOG_LEVEL"); !level.empty()) {
    auto parsed = parse_log_level(level);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    options.log_level = *parsed;
  }

  if (auto valid = options.validate(); !valid) {
    return std::unexpected(valid.error());
  }
  return options;
}

Result<void> EngineOptions::validate() const {
  if (interpreter.program.empty()) {
    return fail(errc::invalid_config, "interpreter program is empty");
  }
  const std::pair<const char*, std::chrono::milliseconds> durations[] = {
      {"grace_window", grace_window},
      {"idle_timeout", idle_timeout},
      {"sweep_interval", sweep_interval},
      {"awaiting_input_after", awaiting_input_after},
      {"exit_drain_timeout", exit_drain_timeout},
  };
  for (const auto& [name, value] : durations) {
    if (auto ok = check_positive(name, value); !ok) {
      return ok;
    }
  }
  return {};
}

}  // namespace execbridge
