#include "execbridge/command.hpp"

#include <utility>

#include "execbridge/internal/access.hpp"
#include "execbridge/internal/backend.hpp"
#include "execbridge/internal/lowering.hpp"

namespace execbridge {

Command::Command(std::string program) { argv_.emplace_back(std::move(program)); }

Command& Command::arg(std::string value) {
  argv_.emplace_back(std::move(value));
  return *this;
}

Command& Command::args(std::initializer_list<std::string_view> values) {
  for (auto value : values) {
    argv_.emplace_back(value);
  }
  return *this;
}

Command& Command::args(const std::vector<std::string>& values) {
  argv_.insert(argv_.end(), values.begin(), values.end());
  return *this;
}

Command& Command::current_dir(std::filesystem::path path) {
  cwd_ = std::move(path);
  return *this;
}

Command& Command::env(std::string key, std::string value) {
  env_delta_[std::move(key)] = std::move(value);
  return *this;
}

Command& Command::env_remove(std::string_view key) {
  env_delta_[std::string(key)] = std::nullopt;
  return *this;
}

Command& Command::env_clear() {
  inherit_env_ = false;
  return *this;
}

Command& Command::options(SpawnOptions value) {
  opts_ = value;
  return *this;
}

Result<ProcessHandle> Command::spawn() const {
  auto lowered = internal::lower_command(*this);
  if (!lowered) {
    return std::unexpected(lowered.error());
  }

  auto spawned = internal::default_backend().spawn(*lowered);
  if (!spawned) {
    return std::unexpected(spawned.error());
  }
  return internal::ProcessAccess::from_spawned(*spawned);
}

ProcessHandle Command::spawn_or_throw() const {
  auto result = spawn();
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(*result);
}

}  // namespace execbridge
