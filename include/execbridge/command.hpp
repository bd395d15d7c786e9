#pragma once

#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execbridge/process.hpp"
#include "execbridge/result.hpp"

namespace execbridge {

namespace internal {
/// @brief Internal access helper for Command.
struct CommandAccess;
}  // namespace internal

/// @brief Options that affect process creation.
struct SpawnOptions {
  /// @brief Place the child in its own process group so kills reach its descendants.
  bool new_process_group = true;
};

/// @brief Builder for launching an interpreter with piped stdin, stdout and stderr.
class Command {
 public:
  /// @brief Construct a command with argv[0]=program.
  explicit Command(std::string program);

  /// @brief Append a single argument.
  Command& arg(std::string value);
  /// @brief Append multiple arguments from an initializer list.
  Command& args(std::initializer_list<std::string_view> values);
  /// @brief Append multiple arguments.
  Command& args(const std::vector<std::string>& values);

  /// @brief Set current working directory for the child.
  Command& current_dir(std::filesystem::path path);

  /// @brief Set or override an environment variable.
  Command& env(std::string key, std::string value);
  /// @brief Remove an environment variable.
  Command& env_remove(std::string_view key);
  /// @brief Clear the inherited environment.
  Command& env_clear();

  /// @brief Set spawn options.
  Command& options(SpawnOptions value);

  /// @brief Spawn without waiting.
  [[nodiscard]] Result<ProcessHandle> spawn() const;
  /// @brief Spawn and throw on error.
  [[nodiscard]] ProcessHandle spawn_or_throw() const;

 private:
  /// @brief Argument vector (argv[0] is the program).
  std::vector<std::string> argv_;
  /// @brief Optional working directory for the child.
  std::optional<std::filesystem::path> cwd_;
  /// @brief Whether to inherit the parent environment.
  bool inherit_env_ = true;
  /// @brief Environment updates (set/unset) to apply to the child.
  std::map<std::string, std::optional<std::string>, std::less<>> env_delta_;
  /// @brief Spawn options for the command.
  SpawnOptions opts_{};

  friend struct internal::CommandAccess;
};

}  // namespace execbridge
