#include "execbridge/internal/lowering.hpp"

#include <unistd.h>

#include "execbridge/internal/access.hpp"

#if EXECBRIDGE_PLATFORM_MACOS
#include <crt_externs.h>
#else
extern char** environ;
#endif

namespace execbridge::internal {

namespace {

char** process_environ() {
#if EXECBRIDGE_PLATFORM_MACOS
  char*** envp = _NSGetEnviron();
  return (envp != nullptr) ? *envp : nullptr;
#else
  return ::environ;
#endif
}

}  // namespace

Result<SpawnSpec> lower_command(const Command& cmd) {
  const auto& argv = CommandAccess::argv(cmd);
  if (argv.empty() || argv.front().empty()) {
    return fail(errc::empty_argv, "argv");
  }

  SpawnSpec spec;
  spec.argv = argv;
  spec.cwd = CommandAccess::cwd(cmd);
  spec.new_process_group = CommandAccess::options(cmd).new_process_group;

  std::map<std::string, std::string, std::less<>> env_map;
  if (CommandAccess::inherit_env(cmd)) {
    for (char** env = process_environ(); env != nullptr && *env != nullptr; ++env) {
      std::string_view entry(*env);
      auto pos = entry.find('=');
      if (pos == std::string_view::npos) {
        continue;
      }
      env_map[std::string(entry.substr(0, pos))] = std::string(entry.substr(pos + 1));
    }
  }

  for (const auto& [key, value] : CommandAccess::env_delta(cmd)) {
    if (value.has_value()) {
      env_map[key] = *value;
    } else {
      env_map.erase(key);
    }
  }

  spec.envp.reserve(env_map.size());
  for (const auto& [key, value] : env_map) {
    std::string entry;
    entry.reserve(key.size() + 1 + value.size());
    entry.append(key);
    entry.push_back('=');
    entry.append(value);
    spec.envp.push_back(std::move(entry));
  }
  return spec;
}

}  // namespace execbridge::internal
