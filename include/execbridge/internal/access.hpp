#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "execbridge/command.hpp"
#include "execbridge/process.hpp"

namespace execbridge::internal {

struct Spawned;

struct ProcessAccess {
  static std::unique_ptr<ProcessHandle::Impl>& impl(ProcessHandle& process) {
    return process.impl_;
  }
  static ProcessHandle from_spawned(Spawned spawned);
};

struct CommandAccess {
  static const std::vector<std::string>& argv(const Command& cmd) { return cmd.argv_; }
  static std::vector<std::string>& mutable_argv(Command& cmd) { return cmd.argv_; }
  static const std::optional<std::filesystem::path>& cwd(const Command& cmd) { return cmd.cwd_; }
  static bool inherit_env(const Command& cmd) { return cmd.inherit_env_; }
  static const std::map<std::string, std::optional<std::string>, std::less<>>& env_delta(
      const Command& cmd) {
    return cmd.env_delta_;
  }
  static const SpawnOptions& options(const Command& cmd) { return cmd.opts_; }
};

}  // namespace execbridge::internal
