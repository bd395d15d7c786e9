#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execbridge/result.hpp"
#include "execbridge/status.hpp"

namespace execbridge::internal {

/// Fully resolved launch request; stdin, stdout and stderr are always piped.
struct SpawnSpec {
  std::vector<std::string> argv;
  std::optional<std::filesystem::path> cwd;
  std::vector<std::string> envp;
  bool new_process_group = false;
};

struct Spawned {
  int pid = -1;
  std::optional<int> pgid;
  std::optional<int> stdin_fd;
  std::optional<int> stdout_fd;
  std::optional<int> stderr_fd;
};

/// How the POSIX backend launches an interpreter.
enum class SpawnStrategy : std::uint8_t { fork_exec, posix_spawn };

/// posix_spawn needs SETSIGDEF (SIGPIPE back to default in the child), SETPGROUP for a
/// new group, and a chdir action when a working directory is set.
bool can_use_posix_spawn(const SpawnSpec& spec);
/// posix_spawn when possible; fork/exec otherwise or under EXECBRIDGE_FORCE_FORK.
SpawnStrategy select_spawn_strategy(const SpawnSpec& spec);
std::string_view to_string(SpawnStrategy strategy) noexcept;

/// Writes to a pipe whose reader exited must surface as EPIPE, not kill the host.
void ignore_sigpipe_once();

class Backend {
 public:
  virtual ~Backend() = default;
  virtual Result<Spawned> spawn(const SpawnSpec& spec) = 0;
  /// Blocking reap.
  virtual Result<ExitStatus> wait(Spawned& spawned) = 0;
  /// Non-blocking reap.
  virtual Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) = 0;
  /// Blocks until the child has exited without reaping it. Succeeds if another
  /// caller already reaped it.
  virtual Result<void> wait_exited(Spawned& spawned) = 0;
  virtual Result<void> terminate(Spawned& spawned) = 0;
  virtual Result<void> kill(Spawned& spawned) = 0;
};

class ScopedBackendOverride {
 public:
  explicit ScopedBackendOverride(Backend& backend);
  ~ScopedBackendOverride();
  ScopedBackendOverride(const ScopedBackendOverride&) = delete;
  ScopedBackendOverride& operator=(const ScopedBackendOverride&) = delete;

 private:
  Backend* previous_ = nullptr;
};

Backend& default_backend();

}  // namespace execbridge::internal
