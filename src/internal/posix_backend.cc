#include <dirent.h>
#include <fcntl.h>
#include <spawn.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "execbridge/internal/backend.hpp"
#include "execbridge/internal/fd.hpp"
#include "execbridge/log.hpp"

namespace execbridge::internal {

namespace {

constexpr long kFallbackMaxFd = 256;
constexpr int kExecFailureExitCode = 127;

std::unexpected<Error> spawn_error(int error, std::string_view context, std::string_view program) {
  return fail(errc::spawn_failed, std::string(context) + "(" + std::string(program) +
                                      "): " + std::system_category().message(error));
}

std::vector<int> list_open_fds() {
  std::vector<int> fds;
#if EXECBRIDGE_PLATFORM_LINUX
  if (DIR* dir = ::opendir("/proc/self/fd")) {
    int dir_fd = ::dirfd(dir);
    while (dirent* entry = ::readdir(dir)) {
      if (entry->d_name[0] == '.') {
        continue;
      }
      char* end = nullptr;
      long value = std::strtol(entry->d_name, &end, 10);
      if (end == nullptr || *end != '\0') {
        continue;
      }
      int fd = static_cast<int>(value);
      if (fd != dir_fd) {
        fds.push_back(fd);
      }
    }
    ::closedir(dir);
    std::ranges::sort(fds);
    return fds;
  }
#endif
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = kFallbackMaxFd;
  }
  for (int fd = 0; fd < max_fd; ++fd) {
    errno = 0;
    if (::fcntl(fd, F_GETFD) != -1 || errno != EBADF) {
      fds.push_back(fd);
    }
  }
  return fds;
}

long max_open_fd_limit() {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  return max_fd < 0 ? kFallbackMaxFd : max_fd;
}

// Runs in the forked child: only async-signal-safe calls.
void close_inherited_fds_after_fork(int keep_fd) {
#if EXECBRIDGE_PLATFORM_LINUX && defined(SYS_close_range)
  // Two ranges around keep_fd; a huge RLIMIT_NOFILE would make the loop below crawl.
  if (keep_fd > STDERR_FILENO) {
    const auto first = static_cast<unsigned int>(STDERR_FILENO + 1);
    const auto keep = static_cast<unsigned int>(keep_fd);
    bool closed = true;
    if (keep > first) {
      closed = ::syscall(SYS_close_range, first, keep - 1, 0U) == 0;
    }
    if (closed && ::syscall(SYS_close_range, keep + 1, ~0U, 0U) == 0) {
      return;
    }
  }
#endif
  long max_fd = max_open_fd_limit();
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd != keep_fd) {
      ::close(fd);
    }
  }
}

std::optional<std::string> find_env_value(const std::vector<std::string>& envp,
                                          std::string_view key) {
  for (const auto& entry : envp) {
    if (entry.size() > key.size() && entry.compare(0, key.size(), key) == 0 &&
        entry[key.size()] == '=') {
      return entry.substr(key.size() + 1);
    }
  }
  return std::nullopt;
}

// Resolve argv[0] before fork so the child only needs async-signal-safe syscalls.
std::string resolve_exec_path(const std::string& argv0, const std::vector<std::string>& envp,
                              const std::optional<std::filesystem::path>& cwd) {
  if (argv0.find('/') != std::string::npos) {
    return argv0;
  }
  std::string path_value = find_env_value(envp, "PATH").value_or("/usr/bin:/bin");
  std::size_t start = 0;
  while (start <= path_value.size()) {
    std::size_t end = path_value.find(':', start);
    if (end == std::string::npos) {
      end = path_value.size();
    }
    std::filesystem::path dir = end == start
                                    ? std::filesystem::path(".")
                                    : std::filesystem::path(path_value.substr(start, end - start));
    if (cwd && dir.is_relative()) {
      dir = *cwd / dir;
    }
    std::filesystem::path candidate = dir / argv0;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    start = end + 1;
  }
  return argv0;
}

ExitStatus to_exit_status(int status) {
  if (WIFSIGNALED(status)) {
    return ExitStatus::signaled(WTERMSIG(status), static_cast<std::uint32_t>(status));
  }
  return ExitStatus::exited(WIFEXITED(status) ? WEXITSTATUS(status) : status,
                            static_cast<std::uint32_t>(status));
}

Result<void> send_signal(const Spawned& spawned, int signo) {
  if (spawned.pgid && ::kill(-*spawned.pgid, signo) == 0) {
    return {};
  }
  if (::kill(spawned.pid, signo) == 0) {
    return {};
  }
  // ESRCH: nothing left to signal; the caller reaps next.
  if (errno == ESRCH) {
    return {};
  }
  return std::unexpected(errno_error("kill"));
}

/// Parent and child ends of the three stdio pipes.
struct StdioPipes {
  unique_fd child_stdin;
  unique_fd parent_stdin;
  unique_fd parent_stdout;
  unique_fd child_stdout;
  unique_fd parent_stderr;
  unique_fd child_stderr;

  Result<void> open() {
    auto in = create_pipe();
    if (!in) {
      return std::unexpected(in.error());
    }
    auto out = create_pipe();
    if (!out) {
      return std::unexpected(out.error());
    }
    auto err = create_pipe();
    if (!err) {
      return std::unexpected(err.error());
    }
    child_stdin = std::move(in->first);
    parent_stdin = std::move(in->second);
    parent_stdout = std::move(out->first);
    child_stdout = std::move(out->second);
    parent_stderr = std::move(err->first);
    child_stderr = std::move(err->second);
    return {};
  }

  Spawned hand_over(int pid, bool new_process_group) {
    Spawned spawned;
    spawned.pid = pid;
    if (new_process_group) {
      spawned.pgid = pid;
    }
    spawned.stdin_fd = parent_stdin.release();
    spawned.stdout_fd = parent_stdout.release();
    spawned.stderr_fd = parent_stderr.release();
    return spawned;
  }
};

std::vector<char*> to_c_array(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

struct SpawnActionState {
  posix_spawn_file_actions_t actions{};
  posix_spawnattr_t attr{};
  bool actions_ready = false;
  bool attr_ready = false;

  ~SpawnActionState() {
    if (actions_ready) {
      posix_spawn_file_actions_destroy(&actions);
    }
    if (attr_ready) {
      posix_spawnattr_destroy(&attr);
    }
  }
};

Result<Spawned> spawn_posix_spawnp(const SpawnSpec& spec, StdioPipes& pipes) {
  const std::string& program = spec.argv.front();
  SpawnActionState state;
  if (int rc = posix_spawn_file_actions_init(&state.actions); rc != 0) {
    return spawn_error(rc, "posix_spawn_file_actions_init", program);
  }
  state.actions_ready = true;
  if (int rc = posix_spawnattr_init(&state.attr); rc != 0) {
    return spawn_error(rc, "posix_spawnattr_init", program);
  }
  state.attr_ready = true;

  short flags = 0;
#ifdef POSIX_SPAWN_SETSIGDEF
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  if (int rc = posix_spawnattr_setsigdefault(&state.attr, &defaults); rc != 0) {
    return spawn_error(rc, "posix_spawnattr_setsigdefault", program);
  }
  flags = static_cast<short>(flags | POSIX_SPAWN_SETSIGDEF);
#endif
  if (spec.new_process_group) {
#ifdef POSIX_SPAWN_SETPGROUP
    if (int rc = posix_spawnattr_setpgroup(&state.attr, 0); rc != 0) {
      return spawn_error(rc, "posix_spawnattr_setpgroup", program);
    }
    flags = static_cast<short>(flags | POSIX_SPAWN_SETPGROUP);
#endif
  }
  if (int rc = posix_spawnattr_setflags(&state.attr, flags); rc != 0) {
    return spawn_error(rc, "posix_spawnattr_setflags", program);
  }

#if EXECBRIDGE_PLATFORM_MACOS
  if (spec.cwd) {
    if (int rc = posix_spawn_file_actions_addchdir_np(&state.actions, spec.cwd->c_str());
        rc != 0) {
      return spawn_error(rc, "posix_spawn_file_actions_addchdir_np", program);
    }
  }
#endif

  std::unordered_set<int> handled{pipes.child_stdin.get(), pipes.child_stdout.get(),
                                  pipes.child_stderr.get()};
  const std::array<std::pair<int, int>, 3> dups{{
      {pipes.child_stdin.get(), STDIN_FILENO},
      {pipes.child_stdout.get(), STDOUT_FILENO},
      {pipes.child_stderr.get(), STDERR_FILENO},
  }};
  for (const auto& [from, to] : dups) {
    if (int rc = posix_spawn_file_actions_adddup2(&state.actions, from, to); rc != 0) {
      return spawn_error(rc, "posix_spawn_file_actions_adddup2", program);
    }
  }
  // Descriptors the host opened without O_CLOEXEC must not leak into the program.
  for (int fd : list_open_fds()) {
    if (fd <= STDERR_FILENO || handled.contains(fd)) {
      continue;
    }
    if (int rc = posix_spawn_file_actions_addclose(&state.actions, fd); rc != 0) {
      return spawn_error(rc, "posix_spawn_file_actions_addclose", program);
    }
  }

  std::vector<std::string> argv_copy = spec.argv;
  std::vector<std::string> envp_copy = spec.envp;
  auto argv_c = to_c_array(argv_copy);
  auto envp_c = to_c_array(envp_copy);

  pid_t pid = -1;
  int spawn_rc =
      ::posix_spawnp(&pid, argv_c[0], &state.actions, &state.attr, argv_c.data(), envp_c.data());
  if (spawn_rc != 0) {
    return spawn_error(spawn_rc, "posix_spawnp", program);
  }
  return pipes.hand_over(pid, spec.new_process_group);
}

Result<Spawned> spawn_fork_exec(const SpawnSpec& spec, StdioPipes& pipes) {
  const std::string& program = spec.argv.front();

  // Error pipe carries the child's errno if setup or exec fails.
  auto error_pipe = create_pipe();
  if (!error_pipe) {
    return std::unexpected(error_pipe.error());
  }
  auto [error_read, error_write] = std::move(*error_pipe);

  std::vector<std::string> argv_copy = spec.argv;
  std::vector<std::string> envp_copy = spec.envp;
  auto argv_c = to_c_array(argv_copy);
  auto envp_c = to_c_array(envp_copy);
  std::string exec_path = resolve_exec_path(program, envp_copy, spec.cwd);

  const int child_stdin = pipes.child_stdin.get();
  const int child_stdout = pipes.child_stdout.get();
  const int child_stderr = pipes.child_stderr.get();
  const int error_fd = error_write.get();

  pid_t pid = ::fork();
  if (pid == -1) {
    return spawn_error(errno, "fork", program);
  }

  if (pid == 0) {
    auto fail_child = [error_fd]() {
      int err = errno;
      (void)::write(error_fd, &err, sizeof(err));
      _exit(kExecFailureExitCode);
    };
    if (spec.new_process_group && ::setpgid(0, 0) == -1) {
      fail_child();
    }
    if (spec.cwd && ::chdir(spec.cwd->c_str()) == -1) {
      fail_child();
    }
    if (::dup2(child_stdin, STDIN_FILENO) == -1 || ::dup2(child_stdout, STDOUT_FILENO) == -1 ||
        ::dup2(child_stderr, STDERR_FILENO) == -1) {
      fail_child();
    }
    ::signal(SIGPIPE, SIG_DFL);
    close_inherited_fds_after_fork(error_fd);
    ::execve(exec_path.c_str(), argv_c.data(), envp_c.data());
    fail_child();
  }

  error_write.reset(-1);
  int child_errno = 0;
  ssize_t read_result = -1;
  do {
    read_result = ::read(error_read.get(), &child_errno, sizeof(child_errno));
  } while (read_result == -1 && errno == EINTR);

  if (read_result == -1) {
    return spawn_error(errno, "read(error pipe)", program);
  }
  if (read_result > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    return spawn_error(child_errno, "exec", program);
  }
  return pipes.hand_over(pid, spec.new_process_group);
}

class PosixBackend final : public Backend {
 public:
  Result<Spawned> spawn(const SpawnSpec& spec) override {
    if (spec.argv.empty() || spec.argv.front().empty()) {
      return fail(errc::empty_argv, "argv");
    }
    ignore_sigpipe_once();

    StdioPipes pipes;
    if (auto opened = pipes.open(); !opened) {
      return fail(errc::pipe_failed, opened.error().context + ": " + opened.error().code.message());
    }
    // Child ends close when `pipes` goes out of scope, after the child has its copies.
    auto strategy = select_spawn_strategy(spec);
    logger()->trace("spawning {} via {}", spec.argv.front(), to_string(strategy));
    if (strategy == SpawnStrategy::posix_spawn) {
      return spawn_posix_spawnp(spec, pipes);
    }
    return spawn_fork_exec(spec, pipes);
  }

  Result<ExitStatus> wait(Spawned& spawned) override {
    int status = 0;
    while (true) {
      pid_t rv = ::waitpid(spawned.pid, &status, 0);
      if (rv == spawned.pid) {
        return to_exit_status(status);
      }
      if (rv == -1 && errno == EINTR) {
        continue;
      }
      return fail(errc::wait_failed, "waitpid: " + std::system_category().message(errno));
    }
  }

  Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) override {
    int status = 0;
    while (true) {
      pid_t rv = ::waitpid(spawned.pid, &status, WNOHANG);
      if (rv == spawned.pid) {
        return std::optional<ExitStatus>(to_exit_status(status));
      }
      if (rv == 0) {
        return std::optional<ExitStatus>();
      }
      if (errno == EINTR) {
        continue;
      }
      return fail(errc::wait_failed, "waitpid: " + std::system_category().message(errno));
    }
  }

  Result<void> wait_exited(Spawned& spawned) override {
    while (true) {
      siginfo_t info{};
      if (::waitid(P_PID, static_cast<id_t>(spawned.pid), &info, WEXITED | WNOWAIT) == 0) {
        return {};
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno == ECHILD) {
        return {};
      }
      return fail(errc::wait_failed, "waitid: " + std::system_category().message(errno));
    }
  }

  Result<void> terminate(Spawned& spawned) override { return send_signal(spawned, SIGTERM); }

  Result<void> kill(Spawned& spawned) override { return send_signal(spawned, SIGKILL); }
};

std::atomic<Backend*> g_backend_override{nullptr};

}  // namespace

void ignore_sigpipe_once() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    std::signal(SIGPIPE, SIG_IGN);
    logger()->debug("SIGPIPE ignored process-wide for child stdin writes");
  });
}

bool can_use_posix_spawn(const SpawnSpec& spec) {
#if EXECBRIDGE_PLATFORM_MACOS
  constexpr bool kHasSpawnChdir = true;
#else
  constexpr bool kHasSpawnChdir = false;
#endif
#ifdef POSIX_SPAWN_SETPGROUP
  constexpr bool kHasSpawnPgroup = true;
#else
  constexpr bool kHasSpawnPgroup = false;
#endif
#ifdef POSIX_SPAWN_SETSIGDEF
  constexpr bool kHasSpawnSigdef = true;
#else
  constexpr bool kHasSpawnSigdef = false;
#endif
  if (spec.cwd && !kHasSpawnChdir) {
    return false;
  }
  if (spec.new_process_group && !kHasSpawnPgroup) {
    return false;
  }
  return kHasSpawnSigdef;
}

SpawnStrategy select_spawn_strategy(const SpawnSpec& spec) {
#if defined(EXECBRIDGE_FORCE_FORK)
  (void)spec;
  return SpawnStrategy::fork_exec;
#else
  return can_use_posix_spawn(spec) ? SpawnStrategy::posix_spawn : SpawnStrategy::fork_exec;
#endif
}

std::string_view to_string(SpawnStrategy strategy) noexcept {
  return strategy == SpawnStrategy::posix_spawn ? "posix_spawn" : "fork/exec";
}

ScopedBackendOverride::ScopedBackendOverride(Backend& backend)
    : previous_(g_backend_override.exchange(&backend)) {}

ScopedBackendOverride::~ScopedBackendOverride() { g_backend_override.store(previous_); }

Backend& default_backend() {
  if (auto* override_backend = g_backend_override.load()) {
    return *override_backend;
  }
  static PosixBackend backend;
  return backend;
}

}  // namespace execbridge::internal
