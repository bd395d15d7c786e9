#include "execbridge/process.hpp"

#include <mutex>

#include "execbridge/internal/access.hpp"
#include "execbridge/internal/backend.hpp"
#include "execbridge/internal/clock.hpp"
#include "execbridge/internal/wait_policy.hpp"
#include "execbridge/log.hpp"

namespace execbridge {

struct ProcessHandle::Impl {
  explicit Impl(internal::Spawned spawned) : spawned_(spawned) {
    if (spawned_.stdin_fd) {
      stdin_pipe.emplace(*spawned_.stdin_fd);
    }
    if (spawned_.stdout_fd) {
      stdout_pipe.emplace(*spawned_.stdout_fd);
    }
    if (spawned_.stderr_fd) {
      stderr_pipe.emplace(*spawned_.stderr_fd);
    }
  }

  // Call with mutex held.
  Result<std::optional<ExitStatus>> poll_locked() {
    if (reaped) {
      return reaped;
    }
    auto status = internal::default_backend().try_wait(spawned_);
    if (status && status->has_value()) {
      reaped = *status;
    }
    return status;
  }

  internal::Spawned spawned_;
  std::chrono::milliseconds kill_grace{kDefaultKillGrace};

  // Guards reaping and signalling.
  mutable std::mutex mutex;
  std::optional<ExitStatus> reaped;

  std::optional<PipeWriter> stdin_pipe;

  std::optional<PipeReader> stdout_pipe;
  std::optional<PipeReader> stderr_pipe;
};

ProcessHandle::ProcessHandle() = default;
ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept = default;
ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept = default;

ProcessHandle::~ProcessHandle() {
  if (!impl_) {
    return;
  }
  if (auto killed = kill(); !killed) {
    logger()->warn("pid {}: kill on destruction failed: {} ({})", impl_->spawned_.pid,
                   killed.error().context, killed.error().code.message());
  }
}

namespace internal {

ProcessHandle ProcessAccess::from_spawned(Spawned spawned) {
  ProcessHandle process;
  ProcessAccess::impl(process) = std::make_unique<ProcessHandle::Impl>(spawned);
  return process;
}

}  // namespace internal

int ProcessHandle::id() const noexcept {
  if (!impl_) {
    return -1;
  }
  return impl_->spawned_.pid;
}

std::optional<PipeWriter> ProcessHandle::take_stdin() noexcept {
  if (!impl_) {
    return std::nullopt;
  }
  auto pipe = std::move(impl_->stdin_pipe);
  impl_->stdin_pipe.reset();
  return pipe;
}

std::optional<PipeReader> ProcessHandle::take_stdout() noexcept {
  if (!impl_) {
    return std::nullopt;
  }
  auto pipe = std::move(impl_->stdout_pipe);
  impl_->stdout_pipe.reset();
  return pipe;
}

std::optional<PipeReader> ProcessHandle::take_stderr() noexcept {
  if (!impl_) {
    return std::nullopt;
  }
  auto pipe = std::move(impl_->stderr_pipe);
  impl_->stderr_pipe.reset();
  return pipe;
}

Result<std::optional<ExitStatus>> ProcessHandle::try_exit_status() {
  if (!impl_) {
    return fail(errc::wait_failed, "try_exit_status");
  }
  std::lock_guard lock(impl_->mutex);
  return impl_->poll_locked();
}

Result<ExitStatus> ProcessHandle::wait() {
  if (!impl_) {
    return fail(errc::wait_failed, "wait");
  }
  {
    std::lock_guard lock(impl_->mutex);
    if (impl_->reaped) {
      return *impl_->reaped;
    }
  }
  // Block without the lock so kill() and try_exit_status() stay responsive.
  auto exited = internal::default_backend().wait_exited(impl_->spawned_);
  std::lock_guard lock(impl_->mutex);
  if (!exited) {
    // ECHILD when kill() reaped the process while we were blocked.
    if (impl_->reaped) {
      return *impl_->reaped;
    }
    return std::unexpected(exited.error());
  }
  if (impl_->reaped) {
    return *impl_->reaped;
  }
  auto status = internal::default_backend().wait(impl_->spawned_);
  if (status) {
    impl_->reaped = *status;
  }
  return status;
}

Result<void> ProcessHandle::kill() {
  if (!impl_) {
    return {};
  }
  std::lock_guard lock(impl_->mutex);
  if (impl_->reaped) {
    return {};
  }
  auto& backend = internal::default_backend();
  auto& spawned = impl_->spawned_;
  internal::WaitOps ops;
  ops.try_wait = [&]() { return backend.try_wait(spawned); };
  ops.wait_blocking = [&]() { return backend.wait(spawned); };
  ops.terminate = [&]() { return backend.terminate(spawned); };
  ops.kill = [&]() { return backend.kill(spawned); };
  auto status = internal::terminate_and_reap(ops, internal::default_clock(), impl_->kill_grace);
  if (!status) {
    return fail(errc::kill_failed, "pid " + std::to_string(spawned.pid) + ": " +
                                       status.error().context);
  }
  impl_->reaped = *status;
  logger()->debug("pid {}: killed ({})", spawned.pid, to_string(*status));
  return {};
}

std::optional<ExitStatus> ProcessHandle::exit_status() const {
  if (!impl_) {
    return std::nullopt;
  }
  std::lock_guard lock(impl_->mutex);
  return impl_->reaped;
}

void ProcessHandle::set_kill_grace(std::chrono::milliseconds grace) noexcept {
  if (impl_) {
    std::lock_guard lock(impl_->mutex);
    impl_->kill_grace = grace;
  }
}

}  // namespace execbridge
