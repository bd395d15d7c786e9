#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include "execbridge/platform.hpp"
#include "execbridge/result.hpp"

namespace execbridge::internal {

class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(-1); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

inline Error errno_error(const char* context) {
  return Error{std::error_code(errno, std::system_category()), context};
}

inline Result<void> set_cloexec(int fd) {
  int flags = ::fcntl(fd, F_GETFD);
  if (flags == -1) {
    return std::unexpected(errno_error("fcntl(F_GETFD)"));
  }
  if (::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    return std::unexpected(errno_error("fcntl(F_SETFD)"));
  }
  return {};
}

inline Result<void> set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1) {
    return std::unexpected(errno_error("fcntl(F_GETFL)"));
  }
  if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return std::unexpected(errno_error("fcntl(F_SETFL)"));
  }
  return {};
}

/// Both ends are close-on-exec; spawn actions dup them onto the child's stdio.
inline Result<std::pair<unique_fd, unique_fd>> create_pipe() {
  std::array<int, 2> fds{};
#if EXECBRIDGE_PLATFORM_LINUX
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(errno_error("pipe2"));
  }
  return std::make_pair(unique_fd(fds[0]), unique_fd(fds[1]));
#else
  if (::pipe(fds.data()) == -1) {
    return std::unexpected(errno_error("pipe"));
  }
  unique_fd read_end(fds[0]);
  unique_fd write_end(fds[1]);
  if (auto rc = set_cloexec(read_end.get()); !rc) {
    return std::unexpected(rc.error());
  }
  if (auto rc = set_cloexec(write_end.get()); !rc) {
    return std::unexpected(rc.error());
  }
  return std::make_pair(std::move(read_end), std::move(write_end));
#endif
}

}  // namespace execbridge::internal
