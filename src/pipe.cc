#include "execbridge/pipe.hpp"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>

#include "execbridge/internal/fd.hpp"

namespace execbridge {

namespace {

// Polls fd for events together with cancel_fd; false once cancel_fd is readable.
Result<bool> wait_ready(int fd, short events, int cancel_fd) {
  std::array<pollfd, 2> fds{};
  fds[0].fd = fd;
  fds[0].events = events;
  fds[1].fd = cancel_fd;
  fds[1].events = POLLIN;
  while (true) {
    fds[0].revents = 0;
    fds[1].revents = 0;
    if (::poll(fds.data(), fds.size(), -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(internal::errno_error("poll"));
    }
    if (fds[1].revents != 0) {
      return false;
    }
    if ((fds[0].revents & (events | POLLHUP | POLLERR)) != 0) {
      return true;
    }
  }
}

}  // namespace

PipeReader::PipeReader(PipeReader&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

PipeReader::~PipeReader() { close(); }

void PipeReader::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Result<bool> PipeReader::wait_readable(int cancel_fd) const {
  if (fd_ < 0) {
    return fail(errc::read_failed, "wait on closed pipe");
  }
  return wait_ready(fd_, POLLIN, cancel_fd);
}

Result<std::size_t> PipeReader::read_some(void* data, std::size_t n) const {
  if (fd_ < 0) {
    return fail(errc::read_failed, "read on closed pipe");
  }
  while (true) {
    ssize_t rv = ::read(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno == EINTR) {
      continue;
    }
    return std::unexpected(internal::errno_error("read"));
  }
}

PipeWriter::PipeWriter(PipeWriter&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

PipeWriter& PipeWriter::operator=(PipeWriter&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

PipeWriter::~PipeWriter() { close(); }

void PipeWriter::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Result<void> PipeWriter::set_nonblocking() const {
  if (fd_ < 0) {
    return fail(errc::closed_pipe, "stdin already closed");
  }
  return internal::set_nonblocking(fd_);
}

Result<bool> PipeWriter::wait_writable(int cancel_fd) const {
  if (fd_ < 0) {
    return fail(errc::closed_pipe, "stdin already closed");
  }
  return wait_ready(fd_, POLLOUT, cancel_fd);
}

Result<std::size_t> PipeWriter::write_some(const void* data, std::size_t n) const {
  if (fd_ < 0) {
    return fail(errc::closed_pipe, "stdin already closed");
  }
  while (true) {
    ssize_t rv = ::write(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return std::size_t{0};
    }
    if (errno == EPIPE) {
      return fail(errc::closed_pipe, "program no longer reads stdin");
    }
    return std::unexpected(internal::errno_error("write"));
  }
}

}  // namespace execbridge
