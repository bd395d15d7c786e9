#include "execbridge/status.hpp"

namespace execbridge {

namespace {

constexpr int kSignalCodeBase = 128;

}  // namespace

ExitStatus ExitStatus::exited(
    int code, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::exited;
  status.value_ = code;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::signaled(
    int signo, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::signaled;
  status.value_ = signo;
  status.native_ = native;
  return status;
}

std::optional<int> ExitStatus::code() const noexcept {
  if (kind_ != Kind::exited) {
    return std::nullopt;
  }
  return value_;
}

std::optional<int> ExitStatus::signal() const noexcept {
  if (kind_ != Kind::signaled) {
    return std::nullopt;
  }
  return value_;
}

int ExitStatus::display_code() const noexcept {
  return kind_ == Kind::exited ? value_ : kSignalCodeBase + value_;
}

std::string to_string(const ExitStatus& status) {
  if (auto signo = status.signal()) {
    return "signal " + std::to_string(*signo);
  }
  return "exit code " + std::to_string(status.display_code());
}

}  // namespace execbridge
