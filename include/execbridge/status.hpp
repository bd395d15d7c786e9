#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace execbridge {

/// @brief Exit status of a finished interpreter process.
class ExitStatus {
 public:
  /// @brief The kind of exit status.
  enum class Kind : std::uint8_t {
    /// @brief Process exited normally with an exit code.
    exited,
    /// @brief Process was terminated by a signal.
    signaled
  };

  /// @brief Construct a normal exit status with an exit code.
  static ExitStatus exited(int code, std::uint32_t native = 0) noexcept;
  /// @brief Construct a signal-terminated status.
  static ExitStatus signaled(int signo, std::uint32_t native = 0) noexcept;

  /// @brief Kind discriminator.
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  /// @brief True if exited with code 0.
  [[nodiscard]] bool success() const noexcept { return kind_ == Kind::exited && value_ == 0; }
  /// @brief Exit code if the process exited normally.
  [[nodiscard]] std::optional<int> code() const noexcept;
  /// @brief Terminating signal if the process was killed by one.
  [[nodiscard]] std::optional<int> signal() const noexcept;
  /// @brief Shell-style code: the exit code, or 128 + signal number.
  [[nodiscard]] int display_code() const noexcept;
  /// @brief Native OS wait status.
  [[nodiscard]] std::uint32_t native() const noexcept { return native_; }

  friend bool operator==(const ExitStatus& lhs, const ExitStatus& rhs) noexcept {
    return lhs.kind_ == rhs.kind_ && lhs.value_ == rhs.value_;
  }

 private:
  Kind kind_{Kind::exited};
  int value_{0};
  std::uint32_t native_{0};
};

/// @brief Short human-readable description, e.g. "exit code 1" or "signal 9".
std::string to_string(const ExitStatus& status);

}  // namespace execbridge
