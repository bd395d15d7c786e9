#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include "execbridge/platform.hpp"

namespace execbridge {

/// @brief Error codes for execbridge operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Caller-facing outcomes
  /// @brief Session id is unknown, expired, or already closed.
  session_not_found,
  /// @brief Input was sent after the program stopped reading stdin.
  closed_pipe,
  /// @brief The interpreter could not be started.
  spawn_failed,
  /// @brief The program source could not be staged for the interpreter.
  script_failed,
  /// @brief Engine options are malformed.
  invalid_config,

  // OS/syscall failures, fatal to a single session
  /// @brief Pipe creation failed.
  pipe_failed,
  /// @brief Read operation failed.
  read_failed,
  /// @brief Write operation failed.
  write_failed,
  /// @brief Wait operation failed.
  wait_failed,
  /// @brief Termination/kill operation failed.
  kill_failed,
  /// @brief Command has no argv entries.
  empty_argv,
};

/// @brief Error payload returned by execbridge APIs.
struct Error {
  /// @brief Error code, in the execbridge or system category.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
};

/// @brief execbridge error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the execbridge category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Result type used by execbridge APIs.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Exception thrown by *_or_throw helpers for execbridge-category errors.
class bridge_error : public std::runtime_error {
 public:
  explicit bridge_error(const Error& error);

  /// @brief Error code that caused the exception.
  [[nodiscard]] const std::error_code& code() const noexcept { return code_; }

 private:
  std::error_code code_;
};

/// @brief Build an unexpected Error from an execbridge code and context.
inline std::unexpected<Error> fail(errc value, std::string context) {
  return std::unexpected(Error{make_error_code(value), std::move(context)});
}

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace execbridge

namespace std {

/// @brief Enable implicit conversion from execbridge::errc to std::error_code.
template <>
struct is_error_code_enum<execbridge::errc> : true_type {};

}  // namespace std
