#include "execbridge/result.hpp"

namespace execbridge {

namespace {

class execbridge_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "execbridge"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::session_not_found:
        return "session not found";
      case errc::closed_pipe:
        return "closed pipe";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::script_failed:
        return "script staging failed";
      case errc::invalid_config:
        return "invalid configuration";
      case errc::pipe_failed:
        return "pipe failed";
      case errc::read_failed:
        return "read failed";
      case errc::write_failed:
        return "write failed";
      case errc::wait_failed:
        return "wait failed";
      case errc::kill_failed:
        return "kill failed";
      case errc::empty_argv:
        return "empty argv";
    }
    return "unknown error";
  }
};

std::string describe(const Error& error) {
  if (error.context.empty()) {
    return error.code.message();
  }
  return error.context + ": " + error.code.message();
}

}  // namespace

const std::error_category& error_category() noexcept {
  static execbridge_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

bridge_error::bridge_error(const Error& error) : std::runtime_error(describe(error)), code_(error.code) {}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  throw bridge_error(error);
}

}  // namespace internal

}  // namespace execbridge
