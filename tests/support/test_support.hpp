#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "execbridge/internal/clock.hpp"
#include "execbridge/options.hpp"
#include "execbridge/output.hpp"
#include "execbridge/pipe.hpp"

namespace execbridge::test {

/// Manually advanced clock; sleep_for advances it instead of sleeping.
class FakeClock final : public internal::Clock {
 public:
  time_point now() override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void sleep_for(std::chrono::milliseconds duration) override {
    std::lock_guard lock(mutex_);
    sleep_calls.push_back(duration);
    now_ += duration;
  }

  void advance(std::chrono::milliseconds duration) {
    std::lock_guard lock(mutex_);
    now_ += duration;
  }

  std::chrono::milliseconds elapsed() {
    std::lock_guard lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(now_.time_since_epoch());
  }

  std::vector<std::chrono::milliseconds> sleep_calls;

 private:
  std::mutex mutex_;
  time_point now_{};
};

/// Engine options running programs under /bin/sh, sweeper off unless a test enables it.
inline EngineOptions shell_options() {
  EngineOptions options;
  options.interpreter = Interpreter::posix_shell();
  options.grace_window = std::chrono::milliseconds(1500);
  options.start_sweeper = false;
  return options;
}

/// Poll fn every 10 ms of real time until it returns true or timeout passes.
inline bool eventually(const std::function<bool()>& fn,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (fn()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return fn();
}

/// Concatenated text of the chunks from one stream.
inline std::string text_of(const std::vector<OutputChunk>& chunks, OutputStream stream) {
  std::string out;
  for (const auto& chunk : chunks) {
    if (chunk.stream == stream) {
      out.append(chunk.text);
    }
  }
  return out;
}

/// Everything left on a blocking read end, up to EOF; empty on a read error.
inline std::string read_to_end(const PipeReader& reader) {
  std::string out;
  std::array<char, 4096> buffer{};
  while (true) {
    auto count = reader.read_some(buffer.data(), buffer.size());
    if (!count || *count == 0) {
      return out;
    }
    out.append(buffer.data(), *count);
  }
}

}  // namespace execbridge::test
