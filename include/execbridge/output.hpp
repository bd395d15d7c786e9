#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execbridge/internal/clock.hpp"
#include "execbridge/status.hpp"

namespace execbridge {

/// @brief Origin of an output chunk.
enum class OutputStream : std::uint8_t {
  /// @brief Program standard output.
  stdout_stream,
  /// @brief Program standard error.
  stderr_stream,
  /// @brief Synthetic end-of-run marker appended after the program exited.
  completion,
};

/// @brief A unit of decoded text appended to a session's output queue.
struct OutputChunk {
  /// @brief Which stream produced the text.
  OutputStream stream = OutputStream::stdout_stream;
  /// @brief Decoded UTF-8 text.
  std::string text;
  /// @brief Set only on a completion chunk of a run that produced an exit status.
  std::optional<int> exit_code;

  friend bool operator==(const OutputChunk&, const OutputChunk&) = default;
};

/// @brief Sentinel printed after a clean exit.
inline constexpr std::string_view kFinishedMarker = "\n[Program finished successfully]";
/// @brief Sentinel prefix printed after a nonzero exit or a signal death.
inline constexpr std::string_view kExitedWithErrorMarker = "\n[Program exited with error]";
/// @brief Sentinel printed when the run failed inside the engine.
inline constexpr std::string_view kTerminatedMarker = "\n[Program terminated unexpectedly]";

/// @brief Build the completion chunk for a finished process.
OutputChunk completion_chunk(const ExitStatus& status);
/// @brief Build the completion chunk for a run the engine could not follow to the end.
OutputChunk failure_chunk();

/// @brief Thread-safe FIFO of output chunks for one session.
///
/// drain() swaps the whole queue out under the lock, so concurrent drains never split
/// or duplicate a chunk.
class OutputQueue {
 public:
  /// @brief Append a chunk and stamp the time of last output.
  void push(OutputChunk chunk);
  /// @brief Append the completion sentinel, running publish under the same lock.
  ///
  /// A drain that returns the sentinel therefore observes whatever publish recorded.
  void push_final(OutputChunk sentinel, const std::function<void()>& publish);
  /// @brief Remove and return everything queued, in append order.
  std::vector<OutputChunk> drain();
  /// @brief Drop everything queued.
  void clear();
  /// @brief Number of queued chunks.
  [[nodiscard]] std::size_t size() const;
  /// @brief Time of the most recent push, if any.
  [[nodiscard]] std::optional<internal::Clock::time_point> last_output_at() const;

 private:
  mutable std::mutex mutex_;
  std::vector<OutputChunk> chunks_;
  std::optional<internal::Clock::time_point> last_output_at_;
};

}  // namespace execbridge
