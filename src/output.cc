#include "execbridge/output.hpp"

#include <utility>

namespace execbridge {

OutputChunk completion_chunk(const ExitStatus& status) {
  OutputChunk chunk;
  chunk.stream = OutputStream::completion;
  chunk.exit_code = status.display_code();
  if (status.success()) {
    chunk.text = std::string(kFinishedMarker);
  } else {
    chunk.text = std::string(kExitedWithErrorMarker) + " (" + to_string(status) + ")";
  }
  return chunk;
}

OutputChunk failure_chunk() {
  OutputChunk chunk;
  chunk.stream = OutputStream::completion;
  chunk.text = std::string(kTerminatedMarker);
  return chunk;
}

void OutputQueue::push(OutputChunk chunk) {
  auto now = internal::default_clock().now();
  std::lock_guard lock(mutex_);
  chunks_.push_back(std::move(chunk));
  last_output_at_ = now;
}

void OutputQueue::push_final(OutputChunk sentinel, const std::function<void()>& publish) {
  auto now = internal::default_clock().now();
  std::lock_guard lock(mutex_);
  publish();
  chunks_.push_back(std::move(sentinel));
  last_output_at_ = now;
}

std::vector<OutputChunk> OutputQueue::drain() {
  std::vector<OutputChunk> out;
  std::lock_guard lock(mutex_);
  out.swap(chunks_);
  return out;
}

void OutputQueue::clear() {
  std::lock_guard lock(mutex_);
  chunks_.clear();
}

std::size_t OutputQueue::size() const {
  std::lock_guard lock(mutex_);
  return chunks_.size();
}

std::optional<internal::Clock::time_point> OutputQueue::last_output_at() const {
  std::lock_guard lock(mutex_);
  return last_output_at_;
}

}  // namespace execbridge
