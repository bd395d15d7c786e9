#include "execbridge/session.hpp"

#include <algorithm>
#include <utility>

#include "execbridge/internal/session_id.hpp"
#include "execbridge/log.hpp"

namespace execbridge {

std::string_view to_string(SessionStateKind kind) noexcept {
  switch (kind) {
    case SessionStateKind::running:
      return "running";
    case SessionStateKind::awaiting_input:
      return "awaiting_input";
    case SessionStateKind::completed:
      return "completed";
    case SessionStateKind::failed:
      return "failed";
    case SessionStateKind::closed:
      return "closed";
  }
  return "unknown";
}

Session::Session(std::string id, SessionOptions options)
    : id_(std::move(id)), options_(options), created_at_(internal::default_clock().now()) {
  last_activity_ = created_at_;
  last_input_ = created_at_;
}

Session::~Session() { close(); }

Result<std::shared_ptr<Session>> Session::start(std::string_view source,
                                                const Interpreter& interpreter,
                                                SessionOptions options) {
  // Sessions are pinned in memory: the capture threads hold references into them.
  std::shared_ptr<Session> session(new Session(internal::new_session_id(), options));

  const std::filesystem::path* script_path = nullptr;
  if (interpreter.delivery == ScriptDelivery::temp_file) {
    auto script = ScriptFile::create(source, session->id_, interpreter.script_suffix);
    if (!script) {
      return std::unexpected(script.error());
    }
    session->script_.emplace(std::move(*script));
    script_path = &session->script_->path();
  }

  auto process = interpreter.command_for(source, script_path).spawn();
  if (!process) {
    logger()->warn("cannot start {}: {}", interpreter.program, process.error().context);
    return std::unexpected(process.error());
  }
  session->process_ = std::move(*process);

  if (auto stdin_pipe = session->process_.take_stdin()) {
    session->input_ = std::make_unique<InputPump>(std::move(*stdin_pipe));
    if (auto started = session->input_->start(); !started) {
      return std::unexpected(started.error());
    }
  }

  session->capture_ = std::make_unique<OutputCapture>(session->process_, session->queue_,
                                                      options.exit_drain_timeout);
  if (auto started = session->capture_->start(); !started) {
    return std::unexpected(started.error());
  }
  logger()->debug("session {}: started {} (pid {})", session->id_, interpreter.program,
                  session->pid());
  return session;
}

void Session::touch() {
  auto now = internal::default_clock().now();
  std::lock_guard lock(activity_mutex_);
  last_activity_ = now;
}

internal::Clock::time_point Session::last_activity() const {
  std::lock_guard lock(activity_mutex_);
  return last_activity_;
}

std::optional<std::vector<OutputChunk>> Session::poll() {
  touch();
  std::lock_guard lock(poll_mutex_);
  if (sentinel_delivered_) {
    return std::nullopt;
  }
  auto chunks = queue_.drain();
  sentinel_delivered_ = std::any_of(chunks.begin(), chunks.end(), [](const OutputChunk& chunk) {
    return chunk.stream == OutputStream::completion;
  });
  return chunks;
}

std::vector<OutputChunk> Session::drain_all() {
  std::lock_guard lock(poll_mutex_);
  return queue_.drain();
}

Result<void> Session::send_input(std::string_view text) {
  if (closed_.load()) {
    return fail(errc::closed_pipe, "session " + id_ + " is closed");
  }
  auto status = process_.try_exit_status();
  if (!status) {
    return std::unexpected(status.error());
  }
  if (status->has_value()) {
    return fail(errc::closed_pipe, "program already exited with " + to_string(**status));
  }
  if (!input_) {
    return fail(errc::closed_pipe, "session " + id_ + " has no stdin");
  }
  auto now = internal::default_clock().now();
  {
    std::lock_guard lock(activity_mutex_);
    last_activity_ = now;
    last_input_ = now;
  }
  std::string line(text);
  line.push_back('\n');
  return input_->enqueue(line);
}

SessionState Session::state() const {
  SessionState state;
  if (closed_.load()) {
    state.kind = SessionStateKind::closed;
    return state;
  }
  if (capture_) {
    state.decode_replacements = capture_->replacements();
  }
  if (capture_ && capture_->finished()) {
    auto outcome = capture_->outcome();
    if (outcome && *outcome) {
      state.kind = SessionStateKind::completed;
      state.exit = **outcome;
    } else {
      state.kind = SessionStateKind::failed;
      if (outcome) {
        state.error = outcome->error();
      }
    }
    return state;
  }

  auto quiet_since = created_at_;
  if (auto last_output = queue_.last_output_at()) {
    quiet_since = std::max(quiet_since, *last_output);
  }
  {
    std::lock_guard lock(activity_mutex_);
    quiet_since = std::max(quiet_since, last_input_);
  }
  state.kind = internal::elapsed_since(internal::default_clock(), quiet_since) >=
                       options_.awaiting_input_after
                   ? SessionStateKind::awaiting_input
                   : SessionStateKind::running;
  return state;
}

void Session::close() noexcept {
  std::lock_guard lock(close_mutex_);
  if (closed_.exchange(true)) {
    return;
  }
  if (capture_) {
    capture_->stop();
  } else if (auto killed = process_.kill(); !killed) {
    logger()->warn("session {}: {}", id_, killed.error().context);
  }
  if (input_) {
    input_->stop();
  }
  queue_.clear();
  if (script_) {
    script_->remove();
  }
  logger()->debug("session {}: closed", id_);
}

}  // namespace execbridge
