#include "execbridge/dispatcher.hpp"

#include <utility>

#include "execbridge/internal/clock.hpp"
#include "execbridge/internal/wait_policy.hpp"
#include "execbridge/log.hpp"

namespace execbridge {

namespace {

constexpr auto kPollStep = std::chrono::milliseconds(5);

}  // namespace

Dispatcher::Dispatcher(SessionRegistry& registry, Options options)
    : registry_(registry), options_(std::move(options)) {}

Result<ExecuteResult> Dispatcher::dispatch(std::string_view source) {
  auto started = Session::start(source, options_.interpreter, options_.session);
  if (!started) {
    return std::unexpected(started.error());
  }
  auto session = std::move(*started);

  bool finished = internal::wait_until(internal::default_clock(), options_.grace_window,
                                       kPollStep, [&] { return session->finished(); });
  if (finished) {
    auto result = collect_direct(*session);
    session->close();
    return result;
  }

  SessionStarted handle{session->id()};
  logger()->info("session {}: pid {} still running after {} ms, now interactive", handle.id,
                 session->pid(), options_.grace_window.count());
  registry_.insert(std::move(session));
  return handle;
}

Result<ExecuteResult> Dispatcher::collect_direct(Session& session) {
  auto state = session.state();
  if (state.kind == SessionStateKind::failed) {
    if (state.error) {
      return std::unexpected(*state.error);
    }
    return fail(errc::wait_failed, "run ended without an exit status");
  }

  DirectResult direct;
  for (auto& chunk : session.drain_all()) {
    switch (chunk.stream) {
      case OutputStream::stdout_stream:
        direct.stdout_data.append(chunk.text);
        break;
      case OutputStream::stderr_stream:
        direct.stderr_data.append(chunk.text);
        break;
      case OutputStream::completion:
        break;
    }
  }
  if (state.exit) {
    direct.status = *state.exit;
    direct.exit_code = state.exit->display_code();
  }
  logger()->debug("session {}: direct result, {}", session.id(), to_string(direct.status));
  return direct;
}

}  // namespace execbridge
