#include "execbridge/engine.hpp"

#include <utility>

#include "execbridge/log.hpp"

namespace execbridge {

namespace {

Dispatcher::Options dispatcher_options(const EngineOptions& options) {
  Dispatcher::Options out;
  out.interpreter = options.interpreter;
  out.grace_window = options.grace_window;
  out.session.exit_drain_timeout = options.exit_drain_timeout;
  out.session.awaiting_input_after = options.awaiting_input_after;
  return out;
}

}  // namespace

Engine::Engine(EngineOptions options)
    : options_(std::move(options)),
      dispatcher_(registry_, dispatcher_options(options_)),
      sweeper_(registry_, options_.idle_timeout, options_.sweep_interval) {}

Engine::~Engine() { shutdown(); }

Result<std::unique_ptr<Engine>> Engine::create(EngineOptions options) {
  if (auto valid = options.validate(); !valid) {
    return std::unexpected(valid.error());
  }
  set_log_level(options.log_level);
  std::unique_ptr<Engine> engine(new Engine(std::move(options)));
  if (engine->options_.start_sweeper) {
    if (auto started = engine->sweeper_.start(); !started) {
      return std::unexpected(started.error());
    }
  }
  logger()->info("engine ready: interpreter {}, grace window {} ms, idle timeout {} ms",
                 engine->options_.interpreter.program, engine->options_.grace_window.count(),
                 engine->options_.idle_timeout.count());
  return engine;
}

std::unique_ptr<Engine> Engine::create_or_throw(EngineOptions options) {
  auto engine = create(std::move(options));
  if (!engine) {
    internal::throw_error(engine.error());
  }
  return std::move(*engine);
}

Result<std::shared_ptr<Session>> Engine::lookup(std::string_view id) const {
  auto session = registry_.find(id);
  if (!session) {
    return fail(errc::session_not_found, "session " + std::string(id));
  }
  return session;
}

Result<ExecuteResult> Engine::execute(std::string_view source) {
  if (shut_down_.load()) {
    return fail(errc::spawn_failed, "engine is shut down");
  }
  return dispatcher_.dispatch(source);
}

Result<std::vector<OutputChunk>> Engine::poll_output(std::string_view id) {
  auto session = lookup(id);
  if (!session) {
    return std::unexpected(session.error());
  }
  auto chunks = (*session)->poll();
  if (!chunks) {
    // The sentinel went out on an earlier poll; this one acknowledges it.
    registry_.close(id);
    logger()->debug("session {}: retired after final drain", id);
    return std::vector<OutputChunk>{};
  }
  return std::move(*chunks);
}

Result<bool> Engine::is_running(std::string_view id) {
  auto session = lookup(id);
  if (!session) {
    return std::unexpected(session.error());
  }
  return (*session)->state().is_running();
}

Result<void> Engine::send_input(std::string_view id, std::string_view text) {
  auto session = lookup(id);
  if (!session) {
    return std::unexpected(session.error());
  }
  return (*session)->send_input(text);
}

void Engine::close(std::string_view id) {
  if (registry_.close(id)) {
    logger()->debug("session {}: closed by caller", id);
  }
}

Result<SessionState> Engine::status(std::string_view id) {
  auto session = lookup(id);
  if (!session) {
    return std::unexpected(session.error());
  }
  return (*session)->state();
}

std::size_t Engine::sweep_idle() { return sweeper_.sweep_once(); }

void Engine::shutdown() noexcept {
  if (shut_down_.exchange(true)) {
    return;
  }
  sweeper_.stop();
  auto closed = registry_.close_all();
  logger()->info("engine shut down, {} session(s) closed", closed);
}

}  // namespace execbridge
