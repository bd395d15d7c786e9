#include <iostream>
#include <variant>

#include "execbridge/engine.hpp"

int main() {
  auto options = execbridge::EngineOptions{};
  options.interpreter = execbridge::Interpreter::posix_shell();
  auto engine = execbridge::Engine::create_or_throw(options);

  auto result = engine->execute("while :; do sleep 1; done");
  if (!result || !std::holds_alternative<execbridge::SessionStarted>(*result)) {
    std::cerr << "expected an interactive session\n";
    return 1;
  }
  const auto id = std::get<execbridge::SessionStarted>(*result).id;

  engine->close(id);
  engine->close(id);

  auto running = engine->is_running(id);
  if (running || running.error().code !=
                     execbridge::make_error_code(execbridge::errc::session_not_found)) {
    std::cerr << "closed session still answers\n";
    return 1;
  }
  return 0;
}
