#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <variant>

#include "execbridge/engine.hpp"
#include "execbridge/wire.hpp"

int main() {
  auto options = execbridge::EngineOptions{};
  options.interpreter = execbridge::Interpreter::posix_shell();
  auto engine = execbridge::Engine::create_or_throw(options);

  auto result = engine->execute("printf 'name:'; read name; echo \"hello $name\"");
  if (!result) {
    std::cerr << "execute failed: " << result.error().context << "\n";
    return 1;
  }
  auto id = execbridge::parse_session_marker(execbridge::to_wire(*result));
  if (!id) {
    std::cerr << "expected an interactive session\n";
    return 1;
  }

  if (auto sent = engine->send_input(*id, "Bob"); !sent) {
    std::cerr << "send_input failed: " << sent.error().context << "\n";
    return 1;
  }

  std::string transcript;
  for (int i = 0; i < 100; ++i) {
    auto chunks = engine->poll_output(*id);
    if (!chunks) {
      break;
    }
    transcript += execbridge::join_text(*chunks);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (transcript != "name:hello Bob\n\n[Program finished successfully]") {
    std::cerr << "unexpected transcript: '" << transcript << "'\n";
    return 1;
  }
  return 0;
}
