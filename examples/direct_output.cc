#include <iostream>
#include <variant>

#include "execbridge/engine.hpp"

int main() {
  auto options = execbridge::EngineOptions{};
  options.interpreter = execbridge::Interpreter::posix_shell();
  auto engine = execbridge::Engine::create_or_throw(options);

  auto result = engine->execute("printf 'out'; printf 'err' 1>&2");
  if (!result) {
    std::cerr << "execute failed: " << result.error().context << " "
              << result.error().code.message() << "\n";
    return 1;
  }

  const auto* direct = std::get_if<execbridge::DirectResult>(&*result);
  if (direct == nullptr) {
    std::cerr << "expected a direct result\n";
    return 1;
  }
  if (direct->stdout_data != "out" || direct->stderr_data != "err" || direct->exit_code != 0) {
    std::cerr << "unexpected output: stdout='" << direct->stdout_data << "' stderr='"
              << direct->stderr_data << "'\n";
    return 1;
  }
  return 0;
}
