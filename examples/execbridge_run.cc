// Runs a program file through the engine the way the learning UI does: poll about every
// 100 ms, print what arrived, forward each terminal line as input.
//
//   execbridge_run [--shell] <script>
//
// Configuration comes from the EXECBRIDGE_* environment variables.

#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "execbridge/engine.hpp"

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);

void print_error(std::string_view what, const execbridge::Error& error) {
  std::cerr << what << ": " << error.context << " (" << error.code.message() << ")\n";
}

// Reads whatever the terminal has ready without blocking; complete lines go to lines.
bool read_ready_lines(std::string& pending, std::vector<std::string>& lines) {
  pollfd fd{STDIN_FILENO, POLLIN, 0};
  if (::poll(&fd, 1, 0) <= 0 || (fd.revents & (POLLIN | POLLHUP)) == 0) {
    return true;
  }
  char buffer[4096];
  ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
  if (count <= 0) {
    return false;
  }
  pending.append(buffer, static_cast<std::size_t>(count));
  std::size_t newline = 0;
  while ((newline = pending.find('\n')) != std::string::npos) {
    lines.push_back(pending.substr(0, newline));
    pending.erase(0, newline + 1);
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  bool use_shell = false;
  std::string path;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--shell") {
      use_shell = true;
    } else if (path.empty()) {
      path = arg;
    }
  }
  if (path.empty()) {
    std::cerr << "usage: " << argv[0] << " [--shell] <script>\n";
    return 2;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    std::cerr << "cannot open " << path << "\n";
    return 2;
  }
  std::ostringstream source;
  source << file.rdbuf();

  auto options = execbridge::EngineOptions::from_env();
  if (!options) {
    print_error("bad configuration", options.error());
    return 2;
  }
  if (use_shell) {
    options->interpreter = execbridge::Interpreter::posix_shell();
  }
  auto engine = execbridge::Engine::create(*options);
  if (!engine) {
    print_error("engine", engine.error());
    return 2;
  }

  auto result = (*engine)->execute(source.str());
  if (!result) {
    print_error("execute", result.error());
    return 1;
  }
  if (const auto* direct = std::get_if<execbridge::DirectResult>(&*result)) {
    std::cout << direct->stdout_data;
    std::cerr << direct->stderr_data;
    return direct->exit_code;
  }

  const auto id = std::get<execbridge::SessionStarted>(*result).id;
  int exit_code = 1;
  std::string pending;
  std::vector<std::string> lines;
  bool stdin_open = true;
  while (true) {
    auto chunks = (*engine)->poll_output(id);
    if (!chunks) {
      break;
    }
    for (const auto& chunk : *chunks) {
      switch (chunk.stream) {
        case execbridge::OutputStream::stdout_stream:
          std::cout << chunk.text << std::flush;
          break;
        case execbridge::OutputStream::stderr_stream:
          std::cerr << chunk.text << std::flush;
          break;
        case execbridge::OutputStream::completion:
          std::cout << chunk.text << "\n" << std::flush;
          exit_code = chunk.exit_code.value_or(1);
          break;
      }
    }

    if (stdin_open) {
      stdin_open = read_ready_lines(pending, lines);
    }
    for (const auto& line : lines) {
      if (auto sent = (*engine)->send_input(id, line); !sent) {
        if (sent.error().code != execbridge::make_error_code(execbridge::errc::closed_pipe)) {
          print_error("send_input", sent.error());
        }
      }
    }
    lines.clear();
    std::this_thread::sleep_for(kPollInterval);
  }
  return exit_code;
}
