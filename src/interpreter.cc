#include "execbridge/interpreter.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cstdlib>
#include <string>
#include <system_error>
#include <utility>

#include "execbridge/internal/fd.hpp"
#include "execbridge/log.hpp"

namespace execbridge {

Interpreter Interpreter::python3() {
  Interpreter interp;
  interp.program = "python3";
  interp.args = {"-u"};
  interp.env = {{"PYTHONUNBUFFERED", "1"}, {"PYTHONIOENCODING", "utf-8"}};
  interp.script_suffix = ".py";
  return interp;
}

Interpreter Interpreter::posix_shell() {
  Interpreter interp;
  interp.program = "/bin/sh";
  interp.script_suffix = ".sh";
  return interp;
}

Command Interpreter::command_for(std::string_view source,
                                 const std::filesystem::path* script) const {
  Command cmd(program);
  cmd.args(args);
  if (delivery == ScriptDelivery::argument || script == nullptr) {
    cmd.arg("-c");
    cmd.arg(std::string(source));
  } else {
    cmd.arg(script->string());
  }
  for (const auto& [key, value] : env) {
    cmd.env(key, value);
  }
  if (working_dir) {
    cmd.current_dir(*working_dir);
  }
  cmd.options(SpawnOptions{.new_process_group = true});
  return cmd;
}

Result<ScriptFile> ScriptFile::create(std::string_view source, std::string_view tag,
                                      std::string_view suffix) {
  std::error_code ec;
  auto temp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return std::unexpected(Error{ec, "temp_directory_path"});
  }
  std::string name = "execbridge_";
  name.append(tag);

  // The interpreter puts the script's directory first on its module path, so
  // the script gets a directory of its own.
  std::string dir_template = (temp / (name + "_XXXXXX")).string();
  if (::mkdtemp(dir_template.data()) == nullptr) {
    auto error = internal::errno_error("mkdtemp");
    return fail(errc::script_failed, dir_template + ": " + error.code.message());
  }
  std::filesystem::path dir(dir_template);
  auto path = dir / (name + std::string(suffix));
  // From here on the directory exists; the ScriptFile owns its removal.
  ScriptFile script(std::move(dir), path);

  internal::unique_fd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
  if (!fd) {
    auto error = internal::errno_error("open");
    return fail(errc::script_failed, path.string() + ": " + error.code.message());
  }

  std::string_view remaining = source;
  while (!remaining.empty()) {
    ssize_t written = ::write(fd.get(), remaining.data(), remaining.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      auto error = internal::errno_error("write");
      return fail(errc::script_failed, path.string() + ": " + error.code.message());
    }
    remaining.remove_prefix(static_cast<std::size_t>(written));
  }
  if (::close(fd.release()) == -1) {
    auto error = internal::errno_error("close");
    return fail(errc::script_failed, path.string() + ": " + error.code.message());
  }
  logger()->debug("staged {} bytes of source at {}", source.size(), path.string());
  return script;
}

ScriptFile::ScriptFile(ScriptFile&& other) noexcept
    : dir_(std::move(other.dir_)), path_(std::move(other.path_)) {
  other.dir_.clear();
  other.path_.clear();
}

ScriptFile& ScriptFile::operator=(ScriptFile&& other) noexcept {
  if (this != &other) {
    remove();
    dir_ = std::move(other.dir_);
    path_ = std::move(other.path_);
    other.dir_.clear();
    other.path_.clear();
  }
  return *this;
}

ScriptFile::~ScriptFile() { remove(); }

void ScriptFile::remove() noexcept {
  if (dir_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  if (ec) {
    logger()->warn("could not remove {}: {}", dir_.string(), ec.message());
  }
  dir_.clear();
  path_.clear();
}

}  // namespace execbridge
