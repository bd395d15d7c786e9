#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execbridge/command.hpp"
#include "execbridge/result.hpp"

namespace execbridge {

/// @brief How program source reaches the interpreter.
enum class ScriptDelivery : std::uint8_t {
  /// @brief Write the source to a private temp file and pass its path.
  temp_file,
  /// @brief Pass the source inline after "-c".
  argument,
};

/// @brief Interpreter binary and the way to launch it.
struct Interpreter {
  /// @brief Program name or path; looked up on PATH when it has no slash.
  std::string program;
  /// @brief Arguments placed before the script path or "-c".
  std::vector<std::string> args;
  /// @brief Extra environment for the child, on top of the inherited one.
  std::map<std::string, std::string, std::less<>> env;
  /// @brief Source delivery mode.
  ScriptDelivery delivery = ScriptDelivery::temp_file;
  /// @brief File name suffix for staged scripts.
  std::string script_suffix;
  /// @brief Working directory for the child; inherited when empty.
  std::optional<std::filesystem::path> working_dir;

  /// @brief python3 -u with unbuffered, UTF-8 stdio.
  static Interpreter python3();
  /// @brief /bin/sh, used by tests and by hosts without Python.
  static Interpreter posix_shell();

  /// @brief Build the launch command for source staged at script (temp_file) or inline.
  [[nodiscard]] Command command_for(std::string_view source,
                                    const std::filesystem::path* script) const;
};

/// @brief Program source written to a file in a private temp directory.
///
/// The directory holds nothing but the script and is removed with it on destruction.
class ScriptFile {
 public:
  /// @brief Create "execbridge_<tag>_XXXXXX/execbridge_<tag><suffix>" under the temp
  /// directory; the directory is mode 0700 and the file 0600.
  static Result<ScriptFile> create(std::string_view source, std::string_view tag,
                                   std::string_view suffix);

  ScriptFile(ScriptFile&& other) noexcept;
  ScriptFile& operator=(ScriptFile&& other) noexcept;
  ScriptFile(const ScriptFile&) = delete;
  ScriptFile& operator=(const ScriptFile&) = delete;
  ~ScriptFile();

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

  /// @brief Delete the file and its directory now; later calls do nothing.
  void remove() noexcept;

 private:
  ScriptFile(std::filesystem::path dir, std::filesystem::path path)
      : dir_(std::move(dir)), path_(std::move(path)) {}

  std::filesystem::path dir_;
  std::filesystem::path path_;
};

}  // namespace execbridge
