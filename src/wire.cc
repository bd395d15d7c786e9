#include "execbridge/wire.hpp"

#include "execbridge/internal/session_id.hpp"

namespace execbridge {

std::string to_wire(const ExecuteResult& result) {
  if (const auto* started = std::get_if<SessionStarted>(&result)) {
    return std::string(kSessionMarkerPrefix) + started->id;
  }
  const auto& direct = std::get<DirectResult>(result);
  if (direct.exit_code == 0 || direct.stderr_data.empty()) {
    return direct.stdout_data;
  }
  return direct.stderr_data;
}

std::optional<std::string> parse_session_marker(std::string_view text) {
  if (!text.starts_with(kSessionMarkerPrefix)) {
    return std::nullopt;
  }
  auto id = text.substr(kSessionMarkerPrefix.size());
  if (!internal::looks_like_session_id(id)) {
    return std::nullopt;
  }
  return std::string(id);
}

std::string join_text(const std::vector<OutputChunk>& chunks) {
  std::string out;
  for (const auto& chunk : chunks) {
    out.append(chunk.text);
  }
  return out;
}

}  // namespace execbridge
