#pragma once

#include <string>
#include <string_view>

namespace execbridge::internal {

/// Random RFC 4122 version-4 UUID in its 36-character textual form.
std::string new_session_id();

/// True if text has the shape new_session_id() produces.
bool looks_like_session_id(std::string_view text);

}  // namespace execbridge::internal
