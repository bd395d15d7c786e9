#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execbridge/dispatcher.hpp"

namespace execbridge {

/// @brief Prefix of the text that announces an interactive session to a text-only caller.
inline constexpr std::string_view kSessionMarkerPrefix = "INTERACTIVE_SESSION:";

/// @brief Flatten an execute() result into one string.
///
/// SessionStarted becomes "INTERACTIVE_SESSION:<id>". A DirectResult becomes its stdout
/// on success and its stderr (or stdout when stderr is empty) otherwise.
std::string to_wire(const ExecuteResult& result);

/// @brief Extract the session id from "INTERACTIVE_SESSION:<id>", if text is one.
std::optional<std::string> parse_session_marker(std::string_view text);

/// @brief Concatenate the text of chunks, the way a terminal would show them.
std::string join_text(const std::vector<OutputChunk>& chunks);

}  // namespace execbridge
