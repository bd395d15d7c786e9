#pragma once

#include "execbridge/command.hpp"
#include "execbridge/internal/backend.hpp"
#include "execbridge/result.hpp"

namespace execbridge::internal {

/// Resolves a Command into argv, the merged environment and spawn flags.
Result<SpawnSpec> lower_command(const Command& cmd);

}  // namespace execbridge::internal
