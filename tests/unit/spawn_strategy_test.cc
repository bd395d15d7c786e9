#include <gtest/gtest.h>
#include <spawn.h>

#include <filesystem>

#include "execbridge/internal/backend.hpp"

namespace execbridge::internal {

TEST(SpawnStrategyTest, CanUsePosixSpawnWithoutCwd) {
  SpawnSpec spec;
  spec.argv = {"python3"};
#ifdef POSIX_SPAWN_SETSIGDEF
  EXPECT_TRUE(can_use_posix_spawn(spec));
#else
  EXPECT_FALSE(can_use_posix_spawn(spec));
#endif
}

TEST(SpawnStrategyTest, CwdRequiresSupport) {
  SpawnSpec spec;
  spec.argv = {"python3"};
  spec.cwd = std::filesystem::current_path();
#if EXECBRIDGE_PLATFORM_MACOS
  EXPECT_TRUE(can_use_posix_spawn(spec));
#else
  EXPECT_FALSE(can_use_posix_spawn(spec));
  EXPECT_EQ(select_spawn_strategy(spec), SpawnStrategy::fork_exec);
#endif
}

TEST(SpawnStrategyTest, ProcessGroupRequiresSupport) {
  SpawnSpec spec;
  spec.argv = {"python3"};
  spec.new_process_group = true;
#if defined(POSIX_SPAWN_SETPGROUP) && defined(POSIX_SPAWN_SETSIGDEF)
  EXPECT_TRUE(can_use_posix_spawn(spec));
#else
  EXPECT_FALSE(can_use_posix_spawn(spec));
#endif
}

TEST(SpawnStrategyTest, InterpreterWithWorkingDirFallsBackToFork) {
  SpawnSpec spec;
  spec.argv = {"/bin/sh", "-c", "pwd"};
  spec.new_process_group = true;
  spec.cwd = std::filesystem::temp_directory_path();
#if !EXECBRIDGE_PLATFORM_MACOS
  EXPECT_EQ(select_spawn_strategy(spec), SpawnStrategy::fork_exec);
  EXPECT_EQ(to_string(select_spawn_strategy(spec)), "fork/exec");
#endif
  EXPECT_EQ(to_string(SpawnStrategy::posix_spawn), "posix_spawn");
}

}  // namespace execbridge::internal
