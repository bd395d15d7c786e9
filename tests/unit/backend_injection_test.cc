#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <optional>
#include <thread>
#include <vector>

#include "execbridge/command.hpp"
#include "execbridge/engine.hpp"
#include "execbridge/internal/access.hpp"
#include "execbridge/internal/backend.hpp"
#include "execbridge/internal/fd.hpp"
#include "execbridge/process.hpp"
#include "support/test_support.hpp"

namespace execbridge {
namespace {

class FakeBackend final : public internal::Backend {
 public:
  Result<internal::Spawned> spawn(const internal::SpawnSpec& spec) override {
    spawn_specs.push_back(spec);
    ++spawn_calls;
    if (spawn_error) {
      return std::unexpected(*spawn_error);
    }
    internal::Spawned spawned;
    spawned.pid = 100 + spawn_calls;
    if (spec.new_process_group) {
      spawned.pgid = spawned.pid;
    }
    return spawned;
  }

  Result<ExitStatus> wait(internal::Spawned& spawned) override {
    wait_pids.push_back(spawned.pid);
    if (wait_error) {
      return std::unexpected(*wait_error);
    }
    return wait_result;
  }

  Result<std::optional<ExitStatus>> try_wait(internal::Spawned& spawned) override {
    try_wait_pids.push_back(spawned.pid);
    if (try_wait_error) {
      return std::unexpected(*try_wait_error);
    }
    if (exit_on_terminate && !terminate_pids.empty()) {
      return std::optional<ExitStatus>(ExitStatus::signaled(SIGTERM));
    }
    return try_wait_result;
  }

  Result<void> wait_exited(internal::Spawned& spawned) override {
    wait_exited_pids.push_back(spawned.pid);
    return {};
  }

  Result<void> terminate(internal::Spawned& spawned) override {
    terminate_pids.push_back(spawned.pid);
    if (terminate_error) {
      return std::unexpected(*terminate_error);
    }
    return {};
  }

  Result<void> kill(internal::Spawned& spawned) override {
    kill_pids.push_back(spawned.pid);
    if (kill_error) {
      return std::unexpected(*kill_error);
    }
    return {};
  }

  int spawn_calls = 0;
  std::vector<internal::SpawnSpec> spawn_specs;
  std::vector<int> wait_pids;
  std::vector<int> wait_exited_pids;
  std::vector<int> try_wait_pids;
  std::vector<int> terminate_pids;
  std::vector<int> kill_pids;
  bool exit_on_terminate = false;

  ExitStatus wait_result = ExitStatus::exited(0);
  std::optional<ExitStatus> try_wait_result;

  std::optional<Error> spawn_error;
  std::optional<Error> wait_error;
  std::optional<Error> try_wait_error;
  std::optional<Error> terminate_error;
  std::optional<Error> kill_error;
};

ProcessHandle fake_process(int pid) {
  internal::Spawned spawned;
  spawned.pid = pid;
  spawned.pgid = pid;
  return internal::ProcessAccess::from_spawned(spawned);
}

}  // namespace

TEST(BackendInjectionTest, ScopedOverrideRestoresDefault) {
  FakeBackend backend;
  internal::Backend* before = &internal::default_backend();
  {
    internal::ScopedBackendOverride override_backend(backend);
    EXPECT_EQ(&internal::default_backend(), &backend);
  }
  EXPECT_EQ(&internal::default_backend(), before);
}

TEST(BackendInjectionTest, ScopedOverrideStacksAndRestores) {
  FakeBackend backend_a;
  FakeBackend backend_b;
  internal::Backend* before = &internal::default_backend();
  {
    internal::ScopedBackendOverride override_a(backend_a);
    EXPECT_EQ(&internal::default_backend(), &backend_a);
    {
      internal::ScopedBackendOverride override_b(backend_b);
      EXPECT_EQ(&internal::default_backend(), &backend_b);
    }
    EXPECT_EQ(&internal::default_backend(), &backend_a);
  }
  EXPECT_EQ(&internal::default_backend(), before);
}

TEST(BackendInjectionTest, ScopedOverrideVisibleAcrossThreads) {
  FakeBackend backend;
  internal::ScopedBackendOverride override_backend(backend);

  internal::Backend* observed = nullptr;
  std::thread worker([&] { observed = &internal::default_backend(); });
  worker.join();
  EXPECT_EQ(observed, &backend);
}

TEST(BackendInjectionTest, CommandSpawnPropagatesBackendError) {
  FakeBackend backend;
  backend.spawn_error = Error{make_error_code(errc::spawn_failed), "posix_spawnp(python3)"};
  internal::ScopedBackendOverride override_backend(backend);

  auto process = Command("python3").spawn();
  ASSERT_FALSE(process.has_value());
  EXPECT_EQ(process.error().code, make_error_code(errc::spawn_failed));
  EXPECT_EQ(backend.spawn_calls, 1);
}

TEST(BackendInjectionTest, WaitReapsOnceAndCaches) {
  FakeBackend backend;
  backend.wait_result = ExitStatus::exited(7);
  internal::ScopedBackendOverride override_backend(backend);

  auto process = fake_process(4242);
  auto first = process.wait();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->code().value_or(-1), 7);
  auto second = process.wait();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, *first);

  EXPECT_EQ(backend.wait_pids.size(), 1u);
  EXPECT_EQ(backend.wait_exited_pids.size(), 1u);
  ASSERT_TRUE(process.exit_status().has_value());

  // Already reaped: no signal may reach a pid the OS could have reused.
  auto killed = process.kill();
  ASSERT_TRUE(killed.has_value());
  EXPECT_TRUE(backend.terminate_pids.empty());
  EXPECT_TRUE(backend.kill_pids.empty());
}

TEST(BackendInjectionTest, KillTerminatesThenReaps) {
  FakeBackend backend;
  backend.exit_on_terminate = true;
  internal::ScopedBackendOverride override_backend(backend);

  auto process = fake_process(5050);
  auto killed = process.kill();
  ASSERT_TRUE(killed.has_value());
  ASSERT_EQ(backend.terminate_pids.size(), 1u);
  EXPECT_EQ(backend.terminate_pids[0], 5050);
  EXPECT_TRUE(backend.kill_pids.empty());
  ASSERT_TRUE(process.exit_status().has_value());
  EXPECT_EQ(process.exit_status()->signal().value_or(0), SIGTERM);

  ASSERT_TRUE(process.kill().has_value());
  EXPECT_EQ(backend.terminate_pids.size(), 1u);
}

TEST(BackendInjectionTest, KillEscalatesAfterGrace) {
  FakeBackend backend;
  backend.wait_result = ExitStatus::signaled(SIGKILL);
  internal::ScopedBackendOverride override_backend(backend);
  test::FakeClock clock;
  internal::ScopedClockOverride override_clock(clock);

  auto process = fake_process(6060);
  process.set_kill_grace(std::chrono::milliseconds(3));
  ASSERT_TRUE(process.kill().has_value());
  EXPECT_EQ(backend.terminate_pids.size(), 1u);
  EXPECT_EQ(backend.kill_pids.size(), 1u);
  EXPECT_EQ(backend.wait_pids.size(), 1u);
  EXPECT_EQ(process.exit_status()->display_code(), 128 + SIGKILL);
}

TEST(BackendInjectionTest, KillFailureIsKillFailed) {
  FakeBackend backend;
  backend.terminate_error = Error{std::error_code(EPERM, std::system_category()), "kill"};
  internal::ScopedBackendOverride override_backend(backend);

  auto process = fake_process(7070);
  auto killed = process.kill();
  ASSERT_FALSE(killed.has_value());
  EXPECT_EQ(killed.error().code, make_error_code(errc::kill_failed));
  EXPECT_FALSE(process.exit_status().has_value());

  // Let the destructor's kill succeed.
  backend.terminate_error.reset();
  backend.exit_on_terminate = true;
}

TEST(BackendInjectionTest, TryExitStatusReturnsStatusOrEmpty) {
  FakeBackend backend;
  internal::ScopedBackendOverride override_backend(backend);

  auto process = fake_process(8080);
  backend.try_wait_result = std::nullopt;
  auto empty_result = process.try_exit_status();
  ASSERT_TRUE(empty_result.has_value());
  EXPECT_FALSE(empty_result->has_value());

  backend.try_wait_result = ExitStatus::exited(9);
  auto status_result = process.try_exit_status();
  ASSERT_TRUE(status_result.has_value());
  ASSERT_TRUE(status_result->has_value());
  EXPECT_EQ(status_result->value().code().value_or(-1), 9);

  // Cached from here on.
  backend.try_wait_result = std::nullopt;
  auto cached = process.try_exit_status();
  ASSERT_TRUE(cached.has_value());
  ASSERT_TRUE(cached->has_value());
  EXPECT_EQ(backend.try_wait_pids.size(), 2u);
}

TEST(BackendInjectionTest, StdinIsHandedOverOnce) {
  FakeBackend backend;
  backend.try_wait_result = ExitStatus::exited(0);
  internal::ScopedBackendOverride override_backend(backend);

  auto pipe = internal::create_pipe();
  ASSERT_TRUE(pipe.has_value());
  internal::Spawned spawned;
  spawned.pid = 9090;
  spawned.stdin_fd = pipe->second.release();
  auto process = internal::ProcessAccess::from_spawned(spawned);

  auto first = process.take_stdin();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->native_handle(), *spawned.stdin_fd);
  EXPECT_FALSE(process.take_stdin().has_value());
}

TEST(BackendInjectionTest, EngineReportsSpawnFailureWithoutSession) {
  FakeBackend backend;
  backend.spawn_error = Error{make_error_code(errc::spawn_failed), "posix_spawnp(python3)"};
  internal::ScopedBackendOverride override_backend(backend);

  auto engine = Engine::create_or_throw(test::shell_options());
  auto result = engine->execute("print('hi')");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::spawn_failed));
  EXPECT_EQ(engine->session_count(), 0u);
}

}  // namespace execbridge
