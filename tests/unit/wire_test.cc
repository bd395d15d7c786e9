#include "execbridge/wire.hpp"

#include <gtest/gtest.h>

#include <set>

#include "execbridge/internal/session_id.hpp"

namespace execbridge {

TEST(WireTest, SessionStartedRendersMarker) {
  ExecuteResult result = SessionStarted{"0f8e6c1a-2b3d-4e5f-8a9b-0c1d2e3f4a5b"};
  auto text = to_wire(result);
  EXPECT_EQ(text, "INTERACTIVE_SESSION:0f8e6c1a-2b3d-4e5f-8a9b-0c1d2e3f4a5b");
  auto id = parse_session_marker(text);
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, "0f8e6c1a-2b3d-4e5f-8a9b-0c1d2e3f4a5b");
}

TEST(WireTest, DirectResultRendersStdoutOrStderr) {
  DirectResult ok;
  ok.stdout_data = "hi\n";
  EXPECT_EQ(to_wire(ok), "hi\n");

  DirectResult failed;
  failed.stdout_data = "partial\n";
  failed.stderr_data = "Traceback (most recent call last):\n";
  failed.exit_code = 1;
  failed.status = ExitStatus::exited(1);
  EXPECT_EQ(to_wire(failed), "Traceback (most recent call last):\n");
}

TEST(WireTest, ProgramOutputIsNotMistakenForMarker) {
  EXPECT_FALSE(parse_session_marker("hello").has_value());
  EXPECT_FALSE(parse_session_marker("INTERACTIVE_SESSION:").has_value());
  EXPECT_FALSE(parse_session_marker("INTERACTIVE_SESSION:not-an-id").has_value());
}

TEST(SessionIdTest, IdsAreVersionFourAndUnique) {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    auto id = internal::new_session_id();
    ASSERT_TRUE(internal::looks_like_session_id(id)) << id;
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
    ids.insert(id);
  }
  EXPECT_EQ(ids.size(), 1000u);
}

TEST(WireTest, JoinTextConcatenates) {
  std::vector<OutputChunk> chunks{{OutputStream::stdout_stream, "hello ", std::nullopt},
                                  {OutputStream::stdout_stream, "Bob\n", std::nullopt},
                                  completion_chunk(ExitStatus::exited(0))};
  EXPECT_EQ(join_text(chunks), "hello Bob\n\n[Program finished successfully]");
}

}  // namespace execbridge
