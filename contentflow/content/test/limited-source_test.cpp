#include "contentflow/limited-source.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/decoder-source.hpp"
#include "contentflow/drain.hpp"
#include "contentflow/memory-content-source.hpp"
#include "contentflow/read-all.hpp"
#include "contentflow/scripted-content-source.hpp"

namespace contentflow {

namespace {

using test::ScriptedContentSource;

// Records the bytes exposed to the consumer before the stream ends.
class ObservingConsumer final : public ChunkConsumer<BodyResult> {
 public:
  std::optional<BodyResult> accept(Chunk chunk) override {
    if (chunk.isFailure()) {
      return BodyResult{.body = seen, .failure = chunk.failure()};
    }
    seen.append(chunk.bytes());
    if (chunk.isLast()) {
      return BodyResult{.body = seen};
    }
    return std::nullopt;
  }

  std::string seen;
};

}  // namespace

TEST(LimitedSource, ExactlyAtLimitSucceeds) {
  auto scripted = std::make_unique<ScriptedContentSource>(ScriptedContentSource::Split("0123456789", 3));
  LimitedSource limited(std::move(scripted), 10);
  const BodyResult result = ReadAll(limited);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.body, "0123456789");
  EXPECT_EQ(limited.length(), 10U);
}

TEST(LimitedSource, AbortsWhenBoundaryIsCrossed) {
  for (std::size_t split : {std::size_t{1}, std::size_t{3}, std::size_t{0}}) {
    SCOPED_TRACE(testing::Message() << "split=" << split);
    auto scripted = std::make_unique<ScriptedContentSource>(ScriptedContentSource::Split("0123456789A", split));
    ScriptedContentSource* upstream = scripted.get();
    LimitedSource limited(std::move(scripted), 10);
    ObservingConsumer consumer;
    const BodyResult result = DrainBlocking(limited, consumer);
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.failure->isLimit(LimitKind::Size));
    EXPECT_LE(consumer.seen.size(), 10U);
    // upstream aborted and offending chunk not leaked
    EXPECT_EQ(upstream->nbFails(), 1U);
    EXPECT_EQ(upstream->nbReleases(), upstream->nbDataChunks());
    // idempotent tail
    const Chunk again = limited.read();
    ASSERT_TRUE(again.isFailure());
    EXPECT_TRUE(again.failure().isLimit(LimitKind::Size));
  }
}

TEST(LimitedSource, ConsumerSeesAllBytesBeforeBoundary) {
  auto scripted = std::make_unique<ScriptedContentSource>(ScriptedContentSource::Split("0123456789A", 1));
  LimitedSource limited(std::move(scripted), 10);
  ObservingConsumer consumer;
  const BodyResult result = DrainBlocking(limited, consumer);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(consumer.seen, "0123456789");
}

TEST(LimitedSource, ZeroMeansUnbounded) {
  const std::string body(500000, 'x');
  LimitedSource limited(std::make_unique<MemoryContentSource>(body), 0, 0);
  const BodyResult result = ReadAll(limited);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.body.size(), body.size());
  for (int i = 0; i < 5000; ++i) {
    ASSERT_FALSE(limited.addField());
  }
}

TEST(LimitedSource, FieldCount) {
  auto scripted = std::make_unique<ScriptedContentSource>(ScriptedContentSource::Split("abc", 1));
  ScriptedContentSource* upstream = scripted.get();
  LimitedSource limited(std::move(scripted), 0, 2);
  EXPECT_FALSE(limited.addField());
  EXPECT_FALSE(limited.addField());
  const auto failure = limited.addField();
  ASSERT_TRUE(failure);
  EXPECT_TRUE(failure->isLimit(LimitKind::Count));
  EXPECT_EQ(limited.fields(), 3U);
  EXPECT_EQ(upstream->nbFails(), 1U);
  const Chunk chunk = limited.read();
  ASSERT_TRUE(chunk.isFailure());
  EXPECT_TRUE(chunk.failure().isLimit(LimitKind::Count));
}

TEST(LimitedSource, CompressedSizeKind) {
  LimitedSource limited(std::make_unique<MemoryContentSource>("0123456789"), 5, 0, LimitKind::CompressedSize);
  const Chunk chunk = limited.read();
  ASSERT_TRUE(chunk.isFailure());
  EXPECT_TRUE(chunk.failure().isLimit(LimitKind::CompressedSize));
}

TEST(LimitedSource, LimitBreachReleasesCodecOnce) {
  int nbCodecReleases = 0;
  auto scripted =
      std::make_unique<ScriptedContentSource>(ScriptedContentSource::Split(std::string_view("hello world\0", 12), 2));
  ScriptedContentSource* upstream = scripted.get();
  auto decoder =
      std::make_unique<DecoderSource>(std::move(scripted), std::make_unique<test::CountingCopyCodec>(64, nbCodecReleases));
  const DecoderSource* decoderPtr = decoder.get();
  LimitedSource limited(std::move(decoder), 3);

  EXPECT_EQ(limited.read().bytes(), "he");
  const Chunk chunk = limited.read();
  ASSERT_TRUE(chunk.isFailure());
  EXPECT_TRUE(chunk.failure().isLimit(LimitKind::Size));
  EXPECT_FALSE(decoderPtr->holdsCodec());
  EXPECT_EQ(nbCodecReleases, 1);
  EXPECT_EQ(upstream->nbFails(), 1U);
  EXPECT_EQ(upstream->failure()->limit, LimitKind::Size);
}

TEST(LimitedSource, PassesThroughUpstreamFailure) {
  test::ScriptedContentSource::Step fail = test::ScriptedContentSource::Step::Fail(FailureKind::Transport);
  vector<test::ScriptedContentSource::Step> steps;
  steps.push_back(std::move(fail));
  LimitedSource limited(std::make_unique<ScriptedContentSource>(std::move(steps)), 10);
  const BodyResult result = ReadAll(limited);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.failure->kind, FailureKind::Transport);
}

}  // namespace contentflow
