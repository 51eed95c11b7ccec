#include "contentflow/memory-content-source.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/vector.hpp"

namespace contentflow {

TEST(MemoryContentSource, SinglePiece) {
  MemoryContentSource source("hello");
  Chunk chunk = source.read();
  EXPECT_EQ(chunk.bytes(), "hello");
  EXPECT_TRUE(chunk.isLast());
  EXPECT_TRUE(source.read().isLast());
  EXPECT_FALSE(source.read().isFailure());
}

TEST(MemoryContentSource, EmptyBodyIsEof) {
  MemoryContentSource source("");
  const Chunk chunk = source.read();
  EXPECT_TRUE(chunk.isLast());
  EXPECT_EQ(chunk.size(), 0U);
}

TEST(MemoryContentSource, Pieces) {
  vector<std::string> pieces;
  pieces.emplace_back("ab");
  pieces.emplace_back("cd");
  MemoryContentSource source(std::move(pieces));
  Chunk first = source.read();
  EXPECT_EQ(first.bytes(), "ab");
  EXPECT_FALSE(first.isLast());
  Chunk second = source.read();
  EXPECT_EQ(second.bytes(), "cd");
  EXPECT_TRUE(second.isLast());
}

TEST(MemoryContentSource, DemandIsImmediate) {
  MemoryContentSource source("x");
  bool called = false;
  source.demand([&called] { called = true; });
  EXPECT_TRUE(called);
}

TEST(MemoryContentSource, FailIsTerminal) {
  MemoryContentSource source("hello");
  source.fail(ContentFailure{.kind = FailureKind::Cancelled});
  for (int i = 0; i < 3; ++i) {
    const Chunk chunk = source.read();
    ASSERT_TRUE(chunk.isFailure());
    EXPECT_EQ(chunk.failure().kind, FailureKind::Cancelled);
  }
}

}  // namespace contentflow
