#include "contentflow/content-failure.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace contentflow {

TEST(ContentFailure, IsLimit) {
  const ContentFailure sizeFailure{.kind = FailureKind::LimitExceeded, .limit = LimitKind::Size, .message = "x"};
  EXPECT_TRUE(sizeFailure.isLimit(LimitKind::Size));
  EXPECT_FALSE(sizeFailure.isLimit(LimitKind::Count));

  const ContentFailure transport{.kind = FailureKind::Transport, .message = "reset"};
  EXPECT_FALSE(transport.isLimit(LimitKind::None));
}

TEST(ContentFailure, Names) {
  EXPECT_EQ(FailureKindName(FailureKind::CodecCorruption), "codec corruption");
  EXPECT_EQ(FailureKindName(FailureKind::Cancelled), "cancelled");
  EXPECT_EQ(LimitKindName(LimitKind::ExpansionRatio), "expansion ratio");
}

TEST(ContentFailure, ContentErrorMessage) {
  const content_error err(ContentFailure{.kind = FailureKind::UnsupportedEncoding, .message = "compress"});
  EXPECT_EQ(std::string_view(err.what()), "unsupported encoding: compress");
  EXPECT_EQ(err.failure().kind, FailureKind::UnsupportedEncoding);
}

}  // namespace contentflow
