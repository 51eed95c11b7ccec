#include "contentflow/codec-adapter.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "contentflow/compression-test-helpers.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/encoding.hpp"
#include "contentflow/invalid_argument_exception.hpp"
#include "contentflow/raw-chars.hpp"
#include "contentflow/vector.hpp"

namespace contentflow {

namespace {

constexpr std::size_t kBufferSize = 256;

vector<Encoding> EnabledEncodings() {
  vector<Encoding> encodings;
  for (Encoding enc : {Encoding::gzip, Encoding::deflate, Encoding::br, Encoding::zstd}) {
    if (IsEncodingEnabled(enc)) {
      encodings.push_back(enc);
    }
  }
  return encodings;
}

vector<std::string> SamplePayloads() {
  vector<std::string> payloads;
  payloads.emplace_back("");
  payloads.emplace_back("hello world");
  payloads.emplace_back(512, 'A');
  payloads.emplace_back(test::MakePatternedPayload(128UL * 1024UL));
  payloads.emplace_back(test::MakeRandomPayload(20UL * 1024UL));
  return payloads;
}

// Feeds 'compressed' by pieces of 'split' bytes, checking that no decoded piece is larger than the buffer size.
bool StreamDecode(CodecAdapter& adapter, std::string_view compressed, std::size_t split, std::string& out) {
  while (true) {
    switch (adapter.status()) {
      case CodecStatus::NeedsMoreInput:
        if (compressed.empty()) {
          adapter.finish();
        } else {
          compressed.remove_prefix(adapter.push(compressed.substr(0, std::min(split, compressed.size()))));
        }
        break;
      case CodecStatus::NeedsMoreOutput: {
        const RawChars decoded = adapter.pull();
        EXPECT_LE(decoded.size(), adapter.bufferSize());
        out.append(std::string_view(decoded));
        break;
      }
      case CodecStatus::Ready:
        adapter.advance();
        break;
      case CodecStatus::Done:
        return true;
      case CodecStatus::Error:
        return false;
    }
  }
}

}  // namespace

class CodecAdapterTest : public ::testing::TestWithParam<Encoding> {};

TEST_P(CodecAdapterTest, FullRoundTrip) {
  for (const auto& payload : SamplePayloads()) {
    SCOPED_TRACE(testing::Message() << "payload size=" << payload.size());
    const std::string compressed = test::Compress(GetParam(), payload);
    auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
    RawChars out;
    ASSERT_TRUE(DecompressFull(*adapter, compressed, 0, out));
    EXPECT_EQ(std::string_view(out), payload);
    EXPECT_EQ(adapter->status(), CodecStatus::Done);
  }
}

TEST_P(CodecAdapterTest, StreamingSplits) {
  const std::string payload = test::MakePatternedPayload(64UL * 1024UL);
  const std::string compressed = test::Compress(GetParam(), payload);
  for (std::size_t split : {std::size_t{1}, std::size_t{7}, std::size_t{1000}, compressed.size()}) {
    SCOPED_TRACE(testing::Message() << "split=" << split);
    auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
    std::string out;
    ASSERT_TRUE(StreamDecode(*adapter, compressed, split, out));
    EXPECT_EQ(out, payload);
  }
}

TEST_P(CodecAdapterTest, EmptyInputIsEmptyBody) {
  auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  EXPECT_EQ(adapter->status(), CodecStatus::NeedsMoreInput);
  adapter->finish();
  EXPECT_EQ(adapter->status(), CodecStatus::Done);
}

TEST_P(CodecAdapterTest, TruncatedStreamIsError) {
  const std::string compressed = test::Compress(GetParam(), test::MakePatternedPayload(4096));
  auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  RawChars out;
  EXPECT_FALSE(DecompressFull(*adapter, std::string_view(compressed).substr(0, compressed.size() / 2), 0, out));
  EXPECT_EQ(adapter->status(), CodecStatus::Error);
  EXPECT_NE(std::string_view(adapter->errorMessage()), "");
}

TEST_P(CodecAdapterTest, CorruptedInputIsError) {
  std::string garbage(512, '\xFF');
  auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  RawChars out;
  EXPECT_FALSE(DecompressFull(*adapter, garbage, 0, out));
  EXPECT_EQ(adapter->status(), CodecStatus::Error);
}

TEST_P(CodecAdapterTest, TrailingBytesAfterEndAreDiscarded) {
  const std::string payload = "hello world";
  std::string compressed = test::Compress(GetParam(), payload);
  compressed.append("trailing garbage");
  auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  RawChars out;
  ASSERT_TRUE(DecompressFull(*adapter, compressed, 0, out));
  EXPECT_EQ(std::string_view(out), payload);
}

TEST_P(CodecAdapterTest, MaxDecompressedBytes) {
  const std::string payload = test::MakePatternedPayload(10000);
  const std::string compressed = test::Compress(GetParam(), payload);
  auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  RawChars out;
  EXPECT_FALSE(DecompressFull(*adapter, compressed, 1000, out));
  EXPECT_LE(out.size(), 1000U);

  adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  out.clear();
  EXPECT_TRUE(DecompressFull(*adapter, compressed, payload.size(), out));
  EXPECT_EQ(out.size(), payload.size());
}

TEST_P(CodecAdapterTest, HighRatioOutputIsBounded) {
  // 1 MiB of zeros compresses to a few hundred bytes, each pull stays within the buffer size.
  const std::string payload(1UL << 20, '\0');
  const std::string compressed = test::Compress(GetParam(), payload);
  ASSERT_LT(compressed.size(), payload.size() / 100);
  auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  std::string out;
  ASSERT_TRUE(StreamDecode(*adapter, compressed, compressed.size(), out));
  EXPECT_EQ(out.size(), payload.size());
}

TEST_P(CodecAdapterTest, TotalInCountsPushedBytes) {
  const std::string compressed = test::Compress(GetParam(), "some body");
  auto adapter = MakeCodecAdapter(GetParam(), kBufferSize);
  std::string out;
  ASSERT_TRUE(StreamDecode(*adapter, compressed, 3, out));
  EXPECT_EQ(adapter->totalIn(), compressed.size());
}

INSTANTIATE_TEST_SUITE_P(Encodings, CodecAdapterTest, ::testing::ValuesIn(EnabledEncodings()),
                         [](const ::testing::TestParamInfo<Encoding>& info) {
                           std::string name(GetEncodingStr(info.param));
                           return name;
                         });
GTEST_ALLOW_UNINSTANTIATED_PARAMETERIZED_TEST(CodecAdapterTest);

TEST(CodecAdapter, UnsupportedEncodingThrows) {
  try {
    [[maybe_unused]] auto adapter = MakeCodecAdapter(Encoding::none, kBufferSize);
    FAIL() << "expected content_error";
  } catch (const content_error& ex) {
    EXPECT_EQ(ex.failure().kind, FailureKind::UnsupportedEncoding);
  }
}

#ifdef CONTENTFLOW_ENABLE_ZLIB
TEST(CodecAdapter, ZeroBufferSizeThrows) {
  EXPECT_THROW(MakeCodecAdapter(Encoding::gzip, 0), invalid_argument);
}

TEST(CodecAdapter, GzipIsNotDeflate) {
  const std::string compressed = test::Compress(Encoding::gzip, "hello");
  ASSERT_TRUE(test::HasGzipMagic(compressed));
  auto adapter = MakeCodecAdapter(Encoding::deflate, kBufferSize);
  RawChars out;
  EXPECT_FALSE(DecompressFull(*adapter, compressed, 0, out));
}
#endif

}  // namespace contentflow
