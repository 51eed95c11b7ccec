#include "contentflow/form-reader.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "contentflow/async-content-source.hpp"
#include "contentflow/compression-test-helpers.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-limits-config.hpp"
#include "contentflow/decoding-source.hpp"
#include "contentflow/decompression-config.hpp"
#include "contentflow/encoding.hpp"
#include "contentflow/limited-source.hpp"
#include "contentflow/scripted-content-source.hpp"

namespace contentflow {

namespace {

std::unique_ptr<LimitedSource> MakeForm(std::string_view body, const ContentLimitsConfig& perCall = {},
                                        std::string_view contentEncoding = "", std::size_t split = 0) {
  auto raw = std::make_unique<test::ScriptedContentSource>(test::ScriptedContentSource::Split(body, split));
  return MakeDecodingSource(std::move(raw), contentEncoding, DecompressionConfig{}, ResolveContentLimits(perCall));
}

FormResult ReadAsync(std::unique_ptr<LimitedSource> source) {
  std::optional<FormResult> result;
  DrainHandle handle = ReadFormFieldsAsync(std::move(source), [&result](FormResult res) { result = std::move(res); });
  EXPECT_TRUE(handle.done());
  return std::move(*result);
}

std::string MakeFormBody(int nbKeys) {
  std::string body;
  for (int i = 0; i < nbKeys; ++i) {
    if (i != 0) {
      body.push_back('&');
    }
    body.append("key").append(std::to_string(i)).append("=v");
  }
  return body;
}

}  // namespace

TEST(FormReader, Blocking) {
  auto source = MakeForm("a=1&b=hello+world", {}, "", 3);
  const FormResult result = ReadFormFields(*source);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.fields.get("a"), "1");
  EXPECT_EQ(result.fields.get("b"), "hello world");
}

TEST(FormReader, EmptyBody) {
  auto source = MakeForm("");
  const FormResult result = ReadFormFields(*source);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.fields.empty());
}

TEST(FormReader, FieldCountLimit) {
  const ContentLimitsConfig perCall{.maxFields = 5};
  auto ok = MakeForm(MakeFormBody(5), perCall);
  EXPECT_TRUE(ReadFormFields(*ok).ok());

  auto source = MakeForm(MakeFormBody(6), perCall);
  const FormResult result = ReadFormFields(*source);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.failure->kind, FailureKind::LimitExceeded);
  EXPECT_EQ(result.failure->limit, LimitKind::Count);
  EXPECT_TRUE(result.fields.empty());
}

TEST(FormReader, DefaultFieldCountLimit) {
  auto source = MakeForm(MakeFormBody(1001), ContentLimitsConfig{.maxLength = -1});
  const FormResult result = ReadFormFields(*source);
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.failure->isLimit(LimitKind::Count));

  auto unbounded = MakeForm(MakeFormBody(1001), ContentLimitsConfig{.maxLength = -1, .maxFields = 0});
  const FormResult res = ReadFormFields(*unbounded);
  ASSERT_TRUE(res.ok());
  EXPECT_EQ(res.fields.size(), 1001U);
}

TEST(FormReader, SizeLimit) {
  auto source = MakeForm("a=0123456789", ContentLimitsConfig{.maxLength = 8}, "", 2);
  const FormResult result = ReadFormFields(*source);
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.failure->isLimit(LimitKind::Size));
}

TEST(FormReader, BlockingAndAsyncAgree) {
  const std::string body = "x=1&y=2&x=3&z=%7E";
  for (std::size_t split : {std::size_t{1}, std::size_t{4}, std::size_t{0}}) {
    SCOPED_TRACE(testing::Message() << "split=" << split);
    auto blockingSource = MakeForm(body, {}, "", split);
    const FormResult blocking = ReadFormFields(*blockingSource);
    const FormResult async = ReadAsync(MakeForm(body, {}, "", split));
    ASSERT_TRUE(blocking.ok());
    ASSERT_TRUE(async.ok());
    EXPECT_EQ(async.fields.size(), blocking.fields.size());
    EXPECT_EQ(async.fields.values("x").size(), 2U);
    EXPECT_EQ(async.fields.get("z"), "~");
    EXPECT_EQ(blocking.fields.get("z"), "~");
  }

  const ContentLimitsConfig perCall{.maxFields = 2};
  const FormResult blocking = [&] {
    auto source = MakeForm(body, perCall);
    return ReadFormFields(*source);
  }();
  const FormResult async = ReadAsync(MakeForm(body, perCall));
  ASSERT_FALSE(blocking.ok());
  ASSERT_FALSE(async.ok());
  EXPECT_EQ(blocking.failure->limit, async.failure->limit);
}

TEST(FormReader, AsyncProducer) {
  auto raw = std::make_unique<AsyncContentSource>();
  AsyncContentSource* producerSide = raw.get();
  auto source = MakeDecodingSource(std::move(raw), "", {}, ResolveContentLimits({}));

  std::optional<FormResult> result;
  DrainHandle handle = ReadFormFieldsAsync(std::move(source), [&result](FormResult res) { result = std::move(res); });
  producerSide->write("na");
  producerSide->write("me=va");
  EXPECT_FALSE(result);
  producerSide->write("lue&other=1");
  producerSide->close();
  ASSERT_TRUE(result);
  ASSERT_TRUE(result->ok());
  EXPECT_EQ(result->fields.get("name"), "value");
  EXPECT_EQ(result->fields.get("other"), "1");
}

#ifdef CONTENTFLOW_ENABLE_ZLIB
TEST(FormReader, CompressedForm) {
  const std::string compressed = test::Compress(Encoding::gzip, "user=alice&role=admin");
  auto source = MakeForm(compressed, {}, "gzip", 5);
  const FormResult result = ReadFormFields(*source);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.fields.get("user"), "alice");
  EXPECT_EQ(result.fields.get("role"), "admin");
}

TEST(FormReader, CompressedFormFieldBomb) {
  const std::string compressed = test::Compress(Encoding::gzip, MakeFormBody(5000));
  auto source = MakeForm(compressed, ContentLimitsConfig{.maxLength = 0}, "gzip");
  const FormResult result = ReadFormFields(*source);
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.failure->isLimit(LimitKind::Count));
}
#endif

}  // namespace contentflow
