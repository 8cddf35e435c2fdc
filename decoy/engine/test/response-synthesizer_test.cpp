#include "decoy/response-synthesizer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <istream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include "decoy/body-types.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"
#include "decoy/expectation.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/multipart.hpp"
#include "decoy/named-value.hpp"
#include "decoy/request-view.hpp"
#include "decoy/responder.hpp"
#include "decoy/response-description.hpp"
#include "decoy/vector.hpp"

#ifdef DECOY_ENABLE_ZLIB
#include "decoy/zlib-codec.hpp"
#endif

namespace decoy {
namespace {

using std::chrono::milliseconds;

struct TypeA {
  std::string value;
};

struct TypeB {
  std::string value;
};

const DecoderRegistry kServerDecoders;

const RequestView kRequest = RequestView::From("GET", "/items?page=2", NamedValues{{"Accept", "*/*"}});

class ResponseSynthesizerTest : public ::testing::Test {
 protected:
  ResponseSynthesizerTest() {
    serverEncoders.add<TypeA>("application/json",
                              [](const TypeA& obj, EncodingContext&) { return "{\"globalA\":\"" + obj.value + "\"}"; });
    serverEncoders.add<TypeB>("application/json",
                              [](const TypeB& obj, EncodingContext&) { return "{\"globalB\":\"" + obj.value + "\"}"; });
  }

  void commit() { expectation.commit(nullptr, kServerDecoders, serverEncoders); }

  ResponseDescription synthesize(uint64_t callIndex = 1, const RequestView& request = kRequest) {
    return synthesizer.synthesize(expectation, callIndex, request);
  }

  EncoderRegistry serverEncoders;
  Expectation expectation;
  ResponseSynthesizer synthesizer;
};

}  // namespace

TEST_F(ResponseSynthesizerTest, WithoutResponderSendsEmptyOk) {
  commit();
  const auto response = synthesize();
  EXPECT_EQ(response.status, http::StatusCodeOK);
  EXPECT_TRUE(response.body.empty());
  EXPECT_TRUE(response.headers.empty());
  EXPECT_FALSE(response.isChunked());
  EXPECT_FALSE(response.forward);
}

TEST_F(ResponseSynthesizerTest, RespondersCycleThenLastIsReused) {
  expectation.respond(Responder(500).body("first")).respond(Responder(503).body("second")).respond(
      Responder(200).body("third"));
  commit();
  static constexpr http::StatusCode kExpected[] = {500, 503, 200, 200, 200, 200};
  for (uint64_t callIndex = 1; callIndex <= std::size(kExpected); ++callIndex) {
    EXPECT_EQ(synthesize(callIndex).status, kExpected[callIndex - 1]) << "call " << callIndex;
  }
  EXPECT_EQ(synthesize(4).body, "third");
}

TEST_F(ResponseSynthesizerTest, RawBody) {
  expectation.respond(Responder(201).header("X-Id", "9").body("hello"));
  commit();
  const auto response = synthesize();
  EXPECT_EQ(response.status, 201);
  EXPECT_EQ(response.body, "hello");
  EXPECT_EQ(response.headerValueOrEmpty("X-Id"), "9");
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);
}

TEST_F(ResponseSynthesizerTest, ExplicitContentTypeHeaderIsKept) {
  expectation.respond(Responder().header("content-type", "text/csv").body("a,b"));
  commit();
  const auto response = synthesize();
  ASSERT_EQ(response.headers.size(), 1U);
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "text/csv");
}

TEST_F(ResponseSynthesizerTest, ObjectBodyIsEncodedWithResolvedEncoder) {
  expectation.respond(Responder().object(TypeA{"x"}, "application/json"));
  commit();
  const auto response = synthesize();
  EXPECT_EQ(response.body, "{\"globalA\":\"x\"}");
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "application/json");
}

TEST_F(ResponseSynthesizerTest, StreamBodyIsReadConcurrently) {
  static constexpr int kNbThreads = 8;
  static constexpr int kNbResponsesPerThread = 100;
  const std::string content(8192, 's');
  const auto openContent = [&content]() -> std::unique_ptr<std::istream> {
    return std::make_unique<std::istringstream>(content);
  };
  expectation.respond(Responder().object(StreamSource{openContent}, "text/plain"));
  commit();

  std::atomic<int> nbComplete{0};
  {
    vector<std::jthread> threads;
    for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
      threads.emplace_back([this, &content, &nbComplete] {
        for (int pos = 0; pos < kNbResponsesPerThread; ++pos) {
          if (synthesize().body == content) {
            ++nbComplete;
          }
        }
      });
    }
  }
  EXPECT_EQ(nbComplete.load(), kNbThreads * kNbResponsesPerThread);
}

TEST_F(ResponseSynthesizerTest, ResponseEncoderOverridesOnlyItsObjectType) {
  const auto localA = [](EncoderRegistry& registry) {
    registry.add<TypeA>("application/json",
                        [](const TypeA& obj, EncodingContext&) { return "{\"localA\":\"" + obj.value + "\"}"; });
  };
  expectation.respond(Responder().object(TypeA{"1"}, "application/json").encoders(localA))
      .respond(Responder().object(TypeB{"2"}, "application/json").encoders(localA));
  commit();
  EXPECT_EQ(synthesize(1).body, "{\"localA\":\"1\"}");
  EXPECT_EQ(synthesize(2).body, "{\"globalB\":\"2\"}");
}

TEST_F(ResponseSynthesizerTest, EncoderFailureGivesInternalServerError) {
  expectation.respond(Responder().object(TypeA{"x"}, "application/json").encoders([](EncoderRegistry& registry) {
    registry.add<TypeA>("application/json",
                        [](const TypeA&, EncodingContext&) -> std::string { throw std::runtime_error("cannot encode"); });
  }));
  commit();
  const auto response = synthesize();
  EXPECT_EQ(response.status, http::StatusCodeInternalServerError);
  EXPECT_TRUE(response.body.contains("cannot encode")) << response.body;
}

TEST_F(ResponseSynthesizerTest, ChunkedBodyIsBalanced) {
  expectation.respond(
      Responder().body("abcdefghij").chunked(3, DelaySpec::Fixed(milliseconds(5))).trailer("X-Checksum", "c1"));
  commit();
  const auto response = synthesize();
  ASSERT_TRUE(response.isChunked());
  EXPECT_TRUE(response.body.empty());
  EXPECT_EQ(response.headerValueOrEmpty(http::TransferEncoding), http::chunked);
  const auto& plan = *response.streamPlan;
  ASSERT_EQ(plan.chunks.size(), 3U);
  EXPECT_EQ(plan.chunks[0].data, "abcd");
  EXPECT_EQ(plan.chunks[1].data, "efg");
  EXPECT_EQ(plan.chunks[2].data, "hij");
  for (const auto& chunk : plan.chunks) {
    EXPECT_EQ(chunk.delayAfter, milliseconds(5));
  }
  EXPECT_EQ(plan.initialDelay, milliseconds(0));
  EXPECT_EQ(plan.totalDelay(), milliseconds(15));
  EXPECT_EQ(plan.body(), "abcdefghij");
  ASSERT_EQ(response.trailers.size(), 1U);
  EXPECT_EQ(response.trailers[0].name, "X-Checksum");
}

TEST_F(ResponseSynthesizerTest, TrailersRequireChunkedResponse) {
  expectation.respond(Responder().body("abc").trailer("X-Checksum", "c1"));
  commit();
  const auto response = synthesize();
  EXPECT_FALSE(response.isChunked());
  EXPECT_TRUE(response.trailers.empty());
  EXPECT_EQ(response.body, "abc");
}

TEST_F(ResponseSynthesizerTest, DelayWithoutChunksGivesSingleChunk) {
  expectation.respond(Responder().body("late").delay(DelaySpec::Fixed(milliseconds(20))));
  commit();
  const auto response = synthesize();
  ASSERT_TRUE(response.isChunked());
  EXPECT_EQ(response.streamPlan->initialDelay, milliseconds(20));
  ASSERT_EQ(response.streamPlan->chunks.size(), 1U);
  EXPECT_EQ(response.streamPlan->chunks[0].data, "late");
  EXPECT_EQ(response.streamPlan->chunks[0].delayAfter, milliseconds(0));
}

TEST_F(ResponseSynthesizerTest, RandomDelaysStayInRange) {
  const auto delay = DelaySpec::Between(milliseconds(3), milliseconds(7));
  for (int draw = 0; draw < 100; ++draw) {
    const auto drawn = ResponseSynthesizer::DrawDelay(delay);
    EXPECT_GE(drawn, milliseconds(3));
    EXPECT_LE(drawn, milliseconds(7));
  }
  EXPECT_EQ(ResponseSynthesizer::DrawDelay(DelaySpec::Fixed(milliseconds(4))), milliseconds(4));
}

TEST(SplitBalancedTest, EdgeCases) {
  auto parts = ResponseSynthesizer::SplitBalanced("", 4);
  ASSERT_EQ(parts.size(), 1U);
  EXPECT_TRUE(parts[0].empty());

  parts = ResponseSynthesizer::SplitBalanced("ab", 5);
  ASSERT_EQ(parts.size(), 2U);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "b");

  parts = ResponseSynthesizer::SplitBalanced("abcdefgh", 4);
  ASSERT_EQ(parts.size(), 4U);
  for (const auto& part : parts) {
    EXPECT_EQ(part.size(), 2U);
  }

  parts = ResponseSynthesizer::SplitBalanced("abc", 0);
  ASSERT_EQ(parts.size(), 1U);
  EXPECT_EQ(parts[0], "abc");
}

TEST_F(ResponseSynthesizerTest, ForwardDirective) {
  expectation.respond(Responder::Forward("http://upstream:9000/"));
  commit();
  const auto request = RequestView::From(
      "POST", "/orders/1?expand=true",
      NamedValues{{"Host", "mock"}, {"Connection", "keep-alive"}, {"X-Trace", "t1"}, {"te", "trailers"}}, "payload");
  const auto response = synthesize(1, request);
  ASSERT_TRUE(response.forward);
  EXPECT_EQ(response.forward->url, "http://upstream:9000/orders/1?expand=true");
  EXPECT_EQ(response.forward->method, "POST");
  EXPECT_EQ(response.forward->body, "payload");
  ASSERT_EQ(response.forward->headers.size(), 1U);
  EXPECT_EQ(response.forward->headers[0].name, "X-Trace");
}

TEST_F(ResponseSynthesizerTest, MultipartResponse) {
  MultipartBody body;
  body.field("title", "report").object("data", TypeA{"v"}, "application/json");
  expectation.respond(Responder().multipart(body).partEncoders([](EncoderRegistry& registry) {
    registry.add<TypeA>("application/json",
                        [](const TypeA& obj, EncodingContext&) { return "{\"part\":\"" + obj.value + "\"}"; });
  }));
  commit();
  const auto response = synthesize();
  const std::string_view contentType = response.headerValueOrEmpty(http::ContentType);
  EXPECT_TRUE(contentType.starts_with("multipart/form-data; boundary=")) << contentType;

  const auto parsed = ParseMultipart(contentType, response.body);
  ASSERT_EQ(parsed.parts.size(), 2U);
  EXPECT_EQ(parsed.parts[0].name, "title");
  EXPECT_EQ(parsed.parts[0].data, "report");
  EXPECT_EQ(parsed.parts[1].name, "data");
  EXPECT_EQ(parsed.parts[1].contentType, "application/json");
  EXPECT_EQ(parsed.parts[1].data, "{\"part\":\"v\"}");
}

TEST_F(ResponseSynthesizerTest, MultipartPartFallsBackToResponseEncoders) {
  MultipartBody body;
  body.subtype = "mixed";
  body.boundary = "fixed-boundary";
  body.object("data", TypeB{"w"}, "application/json");
  expectation.respond(Responder().multipart(body));
  commit();
  const auto response = synthesize();
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "multipart/mixed; boundary=\"fixed-boundary\"");
  const auto parsed = ParseMultipart(response.headerValueOrEmpty(http::ContentType), response.body);
  ASSERT_EQ(parsed.parts.size(), 1U);
  EXPECT_EQ(parsed.parts[0].data, "{\"globalB\":\"w\"}");
}

TEST(ResponseSynthesizerNoMatchTest, NoMatch) {
  auto response = ResponseSynthesizer::NoMatch(http::StatusCodeNotFound, "nothing here", http::ContentTypeTextPlain);
  EXPECT_EQ(response.status, http::StatusCodeNotFound);
  EXPECT_EQ(response.body, "nothing here");
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);

  response = ResponseSynthesizer::NoMatch(http::StatusCodeNotFound, "", http::ContentTypeTextPlain);
  EXPECT_TRUE(response.headers.empty());
}

TEST_F(ResponseSynthesizerTest, IdentityForbiddenWithoutAlternativeIsNotAcceptable) {
  expectation.respond(Responder().body("some body"));
  commit();
  const auto request = RequestView::From("GET", "/", NamedValues{{"Accept-Encoding", "identity;q=0"}});
  const auto response = synthesize(1, request);
  EXPECT_EQ(response.status, http::StatusCodeNotAcceptable);
  EXPECT_EQ(response.body, "No acceptable content-coding available");
}

TEST_F(ResponseSynthesizerTest, NoCompressionWithoutAcceptEncoding) {
  expectation.respond(Responder().body("some body"));
  commit();
  const auto response = synthesize();
  EXPECT_EQ(response.compression.encoding, Encoding::none);
}

#ifdef DECOY_ENABLE_ZLIB

namespace {

std::string Inflate(std::string_view compressed, bool gzip = true) {
  std::string out;
  EXPECT_TRUE(ZlibInflate(compressed, gzip, 0, out));
  return out;
}

const RequestView kGzipRequest = RequestView::From("GET", "/", NamedValues{{"Accept-Encoding", "gzip"}});

}  // namespace

TEST_F(ResponseSynthesizerTest, GzipNegotiatedAndApplied) {
  const std::string body(2000, 'z');
  expectation.respond(Responder().body(body));
  commit();
  auto response = synthesize(1, kGzipRequest);
  ASSERT_EQ(response.compression.encoding, Encoding::gzip);
  EXPECT_FALSE(response.compression.level);
  EXPECT_EQ(response.body, body);

  ApplyCompression(response, synthesizer.compressionConfig());
  EXPECT_EQ(response.compression.encoding, Encoding::none);
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentEncoding), "gzip");
  EXPECT_EQ(response.headerValueOrEmpty(http::Vary), http::AcceptEncoding);
  EXPECT_LT(response.body.size(), body.size());
  EXPECT_EQ(Inflate(response.body), body);
}

TEST_F(ResponseSynthesizerTest, GzipAppliedAcrossChunks) {
  std::string body;
  for (int pos = 0; pos < 500; ++pos) {
    body.append(std::to_string(pos));
  }
  expectation.respond(Responder().body(body).header("Vary", "Origin").chunked(4));
  commit();
  auto response = synthesize(1, kGzipRequest);
  ApplyCompression(response, synthesizer.compressionConfig());
  ASSERT_TRUE(response.isChunked());
  EXPECT_EQ(response.streamPlan->chunks.size(), 4U);
  EXPECT_EQ(Inflate(response.streamPlan->body()), body);
  EXPECT_EQ(response.headerValueOrEmpty(http::Vary), "Origin, Accept-Encoding");
}

TEST_F(ResponseSynthesizerTest, PreEncodedBodyIsNotCompressedTwice) {
  expectation.respond(Responder().header("Content-Encoding", "gzip").body("already compressed"));
  commit();
  const auto response = synthesize(1, kGzipRequest);
  EXPECT_EQ(response.compression.encoding, Encoding::none);
}

TEST_F(ResponseSynthesizerTest, CompressionHonorsThresholdAndAllowList) {
  CompressionConfig config;
  config.minBytes = 100;
  config.contentTypeAllowList.emplace_back("application/json");
  ResponseSynthesizer restricted(config);

  expectation.respond(Responder().body(std::string(200, 'a'), "text/plain"))
      .respond(Responder().body(std::string(10, 'a'), "application/json"))
      .respond(Responder().body(std::string(200, 'a'), "Application/JSON; charset=utf-8"));
  commit();
  EXPECT_EQ(restricted.synthesize(expectation, 1, kGzipRequest).compression.encoding, Encoding::none);
  EXPECT_EQ(restricted.synthesize(expectation, 2, kGzipRequest).compression.encoding, Encoding::none);
  EXPECT_EQ(restricted.synthesize(expectation, 3, kGzipRequest).compression.encoding, Encoding::gzip);
}

TEST_F(ResponseSynthesizerTest, ConfiguredLevelFollowsNegotiatedEncoding) {
  CompressionConfig config;
  config.withLevel(Encoding::gzip, 1).withLevel(Encoding::deflate, 9).withLevel(Encoding::gzip, 2);
  ResponseSynthesizer leveled(config);
  expectation.respond(Responder().body(std::string(300, 'l')));
  commit();
  const auto response = leveled.synthesize(expectation, 1, kGzipRequest);
  EXPECT_EQ(response.compression, (CompressionDirective{Encoding::gzip, 2}));
}

TEST_F(ResponseSynthesizerTest, ResponderDirectiveOverridesNegotiation) {
  const std::string body(500, 'd');
  expectation.respond(Responder().body(body).compression(Encoding::deflate, 9))
      .respond(Responder().body(body).compression(Encoding::none));
  commit();

  auto imposed = synthesize();
  EXPECT_EQ(imposed.compression, (CompressionDirective{Encoding::deflate, 9}));
  ApplyCompression(imposed, synthesizer.compressionConfig());
  EXPECT_EQ(imposed.headerValueOrEmpty(http::ContentEncoding), "deflate");
  EXPECT_EQ(Inflate(imposed.body, false), body);

  EXPECT_EQ(synthesize(2, kGzipRequest).compression.encoding, Encoding::none);
}

TEST_F(ResponseSynthesizerTest, ResponderDirectiveLevelIsChecked) {
  EXPECT_THROW(Responder().compression(Encoding::gzip, 10), std::invalid_argument);
  EXPECT_THROW(Responder().compression(Encoding::gzip, -2), std::invalid_argument);
  EXPECT_NO_THROW(Responder().compression(Encoding::gzip, 0));
}

#endif

}  // namespace decoy
