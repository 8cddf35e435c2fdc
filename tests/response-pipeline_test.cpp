#include <gtest/gtest.h>

#include <any>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/body-types.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/compression-config.hpp"
#include "decoy/expectation-set.hpp"
#include "decoy/http-method.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/in-process-listener.hpp"
#include "decoy/mock-server-config.hpp"
#include "decoy/mock-server.hpp"
#include "decoy/multipart.hpp"
#include "decoy/named-value.hpp"
#include "decoy/responder.hpp"
#include "decoy/response-description.hpp"

#ifdef DECOY_ENABLE_ZLIB
#include "decoy/compressor.hpp"
#include "decoy/encoding.hpp"
#include "decoy/zlib-codec.hpp"
#endif

namespace decoy {

namespace {

using std::chrono::milliseconds;

struct Order {
  std::string item;
  int quantity;
};

// Minimal 'item=quantity' text codec standing for an application codec such as JSON.
Order ParseOrder(std::string_view text) {
  const auto eq = text.find('=');
  return Order{std::string(text.substr(0, eq)), std::stoi(std::string(text.substr(eq + 1)))};
}

class ResponsePipelineTest : public ::testing::Test {
 protected:
  explicit ResponsePipelineTest(MockServerConfig config = MockServerConfig{}.withNbThreads(2)) {
    auto owned = std::make_unique<InProcessListener>();
    listener = owned.get();
    server = std::make_unique<MockServer>(std::move(config), std::move(owned));
    server->globalDecoders([](DecoderRegistry& decoders) {
      decoders.add<Order>("application/x-order", [](std::string_view bytes, const DecodingContext&) {
        return ParseOrder(bytes);
      });
    });
    server->globalEncoders([](EncoderRegistry& encoders) {
      encoders.add<Order>("application/x-order", [](const Order& order, EncodingContext&) {
        return order.item + "=" + std::to_string(order.quantity);
      });
    });
  }

  InProcessListener* listener;
  std::unique_ptr<MockServer> server;
};

}  // namespace

TEST_F(ResponsePipelineTest, DecodedBodyMatchingAndEncodedResponse) {
  server->expectations([](ExpectationSet& set) {
    set.expect()
        .method(http::Method::POST)
        .path("/orders")
        .bodyAs<Order>([](const Order& order) { return order.quantity > 10; }, "bulk order")
        .respond(Responder(http::StatusCodeAccepted).object(Order{"bulk", 1}, "application/x-order"));
    set.expect().method(http::Method::POST).path("/orders").respond(Responder().object(Order{"single", 1},
                                                                                           "application/x-order"));
  });
  server->start();

  const NamedValues headers{{"Content-Type", "application/x-order"}};
  auto response = listener->send("POST", "/orders", headers, "apple=12");
  EXPECT_EQ(response.status, http::StatusCodeAccepted);
  EXPECT_EQ(response.body, "bulk=1");
  EXPECT_EQ(response.headerValueOrEmpty("Content-Type"), "application/x-order");

  response = listener->send("POST", "/orders", headers, "apple=2");
  EXPECT_EQ(response.status, http::StatusCodeOK);
  EXPECT_EQ(response.body, "single=1");
}

TEST_F(ResponsePipelineTest, FormBodyMatching) {
  server->expectations([](ExpectationSet& set) {
    set.expect().path("/login").bodyAs<FormParams>(
        [](const FormParams& form) { return form.value("user") == "joe doe"; }, "user is joe doe");
  });
  server->start();
  const auto response = listener->send(
      "POST", "/login", NamedValues{{"Content-Type", "application/x-www-form-urlencoded"}}, "user=joe+doe&pwd=x");
  EXPECT_EQ(response.status, http::StatusCodeOK);
}

TEST_F(ResponsePipelineTest, MultipartRequestAndResponse) {
  server->expectations([](ExpectationSet& set) {
    set.expect()
        .path("/upload")
        .bodyAs<MultipartBody>(
            [](const MultipartBody& body) {
              const MultipartPart* order = body.part("order");
              return order != nullptr && std::any_cast<Order>(&order->value) != nullptr;
            },
            "has a decoded order part")
        .respond(Responder().multipart(
            MultipartBody{}.field("status", "stored").object("echo", Order{"pear", 3}, "application/x-order")));
  });
  server->start();

  MultipartBody request;
  request.boundary = "XyZ";
  request.field("comment", "hi").file("order", "order.txt", "application/x-order", "pear=3");
  std::string requestBody;
  for (const auto& part : request.parts) {
    requestBody.append("--XyZ\r\n");
    AppendMultipartPart(part, true, part.data, requestBody);
  }
  requestBody.append("--XyZ--\r\n");

  const auto response = listener->send("POST", "/upload", NamedValues{{"Content-Type", request.contentTypeHeader()}},
                                       requestBody);
  ASSERT_EQ(response.status, http::StatusCodeOK);
  const auto contentType = response.headerValueOrEmpty("Content-Type");
  ASSERT_TRUE(contentType.starts_with("multipart/form-data; boundary="));
  const MultipartBody parsed = ParseMultipart(contentType, response.body);
  ASSERT_EQ(parsed.parts.size(), 2U);
  EXPECT_EQ(parsed.parts[0].data, "stored");
  EXPECT_EQ(parsed.parts[1].data, "pear=3");
}

TEST_F(ResponsePipelineTest, ChunkedResponseWithTrailers) {
  server->expectations([](ExpectationSet& set) {
    set.expect().path("/stream").respond(Responder()
                                             .body("0123456789")
                                             .chunked(3, DelaySpec::Fixed(milliseconds(1)))
                                             .trailer("X-Checksum", "abc"));
    set.expect().path("/plain").respond(Responder().body("whole").trailer("X-Checksum", "abc"));
  });
  server->start();

  const auto streamed = listener->send("GET", "/stream");
  ASSERT_TRUE(streamed.isChunked());
  EXPECT_EQ(streamed.streamPlan->chunks.size(), 3U);
  EXPECT_EQ(streamed.streamPlan->body(), "0123456789");
  EXPECT_EQ(streamed.headerValueOrEmpty("Transfer-Encoding"), "chunked");
  ASSERT_EQ(streamed.trailers.size(), 1U);
  EXPECT_EQ(streamed.trailers[0].value, "abc");

  const auto plain = listener->send("GET", "/plain");
  EXPECT_FALSE(plain.isChunked());
  EXPECT_TRUE(plain.trailers.empty());
}

TEST_F(ResponsePipelineTest, ForwardDirective) {
  server->expectations([](ExpectationSet& set) {
    set.expect().pathGlob("/proxy/**").respond(Responder::Forward("http://upstream.local:8081"));
  });
  server->start();
  const auto response =
      listener->send("PUT", "/proxy/a?b=1", NamedValues{{"Host", "mock"}, {"X-Trace", "t1"}}, "payload");
  ASSERT_TRUE(response.forward);
  EXPECT_EQ(response.forward->url, "http://upstream.local:8081/proxy/a?b=1");
  EXPECT_EQ(response.forward->method, "PUT");
  EXPECT_EQ(response.forward->body, "payload");
  ASSERT_EQ(response.forward->headers.size(), 1U);
  EXPECT_EQ(response.forward->headers[0].name, "X-Trace");
}

#ifdef DECOY_ENABLE_ZLIB

namespace {

std::string Gunzip(std::string_view compressed) {
  std::string out;
  EXPECT_TRUE(ZlibInflate(compressed, true, 0, out));
  return out;
}

std::string Gzip(std::string_view plain) { return CompressAll(CompressionDirective{Encoding::gzip, {}}, plain); }

}  // namespace

TEST_F(ResponsePipelineTest, CompressedRequestAndResponse) {
  const std::string largeBody(4096, 'z');
  server->expectations([&largeBody](ExpectationSet& set) {
    set.expect().path("/gz").body("apple=12").respond(Responder().body(largeBody));
  });
  server->start();

  const auto response = listener->send(
      "POST", "/gz",
      NamedValues{{"Content-Type", "application/x-order"}, {"Content-Encoding", "gzip"}, {"Accept-Encoding", "gzip"}},
      Gzip("apple=12"));
  ASSERT_EQ(response.status, http::StatusCodeOK);
  EXPECT_EQ(response.headerValueOrEmpty("Content-Encoding"), "gzip");
  EXPECT_EQ(response.headerValueOrEmpty("Vary"), "Accept-Encoding");
  EXPECT_EQ(Gunzip(response.body), largeBody);
}

#endif

}  // namespace decoy
