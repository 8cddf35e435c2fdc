#include "decoy/match-engine.hpp"

#include <gtest/gtest.h>

#include <any>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include "decoy/codec-registry.hpp"
#include "decoy/expectation-store.hpp"
#include "decoy/expectation.hpp"
#include "decoy/http-method.hpp"
#include "decoy/matcher.hpp"
#include "decoy/multipart.hpp"
#include "decoy/named-value.hpp"
#include "decoy/request-view.hpp"
#include "decoy/value-matcher.hpp"
#include "decoy/vector.hpp"

namespace decoy {
namespace {

const DecoderRegistry kServerDecoders;
const EncoderRegistry kServerEncoders;

class MatchEngineTest : public ::testing::Test {
 protected:
  Expectation& expect() {
    auto& expectation = _pending.emplace_back(std::make_shared<Expectation>());
    return *expectation;
  }

  Requirement& require() {
    auto& requirement = _pendingRequirements.emplace_back(std::make_shared<Requirement>());
    return *requirement;
  }

  void commit() {
    for (auto& expectation : _pending) {
      expectation->commit(nullptr, kServerDecoders, kServerEncoders);
    }
    vector<std::shared_ptr<const Requirement>> requirements(_pendingRequirements.begin(), _pendingRequirements.end());
    store.addRequirements(std::move(requirements));
    store.add(std::move(_pending));
    _pending.clear();
    _pendingRequirements.clear();
  }

  ExpectationStore store;
  MatchEngine engine{store};

 private:
  vector<std::shared_ptr<Expectation>> _pending;
  vector<std::shared_ptr<Requirement>> _pendingRequirements;
};

RequestView Get(std::string_view target, NamedValues headers = {}) {
  return RequestView::From("GET", target, std::move(headers));
}

}  // namespace

TEST_F(MatchEngineTest, FirstRegisteredWins) {
  expect().pathGlob("/users/*");
  expect().path("/users/1");
  commit();

  for (int run = 0; run < 5; ++run) {
    const auto result = engine.match(Get("/users/1"));
    ASSERT_TRUE(result.matched());
    EXPECT_EQ(result.expectation->index(), 1U);
    EXPECT_EQ(result.callIndex, static_cast<uint64_t>(run + 1));
    EXPECT_FALSE(result.mismatchReport);
  }
  const auto snapshot = store.snapshot();
  EXPECT_EQ(snapshot->expectations[0]->nbCalls(), 5U);
  EXPECT_EQ(snapshot->expectations[1]->nbCalls(), 0U);
}

TEST_F(MatchEngineTest, LaterExpectationMatchesWhenEarlierFails) {
  expect().method(http::Method::POST).path("/users");
  expect().method(http::Method::GET).path("/users");
  commit();

  const auto result = engine.match(Get("/users"));
  ASSERT_TRUE(result.matched());
  EXPECT_EQ(result.expectation->index(), 2U);
}

TEST_F(MatchEngineTest, EmptyExpectationMatchesAnything) {
  expect();
  commit();
  EXPECT_TRUE(engine.match(Get("/whatever?x=1")).matched());
}

TEST_F(MatchEngineTest, NoExpectationGivesEmptyReport) {
  const auto result = engine.match(Get("/nothing"));
  EXPECT_FALSE(result.matched());
  ASSERT_TRUE(result.mismatchReport);
  EXPECT_TRUE(result.mismatchReport->entries.empty());
  EXPECT_EQ(result.mismatchReport->summary(), "GET /nothing matched none of 0 expectations (0 matchers passed, 0 failed)");
}

TEST_F(MatchEngineTest, RequirementIsAndedIntoExpectations) {
  require().pathGlob("/api/**").header("Authorization", ValueMatcher::Present());
  expect().pathGlob("/api/**");
  expect().path("/health");
  commit();

  EXPECT_FALSE(engine.match(Get("/api/orders")).matched());
  EXPECT_TRUE(engine.match(Get("/api/orders", {{"Authorization", "Bearer t"}})).matched());
  // out of the requirement scope
  EXPECT_TRUE(engine.match(Get("/health")).matched());
}

TEST_F(MatchEngineTest, RequirementConflictingWithExpectationNeverMatches) {
  require().header("X-Env", "prod");
  expect().header("X-Env", "test");
  commit();

  EXPECT_FALSE(engine.match(Get("/", {{"X-Env", "test"}})).matched());
  EXPECT_FALSE(engine.match(Get("/", {{"X-Env", "prod"}})).matched());
}

TEST_F(MatchEngineTest, MismatchReportIsComplete) {
  expect().method(http::Method::POST).path("/orders").header("X-A", "1");
  expect().path("/orders").query("page", "2");
  expect().pathGlob("/other/*");
  require().header("X-Tenant", ValueMatcher::Present());
  commit();

  const auto request = Get("/orders?page=1", {{"X-A", "1"}});
  const auto result = engine.match(request);
  ASSERT_FALSE(result.matched());
  ASSERT_TRUE(result.mismatchReport);
  const auto& report = *result.mismatchReport;
  EXPECT_EQ(report.method, "GET");
  EXPECT_EQ(report.target, "/orders?page=1");
  ASSERT_EQ(report.entries.size(), 3U);

  // every matcher is listed, even after the first failure, plus the requirement constraint
  const auto snapshot = store.snapshot();
  for (std::size_t pos = 0; pos < report.entries.size(); ++pos) {
    const auto& entry = report.entries[pos];
    const auto& expectation = *snapshot->expectations[pos];
    EXPECT_EQ(entry.expectationIndex, pos + 1U);
    ASSERT_EQ(entry.outcomes.size(), expectation.nbMatchers() + 1U);

    MatchContext ctx(request);
    std::size_t outcomePos = 0;
    expectation.forEachMatcher([&](const Matcher& matcher) {
      EXPECT_EQ(entry.outcomes[outcomePos].passed, matcher.matches(ctx, expectation.decoderChain()));
      EXPECT_EQ(entry.outcomes[outcomePos].description, matcher.describe());
      ++outcomePos;
      return true;
    });
    EXPECT_FALSE(entry.outcomes.back().passed);
    EXPECT_EQ(entry.outcomes.back().description, "requirement: header 'X-Tenant' is present");
  }
  EXPECT_FALSE(report.entries[0].outcomes[0].passed);
  EXPECT_TRUE(report.entries[0].outcomes[1].passed);
  EXPECT_TRUE(report.entries[0].outcomes[2].passed);
  EXPECT_EQ(report.entries[1].nbPassed(), 1U);
  EXPECT_EQ(report.entries[1].nbFailed(), 2U);
  EXPECT_EQ(report.summary(), "GET /orders?page=1 matched none of 3 expectations (3 matchers passed, 6 failed)");

  // no call was counted
  for (const auto& expectation : snapshot->expectations) {
    EXPECT_EQ(expectation->nbCalls(), 0U);
  }
}

TEST_F(MatchEngineTest, ThrowingPredicateIsASoftFailure) {
  expect().header("X-A", ValueMatcher::Satisfies(
                             [](std::string_view) -> bool { throw std::runtime_error("boom"); }, "explodes"));
  expect().path("/fallback");
  commit();

  const auto result = engine.match(Get("/fallback", {{"X-A", "1"}}));
  ASSERT_TRUE(result.matched());
  EXPECT_EQ(result.expectation->index(), 2U);

  const auto report = engine.explain(Get("/elsewhere", {{"X-A", "1"}}));
  ASSERT_EQ(report.entries.size(), 2U);
  ASSERT_EQ(report.entries[0].outcomes.size(), 1U);
  EXPECT_FALSE(report.entries[0].outcomes[0].passed);
  EXPECT_TRUE(report.entries[0].outcomes[0].description.contains("boom")) << report.entries[0].outcomes[0].description;
}

TEST_F(MatchEngineTest, UndecodableBodyIsASoftFailure) {
  expect().method(http::Method::POST).bodyObject([](const std::any&) { return true; }, "anything");
  expect().method(http::Method::POST);
  commit();

  const auto request =
      RequestView::From("POST", "/upload", NamedValues{{"Content-Type", "text/plain; charset=us-ascii"}}, "caf\xC3\xA9");
  const auto result = engine.match(request);
  ASSERT_TRUE(result.matched());
  EXPECT_EQ(result.expectation->index(), 2U);
}

// Parts are decoded through the chain of each expectation, so a decoded body is not shared between chains.
TEST_F(MatchEngineTest, DecodedPartsFollowTheChainOfEachExpectation) {
  expect().bodyAs<MultipartBody>([](const MultipartBody&) { return false; }, "never");
  expect()
      .decoders([](DecoderRegistry& registry) {
        registry.add<int>("application/json", [](std::string_view, const DecodingContext&) { return 42; });
      })
      .bodyAs<MultipartBody>(
          [](const MultipartBody& body) {
            for (const auto& part : body.parts) {
              if (std::any_cast<int>(&part.value) == nullptr) {
                return false;
              }
            }
            return !body.parts.empty();
          },
          "every part is an int");
  commit();

  static constexpr std::string_view kBody =
      "--b\r\nContent-Disposition: form-data; name=\"n\"\r\nContent-Type: application/json\r\n\r\n{}\r\n--b--\r\n";
  const auto request = RequestView::From("POST", "/", NamedValues{{"Content-Type", "multipart/form-data; boundary=b"}},
                                         std::string(kBody));
  const auto result = engine.match(request);
  ASSERT_TRUE(result.matched());
  EXPECT_EQ(result.expectation->index(), 2U);
}

TEST_F(MatchEngineTest, ConcurrentMatchesCountEveryCall) {
  static constexpr int kNbThreads = 8;
  static constexpr int kNbRequestsPerThread = 250;

  expect().path("/a");
  expect().path("/b");
  commit();

  std::atomic<int> nbMatched{0};
  {
    vector<std::jthread> threads;
    for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
      threads.emplace_back([this, &nbMatched, threadPos] {
        for (int pos = 0; pos < kNbRequestsPerThread; ++pos) {
          if (engine.match(Get((threadPos + pos) % 2 == 0 ? "/a" : "/b")).matched()) {
            ++nbMatched;
          }
        }
      });
    }
  }
  const auto snapshot = store.snapshot();
  EXPECT_EQ(nbMatched.load(), kNbThreads * kNbRequestsPerThread);
  EXPECT_EQ(snapshot->expectations[0]->nbCalls() + snapshot->expectations[1]->nbCalls(),
            static_cast<uint64_t>(kNbThreads * kNbRequestsPerThread));
}

}  // namespace decoy
