#include "decoy/expectation-store.hpp"

#include <gtest/gtest.h>

#include <memory>

#include "decoy/call-counter.hpp"
#include "decoy/expectation.hpp"
#include "decoy/vector.hpp"

namespace decoy {

TEST(ExpectationStoreTest, AddAssignsRegistrationIndexes) {
  ExpectationStore store;
  EXPECT_EQ(store.size(), 0U);

  vector<std::shared_ptr<Expectation>> first;
  first.push_back(std::make_shared<Expectation>());
  first.push_back(std::make_shared<Expectation>());
  store.add(first);
  vector<std::shared_ptr<Expectation>> second;
  second.push_back(std::make_shared<Expectation>());
  store.add(second);

  const auto snapshot = store.snapshot();
  ASSERT_EQ(snapshot->expectations.size(), 3U);
  EXPECT_EQ(snapshot->expectations[0]->index(), 1U);
  EXPECT_EQ(snapshot->expectations[1]->index(), 2U);
  EXPECT_EQ(snapshot->expectations[2]->index(), 3U);
  EXPECT_EQ(snapshot->expectations[2].get(), second[0].get());
}

TEST(ExpectationStoreTest, SnapshotsAreImmutable) {
  ExpectationStore store;
  store.add({std::make_shared<Expectation>()});
  const auto before = store.snapshot();
  store.add({std::make_shared<Expectation>()});
  store.addRequirements({std::make_shared<const Requirement>()});
  EXPECT_EQ(before->expectations.size(), 1U);
  EXPECT_TRUE(before->requirements.empty());
  EXPECT_EQ(store.snapshot()->expectations.size(), 2U);
  EXPECT_EQ(store.snapshot()->requirements.size(), 1U);
}

TEST(ExpectationStoreTest, CountersNotifyTheStoreNotifier) {
  ExpectationStore store;
  auto expectation = std::make_shared<Expectation>();
  store.add({expectation});
  const auto generation = store.notifier()->generation();
  expectation->recordCall();
  EXPECT_GT(store.notifier()->generation(), generation);
}

TEST(ExpectationStoreTest, ClearDropsEverything) {
  ExpectationStore store;
  auto expectation = std::make_shared<Expectation>();
  store.add({expectation});
  store.addRequirements({std::make_shared<const Requirement>()});
  expectation->recordCall();

  const auto generation = store.notifier()->generation();
  store.clear();
  EXPECT_EQ(store.size(), 0U);
  EXPECT_TRUE(store.snapshot()->requirements.empty());
  EXPECT_GT(store.notifier()->generation(), generation);

  store.add({std::make_shared<Expectation>()});
  EXPECT_EQ(store.snapshot()->expectations[0]->index(), 1U);
  EXPECT_EQ(store.snapshot()->expectations[0]->nbCalls(), 0U);
}

}  // namespace decoy
