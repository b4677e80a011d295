#include <gtest/gtest.h>

#include <chrono>
#include <set>

#include "face_core/errors.hpp"
#include "face_core/sessions/session_registry.hpp"

using namespace face_core;
using namespace std::chrono_literals;

class SessionRegistryTest : public ::testing::Test {
 protected:
  SessionRegistryTest()
      : now_(std::chrono::system_clock::now()),
        registry_(std::chrono::minutes(30), [this] { return now_; }) {}

  void advance(std::chrono::seconds by) {
    now_ += by;
  }

  std::chrono::system_clock::time_point now_;
  SessionRegistry registry_;
  std::vector<float> reference_ = {1.0f, 0.0f, 0.0f, 0.0f};
};

TEST_F(SessionRegistryTest, CreateReturnsDistinctHexTokens) {
  std::string a = registry_.create("room1", reference_);
  std::string b = registry_.create("room1", reference_);

  EXPECT_NE(a, b);
  EXPECT_EQ(a.size(), 32u);
  EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
  EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(SessionRegistryTest, GetReturnsSessionBeforeTimeout) {
  std::string id = registry_.create("room1", reference_);
  advance(29min);

  auto session = registry_.get(id);

  ASSERT_TRUE(session.has_value());
  EXPECT_EQ(session->library, "room1");
  EXPECT_EQ(session->reference_embedding, reference_);
}

TEST_F(SessionRegistryTest, SessionExpiresAfterTimeoutAndStaysExpired) {
  // Arrange
  std::string id = registry_.create("room1", reference_);

  // Act
  advance(31min);
  auto first = registry_.get(id);
  auto second = registry_.get(id);

  // Assert
  EXPECT_FALSE(first.has_value());
  EXPECT_FALSE(second.has_value());
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(SessionRegistryTest, RequireThrowsForExpiredAndUnknownSessions) {
  std::string id = registry_.create("room1", reference_);
  advance(31min);

  EXPECT_THROW(registry_.require(id), SessionExpired);
  EXPECT_THROW(registry_.require("no-such-session"), SessionExpired);
}

TEST_F(SessionRegistryTest, AppendQueryRecordsInOrder) {
  std::string id = registry_.create("room1", reference_);

  EXPECT_TRUE(registry_.append_query(id, "photos at the beach", "Found 2 photo(s)"));
  advance(1min);
  EXPECT_TRUE(registry_.append_query(id, "in Lisbon", "Found 1 photo(s) from Lisbon"));

  auto session = registry_.require(id);
  ASSERT_EQ(session.query_log.size(), 2u);
  EXPECT_EQ(session.query_log[0].query_text, "photos at the beach");
  EXPECT_EQ(session.query_log[1].response_summary, "Found 1 photo(s) from Lisbon");
  EXPECT_LT(session.query_log[0].at, session.query_log[1].at);
}

TEST_F(SessionRegistryTest, AppendQueryOnMissingSessionReturnsFalse) {
  std::string id = registry_.create("room1", reference_);
  advance(31min);

  EXPECT_FALSE(registry_.append_query(id, "q", "s"));
  EXPECT_FALSE(registry_.append_query("unknown", "q", "s"));
}

TEST_F(SessionRegistryTest, QueriesDoNotExtendTheTimeout) {
  std::string id = registry_.create("room1", reference_);
  advance(20min);
  ASSERT_TRUE(registry_.append_query(id, "q", "s"));
  advance(11min);

  EXPECT_FALSE(registry_.get(id).has_value());
}

TEST_F(SessionRegistryTest, SweepRemovesOnlyExpiredSessions) {
  registry_.create("room1", reference_);
  advance(20min);
  std::string fresh = registry_.create("room2", reference_);
  advance(11min);

  size_t removed = registry_.sweep_expired();

  EXPECT_EQ(removed, 1u);
  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_TRUE(registry_.get(fresh).has_value());
}

TEST(SessionRegistryConstructionTest, RejectsNonPositiveTimeout) {
  EXPECT_THROW((SessionRegistry{std::chrono::seconds(0)}), std::invalid_argument);
}
