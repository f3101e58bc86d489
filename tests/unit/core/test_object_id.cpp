#include <gtest/gtest.h>

#include <set>

#include "rem/core/object_id.hpp"
#include "test_helpers.hpp"

using namespace rem::core;
using rem::ErrorCode;

TEST(ObjectIdTest, GenerateProducesValidUlid) {
  auto id = ObjectId::generate();

  EXPECT_TRUE(id.isValid());
  EXPECT_EQ(id.toString().size(), 26u);
  EXPECT_OK(ObjectId::fromString(id.toString()));
}

TEST(ObjectIdTest, GeneratedIdsAreDistinct) {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.insert(ObjectId::generate().toString());
  }
  EXPECT_EQ(ids.size(), 1000u);
}

TEST(ObjectIdTest, FromStringKeepsText) {
  auto result = ObjectId::fromString("01J8Y4N9W8K6W3K4T4S0S3QF4N");
  ASSERT_OK(result);
  EXPECT_EQ(result->toString(), "01J8Y4N9W8K6W3K4T4S0S3QF4N");
  EXPECT_TRUE(*result == *ObjectId::fromString("01J8Y4N9W8K6W3K4T4S0S3QF4N"));
}

TEST(ObjectIdTest, FromStringRejectsMalformedText) {
  EXPECT_ERROR(ObjectId::fromString("short"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(ObjectId::fromString("01J8Y4N9W8K6W3K4T4S0S3QF4NTOOLONG"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(ObjectId::fromString("01J8Y4N9W8K6W3K4T4S0S3QF4I"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(ObjectId::fromString("01j8y4n9w8k6w3k4t4s0s3qf4n"), ErrorCode::kInvalidArgument);
  // Timestamp beyond 48 bits
  EXPECT_ERROR(ObjectId::fromString("81J8Y4N9W8K6W3K4T4S0S3QF4N"), ErrorCode::kInvalidArgument);
}

TEST(ObjectIdTest, DefaultIsInvalid) {
  ObjectId id;
  EXPECT_FALSE(id.isValid());
  EXPECT_TRUE(id.toString().empty());
}
