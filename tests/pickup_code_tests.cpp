#include "utilities/pickup_code.hpp"
#include "utilities/relay_error.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>

using quickshare::ErrorCode;
using quickshare::PickupCode;
using quickshare::RelayError;

TEST(PickupCodeTest, ParseSplitsAndUppercases) {
  auto code = PickupCode::parse("abc123xyz789");
  EXPECT_EQ(code.lookupSegment(), "ABC123");
  EXPECT_EQ(code.keySegment(), "XYZ789");
  EXPECT_EQ(code.full(), "ABC123XYZ789");
}

TEST(PickupCodeTest, ParseRejectsBadInput) {
  for (const std::string bad : {"", "ABC123", "ABC123XYZ7890", "ABC12-XYZ789", "ABC123 XYZ78"}) {
    try {
      PickupCode::parse(bad);
      FAIL() << "accepted '" << bad << "'";
    } catch (const RelayError &e) {
      EXPECT_EQ(e.code(), ErrorCode::InvalidRequest);
    }
  }
}

TEST(PickupCodeTest, ComposeNormalizes) {
  auto code = PickupCode::compose("abc123", "k3y5eg");
  EXPECT_EQ(code.full(), "ABC123K3Y5EG");
  EXPECT_THROW(PickupCode::compose("ABC12", "K3Y5EG"), RelayError);
}

TEST(PickupCodeTest, RandomSegmentsAreValidAndVaried) {
  std::set<std::string> seen;
  for (int i = 0; i < 200; ++i) {
    auto segment = PickupCode::randomSegment();
    ASSERT_TRUE(PickupCode::isValidSegment(segment)) << segment;
    seen.insert(segment);
  }
  // 36^6 possibilities; 200 draws colliding more than once is not credible.
  EXPECT_GE(seen.size(), 199u);
}
