#include "crypto/key_envelope.hpp"
#include "utilities/pickup_code.hpp"
#include "utilities/relay_error.hpp"

#include <cppcodec/hex_lower.hpp>
#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace quickshare;
using namespace quickshare::crypto;

namespace {

std::string hex(const Key &key) {
  return cppcodec::hex_lower::encode(key.data(), key.size());
}

} // namespace

TEST(KeyEnvelopeTest, ContentKeysAreRandom) {
  Key a = generateContentKey();
  Key b = generateContentKey();
  EXPECT_NE(a, b);
}

TEST(KeyEnvelopeTest, WrappingKeyIsDeterministicPbkdf2) {
  // PBKDF2-HMAC-SHA256("K3Y5EG", "quick-share-salt-K3Y5EG", 100000, 32)
  EXPECT_EQ(hex(deriveWrappingKey("K3Y5EG")),
            "7849d67e884abf948fa0dff65e34c66215e86955ddcbbd3a9d76076453b76e69");
  // Lower-case input normalizes to the same segment.
  EXPECT_EQ(deriveWrappingKey("k3y5eg"), deriveWrappingKey("K3Y5EG"));
  EXPECT_NE(deriveWrappingKey("K3Y5EG"), deriveWrappingKey("K3Y5EH"));
}

TEST(KeyEnvelopeTest, RejectsMalformedSegment) {
  try {
    deriveWrappingKey("SHORT");
    FAIL() << "expected RelayError";
  } catch (const RelayError &e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidRequest);
  }
}

TEST(KeyEnvelopeTest, WrapUnwrap) {
  Key content = generateContentKey();
  Key wrapping = deriveWrappingKey("ABCDEF");
  Bytes wrapped = wrapKey(content, wrapping);
  ASSERT_EQ(wrapped.size(), WRAPPED_KEY_BYTES);
  EXPECT_EQ(unwrapKey(wrapped, wrapping), content);

  // Fresh nonce per wrap.
  EXPECT_NE(wrapKey(content, wrapping), wrapped);
}

TEST(KeyEnvelopeTest, WrongSegmentFailsUnwrap) {
  Key content = generateContentKey();
  Bytes wrapped = wrapKey(content, deriveWrappingKey("ABCDEF"));
  try {
    unwrapKey(wrapped, deriveWrappingKey("ABCDEG"));
    FAIL() << "expected KeyUnwrapError";
  } catch (const RelayError &e) {
    EXPECT_EQ(e.code(), ErrorCode::KeyUnwrapError);
  }
}

TEST(KeyEnvelopeTest, RandomWrongSegmentsAllFailUnwrap) {
  constexpr std::size_t kSamples = 24;
  const std::string segment = PickupCode::randomSegment();
  Key content = generateContentKey();
  Bytes wrapped = wrapKey(content, deriveWrappingKey(segment));

  std::set<std::string> tried;
  while (tried.size() < kSamples) {
    std::string guess = PickupCode::randomSegment();
    if (guess == segment || !tried.insert(guess).second) {
      continue;
    }
    try {
      unwrapKey(wrapped, deriveWrappingKey(guess));
      ADD_FAILURE() << "segment " << guess << " unwrapped the key of " << segment;
    } catch (const RelayError &e) {
      EXPECT_EQ(e.code(), ErrorCode::KeyUnwrapError) << guess;
    }
  }
}

TEST(KeyEnvelopeTest, TamperedOrTruncatedEnvelopeFails) {
  Key content = generateContentKey();
  Key wrapping = deriveWrappingKey("ABCDEF");
  Bytes wrapped = wrapKey(content, wrapping);

  Bytes flipped = wrapped;
  flipped[NONCE_BYTES + 3] ^= std::byte{0x01};
  EXPECT_THROW(unwrapKey(flipped, wrapping), RelayError);

  Bytes truncated(wrapped.begin(), wrapped.end() - 1);
  try {
    unwrapKey(truncated, wrapping);
    FAIL() << "expected KeyUnwrapError";
  } catch (const RelayError &e) {
    EXPECT_EQ(e.code(), ErrorCode::KeyUnwrapError);
  }
}
