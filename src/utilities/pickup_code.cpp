#include "utilities/pickup_code.hpp"

#include "utilities/relay_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sodium.h>
#include <stdexcept>

namespace quickshare {

bool PickupCode::isValidSegment(const std::string &segment) {
  if (segment.size() != SEGMENT_LENGTH) {
    return false;
  }
  return std::all_of(segment.begin(), segment.end(), [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
  });
}

std::string PickupCode::normalizeSegment(const std::string &segment) {
  std::string upper(segment);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  if (!isValidSegment(upper)) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Code segment must be 6 characters of A-Z or 0-9");
  }
  return upper;
}

PickupCode PickupCode::parse(const std::string &fullCode) {
  if (fullCode.size() != CODE_LENGTH) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Pickup code must be 12 characters, got " +
                         std::to_string(fullCode.size()));
  }
  return PickupCode(normalizeSegment(fullCode.substr(0, SEGMENT_LENGTH)),
                    normalizeSegment(fullCode.substr(SEGMENT_LENGTH)));
}

PickupCode PickupCode::compose(const std::string &lookupSegment,
                               const std::string &keySegment) {
  return PickupCode(normalizeSegment(lookupSegment),
                    normalizeSegment(keySegment));
}

std::string PickupCode::randomSegment() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  const auto alphabetSize = static_cast<uint32_t>(std::strlen(ALPHABET));
  std::string segment(SEGMENT_LENGTH, 'A');
  for (auto &c : segment) {
    // randombytes_uniform avoids modulo bias.
    c = ALPHABET[randombytes_uniform(alphabetSize)];
  }
  return segment;
}

} // namespace quickshare
