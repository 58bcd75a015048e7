#ifndef QUICKSHARE_PICKUP_CODE_HPP
#define QUICKSHARE_PICKUP_CODE_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace quickshare {

/**
 * @brief A 12 character pickup code split into its two halves.
 *
 * The lookup segment (first six characters) is sent to the relay and names
 * the stored artifacts. The key segment (last six) never leaves the client;
 * it only feeds the wrapping-key derivation.
 */
class PickupCode {
public:
  static constexpr std::size_t SEGMENT_LENGTH = 6;
  static constexpr std::size_t CODE_LENGTH = 2 * SEGMENT_LENGTH;
  static constexpr const char *ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

  /**
   * @brief Parse a full code, normalizing to upper case.
   * @throw RelayError(InvalidRequest) on wrong length or characters.
   */
  static PickupCode parse(const std::string &fullCode);

  /** Combine a relay-issued lookup segment with a locally drawn key segment. */
  static PickupCode compose(const std::string &lookupSegment,
                            const std::string &keySegment);

  /** Draw a random segment from ALPHABET using the system CSPRNG. */
  static std::string randomSegment();

  /** True if @p segment is SEGMENT_LENGTH characters of [A-Z0-9]. */
  static bool isValidSegment(const std::string &segment);

  /** Upper-case @p segment and validate it. */
  static std::string normalizeSegment(const std::string &segment);

  const std::string &lookupSegment() const { return lookup_; }
  const std::string &keySegment() const { return key_; }
  std::string full() const { return lookup_ + key_; }

private:
  PickupCode(std::string lookup, std::string key)
      : lookup_(std::move(lookup)), key_(std::move(key)) {}

  std::string lookup_;
  std::string key_;
};

} // namespace quickshare

#endif // QUICKSHARE_PICKUP_CODE_HPP
