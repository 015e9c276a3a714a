#ifndef MERKSEAL_DIGEST_HPP
#define MERKSEAL_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace merkseal {

/// Digest size for SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/// The all-zero digest used as the legacy padding sentinel.
inline constexpr Digest ZERO_DIGEST{};

/**
 * @brief Encode a digest as 64 lowercase hex characters, no prefix.
 */
std::string digestToHex(const Digest &digest);

/**
 * @brief Decode a textual digest.
 *
 * Accepts upper or lower case and an optional "0x"/"0X" prefix.
 * @throws std::invalid_argument on wrong length or non-hex characters.
 */
Digest parseDigest(const std::string &text);

/**
 * @brief Lowercase a textual digest and strip any "0x" prefix.
 *
 * Does not validate the characters; see parseDigest for that.
 */
std::string normalizeDigestHex(const std::string &text);

/**
 * @brief Compare two textual digests ignoring case and "0x" prefix.
 */
bool digestHexEquals(const std::string &a, const std::string &b);

/**
 * @brief True if the text is a well formed 32-byte digest.
 */
bool isDigestHex(const std::string &text);

} // namespace merkseal

#endif // MERKSEAL_DIGEST_HPP
