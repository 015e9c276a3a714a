#ifndef MERKSEAL_ABI_CODEC_HPP
#define MERKSEAL_ABI_CODEC_HPP

#include "anchor/anchor_registry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace merkseal {
namespace abi {

/// Selector of getBatch(uint256): first four bytes of its Keccak-256.
inline constexpr const char *GET_BATCH_SELECTOR = "5ac44282";

inline constexpr size_t WORD_SIZE = 32;

/// 0x-prefixed call data for getBatch(@p batchId).
std::string encodeGetBatchCall(uint64_t batchId);

/**
 * @brief Decode hex text (optional 0x prefix) into raw bytes.
 * @throws std::invalid_argument on odd length or non-hex characters.
 */
std::vector<uint8_t> hexToBytes(const std::string &hex);

/**
 * @brief Decode the (bytes32, address, string, uint256) return tuple.
 * @throws std::invalid_argument if the data is truncated, the string
 *         offset points outside the data, or the timestamp exceeds 64 bits.
 */
AnchoredBatch decodeGetBatchResult(const std::string &hex);

} // namespace abi
} // namespace merkseal

#endif // MERKSEAL_ABI_CODEC_HPP
