#include "anchor/abi_codec.hpp"

#include <algorithm>
#include <sodium.h>
#include <stdexcept>

namespace merkseal {
namespace abi {

namespace {

// Big-endian unsigned word that must fit in 64 bits.
uint64_t wordToU64(const std::vector<uint8_t> &data, size_t offset,
                   const char *what) {
  if (offset + WORD_SIZE > data.size())
    throw std::invalid_argument(std::string("ABI data truncated at ") + what);
  for (size_t i = 0; i < WORD_SIZE - 8; ++i) {
    if (data[offset + i] != 0)
      throw std::invalid_argument(std::string(what) +
                                  " does not fit in 64 bits");
  }
  uint64_t v = 0;
  for (size_t i = WORD_SIZE - 8; i < WORD_SIZE; ++i)
    v = (v << 8) | data[offset + i];
  return v;
}

std::string bytesToHex(const uint8_t *data, size_t size) {
  std::string hex(size * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), data, size);
  hex.pop_back();
  return hex;
}

} // namespace

std::string encodeGetBatchCall(uint64_t batchId) {
  uint8_t word[WORD_SIZE] = {0};
  for (size_t i = 0; i < 8; ++i)
    word[WORD_SIZE - 1 - i] = static_cast<uint8_t>(batchId >> (8 * i));
  return std::string("0x") + GET_BATCH_SELECTOR + bytesToHex(word, WORD_SIZE);
}

std::vector<uint8_t> hexToBytes(const std::string &hex) {
  std::string text = hex;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    text.erase(0, 2);
  if (text.size() % 2 != 0)
    throw std::invalid_argument("Hex data has odd length");

  std::vector<uint8_t> out(text.size() / 2);
  size_t binLen = 0;
  const char *end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), text.data(), text.size(), nullptr,
                     &binLen, &end) != 0 ||
      binLen != out.size()) {
    throw std::invalid_argument("Hex data contains non-hex characters");
  }
  return out;
}

AnchoredBatch decodeGetBatchResult(const std::string &hex) {
  const std::vector<uint8_t> data = hexToBytes(hex);
  if (data.size() < 4 * WORD_SIZE)
    throw std::invalid_argument("ABI data too short for getBatch result: " +
                                std::to_string(data.size()) + " bytes");

  AnchoredBatch batch;
  std::copy(data.begin(), data.begin() + WORD_SIZE, batch.root.begin());

  // address: right-aligned 20 bytes of word 1
  for (size_t i = 0; i < WORD_SIZE - 20; ++i) {
    if (data[WORD_SIZE + i] != 0)
      throw std::invalid_argument("owner does not fit in 20 bytes");
  }
  batch.owner = "0x" + bytesToHex(data.data() + WORD_SIZE + 12, 20);

  const uint64_t strOffset = wordToU64(data, 2 * WORD_SIZE, "string offset");
  batch.timestamp = wordToU64(data, 3 * WORD_SIZE, "timestamp");

  if (strOffset > data.size() || data.size() - strOffset < WORD_SIZE)
    throw std::invalid_argument("ABI string offset out of range");
  const uint64_t strLen = wordToU64(data, strOffset, "string length");
  const size_t strStart = strOffset + WORD_SIZE;
  if (strLen > data.size() - strStart)
    throw std::invalid_argument("ABI string runs past the end of the data");
  batch.metaUri.assign(reinterpret_cast<const char *>(data.data() + strStart),
                       strLen);
  return batch;
}

} // namespace abi
} // namespace merkseal
