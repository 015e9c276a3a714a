#include "utilities/digest.hpp"

#include <algorithm>
#include <cctype>
#include <sodium.h>
#include <stdexcept>

namespace merkseal {

std::string digestToHex(const Digest &digest) {
  // sodium_bin2hex writes lowercase characters plus a terminating NUL.
  char hex[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex, DIGEST_SIZE * 2);
}

std::string normalizeDigestHex(const std::string &text) {
  std::string out = text;
  if (out.size() >= 2 && out[0] == '0' && (out[1] == 'x' || out[1] == 'X'))
    out.erase(0, 2);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool isDigestHex(const std::string &text) {
  std::string hex = normalizeDigestHex(text);
  if (hex.size() != DIGEST_SIZE * 2)
    return false;
  return std::all_of(hex.begin(), hex.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; });
}

Digest parseDigest(const std::string &text) {
  if (!isDigestHex(text)) {
    throw std::invalid_argument("Invalid digest '" + text +
                                "': expected 64 hex characters");
  }
  std::string hex = normalizeDigestHex(text);
  Digest digest{};
  size_t binLen = 0;
  if (sodium_hex2bin(digest.data(), digest.size(), hex.data(), hex.size(),
                     nullptr, &binLen, nullptr) != 0 ||
      binLen != DIGEST_SIZE) {
    throw std::invalid_argument("Invalid digest '" + text + "'");
  }
  return digest;
}

bool digestHexEquals(const std::string &a, const std::string &b) {
  return normalizeDigestHex(a) == normalizeDigestHex(b);
}

} // namespace merkseal
