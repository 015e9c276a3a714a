#include "gtest/gtest.h"
#include "utilities/blockio.hpp"
#include "utilities/digest.hpp"
#include <cctype>
#include <cstddef>   // For std::byte
#include <stdexcept> // For std::logic_error, std::invalid_argument
#include <string>
#include <vector>

using namespace merkseal;

namespace {

const std::string EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string TEST_SHA256 =
    "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";
const std::string ABC_SHA256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

// Helper function to create a vector of bytes from a string literal
std::vector<std::byte> string_to_byte_vector(const std::string &str) {
  std::vector<std::byte> vec;
  vec.reserve(str.size());
  for (char c : str)
    vec.push_back(static_cast<std::byte>(c));
  return vec;
}

} // namespace

TEST(BlockIOTest, EmptyInputHashesToKnownDigest) {
  BlockIO bio;
  DigestResult res = bio.finalize_hashed();
  EXPECT_EQ(res.hex, EMPTY_SHA256);
  EXPECT_EQ(res.size, 0u);
  EXPECT_EQ(digestToHex(hashData(std::vector<std::byte>{})), EMPTY_SHA256);
}

TEST(BlockIOTest, KnownVectors) {
  EXPECT_EQ(digestToHex(hashData(std::string("test"))), TEST_SHA256);
  EXPECT_EQ(digestToHex(hashData(string_to_byte_vector("abc"))), ABC_SHA256);
  const std::string abc = "abc";
  EXPECT_EQ(digestToHex(hashData(
                reinterpret_cast<const uint8_t *>(abc.data()), abc.size())),
            ABC_SHA256);
}

TEST(BlockIOTest, IngestMultipleChunksMatchesOneShot) {
  BlockIO bio;
  bio.ingest(std::string("te"));
  std::vector<std::byte> tail = string_to_byte_vector("st");
  bio.ingest(tail.data(), tail.size());
  DigestResult res = bio.finalize_hashed();
  EXPECT_EQ(res.hex, TEST_SHA256);
  EXPECT_EQ(res.size, 4u);
  EXPECT_EQ(res.digest, hashData(std::string("test")));
}

TEST(BlockIOTest, LargeInputIsDeterministic) {
  std::vector<std::byte> data(4 * 1024 * 1024);
  for (size_t i = 0; i < data.size(); ++i)
    data[i] = std::byte(i % 256);
  EXPECT_EQ(hashData(data), hashData(data));
  std::vector<std::byte> altered(data);
  altered[altered.size() / 2] ^= std::byte{0x01};
  EXPECT_NE(hashData(data), hashData(altered));
}

TEST(BlockIOTest, IngestAfterFinalizeThrows) {
  BlockIO bio;
  bio.ingest(std::string("data"));
  bio.finalize_hashed();
  EXPECT_THROW(bio.ingest(std::string("more")), std::logic_error);
}

TEST(BlockIOTest, FinalizeTwiceThrows) {
  BlockIO bio;
  bio.finalize_hashed();
  EXPECT_THROW(bio.finalize_hashed(), std::logic_error);
}

TEST(DigestText, ParseAcceptsPrefixAndUpperCase) {
  Digest d = hashData(std::string("test"));
  EXPECT_EQ(parseDigest(TEST_SHA256), d);
  std::string upper = TEST_SHA256;
  for (auto &c : upper)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  EXPECT_EQ(parseDigest("0x" + upper), d);
  EXPECT_EQ(parseDigest("0X" + TEST_SHA256), d);
}

TEST(DigestText, ParseRejectsMalformed) {
  EXPECT_THROW(parseDigest(""), std::invalid_argument);
  EXPECT_THROW(parseDigest("0x1234"), std::invalid_argument);
  EXPECT_THROW(parseDigest(TEST_SHA256 + "00"), std::invalid_argument);
  std::string bad = TEST_SHA256;
  bad[10] = 'g';
  EXPECT_THROW(parseDigest(bad), std::invalid_argument);
  EXPECT_FALSE(isDigestHex(bad));
  EXPECT_TRUE(isDigestHex("0x" + TEST_SHA256));
}

TEST(DigestText, EqualityIgnoresCaseAndPrefix) {
  EXPECT_TRUE(digestHexEquals("0xABCDEF", "abcdef"));
  EXPECT_TRUE(digestHexEquals(TEST_SHA256, "0x" + TEST_SHA256));
  EXPECT_FALSE(digestHexEquals(TEST_SHA256, EMPTY_SHA256));
  EXPECT_EQ(normalizeDigestHex("0XAbC"), "abc");
}

TEST(DigestText, ZeroDigestEncodesAsZeros) {
  EXPECT_EQ(digestToHex(ZERO_DIGEST), std::string(64, '0'));
}
