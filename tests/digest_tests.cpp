#include "gtest/gtest.h"
#include "utilities/digest.hpp"

#include <stdexcept>
#include <string>

using namespace dedupfs::utils;

TEST(DigestTest, HexRoundTrip) {
  const std::string hex =
      "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
  DigestArray digest = hex_to_digest(hex);
  EXPECT_EQ(digest[0], 0x2c);
  EXPECT_EQ(digest[31], 0x24);
  EXPECT_EQ(digest_to_hex(digest), hex);
}

TEST(DigestTest, HexIsLowercaseFixedWidth) {
  DigestArray digest{};
  digest[0] = 0xAB;
  digest[31] = 0x0F;
  std::string hex = digest_to_hex(digest);
  ASSERT_EQ(hex.size(), DIGEST_HEX_SIZE);
  EXPECT_EQ(hex.substr(0, 2), "ab");
  EXPECT_EQ(hex.substr(62, 2), "0f");
  EXPECT_EQ(hex.substr(2, 60), std::string(60, '0'));
}

TEST(DigestTest, ValidationRejectsMalformedInput) {
  EXPECT_TRUE(is_valid_hex_digest(std::string(64, 'a')));
  EXPECT_FALSE(is_valid_hex_digest(""));
  EXPECT_FALSE(is_valid_hex_digest(std::string(63, 'a')));
  EXPECT_FALSE(is_valid_hex_digest(std::string(65, 'a')));
  EXPECT_FALSE(is_valid_hex_digest(std::string(64, 'A')));
  EXPECT_FALSE(is_valid_hex_digest(std::string(63, 'a') + "g"));
  EXPECT_THROW(hex_to_digest("../../etc/passwd"), std::invalid_argument);
}

TEST(DigestTest, ParseAlgorithmNames) {
  EXPECT_EQ(parse_hash_algorithm("sha256"), HashAlgorithm::SHA256);
  EXPECT_EQ(parse_hash_algorithm("SHA-256"), HashAlgorithm::SHA256);
  EXPECT_EQ(parse_hash_algorithm("Blake3"), HashAlgorithm::BLAKE3);
  EXPECT_THROW(parse_hash_algorithm("md5"), std::invalid_argument);
  EXPECT_EQ(hash_algorithm_name(HashAlgorithm::SHA256), "sha256");
  EXPECT_EQ(hash_algorithm_name(HashAlgorithm::BLAKE3), "blake3");
}
