#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "fslite/checksum/checksum.hpp"

using namespace fslite::checksum;

TEST(ChecksumTest, KnownDigests) {
  // FIPS 180-2 test vectors
  EXPECT_EQ(fingerprint(std::string("")),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(fingerprint(std::string("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChecksumTest, OverloadsAgree) {
  const std::string text = "fragment payload";
  const std::vector<uint8_t> bytes(text.begin(), text.end());

  EXPECT_EQ(fingerprint(text), fingerprint(bytes));
  EXPECT_EQ(fingerprint(bytes), fingerprint(bytes.data(), bytes.size()));
}

TEST(ChecksumTest, DeterministicAndSensitive) {
  std::vector<uint8_t> data(4096, 0x5A);
  const std::string first = fingerprint(data);

  EXPECT_EQ(first, fingerprint(data));
  EXPECT_EQ(first.size(), DIGEST_HEX_LENGTH);

  data[2048] ^= 0x01;
  EXPECT_NE(first, fingerprint(data));
}

TEST(ChecksumTest, BinaryDataWithNulBytes) {
  const std::vector<uint8_t> with_nul = {0x00, 0x01, 0x00, 0x02};
  const std::vector<uint8_t> truncated = {0x00, 0x01};
  EXPECT_NE(fingerprint(with_nul), fingerprint(truncated));
}

TEST(ChecksumTest, NullBufferRejected) {
  EXPECT_THROW(fingerprint(nullptr, 3), ChecksumError);
  EXPECT_NO_THROW(fingerprint(nullptr, 0));
}

TEST(ChecksumTest, DigestValidation) {
  EXPECT_TRUE(is_valid_digest(fingerprint(std::string("abc"))));
  EXPECT_FALSE(is_valid_digest(""));
  EXPECT_FALSE(is_valid_digest(std::string(63, 'a')));
  EXPECT_FALSE(is_valid_digest(std::string(65, 'a')));
  EXPECT_FALSE(is_valid_digest(std::string(64, 'A')));
  EXPECT_FALSE(is_valid_digest(std::string(64, 'g')));
}
