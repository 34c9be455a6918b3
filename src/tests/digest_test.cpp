#include <gtest/gtest.h>
#include <cctype>
#include <string>
#include "crypto/digest.hpp"

using namespace crystal::crypto;

TEST(DigestTest, KnownVectors) {
  EXPECT_EQ(to_hex(sha256(std::string(""))),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(to_hex(sha256(std::string("abc"))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
  Sha256 hasher;
  hasher.update(std::string("a")).update(std::string("b")).update(std::string("c"));
  EXPECT_EQ(hasher.finalize(), sha256(std::string("abc")));
}

TEST(DigestTest, BigEndianIntegers) {
  Sha256 hasher;
  hasher.update_u64(0x0102030405060708ULL);
  Bytes expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
  EXPECT_EQ(hasher.finalize(), sha256(expected));
}

TEST(DigestTest, FinalizeTwiceFails) {
  Sha256 hasher;
  hasher.update(std::string("data"));
  hasher.finalize();
  EXPECT_THROW(hasher.finalize(), CryptoError);
}

TEST(DigestTest, HexRoundTrip) {
  Digest digest = sha256(std::string("crystal"));
  EXPECT_EQ(digest_from_hex(to_hex(digest)), digest);

  std::string upper = to_hex(digest);
  for (auto& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  EXPECT_EQ(digest_from_hex(upper), digest);
}

TEST(DigestTest, MalformedHexRejected) {
  EXPECT_THROW(digest_from_hex("abc"), CryptoError);
  EXPECT_THROW(digest_from_hex(std::string(64, 'g')), CryptoError);
}
