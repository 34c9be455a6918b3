#include <gtest/gtest.h>
#include <limits>
#include <thread>
#include "crypto/fragment_cipher.hpp"
#include "crypto/key_manager.hpp"
#include "test_utils.hpp"

using namespace crystal::crypto;

class FragmentCipherTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() {
    KeyManager manager;
    keys_ = std::make_unique<KeyPair>(manager.generate_keypair());
    other_keys_ = std::make_unique<KeyPair>(manager.generate_keypair());
  }

  static void TearDownTestSuite() {
    keys_.reset();
    other_keys_.reset();
  }

  static std::unique_ptr<KeyPair> keys_;
  static std::unique_ptr<KeyPair> other_keys_;
  FragmentCipher cipher{4096};
};

std::unique_ptr<KeyPair> FragmentCipherTest::keys_;
std::unique_ptr<KeyPair> FragmentCipherTest::other_keys_;

TEST_F(FragmentCipherTest, RoundTrip) {
  Bytes plaintext = random_bytes(1000);
  Bytes ciphertext = cipher.encrypt_fragment(plaintext, *keys_);

  EXPECT_EQ(ciphertext.size(), plaintext.size() + FragmentCipher::OVERHEAD);
  EXPECT_EQ(cipher.decrypt_fragment(ciphertext, *keys_), plaintext);
}

TEST_F(FragmentCipherTest, EmptyFragment) {
  Bytes ciphertext = cipher.encrypt_fragment({}, *keys_);
  EXPECT_EQ(ciphertext.size(), FragmentCipher::OVERHEAD);
  EXPECT_TRUE(cipher.decrypt_fragment(ciphertext, *keys_).empty());
}

TEST_F(FragmentCipherTest, FreshNonceEveryCall) {
  Bytes plaintext = random_bytes(64);
  Bytes first = cipher.encrypt_fragment(plaintext, *keys_);
  Bytes second = cipher.encrypt_fragment(plaintext, *keys_);
  EXPECT_NE(first, second);

  // Digests are over plaintext and therefore stable across re-encryption
  EXPECT_EQ(FragmentCipher::digest(plaintext), FragmentCipher::digest(plaintext));
  EXPECT_NE(FragmentCipher::commitment(FragmentCipher::digest(plaintext), first),
            FragmentCipher::commitment(FragmentCipher::digest(plaintext), second));
}

TEST_F(FragmentCipherTest, TamperedCiphertextRejected) {
  Bytes ciphertext = cipher.encrypt_fragment(random_bytes(256), *keys_);

  for (size_t position : {size_t{0}, FragmentCipher::NONCE_SIZE + 5, ciphertext.size() - 1}) {
    Bytes tampered = ciphertext;
    tampered[position] ^= 0x01;
    EXPECT_THROW(cipher.decrypt_fragment(tampered, *keys_), DecryptionError) << "position " << position;
  }
}

TEST_F(FragmentCipherTest, TruncatedCiphertextRejected) {
  Bytes ciphertext = cipher.encrypt_fragment(random_bytes(32), *keys_);
  Bytes truncated(ciphertext.begin(), ciphertext.begin() + FragmentCipher::OVERHEAD - 1);
  EXPECT_THROW(cipher.decrypt_fragment(truncated, *keys_), DecryptionError);

  Bytes shortened(ciphertext.begin(), ciphertext.end() - 1);
  EXPECT_THROW(cipher.decrypt_fragment(shortened, *keys_), DecryptionError);
}

TEST_F(FragmentCipherTest, WrongKeyRejected) {
  Bytes ciphertext = cipher.encrypt_fragment(random_bytes(128), *keys_);
  EXPECT_THROW(cipher.decrypt_fragment(ciphertext, *other_keys_), DecryptionError);
}

TEST_F(FragmentCipherTest, AssociatedDataBindsContext) {
  Bytes plaintext = random_bytes(128);
  Bytes slot_zero = {'o', 'b', 'j', 0, 0, 0, 0, 0, 0, 0, 0};
  Bytes slot_one = {'o', 'b', 'j', 0, 0, 0, 0, 0, 0, 0, 1};

  Bytes ciphertext = cipher.encrypt_fragment(plaintext, *keys_, slot_zero);
  EXPECT_EQ(cipher.decrypt_fragment(ciphertext, *keys_, slot_zero), plaintext);
  EXPECT_THROW(cipher.decrypt_fragment(ciphertext, *keys_, slot_one), DecryptionError);
  EXPECT_THROW(cipher.decrypt_fragment(ciphertext, *keys_), DecryptionError);
}

TEST_F(FragmentCipherTest, OversizedFragmentRejected) {
  FragmentCipher small(16);
  EXPECT_NO_THROW(small.encrypt_fragment(random_bytes(16), *keys_));
  EXPECT_THROW(small.encrypt_fragment(random_bytes(17), *keys_), EncryptionError);

  Bytes large = cipher.encrypt_fragment(random_bytes(17), *keys_);
  EXPECT_THROW(small.decrypt_fragment(large, *keys_), DecryptionError);
}

TEST_F(FragmentCipherTest, FragmentSizeBoundedByEvpLength) {
  EXPECT_THROW(FragmentCipher{FragmentCipher::MAX_FRAGMENT_SIZE + 1}, CryptoError);
  EXPECT_THROW(FragmentCipher{size_t{3000000000}}, CryptoError);

  FragmentCipher unbounded;
  EXPECT_EQ(unbounded.max_plaintext_size(), FragmentCipher::MAX_FRAGMENT_SIZE);
  EXPECT_LE(FragmentCipher::MAX_FRAGMENT_SIZE + FragmentCipher::OVERHEAD,
            static_cast<size_t>(std::numeric_limits<int>::max()));
}

TEST_F(FragmentCipherTest, DigestIsSha256OfPlaintext) {
  Bytes plaintext = random_bytes(100);
  EXPECT_EQ(FragmentCipher::digest(plaintext), sha256(plaintext));
}

TEST_F(FragmentCipherTest, ConcurrentCiphersShareKeys) {
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};

  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t, &failures]() {
      FragmentCipher local(4096);
      for (int i = 0; i < 20; ++i) {
        Bytes plaintext = random_bytes(512, static_cast<uint32_t>(t * 100 + i));
        if (local.decrypt_fragment(local.encrypt_fragment(plaintext, *keys_), *keys_) != plaintext) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(failures.load(), 0);
}
