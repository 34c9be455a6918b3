#include "crypto/fragment_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <string>

namespace crystal::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Fragment cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FragmentCipher::FragmentCipher(size_t max_plaintext_size)
  : max_plaintext_size_(max_plaintext_size == 0 ? MAX_FRAGMENT_SIZE : max_plaintext_size)
  , context_(nullptr) {
  if (max_plaintext_size_ > MAX_FRAGMENT_SIZE) {
    throw CryptoError("Fragment cipher: Fragment size " + std::to_string(max_plaintext_size_)
                      + " exceeds the supported maximum of " + std::to_string(MAX_FRAGMENT_SIZE));
  }
  context_ = std::make_unique<CipherContext>();
  BOOST_LOG_TRIVIAL(trace) << "Fragment cipher: Created with max fragment size " << max_plaintext_size_;
}

FragmentCipher::~FragmentCipher() = default;

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

Bytes FragmentCipher::encrypt_fragment(const Bytes& plaintext, const KeyPair& keys,
                                       const Bytes& associated_data) {
  if (plaintext.size() > max_plaintext_size_) {
    BOOST_LOG_TRIVIAL(error) << "Fragment cipher: Fragment of " << plaintext.size()
                             << " bytes exceeds limit of " << max_plaintext_size_;
    throw EncryptionError("Fragment exceeds configured fragment size");
  }

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  auto nonce = generate_nonce();
  const auto& key = keys.fragment_key();

  if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
      || EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1
      || EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ERR_clear_error();
    throw EncryptionError("Failed to initialize encryption context");
  }

  if (associated_data.size() > static_cast<size_t>(INT_MAX)) {
    throw EncryptionError("Associated data too large");
  }

  int outlen = 0;
  if (!associated_data.empty()) {
    if (EVP_EncryptUpdate(ctx, nullptr, &outlen, associated_data.data(),
                          static_cast<int>(associated_data.size())) != 1) {
      ERR_clear_error();
      throw EncryptionError("Failed to process associated data");
    }
  }

  Bytes ciphertext(NONCE_SIZE + plaintext.size() + TAG_SIZE);
  std::copy(nonce.begin(), nonce.end(), ciphertext.begin());
  uint8_t* body = ciphertext.data() + NONCE_SIZE;

  int written = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx, body, &outlen, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      ERR_clear_error();
      throw EncryptionError("Failed to encrypt fragment");
    }
    written = outlen;
  }

  if (EVP_EncryptFinal_ex(ctx, body + written, &outlen) != 1) {
    ERR_clear_error();
    throw EncryptionError("Failed to finalize encryption");
  }
  written += outlen;

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                          body + written) != 1) {
    ERR_clear_error();
    throw EncryptionError("Failed to read authentication tag");
  }

  BOOST_LOG_TRIVIAL(trace) << "Fragment cipher: Encrypted " << plaintext.size() << " bytes";
  return ciphertext;
}

Bytes FragmentCipher::decrypt_fragment(const Bytes& ciphertext, const KeyPair& keys,
                                       const Bytes& associated_data) {
  if (ciphertext.size() < OVERHEAD) {
    BOOST_LOG_TRIVIAL(debug) << "Fragment cipher: Ciphertext too short: " << ciphertext.size() << " bytes";
    throw DecryptionError("Ciphertext shorter than nonce and tag");
  }

  size_t body_size = ciphertext.size() - OVERHEAD;
  if (body_size > max_plaintext_size_) {
    throw DecryptionError("Ciphertext exceeds configured fragment size");
  }

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  const uint8_t* nonce = ciphertext.data();
  const uint8_t* body = ciphertext.data() + NONCE_SIZE;
  const uint8_t* tag = body + body_size;
  const auto& key = keys.fragment_key();

  if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
      || EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1
      || EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1) {
    ERR_clear_error();
    throw DecryptionError("Failed to initialize decryption context");
  }

  if (associated_data.size() > static_cast<size_t>(INT_MAX)) {
    throw DecryptionError("Associated data too large");
  }

  int outlen = 0;
  if (!associated_data.empty()) {
    if (EVP_DecryptUpdate(ctx, nullptr, &outlen, associated_data.data(),
                          static_cast<int>(associated_data.size())) != 1) {
      ERR_clear_error();
      throw DecryptionError("Failed to process associated data");
    }
  }

  Bytes plaintext(body_size);
  int written = 0;
  if (body_size > 0) {
    if (EVP_DecryptUpdate(ctx, plaintext.data(), &outlen, body, static_cast<int>(body_size)) != 1) {
      ERR_clear_error();
      throw DecryptionError("Failed to decrypt fragment");
    }
    written = outlen;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                          const_cast<uint8_t*>(tag)) != 1) {
    ERR_clear_error();
    throw DecryptionError("Failed to set authentication tag");
  }

  if (EVP_DecryptFinal_ex(ctx, plaintext.data() + written, &outlen) != 1) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(warning) << "Fragment cipher: Authentication tag mismatch";
    throw DecryptionError("Authentication failed, fragment is corrupted or was encrypted with another key");
  }
  written += outlen;
  plaintext.resize(written);

  BOOST_LOG_TRIVIAL(trace) << "Fragment cipher: Decrypted " << plaintext.size() << " bytes";
  return plaintext;
}

//==============================================
// DIGESTS
//==============================================

Digest FragmentCipher::digest(const Bytes& plaintext) {
  return sha256(plaintext);
}

Digest FragmentCipher::commitment(const Digest& plaintext_digest, const Bytes& ciphertext) {
  Sha256 hasher;
  hasher.update(plaintext_digest);
  hasher.update(sha256(ciphertext));
  return hasher.finalize();
}

//==============================================
// NONCE GENERATION
//==============================================

std::array<uint8_t, FragmentCipher::NONCE_SIZE> FragmentCipher::generate_nonce() const {
  std::array<uint8_t, NONCE_SIZE> nonce;
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw EncryptionError("Failed to generate random nonce");
  }
  return nonce;
}

} // namespace crystal::crypto
