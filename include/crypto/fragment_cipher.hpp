#ifndef CRYSTAL_CRYPTO_FRAGMENT_CIPHER_HPP
#define CRYSTAL_CRYPTO_FRAGMENT_CIPHER_HPP

#include <array>
#include <climits>
#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"
#include "digest.hpp"
#include "key_manager.hpp"

namespace crystal::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Authenticated per-fragment encryption (AES-256-GCM).
// Ciphertext layout: nonce (12) | encrypted payload | tag (16).
// A fresh nonce is drawn for every call, digests are always taken over plaintext
// so they stay reproducible across re-encryption.
class FragmentCipher {
public:
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;
  static constexpr size_t OVERHEAD = NONCE_SIZE + TAG_SIZE;
  // Largest fragment whose sealed form still fits an EVP length argument
  static constexpr size_t MAX_FRAGMENT_SIZE = static_cast<size_t>(INT_MAX) - OVERHEAD;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // max_plaintext_size bounds the fragments this cipher accepts (0 = MAX_FRAGMENT_SIZE)
  explicit FragmentCipher(size_t max_plaintext_size = 0);
  ~FragmentCipher();

  FragmentCipher(const FragmentCipher&) = delete;
  FragmentCipher& operator=(const FragmentCipher&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  Bytes encrypt_fragment(const Bytes& plaintext, const KeyPair& keys,
                         const Bytes& associated_data = {});
  Bytes decrypt_fragment(const Bytes& ciphertext, const KeyPair& keys,
                         const Bytes& associated_data = {});


  // ---- DIGESTS ----
  // SHA-256 of the plaintext fragment
  static Digest digest(const Bytes& plaintext);
  // Binds the plaintext digest to the exact stored ciphertext
  static Digest commitment(const Digest& plaintext_digest, const Bytes& ciphertext);


  // ---- GETTERS ----
  size_t max_plaintext_size() const { return max_plaintext_size_; }

private:
  // ---- PARAMETERS ----
  size_t max_plaintext_size_;
  std::unique_ptr<CipherContext> context_;

  // Generates a random GCM nonce
  std::array<uint8_t, NONCE_SIZE> generate_nonce() const;
};

} // namespace crystal::crypto

#endif // CRYSTAL_CRYPTO_FRAGMENT_CIPHER_HPP
