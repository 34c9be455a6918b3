#ifndef CRYSTAL_CRYPTO_KEY_MANAGER_HPP
#define CRYSTAL_CRYPTO_KEY_MANAGER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "crypto_error.hpp"
#include "digest.hpp"

namespace crystal::crypto {

// Immutable asymmetric key material plus the symmetric fragment key derived from it.
// Copies share the underlying OpenSSL key handle read-only.
class KeyPair {
public:
  static constexpr size_t FRAGMENT_KEY_SIZE = 32;   // AES-256
  using FragmentKey = std::array<uint8_t, FRAGMENT_KEY_SIZE>;

  KeyPair(std::shared_ptr<EVP_PKEY> key, Bytes public_key, const FragmentKey& fragment_key);
  ~KeyPair();

  KeyPair(const KeyPair&) = default;
  KeyPair& operator=(const KeyPair&) = default;

  // ---- GETTERS ----
  EVP_PKEY* native_handle() const { return key_.get(); }
  const Bytes& public_key() const { return public_key_; }
  const FragmentKey& fragment_key() const { return fragment_key_; }

private:
  std::shared_ptr<EVP_PKEY> key_;
  Bytes public_key_;
  FragmentKey fragment_key_;
};

class KeyManager {
public:
  static constexpr size_t SIGNATURE_SIZE = 64;   // Ed25519

  // ---- KEY LIFECYCLE ----
  // Creates a fresh Ed25519 key pair from the OpenSSL CSPRNG
  KeyPair generate_keypair() const;
  // Writes the private key as PKCS#8 PEM (encrypted when a passphrase is given)
  // and the public key as SubjectPublicKeyInfo PEM
  void serialize_keys(const KeyPair& pair, const std::string& private_path,
                      const std::string& public_path,
                      const std::string& passphrase = "") const;
  // Loads both key files and checks that they belong together
  KeyPair load_keys(const std::string& private_path, const std::string& public_path,
                    const std::string& passphrase = "") const;


  // ---- SIGNATURES ----
  Bytes sign(const KeyPair& pair, const Bytes& message) const;
  // Fails closed: any error yields false
  bool verify_signature(const KeyPair& pair, const Bytes& message, const Bytes& signature) const;


  // ---- IDENTIFICATION ----
  // Short hex identifier of the public key, safe for display
  std::string fingerprint(const KeyPair& pair) const;

private:
  // Wraps a private key: extracts the raw public key and derives the fragment key
  KeyPair make_keypair(std::shared_ptr<EVP_PKEY> key) const;
  // HKDF-SHA256 over the raw private key
  KeyPair::FragmentKey derive_fragment_key(EVP_PKEY* key) const;
};

} // namespace crystal::crypto

#endif // CRYSTAL_CRYPTO_KEY_MANAGER_HPP
