#ifndef CRYSTAL_CRYPTO_DIGEST_HPP
#define CRYSTAL_CRYPTO_DIGEST_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace crystal::crypto {

static constexpr size_t DIGEST_SIZE = 32;   // SHA-256

using Digest = std::array<uint8_t, DIGEST_SIZE>;
using Bytes = std::vector<uint8_t>;

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 hasher
class Sha256 {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING OPERATIONS ----
  Sha256& update(const uint8_t* data, size_t length);
  Sha256& update(const Bytes& data);
  Sha256& update(const Digest& data);
  Sha256& update(const std::string& data);
  Sha256& update_u8(uint8_t value);
  // Appends value in big endian byte order
  Sha256& update_u64(uint64_t value);
  // Completes the hash, the hasher cannot be reused afterwards
  Digest finalize();

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};


// ---- ONE-SHOT HELPERS ----
Digest sha256(const uint8_t* data, size_t length);
Digest sha256(const Bytes& data);
Digest sha256(const std::string& data);

// Lowercase hexadecimal rendering
std::string to_hex(const uint8_t* data, size_t length);
std::string to_hex(const Digest& digest);
// Parses a 64 character hexadecimal string, throws CryptoError when malformed
Digest digest_from_hex(const std::string& hex);

} // namespace crystal::crypto

#endif // CRYSTAL_CRYPTO_DIGEST_HPP
