#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>

namespace crystal::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CryptoError("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw CryptoError("Digest: Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;

//==============================================
// HASHING OPERATIONS
//==============================================

Sha256& Sha256::update(const uint8_t* data, size_t length) {
  if (finalized_) {
    throw CryptoError("Digest: Hasher already finalized");
  }
  if (length > 0 && !EVP_DigestUpdate(context_->get(), data, length)) {
    throw CryptoError("Digest: Failed to update hash");
  }
  return *this;
}

Sha256& Sha256::update(const Bytes& data) {
  return update(data.data(), data.size());
}

Sha256& Sha256::update(const Digest& data) {
  return update(data.data(), data.size());
}

Sha256& Sha256::update(const std::string& data) {
  return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha256& Sha256::update_u8(uint8_t value) {
  return update(&value, sizeof(value));
}

Sha256& Sha256::update_u64(uint64_t value) {
  uint64_t big_endian = boost::endian::native_to_big(value);
  return update(reinterpret_cast<const uint8_t*>(&big_endian), sizeof(big_endian));
}

Digest Sha256::finalize() {
  if (finalized_) {
    throw CryptoError("Digest: Hasher already finalized");
  }

  Digest digest{};
  unsigned int length = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &length) || length != DIGEST_SIZE) {
    throw CryptoError("Digest: Failed to finalize hash");
  }
  finalized_ = true;
  return digest;
}

//==============================================
// ONE-SHOT HELPERS
//==============================================

Digest sha256(const uint8_t* data, size_t length) {
  Sha256 hasher;
  hasher.update(data, length);
  return hasher.finalize();
}

Digest sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

Digest sha256(const std::string& data) {
  return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const Digest& digest) {
  return to_hex(digest.data(), digest.size());
}

Digest digest_from_hex(const std::string& hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Invalid hex digest length: " << hex.size();
    throw CryptoError("Digest: Invalid hex digest length");
  }

  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  Digest digest{};
  for (size_t i = 0; i < DIGEST_SIZE; i++) {
    int high = nibble(hex[2 * i]);
    int low = nibble(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      throw CryptoError("Digest: Invalid hex character");
    }
    digest[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return digest;
}

} // namespace crystal::crypto
