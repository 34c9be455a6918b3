#include "crypto/key_manager.hpp"
#include "utils/io_error.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/pem.h>
#include <boost/log/trivial.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace crystal::crypto {

namespace {

constexpr char HKDF_SALT[] = "crystal-storage";
constexpr char HKDF_INFO[] = "fragment-encryption-v1";

// Collects the most recent OpenSSL error for diagnostics
std::string openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  ERR_clear_error();
  return buffer;
}

// Supplies the passphrase to PEM routines without ever prompting on a terminal
int passphrase_callback(char* buf, int size, int /*rwflag*/, void* userdata) {
  const auto* passphrase = static_cast<const std::string*>(userdata);
  if (!passphrase || passphrase->empty()) {
    return 0;
  }
  int length = static_cast<int>(passphrase->size());
  if (length > size) {
    return 0;
  }
  std::memcpy(buf, passphrase->data(), length);
  return length;
}

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::shared_ptr<EVP_PKEY> wrap_pkey(EVP_PKEY* key) {
  return std::shared_ptr<EVP_PKEY>(key, EVP_PKEY_free);
}

Bytes raw_public_key(EVP_PKEY* key) {
  size_t length = 0;
  if (EVP_PKEY_get_raw_public_key(key, nullptr, &length) != 1) {
    throw KeyFormatError("Unable to read public key length: " + openssl_error());
  }
  Bytes raw(length);
  if (EVP_PKEY_get_raw_public_key(key, raw.data(), &length) != 1) {
    throw KeyFormatError("Unable to read public key: " + openssl_error());
  }
  raw.resize(length);
  return raw;
}

} // namespace

//==============================================
// KEY PAIR
//==============================================

KeyPair::KeyPair(std::shared_ptr<EVP_PKEY> key, Bytes public_key, const FragmentKey& fragment_key)
  : key_(std::move(key))
  , public_key_(std::move(public_key))
  , fragment_key_(fragment_key) {}

KeyPair::~KeyPair() {
  OPENSSL_cleanse(fragment_key_.data(), fragment_key_.size());
}

//==============================================
// KEY LIFECYCLE
//==============================================

KeyPair KeyManager::generate_keypair() const {
  BOOST_LOG_TRIVIAL(info) << "Key manager: Generating Ed25519 key pair";

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx) {
    throw KeyGenerationError("Failed to create key generation context: " + openssl_error());
  }
  if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw KeyGenerationError("Failed to initialize key generation: " + openssl_error());
  }

  EVP_PKEY* raw_key = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw_key) != 1 || !raw_key) {
    throw KeyGenerationError("Failed to generate key pair: " + openssl_error());
  }

  try {
    KeyPair pair = make_keypair(wrap_pkey(raw_key));
    BOOST_LOG_TRIVIAL(info) << "Key manager: Generated key pair " << fingerprint(pair);
    return pair;
  }
  catch (const KeyFormatError& e) {
    throw KeyGenerationError(e.what());
  }
}

void KeyManager::serialize_keys(const KeyPair& pair, const std::string& private_path,
                                const std::string& public_path,
                                const std::string& passphrase) const {
  BOOST_LOG_TRIVIAL(info) << "Key manager: Writing key pair " << fingerprint(pair)
                          << " to " << private_path << " and " << public_path;

  for (const auto& path : {private_path, public_path}) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "Key manager: Cannot create directory " << parent << ": " << ec.message();
        throw IOError("Key manager: Cannot create directory " + parent.string());
      }
    }
  }

  // Owner-only from the first byte, an existing file is narrowed before it is rewritten
  int fd = ::open(private_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    throw IOError("Key manager: Cannot open private key file for writing: " + private_path
                  + ": " + std::strerror(errno));
  }
  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
    std::string reason = std::strerror(errno);
    ::close(fd);
    BOOST_LOG_TRIVIAL(error) << "Key manager: Could not restrict permissions of " << private_path << ": " << reason;
    throw IOError("Key manager: Cannot restrict permissions of " + private_path + ": " + reason);
  }

  BioPtr private_bio(BIO_new_fd(fd, BIO_CLOSE));
  if (!private_bio) {
    ::close(fd);
    ERR_clear_error();
    throw IOError("Key manager: Cannot open private key file for writing: " + private_path);
  }

  const EVP_CIPHER* cipher = passphrase.empty() ? nullptr : EVP_aes_256_cbc();
  auto* userdata = const_cast<std::string*>(&passphrase);
  if (PEM_write_bio_PKCS8PrivateKey(private_bio.get(), pair.native_handle(), cipher,
                                    nullptr, 0, passphrase_callback, userdata) != 1) {
    throw IOError("Key manager: Failed to write private key: " + openssl_error());
  }
  private_bio.reset();

  BioPtr public_bio(BIO_new_file(public_path.c_str(), "w"));
  if (!public_bio) {
    ERR_clear_error();
    throw IOError("Key manager: Cannot open public key file for writing: " + public_path);
  }
  if (PEM_write_bio_PUBKEY(public_bio.get(), pair.native_handle()) != 1) {
    throw IOError("Key manager: Failed to write public key: " + openssl_error());
  }

  BOOST_LOG_TRIVIAL(debug) << "Key manager: Key pair written";
}

KeyPair KeyManager::load_keys(const std::string& private_path, const std::string& public_path,
                              const std::string& passphrase) const {
  BOOST_LOG_TRIVIAL(info) << "Key manager: Loading key pair from " << private_path << " and " << public_path;

  for (const auto& path : {private_path, public_path}) {
    if (!std::filesystem::exists(path)) {
      BOOST_LOG_TRIVIAL(error) << "Key manager: Key file not found: " << path;
      throw KeyNotFoundError(path);
    }
  }

  BioPtr private_bio(BIO_new_file(private_path.c_str(), "r"));
  if (!private_bio) {
    ERR_clear_error();
    throw IOError("Key manager: Cannot open private key file: " + private_path);
  }
  auto* userdata = const_cast<std::string*>(&passphrase);
  EVP_PKEY* raw_private = PEM_read_bio_PrivateKey(private_bio.get(), nullptr, passphrase_callback, userdata);
  if (!raw_private) {
    throw KeyFormatError("Cannot parse private key " + private_path + ": " + openssl_error());
  }
  auto private_key = wrap_pkey(raw_private);
  if (EVP_PKEY_id(private_key.get()) != EVP_PKEY_ED25519) {
    throw KeyFormatError("Private key is not an Ed25519 key: " + private_path);
  }

  BioPtr public_bio(BIO_new_file(public_path.c_str(), "r"));
  if (!public_bio) {
    ERR_clear_error();
    throw IOError("Key manager: Cannot open public key file: " + public_path);
  }
  EVP_PKEY* raw_public = PEM_read_bio_PUBKEY(public_bio.get(), nullptr, nullptr, nullptr);
  if (!raw_public) {
    throw KeyFormatError("Cannot parse public key " + public_path + ": " + openssl_error());
  }
  auto public_key = wrap_pkey(raw_public);
  if (EVP_PKEY_id(public_key.get()) != EVP_PKEY_ED25519) {
    throw KeyFormatError("Public key is not an Ed25519 key: " + public_path);
  }

  KeyPair pair = make_keypair(private_key);
  if (raw_public_key(public_key.get()) != pair.public_key()) {
    BOOST_LOG_TRIVIAL(error) << "Key manager: Public key does not match private key";
    throw KeyFormatError("Public key " + public_path + " does not match private key " + private_path);
  }

  BOOST_LOG_TRIVIAL(info) << "Key manager: Loaded key pair " << fingerprint(pair);
  return pair;
}

//==============================================
// SIGNATURES
//==============================================

Bytes KeyManager::sign(const KeyPair& pair, const Bytes& message) const {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw CryptoError("Key manager: Failed to create signing context");
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pair.native_handle()) != 1) {
    throw CryptoError("Key manager: Failed to initialize signing: " + openssl_error());
  }

  Bytes signature(SIGNATURE_SIZE);
  size_t signature_length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_length,
                     message.data(), message.size()) != 1) {
    throw CryptoError("Key manager: Failed to sign message: " + openssl_error());
  }
  signature.resize(signature_length);
  return signature;
}

bool KeyManager::verify_signature(const KeyPair& pair, const Bytes& message, const Bytes& signature) const {
  if (signature.size() != SIGNATURE_SIZE) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pair.native_handle()) != 1) {
    ERR_clear_error();
    return false;
  }

  int result = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                message.data(), message.size());
  if (result != 1) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(debug) << "Key manager: Signature verification failed";
    return false;
  }
  return true;
}

std::string KeyManager::fingerprint(const KeyPair& pair) const {
  Digest digest = sha256(pair.public_key());
  return to_hex(digest.data(), 16);
}

//==============================================
// KEY MATERIAL HELPERS
//==============================================

KeyPair KeyManager::make_keypair(std::shared_ptr<EVP_PKEY> key) const {
  Bytes public_key = raw_public_key(key.get());
  KeyPair::FragmentKey fragment_key = derive_fragment_key(key.get());
  KeyPair pair(std::move(key), std::move(public_key), fragment_key);
  OPENSSL_cleanse(fragment_key.data(), fragment_key.size());
  return pair;
}

KeyPair::FragmentKey KeyManager::derive_fragment_key(EVP_PKEY* key) const {
  size_t private_length = 0;
  if (EVP_PKEY_get_raw_private_key(key, nullptr, &private_length) != 1) {
    throw KeyFormatError("Unable to read private key length: " + openssl_error());
  }
  Bytes secret(private_length);
  if (EVP_PKEY_get_raw_private_key(key, secret.data(), &private_length) != 1) {
    throw KeyFormatError("Unable to read private key: " + openssl_error());
  }

  KeyPair::FragmentKey fragment_key{};
  try {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1
        || EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1
        || EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), reinterpret_cast<const unsigned char*>(HKDF_SALT),
                                       sizeof(HKDF_SALT) - 1) != 1
        || EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), secret.data(), static_cast<int>(secret.size())) != 1
        || EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), reinterpret_cast<const unsigned char*>(HKDF_INFO),
                                       sizeof(HKDF_INFO) - 1) != 1) {
      throw CryptoError("Key manager: Failed to set up key derivation: " + openssl_error());
    }

    size_t out_length = fragment_key.size();
    if (EVP_PKEY_derive(ctx.get(), fragment_key.data(), &out_length) != 1
        || out_length != fragment_key.size()) {
      throw CryptoError("Key manager: Failed to derive fragment key: " + openssl_error());
    }
  }
  catch (...) {
    OPENSSL_cleanse(secret.data(), secret.size());
    throw;
  }

  OPENSSL_cleanse(secret.data(), secret.size());
  return fragment_key;
}

} // namespace crystal::crypto
