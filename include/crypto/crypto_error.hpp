#ifndef CRYSTAL_CRYPTO_ERROR_HPP
#define CRYSTAL_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace crystal::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class KeyGenerationError : public CryptoError {
public:
    explicit KeyGenerationError(const std::string& message)
        : CryptoError("Key generation error: " + message) {}
};

class KeyNotFoundError : public CryptoError {
public:
    explicit KeyNotFoundError(const std::string& message)
        : CryptoError("Key not found: " + message) {}
};

class KeyFormatError : public CryptoError {
public:
    explicit KeyFormatError(const std::string& message)
        : CryptoError("Key format error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

} // namespace crystal::crypto

#endif // CRYSTAL_CRYPTO_ERROR_HPP
