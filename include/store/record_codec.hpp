#ifndef CRYSTAL_STORE_RECORD_CODEC_HPP
#define CRYSTAL_STORE_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "compression/compressor.hpp"
#include "crypto/digest.hpp"
#include "integrity/commitment_tree.hpp"

namespace crystal {
namespace store {

// Persisted form of one encrypted fragment
struct FragmentRecord {
  std::string object_id;
  uint64_t index = 0;
  uint64_t fragment_count = 0;
  crypto::Digest digest{};            // SHA-256 of the plaintext fragment
  integrity::ProofPath proof;
  crypto::Bytes ciphertext;
};

// Per-object metadata needed to verify and recover an object
struct ObjectManifest {
  uint16_t version = 1;
  std::string object_id;
  // Distinguishes successive stores of the same object id, fragment keys include it
  uint64_t generation = 0;
  uint64_t fragment_count = 0;
  uint64_t fragment_size = 0;
  uint64_t compressed_size = 0;
  compression::CompressionMetadata compression;
  crypto::Digest commitment_root{};
  crypto::Digest object_checksum{};    // SHA-256 of the original bytes
  std::vector<uint32_t> node_assignment;
  std::string placement;
  std::string signer;                  // key fingerprint
  crypto::Bytes signature;
};

class RecordFormatError : public std::runtime_error {
public:
  explicit RecordFormatError(const std::string& message)
    : std::runtime_error("Record format error: " + message) {}
};

// Binary encoding of fragment records and manifests, integers in network byte order
class RecordCodec {
public:
  static constexpr uint16_t FORMAT_VERSION = 1;
  static constexpr uint32_t MAX_OBJECT_ID_LENGTH = 4096;
  static constexpr uint32_t MAX_PROOF_LENGTH = 64;
  static constexpr uint32_t MAX_SIGNATURE_LENGTH = 1024;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  static std::size_t serialize(const FragmentRecord& record, std::ostream& output);
  static FragmentRecord deserialize_fragment(std::istream& input);

  static std::size_t serialize(const ObjectManifest& manifest, std::ostream& output);
  static ObjectManifest deserialize_manifest(std::istream& input);

  // Canonical manifest bytes covered by the signature (everything but the signature)
  static crypto::Bytes signed_payload(const ObjectManifest& manifest);

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  template <typename T>
  static void write_int(std::ostream& output, T value) {
    T network_value = boost::endian::native_to_big(value);
    write_bytes(output, &network_value, sizeof(network_value));
  }

  template <typename T>
  static T read_int(std::istream& input) {
    T network_value;
    read_bytes(input, &network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  static void write_string(std::ostream& output, const std::string& value);
  static std::string read_string(std::istream& input, uint32_t max_length);
  static void write_digest(std::ostream& output, const crypto::Digest& digest);
  static crypto::Digest read_digest(std::istream& input);

  static void write_manifest_body(const ObjectManifest& manifest, std::ostream& output);
  static void expect_magic(std::istream& input, const char* magic);
  static void expect_end(std::istream& input);
  // Bytes between the read position and the end of a seekable stream
  static uint64_t remaining_bytes(std::istream& input);
};

} // namespace store
} // namespace crystal

#endif // CRYSTAL_STORE_RECORD_CODEC_HPP
