#include "store/record_codec.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <sstream>

namespace crystal {
namespace store {

namespace {

constexpr char FRAGMENT_MAGIC[] = "CRFG";
constexpr char MANIFEST_MAGIC[] = "CRMF";
constexpr size_t MAGIC_SIZE = 4;

} // namespace

//==============================================
// FRAGMENT RECORDS
//==============================================

std::size_t RecordCodec::serialize(const FragmentRecord& record, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Invalid output stream state";
    throw RecordFormatError("Invalid output stream");
  }
  if (record.proof.size() > MAX_PROOF_LENGTH) {
    throw RecordFormatError("Proof path too long: " + std::to_string(record.proof.size()));
  }

  auto start = output.tellp();

  write_bytes(output, FRAGMENT_MAGIC, MAGIC_SIZE);
  write_int<uint16_t>(output, FORMAT_VERSION);
  write_string(output, record.object_id);
  write_int<uint64_t>(output, record.index);
  write_int<uint64_t>(output, record.fragment_count);
  write_digest(output, record.digest);

  write_int<uint32_t>(output, static_cast<uint32_t>(record.proof.size()));
  for (const auto& step : record.proof) {
    uint8_t side = step.sibling_on_left ? 1 : 0;
    write_bytes(output, &side, sizeof(side));
    write_digest(output, step.sibling);
  }

  write_int<uint64_t>(output, record.ciphertext.size());
  write_bytes(output, record.ciphertext.data(), record.ciphertext.size());

  output.flush();
  auto written = static_cast<std::size_t>(output.tellp() - start);
  BOOST_LOG_TRIVIAL(trace) << "Record codec: Serialized fragment " << record.index
                           << " of '" << record.object_id << "' (" << written << " bytes)";
  return written;
}

FragmentRecord RecordCodec::deserialize_fragment(std::istream& input) {
  if (!input.good()) {
    throw RecordFormatError("Invalid input stream");
  }

  FragmentRecord record;
  expect_magic(input, FRAGMENT_MAGIC);

  uint16_t version = read_int<uint16_t>(input);
  if (version != FORMAT_VERSION) {
    throw RecordFormatError("Unsupported fragment record version " + std::to_string(version));
  }

  record.object_id = read_string(input, MAX_OBJECT_ID_LENGTH);
  record.index = read_int<uint64_t>(input);
  record.fragment_count = read_int<uint64_t>(input);
  if (record.index >= record.fragment_count) {
    throw RecordFormatError("Fragment index " + std::to_string(record.index)
                            + " outside fragment count " + std::to_string(record.fragment_count));
  }
  record.digest = read_digest(input);

  uint32_t proof_length = read_int<uint32_t>(input);
  if (proof_length > MAX_PROOF_LENGTH) {
    throw RecordFormatError("Proof path too long: " + std::to_string(proof_length));
  }
  record.proof.reserve(proof_length);
  for (uint32_t i = 0; i < proof_length; ++i) {
    uint8_t side = 0;
    read_bytes(input, &side, sizeof(side));
    if (side > 1) {
      throw RecordFormatError("Invalid proof step marker");
    }
    integrity::ProofStep step;
    step.sibling_on_left = side == 1;
    step.sibling = read_digest(input);
    record.proof.push_back(step);
  }

  uint64_t ciphertext_length = read_int<uint64_t>(input);
  if (ciphertext_length != remaining_bytes(input)) {
    throw RecordFormatError("Ciphertext length does not match record size");
  }
  record.ciphertext.resize(ciphertext_length);
  read_bytes(input, record.ciphertext.data(), record.ciphertext.size());

  expect_end(input);
  return record;
}

//==============================================
// MANIFESTS
//==============================================

std::size_t RecordCodec::serialize(const ObjectManifest& manifest, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Invalid output stream state";
    throw RecordFormatError("Invalid output stream");
  }
  if (manifest.signature.size() > MAX_SIGNATURE_LENGTH) {
    throw RecordFormatError("Signature too long");
  }

  auto start = output.tellp();
  write_manifest_body(manifest, output);
  write_int<uint32_t>(output, static_cast<uint32_t>(manifest.signature.size()));
  write_bytes(output, manifest.signature.data(), manifest.signature.size());
  output.flush();

  auto written = static_cast<std::size_t>(output.tellp() - start);
  BOOST_LOG_TRIVIAL(trace) << "Record codec: Serialized manifest of '" << manifest.object_id
                           << "' (" << written << " bytes)";
  return written;
}

ObjectManifest RecordCodec::deserialize_manifest(std::istream& input) {
  if (!input.good()) {
    throw RecordFormatError("Invalid input stream");
  }

  ObjectManifest manifest;
  expect_magic(input, MANIFEST_MAGIC);

  manifest.version = read_int<uint16_t>(input);
  if (manifest.version != FORMAT_VERSION) {
    throw RecordFormatError("Unsupported manifest version " + std::to_string(manifest.version));
  }

  manifest.object_id = read_string(input, MAX_OBJECT_ID_LENGTH);
  manifest.generation = read_int<uint64_t>(input);
  manifest.fragment_count = read_int<uint64_t>(input);
  manifest.fragment_size = read_int<uint64_t>(input);
  manifest.compressed_size = read_int<uint64_t>(input);

  uint8_t algorithm_tag = 0;
  read_bytes(input, &algorithm_tag, sizeof(algorithm_tag));
  auto algorithm = compression::algorithm_from_tag(algorithm_tag);
  if (!algorithm) {
    throw RecordFormatError("Unknown compression algorithm tag " + std::to_string(algorithm_tag));
  }
  manifest.compression.algorithm = *algorithm;
  manifest.compression.level = read_int<int32_t>(input);
  manifest.compression.original_size = read_int<uint64_t>(input);

  manifest.commitment_root = read_digest(input);
  manifest.object_checksum = read_digest(input);

  uint64_t assignment_count = read_int<uint64_t>(input);
  if (assignment_count != manifest.fragment_count) {
    throw RecordFormatError("Node assignment count does not match fragment count");
  }
  // Every assignment takes four bytes, the count cannot exceed what is left
  if (assignment_count > remaining_bytes(input) / sizeof(uint32_t)) {
    throw RecordFormatError("Node assignment count exceeds record size");
  }
  if (manifest.fragment_size == 0 && manifest.fragment_count > 0) {
    throw RecordFormatError("Zero fragment size with non-empty fragment set");
  }
  if (manifest.fragment_size > 0) {
    uint64_t needed = manifest.compressed_size / manifest.fragment_size
                      + (manifest.compressed_size % manifest.fragment_size != 0 ? 1 : 0);
    if (manifest.fragment_count < needed) {
      throw RecordFormatError("Fragment count cannot hold the compressed stream");
    }
  }
  manifest.node_assignment.reserve(assignment_count);
  for (uint64_t i = 0; i < assignment_count; ++i) {
    manifest.node_assignment.push_back(read_int<uint32_t>(input));
  }

  manifest.placement = read_string(input, 64);
  manifest.signer = read_string(input, 128);

  uint32_t signature_length = read_int<uint32_t>(input);
  if (signature_length > MAX_SIGNATURE_LENGTH) {
    throw RecordFormatError("Signature too long");
  }
  manifest.signature.resize(signature_length);
  read_bytes(input, manifest.signature.data(), manifest.signature.size());

  expect_end(input);
  return manifest;
}

crypto::Bytes RecordCodec::signed_payload(const ObjectManifest& manifest) {
  std::stringstream buffer;
  write_manifest_body(manifest, buffer);
  const std::string data = buffer.str();
  return crypto::Bytes(data.begin(), data.end());
}

void RecordCodec::write_manifest_body(const ObjectManifest& manifest, std::ostream& output) {
  if (manifest.node_assignment.size() != manifest.fragment_count) {
    throw RecordFormatError("Node assignment count does not match fragment count");
  }

  write_bytes(output, MANIFEST_MAGIC, MAGIC_SIZE);
  write_int<uint16_t>(output, manifest.version);
  write_string(output, manifest.object_id);
  write_int<uint64_t>(output, manifest.generation);
  write_int<uint64_t>(output, manifest.fragment_count);
  write_int<uint64_t>(output, manifest.fragment_size);
  write_int<uint64_t>(output, manifest.compressed_size);

  uint8_t algorithm_tag = static_cast<uint8_t>(manifest.compression.algorithm);
  write_bytes(output, &algorithm_tag, sizeof(algorithm_tag));
  write_int<int32_t>(output, manifest.compression.level);
  write_int<uint64_t>(output, manifest.compression.original_size);

  write_digest(output, manifest.commitment_root);
  write_digest(output, manifest.object_checksum);

  write_int<uint64_t>(output, manifest.node_assignment.size());
  for (uint32_t node : manifest.node_assignment) {
    write_int<uint32_t>(output, node);
  }

  write_string(output, manifest.placement);
  write_string(output, manifest.signer);
}

//==============================================
// STREAM OPERATIONS
//==============================================

void RecordCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Failed to write " << size << " bytes to output stream";
    throw RecordFormatError("Failed to write to output stream");
  }
}

void RecordCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), size)) {
    throw RecordFormatError("Truncated record, expected " + std::to_string(size) + " more bytes");
  }
}

void RecordCodec::write_string(std::ostream& output, const std::string& value) {
  write_int<uint32_t>(output, static_cast<uint32_t>(value.size()));
  write_bytes(output, value.data(), value.size());
}

std::string RecordCodec::read_string(std::istream& input, uint32_t max_length) {
  uint32_t length = read_int<uint32_t>(input);
  if (length > max_length) {
    throw RecordFormatError("String field of " + std::to_string(length) + " bytes exceeds limit");
  }
  std::string value(length, '\0');
  read_bytes(input, value.data(), length);
  return value;
}

void RecordCodec::write_digest(std::ostream& output, const crypto::Digest& digest) {
  write_bytes(output, digest.data(), digest.size());
}

crypto::Digest RecordCodec::read_digest(std::istream& input) {
  crypto::Digest digest{};
  read_bytes(input, digest.data(), digest.size());
  return digest;
}

void RecordCodec::expect_magic(std::istream& input, const char* magic) {
  char buffer[MAGIC_SIZE];
  read_bytes(input, buffer, MAGIC_SIZE);
  if (std::memcmp(buffer, magic, MAGIC_SIZE) != 0) {
    throw RecordFormatError(std::string("Bad magic, expected ") + magic);
  }
}

uint64_t RecordCodec::remaining_bytes(std::istream& input) {
  auto position = input.tellg();
  if (position < 0) {
    throw RecordFormatError("Input stream is not seekable");
  }
  input.seekg(0, std::ios::end);
  auto end = input.tellg();
  input.seekg(position);
  if (end < position) {
    throw RecordFormatError("Input stream position past its end");
  }
  return static_cast<uint64_t>(end - position);
}

void RecordCodec::expect_end(std::istream& input) {
  if (input.peek() != std::char_traits<char>::eof()) {
    throw RecordFormatError("Trailing bytes after record");
  }
  input.clear();
}

} // namespace store
} // namespace crystal
