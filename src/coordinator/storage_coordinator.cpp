#include "coordinator/storage_coordinator.hpp"
#include "fragment/fragmenter.hpp"
#include "utils/retry.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <map>
#include <sstream>

namespace crystal {
namespace coordinator {

namespace {

config::StorageConfig validated(const config::StorageConfig& config) {
  config.validate();
  return config;
}

config::StorageConfig with_node_locations(config::StorageConfig config,
                                          const std::vector<std::shared_ptr<store::NodeStore>>& nodes) {
  config.node_paths.clear();
  for (const auto& node : nodes) {
    if (!node) {
      throw config::ConfigurationError("null node location");
    }
    config.node_paths.push_back(node->location());
  }
  config.validate();
  return config;
}

std::vector<std::shared_ptr<store::NodeStore>> open_nodes(const std::vector<std::string>& paths) {
  std::vector<std::shared_ptr<store::NodeStore>> nodes;
  nodes.reserve(paths.size());
  for (const auto& path : paths) {
    nodes.push_back(std::make_shared<store::Store>(path));
  }
  return nodes;
}

compression::Compressor::Strategy strategy_of(const config::StorageConfig& config) {
  auto strategy = compression::Compressor::strategy_from_string(config.compression);
  if (!strategy) {
    throw config::ConfigurationError("unknown compression strategy: " + config.compression);
  }
  return *strategy;
}

std::unique_ptr<store::PlacementStrategy> placement_of(const config::StorageConfig& config) {
  auto placement = store::make_placement(config.placement);
  if (!placement) {
    throw config::ConfigurationError("unknown placement strategy: " + config.placement);
  }
  return placement;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

StorageCoordinator::StorageCoordinator(const config::StorageConfig& config, const crypto::KeyPair& keys)
  : StorageCoordinator(config, keys, open_nodes(validated(config).node_paths)) {}

StorageCoordinator::StorageCoordinator(const config::StorageConfig& config, const crypto::KeyPair& keys,
                                       std::vector<std::shared_ptr<store::NodeStore>> nodes)
  : config_(with_node_locations(config, nodes)),
    keys_(keys),
    compressor_(strategy_of(config_)),
    placement_(placement_of(config_)),
    nodes_(std::move(nodes)),
    pool_(config_.worker_threads) {
  BOOST_LOG_TRIVIAL(info) << "Coordinator: Ready with " << nodes_.size() << " node location(s), "
                          << "fragment size " << config_.fragment_size << ", placement "
                          << placement_->name() << ", compression " << config_.compression;
}


//==============================================
// STORE
//==============================================

store::ObjectManifest StorageCoordinator::store(const crypto::Bytes& data, const std::string& object_id) {
  validate_object_id(object_id);
  BOOST_LOG_TRIVIAL(info) << "Coordinator: Storing object '" << object_id << "' (" << data.size() << " bytes)";

  // The previous version stays readable until the new manifest replaces it
  std::optional<store::ObjectManifest> previous = previous_manifest(object_id);

  store::ObjectManifest manifest;
  manifest.object_id = object_id;
  manifest.generation = next_generation(previous);
  manifest.fragment_size = config_.fragment_size;
  manifest.placement = placement_->name();
  manifest.object_checksum = crypto::sha256(data);

  auto compressed = compressor_.compress(data);
  manifest.compression = compressed.second;
  manifest.compressed_size = compressed.first.size();

  std::vector<fragment::IndexedChunk> chunks =
      fragment::Fragmenter::split_indexed(compressed.first, config_.fragment_size);
  manifest.fragment_count = chunks.size();

  struct Sealed {
    crypto::Digest digest;
    crypto::Digest commitment;
    crypto::Bytes ciphertext;
  };

  std::vector<std::future<Sealed>> sealing;
  sealing.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    sealing.push_back(pool_.submit([this, &manifest, &chunk]() {
      crypto::FragmentCipher cipher(config_.fragment_size);
      Sealed sealed;
      sealed.digest = crypto::FragmentCipher::digest(chunk.data);
      sealed.ciphertext = cipher.encrypt_fragment(
          chunk.data, keys_, associated_data(manifest.object_id, manifest.generation, chunk.index));
      sealed.commitment = crypto::FragmentCipher::commitment(sealed.digest, sealed.ciphertext);
      return sealed;
    }));
  }

  // The root needs every fragment, wait for all of them
  std::vector<Sealed> sealed = utils::WorkerPool::wait_all(sealing);
  chunks.clear();

  std::vector<crypto::Digest> commitments;
  commitments.reserve(sealed.size());
  for (const auto& item : sealed) {
    commitments.push_back(item.commitment);
  }
  integrity::Commitment commitment = integrity::CommitmentTree::build_commitment(commitments);
  manifest.commitment_root = commitment.root;

  for (uint64_t index = 0; index < manifest.fragment_count; ++index) {
    manifest.node_assignment.push_back(placement_->node_for(object_id, index, nodes_.size()));
  }

  manifest.signer = key_manager_.fingerprint(keys_);
  manifest.signature = key_manager_.sign(keys_, store::RecordCodec::signed_payload(manifest));

  // Fragment records
  std::vector<std::future<void>> writes;
  writes.reserve(sealed.size());
  for (uint64_t index = 0; index < manifest.fragment_count; ++index) {
    writes.push_back(pool_.submit([this, &manifest, &sealed, &commitment, index]() {
      store::FragmentRecord record;
      record.object_id = manifest.object_id;
      record.index = index;
      record.fragment_count = manifest.fragment_count;
      record.digest = sealed[index].digest;
      record.proof = commitment.proofs[index];
      record.ciphertext = sealed[index].ciphertext;

      std::stringstream buffer;
      store::RecordCodec::serialize(record, buffer);
      write_record(*nodes_[manifest.node_assignment[index]],
                   fragment_key(manifest.object_id, manifest.generation, index), buffer.str());
    }));
  }

  for (auto& write : writes) {
    write.wait();
  }

  std::vector<std::pair<uint32_t, std::string>> written;
  std::vector<std::string> failures;
  for (uint64_t index = 0; index < writes.size(); ++index) {
    try {
      writes[index].get();
      written.emplace_back(manifest.node_assignment[index],
                           fragment_key(object_id, manifest.generation, index));
    }
    catch (const std::exception& e) {
      failures.push_back("fragment " + std::to_string(index) + ": " + e.what());
    }
  }

  if (!failures.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Coordinator: " << failures.size() << " fragment write(s) of '"
                             << object_id << "' failed, rolling back";
    discard_records(written);
    throw StorageError("could not write " + std::to_string(failures.size()) + " fragment(s) of '"
                       + object_id + "', first failure: " + failures.front());
  }

  // The manifest goes last and on every node, an object without one is never visible
  std::stringstream manifest_buffer;
  store::RecordCodec::serialize(manifest, manifest_buffer);
  const std::string manifest_payload = manifest_buffer.str();

  std::vector<std::optional<std::string>> replaced;
  replaced.reserve(nodes_.size());
  for (uint32_t node_index = 0; node_index < nodes_.size(); ++node_index) {
    try {
      replaced.push_back(read_record(*nodes_[node_index], manifest_key(object_id)));
      write_record(*nodes_[node_index], manifest_key(object_id), manifest_payload);
    }
    catch (const IOError& e) {
      BOOST_LOG_TRIVIAL(error) << "Coordinator: Manifest write of '" << object_id << "' to "
                               << nodes_[node_index]->location() << " failed, rolling back";
      restore_manifests(object_id, replaced);
      discard_records(written);
      throw StorageError("could not write manifest of '" + object_id + "' to "
                         + nodes_[node_index]->location() + ": " + e.what());
    }
  }

  if (previous) {
    discard_generation(*previous);
  }

  BOOST_LOG_TRIVIAL(info) << "Coordinator: Stored '" << object_id << "' as " << manifest.fragment_count
                          << " fragment(s) (" << compression::algorithm_to_string(manifest.compression.algorithm)
                          << ", " << manifest.compressed_size << " bytes), root "
                          << crypto::to_hex(manifest.commitment_root);
  return manifest;
}


//==============================================
// VERIFY AND RECOVER
//==============================================

integrity::VerificationReport StorageCoordinator::verify(const std::string& object_id) {
  BOOST_LOG_TRIVIAL(info) << "Coordinator: Verifying object '" << object_id << "'";
  store::ObjectManifest manifest = this->manifest(object_id);

  std::vector<FragmentOutcome> outcomes;
  integrity::VerificationReport report = collect(manifest, outcomes);

  if (report.complete()) {
    BOOST_LOG_TRIVIAL(info) << "Coordinator: " << report.summary();
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Coordinator: " << report.summary();
  }
  return report;
}

crypto::Bytes StorageCoordinator::recover(const std::string& object_id) {
  BOOST_LOG_TRIVIAL(info) << "Coordinator: Recovering object '" << object_id << "'";
  store::ObjectManifest manifest = this->manifest(object_id);

  std::vector<FragmentOutcome> outcomes;
  integrity::VerificationReport report = collect(manifest, outcomes);
  if (!report.complete()) {
    report.state = integrity::ObjectState::Unrecoverable;
    BOOST_LOG_TRIVIAL(error) << "Coordinator: Refusing to recover, " << report.summary();
    throw RecoveryError(report.summary(), report);
  }

  struct Opened {
    uint64_t index = 0;
    crypto::Bytes plaintext;
    std::string failure;
  };

  std::vector<std::future<Opened>> opening;
  opening.reserve(outcomes.size());
  for (const auto& outcome : outcomes) {
    opening.push_back(pool_.submit([this, &manifest, &outcome]() {
      Opened opened;
      opened.index = outcome.index;
      crypto::FragmentCipher cipher(manifest.fragment_size);
      try {
        opened.plaintext = cipher.decrypt_fragment(
            outcome.record->ciphertext, keys_,
            associated_data(manifest.object_id, manifest.generation, outcome.index));
      }
      catch (const crypto::DecryptionError& e) {
        opened.failure = e.what();
        return opened;
      }

      if (crypto::FragmentCipher::digest(opened.plaintext) != outcome.record->digest) {
        opened.failure = "plaintext digest does not match the committed digest";
      } else {
        uint64_t expected = outcome.index + 1 < manifest.fragment_count
            ? manifest.fragment_size
            : manifest.compressed_size - manifest.fragment_size * (manifest.fragment_count - 1);
        if (opened.plaintext.size() != expected) {
          opened.failure = "fragment holds " + std::to_string(opened.plaintext.size())
                           + " bytes, expected " + std::to_string(expected);
        }
      }
      if (!opened.failure.empty()) {
        opened.plaintext.clear();
      }
      return opened;
    }));
  }

  std::vector<Opened> opened = utils::WorkerPool::wait_all(opening);

  std::vector<fragment::IndexedChunk> chunks;
  chunks.reserve(opened.size());
  std::map<uint64_t, std::string> undecryptable;
  for (auto& item : opened) {
    if (!item.failure.empty()) {
      undecryptable[item.index] = item.failure;
    } else {
      chunks.push_back({item.index, std::move(item.plaintext)});
    }
  }
  report.mark_all(undecryptable, {});

  if (!report.complete()) {
    report.finalize();
    report.state = integrity::ObjectState::Unrecoverable;
    BOOST_LOG_TRIVIAL(error) << "Coordinator: Decryption check failed, " << report.summary();
    throw RecoveryError(report.summary(), report);
  }

  crypto::Bytes data;
  try {
    crypto::Bytes compressed = fragment::Fragmenter::join(std::move(chunks));
    if (compressed.size() != manifest.compressed_size) {
      report.state = integrity::ObjectState::Unrecoverable;
      throw RecoveryError("reassembled " + std::to_string(compressed.size()) + " bytes, manifest records "
                          + std::to_string(manifest.compressed_size), report);
    }
    data = compressor_.decompress(compressed, manifest.compression);
  }
  catch (const fragment::FragmentOrderError& e) {
    report.state = integrity::ObjectState::Unrecoverable;
    throw RecoveryError(e.what(), report);
  }
  catch (const compression::CompressionError& e) {
    report.state = integrity::ObjectState::Unrecoverable;
    throw RecoveryError(e.what(), report);
  }

  if (crypto::sha256(data) != manifest.object_checksum) {
    report.state = integrity::ObjectState::Unrecoverable;
    BOOST_LOG_TRIVIAL(error) << "Coordinator: Checksum mismatch after reassembling '" << object_id << "'";
    throw RecoveryError("object checksum mismatch after reassembly", report);
  }

  report.state = integrity::ObjectState::Recovered;
  BOOST_LOG_TRIVIAL(info) << "Coordinator: Recovered '" << object_id << "' (" << data.size() << " bytes)";
  return data;
}


//==============================================
// REMOVE
//==============================================

void StorageCoordinator::remove(const std::string& object_id) {
  BOOST_LOG_TRIVIAL(info) << "Coordinator: Removing object '" << object_id << "'";
  store::ObjectManifest manifest = this->manifest(object_id);

  std::vector<std::future<bool>> removals;
  removals.reserve(manifest.fragment_count);
  for (uint64_t index = 0; index < manifest.fragment_count; ++index) {
    uint32_t node_index = manifest.node_assignment[index];
    if (node_index >= nodes_.size()) {
      BOOST_LOG_TRIVIAL(warning) << "Coordinator: Fragment " << index << " is assigned to node "
                                 << node_index << " which is not configured, skipping";
      continue;
    }
    removals.push_back(pool_.submit([this, node_index, &manifest, index]() {
      return remove_record(*nodes_[node_index], fragment_key(manifest.object_id, manifest.generation, index));
    }));
  }

  for (auto& removal : removals) {
    removal.wait();
  }
  std::size_t failed = 0;
  std::string first_failure;
  for (auto& removal : removals) {
    try {
      removal.get();
    }
    catch (const IOError& e) {
      if (failed++ == 0) {
        first_failure = e.what();
      }
    }
  }

  // Keep the manifest while fragments remain so the removal can be repeated
  if (failed > 0) {
    throw StorageError("could not remove " + std::to_string(failed) + " fragment(s) of '"
                       + object_id + "': " + first_failure);
  }

  for (const auto& node : nodes_) {
    remove_record(*node, manifest_key(object_id));
  }
  BOOST_LOG_TRIVIAL(info) << "Coordinator: Removed '" << object_id << "'";
}


//==============================================
// MANIFEST
//==============================================

store::ObjectManifest StorageCoordinator::manifest(const std::string& object_id) {
  validate_object_id(object_id);
  const std::string key = manifest_key(object_id);

  bool found = false;
  std::size_t io_failures = 0;
  std::vector<std::string> problems;

  for (const auto& node : nodes_) {
    std::stringstream buffer;
    try {
      utils::with_retry<IOError>(config_.retry, "read " + key + " from " + node->location(), [&]() {
        buffer.str("");
        buffer.clear();
        node->get(key, buffer);
      });
    }
    catch (const store::KeyMissingError&) {
      continue;
    }
    catch (const IOError& e) {
      ++io_failures;
      BOOST_LOG_TRIVIAL(warning) << "Coordinator: Manifest unreadable at " << node->location() << ": " << e.what();
      continue;
    }

    found = true;
    store::ObjectManifest manifest;
    try {
      manifest = store::RecordCodec::deserialize_manifest(buffer);
    }
    catch (const store::RecordFormatError& e) {
      problems.push_back(node->location() + ": " + e.what());
      continue;
    }

    if (manifest.object_id != object_id) {
      problems.push_back(node->location() + ": manifest names object '" + manifest.object_id + "'");
      continue;
    }
    if (!key_manager_.verify_signature(keys_, store::RecordCodec::signed_payload(manifest), manifest.signature)) {
      problems.push_back(node->location() + ": signature verification failed");
      continue;
    }
    if (manifest.fragment_size > crypto::FragmentCipher::MAX_FRAGMENT_SIZE) {
      problems.push_back(node->location() + ": fragment size " + std::to_string(manifest.fragment_size)
                         + " is not supported");
      continue;
    }

    BOOST_LOG_TRIVIAL(debug) << "Coordinator: Using manifest of '" << object_id << "' from " << node->location();
    return manifest;
  }

  if (found) {
    std::string details;
    for (const auto& problem : problems) {
      details += (details.empty() ? "" : "; ") + problem;
    }
    BOOST_LOG_TRIVIAL(error) << "Coordinator: No authentic manifest for '" << object_id << "': " << details;
    throw ManifestIntegrityError("no authentic manifest for '" + object_id + "': " + details);
  }
  if (io_failures > 0) {
    throw StorageError("manifest of '" + object_id + "' unreadable on " + std::to_string(io_failures)
                       + " node location(s)");
  }
  throw ManifestNotFoundError(object_id);
}


//==============================================
// HELPERS
//==============================================

std::string StorageCoordinator::fragment_key(const std::string& object_id, uint64_t generation, uint64_t index) {
  return object_id + "/" + std::to_string(generation) + "/fragment/" + std::to_string(index);
}

std::string StorageCoordinator::manifest_key(const std::string& object_id) {
  return object_id + "/manifest";
}

void StorageCoordinator::validate_object_id(const std::string& object_id) const {
  if (object_id.empty()) {
    throw std::invalid_argument("Object id must not be empty");
  }
  if (object_id.size() > store::RecordCodec::MAX_OBJECT_ID_LENGTH) {
    throw std::invalid_argument("Object id exceeds " + std::to_string(store::RecordCodec::MAX_OBJECT_ID_LENGTH)
                                + " bytes");
  }
}

crypto::Bytes StorageCoordinator::associated_data(const std::string& object_id, uint64_t generation,
                                                  uint64_t index) {
  crypto::Bytes data(object_id.begin(), object_id.end());
  for (uint64_t value : {generation, index}) {
    uint64_t network_value = boost::endian::native_to_big(value);
    const uint8_t* raw = reinterpret_cast<const uint8_t*>(&network_value);
    data.insert(data.end(), raw, raw + sizeof(network_value));
  }
  return data;
}

std::optional<store::ObjectManifest> StorageCoordinator::previous_manifest(const std::string& object_id) {
  try {
    return manifest(object_id);
  }
  catch (const ManifestNotFoundError&) {
    return std::nullopt;
  }
  catch (const ManifestError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Coordinator: Ignoring unusable previous manifest of '" << object_id
                               << "': " << e.what();
    return std::nullopt;
  }
  catch (const StorageError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Coordinator: Previous manifest of '" << object_id
                               << "' unreadable, its fragments will not be reclaimed: " << e.what();
    return std::nullopt;
  }
}

uint64_t StorageCoordinator::next_generation(const std::optional<store::ObjectManifest>& previous) {
  // Wall clock keeps generations unique even when an older manifest could not be read
  auto now = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  uint64_t generation = now > 0 ? static_cast<uint64_t>(now) : 1;
  if (previous && previous->generation >= generation) {
    generation = previous->generation + 1;
  }
  return generation;
}

void StorageCoordinator::restore_manifests(const std::string& object_id,
                                           const std::vector<std::optional<std::string>>& replaced) noexcept {
  for (uint32_t node_index = 0; node_index < replaced.size(); ++node_index) {
    store::NodeStore& node = *nodes_[node_index];
    try {
      if (replaced[node_index]) {
        write_record(node, manifest_key(object_id), *replaced[node_index]);
      } else {
        remove_record(node, manifest_key(object_id));
      }
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Coordinator: Could not restore manifest of '" << object_id
                                 << "' at " << node.location() << ": " << e.what();
    }
  }
}

void StorageCoordinator::discard_generation(const store::ObjectManifest& previous) noexcept {
  std::vector<std::pair<uint32_t, std::string>> records;
  for (uint64_t index = 0; index < previous.fragment_count; ++index) {
    uint32_t node_index = previous.node_assignment[index];
    if (node_index < nodes_.size()) {
      records.emplace_back(node_index, fragment_key(previous.object_id, previous.generation, index));
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Coordinator: Reclaiming " << records.size() << " fragment(s) of generation "
                           << previous.generation << " of '" << previous.object_id << "'";
  discard_records(records);
}

void StorageCoordinator::write_record(store::NodeStore& node, const std::string& key, const std::string& payload) {
  utils::with_retry<IOError>(config_.retry, "write " + key + " to " + node.location(), [&]() {
    std::istringstream input(payload);
    node.store(key, input);
  });
}

std::optional<std::string> StorageCoordinator::read_record(store::NodeStore& node, const std::string& key) {
  std::stringstream buffer;
  try {
    utils::with_retry<IOError>(config_.retry, "read " + key + " from " + node.location(), [&]() {
      buffer.str("");
      buffer.clear();
      node.get(key, buffer);
    });
  }
  catch (const store::KeyMissingError&) {
    return std::nullopt;
  }
  return buffer.str();
}

bool StorageCoordinator::remove_record(store::NodeStore& node, const std::string& key) {
  try {
    utils::with_retry<IOError>(config_.retry, "remove " + key + " from " + node.location(), [&]() {
      node.remove(key);
    });
    return true;
  }
  catch (const store::KeyMissingError&) {
    BOOST_LOG_TRIVIAL(debug) << "Coordinator: " << key << " already absent at " << node.location();
    return false;
  }
}

integrity::VerificationReport StorageCoordinator::collect(const store::ObjectManifest& manifest,
                                                          std::vector<FragmentOutcome>& outcomes) {
  std::vector<std::future<FragmentOutcome>> fetches;
  fetches.reserve(manifest.fragment_count);
  for (uint64_t index = 0; index < manifest.fragment_count; ++index) {
    fetches.push_back(pool_.submit([this, &manifest, index]() {
      return fetch_fragment(manifest, index);
    }));
  }
  outcomes = utils::WorkerPool::wait_all(fetches);

  std::vector<integrity::FragmentEvidence> evidence;
  evidence.reserve(outcomes.size());
  for (const auto& outcome : outcomes) {
    if (outcome.record) {
      evidence.push_back({outcome.index, outcome.commitment, outcome.record->proof});
    }
  }

  integrity::VerificationReport report = integrity::CommitmentTree::verify_object(
      manifest.fragment_count, evidence, manifest.commitment_root);
  report.object_id = manifest.object_id;

  std::map<uint64_t, std::string> failed;
  std::map<uint64_t, std::string> missing;
  for (const auto& outcome : outcomes) {
    if (outcome.record) {
      continue;
    }
    (outcome.missing ? missing : failed)[outcome.index] = outcome.reason;
  }
  report.mark_all(failed, missing);
  report.finalize();
  return report;
}

StorageCoordinator::FragmentOutcome StorageCoordinator::fetch_fragment(const store::ObjectManifest& manifest,
                                                                       uint64_t index) {
  FragmentOutcome outcome;
  outcome.index = index;

  uint32_t node_index = manifest.node_assignment[index];
  if (node_index >= nodes_.size()) {
    outcome.missing = true;
    outcome.reason = "assigned node " + std::to_string(node_index) + " is not configured";
    return outcome;
  }

  store::NodeStore& node = *nodes_[node_index];
  const std::string key = fragment_key(manifest.object_id, manifest.generation, index);
  std::stringstream buffer;

  try {
    utils::with_retry<IOError>(config_.retry, "read " + key + " from " + node.location(), [&]() {
      buffer.str("");
      buffer.clear();
      node.get(key, buffer);
    });
  }
  catch (const store::KeyMissingError&) {
    outcome.missing = true;
    outcome.reason = "fragment record not found at " + node.location();
    return outcome;
  }
  catch (const IOError& e) {
    outcome.missing = true;
    outcome.reason = std::string("read failed after retries: ") + e.what();
    return outcome;
  }

  store::FragmentRecord record;
  try {
    record = store::RecordCodec::deserialize_fragment(buffer);
  }
  catch (const store::RecordFormatError& e) {
    outcome.reason = e.what();
    return outcome;
  }

  if (record.object_id != manifest.object_id || record.index != index
      || record.fragment_count != manifest.fragment_count) {
    outcome.reason = "record header does not match the manifest";
    return outcome;
  }

  outcome.commitment = crypto::FragmentCipher::commitment(record.digest, record.ciphertext);
  outcome.record = std::move(record);
  return outcome;
}

void StorageCoordinator::discard_records(const std::vector<std::pair<uint32_t, std::string>>& written) noexcept {
  for (const auto& entry : written) {
    try {
      remove_record(*nodes_[entry.first], entry.second);
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Coordinator: Could not roll back " << entry.second
                                 << " at " << nodes_[entry.first]->location() << ": " << e.what();
    }
  }
}

} // namespace coordinator
} // namespace crystal
