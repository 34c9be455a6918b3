#ifndef CRYSTAL_COORDINATOR_STORAGE_COORDINATOR_HPP
#define CRYSTAL_COORDINATOR_STORAGE_COORDINATOR_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "compression/compressor.hpp"
#include "config/config.hpp"
#include "crypto/fragment_cipher.hpp"
#include "crypto/key_manager.hpp"
#include "integrity/commitment_tree.hpp"
#include "store/placement.hpp"
#include "store/record_codec.hpp"
#include "store/store.hpp"
#include "utils/worker_pool.hpp"

namespace crystal {
namespace coordinator {

// A store could not be completed, nothing usable was committed
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message)
    : std::runtime_error("Storage error: " + message) {}
};

// Recovery refused to produce plaintext. The report names every missing and failed index
class RecoveryError : public std::runtime_error {
public:
  RecoveryError(const std::string& message, integrity::VerificationReport report)
    : std::runtime_error("Recovery error: " + message), report_(std::move(report)) {}

  const integrity::VerificationReport& report() const { return report_; }

private:
  integrity::VerificationReport report_;
};

class ManifestError : public std::runtime_error {
public:
  explicit ManifestError(const std::string& message)
    : std::runtime_error("Manifest error: " + message) {}
};

// No node location holds a manifest for the object
class ManifestNotFoundError : public ManifestError {
public:
  explicit ManifestNotFoundError(const std::string& object_id)
    : ManifestError("no manifest found for object '" + object_id + "'") {}
};

// Every manifest copy found was malformed or carried an invalid signature
class ManifestIntegrityError : public ManifestError {
public:
  explicit ManifestIntegrityError(const std::string& message)
    : ManifestError(message) {}
};

// Drives store, verify, recover and remove across the configured node locations.
// Per-fragment work runs on the worker pool, key material is shared read-only.
class StorageCoordinator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens a directory Store for every configured node path
  StorageCoordinator(const config::StorageConfig& config, const crypto::KeyPair& keys);
  // Uses the given node locations in place of config.node_paths
  StorageCoordinator(const config::StorageConfig& config, const crypto::KeyPair& keys,
                     std::vector<std::shared_ptr<store::NodeStore>> nodes);

  StorageCoordinator(const StorageCoordinator&) = delete;
  StorageCoordinator& operator=(const StorageCoordinator&) = delete;


  // ---- OBJECT OPERATIONS ----
  // compress -> split -> digest + encrypt per fragment -> commit -> persist.
  // Throws StorageError when any record cannot be written after retries.
  store::ObjectManifest store(const crypto::Bytes& data, const std::string& object_id);

  // Checks every stored fragment against the committed root without decrypting
  integrity::VerificationReport verify(const std::string& object_id);

  // Returns the original bytes only when every fragment verifies and decrypts.
  // Throws RecoveryError carrying the report otherwise.
  crypto::Bytes recover(const std::string& object_id);

  // Deletes all fragment records and manifest copies, already absent entries are skipped
  void remove(const std::string& object_id);

  // Loads and authenticates the manifest
  store::ObjectManifest manifest(const std::string& object_id);


  // ---- GETTERS ----
  std::size_t node_count() const { return nodes_.size(); }
  const config::StorageConfig& storage_config() const { return config_; }

  // ---- RECORD KEYS ----
  static std::string fragment_key(const std::string& object_id, uint64_t generation, uint64_t index);
  static std::string manifest_key(const std::string& object_id);

private:
  // Result of fetching and checking one fragment
  struct FragmentOutcome {
    uint64_t index = 0;
    std::optional<store::FragmentRecord> record;
    crypto::Digest commitment{};
    bool missing = false;
    std::string reason;     // set when record is empty
  };

  // ---- PARAMETERS ----
  config::StorageConfig config_;
  const crypto::KeyPair keys_;
  crypto::KeyManager key_manager_;
  compression::Compressor compressor_;
  std::unique_ptr<store::PlacementStrategy> placement_;
  std::vector<std::shared_ptr<store::NodeStore>> nodes_;
  utils::WorkerPool pool_;


  // ---- HELPERS ----
  void validate_object_id(const std::string& object_id) const;
  // object_id | be64(generation) | be64(index)
  static crypto::Bytes associated_data(const std::string& object_id, uint64_t generation, uint64_t index);

  // Authentic manifest currently published for the object, if any
  std::optional<store::ObjectManifest> previous_manifest(const std::string& object_id);
  static uint64_t next_generation(const std::optional<store::ObjectManifest>& previous);
  void write_record(store::NodeStore& node, const std::string& key, const std::string& payload);
  // Empty when the key is absent, other read failures throw after retries
  std::optional<std::string> read_record(store::NodeStore& node, const std::string& key);
  // Returns false when the key was already absent
  bool remove_record(store::NodeStore& node, const std::string& key);

  // Fetches every fragment of the object and checks headers and inclusion proofs
  integrity::VerificationReport collect(const store::ObjectManifest& manifest,
                                        std::vector<FragmentOutcome>& outcomes);
  FragmentOutcome fetch_fragment(const store::ObjectManifest& manifest, uint64_t index);

  // Best effort removal used to roll back a failed store
  void discard_records(const std::vector<std::pair<uint32_t, std::string>>& written) noexcept;
  // Puts back the manifest bytes each node held before publishing, or removes the new copy
  void restore_manifests(const std::string& object_id,
                         const std::vector<std::optional<std::string>>& replaced) noexcept;
  // Deletes the fragment records of a superseded generation
  void discard_generation(const store::ObjectManifest& previous) noexcept;
};

} // namespace coordinator
} // namespace crystal

#endif // CRYSTAL_COORDINATOR_STORAGE_COORDINATOR_HPP
