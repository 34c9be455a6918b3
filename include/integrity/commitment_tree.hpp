#ifndef CRYSTAL_INTEGRITY_COMMITMENT_TREE_HPP
#define CRYSTAL_INTEGRITY_COMMITMENT_TREE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "crypto/digest.hpp"

namespace crystal {
namespace integrity {

using crypto::Digest;

// One step of an inclusion proof, from leaf towards root
struct ProofStep {
  Digest sibling;
  bool sibling_on_left;

  bool operator==(const ProofStep& other) const {
    return sibling == other.sibling && sibling_on_left == other.sibling_on_left;
  }
};

using ProofPath = std::vector<ProofStep>;

struct Commitment {
  Digest root;
  std::vector<ProofPath> proofs;   // one per fragment index
};

// What a verifier holds for one fragment
struct FragmentEvidence {
  uint64_t index;
  Digest digest;
  ProofPath proof;
};

// Lifecycle of a logical object as seen by verification and recovery
enum class ObjectState {
  Uninitialized,
  Stored,
  Verified,
  PartiallyVerified,
  Corrupted,
  Recovered,
  Unrecoverable
};

const char* object_state_to_string(ObjectState state);

struct VerificationReport {
  std::string object_id;
  uint64_t fragment_count = 0;
  std::vector<uint64_t> verified_indices;
  std::vector<uint64_t> failed_indices;
  std::vector<uint64_t> missing_indices;
  std::map<uint64_t, std::string> failure_reasons;
  ObjectState state = ObjectState::Stored;

  bool complete() const { return failed_indices.empty() && missing_indices.empty(); }

  // Marks an index failed with a reason, replacing a verified or missing entry
  void mark_failed(uint64_t index, const std::string& reason);
  void mark_missing(uint64_t index, const std::string& reason);
  // Applies many marks in one pass over the index lists. An index in both maps counts as failed
  void mark_all(const std::map<uint64_t, std::string>& failed,
                const std::map<uint64_t, std::string>& missing);
  // Sorts index lists and derives the state
  void finalize();
  std::string summary() const;
};

// Merkle commitment over ordered fragment digests.
// leaf     = SHA-256(0x00 | be64(index) | digest)
// internal = SHA-256(0x01 | left | right)
// A node without a sibling is promoted to the next level unchanged.
class CommitmentTree {
public:
  static Commitment build_commitment(const std::vector<Digest>& digests);

  // Never throws; any mismatch yields false
  static bool verify_fragment(uint64_t index, const Digest& digest,
                              const ProofPath& proof, const Digest& root) noexcept;

  static VerificationReport verify_object(uint64_t fragment_count,
                                          const std::vector<FragmentEvidence>& evidence,
                                          const Digest& root);

  // Root of an empty digest set: SHA-256 of the empty string
  static Digest empty_root();

  static Digest leaf_hash(uint64_t index, const Digest& digest);
  static Digest node_hash(const Digest& left, const Digest& right);
};

} // namespace integrity
} // namespace crystal

#endif // CRYSTAL_INTEGRITY_COMMITMENT_TREE_HPP
