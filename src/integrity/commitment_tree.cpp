#include "integrity/commitment_tree.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <set>
#include <sstream>

namespace crystal {
namespace integrity {

namespace {

constexpr uint8_t LEAF_PREFIX = 0x00;
constexpr uint8_t NODE_PREFIX = 0x01;

std::string join_indices(const std::vector<uint64_t>& indices) {
  std::stringstream ss;
  ss << "[";
  for (size_t i = 0; i < indices.size(); ++i) {
    ss << (i ? ", " : "") << indices[i];
  }
  ss << "]";
  return ss.str();
}

} // namespace

const char* object_state_to_string(ObjectState state) {
  switch (state) {
    case ObjectState::Uninitialized:     return "uninitialized";
    case ObjectState::Stored:            return "stored";
    case ObjectState::Verified:          return "verified";
    case ObjectState::PartiallyVerified: return "partially-verified";
    case ObjectState::Corrupted:         return "corrupted";
    case ObjectState::Recovered:         return "recovered";
    case ObjectState::Unrecoverable:     return "unrecoverable";
    default:                             return "unknown";
  }
}

//==============================================
// VERIFICATION REPORT
//==============================================

void VerificationReport::mark_failed(uint64_t index, const std::string& reason) {
  mark_all({{index, reason}}, {});
}

void VerificationReport::mark_missing(uint64_t index, const std::string& reason) {
  mark_all({}, {{index, reason}});
}

void VerificationReport::mark_all(const std::map<uint64_t, std::string>& failed,
                                  const std::map<uint64_t, std::string>& missing) {
  auto marked = [&](uint64_t index) { return failed.count(index) > 0 || missing.count(index) > 0; };
  for (auto* list : {&verified_indices, &failed_indices, &missing_indices}) {
    list->erase(std::remove_if(list->begin(), list->end(), marked), list->end());
  }

  for (const auto& entry : missing) {
    if (failed.count(entry.first) == 0) {
      missing_indices.push_back(entry.first);
      failure_reasons[entry.first] = entry.second;
    }
  }
  for (const auto& entry : failed) {
    failed_indices.push_back(entry.first);
    failure_reasons[entry.first] = entry.second;
  }
}

void VerificationReport::finalize() {
  std::sort(verified_indices.begin(), verified_indices.end());
  std::sort(failed_indices.begin(), failed_indices.end());
  std::sort(missing_indices.begin(), missing_indices.end());

  if (complete()) {
    state = ObjectState::Verified;
  } else if (verified_indices.empty()) {
    state = ObjectState::Corrupted;
  } else {
    state = ObjectState::PartiallyVerified;
  }
}

std::string VerificationReport::summary() const {
  std::stringstream ss;
  ss << "object '" << object_id << "' " << object_state_to_string(state)
     << ": " << verified_indices.size() << "/" << fragment_count << " fragments verified";
  if (!failed_indices.empty()) {
    ss << ", failed " << join_indices(failed_indices);
  }
  if (!missing_indices.empty()) {
    ss << ", missing " << join_indices(missing_indices);
  }
  return ss.str();
}

//==============================================
// HASHING
//==============================================

Digest CommitmentTree::leaf_hash(uint64_t index, const Digest& digest) {
  crypto::Sha256 hasher;
  hasher.update_u8(LEAF_PREFIX).update_u64(index).update(digest);
  return hasher.finalize();
}

Digest CommitmentTree::node_hash(const Digest& left, const Digest& right) {
  crypto::Sha256 hasher;
  hasher.update_u8(NODE_PREFIX).update(left).update(right);
  return hasher.finalize();
}

Digest CommitmentTree::empty_root() {
  return crypto::sha256(nullptr, 0);
}

//==============================================
// COMMITMENT CONSTRUCTION
//==============================================

Commitment CommitmentTree::build_commitment(const std::vector<Digest>& digests) {
  Commitment commitment;
  commitment.proofs.resize(digests.size());

  if (digests.empty()) {
    commitment.root = empty_root();
    BOOST_LOG_TRIVIAL(debug) << "Commitment tree: Empty digest set, using constant root";
    return commitment;
  }

  std::vector<Digest> level;
  level.reserve(digests.size());
  for (size_t i = 0; i < digests.size(); ++i) {
    level.push_back(leaf_hash(i, digests[i]));
  }

  // Position of a leaf at depth d is (index >> d) since promoted nodes keep their slot
  size_t depth = 0;
  while (level.size() > 1) {
    for (size_t leaf = 0; leaf < digests.size(); ++leaf) {
      size_t position = leaf >> depth;
      if (position % 2 == 1) {
        commitment.proofs[leaf].push_back({level[position - 1], true});
      } else if (position + 1 < level.size()) {
        commitment.proofs[leaf].push_back({level[position + 1], false});
      }
    }

    std::vector<Digest> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      if (i + 1 < level.size()) {
        next.push_back(node_hash(level[i], level[i + 1]));
      } else {
        next.push_back(level[i]);
      }
    }
    level = std::move(next);
    ++depth;
  }

  commitment.root = level.front();
  BOOST_LOG_TRIVIAL(debug) << "Commitment tree: Built root " << crypto::to_hex(commitment.root)
                           << " over " << digests.size() << " digests, depth " << depth;
  return commitment;
}

//==============================================
// VERIFICATION
//==============================================

bool CommitmentTree::verify_fragment(uint64_t index, const Digest& digest,
                                     const ProofPath& proof, const Digest& root) noexcept {
  try {
    Digest current = leaf_hash(index, digest);
    for (const auto& step : proof) {
      current = step.sibling_on_left ? node_hash(step.sibling, current)
                                     : node_hash(current, step.sibling);
    }
    return current == root;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Commitment tree: Verification of fragment " << index
                             << " aborted: " << e.what();
    return false;
  }
}

VerificationReport CommitmentTree::verify_object(uint64_t fragment_count,
                                                 const std::vector<FragmentEvidence>& evidence,
                                                 const Digest& root) {
  VerificationReport report;
  report.fragment_count = fragment_count;

  std::set<uint64_t> seen;
  std::set<uint64_t> verified;

  for (const auto& item : evidence) {
    if (item.index >= fragment_count) {
      BOOST_LOG_TRIVIAL(warning) << "Commitment tree: Ignoring evidence for out-of-range index "
                                 << item.index << " (fragment count " << fragment_count << ")";
      continue;
    }
    seen.insert(item.index);
    if (verify_fragment(item.index, item.digest, item.proof, root)) {
      verified.insert(item.index);
    }
  }

  for (uint64_t index = 0; index < fragment_count; ++index) {
    if (verified.count(index)) {
      report.verified_indices.push_back(index);
    } else if (seen.count(index)) {
      report.failed_indices.push_back(index);
      report.failure_reasons[index] = "inclusion proof does not match commitment root";
    } else {
      report.missing_indices.push_back(index);
      report.failure_reasons[index] = "no fragment available";
    }
  }

  report.finalize();
  BOOST_LOG_TRIVIAL(info) << "Commitment tree: " << report.verified_indices.size() << " verified, "
                          << report.failed_indices.size() << " failed, "
                          << report.missing_indices.size() << " missing";
  return report;
}

} // namespace integrity
} // namespace crystal
