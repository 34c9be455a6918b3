#include "store/placement.hpp"
#include "crypto/digest.hpp"
#include <stdexcept>

namespace crystal {
namespace store {

uint32_t ModuloPlacement::node_for(const std::string& /*object_id*/, uint64_t index, size_t node_count) const {
  if (node_count == 0) {
    throw std::invalid_argument("Placement: No node locations configured");
  }
  return static_cast<uint32_t>(index % node_count);
}

uint32_t HashedPlacement::node_for(const std::string& object_id, uint64_t index, size_t node_count) const {
  if (node_count == 0) {
    throw std::invalid_argument("Placement: No node locations configured");
  }

  crypto::Digest digest = crypto::sha256(object_id);
  uint64_t offset = 0;
  for (size_t i = 0; i < sizeof(offset); ++i) {
    offset = (offset << 8) | digest[i];
  }
  return static_cast<uint32_t>((offset % node_count + index % node_count) % node_count);
}

std::unique_ptr<PlacementStrategy> make_placement(const std::string& name) {
  if (name == "modulo") {
    return std::make_unique<ModuloPlacement>();
  }
  if (name == "hashed") {
    return std::make_unique<HashedPlacement>();
  }
  return nullptr;
}

} // namespace store
} // namespace crystal
