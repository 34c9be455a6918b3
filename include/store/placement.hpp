#ifndef CRYSTAL_STORE_PLACEMENT_HPP
#define CRYSTAL_STORE_PLACEMENT_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace crystal {
namespace store {

// Decides which node location holds which fragment index
class PlacementStrategy {
public:
  virtual ~PlacementStrategy() = default;

  virtual uint32_t node_for(const std::string& object_id, uint64_t index, size_t node_count) const = 0;
  virtual const char* name() const = 0;

protected:
  PlacementStrategy() = default;
};

// index % node_count
class ModuloPlacement : public PlacementStrategy {
public:
  uint32_t node_for(const std::string& object_id, uint64_t index, size_t node_count) const override;
  const char* name() const override { return "modulo"; }
};

// Offsets the modulo sequence by a hash of the object id so that
// different objects do not all start on the first node
class HashedPlacement : public PlacementStrategy {
public:
  uint32_t node_for(const std::string& object_id, uint64_t index, size_t node_count) const override;
  const char* name() const override { return "hashed"; }
};

// Returns nullptr for unknown names
std::unique_ptr<PlacementStrategy> make_placement(const std::string& name);

} // namespace store
} // namespace crystal

#endif // CRYSTAL_STORE_PLACEMENT_HPP
