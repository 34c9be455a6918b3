#ifndef CRYSTAL_FRAGMENT_FRAGMENTER_HPP
#define CRYSTAL_FRAGMENT_FRAGMENTER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace crystal {
namespace fragment {

using Bytes = std::vector<uint8_t>;

// One chunk of a split stream tagged with its position
struct IndexedChunk {
  uint64_t index;
  Bytes data;
};

class FragmentOrderError : public std::runtime_error {
public:
  explicit FragmentOrderError(const std::string& message)
    : std::runtime_error("Fragment order error: " + message) {}
};

// Stateless splitting and reassembly of byte streams
class Fragmenter {
public:
  // Every chunk but the last is exactly fragment_size bytes, empty input gives no chunks.
  // Throws ConfigurationError when fragment_size is zero
  static std::vector<Bytes> split(const Bytes& input, size_t fragment_size);
  // Same as split() with each chunk tagged by its index
  static std::vector<IndexedChunk> split_indexed(const Bytes& input, size_t fragment_size);

  // Concatenates chunks already in index order
  static Bytes join(const std::vector<Bytes>& chunks);
  // Sorts by index and concatenates. Throws FragmentOrderError on gaps,
  // duplicates or a sequence not starting at zero
  static Bytes join(std::vector<IndexedChunk> chunks);

  // ceil(length / fragment_size)
  static uint64_t fragment_count(uint64_t length, size_t fragment_size);
};

} // namespace fragment
} // namespace crystal

#endif // CRYSTAL_FRAGMENT_FRAGMENTER_HPP
