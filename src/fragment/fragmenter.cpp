#include "fragment/fragmenter.hpp"
#include "config/config_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace crystal {
namespace fragment {

namespace {

void check_fragment_size(size_t fragment_size) {
  if (fragment_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: Fragment size must be positive";
    throw config::ConfigurationError("fragment_size must be a positive integer");
  }
}

} // namespace

//==============================================
// SPLITTING
//==============================================

std::vector<Bytes> Fragmenter::split(const Bytes& input, size_t fragment_size) {
  check_fragment_size(fragment_size);

  std::vector<Bytes> chunks;
  chunks.reserve(fragment_count(input.size(), fragment_size));

  for (size_t offset = 0; offset < input.size(); offset += fragment_size) {
    size_t length = std::min(fragment_size, input.size() - offset);
    chunks.emplace_back(input.begin() + offset, input.begin() + offset + length);
    BOOST_LOG_TRIVIAL(trace) << "Fragmenter: Fragment " << chunks.size() - 1 << ": Size = " << length << " bytes";
  }

  BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Split " << input.size() << " bytes into "
                           << chunks.size() << " fragments of up to " << fragment_size << " bytes";
  return chunks;
}

std::vector<IndexedChunk> Fragmenter::split_indexed(const Bytes& input, size_t fragment_size) {
  std::vector<Bytes> chunks = split(input, fragment_size);

  std::vector<IndexedChunk> indexed;
  indexed.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    indexed.push_back({i, std::move(chunks[i])});
  }
  return indexed;
}

//==============================================
// REASSEMBLY
//==============================================

Bytes Fragmenter::join(const std::vector<Bytes>& chunks) {
  size_t total = 0;
  for (const auto& chunk : chunks) {
    total += chunk.size();
  }

  Bytes data;
  data.reserve(total);
  for (const auto& chunk : chunks) {
    data.insert(data.end(), chunk.begin(), chunk.end());
  }

  BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Merged data size: " << data.size() << " bytes";
  return data;
}

Bytes Fragmenter::join(std::vector<IndexedChunk> chunks) {
  std::sort(chunks.begin(), chunks.end(),
            [](const IndexedChunk& a, const IndexedChunk& b) { return a.index < b.index; });

  for (size_t position = 0; position < chunks.size(); ++position) {
    uint64_t index = chunks[position].index;
    if (index == position) {
      continue;
    }
    if (position > 0 && index == chunks[position - 1].index) {
      BOOST_LOG_TRIVIAL(error) << "Fragmenter: Duplicate fragment index " << index;
      throw FragmentOrderError("duplicate fragment index " + std::to_string(index));
    }
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: Missing fragment index " << position;
    throw FragmentOrderError("missing fragment index " + std::to_string(position));
  }

  std::vector<Bytes> ordered;
  ordered.reserve(chunks.size());
  for (auto& chunk : chunks) {
    ordered.push_back(std::move(chunk.data));
  }
  return join(ordered);
}

uint64_t Fragmenter::fragment_count(uint64_t length, size_t fragment_size) {
  check_fragment_size(fragment_size);
  return (length + fragment_size - 1) / fragment_size;
}

} // namespace fragment
} // namespace crystal
