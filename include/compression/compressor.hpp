#ifndef CRYSTAL_COMPRESSION_COMPRESSOR_HPP
#define CRYSTAL_COMPRESSION_COMPRESSOR_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace crystal {
namespace compression {

using Bytes = std::vector<uint8_t>;

// Closed set of stream encodings, the tag value is persisted in manifests
enum class Algorithm : uint8_t {
  Raw = 0,
  DeflateFast = 1,
  DeflateBest = 2
};

const char* algorithm_to_string(Algorithm algorithm);
std::optional<Algorithm> algorithm_from_tag(uint8_t tag);

// Everything needed to reverse compression without consulting configuration
struct CompressionMetadata {
  Algorithm algorithm = Algorithm::Raw;
  int32_t level = 0;
  uint64_t original_size = 0;
};

class CompressionError : public std::runtime_error {
public:
  explicit CompressionError(const std::string& message)
    : std::runtime_error("Compression error: " + message) {}
};

// Capability interface implemented by every encoding
class CompressionCodec {
public:
  virtual ~CompressionCodec() = default;

  virtual Algorithm algorithm() const = 0;
  virtual int32_t level() const = 0;
  virtual Bytes encode(const Bytes& input) const = 0;
  virtual Bytes decode(const Bytes& input, uint64_t original_size) const = 0;

protected:
  CompressionCodec() = default;
};

class RawCodec : public CompressionCodec {
public:
  Algorithm algorithm() const override { return Algorithm::Raw; }
  int32_t level() const override { return 0; }
  Bytes encode(const Bytes& input) const override;
  Bytes decode(const Bytes& input, uint64_t original_size) const override;
};

// zlib stream at a fixed compression level
class DeflateCodec : public CompressionCodec {
public:
  DeflateCodec(Algorithm algorithm, int32_t level);

  Algorithm algorithm() const override { return algorithm_; }
  int32_t level() const override { return level_; }
  Bytes encode(const Bytes& input) const override;
  Bytes decode(const Bytes& input, uint64_t original_size) const override;

private:
  Algorithm algorithm_;
  int32_t level_;
};

class Compressor {
public:
  enum class Strategy {
    Auto,   // choose from data characteristics
    Fast,
    Best,
    None
  };

  static constexpr double RAW_ENTROPY_THRESHOLD = 7.5;       // bits per byte
  static constexpr size_t FAST_SIZE_THRESHOLD = 1024 * 1024;
  static constexpr size_t ENTROPY_SAMPLE_SIZE = 64 * 1024;
  static constexpr uint32_t ENCODE_ATTEMPTS = 2;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Compressor(Strategy strategy = Strategy::Auto);


  // Replaces the codec serving codec->algorithm()
  void register_codec(std::unique_ptr<CompressionCodec> codec);


  // ---- COMPRESSION OPERATIONS ----
  // Encoding errors are retried once, then propagate as CompressionError
  std::pair<Bytes, CompressionMetadata> compress(const Bytes& input) const;
  Bytes decompress(const Bytes& input, const CompressionMetadata& metadata) const;


  // ---- STRATEGY ----
  // Algorithm that compress() would try first for this input
  Algorithm select_algorithm(const Bytes& input) const;
  // Shannon entropy of a leading sample, in bits per byte
  static double estimate_entropy(const Bytes& input, size_t sample_size = ENTROPY_SAMPLE_SIZE);

  static std::optional<Strategy> strategy_from_string(const std::string& name);
  static const char* strategy_to_string(Strategy strategy);

  Strategy strategy() const { return strategy_; }

private:
  Strategy strategy_;
  std::array<std::unique_ptr<CompressionCodec>, 3> codecs_;

  const CompressionCodec& codec_for(Algorithm algorithm) const;
};

} // namespace compression
} // namespace crystal

#endif // CRYSTAL_COMPRESSION_COMPRESSOR_HPP
