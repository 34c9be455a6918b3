#include "compression/compressor.hpp"
#include <zlib.h>
#include <boost/log/trivial.hpp>
#include "utils/retry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace crystal {
namespace compression {

namespace {

// Upper bound on deflate expansion, used to reject corrupt size metadata
constexpr uint64_t MAX_DEFLATE_RATIO = 1032;

} // namespace

const char* algorithm_to_string(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::Raw:         return "raw";
    case Algorithm::DeflateFast: return "deflate-fast";
    case Algorithm::DeflateBest: return "deflate-best";
    default:                     return "unknown";
  }
}

std::optional<Algorithm> algorithm_from_tag(uint8_t tag) {
  switch (tag) {
    case static_cast<uint8_t>(Algorithm::Raw):         return Algorithm::Raw;
    case static_cast<uint8_t>(Algorithm::DeflateFast): return Algorithm::DeflateFast;
    case static_cast<uint8_t>(Algorithm::DeflateBest): return Algorithm::DeflateBest;
    default:                                           return std::nullopt;
  }
}

//==============================================
// RAW CODEC
//==============================================

Bytes RawCodec::encode(const Bytes& input) const {
  return input;
}

Bytes RawCodec::decode(const Bytes& input, uint64_t original_size) const {
  if (input.size() != original_size) {
    throw CompressionError("Raw stream size " + std::to_string(input.size())
                           + " does not match recorded size " + std::to_string(original_size));
  }
  return input;
}

//==============================================
// DEFLATE CODEC
//==============================================

DeflateCodec::DeflateCodec(Algorithm algorithm, int32_t level)
  : algorithm_(algorithm)
  , level_(level) {}

Bytes DeflateCodec::encode(const Bytes& input) const {
  if (input.size() > std::numeric_limits<uLong>::max()) {
    throw CompressionError("Input too large for zlib");
  }

  uLongf bound = compressBound(static_cast<uLong>(input.size()));
  Bytes output(bound);
  int result = compress2(output.data(), &bound, input.data(), static_cast<uLong>(input.size()), level_);
  if (result != Z_OK) {
    BOOST_LOG_TRIVIAL(error) << "Compressor: zlib compress2 failed with code " << result;
    throw CompressionError("zlib error: " + std::to_string(result));
  }
  output.resize(bound);
  return output;
}

Bytes DeflateCodec::decode(const Bytes& input, uint64_t original_size) const {
  if (original_size == 0) {
    throw CompressionError("Deflate stream recorded with zero original size");
  }
  if (original_size > static_cast<uint64_t>(input.size()) * MAX_DEFLATE_RATIO + 1024) {
    throw CompressionError("Recorded original size " + std::to_string(original_size)
                           + " is implausible for " + std::to_string(input.size()) + " compressed bytes");
  }

  Bytes output(original_size);
  uLongf size = static_cast<uLongf>(original_size);
  int result = uncompress(output.data(), &size, input.data(), static_cast<uLong>(input.size()));
  if (result != Z_OK) {
    BOOST_LOG_TRIVIAL(error) << "Compressor: zlib uncompress failed with code " << result;
    throw CompressionError("zlib error: " + std::to_string(result));
  }
  if (size != original_size) {
    throw CompressionError("Decompressed size " + std::to_string(size)
                           + " does not match recorded size " + std::to_string(original_size));
  }
  return output;
}

//==============================================
// CONSTRUCTOR
//==============================================

Compressor::Compressor(Strategy strategy)
  : strategy_(strategy) {
  register_codec(std::make_unique<RawCodec>());
  register_codec(std::make_unique<DeflateCodec>(Algorithm::DeflateFast, Z_BEST_SPEED));
  register_codec(std::make_unique<DeflateCodec>(Algorithm::DeflateBest, Z_BEST_COMPRESSION));
  BOOST_LOG_TRIVIAL(debug) << "Compressor: Using strategy " << strategy_to_string(strategy_);
}

void Compressor::register_codec(std::unique_ptr<CompressionCodec> codec) {
  if (!codec) {
    throw CompressionError("Cannot register an empty codec");
  }
  size_t slot = static_cast<size_t>(codec->algorithm());
  if (slot >= codecs_.size()) {
    throw CompressionError("Unsupported algorithm tag " + std::to_string(slot));
  }
  codecs_[slot] = std::move(codec);
}

//==============================================
// COMPRESSION OPERATIONS
//==============================================

std::pair<Bytes, CompressionMetadata> Compressor::compress(const Bytes& input) const {
  Algorithm algorithm = select_algorithm(input);
  const CompressionCodec& codec = codec_for(algorithm);

  CompressionMetadata metadata;
  metadata.original_size = input.size();

  // A failed encoding is retried once before the store gives up
  utils::RetryPolicy once;
  once.max_attempts = ENCODE_ATTEMPTS;
  once.initial_backoff = std::chrono::milliseconds(0);
  Bytes encoded = utils::with_retry<CompressionError>(
      once, std::string("compression with ") + algorithm_to_string(algorithm),
      [&]() { return codec.encode(input); });
  if (algorithm != Algorithm::Raw && encoded.size() >= input.size()) {
    BOOST_LOG_TRIVIAL(debug) << "Compressor: " << algorithm_to_string(algorithm)
                             << " would not shrink " << input.size() << " bytes, storing raw";
    const CompressionCodec& raw = codec_for(Algorithm::Raw);
    metadata.algorithm = raw.algorithm();
    metadata.level = raw.level();
    return {raw.encode(input), metadata};
  }

  metadata.algorithm = codec.algorithm();
  metadata.level = codec.level();
  BOOST_LOG_TRIVIAL(info) << "Compressor: " << algorithm_to_string(algorithm) << " reduced "
                          << input.size() << " bytes to " << encoded.size();
  return {std::move(encoded), metadata};
}

Bytes Compressor::decompress(const Bytes& input, const CompressionMetadata& metadata) const {
  BOOST_LOG_TRIVIAL(debug) << "Compressor: Decompressing " << input.size() << " bytes with "
                           << algorithm_to_string(metadata.algorithm);
  if (metadata.original_size == 0) {
    if (!input.empty()) {
      throw CompressionError("Non-empty stream recorded with zero original size");
    }
    return {};
  }
  return codec_for(metadata.algorithm).decode(input, metadata.original_size);
}

//==============================================
// STRATEGY
//==============================================

Algorithm Compressor::select_algorithm(const Bytes& input) const {
  switch (strategy_) {
    case Strategy::None:
      return Algorithm::Raw;
    case Strategy::Fast:
      return Algorithm::DeflateFast;
    case Strategy::Best:
      return Algorithm::DeflateBest;
    case Strategy::Auto:
    default:
      break;
  }

  if (input.empty()) {
    return Algorithm::Raw;
  }

  double entropy = estimate_entropy(input);
  BOOST_LOG_TRIVIAL(debug) << "Compressor: Estimated entropy " << entropy << " bits/byte";
  if (entropy >= RAW_ENTROPY_THRESHOLD) {
    return Algorithm::Raw;
  }
  if (input.size() > FAST_SIZE_THRESHOLD) {
    return Algorithm::DeflateFast;
  }
  return Algorithm::DeflateBest;
}

double Compressor::estimate_entropy(const Bytes& input, size_t sample_size) {
  size_t length = std::min(input.size(), sample_size);
  if (length == 0) {
    return 0.0;
  }

  std::array<size_t, 256> counts{};
  for (size_t i = 0; i < length; ++i) {
    counts[input[i]]++;
  }

  double entropy = 0.0;
  for (size_t count : counts) {
    if (count == 0) {
      continue;
    }
    double p = static_cast<double>(count) / static_cast<double>(length);
    entropy -= p * std::log2(p);
  }
  return entropy;
}

std::optional<Compressor::Strategy> Compressor::strategy_from_string(const std::string& name) {
  if (name == "auto") return Strategy::Auto;
  if (name == "fast") return Strategy::Fast;
  if (name == "best") return Strategy::Best;
  if (name == "none" || name == "raw") return Strategy::None;
  return std::nullopt;
}

const char* Compressor::strategy_to_string(Strategy strategy) {
  switch (strategy) {
    case Strategy::Auto: return "auto";
    case Strategy::Fast: return "fast";
    case Strategy::Best: return "best";
    case Strategy::None: return "none";
    default:             return "unknown";
  }
}

const CompressionCodec& Compressor::codec_for(Algorithm algorithm) const {
  size_t slot = static_cast<size_t>(algorithm);
  if (slot >= codecs_.size() || !codecs_[slot]) {
    throw CompressionError("Unsupported algorithm tag " + std::to_string(slot));
  }
  return *codecs_[slot];
}

} // namespace compression
} // namespace crystal
