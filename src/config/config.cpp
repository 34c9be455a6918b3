#include "config/config.hpp"
#include "compression/compressor.hpp"
#include "crypto/fragment_cipher.hpp"
#include "logger/logger.hpp"
#include "store/placement.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace crystal::config {

namespace pt = boost::property_tree;

namespace {

StorageConfig from_tree(const pt::ptree& tree) {
  StorageConfig config;

  try {
    config.fragment_size = tree.get<std::size_t>("storage.fragment_size", config.fragment_size);
    config.node_paths = split_list(tree.get<std::string>("storage.node_paths", ""));
    config.worker_threads = tree.get<std::size_t>("storage.worker_threads", config.worker_threads);
    config.compression = boost::algorithm::trim_copy(
        tree.get<std::string>("storage.compression", config.compression));
    config.placement = boost::algorithm::trim_copy(
        tree.get<std::string>("storage.placement", config.placement));

    config.private_key_path = boost::algorithm::trim_copy(
        tree.get<std::string>("keys.private_key", config.private_key_path));
    config.public_key_path = boost::algorithm::trim_copy(
        tree.get<std::string>("keys.public_key", config.public_key_path));

    config.retry.max_attempts = tree.get<uint32_t>("retry.max_attempts", config.retry.max_attempts);
    config.retry.initial_backoff = std::chrono::milliseconds(
        tree.get<int64_t>("retry.initial_backoff_ms", config.retry.initial_backoff.count()));
    config.retry.max_backoff = std::chrono::milliseconds(
        tree.get<int64_t>("retry.max_backoff_ms", config.retry.max_backoff.count()));
    config.retry.multiplier = tree.get<double>("retry.multiplier", config.retry.multiplier);

    config.log_level = boost::algorithm::trim_copy(
        tree.get<std::string>("logging.level", config.log_level));
    config.log_file = boost::algorithm::trim_copy(
        tree.get<std::string>("logging.file", config.log_file));
  }
  catch (const pt::ptree_bad_data& e) {
    throw ConfigurationError(std::string("invalid value: ") + e.what());
  }

  config.validate();
  return config;
}

} // namespace

//==============================================
// VALIDATION
//==============================================

void StorageConfig::validate() const {
  if (fragment_size == 0) {
    throw ConfigurationError("fragment_size must be greater than zero");
  }
  if (fragment_size > crypto::FragmentCipher::MAX_FRAGMENT_SIZE) {
    throw ConfigurationError("fragment_size must not exceed "
                             + std::to_string(crypto::FragmentCipher::MAX_FRAGMENT_SIZE) + " bytes");
  }
  if (node_paths.empty()) {
    throw ConfigurationError("node_paths must name at least one node location");
  }

  std::set<std::string> unique_paths;
  for (const auto& path : node_paths) {
    auto normalized = std::filesystem::path(path).lexically_normal().string();
    if (!unique_paths.insert(normalized).second) {
      throw ConfigurationError("duplicate node path: " + path);
    }
  }

  if (private_key_path.empty() || public_key_path.empty()) {
    throw ConfigurationError("both private_key and public_key paths are required");
  }
  if (!compression::Compressor::strategy_from_string(compression)) {
    throw ConfigurationError("unknown compression strategy: " + compression);
  }
  if (!store::make_placement(placement)) {
    throw ConfigurationError("unknown placement strategy: " + placement);
  }
  if (!logger::parse_severity(log_level)) {
    throw ConfigurationError("unknown log level: " + log_level);
  }

  retry.validate();
}


//==============================================
// LOADING
//==============================================

StorageConfig load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(debug) << "Config: Loading configuration from " << path;

  std::ifstream file(path);
  if (!file) {
    throw ConfigurationError("cannot open configuration file: " + path);
  }

  pt::ptree tree;
  try {
    pt::read_ini(file, tree);
  }
  catch (const pt::ini_parser_error& e) {
    throw ConfigurationError("malformed configuration file " + path + ": " + e.message());
  }

  StorageConfig config = from_tree(tree);
  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << config.node_paths.size()
                          << " node location(s), fragment size " << config.fragment_size;
  return config;
}

StorageConfig parse_config(const std::string& ini_text) {
  std::istringstream input(ini_text);
  pt::ptree tree;
  try {
    pt::read_ini(input, tree);
  }
  catch (const pt::ini_parser_error& e) {
    throw ConfigurationError("malformed configuration: " + e.message());
  }
  return from_tree(tree);
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::istringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    boost::algorithm::trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

} // namespace crystal::config
