#ifndef CRYSTAL_CONFIG_HPP
#define CRYSTAL_CONFIG_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "config/config_error.hpp"
#include "utils/retry.hpp"

namespace crystal::config {

struct StorageConfig {
  // [storage]
  std::size_t fragment_size = 1024 * 1024;
  std::vector<std::string> node_paths;
  std::size_t worker_threads = 0;          // 0 = hardware concurrency
  std::string compression = "auto";        // auto | fast | best | none
  std::string placement = "modulo";        // modulo | hashed

  // [keys]
  std::string private_key_path = "keys/private.pem";
  std::string public_key_path = "keys/public.pem";
  // Supplied by the caller (CRYSTAL_KEY_PASSPHRASE), never read from the file
  std::string key_passphrase;

  // [retry]
  utils::RetryPolicy retry;

  // [logging]
  std::string log_level = "info";
  std::string log_file;

  // Throws ConfigurationError describing the first invalid setting
  void validate() const;
};

// Reads an INI file, unknown keys are ignored, absent keys keep their defaults.
// Throws ConfigurationError when the file is missing, malformed or fails validation.
StorageConfig load_config(const std::string& path);

// Same as load_config() reading from an in-memory INI document
StorageConfig parse_config(const std::string& ini_text);

// Splits a comma separated list and trims surrounding whitespace, dropping empty entries
std::vector<std::string> split_list(const std::string& value);

} // namespace crystal::config

#endif // CRYSTAL_CONFIG_HPP
