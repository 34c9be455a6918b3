#include "store/store.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>

namespace crystal {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
Store::Store(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void Store::store(const std::string& key, std::istream& data) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing data with key: " << key;

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid input stream provided for key: " << key;
    throw StoreError("Store: Invalid input stream");
  }

  // Generate path from key and ensure directory structure exists
  std::filesystem::path file_path = resolve_key_path(key);
  check_directory_exists(file_path.parent_path());
  BOOST_LOG_TRIVIAL(trace) << "Store: Calculated file path: " << file_path.string();

  // Write beside the target and rename so readers never see a partial record
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";

  std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw StoreError("Store: Failed to create file: " + temp_path.string());
  }

  size_t bytes_written = 0;
  char buffer[4096];

  // Read input stream in chunks and write to file
  while (data.read(buffer, sizeof(buffer))) {
    file.write(buffer, data.gcount());
    bytes_written += data.gcount();
  }

  // Handle final partial chunk if present
  if (data.gcount() > 0) {
    file.write(buffer, data.gcount());
    bytes_written += data.gcount();
  }

  file.close();
  if (!file) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    throw StoreError("Store: Failed to write file: " + temp_path.string());
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to commit file " << file_path.string() << ": " << ec.message();
    std::filesystem::remove(temp_path, ec);
    throw StoreError("Store: Failed to commit file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully stored " << bytes_written << " bytes with key: " << key;
}

void Store::get(const std::string& key, std::stringstream& output) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving data for key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(file_path, key);

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  char buffer[4096];
  size_t total_bytes = 0;

  // Read file in chunks to handle large files efficiently
  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  if (file.bad()) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }
  if (!output.good()) {
    throw StoreError("Store: Failed to write to output stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully streamed " << total_bytes << " bytes for key: " << key;
}

void Store::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Removing file with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(file_path, key);

  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec) || ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file with key: " << key;
    throw StoreError("Store: Failed to remove file: " + file_path.string());
  }

  prune_empty_directories(file_path);
  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully removed file with key: " << key;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;
  bool exists = std::filesystem::exists(file_path, ec);

  BOOST_LOG_TRIVIAL(trace) << "Store: Key " << key << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists && !ec;
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string Store::hash_key(const std::string& key) const {
  return crypto::to_hex(crypto::sha256(key));
}

std::filesystem::path Store::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    std::filesystem::create_directories(path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to create directory " << path.string() << ": " << ec.message();
      throw StoreError("Store: Failed to create directory: " + path.string());
    }
  }
}

std::filesystem::path Store::resolve_key_path(const std::string& key) const {
  std::string hash = hash_key(key);
  return get_path_for_hash(hash);
}

void Store::verify_file_exists(const std::filesystem::path& file_path, const std::string& key) const {
  std::error_code ec;
  if (!std::filesystem::exists(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: File not found for key " << key << ": " << file_path.string();
    throw KeyMissingError("Store: Key not found at " + base_path_.string() + ": " + key);
  }
}

void Store::prune_empty_directories(const std::filesystem::path& file_path) const {
  std::error_code ec;
  auto current = file_path.parent_path();
  while (current != base_path_ && current.string().size() > base_path_.string().size()) {
    if (!std::filesystem::is_empty(current, ec) || ec) {
      break;
    }
    std::filesystem::remove(current, ec);
    current = current.parent_path();
  }
}

} // namespace store
} // namespace crystal
