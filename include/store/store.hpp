#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <memory>
#include <vector>
#include <stdexcept>
#include "utils/io_error.hpp"

namespace crystal {
namespace store {

// Transient failure while reading or writing a node location
class StoreError : public IOError {
public:
  explicit StoreError(const std::string& message) : IOError(message) {}
};

// The requested key does not exist at the node location
class KeyMissingError : public std::runtime_error {
public:
  explicit KeyMissingError(const std::string& message) : std::runtime_error(message) {}
};

// A node location holding fragment records and manifests
class NodeStore {
public:
  virtual ~NodeStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Stores data stream under given key, replacing any previous value
  virtual void store(const std::string& key, std::istream& data) = 0;
  // Appends the value stored under key to output
  virtual void get(const std::string& key, std::stringstream& output) = 0;
  // Removes data associated with given key
  virtual void remove(const std::string& key) = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool has(const std::string& key) const = 0;
  // Opaque identifier of this location, used in logs and reports
  virtual std::string location() const = 0;

protected:
  NodeStore() = default;
};

// Content addressed directory store:
// {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
class Store : public NodeStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  void store(const std::string& key, std::istream& data) override;
  void get(const std::string& key, std::stringstream& output) override;
  void remove(const std::string& key) override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const override;
  std::string location() const override { return base_path_.string(); }
  // Resolves a key to its corresponding filesystem path by generating hash and converting to path
  std::filesystem::path resolve_key_path(const std::string& key) const;

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key
  std::string hash_key(const std::string& key) const;
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- QUERY OPERATIONS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Verifies if a file exists at the given path, throws KeyMissingError if not found
  void verify_file_exists(const std::filesystem::path& file_path, const std::string& key) const;
  // Removes empty hash directories between file_path and base_path_
  void prune_empty_directories(const std::filesystem::path& file_path) const;
};

} // namespace store
} // namespace crystal
