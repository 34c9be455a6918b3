#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>
#include "store/store.hpp"
#include "test_utils.hpp"
#include <chrono>
#include <thread>
#include <atomic>
#include <set>

using namespace crystal::store;

class StoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<Store> store;

  void SetUp() override {
    test_dir = make_test_directory("store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<Store>(test_dir.string());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void store_and_verify(const std::string& key, const std::string& data) {
    auto input = create_test_stream(data);
    ASSERT_NO_THROW(store->store(key, *input)) << "Failed to store key: " << key;
    ASSERT_TRUE(store->has(key)) << "Key should exist after storing: " << key;

    std::stringstream output;
    ASSERT_NO_THROW(store->get(key, output)) << "Failed to retrieve key: " << key;
    ASSERT_EQ(output.str(), data) << "Data mismatch for key: " << key;
  }

  void expect_retrieval_fails(const std::string& key) {
    EXPECT_FALSE(store->has(key)) << "Key should not exist: " << key;
    std::stringstream output;
    EXPECT_THROW(store->get(key, output), KeyMissingError)
      << "Getting non-existent key should throw: " << key;
  }

  static std::unique_ptr<std::stringstream> create_test_stream(const std::string& content) {
    auto ss = std::make_unique<std::stringstream>();
    if (!content.empty()) {
      ss->write(content.c_str(), content.length());
      ss->seekg(0);
    }
    return ss;
  }
};

TEST_F(StoreTest, BasicOperations) {
  const std::string key = "object/fragment/0";
  const std::string data = "Hello, Store!";

  // Test storing and retrieving
  store_and_verify(key, data);

  // Test empty data
  store_and_verify("object/manifest", "");

  // Test non-existent key
  expect_retrieval_fails("object/fragment/1");
}

TEST_F(StoreTest, MultipleFiles) {
  const std::vector<std::pair<std::string, std::string>> test_data = {
    {"a/fragment/0", "First content"},
    {"a/fragment/1", "Second content"},
    {"b/fragment/0", "Third content"}
  };

  for (const auto& [key, data] : test_data) {
    store_and_verify(key, data);
  }
}

TEST_F(StoreTest, ContentAddressedLayout) {
  store_and_verify("layout_key", "data");

  auto path = store->resolve_key_path("layout_key");
  auto relative = std::filesystem::relative(path, test_dir);

  // Three two-character directories then the rest of the 64 character hash
  std::vector<std::string> parts;
  for (const auto& part : relative) {
    parts.push_back(part.string());
  }
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0].size(), 2u);
  EXPECT_EQ(parts[1].size(), 2u);
  EXPECT_EQ(parts[2].size(), 2u);
  EXPECT_EQ(parts[3].size(), 58u);
  EXPECT_EQ(store->location(), test_dir.string());
}

TEST_F(StoreTest, ErrorHandling) {
  // Test invalid stream
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(store->store("bad_stream", bad_stream), StoreError);

  // Removing an absent key reports it missing
  EXPECT_THROW(store->remove("never_stored"), KeyMissingError);

  // A failed write leaves nothing behind
  EXPECT_FALSE(store->has("bad_stream"));
}

TEST_F(StoreTest, StoreErrorIsTransientIOError) {
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(store->store("bad_stream", bad_stream), crystal::IOError);
}

TEST_F(StoreTest, RemoveDeletesAndPrunes) {
  store_and_verify("remove_me", "data");
  auto path = store->resolve_key_path("remove_me");

  ASSERT_NO_THROW(store->remove("remove_me"));
  expect_retrieval_fails("remove_me");
  EXPECT_FALSE(std::filesystem::exists(path.parent_path()));
  EXPECT_TRUE(std::filesystem::exists(test_dir));
}

TEST_F(StoreTest, NoTemporaryFilesLeft) {
  store_and_verify("atomic_key", std::string(10000, 'z'));

  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
  }
}

TEST_F(StoreTest, EdgeCases) {
  const std::string data = "Test data";
  std::vector<std::string> edge_case_keys = {
    "",  // Empty key
    "../path/traversal",  // Path traversal
    std::string(1024, 'a'),  // Very long key
    "/absolute/path",  // Absolute path
    "\\windows\\path"  // Windows-style path
  };

  // Keys are hashed, so every key maps inside the base directory
  for (const auto& key : edge_case_keys) {
    store_and_verify(key, data);
    auto path = store->resolve_key_path(key);
    EXPECT_EQ(path.string().rfind(test_dir.string(), 0), 0u) << "Key escaped the store: " << key;
  }
}

TEST_F(StoreTest, AdvancedOperations) {
  const std::string key = "advanced_test";
  const size_t large_size = 1024 * 1024;  // 1MB
  const std::string large_data(large_size, 'X');

  // Test large file handling
  store_and_verify(key, large_data);
  ASSERT_EQ(std::filesystem::file_size(store->resolve_key_path(key)), large_size);

  // Test overwrite behavior
  const std::string updated_data = "Updated content";
  store_and_verify(key, updated_data);
  ASSERT_EQ(std::filesystem::file_size(store->resolve_key_path(key)), updated_data.length());
}

TEST_F(StoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          std::string key = "concurrent_" + std::to_string(i) + "_" + std::to_string(j);
          std::string data = "Data for " + key;
          store_and_verify(key, data);
          successful_ops++;
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
      thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
}
