#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace crystal::config;

namespace {

const char* VALID_CONFIG = R"(
[storage]
fragment_size = 1024
node_paths = data/node1, data/node2 ,data/node3
worker_threads = 3
compression = none
placement = hashed

[keys]
private_key = keys/private.pem
public_key = keys/public.pem

[retry]
max_attempts = 5
initial_backoff_ms = 10
max_backoff_ms = 100
multiplier = 3.0

[logging]
level = debug
file = logs/crystal.log
)";

std::string replace(std::string text, const std::string& from, const std::string& to) {
  auto position = text.find(from);
  if (position != std::string::npos) {
    text.replace(position, from.size(), to);
  }
  return text;
}

} // namespace

TEST(ConfigTest, ParsesEverySection) {
  StorageConfig config = parse_config(VALID_CONFIG);

  EXPECT_EQ(config.fragment_size, 1024u);
  EXPECT_EQ(config.node_paths, (std::vector<std::string>{"data/node1", "data/node2", "data/node3"}));
  EXPECT_EQ(config.worker_threads, 3u);
  EXPECT_EQ(config.compression, "none");
  EXPECT_EQ(config.placement, "hashed");
  EXPECT_EQ(config.private_key_path, "keys/private.pem");
  EXPECT_EQ(config.public_key_path, "keys/public.pem");
  EXPECT_EQ(config.retry.max_attempts, 5u);
  EXPECT_EQ(config.retry.initial_backoff.count(), 10);
  EXPECT_EQ(config.retry.max_backoff.count(), 100);
  EXPECT_DOUBLE_EQ(config.retry.multiplier, 3.0);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.log_file, "logs/crystal.log");
  EXPECT_TRUE(config.key_passphrase.empty());
}

TEST(ConfigTest, DefaultsForAbsentKeys) {
  StorageConfig config = parse_config("[storage]\nnode_paths = only\n");

  EXPECT_EQ(config.fragment_size, 1024u * 1024u);
  EXPECT_EQ(config.node_paths.size(), 1u);
  EXPECT_EQ(config.worker_threads, 0u);
  EXPECT_EQ(config.compression, "auto");
  EXPECT_EQ(config.placement, "modulo");
  EXPECT_EQ(config.retry.max_attempts, 4u);
  EXPECT_EQ(config.retry.initial_backoff.count(), 50);
  EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigTest, ZeroFragmentSizeRejected) {
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "fragment_size = 1024", "fragment_size = 0")),
               ConfigurationError);
}

TEST(ConfigTest, FragmentSizeBeyondCipherLimitRejected) {
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "fragment_size = 1024", "fragment_size = 3000000000")),
               ConfigurationError);
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "fragment_size = 1024", "fragment_size = 2147483647")),
               ConfigurationError);
  EXPECT_NO_THROW(parse_config(replace(VALID_CONFIG, "fragment_size = 1024", "fragment_size = 2147483619")));
}

TEST(ConfigTest, MissingNodePathsRejected) {
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "node_paths = data/node1, data/node2 ,data/node3",
                                    "node_paths = ")),
               ConfigurationError);
  EXPECT_THROW(parse_config("[storage]\nfragment_size = 10\n"), ConfigurationError);
}

TEST(ConfigTest, DuplicateNodePathsRejected) {
  EXPECT_THROW(parse_config("[storage]\nnode_paths = data/a, data/./a\n"), ConfigurationError);
}

TEST(ConfigTest, UnknownNamesRejected) {
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "compression = none", "compression = brotli")),
               ConfigurationError);
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "placement = hashed", "placement = random")),
               ConfigurationError);
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "level = debug", "level = chatty")),
               ConfigurationError);
}

TEST(ConfigTest, InvalidRetryRejected) {
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "max_attempts = 5", "max_attempts = 0")),
               ConfigurationError);
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "multiplier = 3.0", "multiplier = 0.1")),
               ConfigurationError);
}

TEST(ConfigTest, NonNumericValueRejected) {
  EXPECT_THROW(parse_config(replace(VALID_CONFIG, "fragment_size = 1024", "fragment_size = large")),
               ConfigurationError);
}

TEST(ConfigTest, MalformedFileRejected) {
  EXPECT_THROW(parse_config("[storage\nnode_paths = a\n"), ConfigurationError);
}

TEST(ConfigTest, LoadFromFile) {
  auto dir = make_test_directory("config_test");
  auto path = dir / "crystal.ini";
  {
    std::ofstream file(path);
    file << VALID_CONFIG;
  }

  StorageConfig config = load_config(path.string());
  EXPECT_EQ(config.node_paths.size(), 3u);

  EXPECT_THROW(load_config((dir / "absent.ini").string()), ConfigurationError);
  std::filesystem::remove_all(dir);
}

TEST(ConfigTest, SplitList) {
  EXPECT_EQ(split_list(" a, b ,,c "), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(split_list("").empty());
  EXPECT_TRUE(split_list(" , ").empty());
}
