#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include "cli/cli.hpp"
#include "coordinator/storage_coordinator.hpp"
#include "store/store.hpp"
#include "test_utils.hpp"

using namespace crystal;
using namespace crystal::cli;

//==============================================
// COMMAND LINE PARSING
//==============================================

TEST(CommandLineTest, CommandAndArguments) {
  std::stringstream err;
  ProgramOptions options = parse_command_line({"store", "input.bin", "object-1"}, err);
  EXPECT_TRUE(options.valid);
  EXPECT_EQ(options.command, "store");
  EXPECT_EQ(options.arguments, (std::vector<std::string>{"input.bin", "object-1"}));
  EXPECT_EQ(options.config_path, "crystal.ini");
  EXPECT_FALSE(options.force);
  EXPECT_TRUE(err.str().empty());
}

TEST(CommandLineTest, GlobalOptions) {
  std::stringstream err;
  ProgramOptions options = parse_command_line({"-c", "other.ini", "--log-level", "debug", "verify", "obj"}, err);
  EXPECT_TRUE(options.valid);
  EXPECT_EQ(options.config_path, "other.ini");
  EXPECT_EQ(options.log_level, "debug");
  EXPECT_EQ(options.command, "verify");
  EXPECT_EQ(options.arguments, (std::vector<std::string>{"obj"}));
}

TEST(CommandLineTest, ForceFlag) {
  std::stringstream err;
  ProgramOptions options = parse_command_line({"keygen", "--force"}, err);
  EXPECT_TRUE(options.valid);
  EXPECT_TRUE(options.force);
  EXPECT_TRUE(options.arguments.empty());
}

TEST(CommandLineTest, Help) {
  std::stringstream err;
  EXPECT_EQ(parse_command_line({"--help"}, err).command, "help");
  EXPECT_EQ(parse_command_line({"-h"}, err).command, "help");
}

TEST(CommandLineTest, InvalidInput) {
  std::stringstream err;
  EXPECT_FALSE(parse_command_line({}, err).valid);
  EXPECT_FALSE(parse_command_line({"-c"}, err).valid);
  EXPECT_FALSE(parse_command_line({"-l", "loud", "verify", "obj"}, err).valid);
  EXPECT_FALSE(parse_command_line({"verify", "--unknown"}, err).valid);
  EXPECT_NE(err.str().find("Invalid log level"), std::string::npos);
}

//==============================================
// COMMAND EXECUTION
//==============================================

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path config_path;
  std::stringstream out;
  std::stringstream err;

  void SetUp() override {
    unsetenv("CRYSTAL_KEY_PASSPHRASE");
    test_dir = make_test_directory("cli_test");
    config_path = test_dir / "crystal.ini";

    std::ofstream config(config_path);
    config << "[storage]\n"
           << "fragment_size = 512\n"
           << "node_paths = " << (test_dir / "node1").string() << ", "
           << (test_dir / "node2").string() << "\n"
           << "compression = auto\n"
           << "[keys]\n"
           << "private_key = " << (test_dir / "keys" / "private.pem").string() << "\n"
           << "public_key = " << (test_dir / "keys" / "public.pem").string() << "\n"
           << "[retry]\n"
           << "max_attempts = 2\n"
           << "initial_backoff_ms = 1\n"
           << "[logging]\n"
           << "level = error\n";
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  int run(const std::vector<std::string>& args) {
    std::vector<std::string> full = {"-c", config_path.string()};
    full.insert(full.end(), args.begin(), args.end());
    ProgramOptions options = parse_command_line(full, err);
    options.init_logging = false;
    CLI cli(out, err);
    return cli.run(options);
  }

  std::filesystem::path write_input(const std::string& name, const std::vector<uint8_t>& data) {
    auto path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
  }

  static std::vector<uint8_t> read_output(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }
};

TEST_F(CLITest, FullLifecycle) {
  ASSERT_EQ(run({"keygen"}), EXIT_OK) << err.str();
  EXPECT_TRUE(std::filesystem::exists(test_dir / "keys" / "private.pem"));

  std::vector<uint8_t> data = repetitive_bytes(3000);
  auto input = write_input("notes.txt", data);

  ASSERT_EQ(run({"store", input.string()}), EXIT_OK) << err.str();
  EXPECT_NE(out.str().find("object:    notes.txt"), std::string::npos);
  EXPECT_NE(out.str().find("root:"), std::string::npos);

  EXPECT_EQ(run({"verify", "notes.txt"}), EXIT_OK) << err.str();

  auto output = test_dir / "recovered.txt";
  ASSERT_EQ(run({"recover", "notes.txt", output.string()}), EXIT_OK) << err.str();
  EXPECT_EQ(read_output(output), data);

  EXPECT_EQ(run({"remove", "notes.txt"}), EXIT_OK) << err.str();
  EXPECT_EQ(run({"verify", "notes.txt"}), EXIT_IO);
}

TEST_F(CLITest, ExplicitObjectId) {
  ASSERT_EQ(run({"keygen"}), EXIT_OK);
  auto input = write_input("data.bin", random_bytes(1500));
  ASSERT_EQ(run({"store", input.string(), "custom-id"}), EXIT_OK) << err.str();
  EXPECT_EQ(run({"verify", "custom-id"}), EXIT_OK);
  EXPECT_EQ(run({"verify", "data.bin"}), EXIT_IO);
}

TEST_F(CLITest, KeygenRefusesToOverwrite) {
  ASSERT_EQ(run({"keygen"}), EXIT_OK);
  EXPECT_EQ(run({"keygen"}), EXIT_USAGE);
  EXPECT_EQ(run({"keygen", "--force"}), EXIT_OK);
}

TEST_F(CLITest, TamperedObjectFailsIntegrity) {
  ASSERT_EQ(run({"keygen"}), EXIT_OK);
  auto input = write_input("payload.bin", random_bytes(1500));
  ASSERT_EQ(run({"store", input.string(), "payload"}), EXIT_OK);

  // Fragment 0 sits on the first node under modulo placement
  {
    store::Store node((test_dir / "node1").string());
    std::stringstream manifest_buffer;
    node.get(coordinator::StorageCoordinator::manifest_key("payload"), manifest_buffer);
    store::ObjectManifest manifest = store::RecordCodec::deserialize_manifest(manifest_buffer);
    const std::string key = coordinator::StorageCoordinator::fragment_key("payload", manifest.generation, 0);
    std::stringstream buffer;
    node.get(key, buffer);
    store::FragmentRecord record = store::RecordCodec::deserialize_fragment(buffer);
    record.ciphertext.back() ^= 0x01;
    std::stringstream tampered;
    store::RecordCodec::serialize(record, tampered);
    node.store(key, tampered);
  }

  EXPECT_EQ(run({"verify", "payload"}), EXIT_INTEGRITY);
  EXPECT_NE(out.str().find("failed"), std::string::npos);
  EXPECT_EQ(run({"recover", "payload", (test_dir / "out.bin").string()}), EXIT_INTEGRITY);
}

TEST_F(CLITest, MissingKeys) {
  auto input = write_input("orphan.bin", random_bytes(100));
  EXPECT_EQ(run({"store", input.string()}), EXIT_KEY);
}

TEST_F(CLITest, MissingInputFile) {
  ASSERT_EQ(run({"keygen"}), EXIT_OK);
  EXPECT_EQ(run({"store", (test_dir / "absent.bin").string()}), EXIT_IO);
}

TEST_F(CLITest, ConfigurationErrors) {
  std::filesystem::remove(config_path);
  EXPECT_EQ(run({"verify", "anything"}), EXIT_CONFIGURATION);

  std::ofstream(config_path) << "[storage]\nfragment_size = 0\nnode_paths = a\n";
  EXPECT_EQ(run({"verify", "anything"}), EXIT_CONFIGURATION);
}

TEST_F(CLITest, UsageErrors) {
  EXPECT_EQ(run({"verify"}), EXIT_USAGE);
  EXPECT_EQ(run({"frobnicate", "x"}), EXIT_USAGE);
  EXPECT_EQ(run({"--bogus"}), EXIT_USAGE);
  EXPECT_EQ(run({"help"}), EXIT_OK);
  EXPECT_NE(out.str().find("Usage:"), std::string::npos);
}
