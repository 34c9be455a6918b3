#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "crypto/key_manager.hpp"

namespace crystal {
namespace cli {

// Process exit status, distinct per failure class
enum ExitCode : int {
  EXIT_OK = 0,
  EXIT_USAGE = 1,
  EXIT_CONFIGURATION = 2,
  EXIT_INTEGRITY = 3,
  EXIT_IO = 4,
  EXIT_KEY = 5
};

struct ProgramOptions {
  std::string config_path = "crystal.ini";
  // Overrides [logging] level when set
  std::string log_level;
  std::string command;
  std::vector<std::string> arguments;
  bool force{false};
  // Install log sinks from the configuration before running the command
  bool init_logging{true};
  bool valid{false};
};

void print_usage(std::ostream& out, const std::string& program_name);

// Parses "[-c config] [-l level] <command> [args] [--force]"
ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(std::ostream& out, std::ostream& err);


  // ---- STARTUP ----
  // Runs one command and returns its exit code, never throws
  int run(const ProgramOptions& options);

private:
  // ---- PARAMETERS ----
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  int process_command(const ProgramOptions& options, const config::StorageConfig& config);
  int handle_keygen_command(const config::StorageConfig& config, bool force);
  int handle_store_command(const config::StorageConfig& config, const std::vector<std::string>& arguments);
  int handle_verify_command(const config::StorageConfig& config, const std::vector<std::string>& arguments);
  int handle_recover_command(const config::StorageConfig& config, const std::vector<std::string>& arguments);
  int handle_remove_command(const config::StorageConfig& config, const std::vector<std::string>& arguments);
  void handle_help_command();

  crypto::KeyPair load_keys(const config::StorageConfig& config) const;
  int log_and_display_error(int code, const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace crystal
