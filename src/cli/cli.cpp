#include "cli/cli.hpp"
#include "coordinator/storage_coordinator.hpp"
#include "fragment/fragmenter.hpp"
#include "logger/logger.hpp"
#include "utils/io_error.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <boost/log/trivial.hpp>

namespace crystal {
namespace cli {

namespace {

constexpr const char* PASSPHRASE_VARIABLE = "CRYSTAL_KEY_PASSPHRASE";

crypto::Bytes read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw IOError("Cannot open input file: " + path);
  }
  crypto::Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw IOError("Failed to read input file: " + path);
  }
  return data;
}

void write_file(const std::string& path, const crypto::Bytes& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw IOError("Cannot open output file: " + path);
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    throw IOError("Failed to write output file: " + path);
  }
}

void print_report(std::ostream& out, const integrity::VerificationReport& report) {
  out << report.summary() << std::endl;
  for (const auto& [index, reason] : report.failure_reasons) {
    out << "  fragment " << index << ": " << reason << std::endl;
  }
}

} // namespace

//==============================================
// COMMAND LINE
//==============================================

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [-c <config>] [-l <level>] <command> [args]\n"
      << "Options:\n"
      << "  -c, --config     Configuration file (default crystal.ini)\n"
      << "  -l, --log-level  trace, debug, info, warning, error or fatal\n"
      << "Commands:\n"
      << "  keygen [--force]             Generate the signing key pair\n"
      << "  store <file> [object_id]     Store a file, object id defaults to the file name\n"
      << "  verify <object_id>           Verify every fragment against the commitment\n"
      << "  recover <object_id> <file>   Recover an object into <file>\n"
      << "  remove <object_id>           Delete an object from every node\n"
      << "  help                         Display this help message\n"
      << "The private key passphrase is read from " << PASSPHRASE_VARIABLE << ".\n";
}

ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err) {
  ProgramOptions options;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (options.command.empty() && (arg == "-c" || arg == "--config" || arg == "-l" || arg == "--log-level")) {
      if (i + 1 >= args.size()) {
        err << "Error: Missing value for " << arg << '\n';
        return options;
      }
      const std::string& value = args[++i];
      if (arg == "-c" || arg == "--config") {
        options.config_path = value;
      } else if (!logger::parse_severity(value)) {
        err << "Error: Invalid log level: " << value << '\n';
        return options;
      } else {
        options.log_level = value;
      }
    } else if (options.command.empty() && (arg == "-h" || arg == "--help")) {
      options.command = "help";
    } else if (arg == "--force") {
      options.force = true;
    } else if (!arg.empty() && arg[0] == '-') {
      err << "Error: Unknown argument: " << arg << '\n';
      return options;
    } else if (options.command.empty()) {
      options.command = arg;
    } else {
      options.arguments.push_back(arg);
    }
  }

  if (options.command.empty()) {
    err << "Error: No command given\n";
    return options;
  }

  options.valid = true;
  return options;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(std::ostream& out, std::ostream& err)
  : out_(out)
  , err_(err) {
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const ProgramOptions& options) {
  if (!options.valid) {
    return EXIT_USAGE;
  }
  if (options.command == "help") {
    handle_help_command();
    return EXIT_OK;
  }

  config::StorageConfig config;
  try {
    config = config::load_config(options.config_path);
    if (!options.log_level.empty()) {
      config.log_level = options.log_level;
    }
    if (const char* passphrase = std::getenv(PASSPHRASE_VARIABLE)) {
      config.key_passphrase = passphrase;
    }
    config.validate();

    if (options.init_logging) {
      logger::LogOptions log_options;
      log_options.min_level = *logger::parse_severity(config.log_level);
      log_options.log_file = config.log_file;
      logger::init_logging(log_options);
    }
  }
  catch (const config::ConfigurationError& e) {
    return log_and_display_error(EXIT_CONFIGURATION, "Invalid configuration", e.what());
  }
  catch (const std::exception& e) {
    return log_and_display_error(EXIT_CONFIGURATION, "Failed to initialize", e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "CLI: Running command '" << options.command << "'";

  try {
    return process_command(options, config);
  }
  catch (const std::invalid_argument& e) {
    return log_and_display_error(EXIT_USAGE, "Invalid argument", e.what());
  }
  catch (const config::ConfigurationError& e) {
    return log_and_display_error(EXIT_CONFIGURATION, "Invalid configuration", e.what());
  }
  catch (const coordinator::RecoveryError& e) {
    print_report(out_, e.report());
    return log_and_display_error(EXIT_INTEGRITY, "Recovery failed", e.what());
  }
  catch (const coordinator::ManifestIntegrityError& e) {
    return log_and_display_error(EXIT_INTEGRITY, "Manifest rejected", e.what());
  }
  catch (const crypto::DecryptionError& e) {
    return log_and_display_error(EXIT_INTEGRITY, "Decryption failed", e.what());
  }
  catch (const store::RecordFormatError& e) {
    return log_and_display_error(EXIT_INTEGRITY, "Malformed record", e.what());
  }
  catch (const fragment::FragmentOrderError& e) {
    return log_and_display_error(EXIT_INTEGRITY, "Fragment layout corrupted", e.what());
  }
  catch (const coordinator::ManifestNotFoundError& e) {
    return log_and_display_error(EXIT_IO, "Object not found", e.what());
  }
  catch (const coordinator::StorageError& e) {
    return log_and_display_error(EXIT_IO, "Storage failed", e.what());
  }
  catch (const IOError& e) {
    return log_and_display_error(EXIT_IO, "I/O failure", e.what());
  }
  catch (const crypto::CryptoError& e) {
    return log_and_display_error(EXIT_KEY, "Key error", e.what());
  }
  catch (const compression::CompressionError& e) {
    return log_and_display_error(EXIT_IO, "Compression failed", e.what());
  }
  catch (const std::exception& e) {
    return log_and_display_error(EXIT_IO, "Unexpected failure", e.what());
  }
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const ProgramOptions& options, const config::StorageConfig& config) {
  const std::string& command = options.command;

  if (command == "keygen" && options.arguments.empty()) {
    return handle_keygen_command(config, options.force);
  }
  else if (command == "store" && (options.arguments.size() == 1 || options.arguments.size() == 2)) {
    return handle_store_command(config, options.arguments);
  }
  else if (command == "verify" && options.arguments.size() == 1) {
    return handle_verify_command(config, options.arguments);
  }
  else if (command == "recover" && options.arguments.size() == 2) {
    return handle_recover_command(config, options.arguments);
  }
  else if (command == "remove" && options.arguments.size() == 1) {
    return handle_remove_command(config, options.arguments);
  }

  err_ << "Unknown command or invalid arguments: " << command << std::endl;
  handle_help_command();
  return EXIT_USAGE;
}

int CLI::handle_keygen_command(const config::StorageConfig& config, bool force) {
  if (!force && (std::filesystem::exists(config.private_key_path)
                 || std::filesystem::exists(config.public_key_path))) {
    err_ << "Key files already exist, use --force to replace them" << std::endl;
    return EXIT_USAGE;
  }

  crypto::KeyManager manager;
  crypto::KeyPair pair = manager.generate_keypair();
  manager.serialize_keys(pair, config.private_key_path, config.public_key_path, config.key_passphrase);

  out_ << "Generated key pair " << manager.fingerprint(pair) << std::endl;
  out_ << "  private: " << config.private_key_path << std::endl;
  out_ << "  public:  " << config.public_key_path << std::endl;
  return EXIT_OK;
}

int CLI::handle_store_command(const config::StorageConfig& config, const std::vector<std::string>& arguments) {
  const std::string& path = arguments[0];
  const std::string object_id = arguments.size() > 1
      ? arguments[1]
      : std::filesystem::path(path).filename().string();

  crypto::Bytes data = read_file(path);
  crypto::KeyPair keys = load_keys(config);
  coordinator::StorageCoordinator coordinator(config, keys);

  store::ObjectManifest manifest = coordinator.store(data, object_id);
  out_ << "object:    " << manifest.object_id << std::endl;
  out_ << "fragments: " << manifest.fragment_count << std::endl;
  out_ << "root:      " << crypto::to_hex(manifest.commitment_root) << std::endl;
  return EXIT_OK;
}

int CLI::handle_verify_command(const config::StorageConfig& config, const std::vector<std::string>& arguments) {
  crypto::KeyPair keys = load_keys(config);
  coordinator::StorageCoordinator coordinator(config, keys);

  integrity::VerificationReport report = coordinator.verify(arguments[0]);
  print_report(out_, report);
  return report.complete() ? EXIT_OK : EXIT_INTEGRITY;
}

int CLI::handle_recover_command(const config::StorageConfig& config, const std::vector<std::string>& arguments) {
  crypto::KeyPair keys = load_keys(config);
  coordinator::StorageCoordinator coordinator(config, keys);

  crypto::Bytes data = coordinator.recover(arguments[0]);
  write_file(arguments[1], data);
  out_ << "Recovered " << data.size() << " bytes to " << arguments[1] << std::endl;
  return EXIT_OK;
}

int CLI::handle_remove_command(const config::StorageConfig& config, const std::vector<std::string>& arguments) {
  crypto::KeyPair keys = load_keys(config);
  coordinator::StorageCoordinator coordinator(config, keys);

  coordinator.remove(arguments[0]);
  out_ << "Removed " << arguments[0] << std::endl;
  return EXIT_OK;
}

void CLI::handle_help_command() {
  print_usage(out_, "crystal");
}

crypto::KeyPair CLI::load_keys(const config::StorageConfig& config) const {
  crypto::KeyManager manager;
  return manager.load_keys(config.private_key_path, config.public_key_path, config.key_passphrase);
}

int CLI::log_and_display_error(int code, const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << message << ": " << error << std::endl;
  return code;
}

} // namespace cli
} // namespace crystal
