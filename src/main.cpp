#include "cli/cli.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);

  crystal::cli::ProgramOptions options = crystal::cli::parse_command_line(args, std::cerr);
  if (!options.valid) {
    crystal::cli::print_usage(std::cerr, argv[0]);
    return crystal::cli::EXIT_USAGE;
  }

  crystal::cli::CLI cli(std::cout, std::cerr);
  return cli.run(options);
}
