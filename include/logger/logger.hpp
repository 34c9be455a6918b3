#ifndef CRYSTAL_LOGGER_HPP
#define CRYSTAL_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace crystal::logger {

using severity_level = boost::log::trivial::severity_level;

struct LogOptions {
  severity_level min_level = boost::log::trivial::info;
  // Empty disables the file sink
  std::string log_file;
  bool console = true;
};

// Replaces any installed sinks with a stderr console sink and an optional file sink
void init_logging(const LogOptions& options);

// Accepts trace, debug, info, warning, error, fatal (case insensitive)
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace crystal::logger

#endif // CRYSTAL_LOGGER_HPP
