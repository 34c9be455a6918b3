#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace crystal::logger {

void init_logging(const LogOptions& options) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "]"
            << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
            << " " << expr::smessage
    );

    if (options.console) {
      logging::add_console_log(std::clog, keywords::format = format);
    }

    if (!options.log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      logging::add_file_log(
          keywords::file_name = log_path.string(),
          keywords::format = format,
          keywords::open_mode = std::ios::out | std::ios::app,
          keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
          keywords::auto_flush = true
      );
    }

    logging::core::get()->set_filter(logging::trivial::severity >= options.min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

std::optional<severity_level> parse_severity(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")   return boost::log::trivial::trace;
  if (lowered == "debug")   return boost::log::trivial::debug;
  if (lowered == "info")    return boost::log::trivial::info;
  if (lowered == "warning" || lowered == "warn") return boost::log::trivial::warning;
  if (lowered == "error")   return boost::log::trivial::error;
  if (lowered == "fatal")   return boost::log::trivial::fatal;
  return std::nullopt;
}

} // namespace crystal::logger
