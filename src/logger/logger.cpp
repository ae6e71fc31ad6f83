#include "logger/logger.hpp"
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace fileclient::logger {

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  namespace trivial = boost::log::trivial;

  if (name == "trace") return trivial::trace;
  if (name == "debug") return trivial::debug;
  if (name == "info") return trivial::info;
  if (name == "warning") return trivial::warning;
  if (name == "error") return trivial::error;
  if (name == "fatal") return trivial::fatal;
  return trivial::warning;
}

void init_logging(const std::string& log_file, const std::string& level) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  logging::core::get()->remove_all_sinks();
  logging::add_common_attributes();

  const auto format = (
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << logging::trivial::severity << "]"
      << " " << expr::smessage
  );

  if (!log_file.empty()) {
    logging::add_file_log(
      keywords::file_name = log_file,
      keywords::open_mode = std::ios_base::app,
      keywords::format = format,
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );
  } else {
    logging::add_console_log(
      std::clog,
      keywords::format = format,
      keywords::auto_flush = true
    );
  }

  logging::core::get()->set_filter(logging::trivial::severity >= parse_severity(level));
  BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized at level " << level;
}

} // namespace fileclient::logger
