#ifndef FILECLIENT_LOGGER_HPP
#define FILECLIENT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace fileclient::logger {

// Maps "trace".."fatal" to a severity, unknown names give warning
boost::log::trivial::severity_level parse_severity(const std::string& name);

// Configures the Boost.Log core once per process. Writes to log_file when it
// is set, to stderr otherwise.
void init_logging(const std::string& log_file, const std::string& level);

} // namespace fileclient::logger

#endif // FILECLIENT_LOGGER_HPP
