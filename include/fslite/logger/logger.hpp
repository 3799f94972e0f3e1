#ifndef FSLITE_LOGGER_HPP
#define FSLITE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace fslite::logging {

using severity = boost::log::trivial::severity_level;

// Installs a rotating file sink and a console sink, replacing any existing sinks
void init_logging(const std::string& log_file = "fslite.log",
                  severity min_level = boost::log::trivial::info,
                  bool console = true);

// Changes the minimum severity that reaches the sinks
void set_log_level(severity level);

void enable_logging();
void disable_logging();

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a level.
// Throws std::invalid_argument for anything else.
severity parse_severity(const std::string& name);

} // namespace fslite::logging

#endif // FSLITE_LOGGER_HPP
