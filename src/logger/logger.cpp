#include "fslite/logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fslite::logging {

namespace {

namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

// Shared by both sinks so file and console lines look the same
auto make_formatter() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
    << " [" << boost::log::trivial::severity << "] "
    << expr::smessage;
}

} // namespace

//==============================================
// SINK SETUP
//==============================================

void init_logging(const std::string& log_file, severity min_level, bool console) {
  try {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    // File sink, rotated every 10 MB
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    auto file_backend = boost::make_shared<sinks::text_file_backend>();
    file_backend->set_file_name_pattern(log_path.string());
    file_backend->set_rotation_size(10 * 1024 * 1024);
    file_backend->set_open_mode(std::ios::out | std::ios::app);
    file_backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto file = boost::make_shared<file_sink>(file_backend);
    file->set_formatter(make_formatter());
    core->add_sink(file);

    if (console) {
      auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
      console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      console_backend->auto_flush(true);

      using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
      auto stream = boost::make_shared<console_sink>(console_backend);
      stream->set_formatter(make_formatter());
      // Keep the shell readable: only warnings and worse go to the terminal
      stream->set_filter(boost::log::trivial::severity >= boost::log::trivial::warning);
      core->add_sink(stream);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

//==============================================
// LEVEL CONTROL
//==============================================

void set_log_level(severity level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

severity parse_severity(const std::string& name) {
  if (name == "trace") return boost::log::trivial::trace;
  if (name == "debug") return boost::log::trivial::debug;
  if (name == "info") return boost::log::trivial::info;
  if (name == "warning" || name == "warn") return boost::log::trivial::warning;
  if (name == "error") return boost::log::trivial::error;
  if (name == "fatal") return boost::log::trivial::fatal;
  throw std::invalid_argument("Logger: Unknown log level: " + name);
}

} // namespace fslite::logging
