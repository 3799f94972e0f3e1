#ifndef FSLITE_CONFIG_HPP
#define FSLITE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "fslite/engine/types.hpp"
#include "fslite/logger/logger.hpp"

namespace fslite::config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}
};

// Program options. Defaults reproduce a five-node mesh with 1 MiB fragments.
struct Config {
  std::string storage_root{"simulated_nodes"};
  std::vector<std::string> nodes{"node_1", "node_2", "node_3", "node_4", "node_5"};
  engine::SizingPolicy sizing{engine::SizingPolicy::fixed_size(1024 * 1024)};
  engine::AvailabilityPolicy availability{engine::AvailabilityPolicy::IGNORE};
  std::chrono::milliseconds io_timeout{5000};
  std::size_t io_workers{4};
  std::string restore_dir{"restored"};
  std::string log_file{"fslite.log"};
  logging::severity log_level{boost::log::trivial::info};
  bool show_help{false};
};

// Parses "-flag value" pairs on top of the defaults. Throws ConfigError.
Config parse_command_line(int argc, const char* const argv[]);

// Rejects empty node lists, zero sizes and non-positive timeouts. Throws ConfigError.
void validate(const Config& config);

// Splits "a,b,c" into its non-empty parts
std::vector<std::string> split_list(const std::string& value);

std::string usage(const std::string& program_name);

} // namespace fslite::config

#endif // FSLITE_CONFIG_HPP
