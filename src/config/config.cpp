#include "fslite/config/config.hpp"
#include <set>
#include <sstream>
#include <unordered_map>

namespace fslite::config {

namespace {

enum class Option {
  ROOT,
  NODES,
  FRAGMENT_SIZE,
  FRAGMENT_COUNT,
  AVAILABILITY,
  TIMEOUT,
  WORKERS,
  RESTORE_DIR,
  LOG_FILE,
  LOG_LEVEL
};

const std::unordered_map<std::string, Option> FLAG_MAP = {
  {"-r", Option::ROOT},           {"--root", Option::ROOT},
  {"-n", Option::NODES},          {"--nodes", Option::NODES},
  {"-s", Option::FRAGMENT_SIZE},  {"--fragment-size", Option::FRAGMENT_SIZE},
  {"-c", Option::FRAGMENT_COUNT}, {"--fragment-count", Option::FRAGMENT_COUNT},
  {"-a", Option::AVAILABILITY},   {"--availability", Option::AVAILABILITY},
  {"-t", Option::TIMEOUT},        {"--timeout-ms", Option::TIMEOUT},
  {"-w", Option::WORKERS},        {"--workers", Option::WORKERS},
  {"-o", Option::RESTORE_DIR},    {"--restore-dir", Option::RESTORE_DIR},
  {"-l", Option::LOG_FILE},       {"--log-file", Option::LOG_FILE},
  {"-v", Option::LOG_LEVEL},      {"--log-level", Option::LOG_LEVEL}
};

// Whole-string unsigned parse; std::stoull alone accepts "12abc" and "-1"
std::size_t parse_positive(const std::string& flag, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError("Invalid number for " + flag + ": " + value);
  }
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::exception&) {
    throw ConfigError("Number out of range for " + flag + ": " + value);
  }
  if (parsed == 0) {
    throw ConfigError(flag + " must be positive");
  }
  return static_cast<std::size_t>(parsed);
}

} // namespace

//==============================================
// COMMAND LINE PARSING
//==============================================

Config parse_command_line(int argc, const char* const argv[]) {
  Config config;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-h" || flag == "--help") {
      config.show_help = true;
      continue;
    }

    auto it = FLAG_MAP.find(flag);
    if (it == FLAG_MAP.end()) {
      throw ConfigError("Unknown argument: " + flag);
    }
    if (i + 1 >= argc) {
      throw ConfigError("Missing value for " + flag);
    }
    const std::string value(argv[++i]);

    switch (it->second) {
      case Option::ROOT:
        config.storage_root = value;
        break;
      case Option::NODES:
        config.nodes = split_list(value);
        break;
      case Option::FRAGMENT_SIZE:
        config.sizing = engine::SizingPolicy::fixed_size(parse_positive(flag, value));
        break;
      case Option::FRAGMENT_COUNT:
        config.sizing = engine::SizingPolicy::fixed_count(parse_positive(flag, value));
        break;
      case Option::AVAILABILITY:
        try {
          config.availability = engine::parse_availability_policy(value);
        } catch (const std::invalid_argument& e) {
          throw ConfigError(e.what());
        }
        break;
      case Option::TIMEOUT:
        config.io_timeout = std::chrono::milliseconds(parse_positive(flag, value));
        break;
      case Option::WORKERS:
        config.io_workers = parse_positive(flag, value);
        break;
      case Option::RESTORE_DIR:
        config.restore_dir = value;
        break;
      case Option::LOG_FILE:
        config.log_file = value;
        break;
      case Option::LOG_LEVEL:
        try {
          config.log_level = logging::parse_severity(value);
        } catch (const std::invalid_argument& e) {
          throw ConfigError(e.what());
        }
        break;
    }
  }

  validate(config);
  return config;
}

void validate(const Config& config) {
  if (config.nodes.empty()) {
    throw ConfigError("At least one node is required");
  }

  std::set<std::string> seen;
  for (const auto& node : config.nodes) {
    if (node.find('/') != std::string::npos || node.find('\\') != std::string::npos ||
        node == "." || node == "..") {
      throw ConfigError("Invalid node name: " + node);
    }
    if (!seen.insert(node).second) {
      throw ConfigError("Duplicate node name: " + node);
    }
  }

  if (config.sizing.value == 0) {
    throw ConfigError("Fragment size or count must be positive");
  }
  if (config.io_timeout.count() <= 0) {
    throw ConfigError("IO timeout must be positive");
  }
  if (config.io_workers == 0) {
    throw ConfigError("At least one IO worker is required");
  }
  if (config.storage_root.empty()) {
    throw ConfigError("Storage root must not be empty");
  }
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> parts;
  std::stringstream ss(value);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

std::string usage(const std::string& program_name) {
  std::stringstream ss;
  ss << "Usage: " << program_name << " [options]\n"
     << "Options:\n"
     << "  -r, --root <dir>            Storage root holding one directory per node (simulated_nodes)\n"
     << "  -n, --nodes <a,b,...>       Node names in placement order (node_1,...,node_5)\n"
     << "  -s, --fragment-size <bytes> Fixed fragment size (1048576)\n"
     << "  -c, --fragment-count <n>    Fixed fragment count, replaces --fragment-size\n"
     << "  -a, --availability <mode>   ignore | full-mesh | available-only (ignore)\n"
     << "  -t, --timeout-ms <ms>       Storage I/O timeout per operation (5000)\n"
     << "  -w, --workers <n>           Storage I/O worker threads (4)\n"
     << "  -o, --restore-dir <dir>     Where 'get' writes reconstructed files (restored)\n"
     << "  -l, --log-file <path>       Log file (fslite.log)\n"
     << "  -v, --log-level <level>     trace | debug | info | warning | error | fatal (info)\n"
     << "  -h, --help                  Show this message\n"
     << "Example: " << program_name << " -r /tmp/mesh -n alpha,beta,gamma -c 3\n";
  return ss.str();
}

} // namespace fslite::config
