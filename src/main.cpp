#include "fslite/cli/cli.hpp"
#include "fslite/config/config.hpp"
#include "fslite/file_service/file_service.hpp"
#include "fslite/logger/logger.hpp"
#include <iostream>
#include <string>

bool run_shell(const fslite::config::Config& config) {
  try {
    fslite::logging::init_logging(config.log_file, config.log_level);

    fslite::service::FileService file_service(config);
    fslite::cli::CLI cli(file_service);

    std::cout << "FS-Lite: " << config.nodes.size() << " nodes under " << config.storage_root
              << ", availability policy " << fslite::engine::to_string(config.availability) << "\n";
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const std::string program_name = argc > 0 ? argv[0] : "fslite";

  fslite::config::Config config;
  try {
    config = fslite::config::parse_command_line(argc, argv);
  } catch (const fslite::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n' << fslite::config::usage(program_name);
    return 1;
  }

  if (config.show_help) {
    std::cout << fslite::config::usage(program_name);
    return 0;
  }

  return run_shell(config) ? 0 : 1;
}
