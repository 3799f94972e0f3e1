#pragma once

#include <iostream>
#include <string>
#include "fslite/file_service/file_service.hpp"

namespace fslite {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(service::FileService& file_service, std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Reads commands until "quit" or end of input
  void run();
  // Runs one command line; returns false once the shell should stop
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  // System components
  service::FileService& file_service_;
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::string& argument, const std::string& extra);
  void handle_store_command(const std::string& path);
  void handle_read_command(const std::string& file_id);
  void handle_get_command(const std::string& file_id, const std::string& directory);
  void handle_check_command(const std::string& file_id);
  void handle_delete_command(const std::string& file_id);
  void handle_list_command();
  void handle_status_command();
  void handle_toggle_command(const std::string& node);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace fslite
