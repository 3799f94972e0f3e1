#include "fslite/cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>

namespace fslite {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(service::FileService& file_service, std::istream& in, std::ostream& out)
  : running_(false)
  , file_service_(file_service)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "FSLite> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "FSLite> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument, extra;
  iss >> command >> argument >> extra;

  if (command.empty()) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  process_command(command, argument, extra);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument, const std::string& extra) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with argument: " << argument;

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "ls") {
    handle_list_command();
  }
  else if (command == "status") {
    handle_status_command();
  }
  else if (argument.empty()) {
    out_ << "Invalid input. Usage: <command> <argument> (type 'help')" << std::endl;
  }
  else if (command == "store") {
    handle_store_command(argument);
  }
  else if (command == "read") {
    handle_read_command(argument);
  }
  else if (command == "get") {
    handle_get_command(argument, extra);
  }
  else if (command == "check") {
    handle_check_command(argument);
  }
  else if (command == "delete") {
    handle_delete_command(argument);
  }
  else if (command == "toggle") {
    handle_toggle_command(argument);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_store_command(const std::string& path) {
  try {
    auto record = file_service_.store_file(path);
    out_ << "Stored " << record.filename << " as " << record.id << " ("
         << record.fragments.size() << " fragments, " << record.total_size() << " bytes)" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_read_command(const std::string& file_id) {
  try {
    auto content = file_service_.download(file_id);
    out_.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    out_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_get_command(const std::string& file_id, const std::string& directory) {
  try {
    auto path = file_service_.export_file(file_id, directory);
    out_ << "Reconstructed to " << path.string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reconstructing file", e.what());
  }
}

void CLI::handle_check_command(const std::string& file_id) {
  try {
    for (const auto& report : file_service_.check(file_id)) {
      out_ << "  #" << std::left << std::setw(5) << report.index << std::setw(12) << report.node
           << engine::to_string(report.state);
      if (!report.detail.empty()) {
        out_ << " (" << report.detail << ")";
      }
      out_ << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error checking file", e.what());
  }
}

void CLI::handle_delete_command(const std::string& file_id) {
  try {
    file_service_.remove(file_id);
    out_ << "File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_list_command() {
  auto files = file_service_.list();
  if (files.empty()) {
    out_ << "No files stored" << std::endl;
    return;
  }
  for (const auto& file : files) {
    out_ << "* " << file.id << "  " << file.filename << "  " << file.size << " bytes  "
         << file.fragments << " fragments" << std::endl;
  }
}

void CLI::handle_status_command() {
  auto summary = file_service_.status();
  out_ << "Mesh health: " << summary.mesh_health << "%" << std::endl;
  for (const auto& node : summary.nodes) {
    out_ << "  " << std::left << std::setw(12) << node.name << (node.available ? "online" : "offline") << std::endl;
  }
}

void CLI::handle_toggle_command(const std::string& node) {
  try {
    bool online = file_service_.toggle(node);
    out_ << "Node " << node << " is now " << (online ? "online" : "offline") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error toggling node", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help              Display this help message" << std::endl;
  out_ << "  store <path>      Fragment local <path> across the nodes" << std::endl;
  out_ << "  read <id>         Reconstruct <id> and print it" << std::endl;
  out_ << "  get <id> [dir]    Reconstruct <id> into [dir] (default restore directory)" << std::endl;
  out_ << "  check <id>        Verify every fragment of <id>" << std::endl;
  out_ << "  delete <id>       Remove <id> and its fragments" << std::endl;
  out_ << "  ls                List stored files" << std::endl;
  out_ << "  status            Show node availability and mesh health" << std::endl;
  out_ << "  toggle <node>     Flip a node between online and offline" << std::endl;
  out_ << "  quit              Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace fslite
