#include "fslite/storage/local_backend.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>

namespace fslite {
namespace storage {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalBackend::LocalBackend(const std::string& base_path, const std::vector<std::string>& nodes)
  : base_path_(base_path)
  , nodes_(nodes) {
  BOOST_LOG_TRIVIAL(info) << "Local backend: Initializing with base path: " << base_path;

  try {
    check_directory_exists(base_path_);
    for (const auto& node : nodes_) {
      check_name(node);
      check_directory_exists(base_path_ / node);
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Failed to create node directories: " << e.what();
    throw StoreError("Local backend: Failed to create node directories: " + std::string(e.what()));
  }

  BOOST_LOG_TRIVIAL(debug) << "Local backend: " << nodes_.size() << " node directories created/verified";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void LocalBackend::write(const std::string& node, const std::string& name,
                         const std::vector<uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(debug) << "Local backend: Writing " << bytes.size() << " bytes to " << node << "/" << name;

  check_name(name);
  std::filesystem::path dir = node_dir(node);
  std::filesystem::path file_path = dir / name;

  // Open output file in binary mode for cross-platform consistency
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Failed to create file: " << file_path.string();
    throw StoreError("Local backend: Failed to create file: " + file_path.string());
  }

  if (!bytes.empty()) {
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  }
  file.close();

  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Failed to write file: " << file_path.string();
    throw StoreError("Local backend: Failed to write file: " + file_path.string());
  }
}

std::vector<uint8_t> LocalBackend::read(const std::string& node, const std::string& name) {
  BOOST_LOG_TRIVIAL(debug) << "Local backend: Reading " << node << "/" << name;

  check_name(name);
  std::filesystem::path file_path = node_dir(node) / name;

  std::error_code ec;
  auto size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: File not found: " << file_path.string();
    throw StoreError("Local backend: File not found: " + file_path.string());
  }

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Local backend: Failed to open file: " + file_path.string());
  }

  std::vector<uint8_t> bytes(static_cast<std::size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Short read on file: " << file_path.string();
    throw StoreError("Local backend: Failed to read file: " + file_path.string());
  }

  return bytes;
}

bool LocalBackend::exists(const std::string& node, const std::string& name) {
  check_name(name);
  std::error_code ec;
  bool found = std::filesystem::is_regular_file(node_dir(node) / name, ec);

  BOOST_LOG_TRIVIAL(debug) << "Local backend: Blob " << node << "/" << name
                           << (found ? " exists" : " not found");
  return found;
}

bool LocalBackend::remove(const std::string& node, const std::string& name) {
  check_name(name);
  std::filesystem::path file_path = node_dir(node) / name;

  std::error_code ec;
  bool removed = std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Failed to remove " << file_path.string() << ": " << ec.message();
    throw StoreError("Local backend: Failed to remove file: " + file_path.string());
  }

  if (removed) {
    BOOST_LOG_TRIVIAL(debug) << "Local backend: Removed " << node << "/" << name;
  }
  return removed;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> LocalBackend::list(const std::string& node) const {
  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(node_dir(node))) {
    if (entry.is_regular_file()) {
      names.push_back(entry.path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

void LocalBackend::clear() {
  BOOST_LOG_TRIVIAL(info) << "Local backend: Clearing all nodes under: " << base_path_;
  for (const auto& node : nodes_) {
    std::filesystem::remove_all(base_path_ / node);
    check_directory_exists(base_path_ / node);
  }
}

std::filesystem::path LocalBackend::blob_path(const std::string& node, const std::string& name) const {
  check_name(name);
  return node_dir(node) / name;
}


//==============================================
// PATH RESOLUTION
//==============================================

void LocalBackend::check_name(const std::string& name) const {
  if (name.empty() || name == "." || name == ".." ||
      name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Invalid blob or node name: '" << name << "'";
    throw StoreError("Local backend: Invalid name: " + name);
  }
}

std::filesystem::path LocalBackend::node_dir(const std::string& node) const {
  if (std::find(nodes_.begin(), nodes_.end(), node) == nodes_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Unknown node: " << node;
    throw StoreError("Local backend: Unknown node: " + node);
  }
  return base_path_ / node;
}

void LocalBackend::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace storage
} // namespace fslite
