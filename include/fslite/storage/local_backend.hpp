#ifndef FSLITE_LOCAL_BACKEND_HPP
#define FSLITE_LOCAL_BACKEND_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "fslite/storage/storage_backend.hpp"

namespace fslite {
namespace storage {

// Filesystem backend: one directory per node under a common root,
// one file per blob. Layout: {base_path}/{node}/{name}
class LocalBackend : public StorageBackend {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the root and one directory per node if missing
  LocalBackend(const std::string& base_path, const std::vector<std::string>& nodes);


  // ---- CORE STORAGE OPERATIONS ----
  void write(const std::string& node, const std::string& name,
             const std::vector<uint8_t>& bytes) override;
  std::vector<uint8_t> read(const std::string& node, const std::string& name) override;
  bool exists(const std::string& node, const std::string& name) override;
  bool remove(const std::string& node, const std::string& name) override;


  // ---- QUERY OPERATIONS ----
  // Names of every blob stored at node, sorted
  std::vector<std::string> list(const std::string& node) const;
  // Removes every blob on every node and recreates the empty node directories
  void clear();
  // Full path of a blob, for inspection and manual recovery
  std::filesystem::path blob_path(const std::string& node, const std::string& name) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all node directories
  std::filesystem::path base_path_;
  std::vector<std::string> nodes_;


  // ---- PATH RESOLUTION ----
  // Rejects names that would escape the node directory
  void check_name(const std::string& name) const;
  std::filesystem::path node_dir(const std::string& node) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace storage
} // namespace fslite

#endif // FSLITE_LOCAL_BACKEND_HPP
