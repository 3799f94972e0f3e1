#ifndef FSLITE_FILE_SERVICE_HPP
#define FSLITE_FILE_SERVICE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "fslite/config/config.hpp"
#include "fslite/engine/fragmenter.hpp"
#include "fslite/engine/reconstructor.hpp"
#include "fslite/node/node_registry.hpp"
#include "fslite/registry/file_registry.hpp"
#include "fslite/storage/storage_backend.hpp"
#include "fslite/utils/io_executor.hpp"

namespace fslite {
namespace service {

// Wires the engine to a backend, a node registry and a file registry,
// and exposes the upload / download / delete / status operations.
class FileService {
public:
  FileService(const FileService&) = delete;
  FileService& operator=(const FileService&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Uses a LocalBackend rooted at config.storage_root
  explicit FileService(const config::Config& config);
  // Uses the given backend; config.storage_root is ignored
  FileService(const config::Config& config, std::shared_ptr<storage::StorageBackend> backend);
  virtual ~FileService();


  // ---- PROCESSING OF USER REQUESTS ----
  // Fragments content under a fresh file id and registers it. On a write failure or
  // timeout every blob the upload may have written is removed before the error is
  // rethrown. Throws StoreError if no unused file id can be allocated.
  engine::FileRecord upload(const std::string& filename, const std::vector<uint8_t>& content);
  // Reads a local file and uploads it under its base name
  engine::FileRecord store_file(const std::filesystem::path& path);
  // Throws FileNotFound or any reconstruction error
  std::vector<uint8_t> download(const std::string& file_id);
  // Reconstructs into directory (restore_dir when empty) under the original filename
  std::filesystem::path export_file(const std::string& file_id, const std::filesystem::path& directory = {});
  // Per-fragment health of a stored file
  std::vector<engine::FragmentReport> check(const std::string& file_id);
  // Removes every fragment then the record. Fragment removal failures are logged, not rethrown.
  void remove(const std::string& file_id);


  // ---- QUERIES AND OPERATOR ACTIONS ----
  std::vector<registry::FileSummary> list() const;
  node::HealthSummary status() const;
  bool toggle(const std::string& node);


  // ---- GETTERS ----
  node::NodeRegistry& get_nodes() { return *nodes_; }
  registry::FileRegistry& get_registry() { return registry_; }
  engine::Fragmenter& get_fragmenter() { return *fragmenter_; }
  storage::StorageBackend& get_backend() { return *backend_; }
  const config::Config& get_config() const { return config_; }

protected:
  // Source of candidate file ids
  virtual std::string new_file_id();

private:
  // ---- PARAMETERS ----
  config::Config config_;
  std::shared_ptr<storage::StorageBackend> backend_;
  std::unique_ptr<node::NodeRegistry> nodes_;
  std::unique_ptr<utils::IoExecutor> executor_;
  std::unique_ptr<engine::Fragmenter> fragmenter_;
  std::unique_ptr<engine::Reconstructor> reconstructor_;
  registry::FileRegistry registry_;


  // Removes "<file_id>.part<i>" from every node for each index a file of content_size could use
  void discard_orphans(const std::string& file_id, std::size_t content_size);
  engine::FileRecord find_record(const std::string& file_id) const;
  // A candidate id not yet in the registry
  std::string allocate_file_id();
};

} // namespace service
} // namespace fslite

#endif // FSLITE_FILE_SERVICE_HPP
