#ifndef FSLITE_FILE_REGISTRY_HPP
#define FSLITE_FILE_REGISTRY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "fslite/engine/types.hpp"

namespace fslite {
namespace registry {

// Listing row for one stored file
struct FileSummary {
  std::string id;
  std::string filename;
  std::size_t size;
  std::size_t fragments;
};

// In-memory map from file id to its record
class FileRegistry {
public:
  FileRegistry() = default;
  FileRegistry(const FileRegistry&) = delete;
  FileRegistry& operator=(const FileRegistry&) = delete;

  // ---- RECORD MANAGEMENT ----
  // Returns false if a record with the same id already exists
  bool add(const engine::FileRecord& record);
  std::optional<engine::FileRecord> get(const std::string& id) const;
  // Returns false if no record had that id
  bool remove(const std::string& id);
  bool has(const std::string& id) const;

  // ---- QUERIES ----
  // Sorted by id
  std::vector<FileSummary> list() const;
  std::size_t size() const;

private:
  std::map<std::string, engine::FileRecord> records_;
  mutable std::mutex mutex_;
};

} // namespace registry
} // namespace fslite

#endif // FSLITE_FILE_REGISTRY_HPP
