#ifndef FSLITE_STORAGE_BACKEND_HPP
#define FSLITE_STORAGE_BACKEND_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fslite {
namespace storage {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Blob storage addressed by (node, name). Implementations must be safe to call
// from several threads at once for distinct names.
class StorageBackend {
public:
  virtual ~StorageBackend() = default;

  // Writes bytes under name at node, replacing any previous blob. Throws StoreError.
  virtual void write(const std::string& node, const std::string& name,
                     const std::vector<uint8_t>& bytes) = 0;
  // Returns the blob stored under name at node. Throws StoreError if it cannot be read.
  virtual std::vector<uint8_t> read(const std::string& node, const std::string& name) = 0;
  virtual bool exists(const std::string& node, const std::string& name) = 0;
  // Returns false if there was nothing to remove
  virtual bool remove(const std::string& node, const std::string& name) = 0;
};

} // namespace storage
} // namespace fslite

#endif // FSLITE_STORAGE_BACKEND_HPP
