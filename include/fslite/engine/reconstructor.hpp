#ifndef FSLITE_RECONSTRUCTOR_HPP
#define FSLITE_RECONSTRUCTOR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "fslite/engine/types.hpp"
#include "fslite/engine/engine_error.hpp"
#include "fslite/node/node_registry.hpp"
#include "fslite/storage/storage_backend.hpp"
#include "fslite/utils/io_executor.hpp"

namespace fslite::engine {

// Outcome of checking one fragment without assembling the file
struct FragmentReport {
  enum class State {
    OK,
    UNAVAILABLE,
    CORRUPTED,
    TIMED_OUT
  };

  std::size_t index;
  std::string node;
  State state;
  std::string detail;
};

const char* to_string(FragmentReport::State state);

class Reconstructor {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Reconstructor(std::shared_ptr<storage::StorageBackend> backend,
                node::NodeRegistry& nodes,
                utils::IoExecutor& executor,
                AvailabilityPolicy availability);


  // ---- RECONSTRUCTION ----
  // Rebuilds the original bytes from fragments given in any order.
  // Throws StructuralCorruption, MeshDegraded, FragmentUnavailable, IntegrityViolation
  // or BackendTimeout for the first failing fragment in index order. Never returns partial output.
  // Each read may run for the executor timeout from the moment it starts.
  std::vector<uint8_t> reconstruct(const std::vector<Fragment>& fragments);

  // Checks every fragment and reports each one. Throws StructuralCorruption only.
  std::vector<FragmentReport> verify(const std::vector<Fragment>& fragments);

private:
  // What a worker found for one fragment
  struct Fetched {
    bool present{false};
    std::vector<uint8_t> bytes;
    std::string hash;
  };

  // ---- PARAMETERS ----
  std::shared_ptr<storage::StorageBackend> backend_;
  node::NodeRegistry& nodes_;
  utils::IoExecutor& executor_;
  AvailabilityPolicy availability_;


  // ---- RETRIEVAL ----
  // Submits an existence check, read and fingerprint for one fragment
  utils::IoTask<Fetched> fetch(const Fragment& fragment);
  // Index of the first fragment whose node is offline or unknown, or fragments.size()
  std::size_t first_offline(const std::vector<Fragment>& fragments,
                            const std::vector<node::NodeStatus>& status) const;
};

} // namespace fslite::engine

#endif // FSLITE_RECONSTRUCTOR_HPP
