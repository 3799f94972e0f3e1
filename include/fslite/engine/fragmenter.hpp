#ifndef FSLITE_FRAGMENTER_HPP
#define FSLITE_FRAGMENTER_HPP

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

class Fragmenter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Fragmenter(std::shared_ptr<storage::StorageBackend> backend,
             node::NodeRegistry& nodes,
             utils::IoExecutor& executor,
             SizingPolicy sizing,
             AvailabilityPolicy availability);


  // ---- FRAGMENTATION ----
  // Splits content, writes every fragment to its node and returns the fragments in index order.
  // Throws EmptyInput, NoNodesConfigured, MeshDegraded, WriteFailed or BackendTimeout.
  // Each write may run for the executor timeout from the moment it starts.
  // On failure every submitted write has finished before the error is thrown;
  // fragments written by then are left in place.
  std::vector<Fragment> split(const std::string& file_id, const std::vector<uint8_t>& content);

  // Layout split() would produce for content_size bytes given the current node flags.
  // Touches no storage. Throws like split() for empty input or no usable nodes.
  std::vector<PlannedFragment> plan(const std::string& file_id, std::size_t content_size) const;


  // ---- GETTERS ----
  const SizingPolicy& sizing() const { return sizing_; }
  AvailabilityPolicy availability() const { return availability_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<storage::StorageBackend> backend_;
  node::NodeRegistry& nodes_;
  utils::IoExecutor& executor_;
  SizingPolicy sizing_;
  AvailabilityPolicy availability_;


  // ---- PLACEMENT ----
  // Nodes eligible for placement under the availability policy, in configured order
  std::vector<std::string> placement_nodes(const std::vector<node::NodeStatus>& status) const;
  std::vector<PlannedFragment> plan_with(const std::string& file_id, std::size_t content_size,
                                         const std::vector<node::NodeStatus>& status) const;


  // ---- FAILURE HANDLING ----
  // Waits for every write, including ones already reported as timed out
  static void settle(std::vector<utils::IoTask<void>>& writes);
};

} // namespace fslite::engine

#endif // FSLITE_FRAGMENTER_HPP
