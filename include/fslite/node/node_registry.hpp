#ifndef FSLITE_NODE_REGISTRY_HPP
#define FSLITE_NODE_REGISTRY_HPP

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace fslite {
namespace node {

struct NodeStatus {
  std::string name;
  bool available;
};

struct HealthSummary {
  // Per-node availability, in configured order
  std::vector<NodeStatus> nodes;
  // available / total, 0 when no nodes are configured
  double available_fraction{0.0};
  // floor(available_fraction * 100)
  int mesh_health{0};
};

// Ordered set of storage locations with a simulated availability switch per node.
// The order is fixed at construction. Flags are guarded by a single mutex.
class NodeRegistry {
public:
  // Delete copy constructor and assignment operator
  NodeRegistry(const NodeRegistry&) = delete;
  NodeRegistry& operator=(const NodeRegistry&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // All nodes start available. Throws std::invalid_argument on duplicate or empty names.
  explicit NodeRegistry(const std::vector<std::string>& nodes);


  // ---- NODE QUERIES ----
  std::vector<std::string> list_nodes() const;
  // Available nodes, in configured order
  std::vector<std::string> available_nodes() const;
  bool has_node(const std::string& node) const;
  std::size_t size() const;


  // ---- AVAILABILITY ----
  // Throws std::out_of_range for an unknown node
  bool is_available(const std::string& node) const;
  void set_available(const std::string& node, bool available);
  // Flips the flag and returns the new state
  bool toggle(const std::string& node);
  // Snapshot of every flag taken under one lock
  std::vector<NodeStatus> snapshot() const;


  // ---- REPORTING ----
  HealthSummary health_summary() const;

private:
  // ---- PARAMETERS ----
  // Configured order
  const std::vector<std::string> order_;
  // Node name to availability flag and access mutex
  std::map<std::string, bool> available_;
  mutable std::mutex mutex_;

  // Caller must hold mutex_
  std::map<std::string, bool>::const_iterator find_locked(const std::string& node) const;
};

} // namespace node
} // namespace fslite

#endif // FSLITE_NODE_REGISTRY_HPP
