#include "fslite/node/node_registry.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace fslite {
namespace node {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NodeRegistry::NodeRegistry(const std::vector<std::string>& nodes)
  : order_(nodes) {

  for (const auto& name : order_) {
    if (name.empty()) {
      BOOST_LOG_TRIVIAL(error) << "Node registry: Empty node name in configuration";
      throw std::invalid_argument("Node registry: Empty node name");
    }
    if (!available_.emplace(name, true).second) {
      BOOST_LOG_TRIVIAL(error) << "Node registry: Duplicate node name: " << name;
      throw std::invalid_argument("Node registry: Duplicate node name: " + name);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Node registry: initialized with " << order_.size() << " nodes";
}


//==============================================
// NODE QUERIES
//==============================================

std::vector<std::string> NodeRegistry::list_nodes() const {
  return order_;
}

std::vector<std::string> NodeRegistry::available_nodes() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> result;
  for (const auto& name : order_) {
    if (available_.at(name)) {
      result.push_back(name);
    }
  }
  return result;
}

bool NodeRegistry::has_node(const std::string& node) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_.count(node) > 0;
}

std::size_t NodeRegistry::size() const {
  return order_.size();
}


//==============================================
// AVAILABILITY
//==============================================

bool NodeRegistry::is_available(const std::string& node) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_locked(node)->second;
}

void NodeRegistry::set_available(const std::string& node, bool available) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = available_.find(node);
  if (it == available_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Node registry: Attempted to update unknown node: " << node;
    throw std::out_of_range("Node registry: Unknown node: " + node);
  }

  it->second = available;
  BOOST_LOG_TRIVIAL(info) << "Node registry: Node " << node << " marked "
                          << (available ? "online" : "offline");
}

bool NodeRegistry::toggle(const std::string& node) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = available_.find(node);
  if (it == available_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Node registry: Attempted to toggle unknown node: " << node;
    throw std::out_of_range("Node registry: Unknown node: " + node);
  }

  it->second = !it->second;
  BOOST_LOG_TRIVIAL(info) << "Node registry: Node " << node << " toggled "
                          << (it->second ? "online" : "offline");
  return it->second;
}

std::vector<NodeStatus> NodeRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<NodeStatus> result;
  result.reserve(order_.size());
  for (const auto& name : order_) {
    result.push_back({name, available_.at(name)});
  }
  return result;
}


//==============================================
// REPORTING
//==============================================

HealthSummary NodeRegistry::health_summary() const {
  HealthSummary summary;
  summary.nodes = snapshot();

  if (summary.nodes.empty()) {
    return summary;
  }

  std::size_t online = 0;
  for (const auto& status : summary.nodes) {
    if (status.available) {
      ++online;
    }
  }

  summary.available_fraction = static_cast<double>(online) / summary.nodes.size();
  summary.mesh_health = static_cast<int>(online * 100 / summary.nodes.size());

  BOOST_LOG_TRIVIAL(debug) << "Node registry: Mesh health " << summary.mesh_health << "% ("
                           << online << "/" << summary.nodes.size() << " online)";
  return summary;
}


//==============================================
// UTILITY METHODS
//==============================================

std::map<std::string, bool>::const_iterator NodeRegistry::find_locked(const std::string& node) const {
  auto it = available_.find(node);
  if (it == available_.end()) {
    throw std::out_of_range("Node registry: Unknown node: " + node);
  }
  return it;
}

} // namespace node
} // namespace fslite
