#include "fslite/engine/fragmenter.hpp"
#include "fslite/checksum/checksum.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <set>

namespace fslite::engine {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Fragmenter::Fragmenter(std::shared_ptr<storage::StorageBackend> backend,
                       node::NodeRegistry& nodes,
                       utils::IoExecutor& executor,
                       SizingPolicy sizing,
                       AvailabilityPolicy availability)
  : backend_(std::move(backend))
  , nodes_(nodes)
  , executor_(executor)
  , sizing_(sizing)
  , availability_(availability) {

  if (!backend_) {
    throw std::invalid_argument("Fragmenter: Storage backend is required");
  }
  if (sizing_.value == 0) {
    throw std::invalid_argument("Fragmenter: Sizing policy value must be positive");
  }

  BOOST_LOG_TRIVIAL(info) << "Fragmenter: initialized with "
                          << (sizing_.mode == SizingPolicy::Mode::FIXED_SIZE ? "fixed size " : "fixed count ")
                          << sizing_.value << ", availability policy " << to_string(availability_);
}


//==============================================
// FRAGMENTATION
//==============================================

std::vector<Fragment> Fragmenter::split(const std::string& file_id, const std::vector<uint8_t>& content) {
  BOOST_LOG_TRIVIAL(info) << "Fragmenter: Splitting " << content.size() << " bytes for file " << file_id;

  if (content.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: Refusing to split empty content for file " << file_id;
    throw EmptyInput();
  }

  // One consistent view of the flags for placement and gating
  const auto status = nodes_.snapshot();
  const auto layout = plan_with(file_id, content.size(), status);

  std::set<std::string> offline;
  for (const auto& node : status) {
    if (!node.available) {
      offline.insert(node.name);
    }
  }

  // Writes stop at the first fragment placed on an offline node
  std::size_t limit = layout.size();
  for (const auto& planned : layout) {
    if (offline.count(planned.node) > 0) {
      limit = planned.index;
      break;
    }
  }

  std::vector<Fragment> fragments;
  std::vector<utils::IoTask<void>> writes;
  fragments.reserve(layout.size());
  writes.reserve(limit);

  for (std::size_t i = 0; i < limit; ++i) {
    const auto& planned = layout[i];
    std::vector<uint8_t> slice(content.begin() + planned.offset,
                               content.begin() + planned.offset + planned.length);

    std::string hash = checksum::fingerprint(slice);
    fragments.emplace_back(planned.index, planned.node, planned.name, hash, planned.length);

    BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Fragment " << planned.index << " (" << planned.length
                             << " bytes) -> " << planned.node << "/" << planned.name;

    // The task owns its bytes so an abandoned write never touches caller memory
    writes.push_back(executor_.submit(
      [backend = backend_, node = planned.node, name = planned.name, bytes = std::move(slice)]() {
        backend->write(node, name, bytes);
      }));
  }

  // Collect results in index order; the first failure wins
  for (std::size_t i = 0; i < writes.size(); ++i) {
    const auto& planned = layout[i];

    if (writes[i].wait_for_result() == std::future_status::timeout) {
      BOOST_LOG_TRIVIAL(error) << "Fragmenter: Timed out writing fragment " << i << " to " << planned.node;
      settle(writes);
      throw BackendTimeout(planned.node, i);
    }

    try {
      writes[i].get();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Fragmenter: Failed to write fragment " << i << " to "
                               << planned.node << ": " << e.what();
      settle(writes);
      throw WriteFailed(planned.node, i, e.what());
    }
  }

  if (limit < layout.size()) {
    const auto& planned = layout[limit];
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: Node " << planned.node << " is offline, fragment "
                             << limit << " not written";
    throw WriteFailed(planned.node, limit, "node unavailable");
  }

  BOOST_LOG_TRIVIAL(info) << "Fragmenter: Split file " << file_id << " into " << fragments.size() << " fragments";
  return fragments;
}

std::vector<PlannedFragment> Fragmenter::plan(const std::string& file_id, std::size_t content_size) const {
  return plan_with(file_id, content_size, nodes_.snapshot());
}


//==============================================
// PLACEMENT
//==============================================

std::vector<std::string> Fragmenter::placement_nodes(const std::vector<node::NodeStatus>& status) const {
  if (status.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: No nodes configured";
    throw NoNodesConfigured();
  }

  std::vector<std::string> all;
  std::vector<std::string> online;
  std::vector<std::string> offline;
  for (const auto& node : status) {
    all.push_back(node.name);
    (node.available ? online : offline).push_back(node.name);
  }

  switch (availability_) {
    case AvailabilityPolicy::FULL_MESH:
      if (!offline.empty()) {
        BOOST_LOG_TRIVIAL(error) << "Fragmenter: " << offline.size() << " nodes offline, mesh incomplete";
        throw MeshDegraded(offline);
      }
      return all;

    case AvailabilityPolicy::AVAILABLE_ONLY:
      if (online.empty()) {
        BOOST_LOG_TRIVIAL(error) << "Fragmenter: Every configured node is offline";
        throw NoNodesConfigured("no available nodes");
      }
      return online;

    case AvailabilityPolicy::IGNORE:
    default:
      return all;
  }
}

std::vector<PlannedFragment> Fragmenter::plan_with(const std::string& file_id, std::size_t content_size,
                                                   const std::vector<node::NodeStatus>& status) const {
  if (content_size == 0) {
    throw EmptyInput();
  }

  const auto targets = placement_nodes(status);
  const std::size_t fragment_size = sizing_.fragment_size(content_size);

  std::vector<PlannedFragment> layout;
  layout.reserve(content_size / fragment_size + 1);

  // An exact multiple never yields a trailing zero-length fragment
  for (std::size_t offset = 0, index = 0; offset < content_size; offset += fragment_size, ++index) {
    std::size_t length = std::min(fragment_size, content_size - offset);
    layout.push_back({index, offset, length, targets[index % targets.size()], make_blob_name(file_id, index)});
  }

  return layout;
}


//==============================================
// FAILURE HANDLING
//==============================================

void Fragmenter::settle(std::vector<utils::IoTask<void>>& writes) {
  BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Waiting for outstanding writes before reporting failure";
  for (auto& write : writes) {
    write.settle();
  }
}

} // namespace fslite::engine
