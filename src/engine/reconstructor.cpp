#include "fslite/engine/reconstructor.hpp"
#include "fslite/checksum/checksum.hpp"
#include <boost/log/trivial.hpp>
#include <map>

namespace fslite::engine {

const char* to_string(FragmentReport::State state) {
  switch (state) {
    case FragmentReport::State::OK: return "ok";
    case FragmentReport::State::UNAVAILABLE: return "unavailable";
    case FragmentReport::State::CORRUPTED: return "corrupted";
    case FragmentReport::State::TIMED_OUT: return "timed out";
    default: return "unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Reconstructor::Reconstructor(std::shared_ptr<storage::StorageBackend> backend,
                             node::NodeRegistry& nodes,
                             utils::IoExecutor& executor,
                             AvailabilityPolicy availability)
  : backend_(std::move(backend))
  , nodes_(nodes)
  , executor_(executor)
  , availability_(availability) {

  if (!backend_) {
    throw std::invalid_argument("Reconstructor: Storage backend is required");
  }
  BOOST_LOG_TRIVIAL(info) << "Reconstructor: initialized with availability policy " << to_string(availability_);
}


//==============================================
// RECONSTRUCTION
//==============================================

std::vector<uint8_t> Reconstructor::reconstruct(const std::vector<Fragment>& fragments) {
  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Rebuilding file from " << fragments.size() << " fragments";

  std::vector<Fragment> ordered;
  try {
    ordered = sort_and_validate(fragments);
  } catch (const StructuralCorruption& e) {
    BOOST_LOG_TRIVIAL(error) << "Reconstructor: " << e.what();
    throw;
  }

  const auto status = nodes_.snapshot();

  if (availability_ == AvailabilityPolicy::FULL_MESH) {
    std::vector<std::string> offline;
    for (const auto& node : status) {
      if (!node.available) {
        offline.push_back(node.name);
      }
    }
    if (!offline.empty()) {
      BOOST_LOG_TRIVIAL(error) << "Reconstructor: " << offline.size() << " nodes offline, mesh incomplete";
      throw MeshDegraded(offline);
    }
  }

  // Nothing is read from or past the first fragment on an offline node
  const std::size_t limit = first_offline(ordered, status);
  std::vector<utils::IoTask<Fetched>> reads;
  reads.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    reads.push_back(fetch(ordered[i]));
  }

  std::vector<uint8_t> output;
  for (std::size_t i = 0; i < reads.size(); ++i) {
    const Fragment& fragment = ordered[i];

    // Pending reads after a failure are abandoned; their bytes are dropped with the tasks
    if (reads[i].wait_for_result() == std::future_status::timeout) {
      BOOST_LOG_TRIVIAL(error) << "Reconstructor: Timed out reading fragment " << i << " from " << fragment.node;
      throw BackendTimeout(fragment.node, i);
    }

    Fetched fetched;
    try {
      fetched = reads[i].get();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Reconstructor: Failed to read fragment " << i << " from "
                               << fragment.node << ": " << e.what();
      throw FragmentUnavailable(fragment.node, i);
    }

    if (!fetched.present) {
      BOOST_LOG_TRIVIAL(error) << "Reconstructor: Node " << fragment.node << " is offline or fragment "
                               << i << " missing";
      throw FragmentUnavailable(fragment.node, i);
    }

    if (fetched.hash != fragment.hash || fetched.bytes.size() != fragment.size) {
      BOOST_LOG_TRIVIAL(error) << "Reconstructor: Integrity mismatch in fragment " << i
                               << " (expected " << fragment.hash << ", got " << fetched.hash << ")";
      throw IntegrityViolation(i);
    }

    output.insert(output.end(), fetched.bytes.begin(), fetched.bytes.end());
  }

  if (limit < ordered.size()) {
    const Fragment& fragment = ordered[limit];
    BOOST_LOG_TRIVIAL(error) << "Reconstructor: Node " << fragment.node << " is offline, fragment "
                             << limit << " unavailable";
    throw FragmentUnavailable(fragment.node, limit);
  }

  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Rebuilt " << output.size() << " bytes from "
                          << ordered.size() << " fragments";
  return output;
}

std::vector<FragmentReport> Reconstructor::verify(const std::vector<Fragment>& fragments) {
  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Verifying " << fragments.size() << " fragments";

  const auto ordered = sort_and_validate(fragments);
  const auto status = nodes_.snapshot();

  std::map<std::string, bool> online;
  for (const auto& node : status) {
    online[node.name] = node.available;
  }

  // Offline nodes are reported without being touched
  std::vector<utils::IoTask<Fetched>> reads(ordered.size());
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    auto it = online.find(ordered[i].node);
    if (it != online.end() && it->second) {
      reads[i] = fetch(ordered[i]);
    }
  }

  std::vector<FragmentReport> reports;
  reports.reserve(ordered.size());

  for (std::size_t i = 0; i < ordered.size(); ++i) {
    const Fragment& fragment = ordered[i];
    FragmentReport report{i, fragment.node, FragmentReport::State::OK, ""};

    if (!reads[i].valid()) {
      report.state = FragmentReport::State::UNAVAILABLE;
      report.detail = "node offline";
    } else if (reads[i].wait_for_result() == std::future_status::timeout) {
      report.state = FragmentReport::State::TIMED_OUT;
      report.detail = "no answer within timeout";
    } else {
      try {
        Fetched fetched = reads[i].get();
        if (!fetched.present) {
          report.state = FragmentReport::State::UNAVAILABLE;
          report.detail = "blob missing";
        } else if (fetched.hash != fragment.hash || fetched.bytes.size() != fragment.size) {
          report.state = FragmentReport::State::CORRUPTED;
          report.detail = "checksum mismatch";
        }
      } catch (const std::exception& e) {
        report.state = FragmentReport::State::UNAVAILABLE;
        report.detail = e.what();
      }
    }

    BOOST_LOG_TRIVIAL(debug) << "Reconstructor: Fragment " << i << " on " << fragment.node
                             << ": " << to_string(report.state);
    reports.push_back(std::move(report));
  }

  return reports;
}


//==============================================
// RETRIEVAL
//==============================================

utils::IoTask<Reconstructor::Fetched> Reconstructor::fetch(const Fragment& fragment) {
  return executor_.submit([backend = backend_, node = fragment.node, name = fragment.name]() {
    Fetched fetched;
    if (!backend->exists(node, name)) {
      return fetched;
    }
    fetched.present = true;
    fetched.bytes = backend->read(node, name);
    fetched.hash = checksum::fingerprint(fetched.bytes);
    return fetched;
  });
}

std::size_t Reconstructor::first_offline(const std::vector<Fragment>& fragments,
                                         const std::vector<node::NodeStatus>& status) const {
  std::map<std::string, bool> online;
  for (const auto& node : status) {
    online[node.name] = node.available;
  }

  for (std::size_t i = 0; i < fragments.size(); ++i) {
    auto it = online.find(fragments[i].node);
    if (it == online.end() || !it->second) {
      return i;
    }
  }
  return fragments.size();
}

} // namespace fslite::engine
