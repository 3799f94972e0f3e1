#include "fslite/registry/file_registry.hpp"
#include <boost/log/trivial.hpp>

namespace fslite {
namespace registry {

bool FileRegistry::add(const engine::FileRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!records_.emplace(record.id, record).second) {
    BOOST_LOG_TRIVIAL(warning) << "File registry: Record already exists for id: " << record.id;
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "File registry: Added " << record.filename << " as " << record.id
                          << " (" << record.fragments.size() << " fragments)";
  return true;
}

std::optional<engine::FileRecord> FileRegistry::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = records_.find(id);
  if (it == records_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "File registry: No record for id: " << id;
    return std::nullopt;
  }
  return it->second;
}

bool FileRegistry::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (records_.erase(id) == 0) {
    BOOST_LOG_TRIVIAL(warning) << "File registry: Attempted to remove non-existent record: " << id;
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "File registry: Removed record: " << id;
  return true;
}

bool FileRegistry::has(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.count(id) > 0;
}

std::vector<FileSummary> FileRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<FileSummary> rows;
  rows.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    rows.push_back({id, record.filename, record.total_size(), record.fragments.size()});
  }
  return rows;
}

std::size_t FileRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace registry
} // namespace fslite
