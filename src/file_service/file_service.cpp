#include "fslite/file_service/file_service.hpp"
#include "fslite/storage/local_backend.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iterator>

namespace fslite {
namespace service {

namespace {

constexpr int MAX_ID_ATTEMPTS = 8;

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileService::FileService(const config::Config& config)
  : FileService(config, std::make_shared<storage::LocalBackend>(config.storage_root, config.nodes)) {}

FileService::FileService(const config::Config& config, std::shared_ptr<storage::StorageBackend> backend)
  : config_(config)
  , backend_(std::move(backend)) {

  BOOST_LOG_TRIVIAL(info) << "File service: Initializing with " << config_.nodes.size() << " nodes";

  try {
    config::validate(config_);
    if (!backend_) {
      throw std::invalid_argument("File service: Storage backend is required");
    }

    nodes_ = std::make_unique<node::NodeRegistry>(config_.nodes);
    executor_ = std::make_unique<utils::IoExecutor>(config_.io_workers, config_.io_timeout);
    fragmenter_ = std::make_unique<engine::Fragmenter>(
      backend_, *nodes_, *executor_, config_.sizing, config_.availability);
    reconstructor_ = std::make_unique<engine::Reconstructor>(
      backend_, *nodes_, *executor_, config_.availability);

    BOOST_LOG_TRIVIAL(info) << "File service: Initialization complete";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File service: Failed to initialize: " << e.what();
    throw;
  }
}

FileService::~FileService() {
  // The engine must go before the executor it submits to
  reconstructor_.reset();
  fragmenter_.reset();
  executor_.reset();
}


//==============================================
// PROCESSING OF USER REQUESTS
//==============================================

engine::FileRecord FileService::upload(const std::string& filename, const std::vector<uint8_t>& content) {
  BOOST_LOG_TRIVIAL(info) << "File service: Uploading " << filename << " (" << content.size() << " bytes)";

  const std::string file_id = allocate_file_id();

  std::vector<engine::Fragment> fragments;
  try {
    fragments = fragmenter_->split(file_id, content);
  }
  catch (const engine::EngineError& e) {
    BOOST_LOG_TRIVIAL(error) << "File service: Upload of " << filename << " failed: " << e.what();
    if (e.kind() == engine::ErrorKind::WRITE_FAILED || e.kind() == engine::ErrorKind::BACKEND_TIMEOUT) {
      discard_orphans(file_id, content.size());
    }
    throw;
  }

  engine::FileRecord record(file_id, filename, std::move(fragments));
  if (!registry_.add(record)) {
    // Another upload claimed the id meanwhile; its blobs share these names, so nothing is removed
    BOOST_LOG_TRIVIAL(error) << "File service: File id " << file_id << " was registered concurrently";
    throw storage::StoreError("File service: File id already registered: " + file_id);
  }

  BOOST_LOG_TRIVIAL(info) << "File service: Stored " << filename << " as " << file_id
                          << " in " << record.fragments.size() << " fragments";
  return record;
}

engine::FileRecord FileService::store_file(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "File service: Storing local file: " << path.string();

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "File service: Failed to open file: " << path.string();
    throw storage::StoreError("File service: Failed to open file: " + path.string());
  }

  std::vector<uint8_t> content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw storage::StoreError("File service: Failed to read file: " + path.string());
  }

  return upload(path.filename().string(), content);
}

std::vector<uint8_t> FileService::download(const std::string& file_id) {
  BOOST_LOG_TRIVIAL(info) << "File service: Download requested for " << file_id;
  const engine::FileRecord record = find_record(file_id);
  return reconstructor_->reconstruct(record.fragments);
}

std::filesystem::path FileService::export_file(const std::string& file_id, const std::filesystem::path& directory) {
  const engine::FileRecord record = find_record(file_id);
  const std::vector<uint8_t> content = reconstructor_->reconstruct(record.fragments);

  std::filesystem::path target_dir = directory.empty() ? std::filesystem::path(config_.restore_dir) : directory;
  std::filesystem::create_directories(target_dir);

  // Only the last path component of the stored name is trusted
  std::filesystem::path output_path = target_dir / std::filesystem::path(record.filename).filename();

  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    BOOST_LOG_TRIVIAL(error) << "File service: Failed to create file: " << output_path.string();
    throw storage::StoreError("File service: Failed to create file: " + output_path.string());
  }
  out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    throw storage::StoreError("File service: Failed to write file: " + output_path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "File service: " << record.filename << " reconstructed to " << output_path.string();
  return output_path;
}

std::vector<engine::FragmentReport> FileService::check(const std::string& file_id) {
  const engine::FileRecord record = find_record(file_id);
  return reconstructor_->verify(record.fragments);
}

void FileService::remove(const std::string& file_id) {
  BOOST_LOG_TRIVIAL(info) << "File service: Deleting " << file_id;
  const engine::FileRecord record = find_record(file_id);

  std::size_t removed = 0;
  for (const auto& fragment : record.fragments) {
    try {
      if (backend_->remove(fragment.node, fragment.name)) {
        ++removed;
      }
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "File service: Failed to remove fragment " << fragment.index
                               << " from " << fragment.node << ": " << e.what();
    }
  }

  registry_.remove(file_id);
  BOOST_LOG_TRIVIAL(info) << "File service: Deleted " << file_id << ", removed " << removed << "/"
                          << record.fragments.size() << " fragments";
}


//==============================================
// QUERIES AND OPERATOR ACTIONS
//==============================================

std::vector<registry::FileSummary> FileService::list() const {
  return registry_.list();
}

node::HealthSummary FileService::status() const {
  return nodes_->health_summary();
}

bool FileService::toggle(const std::string& node) {
  return nodes_->toggle(node);
}


//==============================================
// UTILITY METHODS
//==============================================

void FileService::discard_orphans(const std::string& file_id, std::size_t content_size) {
  if (content_size == 0) {
    return;
  }

  const std::size_t fragment_size = config_.sizing.fragment_size(content_size);
  const std::size_t count = content_size / fragment_size + (content_size % fragment_size != 0 ? 1 : 0);

  std::size_t discarded = 0;
  for (std::size_t index = 0; index < count; ++index) {
    const std::string name = engine::make_blob_name(file_id, index);
    for (const auto& node : nodes_->list_nodes()) {
      try {
        if (backend_->remove(node, name)) {
          ++discarded;
        }
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "File service: Could not discard " << node << "/" << name << ": " << e.what();
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "File service: Discarded " << discarded << " orphaned fragments of " << file_id;
}

std::string FileService::new_file_id() {
  return engine::generate_file_id();
}

std::string FileService::allocate_file_id() {
  for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
    std::string file_id = new_file_id();
    if (!registry_.has(file_id)) {
      return file_id;
    }
    BOOST_LOG_TRIVIAL(warning) << "File service: Generated file id " << file_id << " is already in use";
  }
  BOOST_LOG_TRIVIAL(error) << "File service: Could not allocate a unique file id";
  throw storage::StoreError("File service: Could not allocate a unique file id");
}

engine::FileRecord FileService::find_record(const std::string& file_id) const {
  auto record = registry_.get(file_id);
  if (!record) {
    BOOST_LOG_TRIVIAL(error) << "File service: File not found: " << file_id;
    throw engine::FileNotFound(file_id);
  }
  return *record;
}

} // namespace service
} // namespace fslite
