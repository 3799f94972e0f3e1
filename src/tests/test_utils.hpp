#ifndef FSLITE_TEST_UTILS_HPP
#define FSLITE_TEST_UTILS_HPP

#include <gmock/gmock.h>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include "fslite/storage/storage_backend.hpp"

// Quiet logging for test runs; raise the level when debugging a failure
inline void init_test_logging() {
  boost::log::core::get()->set_filter(
    boost::log::trivial::severity >= boost::log::trivial::error
  );
}

// Fresh directory under the system temp dir, unique per call
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
  static std::mt19937_64 gen(std::random_device{}());
  auto path = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
     "_" + std::to_string(gen()));
  std::filesystem::create_directories(path);
  return path;
}

// Deterministic pseudo-random payload
inline std::vector<uint8_t> make_bytes(std::size_t size, uint32_t seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<uint8_t> bytes(size);
  for (auto& byte : bytes) {
    byte = static_cast<uint8_t>(dist(gen));
  }
  return bytes;
}

inline std::vector<uint8_t> to_bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

class MockStorageBackend : public fslite::storage::StorageBackend {
public:
  MOCK_METHOD(void, write, (const std::string& node, const std::string& name,
                            const std::vector<uint8_t>& bytes), (override));
  MOCK_METHOD(std::vector<uint8_t>, read, (const std::string& node, const std::string& name), (override));
  MOCK_METHOD(bool, exists, (const std::string& node, const std::string& name), (override));
  MOCK_METHOD(bool, remove, (const std::string& node, const std::string& name), (override));
};

#endif // FSLITE_TEST_UTILS_HPP
