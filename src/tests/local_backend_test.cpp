#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include "fslite/storage/local_backend.hpp"
#include "test_utils.hpp"

using namespace fslite::storage;

class LocalBackendTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<LocalBackend> backend;
  const std::vector<std::string> nodes = {"node_1", "node_2", "node_3"};

  void SetUp() override {
    init_test_logging();
    test_dir = make_temp_dir("local_backend_test");
    backend = std::make_unique<LocalBackend>(test_dir.string(), nodes);
    ASSERT_NE(backend, nullptr);
  }

  void TearDown() override {
    backend.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void write_and_verify(const std::string& node, const std::string& name, const std::vector<uint8_t>& data) {
    ASSERT_NO_THROW(backend->write(node, name, data)) << "Failed to write " << node << "/" << name;
    ASSERT_TRUE(backend->exists(node, name)) << "Blob should exist after writing: " << name;
    std::vector<uint8_t> output;
    ASSERT_NO_THROW(output = backend->read(node, name)) << "Failed to read " << node << "/" << name;
    ASSERT_EQ(output, data) << "Data mismatch for " << node << "/" << name;
  }
};

TEST_F(LocalBackendTest, CreatesOneDirectoryPerNode) {
  for (const auto& node : nodes) {
    EXPECT_TRUE(std::filesystem::is_directory(test_dir / node)) << node;
  }
}

TEST_F(LocalBackendTest, BasicOperations) {
  write_and_verify("node_1", "abc.part0", to_bytes("Hello, node!"));

  // Blob lands at {root}/{node}/{name} for manual inspection
  EXPECT_TRUE(std::filesystem::exists(test_dir / "node_1" / "abc.part0"));
  EXPECT_EQ(backend->blob_path("node_1", "abc.part0"), test_dir / "node_1" / "abc.part0");

  // Same name on a different node is a different blob
  EXPECT_FALSE(backend->exists("node_2", "abc.part0"));
}

TEST_F(LocalBackendTest, BinaryAndLargeData) {
  write_and_verify("node_2", "binary.part0", std::vector<uint8_t>{0x00, 0xFF, 0x00, 0x0A, 0x0D});
  write_and_verify("node_3", "large.part0", make_bytes(3 * 1024 * 1024));
}

TEST_F(LocalBackendTest, OverwriteReplacesContent) {
  write_and_verify("node_1", "blob", make_bytes(4096));
  write_and_verify("node_1", "blob", to_bytes("short"));
  EXPECT_EQ(std::filesystem::file_size(test_dir / "node_1" / "blob"), 5u);
}

TEST_F(LocalBackendTest, MissingBlob) {
  EXPECT_FALSE(backend->exists("node_1", "missing.part0"));
  EXPECT_THROW(backend->read("node_1", "missing.part0"), StoreError);
  EXPECT_FALSE(backend->remove("node_1", "missing.part0"));
}

TEST_F(LocalBackendTest, RemoveAndList) {
  write_and_verify("node_1", "b.part1", to_bytes("1"));
  write_and_verify("node_1", "a.part0", to_bytes("0"));
  EXPECT_EQ(backend->list("node_1"), (std::vector<std::string>{"a.part0", "b.part1"}));

  EXPECT_TRUE(backend->remove("node_1", "a.part0"));
  EXPECT_FALSE(backend->exists("node_1", "a.part0"));
  EXPECT_EQ(backend->list("node_1"), (std::vector<std::string>{"b.part1"}));

  backend->clear();
  EXPECT_TRUE(backend->list("node_1").empty());
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "node_1"));
}

TEST_F(LocalBackendTest, RejectsUnknownNodesAndUnsafeNames) {
  EXPECT_THROW(backend->write("node_9", "x", to_bytes("data")), StoreError);
  EXPECT_THROW(backend->read("node_9", "x"), StoreError);

  const std::vector<std::string> unsafe = {"", ".", "..", "../escape", "a/b", "a\\b"};
  for (const auto& name : unsafe) {
    EXPECT_THROW(backend->write("node_1", name, to_bytes("data")), StoreError) << "name: " << name;
  }
  EXPECT_FALSE(std::filesystem::exists(test_dir / "escape"));
}

TEST_F(LocalBackendTest, CorruptionOnDiskIsVisible) {
  write_and_verify("node_1", "blob", to_bytes("original"));
  {
    std::fstream file(test_dir / "node_1" / "blob", std::ios::in | std::ios::out | std::ios::binary);
    file.seekp(0);
    file.put('X');
  }
  EXPECT_EQ(backend->read("node_1", "blob"), to_bytes("Xriginal"));
}

TEST_F(LocalBackendTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          const std::string& node = nodes[(i + j) % nodes.size()];
          std::string name = "concurrent_" + std::to_string(i) + "_" + std::to_string(j);
          auto data = to_bytes("Data for " + name);
          backend->write(node, name, data);
          if (backend->read(node, name) == data) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
}
