#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "fslite/registry/file_registry.hpp"
#include "fslite/checksum/checksum.hpp"
#include "test_utils.hpp"

using namespace fslite;
using fslite::registry::FileRegistry;

namespace {

engine::FileRecord make_record(const std::string& id, const std::string& filename, std::size_t count) {
  std::vector<engine::Fragment> fragments;
  for (std::size_t i = 0; i < count; ++i) {
    fragments.emplace_back(i, "node_" + std::to_string(i % 5 + 1), engine::make_blob_name(id, i),
                           checksum::fingerprint(std::string("part") + std::to_string(i)), 10);
  }
  return engine::FileRecord(id, filename, fragments);
}

} // namespace

class FileRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  FileRegistry registry;
};

TEST_F(FileRegistryTest, AddAndGet) {
  EXPECT_TRUE(registry.add(make_record("b2", "notes.txt", 3)));
  EXPECT_TRUE(registry.has("b2"));
  EXPECT_EQ(registry.size(), 1u);

  auto record = registry.get("b2");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->filename, "notes.txt");
  EXPECT_EQ(record->fragments.size(), 3u);
  EXPECT_EQ(record->total_size(), 30u);
}

TEST_F(FileRegistryTest, DuplicateIdRejected) {
  ASSERT_TRUE(registry.add(make_record("same", "first.bin", 1)));
  EXPECT_FALSE(registry.add(make_record("same", "second.bin", 2)));
  EXPECT_EQ(registry.get("same")->filename, "first.bin");
}

TEST_F(FileRegistryTest, UnknownId) {
  EXPECT_FALSE(registry.has("missing"));
  EXPECT_FALSE(registry.get("missing").has_value());
  EXPECT_FALSE(registry.remove("missing"));
}

TEST_F(FileRegistryTest, RemoveDropsRecord) {
  registry.add(make_record("gone", "a.bin", 2));
  EXPECT_TRUE(registry.remove("gone"));
  EXPECT_FALSE(registry.has("gone"));
  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(FileRegistryTest, ListIsSortedById) {
  registry.add(make_record("cc", "third.bin", 1));
  registry.add(make_record("aa", "first.bin", 4));
  registry.add(make_record("bb", "second.bin", 2));

  auto summaries = registry.list();
  ASSERT_EQ(summaries.size(), 3u);
  EXPECT_EQ(summaries[0].id, "aa");
  EXPECT_EQ(summaries[0].filename, "first.bin");
  EXPECT_EQ(summaries[0].size, 40u);
  EXPECT_EQ(summaries[0].fragments, 4u);
  EXPECT_EQ(summaries[1].id, "bb");
  EXPECT_EQ(summaries[2].id, "cc");
}

TEST_F(FileRegistryTest, ConcurrentAdds) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < 50; ++i) {
        registry.add(make_record(std::to_string(t) + "_" + std::to_string(i), "f", 1));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(registry.size(), 200u);
}
