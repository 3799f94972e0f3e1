#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "fslite/node/node_registry.hpp"
#include "test_utils.hpp"

using namespace fslite::node;

class NodeRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
    registry = std::make_unique<NodeRegistry>(std::vector<std::string>{"node_1", "node_2", "node_3", "node_4"});
  }

  std::unique_ptr<NodeRegistry> registry;
};

TEST_F(NodeRegistryTest, OrderIsStable) {
  const std::vector<std::string> expected = {"node_1", "node_2", "node_3", "node_4"};
  EXPECT_EQ(registry->list_nodes(), expected);

  registry->set_available("node_2", false);
  registry->set_available("node_2", true);
  EXPECT_EQ(registry->list_nodes(), expected);
  EXPECT_EQ(registry->size(), 4u);
}

TEST_F(NodeRegistryTest, AllNodesStartAvailable) {
  for (const auto& name : registry->list_nodes()) {
    EXPECT_TRUE(registry->is_available(name)) << name;
  }
  EXPECT_EQ(registry->available_nodes().size(), 4u);
}

TEST_F(NodeRegistryTest, SetAndToggle) {
  registry->set_available("node_3", false);
  EXPECT_FALSE(registry->is_available("node_3"));
  EXPECT_EQ(registry->available_nodes(), (std::vector<std::string>{"node_1", "node_2", "node_4"}));

  EXPECT_TRUE(registry->toggle("node_3"));
  EXPECT_TRUE(registry->is_available("node_3"));
  EXPECT_FALSE(registry->toggle("node_1"));
  EXPECT_FALSE(registry->is_available("node_1"));
}

TEST_F(NodeRegistryTest, UnknownNode) {
  EXPECT_FALSE(registry->has_node("node_9"));
  EXPECT_THROW(registry->is_available("node_9"), std::out_of_range);
  EXPECT_THROW(registry->set_available("node_9", false), std::out_of_range);
  EXPECT_THROW(registry->toggle("node_9"), std::out_of_range);
}

TEST_F(NodeRegistryTest, HealthSummary) {
  auto healthy = registry->health_summary();
  EXPECT_DOUBLE_EQ(healthy.available_fraction, 1.0);
  EXPECT_EQ(healthy.mesh_health, 100);
  ASSERT_EQ(healthy.nodes.size(), 4u);
  EXPECT_EQ(healthy.nodes[0].name, "node_1");

  registry->set_available("node_4", false);
  auto degraded = registry->health_summary();
  EXPECT_DOUBLE_EQ(degraded.available_fraction, 0.75);
  EXPECT_EQ(degraded.mesh_health, 75);
  EXPECT_FALSE(degraded.nodes[3].available);
}

TEST_F(NodeRegistryTest, HealthRoundsDown) {
  NodeRegistry three(std::vector<std::string>{"a", "b", "c"});
  three.set_available("c", false);
  EXPECT_EQ(three.health_summary().mesh_health, 66);
}

TEST(NodeRegistryConstructionTest, EmptyRegistryReportsZeroHealth) {
  NodeRegistry empty(std::vector<std::string>{});
  auto summary = empty.health_summary();
  EXPECT_TRUE(summary.nodes.empty());
  EXPECT_DOUBLE_EQ(summary.available_fraction, 0.0);
  EXPECT_EQ(summary.mesh_health, 0);
}

TEST(NodeRegistryConstructionTest, RejectsDuplicatesAndEmptyNames) {
  const std::vector<std::string> duplicated = {"a", "b", "a"};
  const std::vector<std::string> unnamed = {"a", ""};
  EXPECT_THROW(NodeRegistry registry(duplicated), std::invalid_argument);
  EXPECT_THROW(NodeRegistry registry(unnamed), std::invalid_argument);
}

TEST_F(NodeRegistryTest, ConcurrentTogglesAndReads) {
  const int iterations = 1000;
  std::atomic<bool> stop{false};
  std::vector<std::thread> threads;

  // Each toggler flips its node an even number of times
  for (const auto& name : registry->list_nodes()) {
    threads.emplace_back([this, name, iterations]() {
      for (int i = 0; i < iterations * 2; ++i) {
        registry->toggle(name);
      }
    });
  }

  std::thread reader([this, &stop]() {
    while (!stop) {
      auto summary = registry->health_summary();
      ASSERT_EQ(summary.nodes.size(), 4u);
      ASSERT_GE(summary.mesh_health, 0);
      ASSERT_LE(summary.mesh_health, 100);
    }
  });

  for (auto& thread : threads) {
    thread.join();
  }
  stop = true;
  reader.join();

  EXPECT_EQ(registry->health_summary().mesh_health, 100);
}
