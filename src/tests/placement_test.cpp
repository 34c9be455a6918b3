#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include "store/placement.hpp"

using namespace crystal::store;

TEST(PlacementTest, ModuloRoundRobin) {
  ModuloPlacement placement;
  EXPECT_STREQ(placement.name(), "modulo");
  for (uint64_t index = 0; index < 12; ++index) {
    EXPECT_EQ(placement.node_for("object", index, 3), index % 3);
  }
}

TEST(PlacementTest, HashedStaysInRangeAndIsStable) {
  HashedPlacement placement;
  EXPECT_STREQ(placement.name(), "hashed");

  for (uint64_t index = 0; index < 20; ++index) {
    uint32_t node = placement.node_for("report.pdf", index, 5);
    EXPECT_LT(node, 5u);
    EXPECT_EQ(node, placement.node_for("report.pdf", index, 5));
  }
}

TEST(PlacementTest, HashedRotatesConsecutiveIndices) {
  HashedPlacement placement;
  uint32_t first = placement.node_for("object", 0, 4);
  for (uint64_t index = 1; index < 8; ++index) {
    EXPECT_EQ(placement.node_for("object", index, 4), (first + index) % 4);
  }
}

TEST(PlacementTest, HashedSpreadsFirstFragments) {
  HashedPlacement placement;
  std::set<uint32_t> nodes;
  for (int i = 0; i < 64; ++i) {
    nodes.insert(placement.node_for("object-" + std::to_string(i), 0, 4));
  }
  EXPECT_GT(nodes.size(), 1u);
}

TEST(PlacementTest, ZeroNodesRejected) {
  ModuloPlacement modulo;
  HashedPlacement hashed;
  EXPECT_THROW(modulo.node_for("object", 0, 0), std::invalid_argument);
  EXPECT_THROW(hashed.node_for("object", 0, 0), std::invalid_argument);
}

TEST(PlacementTest, Factory) {
  auto modulo = make_placement("modulo");
  ASSERT_NE(modulo, nullptr);
  EXPECT_STREQ(modulo->name(), "modulo");

  auto hashed = make_placement("hashed");
  ASSERT_NE(hashed, nullptr);
  EXPECT_STREQ(hashed->name(), "hashed");

  EXPECT_EQ(make_placement("random"), nullptr);
}
