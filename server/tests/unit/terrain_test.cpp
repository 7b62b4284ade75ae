#include <gtest/gtest.h>

#include "cuberace/terrain.hpp"
#include "world_fixture.hpp"

using cuberace::Cell;

TEST(TerrainQueryTest, BoundsAreHalfOpen) {
  auto world = cuberace::testing::WorldFromText(
      "R..\n"
      "B.G\n");
  cuberace::TerrainQuery terrain(world);

  EXPECT_TRUE(terrain.InBounds({0, 0}));
  EXPECT_TRUE(terrain.InBounds({2, 1}));
  EXPECT_FALSE(terrain.InBounds({3, 0}));
  EXPECT_FALSE(terrain.InBounds({0, 2}));
  EXPECT_FALSE(terrain.InBounds({-1, 0}));
  EXPECT_FALSE(terrain.InBounds({0, -1}));
}

TEST(TerrainQueryTest, ReportsStaticTerrain) {
  auto world = cuberace::testing::WorldFromText(
      "R#V\n"
      "B.G\n");
  cuberace::TerrainQuery terrain(world);

  EXPECT_TRUE(terrain.IsWall({1, 0}));
  EXPECT_FALSE(terrain.IsWall({2, 0}));
  EXPECT_TRUE(terrain.IsLedge({2, 0}));
  EXPECT_FALSE(terrain.IsLedge({1, 0}));
}

TEST(TerrainQueryTest, BoulderLookupFollowsWorldState) {
  auto world = cuberace::testing::WorldFromText(
      "RO.O\n"
      "B..G\n");
  cuberace::TerrainQuery terrain(world);

  ASSERT_TRUE(terrain.BoulderAt({1, 0}).has_value());
  EXPECT_EQ(*terrain.BoulderAt({1, 0}), 0u);
  EXPECT_EQ(*terrain.BoulderAt({3, 0}), 1u);
  EXPECT_FALSE(terrain.BoulderAt({2, 0}).has_value());

  world.boulders[0] = Cell{2, 0};
  EXPECT_FALSE(terrain.BoulderAt({1, 0}).has_value());
  EXPECT_EQ(*terrain.BoulderAt({2, 0}), 0u);
}

TEST(TerrainQueryTest, CubeLookupCanExcludeMover) {
  auto world = cuberace::testing::WorldFromText(
      "RB.\n"
      "..G\n");
  cuberace::TerrainQuery terrain(world);

  EXPECT_TRUE(terrain.CubeAt({0, 0}, std::nullopt));
  EXPECT_TRUE(terrain.CubeAt({1, 0}, std::nullopt));
  EXPECT_FALSE(terrain.CubeAt({2, 0}, std::nullopt));
  EXPECT_FALSE(terrain.CubeAt({0, 0}, Cell{0, 0}));
  EXPECT_TRUE(terrain.CubeAt({1, 0}, Cell{0, 0}));
}
