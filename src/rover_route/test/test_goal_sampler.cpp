#include "rover_route/goal_sampler.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <set>
#include <stdexcept>
#include <vector>

namespace {

rover_route::MapInfo MakeInfo(int width, int height, double resolution = 1.0,
                              double x0 = 0.0, double y0 = 0.0, double yaw = 0.0)
{
  rover_route::MapInfo info;
  info.width = width;
  info.height = height;
  info.resolution = resolution;
  info.origin = Eigen::Vector2d(x0, y0);
  info.yaw = yaw;
  return info;
}

}  // namespace

TEST_CASE("ravelIndex is a bijection onto the flat grid", "[sampler]")
{
  const int width = 7;
  const int height = 4;
  rover_route::GoalSampler sampler(MakeInfo(width, height), std::vector<int8_t>(width * height, 0));

  std::set<int> seen;
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      int index = sampler.ravelIndex(x, y);
      CHECK(index >= 0);
      CHECK(index < width * height);
      seen.insert(index);
    }
  }
  CHECK(seen.size() == static_cast<std::size_t>(width * height));
  CHECK(sampler.ravelIndex(3, 2) == 2 * width + 3);
}

TEST_CASE("gridToWorld with identity origin only scales by resolution", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(10, 10, 0.05), std::vector<int8_t>(100, 0));

  Eigen::Vector2d world = sampler.gridToWorld(4, 7);
  CHECK(world.x() == 0.05 * 4);
  CHECK(world.y() == 0.05 * 7);
}

TEST_CASE("gridToWorld rotates by yaw then translates by origin", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(10, 10, 0.5, -3.0, 2.0, M_PI / 2.0), std::vector<int8_t>(100, 0));

  // 旋转 90 度: (0.5*2, 0.5*1) -> (-0.5, 1.0)
  Eigen::Vector2d world = sampler.gridToWorld(2, 1);
  CHECK(world.x() == Catch::Approx(-3.5));
  CHECK(world.y() == Catch::Approx(3.0));
}

TEST_CASE("worldToGrid inverts gridToWorld", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(20, 30, 0.1, 1.5, -2.25, 0.7), std::vector<int8_t>(600, 0));

  for (int y = 0; y < 30; y += 3) {
    for (int x = 0; x < 20; x += 4) {
      Eigen::Vector2d cell = sampler.worldToGrid(sampler.gridToWorld(x, y));
      CHECK(cell.x() == Catch::Approx(x).margin(1e-9));
      CHECK(cell.y() == Catch::Approx(y).margin(1e-9));
    }
  }
}

TEST_CASE("isRegionClean rejects occupied and unknown cells inside the window", "[sampler]")
{
  const int width = 20;
  const int height = 20;
  std::vector<int8_t> data(width * height, 0);
  data[5 * width + 5] = 100;   // 占据
  data[15 * width + 15] = -1;  // 未知

  rover_route::GoalSampler sampler(MakeInfo(width, height), data);

  // 半宽 max(2, 20/50) = 2
  CHECK_FALSE(sampler.isRegionClean(5, 5));
  CHECK_FALSE(sampler.isRegionClean(7, 7));
  CHECK_FALSE(sampler.isRegionClean(3, 5));
  CHECK(sampler.isRegionClean(8, 5));
  CHECK(sampler.isRegionClean(5, 8));
  CHECK_FALSE(sampler.isRegionClean(13, 15));
  CHECK(sampler.isRegionClean(12, 15));
}

TEST_CASE("isRegionClean clamps the window at the grid border", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(6, 6), std::vector<int8_t>(36, 0));
  CHECK(sampler.isRegionClean(0, 0));
  CHECK(sampler.isRegionClean(5, 5));
  CHECK_FALSE(sampler.isRegionClean(6, 0));
}

TEST_CASE("isRegionClean window grows with the map size", "[sampler]")
{
  const int width = 200;
  const int height = 200;
  std::vector<int8_t> data(width * height, 0);
  data[100 * width + 104] = 100;

  rover_route::GoalSampler sampler(MakeInfo(width, height), data);

  // 半宽 200/50 = 4
  CHECK_FALSE(sampler.isRegionClean(100, 100));
  CHECK(sampler.isRegionClean(99, 100));
}

TEST_CASE("nextGoal on a free 5x5 grid returns a cell-aligned pose", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(5, 5), std::vector<int8_t>(25, 0));

  for (int i = 0; i < 20; ++i) {
    auto goal = sampler.nextGoal();
    REQUIRE(goal.has_value());
    double x = goal->position.x();
    double y = goal->position.y();
    CHECK(x >= 0.0);
    CHECK(x < 5.0);
    CHECK(y >= 0.0);
    CHECK(y < 5.0);
    CHECK(x == std::floor(x));
    CHECK(y == std::floor(y));
    CHECK(goal->position.z() == 0.0);
    CHECK(goal->orientation.w() == Catch::Approx(1.0));
    CHECK(goal->orientation.x() == Catch::Approx(0.0));
    CHECK(goal->orientation.y() == Catch::Approx(0.0));
    CHECK(goal->orientation.z() == Catch::Approx(0.0));
  }
}

TEST_CASE("nextGoal gives up on a fully occupied grid", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(10, 10), std::vector<int8_t>(100, 100));
  CHECK_FALSE(sampler.nextGoal().has_value());
}

TEST_CASE("nextGoal gives up on a fully unknown grid", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(10, 10), std::vector<int8_t>(100, -1));
  CHECK_FALSE(sampler.nextGoal().has_value());
}

TEST_CASE("nextGoal never returns a cell near an obstacle", "[sampler]")
{
  // 左半边有噪点，只有右侧 x >= 14 的区域是干净的
  const int width = 20;
  const int height = 10;
  std::vector<int8_t> data(width * height, 0);
  for (int y = 0; y < height; y += 3) {
    for (int x = 0; x < 12; x += 3) {
      data[y * width + x] = 100;
    }
  }
  rover_route::GoalSampler sampler(MakeInfo(width, height), data);

  int found = 0;
  for (int i = 0; i < 50; ++i) {
    auto goal = sampler.nextGoal();
    if (!goal) {
      continue;
    }
    ++found;
    int x = static_cast<int>(goal->position.x());
    int y = static_cast<int>(goal->position.y());
    CHECK(x >= 12);
    CHECK(sampler.isRegionClean(x, y));
  }
  CHECK(found > 0);
}

TEST_CASE("GoalSampler rejects a snapshot with the wrong size", "[sampler]")
{
  CHECK_THROWS_AS(rover_route::GoalSampler(MakeInfo(4, 4), std::vector<int8_t>(15, 0)), std::invalid_argument);
}

TEST_CASE("nextGoal on an empty map reports no goal", "[sampler]")
{
  rover_route::GoalSampler sampler(MakeInfo(0, 0), std::vector<int8_t>());
  CHECK_FALSE(sampler.nextGoal().has_value());
}
