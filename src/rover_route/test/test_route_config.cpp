#include "rover_route/route_config.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <vector>

TEST_CASE("parseRouteMode accepts the three route modes", "[config]")
{
  rover_route::RouteMode mode;
  REQUIRE(rover_route::parseRouteMode("inorder", mode));
  CHECK(mode == rover_route::RouteMode::Sequential);
  REQUIRE(rover_route::parseRouteMode("random", mode));
  CHECK(mode == rover_route::RouteMode::RandomChoice);
  REQUIRE(rover_route::parseRouteMode("dynamic", mode));
  CHECK(mode == rover_route::RouteMode::DynamicSampling);

  CHECK(rover_route::routeModeName(rover_route::RouteMode::RandomChoice) == "random");
}

TEST_CASE("parseRouteMode rejects unknown names", "[config]")
{
  rover_route::RouteMode mode;
  CHECK_FALSE(rover_route::parseRouteMode("", mode));
  CHECK_FALSE(rover_route::parseRouteMode("Inorder", mode));
  CHECK_FALSE(rover_route::parseRouteMode("patrol", mode));
}

TEST_CASE("parsePoses reads stride-7 groups and normalizes orientation", "[config]")
{
  const std::vector<double> flat = {
    1.0, 2.0, 0.0, 0.0, 0.0, 0.0, 2.0,
    -0.5, 3.5, 0.1, 0.0, 0.0, 1.0, 1.0};

  std::vector<rover_route::Pose> poses;
  REQUIRE(rover_route::parsePoses(flat, poses));
  REQUIRE(poses.size() == 2);

  CHECK(poses[0].position.x() == 1.0);
  CHECK(poses[0].position.y() == 2.0);
  CHECK(poses[0].orientation.w() == Catch::Approx(1.0));

  CHECK(poses[1].position.z() == Catch::Approx(0.1));
  CHECK(poses[1].orientation.norm() == Catch::Approx(1.0));
  CHECK(poses[1].orientation.z() == Catch::Approx(std::sqrt(0.5)));
  CHECK(poses[1].orientation.w() == Catch::Approx(std::sqrt(0.5)));
}

TEST_CASE("parsePoses accepts an empty list", "[config]")
{
  std::vector<rover_route::Pose> poses;
  CHECK(rover_route::parsePoses({}, poses));
  CHECK(poses.empty());
}

TEST_CASE("parsePoses rejects malformed lists", "[config]")
{
  std::vector<rover_route::Pose> poses;
  CHECK_FALSE(rover_route::parsePoses({1.0, 2.0, 0.0}, poses));
  CHECK_FALSE(rover_route::parsePoses({1.0, 2.0, 0.0, 0.0, 0.0, 0.0, 0.0}, poses));
  CHECK_FALSE(rover_route::parsePoses(
    {1.0, std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0, 0.0, 0.0, 1.0}, poses));
  CHECK(poses.empty());
}
