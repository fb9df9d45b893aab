#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "map/path_planner.hpp"
#include "map/terrain_generator.hpp"
#include "map/terrain_grid.hpp"

#include <cmath>

using namespace rsim;
using namespace rsim::map;
using Catch::Matchers::WithinAbs;

namespace {

/// Every step is an 8-neighbour move and no cell is an obstacle.
void check_plan_valid(const TerrainGrid& grid, const PathPlan& plan,
                      const Coord& start, const Coord& goal) {
    REQUIRE_FALSE(plan.empty());
    CHECK(plan.cells.front() == start);
    CHECK(plan.cells.back() == goal);
    for (size_t i = 0; i < plan.cells.size(); ++i) {
        CHECK(grid.get(plan.cells[i]) != TerrainCell::Obstacle);
        if (i > 0) {
            CHECK(is_adjacent(plan.cells[i - 1], plan.cells[i]));
            CHECK(plan.cells[i - 1] != plan.cells[i]);
        }
    }
}

} // namespace

TEST_CASE("Planner finds a path on clear terrain", "[planner]") {
    TerrainGrid grid(10);
    auto r = PathPlanner::find_path(grid, {0, 0}, {9, 9}, PathAlgorithm::AStar);
    REQUIRE(r.ok());
    REQUIRE(r.value().found);
    check_plan_valid(grid, r.value().plan, {0, 0}, {9, 9});

    // Straight diagonal is optimal
    CHECK(r.value().plan.length() == 10);
    CHECK_THAT(r.value().plan.total_cost, WithinAbs(9 * std::sqrt(2.0), 1e-9));
    CHECK(r.value().plan.compute_seconds >= 0.0);
}

TEST_CASE("Planner reports no path across a wall", "[planner]") {
    TerrainGrid grid(10);
    for (i32 x = 0; x < 10; ++x) {
        REQUIRE(grid.set({x, 4}, TerrainCell::Obstacle).ok());
    }

    for (auto algo : {PathAlgorithm::AStar, PathAlgorithm::Dijkstra,
                      PathAlgorithm::EnergyEfficient}) {
        auto r = PathPlanner::find_path(grid, {0, 0}, {9, 9}, algo);
        REQUIRE(r.ok()); // not an error
        CHECK_FALSE(r.value().found);
        CHECK(r.value().plan.empty());
        CHECK(std::isinf(r.value().plan.total_cost));
    }
}

TEST_CASE("Planner takes the direct diagonal step", "[planner]") {
    TerrainGrid grid(10);
    auto r = PathPlanner::find_path(grid, {0, 0}, {1, 1}, "A*");
    REQUIRE(r.ok());
    REQUIRE(r.value().found);

    const auto& plan = r.value().plan;
    REQUIRE(plan.length() == 2);
    CHECK(plan.cells[0] == Coord{0, 0});
    CHECK(plan.cells[1] == Coord{1, 1});
    CHECK_THAT(plan.total_cost, WithinAbs(1.4142, 0.1));
}

TEST_CASE("Planner avoids obstacles", "[planner]") {
    TerrainGrid grid(10);
    REQUIRE(grid.set({1, 1}, TerrainCell::Obstacle).ok());

    auto r = PathPlanner::find_path(grid, {0, 0}, {2, 2}, PathAlgorithm::AStar);
    REQUIRE(r.ok());
    REQUIRE(r.value().found);
    check_plan_valid(grid, r.value().plan, {0, 0}, {2, 2});
    for (const auto& c : r.value().plan.cells) {
        CHECK(c != Coord{1, 1});
    }
}

TEST_CASE("Planner never routes through obstacles on generated terrain",
          "[planner]") {
    for (u64 seed = 0; seed < 25; ++seed) {
        auto g = generate_terrain(20, seed);
        REQUIRE(g.ok());
        const auto& grid = g.value();
        for (auto algo : {PathAlgorithm::AStar, PathAlgorithm::Dijkstra,
                          PathAlgorithm::EnergyEfficient}) {
            auto r = PathPlanner::find_path(grid, grid.start(), grid.goal(),
                                            algo);
            REQUIRE(r.ok());
            REQUIRE(r.value().found);
            check_plan_valid(grid, r.value().plan, grid.start(), grid.goal());
        }
    }
}

TEST_CASE("A* and Dijkstra agree on optimal cost", "[planner]") {
    for (u64 seed = 100; seed < 120; ++seed) {
        auto g = generate_terrain(20, seed);
        REQUIRE(g.ok());
        const auto& grid = g.value();
        auto a = PathPlanner::find_path(grid, grid.start(), grid.goal(),
                                        PathAlgorithm::AStar);
        auto d = PathPlanner::find_path(grid, grid.start(), grid.goal(),
                                        PathAlgorithm::Dijkstra);
        REQUIRE(a.ok());
        REQUIRE(d.ok());
        REQUIRE(a.value().found);
        REQUIRE(d.value().found);
        CHECK_THAT(a.value().plan.total_cost,
                   WithinAbs(d.value().plan.total_cost, 1e-9));
    }
}

TEST_CASE("Energy-efficient planner is no costlier around a rock field",
          "[planner]") {
    TerrainGrid grid(10);
    for (i32 y = 3; y < 7; ++y) {
        for (i32 x = 3; x < 7; ++x) {
            REQUIRE(grid.set({x, y}, TerrainCell::Rocks).ok());
        }
    }

    auto normal = PathPlanner::find_path(grid, {0, 0}, {9, 9},
                                         PathAlgorithm::AStar);
    auto efficient = PathPlanner::find_path(grid, {0, 0}, {9, 9},
                                            PathAlgorithm::EnergyEfficient);
    REQUIRE(normal.ok());
    REQUIRE(efficient.ok());
    REQUIRE(normal.value().found);
    REQUIRE(efficient.value().found);

    CHECK(efficient.value().plan.total_cost <=
          normal.value().plan.total_cost + 1e-9);
    for (const auto& c : efficient.value().plan.cells) {
        CHECK(grid.get(c) != TerrainCell::Rocks);
    }
}

TEST_CASE("Energy-efficient planner pays squared terrain cost", "[planner]") {
    TerrainGrid grid(10, TerrainCell::Sand);
    auto r = PathPlanner::find_path(grid, {0, 0}, {3, 0},
                                    PathAlgorithm::EnergyEfficient);
    REQUIRE(r.ok());
    REQUIRE(r.value().found);
    // Three cardinal steps onto sand: 3 * 1.0 * 2^2
    CHECK_THAT(r.value().plan.total_cost, WithinAbs(12.0, 1e-9));

    auto plain = PathPlanner::find_path(grid, {0, 0}, {3, 0},
                                        PathAlgorithm::AStar);
    REQUIRE(plain.ok());
    CHECK_THAT(plain.value().plan.total_cost, WithinAbs(6.0, 1e-9));
}

TEST_CASE("Planner handles a blocked goal as no path", "[planner]") {
    TerrainGrid grid(10);
    REQUIRE(grid.set({9, 9}, TerrainCell::Obstacle).ok());
    auto r = PathPlanner::find_path(grid, {0, 0}, {9, 9}, PathAlgorithm::AStar);
    REQUIRE(r.ok());
    CHECK_FALSE(r.value().found);
}

TEST_CASE("Planner returns a single cell when start is goal", "[planner]") {
    TerrainGrid grid(10);
    auto r = PathPlanner::find_path(grid, {4, 4}, {4, 4},
                                    PathAlgorithm::Dijkstra);
    REQUIRE(r.ok());
    REQUIRE(r.value().found);
    REQUIRE(r.value().plan.length() == 1);
    CHECK(r.value().plan.total_cost == 0.0);
}

TEST_CASE("Planner rejects out-of-range endpoints", "[planner]") {
    TerrainGrid grid(10);
    auto bad_start = PathPlanner::find_path(grid, {-1, 0}, {9, 9},
                                            PathAlgorithm::AStar);
    REQUIRE_FALSE(bad_start.ok());
    CHECK(bad_start.error().code == ErrorCode::OutOfBounds);

    auto bad_goal = PathPlanner::find_path(grid, {0, 0}, {10, 10},
                                           PathAlgorithm::AStar);
    REQUIRE_FALSE(bad_goal.ok());
    CHECK(bad_goal.error().code == ErrorCode::OutOfBounds);
}

TEST_CASE("Algorithm names parse at the string boundary", "[planner]") {
    CHECK(parse_algorithm("A*").value() == PathAlgorithm::AStar);
    CHECK(parse_algorithm("Dijkstra").value() == PathAlgorithm::Dijkstra);
    CHECK(parse_algorithm("EnergyEfficient").value() ==
          PathAlgorithm::EnergyEfficient);
    CHECK(parse_algorithm("Energy Efficient").value() ==
          PathAlgorithm::EnergyEfficient);

    auto bad = parse_algorithm("BFS");
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().code == ErrorCode::UnknownAlgorithm);

    TerrainGrid grid(10);
    auto r = PathPlanner::find_path(grid, {0, 0}, {9, 9}, "Greedy");
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::UnknownAlgorithm);

    for (auto algo : {PathAlgorithm::AStar, PathAlgorithm::Dijkstra,
                      PathAlgorithm::EnergyEfficient}) {
        CHECK(parse_algorithm(algorithm_name(algo)).value() == algo);
    }
}

TEST_CASE("Planner output is reproducible", "[planner]") {
    auto g = generate_terrain(30, 77);
    REQUIRE(g.ok());
    const auto& grid = g.value();
    auto a = PathPlanner::find_path(grid, grid.start(), grid.goal(),
                                    PathAlgorithm::EnergyEfficient);
    auto b = PathPlanner::find_path(grid, grid.start(), grid.goal(),
                                    PathAlgorithm::EnergyEfficient);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    CHECK(a.value().plan.cells == b.value().plan.cells);
    CHECK(a.value().plan.total_cost == b.value().plan.total_cost);
}
