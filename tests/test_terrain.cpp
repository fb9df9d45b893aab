#include <catch2/catch_test_macros.hpp>

#include "map/path_planner.hpp"
#include "map/terrain_cost.hpp"
#include "map/terrain_generator.hpp"
#include "map/terrain_grid.hpp"

#include <algorithm>
#include <cmath>

using namespace rsim;
using namespace rsim::map;

// ================================================================
// Cost table
// ================================================================

TEST_CASE("Terrain cost table", "[terrain]") {
    CHECK(terrain_cost(TerrainCell::Clear) == 1.0);
    CHECK(terrain_cost(TerrainCell::Sand) == 2.0);
    CHECK(terrain_cost(TerrainCell::Rocks) == 3.0);
    CHECK(std::isinf(terrain_cost(TerrainCell::Obstacle)));
    CHECK(terrain_cost(TerrainCell::RoverMarker) == 1.0);
    CHECK(terrain_cost(TerrainCell::GoalMarker) == 1.0);

    CHECK(speed_factor(TerrainCell::Clear) == 1.0);
    CHECK(speed_factor(TerrainCell::Sand) == 0.7);
    CHECK(speed_factor(TerrainCell::Rocks) == 0.5);
    CHECK(speed_factor(TerrainCell::GoalMarker) == 1.0);
}

TEST_CASE("Terrain class names map both ways", "[terrain]") {
    for (u32 i = 0; i < TERRAIN_CELL_COUNT; ++i) {
        auto cell = static_cast<TerrainCell>(i);
        auto back = terrain_cell_from_name(terrain_cell_name(cell));
        REQUIRE(back.has_value());
        CHECK(*back == cell);
    }
    CHECK_FALSE(terrain_cell_from_name("Lava").has_value());
}

// ================================================================
// Grid accessors
// ================================================================

TEST_CASE("TerrainGrid accessors are bounds checked", "[terrain]") {
    TerrainGrid grid(10);

    REQUIRE(grid.set({3, 4}, TerrainCell::Sand).ok());
    auto cell = grid.at({3, 4});
    REQUIRE(cell.ok());
    CHECK(cell.value() == TerrainCell::Sand);

    auto oob = grid.at({10, 0});
    REQUIRE_FALSE(oob.ok());
    CHECK(oob.error().code == ErrorCode::OutOfBounds);

    auto neg = grid.set({-1, 2}, TerrainCell::Rocks);
    REQUIRE_FALSE(neg.ok());
    CHECK(neg.error().code == ErrorCode::OutOfBounds);

    // Failed write leaves the grid untouched
    CHECK(grid.count(TerrainCell::Rocks) == 0);
}

TEST_CASE("TerrainGrid markers restore the terrain underneath", "[terrain]") {
    TerrainGrid grid(10);
    REQUIRE(grid.set({2, 2}, TerrainCell::Sand).ok());

    REQUIRE(grid.mark({2, 2}, TerrainCell::RoverMarker).ok());
    CHECK(grid.get({2, 2}) == TerrainCell::RoverMarker);
    CHECK(grid.base({2, 2}) == TerrainCell::Sand);
    CHECK(grid.cost_at({2, 2}) == 1.0);

    REQUIRE(grid.clear_marker({2, 2}).ok());
    CHECK(grid.get({2, 2}) == TerrainCell::Sand);

    auto not_marker = grid.mark({1, 1}, TerrainCell::Rocks);
    REQUIRE_FALSE(not_marker.ok());
    CHECK(not_marker.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("TerrainGrid connectivity check", "[terrain]") {
    TerrainGrid grid(10);
    CHECK(grid.is_connected(grid.start(), grid.goal()));

    for (i32 x = 0; x < 10; ++x) {
        REQUIRE(grid.set({x, 4}, TerrainCell::Obstacle).ok());
    }
    CHECK_FALSE(grid.is_connected(grid.start(), grid.goal()));

    // One gap is enough, diagonals count
    REQUIRE(grid.set({7, 4}, TerrainCell::Clear).ok());
    CHECK(grid.is_connected(grid.start(), grid.goal()));
}

// ================================================================
// Generation
// ================================================================

TEST_CASE("Terrain generation is deterministic per seed", "[terrain]") {
    auto a = generate_terrain(10, 1234);
    auto b = generate_terrain(10, 1234);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    CHECK(a.value() == b.value());

    auto c = generate_terrain(32, 99);
    auto d = generate_terrain(32, 99);
    REQUIRE(c.ok());
    REQUIRE(d.ok());
    CHECK(c.value() == d.value());
}

TEST_CASE("Different seeds give different terrain", "[terrain]") {
    auto a = generate_terrain(24, 1);
    auto b = generate_terrain(24, 2);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    CHECK(a.value() != b.value());
}

TEST_CASE("Terrain generation rejects small grids", "[terrain]") {
    auto r = generate_terrain(9, 1);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Noise field is normalized", "[terrain]") {
    auto field = smoothed_noise_field(16, 5);
    REQUIRE(field.size() == 256);
    f64 mn = 1.0, mx = 0.0;
    for (f64 v : field) {
        mn = std::min(mn, v);
        mx = std::max(mx, v);
    }
    CHECK(mn == 0.0);
    CHECK(mx == 1.0);
}

TEST_CASE("Generated terrain keeps start and goal areas clear", "[terrain]") {
    for (u64 seed = 0; seed < 50; ++seed) {
        auto r = generate_terrain(16, seed);
        REQUIRE(r.ok());
        const auto& grid = r.value();

        for (const Coord& anchor : {grid.start(), grid.goal()}) {
            for (i32 dy = -2; dy <= 2; ++dy) {
                for (i32 dx = -2; dx <= 2; ++dx) {
                    Coord c{anchor.x + dx, anchor.y + dy};
                    if (!grid.in_bounds(c)) continue;
                    CHECK(grid.get(c) == TerrainCell::Clear);
                }
            }
        }
    }
}

TEST_CASE("Generated terrain has no obstacles in the central cross",
          "[terrain]") {
    const u32 size = 24;
    const i32 center = size / 2;
    const i32 width = std::max<i32>(2, size / 8);
    for (u64 seed = 0; seed < 20; ++seed) {
        auto r = generate_terrain(size, seed);
        REQUIRE(r.ok());
        const auto& grid = r.value();
        for (i32 band = center - width / 2; band < center + width / 2; ++band) {
            for (i32 i = 0; i < static_cast<i32>(size); ++i) {
                CHECK(grid.get({i, band}) != TerrainCell::Obstacle);
                CHECK(grid.get({band, i}) != TerrainCell::Obstacle);
            }
        }
    }
}

TEST_CASE("Generated terrain always connects start and goal", "[terrain]") {
    for (u64 seed = 0; seed < 1000; ++seed) {
        auto r = generate_terrain(20, seed);
        REQUIRE(r.ok());
        const auto& grid = r.value();
        REQUIRE(grid.is_connected(grid.start(), grid.goal()));

        auto path = PathPlanner::find_path(grid, grid.start(), grid.goal(),
                                           PathAlgorithm::AStar);
        REQUIRE(path.ok());
        REQUIRE(path.value().found);
        CHECK(path.value().plan.cells.front() == grid.start());
        CHECK(path.value().plan.cells.back() == grid.goal());
    }
}
