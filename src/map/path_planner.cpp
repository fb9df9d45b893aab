#include "map/path_planner.hpp"
#include "map/terrain_grid.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <spdlog/spdlog.h>
#include <tuple>

namespace rsim::map {

static constexpr f64 INF = std::numeric_limits<f64>::infinity();
static constexpr u32 NO_PARENT = std::numeric_limits<u32>::max();

static f64 euclidean(const Coord& a, const Coord& b) {
    f64 dx = static_cast<f64>(a.x - b.x);
    f64 dy = static_cast<f64>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

/// Step cost of entering a cell with the given terrain cost.
static f64 step_cost(PathAlgorithm algorithm, f64 base, f64 terrain) {
    if (algorithm == PathAlgorithm::EnergyEfficient) {
        return base * terrain * terrain;
    }
    return base * terrain;
}

/// Frontier priority for a neighbour reached at cost g.
static f64 priority(PathAlgorithm algorithm, f64 g, const Coord& n,
                    const Coord& goal, f64 terrain) {
    switch (algorithm) {
    case PathAlgorithm::AStar: return g + euclidean(n, goal);
    case PathAlgorithm::Dijkstra: return g;
    case PathAlgorithm::EnergyEfficient:
        return g + euclidean(n, goal) * terrain;
    }
    return g;
}

const char* algorithm_name(PathAlgorithm algorithm) {
    switch (algorithm) {
    case PathAlgorithm::AStar: return "A*";
    case PathAlgorithm::Dijkstra: return "Dijkstra";
    case PathAlgorithm::EnergyEfficient: return "EnergyEfficient";
    }
    return "Unknown";
}

Result<PathAlgorithm> parse_algorithm(std::string_view name) {
    if (name == "A*") return PathAlgorithm::AStar;
    if (name == "Dijkstra") return PathAlgorithm::Dijkstra;
    if (name == "EnergyEfficient" || name == "Energy-Efficient" ||
        name == "Energy Efficient")
        return PathAlgorithm::EnergyEfficient;
    return Error(ErrorCode::UnknownAlgorithm,
                 "Unknown algorithm: " + std::string(name));
}

Result<PathResult> PathPlanner::find_path(const TerrainGrid& grid,
                                          const Coord& start,
                                          const Coord& goal,
                                          std::string_view algorithm) {
    auto parsed = parse_algorithm(algorithm);
    if (!parsed) return parsed.error();
    return find_path(grid, start, goal, parsed.value());
}

Result<PathResult> PathPlanner::find_path(const TerrainGrid& grid,
                                          const Coord& start,
                                          const Coord& goal,
                                          PathAlgorithm algorithm) {
    for (const Coord* c : {&start, &goal}) {
        if (!grid.in_bounds(*c)) {
            return Error(ErrorCode::OutOfBounds,
                         "Path endpoint (" + std::to_string(c->x) + ", " +
                             std::to_string(c->y) + ") outside " +
                             std::to_string(grid.size()) + "x" +
                             std::to_string(grid.size()) + " grid");
        }
    }

    auto t0 = std::chrono::steady_clock::now();
    PathResult result = search(grid, start, goal, algorithm);
    auto t1 = std::chrono::steady_clock::now();
    result.plan.compute_seconds =
        std::chrono::duration<f64>(t1 - t0).count();

    if (result.found) {
        spdlog::debug("Planner[{}]: {} cells, cost {:.3f}, {:.3f} ms",
                      algorithm_name(algorithm), result.plan.length(),
                      result.plan.total_cost,
                      result.plan.compute_seconds * 1000.0);
    } else {
        spdlog::debug("Planner[{}]: no path from ({},{}) to ({},{})",
                      algorithm_name(algorithm), start.x, start.y, goal.x,
                      goal.y);
    }
    return result;
}

PathResult PathPlanner::search(const TerrainGrid& grid, const Coord& start,
                               const Coord& goal, PathAlgorithm algorithm) {
    PathResult result;
    result.plan.total_cost = INF;

    if (!is_passable(grid.get(goal))) return result;

    const u32 n = grid.size();
    const u32 total = n * n;
    auto idx = [n](const Coord& c) -> u32 {
        return static_cast<u32>(c.y) * n + static_cast<u32>(c.x);
    };
    auto coord_of = [n](u32 i) -> Coord {
        return {static_cast<i32>(i % n), static_cast<i32>(i / n)};
    };

    std::vector<f64> cost_so_far(total, INF);
    std::vector<u32> came_from(total, NO_PARENT);

    // (priority, insertion order, node, g at push). Insertion order breaks
    // ties so equal priorities pop first-in-first-out.
    using Entry = std::tuple<f64, u64, u32, f64>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;
    u64 sequence = 0;

    const u32 start_idx = idx(start);
    const u32 goal_idx = idx(goal);
    cost_so_far[start_idx] = 0.0;
    open.push({0.0, sequence++, start_idx, 0.0});

    static constexpr i32 dirs[8][2] = {
        {0, 1}, {1, 0}, {0, -1}, {-1, 0},
        {1, 1}, {-1, -1}, {1, -1}, {-1, 1}
    };

    while (!open.empty()) {
        auto [f, seq, cur_idx, g] = open.top();
        open.pop();

        if (cur_idx == goal_idx) break;
        if (g > cost_so_far[cur_idx]) continue; // superseded entry

        const Coord cur = coord_of(cur_idx);
        for (auto& dir : dirs) {
            Coord next{cur.x + dir[0], cur.y + dir[1]};
            if (!grid.in_bounds(next)) continue;

            const TerrainCell cell = grid.get(next);
            if (!is_passable(cell)) continue;

            const bool diagonal = dir[0] != 0 && dir[1] != 0;
            const f64 base = diagonal ? DIAGONAL_STEP : CARDINAL_STEP;
            const f64 terrain = terrain_cost(cell);
            const f64 new_cost = cost_so_far[cur_idx] +
                                 step_cost(algorithm, base, terrain);

            const u32 n_idx = idx(next);
            if (new_cost < cost_so_far[n_idx]) {
                cost_so_far[n_idx] = new_cost;
                came_from[n_idx] = cur_idx;
                open.push({priority(algorithm, new_cost, next, goal, terrain),
                           sequence++, n_idx, new_cost});
            }
        }
    }

    if (cost_so_far[goal_idx] == INF) return result;

    std::vector<Coord> path;
    for (u32 cur = goal_idx; cur != NO_PARENT; cur = came_from[cur]) {
        path.push_back(coord_of(cur));
        if (cur == start_idx) break;
    }
    std::reverse(path.begin(), path.end());

    result.found = true;
    result.plan.cells = std::move(path);
    result.plan.total_cost = cost_so_far[goal_idx];
    return result;
}

} // namespace rsim::map
