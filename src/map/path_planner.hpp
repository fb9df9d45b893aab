#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "map/coord.hpp"

#include <string_view>
#include <vector>

namespace rsim::map {

class TerrainGrid;

/// Cost model used by the search.
enum class PathAlgorithm : u8 {
    AStar,           // terrain-weighted steps, Euclidean heuristic
    Dijkstra,        // same steps, no heuristic
    EnergyEfficient, // squared terrain weight, terrain-scaled heuristic
};

const char* algorithm_name(PathAlgorithm algorithm);

/// Parse "A*", "Dijkstra" or "EnergyEfficient" ("Energy-Efficient" and
/// "Energy Efficient" are accepted too). Anything else is an UnknownAlgorithm error.
Result<PathAlgorithm> parse_algorithm(std::string_view name);

struct PathPlan {
    std::vector<Coord> cells; // start..goal inclusive
    f64 total_cost = 0.0;     // accumulated search cost at the goal
    f64 compute_seconds = 0.0;

    bool empty() const { return cells.empty(); }
    size_t length() const { return cells.size(); }
};

struct PathResult {
    bool found = false;
    PathPlan plan; // cells empty and total_cost infinite when !found
};

/// Best-first search over an 8-connected grid. Stateless; reads the grid
/// through a const reference and never modifies it.
class PathPlanner {
public:
    /// Compute a minimum-cost path from start to goal.
    /// Out-of-range endpoints are an OutOfBounds error; an unreachable or
    /// blocked goal is a successful result with found == false.
    static Result<PathResult> find_path(const TerrainGrid& grid,
                                        const Coord& start, const Coord& goal,
                                        PathAlgorithm algorithm);

    /// String-keyed entry point for CLI/config input.
    static Result<PathResult> find_path(const TerrainGrid& grid,
                                        const Coord& start, const Coord& goal,
                                        std::string_view algorithm);

    static constexpr f64 CARDINAL_STEP = 1.0;
    static constexpr f64 DIAGONAL_STEP = 1.41421356237309505;

private:
    static PathResult search(const TerrainGrid& grid, const Coord& start,
                             const Coord& goal, PathAlgorithm algorithm);
};

} // namespace rsim::map
