#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "map/coord.hpp"
#include "map/terrain_cost.hpp"

#include <vector>

namespace rsim::map {

/// Square grid of terrain cost classes.
///
/// Two layers are kept: the base terrain and the live layer. Markers
/// (rover, goal) are written to the live layer only, and clear_marker()
/// restores the base class underneath. Every query reads the live layer.
class TerrainGrid {
public:
    static constexpr u32 MIN_SIZE = 2;

    explicit TerrainGrid(u32 size, TerrainCell fill = TerrainCell::Clear);

    /// Build from row-major cell data (size * size entries).
    TerrainGrid(u32 size, std::vector<TerrainCell> cells);

    u32 size() const { return size_; }
    Coord start() const { return {0, 0}; }
    Coord goal() const {
        return {static_cast<i32>(size_) - 1, static_cast<i32>(size_) - 1};
    }

    bool in_bounds(const Coord& c) const {
        return c.x >= 0 && c.y >= 0 && static_cast<u32>(c.x) < size_ &&
               static_cast<u32>(c.y) < size_;
    }

    /// Bounds-checked live cell lookup.
    Result<TerrainCell> at(const Coord& c) const;

    /// Bounds-checked write to both base and live layers.
    Result<void> set(const Coord& c, TerrainCell cell);

    /// Overlay a RoverMarker or GoalMarker on the live layer.
    Result<void> mark(const Coord& c, TerrainCell marker);

    /// Restore the base terrain under a marker.
    Result<void> clear_marker(const Coord& c);

    /// Live cell (no bounds check).
    TerrainCell get(const Coord& c) const { return cells_[index(c)]; }

    /// Base terrain under any marker (no bounds check).
    TerrainCell base(const Coord& c) const { return base_cells_[index(c)]; }

    /// Movement cost of entering c (no bounds check).
    f64 cost_at(const Coord& c) const { return terrain_cost(get(c)); }

    /// Number of live cells of the given class.
    size_t count(TerrainCell cell) const;

    /// 8-connected reachability over non-Obstacle live cells.
    bool is_connected(const Coord& from, const Coord& to) const;

    const std::vector<TerrainCell>& cells() const { return cells_; }

    bool operator==(const TerrainGrid& o) const {
        return size_ == o.size_ && cells_ == o.cells_ &&
               base_cells_ == o.base_cells_;
    }
    bool operator!=(const TerrainGrid& o) const { return !(*this == o); }

private:
    size_t index(const Coord& c) const {
        return static_cast<size_t>(c.y) * size_ + static_cast<size_t>(c.x);
    }
    Error out_of_bounds(const Coord& c) const;

    u32 size_;
    std::vector<TerrainCell> cells_;
    std::vector<TerrainCell> base_cells_; // terrain without markers
};

} // namespace rsim::map
