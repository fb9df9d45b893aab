#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace rsim::map {

/// Cost class of a grid cell. RoverMarker and GoalMarker are overlays used
/// for display; they cost the same as Clear.
enum class TerrainCell : u8 {
    Clear       = 0,
    Sand        = 1,
    Rocks       = 2,
    Obstacle    = 3, // impassable
    RoverMarker = 4,
    GoalMarker  = 5,
};

constexpr u32 TERRAIN_CELL_COUNT = 6;

/// Movement cost of entering a cell of this class.
/// Obstacle returns +infinity.
f64 terrain_cost(TerrainCell cell);

/// Speed multiplier applied after the rover enters a cell of this class.
f64 speed_factor(TerrainCell cell);

const char* terrain_cell_name(TerrainCell cell);

/// Inverse of terrain_cell_name(). Case-sensitive.
std::optional<TerrainCell> terrain_cell_from_name(std::string_view name);

inline bool is_passable(TerrainCell cell) {
    return cell != TerrainCell::Obstacle;
}

inline bool is_marker(TerrainCell cell) {
    return cell == TerrainCell::RoverMarker || cell == TerrainCell::GoalMarker;
}

} // namespace rsim::map
