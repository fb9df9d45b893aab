#include "map/terrain_cost.hpp"

#include <array>
#include <limits>

namespace rsim::map {

struct TerrainClassInfo {
    const char* name;
    f64 cost;
    f64 speed;
};

static constexpr f64 INF = std::numeric_limits<f64>::infinity();

// Indexed by TerrainCell value
static constexpr std::array<TerrainClassInfo, TERRAIN_CELL_COUNT>
    CLASS_TABLE = {{
    {"Clear",       1.0, 1.0},
    {"Sand",        2.0, 0.7},
    {"Rocks",       3.0, 0.5},
    {"Obstacle",    INF, 1.0},
    {"RoverMarker", 1.0, 1.0},
    {"GoalMarker",  1.0, 1.0},
}};

static const TerrainClassInfo& info(TerrainCell cell) {
    return CLASS_TABLE[static_cast<u8>(cell)];
}

f64 terrain_cost(TerrainCell cell) {
    return info(cell).cost;
}

f64 speed_factor(TerrainCell cell) {
    return info(cell).speed;
}

const char* terrain_cell_name(TerrainCell cell) {
    return info(cell).name;
}

std::optional<TerrainCell> terrain_cell_from_name(std::string_view name) {
    for (u32 i = 0; i < TERRAIN_CELL_COUNT; ++i) {
        if (name == CLASS_TABLE[i].name) {
            return static_cast<TerrainCell>(i);
        }
    }
    return std::nullopt;
}

} // namespace rsim::map
