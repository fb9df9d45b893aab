#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "map/terrain_grid.hpp"

#include <optional>
#include <vector>

namespace rsim::map {

/// Noise and bucketing parameters for generate_terrain().
struct TerrainGenParams {
    u32 octaves = 6;
    f64 scale = 100.0;      // base smoothing sigma = scale / 10
    f64 persistence = 0.5;
    f64 lacunarity = 2.0;

    // Upper bounds of the value bands; anything >= rocks_max is Obstacle
    f64 clear_max = 0.40;
    f64 sand_max = 0.60;
    f64 rocks_max = 0.85;

    f64 pathway_sand_ratio = 0.30;  // Sand vs Clear when carving the cross
    u32 clear_radius = 2;           // around start and goal
    f64 random_clear_ratio = 0.15;  // share of Obstacles opened up
};

/// Smallest grid size accepted by generate_terrain().
constexpr u32 MIN_GENERATED_SIZE = 10;

/// Generate a terrain grid. The same size and seed always produce the same
/// grid; without a seed a random one is drawn.
///
/// Start (0,0) and goal (N-1,N-1) are guaranteed to be connected: if the
/// carved pathways do not link them, the main diagonal is opened.
Result<TerrainGrid> generate_terrain(u32 size,
                                     std::optional<u64> seed = std::nullopt,
                                     const TerrainGenParams& params = {});

/// Multi-octave smoothed random field normalized to [0, 1], row-major.
/// Exposed for tests.
std::vector<f64> smoothed_noise_field(u32 size, u64 seed,
                                      const TerrainGenParams& params = {});

} // namespace rsim::map
