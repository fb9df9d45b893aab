#include "map/terrain_generator.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <random>
#include <spdlog/spdlog.h>

namespace rsim::map {

/// Mirror an index into [0, n) the way a half-sample symmetric boundary does:
/// d c b a | a b c d | d c b a
static i32 reflect_index(i32 i, i32 n) {
    const i32 period = 2 * n;
    i %= period;
    if (i < 0) i += period;
    return i < n ? i : period - 1 - i;
}

static std::vector<f64> gaussian_kernel(f64 sigma) {
    const i32 radius = static_cast<i32>(4.0 * sigma + 0.5);
    std::vector<f64> kernel(static_cast<size_t>(2 * radius + 1));
    f64 sum = 0.0;
    for (i32 i = -radius; i <= radius; ++i) {
        f64 w = std::exp(-0.5 * (i * i) / (sigma * sigma));
        kernel[static_cast<size_t>(i + radius)] = w;
        sum += w;
    }
    for (auto& w : kernel) w /= sum;
    return kernel;
}

/// Separable Gaussian blur, in place.
static void gaussian_blur(std::vector<f64>& field, u32 size, f64 sigma) {
    if (sigma <= 0.0) return;
    const auto kernel = gaussian_kernel(sigma);
    const i32 radius = static_cast<i32>(kernel.size() / 2);
    const i32 n = static_cast<i32>(size);
    std::vector<f64> tmp(field.size());

    // Horizontal pass
    for (i32 y = 0; y < n; ++y) {
        for (i32 x = 0; x < n; ++x) {
            f64 acc = 0.0;
            for (i32 k = -radius; k <= radius; ++k) {
                i32 sx = reflect_index(x + k, n);
                acc += kernel[static_cast<size_t>(k + radius)] *
                       field[static_cast<size_t>(y * n + sx)];
            }
            tmp[static_cast<size_t>(y * n + x)] = acc;
        }
    }
    // Vertical pass
    for (i32 y = 0; y < n; ++y) {
        for (i32 x = 0; x < n; ++x) {
            f64 acc = 0.0;
            for (i32 k = -radius; k <= radius; ++k) {
                i32 sy = reflect_index(y + k, n);
                acc += kernel[static_cast<size_t>(k + radius)] *
                       tmp[static_cast<size_t>(sy * n + x)];
            }
            field[static_cast<size_t>(y * n + x)] = acc;
        }
    }
}

static TerrainCell bucket(f64 value, const TerrainGenParams& p) {
    if (value < p.clear_max) return TerrainCell::Clear;
    if (value < p.sand_max) return TerrainCell::Sand;
    if (value < p.rocks_max) return TerrainCell::Rocks;
    return TerrainCell::Obstacle;
}

std::vector<f64> smoothed_noise_field(u32 size, u64 seed,
                                      const TerrainGenParams& params) {
    const size_t total = static_cast<size_t>(size) * size;
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<f64> uniform(0.0, 1.0);

    std::vector<f64> noise(total, 0.0);
    std::vector<f64> octave(total);
    f64 amplitude = 1.0;
    f64 frequency = 1.0;

    for (u32 o = 0; o < params.octaves; ++o) {
        for (auto& v : octave) v = uniform(rng);
        gaussian_blur(octave, size, (params.scale / frequency) / 10.0);
        for (size_t i = 0; i < total; ++i) noise[i] += amplitude * octave[i];
        amplitude *= params.persistence;
        frequency *= params.lacunarity;
    }

    auto [mn_it, mx_it] = std::minmax_element(noise.begin(), noise.end());
    const f64 mn = *mn_it;
    const f64 range = *mx_it - mn;
    for (auto& v : noise) {
        v = range > 0.0 ? (v - mn) / range : 0.0;
    }
    return noise;
}

Result<TerrainGrid> generate_terrain(u32 size, std::optional<u64> seed,
                                     const TerrainGenParams& params) {
    if (size < MIN_GENERATED_SIZE) {
        return Error(ErrorCode::InvalidArgument,
                     "Grid size must be at least " +
                         std::to_string(MIN_GENERATED_SIZE) + ", got " +
                         std::to_string(size));
    }

    const u64 actual_seed = seed ? *seed : std::random_device{}();
    const auto field = smoothed_noise_field(size, actual_seed, params);
    const i32 n = static_cast<i32>(size);
    auto idx = [n](i32 x, i32 y) { return static_cast<size_t>(y * n + x); };

    std::vector<TerrainCell> cells(field.size());
    std::transform(field.begin(), field.end(), cells.begin(),
                   [&](f64 v) { return bucket(v, params); });

    // Separate stream for the carving steps so tuning the noise does not
    // reshuffle them.
    std::mt19937_64 rng(actual_seed ^ 0x9e3779b97f4a7c15ULL);
    std::bernoulli_distribution pick_sand(params.pathway_sand_ratio);
    std::uniform_real_distribution<f64> uniform(0.0, 1.0);

    // (a) Central cross-shaped pathway
    const i32 center = n / 2;
    const i32 width = std::max(2, n / 8);
    const i32 band_start = center - width / 2;
    const i32 band_end = center + width / 2;
    auto open_cell = [&](i32 x, i32 y) {
        auto& cell = cells[idx(x, y)];
        if (cell == TerrainCell::Obstacle) {
            cell = pick_sand(rng) ? TerrainCell::Sand : TerrainCell::Clear;
        }
    };
    for (i32 band = band_start; band < band_end; ++band) {
        for (i32 i = 0; i < n; ++i) {
            open_cell(i, band); // horizontal arm
            open_cell(band, i); // vertical arm
        }
    }

    // (b) Start and goal neighbourhoods
    const i32 r = static_cast<i32>(params.clear_radius);
    for (i32 anchor : {0, n - 1}) {
        for (i32 y = std::max(0, anchor - r); y <= std::min(n - 1, anchor + r); ++y) {
            for (i32 x = std::max(0, anchor - r); x <= std::min(n - 1, anchor + r); ++x) {
                cells[idx(x, y)] = TerrainCell::Clear;
            }
        }
    }

    // (c) Open a share of the remaining obstacles
    for (auto& cell : cells) {
        bool roll = uniform(rng) < params.random_clear_ratio;
        if (roll && cell == TerrainCell::Obstacle) cell = TerrainCell::Clear;
    }

    // (d) Guarantee start-goal connectivity
    TerrainGrid grid(size, cells);
    if (!grid.is_connected(grid.start(), grid.goal())) {
        spdlog::debug("Terrain seed {}: start and goal disconnected, "
                      "opening diagonal corridor", actual_seed);
        for (i32 i = 0; i < n; ++i) {
            if (cells[idx(i, i)] == TerrainCell::Obstacle) {
                cells[idx(i, i)] = TerrainCell::Clear;
            }
        }
        grid = TerrainGrid(size, std::move(cells));
    }

    assert(is_passable(grid.get(grid.start())));
    assert(is_passable(grid.get(grid.goal())));
    assert(grid.is_connected(grid.start(), grid.goal()));

    spdlog::debug("Generated {}x{} terrain (seed {}): clear={} sand={} "
                  "rocks={} obstacle={}",
                  size, size, actual_seed, grid.count(TerrainCell::Clear),
                  grid.count(TerrainCell::Sand), grid.count(TerrainCell::Rocks),
                  grid.count(TerrainCell::Obstacle));
    return grid;
}

} // namespace rsim::map
