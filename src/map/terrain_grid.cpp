#include "map/terrain_grid.hpp"

#include <algorithm>
#include <cassert>
#include <deque>
#include <spdlog/fmt/fmt.h>

namespace rsim::map {

TerrainGrid::TerrainGrid(u32 size, TerrainCell fill)
    : size_(size),
      cells_(static_cast<size_t>(size) * size, fill),
      base_cells_(cells_) {
    assert(size >= MIN_SIZE);
}

TerrainGrid::TerrainGrid(u32 size, std::vector<TerrainCell> cells)
    : size_(size), cells_(std::move(cells)) {
    assert(size >= MIN_SIZE);
    assert(cells_.size() == static_cast<size_t>(size_) * size_);
    base_cells_ = cells_;
}

Error TerrainGrid::out_of_bounds(const Coord& c) const {
    return Error(ErrorCode::OutOfBounds,
                 fmt::format("Coordinate ({}, {}) outside {}x{} grid", c.x,
                             c.y, size_, size_));
}

Result<TerrainCell> TerrainGrid::at(const Coord& c) const {
    if (!in_bounds(c)) return out_of_bounds(c);
    return cells_[index(c)];
}

Result<void> TerrainGrid::set(const Coord& c, TerrainCell cell) {
    if (!in_bounds(c)) return out_of_bounds(c);
    cells_[index(c)] = cell;
    base_cells_[index(c)] = cell;
    return {};
}

Result<void> TerrainGrid::mark(const Coord& c, TerrainCell marker) {
    if (!in_bounds(c)) return out_of_bounds(c);
    if (!is_marker(marker)) {
        return Error(ErrorCode::InvalidArgument,
                     fmt::format("{} is not a marker class",
                                 terrain_cell_name(marker)));
    }
    cells_[index(c)] = marker;
    return {};
}

Result<void> TerrainGrid::clear_marker(const Coord& c) {
    if (!in_bounds(c)) return out_of_bounds(c);
    cells_[index(c)] = base_cells_[index(c)];
    return {};
}

size_t TerrainGrid::count(TerrainCell cell) const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), cell));
}

bool TerrainGrid::is_connected(const Coord& from, const Coord& to) const {
    if (!in_bounds(from) || !in_bounds(to)) return false;
    if (!is_passable(get(from)) || !is_passable(get(to))) return false;

    std::vector<bool> seen(cells_.size(), false);
    std::deque<Coord> queue;
    queue.push_back(from);
    seen[index(from)] = true;

    while (!queue.empty()) {
        Coord cur = queue.front();
        queue.pop_front();
        if (cur == to) return true;

        for (i32 dy = -1; dy <= 1; ++dy) {
            for (i32 dx = -1; dx <= 1; ++dx) {
                if (dx == 0 && dy == 0) continue;
                Coord n{cur.x + dx, cur.y + dy};
                if (!in_bounds(n) || seen[index(n)]) continue;
                if (!is_passable(get(n))) continue;
                seen[index(n)] = true;
                queue.push_back(n);
            }
        }
    }
    return false;
}

} // namespace rsim::map
