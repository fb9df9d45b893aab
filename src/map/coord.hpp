#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <functional>

namespace rsim::map {

/// Integer grid coordinate. Cells are stored row-major: index = y * size + x.
struct Coord {
    i32 x = 0;
    i32 y = 0;

    bool operator==(const Coord& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Coord& o) const { return !(*this == o); }
};

/// True when a and b are the same cell or 8-neighbours.
inline bool is_adjacent(const Coord& a, const Coord& b) {
    i32 dx = a.x - b.x;
    i32 dy = a.y - b.y;
    return dx >= -1 && dx <= 1 && dy >= -1 && dy <= 1;
}

} // namespace rsim::map

template <>
struct std::hash<rsim::map::Coord> {
    size_t operator()(const rsim::map::Coord& c) const noexcept {
        return std::hash<rsim::u64>{}(
            (static_cast<rsim::u64>(static_cast<rsim::u32>(c.x)) << 32) |
            static_cast<rsim::u32>(c.y));
    }
};
