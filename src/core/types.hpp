#pragma once

#include <cstdint>
#include <filesystem>

namespace rsim {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using f64 = double;

constexpr const char* VERSION = "0.1.0";

} // namespace rsim
