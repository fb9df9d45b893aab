#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sim/mission_telemetry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rsim::sim {

/// YAML serialization of mission history.
///
/// The document is a sequence of maps keyed by the MissionRecord field
/// names. Doubles are written with full precision, so loading a saved file
/// yields records equal to the originals and saving them again is
/// byte-identical.

std::string emit_missions(const std::vector<MissionRecord>& records);

Result<std::vector<MissionRecord>> parse_missions(std::string_view text);

Result<void> save_missions(const fs::path& path,
                           const std::vector<MissionRecord>& records);

Result<std::vector<MissionRecord>> load_missions(const fs::path& path);

} // namespace rsim::sim
