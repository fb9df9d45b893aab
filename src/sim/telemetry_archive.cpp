#include "sim/telemetry_archive.hpp"

#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace rsim::sim {

static constexpr const char* KEY_ID = "mission_id";
static constexpr const char* KEY_START = "start_time";
static constexpr const char* KEY_END = "end_time";
static constexpr const char* KEY_SUCCESS = "success";
static constexpr const char* KEY_DISTANCE = "total_distance";
static constexpr const char* KEY_ENERGY = "energy_consumed";
static constexpr const char* KEY_TERRAIN = "terrain_distribution";
static constexpr const char* KEY_SPEED = "average_speed";
static constexpr const char* KEY_PATH = "path";

/// Fetch a required field, turning absence into a readable error.
static Result<YAML::Node> require(const YAML::Node& node, const char* key,
                                  size_t index) {
    YAML::Node child = node[key];
    if (!child) {
        return Error(ErrorCode::ParseError,
                     "Mission " + std::to_string(index) + ": missing '" +
                         key + "'");
    }
    return child;
}

static Result<MissionRecord> decode_record(const YAML::Node& node,
                                           size_t index) {
    if (!node.IsMap()) {
        return Error(ErrorCode::ParseError,
                     "Mission " + std::to_string(index) + " is not a map");
    }

    MissionRecord r;
    for (const char* key : {KEY_ID, KEY_START, KEY_END, KEY_SUCCESS,
                            KEY_DISTANCE, KEY_ENERGY, KEY_TERRAIN, KEY_SPEED,
                            KEY_PATH}) {
        auto field = require(node, key, index);
        if (!field) return field.error();
    }

    r.mission_id = node[KEY_ID].as<u32>();
    r.start_time = node[KEY_START].as<std::string>();
    r.end_time = node[KEY_END].as<std::string>();
    r.success = node[KEY_SUCCESS].as<bool>();
    r.total_distance = node[KEY_DISTANCE].as<u32>();
    r.energy_consumed = node[KEY_ENERGY].as<f64>();
    r.average_speed = node[KEY_SPEED].as<f64>();

    for (const auto& entry : node[KEY_TERRAIN]) {
        auto name = entry.first.as<std::string>();
        auto cell = map::terrain_cell_from_name(name);
        if (!cell) {
            return Error(ErrorCode::ParseError,
                         "Mission " + std::to_string(index) +
                             ": unknown terrain class '" + name + "'");
        }
        r.terrain_distribution[*cell] = entry.second.as<f64>();
    }

    for (const auto& pt : node[KEY_PATH]) {
        if (!pt.IsSequence() || pt.size() != 2) {
            return Error(ErrorCode::ParseError,
                         "Mission " + std::to_string(index) +
                             ": path entries must be [x, y]");
        }
        r.path.push_back({pt[0].as<i32>(), pt[1].as<i32>()});
    }
    return r;
}

std::string emit_missions(const std::vector<MissionRecord>& records) {
    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<f64>::max_digits10);

    out << YAML::BeginSeq;
    for (const auto& r : records) {
        out << YAML::BeginMap;
        out << YAML::Key << KEY_ID << YAML::Value << r.mission_id;
        out << YAML::Key << KEY_START << YAML::Value << r.start_time;
        out << YAML::Key << KEY_END << YAML::Value << r.end_time;
        out << YAML::Key << KEY_SUCCESS << YAML::Value << r.success;
        out << YAML::Key << KEY_DISTANCE << YAML::Value << r.total_distance;
        out << YAML::Key << KEY_ENERGY << YAML::Value << r.energy_consumed;

        out << YAML::Key << KEY_TERRAIN << YAML::Value << YAML::BeginMap;
        for (const auto& [cell, share] : r.terrain_distribution) {
            out << YAML::Key << map::terrain_cell_name(cell)
                << YAML::Value << share;
        }
        out << YAML::EndMap;

        out << YAML::Key << KEY_SPEED << YAML::Value << r.average_speed;

        out << YAML::Key << KEY_PATH << YAML::Value << YAML::BeginSeq;
        for (const auto& c : r.path) {
            out << YAML::Flow << YAML::BeginSeq << c.x << c.y << YAML::EndSeq;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    std::string text = out.c_str();
    text += '\n';
    return text;
}

Result<std::vector<MissionRecord>> parse_missions(std::string_view text) {
    std::vector<MissionRecord> records;
    try {
        YAML::Node root = YAML::Load(std::string(text));
        if (root.IsNull()) return records;
        if (!root.IsSequence()) {
            return Error(ErrorCode::ParseError,
                         "Mission archive must be a sequence");
        }
        for (size_t i = 0; i < root.size(); ++i) {
            auto rec = decode_record(root[i], i);
            if (!rec) return rec.error();
            records.push_back(std::move(rec.value()));
        }
    } catch (const YAML::Exception& e) {
        return Error(ErrorCode::ParseError,
                     std::string("Malformed mission archive: ") + e.what());
    }
    return records;
}

Result<void> save_missions(const fs::path& path,
                           const std::vector<MissionRecord>& records) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Error(ErrorCode::IoError,
                     "Failed to open file for writing: " + path.string());
    }
    file << emit_missions(records);
    if (!file) {
        return Error(ErrorCode::IoError, "Failed to write: " + path.string());
    }
    spdlog::info("Saved {} missions to {}", records.size(), path.string());
    return {};
}

Result<std::vector<MissionRecord>> load_missions(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error(ErrorCode::IoError, "Failed to open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_missions(buffer.str());
    if (result) {
        spdlog::info("Loaded {} missions from {}", result.value().size(),
                     path.string());
    }
    return result;
}

} // namespace rsim::sim
