/**
 * @file geojson_reader.cpp
 * @brief Implementation of the GeoJSON reader using nlohmann/json
 */

#include "io/geojson_reader.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iterator>

namespace geobim::io {

// Keeps object members in document order, so attributes stay in source field order
using json = nlohmann::ordered_json;

// ============================================================================
// Internal Handler
// ============================================================================

/**
 * @brief Converts parsed GeoJSON features into records
 */
class FeatureHandler {
public:
    FeatureHandler(std::vector<SourceRecord>& records, ReaderStats& stats,
                   const ReaderConfig& config, const std::string& group)
        : m_records(records), m_stats(stats), m_config(config), m_group(group) {}

    void feature(const json& feature, int64_t index) {
        SourceRecord entry;
        entry.group = m_group;
        entry.record.source_id = index;

        if (!feature.is_object()) {
            reject(entry.record, fmt::format("feature is a JSON {}, not an object", feature.type_name()));
        } else {
            // A feature that cannot be read becomes a record that carries the reason,
            // so it is skipped on its own during conversion
            try {
                auto props = feature.find("properties");
                if (props != feature.end() && props->is_object()) {
                    read_properties(*props, entry.record.attributes);
                }

                auto geom = feature.find("geometry");
                if (geom == feature.end() || geom->is_null()) {
                    entry.record.kind = RecordKind::Unsupported;
                    entry.record.source_kind = "null";
                } else if (!geom->is_object()) {
                    reject(entry.record, fmt::format("geometry is a JSON {}, not an object", geom->type_name()));
                } else {
                    read_geometry(*geom, entry.record);
                }
            } catch (const json::exception& e) {
                reject(entry.record, e.what());
            }
        }

        switch (entry.record.kind) {
            case RecordKind::Point:       m_stats.points++; break;
            case RecordKind::Line:        m_stats.lines++; break;
            case RecordKind::Polygon:     m_stats.polygons++; break;
            case RecordKind::Unsupported: m_stats.unsupported++; break;
        }
        m_stats.total_features++;

        m_records.push_back(std::move(entry));
    }

private:
    void reject(Record& record, const std::string& reason) {
        record.geometry_error = reason;
        m_stats.malformed_geometries++;
        spdlog::warn("GeoJSON Reader: Feature {} in '{}': {}", record.source_id, m_group, reason);
    }

    void read_properties(const json& props, AttributeList& attributes) {
        for (auto it = props.begin(); it != props.end(); ++it) {
            const std::string& key = it.key();
            const json& value = it.value();
            if (value.is_null()) {
                m_stats.null_values_dropped++;
                continue;
            }

            if (value.is_string()) {
                attributes.push_back({key, value.get<std::string>()});
            } else if (value.is_boolean()) {
                attributes.push_back({key, value.get<bool>()});
            } else if (value.is_number()) {
                attributes.push_back({key, value.get<double>()});
            } else if (m_config.keep_nested_values) {
                attributes.push_back({key, value.dump()});
            }
        }
    }

    // A position is two or more numbers; elements beyond the third are ignored
    static bool read_position(const json& position, glm::dvec3& out) {
        if (!position.is_array() || position.size() < 2) {
            return false;
        }
        for (const auto& c : position) {
            if (!c.is_number()) {
                return false;
            }
        }

        out.x = position[0].get<double>();
        out.y = position[1].get<double>();
        out.z = position.size() >= 3 ? position[2].get<double>() : 0.0;
        return true;
    }

    /**
     * @brief Read an array of positions
     * @return false if the value is not an array or any position is malformed
     */
    bool read_positions(const json& positions, std::vector<glm::dvec3>& out, Record& record) {
        if (!positions.is_array()) {
            reject(record, fmt::format("{} coordinates are not an array", record.source_kind));
            return false;
        }
        out.reserve(positions.size());
        for (size_t i = 0; i < positions.size(); ++i) {
            glm::dvec3 p;
            if (!read_position(positions[i], p)) {
                m_stats.malformed_positions++;
                reject(record, fmt::format("{} has a malformed position at index {}", record.source_kind, i));
                return false;
            }
            out.push_back(p);
        }
        return true;
    }

    void read_geometry(const json& geom, Record& record) {
        auto type = geom.find("type");
        record.source_kind = (type != geom.end() && type->is_string()) ? type->get<std::string>() : "";

        if (record.source_kind == "Point") {
            record.kind = RecordKind::Point;
        } else if (record.source_kind == "LineString") {
            record.kind = RecordKind::Line;
        } else if (record.source_kind == "Polygon") {
            record.kind = RecordKind::Polygon;
        } else {
            record.kind = RecordKind::Unsupported;
            return;
        }

        auto coords = geom.find("coordinates");
        if (coords == geom.end()) {
            reject(record, record.source_kind + " has no coordinates");
            return;
        }

        if (record.kind == RecordKind::Point) {
            glm::dvec3 p;
            if (!read_position(*coords, p)) {
                m_stats.malformed_positions++;
                reject(record, "Point has a malformed position");
                return;
            }
            record.vertices.push_back(p);
        } else if (record.kind == RecordKind::Line) {
            read_positions(*coords, record.vertices, record);
        } else {
            if (!coords->is_array() || coords->empty()) {
                reject(record, "Polygon has no rings");
                return;
            }
            if (!read_positions((*coords)[0], record.vertices, record)) {
                return;
            }
            for (size_t i = 1; i < coords->size(); ++i) {
                if (!read_positions((*coords)[i], record.inner_rings.emplace_back(), record)) {
                    return;
                }
            }
        }
    }

    std::vector<SourceRecord>& m_records;
    ReaderStats& m_stats;
    const ReaderConfig& m_config;
    const std::string& m_group;
};

// ============================================================================
// GeoJSONReader Implementation
// ============================================================================

void GeoJSONReader::clear() {
    m_records.clear();
    m_stats = ReaderStats{};
    m_error.clear();
    m_has_data = false;
}

void GeoJSONReader::report_progress(ReadProgress::Stage stage, const std::string& message,
                                    size_t current, size_t total) {
    if (m_progress_callback) {
        ReadProgress progress;
        progress.stage = stage;
        progress.message = message;
        progress.current = current;
        progress.total = total;
        m_progress_callback(progress);
    }
}

bool GeoJSONReader::parse(const std::filesystem::path& filepath) {
    clear();

    report_progress(ReadProgress::Stage::ReadingFile, "Opening " + filepath.filename().string());

    if (!std::filesystem::exists(filepath)) {
        m_error = "File not found: " + filepath.string();
        spdlog::error("GeoJSON Reader: {}", m_error);
        return false;
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        m_error = "Cannot open file: " + filepath.string();
        spdlog::error("GeoJSON Reader: {}", m_error);
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    std::string group = m_config.group_override.empty()
        ? filepath.stem().string()
        : m_config.group_override;

    return parse_string(text, group);
}

bool GeoJSONReader::parse_string(const std::string& text, const std::string& group) {
    using Clock = std::chrono::high_resolution_clock;

    clear();
    auto parse_start = Clock::now();

    report_progress(ReadProgress::Stage::ParsingJson, "Parsing JSON...");

    json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        m_error = "Malformed JSON in layer '" + group + "'";
        spdlog::error("GeoJSON Reader: {}", m_error);
        return false;
    }

    if (!document.is_object()) {
        m_error = "Top-level value of layer '" + group + "' is not an object";
        spdlog::error("GeoJSON Reader: {}", m_error);
        return false;
    }

    FeatureHandler handler(m_records, m_stats, m_config, group);

    try {
        std::string type = document.value("type", std::string());
        if (type == "FeatureCollection") {
            auto features = document.find("features");
            if (features == document.end() || !features->is_array()) {
                m_error = "FeatureCollection in layer '" + group + "' has no features array";
                spdlog::error("GeoJSON Reader: {}", m_error);
                return false;
            }

            const size_t total = features->size();
            m_records.reserve(total);
            for (size_t i = 0; i < total; ++i) {
                if (i % 1000 == 0) {
                    report_progress(ReadProgress::Stage::ConvertingFeatures,
                                    "Converting features...", i, total);
                }
                handler.feature((*features)[i], static_cast<int64_t>(i));
            }
        } else if (type == "Feature") {
            handler.feature(document, 0);
        } else {
            m_error = "Unsupported GeoJSON type '" + type + "' in layer '" + group + "'";
            spdlog::error("GeoJSON Reader: {}", m_error);
            return false;
        }
    } catch (const json::exception& e) {
        m_error = e.what();
        spdlog::error("GeoJSON Reader error: {}", m_error);
        m_records.clear();
        return false;
    }

    m_stats.parse_time_ms = std::chrono::duration<double, std::milli>(
        Clock::now() - parse_start).count();

    spdlog::info("GeoJSON Reader: Read {} features from '{}' in {:.1f}ms",
                 m_stats.total_features, group, m_stats.parse_time_ms);

    report_progress(ReadProgress::Stage::Complete, "Reading complete",
                    m_stats.total_features, m_stats.total_features);

    m_has_data = true;
    return true;
}

std::vector<SourceRecord> GeoJSONReader::take_records() {
    m_has_data = false;
    return std::move(m_records);
}

void GeoJSONReader::log_statistics() const {
    spdlog::info("=== GeoJSON Read Statistics ===");
    spdlog::info("  Features: {}", m_stats.total_features);
    spdlog::info("  Points: {}", m_stats.points);
    spdlog::info("  Lines: {}", m_stats.lines);
    spdlog::info("  Polygons: {}", m_stats.polygons);
    spdlog::info("  Unsupported: {}", m_stats.unsupported);
    if (m_stats.null_values_dropped > 0) {
        spdlog::info("  Null values dropped: {}", m_stats.null_values_dropped);
    }
    if (m_stats.malformed_geometries > 0) {
        spdlog::warn("  Malformed geometries: {} ({} bad positions)",
                     m_stats.malformed_geometries, m_stats.malformed_positions);
    }
    spdlog::info("  Parse time: {:.1f}ms", m_stats.parse_time_ms);
}

// ============================================================================
// Input Collection
// ============================================================================

static bool is_geojson_file(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".geojson" || ext == ".json";
}

std::vector<std::filesystem::path> collect_input_files(
    const std::vector<std::filesystem::path>& inputs) {
    std::vector<std::filesystem::path> files;

    for (const auto& input : inputs) {
        std::error_code ec;
        if (std::filesystem::is_directory(input, ec)) {
            std::vector<std::filesystem::path> found;
            for (const auto& entry : std::filesystem::directory_iterator(input, ec)) {
                if (entry.is_regular_file(ec) && is_geojson_file(entry.path())) {
                    found.push_back(entry.path());
                }
            }
            if (ec) {
                spdlog::warn("GeoJSON Reader: Cannot list directory {}: {}", input.string(), ec.message());
            }
            std::sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        } else {
            files.push_back(input);
        }
    }

    return files;
}

} // namespace geobim::io
