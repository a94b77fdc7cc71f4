/**
 * @file geojson_reader.hpp
 * @brief GeoJSON input adapter producing conversion records
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * Reads a FeatureCollection (or a single Feature) and turns each feature
 * into one Record. Coordinates are passed through unprojected; the
 * grouping key of every record is the file stem.
 *
 * Geometry mapping:
 *   - Point      -> RecordKind::Point
 *   - LineString -> RecordKind::Line
 *   - Polygon    -> RecordKind::Polygon (first ring outer, rest holes)
 *   - anything else (Multi*, GeometryCollection, null) -> RecordKind::Unsupported
 */

#pragma once

#include "core/types.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace geobim::io {

// ============================================================================
// Reader Configuration
// ============================================================================

/**
 * @brief Configuration options for GeoJSON reading
 */
struct ReaderConfig {
    bool keep_nested_values = true;     ///< Store object/array properties as JSON text
    std::string group_override;         ///< Grouping key for all records (empty = file stem)
};

// ============================================================================
// Progress Reporting
// ============================================================================

/**
 * @brief Progress information during reading
 */
struct ReadProgress {
    enum class Stage {
        ReadingFile,        ///< Opening and reading file
        ParsingJson,        ///< Parsing the JSON document
        ConvertingFeatures, ///< Turning features into records
        Complete            ///< Reading finished
    };

    Stage stage = Stage::ReadingFile;
    size_t current = 0;
    size_t total = 0;
    std::string message;

    [[nodiscard]] float percentage() const {
        return total > 0 ? static_cast<float>(current) / static_cast<float>(total) * 100.0f : 0.0f;
    }
};

/// Callback function type for progress updates
using ReadProgressCallback = std::function<void(const ReadProgress&)>;

/**
 * @brief Reader statistics for logging
 */
struct ReaderStats {
    size_t total_features = 0;
    size_t points = 0;
    size_t lines = 0;
    size_t polygons = 0;
    size_t unsupported = 0;
    size_t null_values_dropped = 0;     ///< Properties skipped because they were null
    size_t malformed_positions = 0;     ///< Positions that were not an array of 2+ numbers
    size_t malformed_geometries = 0;    ///< Features whose geometry could not be read
    double parse_time_ms = 0.0;
};

// ============================================================================
// GeoJSON Reader
// ============================================================================

/**
 * @brief Reader for GeoJSON feature files
 *
 * Usage:
 * @code
 * geobim::io::GeoJSONReader reader;
 * if (reader.parse("roads.geojson")) {
 *     auto records = reader.take_records();
 * } else {
 *     spdlog::error("{}", reader.get_error());
 * }
 * @endcode
 */
class GeoJSONReader {
public:
    GeoJSONReader() = default;

    void set_config(const ReaderConfig& config) { m_config = config; }
    [[nodiscard]] const ReaderConfig& get_config() const { return m_config; }

    void set_progress_callback(ReadProgressCallback callback) {
        m_progress_callback = std::move(callback);
    }

    /**
     * @brief Parse a GeoJSON file
     * @param filepath Path to a .geojson/.json file
     * @return true on success, false on failure (see get_error())
     */
    bool parse(const std::filesystem::path& filepath);

    /**
     * @brief Parse GeoJSON text
     * @param text Document contents
     * @param group Grouping key for the records
     * @return true on success, false on failure (see get_error())
     */
    bool parse_string(const std::string& text, const std::string& group);

    [[nodiscard]] const std::string& get_error() const { return m_error; }
    [[nodiscard]] bool has_data() const { return m_has_data; }

    [[nodiscard]] const std::vector<SourceRecord>& get_records() const { return m_records; }

    /**
     * @brief Move the records out of the reader
     */
    [[nodiscard]] std::vector<SourceRecord> take_records();

    [[nodiscard]] const ReaderStats& get_stats() const { return m_stats; }

    /**
     * @brief Log reader statistics to spdlog
     */
    void log_statistics() const;

    void clear();

private:
    void report_progress(ReadProgress::Stage stage, const std::string& message,
                         size_t current = 0, size_t total = 0);

    ReaderConfig m_config;
    ReadProgressCallback m_progress_callback;

    std::vector<SourceRecord> m_records;
    ReaderStats m_stats;
    std::string m_error;
    bool m_has_data = false;
};

/**
 * @brief Collect GeoJSON inputs from a list of files and directories
 *
 * Directories are scanned (non-recursively) for .geojson and .json files,
 * sorted by name so runs are reproducible.
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_input_files(
    const std::vector<std::filesystem::path>& inputs);

} // namespace geobim::io
