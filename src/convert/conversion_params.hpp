#pragma once

#include "core/error.hpp"
#include "geometry/primitives.hpp"
#include "model/property_set.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace geobim::convert {

// ============================================================================
// Conversion Configuration
// ============================================================================

/**
 * @brief Run-wide conversion options
 *
 * Read-only for the duration of a run.
 */
struct ConversionParams {
    // Default dimensions
    double point_size = 2.0;                ///< Box width, depth and default height for points (m)
    double pipe_radius = 0.1;               ///< Default pipe radius for lines (m)
    double extrusion_height = 0.1;          ///< Default extrusion height for polygons (m)

    // Attribute overrides, first present numeric field wins
    std::vector<std::string> point_height_fields = {"height"};
    std::vector<std::string> pipe_radius_fields = {"radius"};
    std::vector<std::string> extrusion_height_fields = {"buildingHeight", "height"};

    // Geometry options
    int pipe_segments = geometry::DEFAULT_PIPE_SEGMENTS;   ///< Vertices per pipe cross-section
    bool use_z = false;                     ///< Keep source z values (otherwise z = 0)
    bool polygon_centroid_markers = false;  ///< Emit an extra point box at each footprint centroid

    // Output
    std::string property_set_name = model::DEFAULT_PROPERTY_SET_NAME;
};

// ============================================================================
// Run Results
// ============================================================================

/**
 * @brief Record-level problem encountered during conversion
 */
struct ConversionWarning {
    size_t record_index = 0;        ///< Position in the input sequence
    int64_t source_id = -1;         ///< Feature index in the source, -1 if unknown
    std::string group;              ///< Grouping key of the record
    ErrorKind kind = ErrorKind::InvalidGeometry;
    std::string message;            ///< Human-readable description
    bool record_skipped = true;     ///< false for diagnostics on converted records
};

/**
 * @brief Conversion statistics for logging
 */
struct ConversionStatistics {
    size_t records_total = 0;       ///< Records dispatched
    size_t converted = 0;           ///< Records that produced an element
    size_t skipped = 0;             ///< Records skipped with a warning
    size_t skipped_points = 0;      ///< Skipped point records
    size_t skipped_lines = 0;       ///< Skipped line records
    size_t skipped_polygons = 0;    ///< Skipped polygon records
    size_t skipped_unsupported = 0; ///< Skipped records of an unsupported kind
    size_t points = 0;              ///< Converted point records
    size_t lines = 0;               ///< Converted line records
    size_t polygons = 0;            ///< Converted polygon records
    size_t centroid_markers = 0;    ///< Extra centroid boxes
    size_t default_styled = 0;      ///< Elements that fell back to the default style
    double convert_time_ms = 0.0;   ///< Wall time of the run
};

} // namespace geobim::convert
