/**
 * @file types.hpp
 * @brief Input record types for the geobim conversion engine
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * This file contains the data structures the input adapters produce:
 * typed attribute values and geographic feature records.
 */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace geobim {

// ============================================================================
// Attribute Values
// ============================================================================

/**
 * @brief Closed tagged value of a feature attribute
 *
 * Index order is significant: string, number, boolean.
 */
using AttributeValue = std::variant<std::string, double, bool>;

/**
 * @brief Kind of an AttributeValue
 */
enum class ValueKind {
    String,
    Number,
    Boolean
};

/**
 * @brief One named attribute of a feature
 */
struct Attribute {
    std::string name;       ///< Field name as found in the source
    AttributeValue value;   ///< Typed value
};

/// Ordered attribute list, in source field order
using AttributeList = std::vector<Attribute>;

[[nodiscard]] ValueKind value_kind(const AttributeValue& value);

/**
 * @brief Value-kind-aware equality
 *
 * Numbers compare numerically, strings compare exactly (case-sensitive),
 * booleans compare by value. Values of different kinds never compare equal.
 */
[[nodiscard]] bool values_equal(const AttributeValue& a, const AttributeValue& b);

/**
 * @brief Format a value as text (numbers in shortest round-trip form)
 */
[[nodiscard]] std::string value_to_string(const AttributeValue& value);

/**
 * @brief Find the first attribute with the given name
 * @return Pointer into the list, or nullptr if absent
 */
[[nodiscard]] const Attribute* find_attribute(const AttributeList& attributes,
                                              std::string_view name);

// ============================================================================
// Records
// ============================================================================

/**
 * @brief Geometry kind of an input record
 */
enum class RecordKind {
    Point,          ///< Single position
    Line,           ///< Polyline (2+ vertices)
    Polygon,        ///< Outer ring with optional inner rings
    Unsupported     ///< Anything else the reader encountered (multi-geometries etc.)
};

/**
 * @brief Convert RecordKind to human-readable string
 */
[[nodiscard]] inline const char* record_kind_name(RecordKind kind) {
    switch (kind) {
        case RecordKind::Point:       return "Point";
        case RecordKind::Line:        return "Line";
        case RecordKind::Polygon:     return "Polygon";
        case RecordKind::Unsupported: return "Unsupported";
    }
    return "Unsupported";
}

/**
 * @brief One input feature with geometry and attributes
 *
 * For points `vertices` holds the position, for lines the centerline and
 * for polygons the outer ring. Coordinates are passed through unprojected.
 * A reader that cannot read the source geometry sets `geometry_error`;
 * such a record is skipped as InvalidGeometry.
 */
struct Record {
    RecordKind kind = RecordKind::Unsupported;          ///< Geometry kind
    std::string source_kind;                            ///< Geometry type name from the source
    std::vector<glm::dvec3> vertices;                   ///< Position, centerline or outer ring
    std::vector<std::vector<glm::dvec3>> inner_rings;   ///< Polygon holes
    AttributeList attributes;                           ///< Source attributes
    int64_t source_id = -1;                             ///< Feature index in the source, -1 if unknown
    std::string geometry_error;                         ///< Why the geometry could not be read, empty if it was
};

/**
 * @brief A record paired with its grouping key (source layer name)
 */
struct SourceRecord {
    Record record;
    std::string group;
};

} // namespace geobim
