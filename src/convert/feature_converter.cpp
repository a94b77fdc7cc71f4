/**
 * @file feature_converter.cpp
 * @brief Implementation of record dispatch and the conversion run
 */

#include "convert/feature_converter.hpp"
#include "geometry/polygon_utils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace geobim::convert {

std::optional<double> numeric_override(const AttributeList& attributes,
                                       const std::vector<std::string>& fields) {
    for (const auto& field : fields) {
        const Attribute* attr = find_attribute(attributes, field);
        if (attr && value_kind(attr->value) == ValueKind::Number) {
            return std::get<double>(attr->value);
        }
    }
    return std::nullopt;
}

FeatureConverter::FeatureConverter(const style::StyleTable& styles, ConversionParams params,
                                   model::ModelAssembler& assembler)
    : m_styles(styles), m_params(std::move(params)), m_assembler(assembler) {}

glm::dvec3 FeatureConverter::flatten(const glm::dvec3& p) const {
    return m_params.use_z ? p : glm::dvec3(p.x, p.y, 0.0);
}

// ============================================================================
// Geometry
// ============================================================================

geometry::SolidGeometry FeatureConverter::build_geometry(const Record& record,
                                                         std::vector<std::string>* notes) const {
    using geometry::SolidBuilder;

    if (!record.geometry_error.empty()) {
        throw InvalidGeometry(record.geometry_error);
    }

    switch (record.kind) {
        case RecordKind::Point: {
            if (record.vertices.empty()) {
                throw InvalidGeometry("point record has no position");
            }
            double height = numeric_override(record.attributes, m_params.point_height_fields)
                                .value_or(m_params.point_size);
            return SolidBuilder::make_box(flatten(record.vertices.front()),
                                          m_params.point_size, m_params.point_size, height);
        }

        case RecordKind::Line: {
            std::vector<glm::dvec3> centerline;
            centerline.reserve(record.vertices.size());
            for (const auto& v : record.vertices) {
                centerline.push_back(flatten(v));
            }
            double radius = numeric_override(record.attributes, m_params.pipe_radius_fields)
                                .value_or(m_params.pipe_radius);
            return SolidBuilder::make_swept_pipe(centerline, radius, m_params.pipe_segments);
        }

        case RecordKind::Polygon: {
            std::vector<glm::dvec2> outer;
            outer.reserve(record.vertices.size());
            for (const auto& v : record.vertices) {
                outer.emplace_back(v.x, v.y);
            }

            std::vector<std::vector<glm::dvec2>> inner;
            inner.reserve(record.inner_rings.size());
            for (const auto& ring : record.inner_rings) {
                auto& hole = inner.emplace_back();
                hole.reserve(ring.size());
                for (const auto& v : ring) {
                    hole.emplace_back(v.x, v.y);
                }
            }

            double base_z = (m_params.use_z && !record.vertices.empty()) ? record.vertices.front().z : 0.0;
            double height = numeric_override(record.attributes, m_params.extrusion_height_fields)
                                .value_or(m_params.extrusion_height);
            return SolidBuilder::make_extruded_solid(outer, inner, height, base_z, notes);
        }

        case RecordKind::Unsupported:
            break;
    }

    throw UnsupportedRecordKind(fmt::format("unsupported geometry type '{}'",
        record.source_kind.empty() ? record_kind_name(record.kind) : record.source_kind));
}

// ============================================================================
// Elements
// ============================================================================

model::ModelElement FeatureConverter::build_element(const Record& record,
                                                    std::vector<std::string>* notes) const {
    model::ModelElement element;
    element.geometry = build_geometry(record, notes);
    element.style = m_styles.resolve(record.attributes);
    element.properties = model::to_property_set(record.attributes, m_params.property_set_name);
    element.source_kind = record.kind;
    element.source_id = record.source_id;
    element.name = record.source_id >= 0
        ? fmt::format("{} {}", element.style.category, record.source_id)
        : element.style.category;
    return element;
}

model::ModelElement FeatureConverter::build_centroid_marker(const Record& record,
                                                            const model::ModelElement& footprint) const {
    const auto& solid = std::get<geometry::ExtrudedSolid>(footprint.geometry.shape);
    glm::dvec2 c = geometry::centroid(solid.outer_ring);

    model::ModelElement marker;
    marker.geometry = geometry::SolidBuilder::make_box(glm::dvec3(c, solid.placement.z),
                                                       m_params.point_size, m_params.point_size,
                                                       m_params.point_size);
    marker.style = footprint.style;
    marker.properties = footprint.properties;
    marker.source_kind = record.kind;
    marker.source_id = record.source_id;
    marker.name = footprint.name + " centroid";
    return marker;
}

// ============================================================================
// Dispatch
// ============================================================================

void FeatureConverter::add_warning(size_t record_index, const Record& record,
                                   const std::string& group_key, ErrorKind kind,
                                   const std::string& message, bool skipped) {
    ConversionWarning warning;
    warning.record_index = record_index;
    warning.source_id = record.source_id;
    warning.group = group_key;
    warning.kind = kind;
    warning.message = message;
    warning.record_skipped = skipped;

    if (skipped) {
        spdlog::warn("FeatureConverter: Skipping record {} in '{}' ({}): {}",
                     record_index, group_key, error_kind_name(kind), message);
    } else {
        spdlog::debug("FeatureConverter: Record {} in '{}': {}", record_index, group_key, message);
    }

    m_warnings.push_back(std::move(warning));
}

void FeatureConverter::count_skipped(RecordKind kind) {
    switch (kind) {
        case RecordKind::Point:       m_stats.skipped_points++; break;
        case RecordKind::Line:        m_stats.skipped_lines++; break;
        case RecordKind::Polygon:     m_stats.skipped_polygons++; break;
        case RecordKind::Unsupported: m_stats.skipped_unsupported++; break;
    }
    m_stats.skipped++;
}

std::optional<model::ElementId> FeatureConverter::dispatch(const Record& record,
                                                           const std::string& group_key,
                                                           size_t record_index) {
    m_stats.records_total++;

    std::vector<std::string> notes;
    model::ModelElement element;
    try {
        element = build_element(record, &notes);
    } catch (const InvalidGeometry& e) {
        add_warning(record_index, record, group_key, e.kind(), e.what(), true);
        count_skipped(record.kind);
        return std::nullopt;
    } catch (const UnsupportedRecordKind& e) {
        add_warning(record_index, record, group_key, e.kind(), e.what(), true);
        count_skipped(record.kind);
        return std::nullopt;
    }

    for (const auto& note : notes) {
        add_warning(record_index, record, group_key, ErrorKind::InvalidGeometry, note, false);
    }

    switch (record.kind) {
        case RecordKind::Point:   m_stats.points++; break;
        case RecordKind::Line:    m_stats.lines++; break;
        case RecordKind::Polygon: m_stats.polygons++; break;
        case RecordKind::Unsupported: break;
    }
    if (element.style.is_default()) {
        m_stats.default_styled++;
    }
    m_stats.converted++;

    std::optional<model::ModelElement> marker;
    if (m_params.polygon_centroid_markers && record.kind == RecordKind::Polygon) {
        marker = build_centroid_marker(record, element);
    }

    spdlog::debug("FeatureConverter: Record {} in '{}' -> {} '{}'", record_index, group_key,
                  geometry::solid_kind_name(element.geometry.kind()), element.name);

    model::ElementId id = m_assembler.add_element(group_key, std::move(element));

    if (marker) {
        m_assembler.add_element(group_key, std::move(*marker));
        m_stats.centroid_markers++;
    }

    return id;
}

std::vector<ConversionWarning> FeatureConverter::take_warnings() {
    std::vector<ConversionWarning> result = std::move(m_warnings);
    m_warnings.clear();
    return result;
}

void FeatureConverter::log_statistics() const {
    convert::log_statistics(m_stats, m_warnings.size());
}

void log_statistics(const ConversionStatistics& stats, size_t warning_count) {
    spdlog::info("=== Conversion Statistics ===");
    spdlog::info("  Records: {}", stats.records_total);
    spdlog::info("  Converted: {} ({} points, {} lines, {} polygons)",
                 stats.converted, stats.points, stats.lines, stats.polygons);
    if (stats.centroid_markers > 0) {
        spdlog::info("  Centroid markers: {}", stats.centroid_markers);
    }
    spdlog::info("  Default style: {}", stats.default_styled);
    spdlog::info("  Skipped: {} ({} points, {} lines, {} polygons, {} unsupported)",
                 stats.skipped, stats.skipped_points, stats.skipped_lines,
                 stats.skipped_polygons, stats.skipped_unsupported);
    spdlog::info("  Warnings: {}", warning_count);
    spdlog::info("  Time: {:.1f}ms", stats.convert_time_ms);
}

// ============================================================================
// Run
// ============================================================================

ConversionResult convert(const std::vector<SourceRecord>& records,
                         const style::StyleTable& styles,
                         const ConversionParams& params,
                         const model::AssemblerConfig& assembler_config) {
    using Clock = std::chrono::high_resolution_clock;
    auto start_time = Clock::now();

    model::ModelAssembler assembler(assembler_config);
    FeatureConverter converter(styles, params, assembler);

    for (size_t i = 0; i < records.size(); ++i) {
        converter.dispatch(records[i].record, records[i].group, i);
    }

    ConversionResult result;
    result.graph = assembler.finalize();
    result.stats = converter.get_statistics();
    result.stats.convert_time_ms = std::chrono::duration<double, std::milli>(
        Clock::now() - start_time).count();
    result.warnings = converter.take_warnings();

    spdlog::info("FeatureConverter: Converted {} of {} records into {} elements in {:.1f}ms",
                 result.stats.converted, result.stats.records_total,
                 result.graph.element_count(), result.stats.convert_time_ms);
    return result;
}

} // namespace geobim::convert
