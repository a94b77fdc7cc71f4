/**
 * @file ifc_writer.hpp
 * @brief IFC2X3 serializer for a finalized model graph
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * Builds the file with IfcOpenShell's IfcHierarchyHelper: the spatial
 * structure IfcProject -> IfcSite -> IfcBuilding -> IfcBuildingStorey (one
 * storey per group) and one IfcBuildingElementProxy per element. Bodies are
 * written as IfcFacetedBrep from the element's boundary representation,
 * attributes as an IfcPropertySet and resolved styles as IfcSurfaceStyle.
 * Lengths are in metres.
 */

#pragma once

#include "model/model_graph.hpp"
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>

namespace geobim::io {

/// IfcTimeStamp is a 32-bit count of seconds since the Unix epoch
constexpr int64_t MAX_IFC_TIMESTAMP = std::numeric_limits<int32_t>::max();

/**
 * @brief Header and owner-history settings of the written file
 */
struct IfcWriterConfig {
    std::string building_name = "Building";
    std::string author_given_name = "GeoBIM";
    std::string author_family_name = "User";
    std::string organization_name = "GeoBIM";
    std::string application_name = "geobim";
    std::string application_version = "0.1.0";
    std::string application_identifier = "geobim";
    std::optional<int64_t> timestamp;       ///< Unix seconds in [0, MAX_IFC_TIMESTAMP]; current time when unset
};

/**
 * @brief Writer statistics for logging
 */
struct IfcWriterStats {
    size_t entity_count = 0;        ///< Instances in the DATA section
    size_t storeys = 0;
    size_t elements = 0;
    size_t property_sets = 0;
    size_t surface_styles = 0;      ///< Distinct resolved styles
    size_t faces = 0;
    double write_time_ms = 0.0;
};

/**
 * @brief Serializer for ModelGraph to IFC2X3
 *
 * Usage:
 * @code
 * geobim::io::IfcWriter writer;
 * if (!writer.write(graph, "model.ifc")) {
 *     spdlog::error("{}", writer.get_error());
 * }
 * @endcode
 */
class IfcWriter {
public:
    IfcWriter() = default;

    void set_config(const IfcWriterConfig& config) { m_config = config; }
    [[nodiscard]] const IfcWriterConfig& get_config() const { return m_config; }

    /**
     * @brief Serialize a graph to a file
     * @return true on success, false on failure (see get_error())
     */
    bool write(const model::ModelGraph& graph, const std::filesystem::path& filepath);

    /**
     * @brief Serialize a graph to a string
     * @param file_name Name recorded in the FILE_NAME header
     * @return File contents, empty on failure (see get_error())
     */
    [[nodiscard]] std::string write_string(const model::ModelGraph& graph,
                                           const std::string& file_name = "model.ifc");

    [[nodiscard]] const std::string& get_error() const { return m_error; }
    [[nodiscard]] const IfcWriterStats& get_stats() const { return m_stats; }

    void log_statistics() const;

private:
    IfcWriterConfig m_config;
    IfcWriterStats m_stats;
    std::string m_error;
};

} // namespace geobim::io
