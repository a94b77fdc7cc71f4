/**
 * @file feature_converter.hpp
 * @brief Converts input records into styled, attributed solids
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * Points become boxes, lines become swept pipes and polygons become
 * extruded solids. Record-level failures skip the record and are collected
 * as warnings; the run continues with the next record.
 */

#pragma once

#include "convert/conversion_params.hpp"
#include "core/types.hpp"
#include "model/model_assembler.hpp"
#include "model/model_graph.hpp"
#include "style/style_table.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geobim::convert {

/**
 * @brief Outcome of a complete run
 *
 * `warnings` empty means full success; otherwise the graph still holds
 * every record that converted.
 */
struct ConversionResult {
    model::ModelGraph graph;
    std::vector<ConversionWarning> warnings;
    ConversionStatistics stats;

    [[nodiscard]] bool complete() const { return warnings.empty(); }
};

/**
 * @brief Per-record conversion into a ModelAssembler
 *
 * Usage:
 * @code
 * model::ModelAssembler assembler;
 * FeatureConverter converter(styles, params, assembler);
 * for (size_t i = 0; i < records.size(); ++i) {
 *     converter.dispatch(records[i].record, records[i].group, i);
 * }
 * auto graph = assembler.finalize();
 * @endcode
 */
class FeatureConverter {
public:
    /**
     * @param styles Rule table, must outlive the converter
     * @param params Conversion options
     * @param assembler Receives converted elements, must outlive the converter
     */
    FeatureConverter(const style::StyleTable& styles, ConversionParams params,
                     model::ModelAssembler& assembler);

    /**
     * @brief Convert one record and register it under `group_key`
     * @param record Input feature
     * @param group_key Grouping key (source layer)
     * @param record_index Position in the input, used in warnings
     * @return Id of the registered element, or nullopt if the record was skipped
     * @throws InvalidState if the assembler has been finalized
     */
    std::optional<model::ElementId> dispatch(const Record& record, const std::string& group_key,
                                             size_t record_index);

    /**
     * @brief Build the element for a record without registering it
     *
     * Pure function of the record, the style table and the parameters.
     *
     * @param notes Receives non-fatal geometry diagnostics, may be null
     * @throws InvalidGeometry for degenerate geometry
     * @throws UnsupportedRecordKind for kinds other than point/line/polygon
     */
    [[nodiscard]] model::ModelElement build_element(const Record& record,
                                                    std::vector<std::string>* notes = nullptr) const;

    [[nodiscard]] const std::vector<ConversionWarning>& warnings() const { return m_warnings; }
    [[nodiscard]] std::vector<ConversionWarning> take_warnings();

    [[nodiscard]] const ConversionStatistics& get_statistics() const { return m_stats; }
    [[nodiscard]] const ConversionParams& get_params() const { return m_params; }

    /**
     * @brief Log conversion statistics to spdlog
     */
    void log_statistics() const;

private:
    [[nodiscard]] geometry::SolidGeometry build_geometry(const Record& record,
                                                         std::vector<std::string>* notes) const;

    [[nodiscard]] model::ModelElement build_centroid_marker(const Record& record,
                                                            const model::ModelElement& footprint) const;

    [[nodiscard]] glm::dvec3 flatten(const glm::dvec3& p) const;

    void add_warning(size_t record_index, const Record& record, const std::string& group_key,
                     ErrorKind kind, const std::string& message, bool skipped);
    void count_skipped(RecordKind kind);

    const style::StyleTable& m_styles;
    ConversionParams m_params;
    model::ModelAssembler& m_assembler;
    std::vector<ConversionWarning> m_warnings;
    ConversionStatistics m_stats;
};

/**
 * @brief Look up the first attribute among `fields` that holds a number
 */
[[nodiscard]] std::optional<double> numeric_override(const AttributeList& attributes,
                                                     const std::vector<std::string>& fields);

/**
 * @brief Log conversion statistics to spdlog
 */
void log_statistics(const ConversionStatistics& stats, size_t warning_count);

/**
 * @brief Convert a finite record sequence in input order
 *
 * @throws InvalidState on assembler misuse (programmer error)
 */
[[nodiscard]] ConversionResult convert(const std::vector<SourceRecord>& records,
                                       const style::StyleTable& styles,
                                       const ConversionParams& params,
                                       const model::AssemblerConfig& assembler_config = {});

} // namespace geobim::convert
