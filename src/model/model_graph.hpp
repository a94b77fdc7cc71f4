/**
 * @file model_graph.hpp
 * @brief Spatial hierarchy and converted elements handed to serializers
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * The hierarchy is project -> site -> group, one group per grouping key
 * (typically the source layer). Elements hang off group nodes. Node and
 * element ids are indices assigned in insertion order, so the same input
 * always produces the same ids.
 */

#pragma once

#include "core/types.hpp"
#include "geometry/primitives.hpp"
#include "model/property_set.hpp"
#include "style/style_table.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geobim::model {

/// Index of a node in ModelGraph::nodes()
using NodeId = uint32_t;

/// Index of an element in ModelGraph::elements()
using ElementId = uint32_t;

/**
 * @brief Role of a hierarchy node
 */
enum class NodeKind {
    Project,    ///< Root of the hierarchy
    Site,       ///< Single site below the project
    Group       ///< Grouping level keyed by source layer
};

[[nodiscard]] inline const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Project: return "Project";
        case NodeKind::Site:    return "Site";
        case NodeKind::Group:   return "Group";
    }
    return "Unknown";
}

/**
 * @brief Spatial grouping container
 */
struct HierarchyNode {
    NodeId id = 0;                          ///< Index in the graph
    NodeKind kind = NodeKind::Group;        ///< Role in the hierarchy
    std::string key;                        ///< Grouping key (empty for project/site)
    std::string name;                       ///< Display name
    std::optional<NodeId> parent;           ///< Parent node, none for the project
    std::vector<NodeId> children;           ///< Child nodes in creation order
    std::vector<ElementId> elements;        ///< Contained elements in insertion order
};

/**
 * @brief One converted feature
 */
struct ModelElement {
    ElementId id = 0;                           ///< Index in the graph (set on registration)
    std::string name;                           ///< Display name
    RecordKind source_kind = RecordKind::Point; ///< Kind of the originating record
    int64_t source_id = -1;                     ///< Feature index in the source
    geometry::SolidGeometry geometry;           ///< Solid with boundary representation
    style::ResolvedStyle style;                 ///< Always a concrete or the default style
    PropertySet properties;                     ///< Attributes as typed properties
    NodeId parent = 0;                          ///< Owning group (set on registration)
};

/**
 * @brief Finalized, read-only model
 */
class ModelGraph {
public:
    ModelGraph() = default;

    [[nodiscard]] const HierarchyNode& root() const { return m_nodes.at(0); }
    [[nodiscard]] const HierarchyNode& site() const { return m_nodes.at(1); }

    [[nodiscard]] const HierarchyNode& node(NodeId id) const { return m_nodes.at(id); }
    [[nodiscard]] const ModelElement& element(ElementId id) const { return m_elements.at(id); }

    [[nodiscard]] const std::vector<HierarchyNode>& nodes() const { return m_nodes; }
    [[nodiscard]] const std::vector<ModelElement>& elements() const { return m_elements; }

    [[nodiscard]] size_t element_count() const { return m_elements.size(); }

    /**
     * @brief Group nodes in creation order
     */
    [[nodiscard]] std::vector<const HierarchyNode*> groups() const;

    /**
     * @brief Find a group node by key
     * @return Pointer to the node, or nullptr if no such group exists
     */
    [[nodiscard]] const HierarchyNode* find_group(std::string_view key) const;

    /**
     * @brief Elements contained in a node, in insertion order
     */
    [[nodiscard]] std::vector<const ModelElement*> elements_of(const HierarchyNode& node) const;

    /**
     * @brief Log a summary of the hierarchy to spdlog
     */
    void log_summary() const;

private:
    friend class ModelAssembler;

    ModelGraph(std::vector<HierarchyNode> nodes, std::vector<ModelElement> elements)
        : m_nodes(std::move(nodes)), m_elements(std::move(elements)) {}

    std::vector<HierarchyNode> m_nodes;
    std::vector<ModelElement> m_elements;
};

} // namespace geobim::model
