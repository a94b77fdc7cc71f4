#include "model/model_graph.hpp"
#include <spdlog/spdlog.h>

namespace geobim::model {

std::vector<const HierarchyNode*> ModelGraph::groups() const {
    std::vector<const HierarchyNode*> result;
    for (const auto& node : m_nodes) {
        if (node.kind == NodeKind::Group) {
            result.push_back(&node);
        }
    }
    return result;
}

const HierarchyNode* ModelGraph::find_group(std::string_view key) const {
    for (const auto& node : m_nodes) {
        if (node.kind == NodeKind::Group && node.key == key) {
            return &node;
        }
    }
    return nullptr;
}

std::vector<const ModelElement*> ModelGraph::elements_of(const HierarchyNode& node) const {
    std::vector<const ModelElement*> result;
    result.reserve(node.elements.size());
    for (ElementId id : node.elements) {
        result.push_back(&m_elements.at(id));
    }
    return result;
}

void ModelGraph::log_summary() const {
    if (m_nodes.empty()) {
        spdlog::info("ModelGraph: empty");
        return;
    }

    spdlog::info("ModelGraph: {} '{}' / {} '{}', {} groups, {} elements",
                 node_kind_name(root().kind), root().name,
                 node_kind_name(site().kind), site().name,
                 groups().size(), m_elements.size());

    for (const HierarchyNode* group : groups()) {
        spdlog::info("  Group '{}': {} elements", group->name, group->elements.size());
    }
}

} // namespace geobim::model
