#include "model/model_assembler.hpp"
#include "core/error.hpp"
#include <spdlog/spdlog.h>

namespace geobim::model {

ModelAssembler::ModelAssembler(AssemblerConfig config) {
    NodeId project = add_node(NodeKind::Project, "", config.project_name, std::nullopt);
    m_site_id = add_node(NodeKind::Site, "", config.site_name, project);
}

NodeId ModelAssembler::add_node(NodeKind kind, const std::string& key, const std::string& name,
                                std::optional<NodeId> parent) {
    HierarchyNode node;
    node.id = static_cast<NodeId>(m_nodes.size());
    node.kind = kind;
    node.key = key;
    node.name = name;
    node.parent = parent;

    if (parent) {
        m_nodes[*parent].children.push_back(node.id);
    }

    m_nodes.push_back(std::move(node));
    return m_nodes.back().id;
}

void ModelAssembler::ensure_open(const char* operation) const {
    if (m_finalized) {
        spdlog::error("ModelAssembler: {} called after finalize()", operation);
        throw InvalidState(std::string("ModelAssembler::") + operation + " called after finalize()");
    }
}

NodeId ModelAssembler::get_or_create_group(const std::string& key) {
    ensure_open("get_or_create_group");

    auto it = m_group_index.find(key);
    if (it != m_group_index.end()) {
        return it->second;
    }

    NodeId id = add_node(NodeKind::Group, key, key.empty() ? "Default" : key, m_site_id);
    m_group_index.emplace(key, id);

    spdlog::debug("ModelAssembler: Created group '{}'", m_nodes[id].name);
    return id;
}

ElementId ModelAssembler::add_element(const std::string& group_key, ModelElement element) {
    ensure_open("add_element");

    NodeId group = get_or_create_group(group_key);

    element.id = static_cast<ElementId>(m_elements.size());
    element.parent = group;
    m_nodes[group].elements.push_back(element.id);

    m_elements.push_back(std::move(element));
    return m_elements.back().id;
}

ModelGraph ModelAssembler::finalize() {
    ensure_open("finalize");
    m_finalized = true;

    spdlog::debug("ModelAssembler: Finalized with {} groups and {} elements",
                  m_group_index.size(), m_elements.size());

    ModelGraph graph(std::move(m_nodes), std::move(m_elements));
    m_nodes.clear();
    m_elements.clear();
    m_group_index.clear();
    return graph;
}

} // namespace geobim::model
