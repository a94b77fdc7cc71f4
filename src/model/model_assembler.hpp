#pragma once

#include "model/model_graph.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace geobim::model {

/**
 * @brief Names of the fixed top levels of the hierarchy
 */
struct AssemblerConfig {
    std::string project_name = "GeoBIM Project";
    std::string site_name = "Site";
};

/**
 * @brief Accumulates converted elements into one hierarchy
 *
 * Creates the project and site nodes on construction and a group node on
 * the first reference to each grouping key. Single writer: callers that
 * build geometry concurrently must serialize calls into the assembler.
 *
 * Usage:
 * @code
 * ModelAssembler assembler;
 * assembler.add_element("buildings", std::move(element));
 * ModelGraph graph = assembler.finalize();
 * @endcode
 */
class ModelAssembler {
public:
    explicit ModelAssembler(AssemblerConfig config = {});

    // Non-copyable, movable
    ModelAssembler(const ModelAssembler&) = delete;
    ModelAssembler& operator=(const ModelAssembler&) = delete;
    ModelAssembler(ModelAssembler&&) noexcept = default;
    ModelAssembler& operator=(ModelAssembler&&) noexcept = default;

    /**
     * @brief Return the group node for a key, creating it on first use
     *
     * Idempotent within a run; groups keep their creation order.
     *
     * @throws InvalidState after finalize()
     */
    NodeId get_or_create_group(const std::string& key);

    /**
     * @brief Append an element to the group for `group_key`
     *
     * Assigns the element's id and parent. Never deduplicates.
     *
     * @return Id of the registered element
     * @throws InvalidState after finalize()
     */
    ElementId add_element(const std::string& group_key, ModelElement element);

    /**
     * @brief Hand over the accumulated hierarchy
     *
     * Callable once; every mutating call afterwards throws InvalidState.
     *
     * @throws InvalidState if already finalized
     */
    ModelGraph finalize();

    [[nodiscard]] bool is_finalized() const { return m_finalized; }

    [[nodiscard]] const HierarchyNode& node(NodeId id) const { return m_nodes.at(id); }

    [[nodiscard]] size_t element_count() const { return m_elements.size(); }
    [[nodiscard]] size_t group_count() const { return m_group_index.size(); }

private:
    void ensure_open(const char* operation) const;

    NodeId add_node(NodeKind kind, const std::string& key, const std::string& name,
                    std::optional<NodeId> parent);

    std::vector<HierarchyNode> m_nodes;
    std::vector<ModelElement> m_elements;
    std::unordered_map<std::string, NodeId> m_group_index;
    NodeId m_site_id = 0;
    bool m_finalized = false;
};

} // namespace geobim::model
