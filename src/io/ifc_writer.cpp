/**
 * @file ifc_writer.cpp
 * @brief Implementation of the IFC2X3 writer using IfcOpenShell
 */

#include "io/ifc_writer.hpp"
#include "style/color.hpp"
#include <ifcparse/Ifc2x3.h>
#include <ifcparse/IfcGlobalId.h>
#include <ifcparse/IfcHierarchyHelper.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace geobim::io {

using Schema = Ifc2x3;
using IfcFile = IfcHierarchyHelper<Schema>;

static Schema::IfcValue* ifc_value(const AttributeValue& value) {
    switch (value_kind(value)) {
        case ValueKind::String:  return new Schema::IfcLabel(std::get<std::string>(value));
        case ValueKind::Number:  return new Schema::IfcReal(std::get<double>(value));
        case ValueKind::Boolean: return new Schema::IfcBoolean(std::get<bool>(value));
    }
    return nullptr;
}

static size_t count_instances(const std::string& text) {
    size_t count = 0;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.front() == '#') {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Internal Builder
// ============================================================================

/**
 * @brief Populates one IfcHierarchyHelper from a model graph
 */
class EntityBuilder {
public:
    EntityBuilder(IfcFile& file, const model::ModelGraph& graph,
                  const IfcWriterConfig& config, IfcWriterStats& stats)
        : m_file(file), m_graph(graph), m_config(config), m_stats(stats) {}

    void build(int64_t timestamp) {
        write_owner_history(timestamp);
        write_project();
        write_spatial_structure();
    }

private:
    void write_owner_history(int64_t timestamp) {
        m_owner_history = m_file.addOwnerHistory();

        auto* person = m_owner_history->OwningUser()->ThePerson();
        person->setGivenName(m_config.author_given_name);
        person->setFamilyName(m_config.author_family_name);
        m_owner_history->OwningUser()->TheOrganization()->setName(m_config.organization_name);

        auto* application = m_owner_history->OwningApplication();
        application->setApplicationFullName(m_config.application_name);
        application->setApplicationIdentifier(m_config.application_identifier);
        application->setVersion(m_config.application_version);
        application->ApplicationDeveloper()->setName(m_config.organization_name);

        m_owner_history->setCreationDate(static_cast<int>(timestamp));
    }

    // IfcHierarchyHelper::addProject() declares millimetres, so the unit
    // assignment is built here in metres
    void write_project() {
        IfcEntityList::ptr units(new IfcEntityList);
        auto* length = new Schema::IfcSIUnit(Schema::IfcUnitEnum::IfcUnit_LENGTHUNIT, boost::none,
                                             Schema::IfcSIUnitName::IfcSIUnitName_METRE);
        auto* area = new Schema::IfcSIUnit(Schema::IfcUnitEnum::IfcUnit_AREAUNIT, boost::none,
                                           Schema::IfcSIUnitName::IfcSIUnitName_SQUARE_METRE);
        auto* volume = new Schema::IfcSIUnit(Schema::IfcUnitEnum::IfcUnit_VOLUMEUNIT, boost::none,
                                             Schema::IfcSIUnitName::IfcSIUnitName_CUBIC_METRE);
        units->push(length);
        units->push(area);
        units->push(volume);

        auto* unit_assignment = new Schema::IfcUnitAssignment(units);

        Schema::IfcRepresentationContext::list::ptr contexts(new Schema::IfcRepresentationContext::list);
        m_project = new Schema::IfcProject(IfcParse::IfcGlobalId(), m_owner_history,
                                           m_graph.root().name, boost::none, boost::none,
                                           boost::none, boost::none, contexts, unit_assignment);

        m_file.addEntity(length);
        m_file.addEntity(area);
        m_file.addEntity(volume);
        m_file.addEntity(unit_assignment);
        m_file.addEntity(m_project);

        // Registers the 3D context with the project
        m_context = m_file.getRepresentationContext("Model");
    }

    void write_spatial_structure() {
        auto* site = m_file.addSite(m_project, m_owner_history);
        site->setName(m_graph.site().name);

        auto* building = m_file.addBuilding(site, m_owner_history);
        building->setName(m_config.building_name);

        for (const model::HierarchyNode* group : m_graph.groups()) {
            auto* storey = m_file.addBuildingStorey(building, m_owner_history);
            storey->setName(group->name);
            m_stats.storeys++;

            for (const model::ModelElement* element : m_graph.elements_of(*group)) {
                write_element(*element, storey);
            }
        }
    }

    Schema::IfcPolyLoop* write_loop(const std::vector<uint32_t>& loop,
                                    const std::vector<Schema::IfcCartesianPoint*>& points) {
        Schema::IfcCartesianPoint::list::ptr polygon(new Schema::IfcCartesianPoint::list);
        for (uint32_t index : loop) {
            polygon->push(points.at(index));
        }
        auto* poly_loop = new Schema::IfcPolyLoop(polygon);
        m_file.addEntity(poly_loop);
        return poly_loop;
    }

    Schema::IfcFacetedBrep* write_brep(const geometry::Brep& brep) {
        std::vector<Schema::IfcCartesianPoint*> points;
        points.reserve(brep.vertices.size());
        for (const auto& v : brep.vertices) {
            points.push_back(m_file.addTriplet<Schema::IfcCartesianPoint>(v.x, v.y, v.z));
        }

        Schema::IfcFace::list::ptr faces(new Schema::IfcFace::list);
        for (const auto& face : brep.faces) {
            if (face.outer.size() < 3) {
                continue;
            }

            Schema::IfcFaceBound::list::ptr bounds(new Schema::IfcFaceBound::list);
            auto* outer = new Schema::IfcFaceOuterBound(write_loop(face.outer, points), true);
            m_file.addEntity(outer);
            bounds->push(outer);

            for (const auto& inner : face.inner) {
                if (inner.size() < 3) {
                    continue;
                }
                auto* hole = new Schema::IfcFaceBound(write_loop(inner, points), true);
                m_file.addEntity(hole);
                bounds->push(hole);
            }

            auto* ifc_face = new Schema::IfcFace(bounds);
            m_file.addEntity(ifc_face);
            faces->push(ifc_face);
        }
        m_stats.faces += static_cast<size_t>(faces->size());

        auto* shell = new Schema::IfcClosedShell(faces);
        m_file.addEntity(shell);
        auto* solid = new Schema::IfcFacetedBrep(shell);
        m_file.addEntity(solid);
        return solid;
    }

    Schema::IfcPresentationStyleAssignment* style_assignment(const style::ResolvedStyle& resolved) {
        std::string key = style::color_to_hex(resolved.color) + "|" + resolved.category;
        auto it = m_styles.find(key);
        if (it != m_styles.end()) {
            return it->second;
        }

        const auto& c = resolved.color;
        auto* assignment = m_file.addStyleAssignment(c.r, c.g, c.b, c.a);

        IfcEntityList::ptr styles = assignment->Styles();
        for (auto item = styles->begin(); item != styles->end(); ++item) {
            if (auto* surface = (*item)->as<Schema::IfcSurfaceStyle>()) {
                surface->setName(resolved.category);
            }
        }

        m_styles.emplace(key, assignment);
        m_stats.surface_styles++;
        return assignment;
    }

    void write_element(const model::ModelElement& element, Schema::IfcBuildingStorey* storey) {
        Schema::IfcRepresentationItem::list::ptr items(new Schema::IfcRepresentationItem::list);
        items->push(write_brep(element.geometry.brep));

        auto* representation = new Schema::IfcShapeRepresentation(
            m_context, std::string("Body"), std::string("Brep"), items);
        m_file.addEntity(representation);

        Schema::IfcRepresentation::list::ptr representations(new Schema::IfcRepresentation::list);
        representations->push(representation);
        auto* shape = new Schema::IfcProductDefinitionShape(boost::none, boost::none, representations);
        m_file.addEntity(shape);

        auto* proxy = new Schema::IfcBuildingElementProxy(
            IfcParse::IfcGlobalId(), m_owner_history, element.name, boost::none,
            element.style.category, m_file.addLocalPlacement(storey->ObjectPlacement()),
            shape, boost::none, boost::none);
        m_file.addBuildingProduct(proxy, storey, m_owner_history);
        m_file.setSurfaceColour(shape, style_assignment(element.style));
        m_stats.elements++;

        if (!element.properties.empty()) {
            write_property_set(element.properties, proxy);
        }
    }

    void write_property_set(const model::PropertySet& properties, Schema::IfcBuildingElementProxy* proxy) {
        Schema::IfcProperty::list::ptr values(new Schema::IfcProperty::list);
        for (const auto& property : properties.properties) {
            auto* single = new Schema::IfcPropertySingleValue(property.name, boost::none,
                                                              ifc_value(property.value), nullptr);
            m_file.addEntity(single);
            values->push(single);
        }

        auto* pset = new Schema::IfcPropertySet(IfcParse::IfcGlobalId(), m_owner_history,
                                                properties.name, boost::none, values);
        m_file.addEntity(pset);

        Schema::IfcObject::list::ptr related(new Schema::IfcObject::list);
        related->push(proxy);
        auto* relation = new Schema::IfcRelDefinesByProperties(IfcParse::IfcGlobalId(), m_owner_history,
                                                               boost::none, boost::none, related, pset);
        m_file.addEntity(relation);
        m_stats.property_sets++;
    }

    IfcFile& m_file;
    const model::ModelGraph& m_graph;
    const IfcWriterConfig& m_config;
    IfcWriterStats& m_stats;

    Schema::IfcOwnerHistory* m_owner_history = nullptr;
    Schema::IfcProject* m_project = nullptr;
    Schema::IfcGeometricRepresentationContext* m_context = nullptr;
    std::map<std::string, Schema::IfcPresentationStyleAssignment*> m_styles;
};

// ============================================================================
// IfcWriter Implementation
// ============================================================================

std::string IfcWriter::write_string(const model::ModelGraph& graph, const std::string& file_name) {
    using Clock = std::chrono::high_resolution_clock;
    auto start_time = Clock::now();

    m_stats = IfcWriterStats{};
    m_error.clear();

    if (graph.nodes().size() < 2) {
        m_error = "Model graph has no project/site hierarchy";
        spdlog::error("IFC Writer: {}", m_error);
        return {};
    }

    const int64_t timestamp = m_config.timestamp.value_or(
        static_cast<int64_t>(std::time(nullptr)));
    if (timestamp < 0 || timestamp > MAX_IFC_TIMESTAMP) {
        m_error = fmt::format("Timestamp {} does not fit an IfcTimeStamp", timestamp);
        spdlog::error("IFC Writer: {}", m_error);
        return {};
    }

    try {

        IfcFile file;
        auto& header = file.header().file_name();
        header.name(file_name);
        header.time_stamp(fmt::format("{:%Y-%m-%dT%H:%M:%S}",
                                      fmt::gmtime(static_cast<std::time_t>(timestamp))));
        header.author({m_config.author_given_name + " " + m_config.author_family_name});
        header.organization({m_config.organization_name});
        header.preprocessor_version(m_config.application_name + " " + m_config.application_version);
        header.originating_system(m_config.application_name);

        EntityBuilder builder(file, graph, m_config, m_stats);
        builder.build(timestamp);

        std::ostringstream out;
        out << file;

        std::string text = out.str();
        m_stats.entity_count = count_instances(text);
        m_stats.write_time_ms = std::chrono::duration<double, std::milli>(
            Clock::now() - start_time).count();
        return text;

    } catch (const std::exception& e) {
        m_error = e.what();
        spdlog::error("IFC Writer error: {}", m_error);
        return {};
    }
}

bool IfcWriter::write(const model::ModelGraph& graph, const std::filesystem::path& filepath) {
    std::string content = write_string(graph, filepath.filename().string());
    if (content.empty()) {
        return false;
    }

    std::ofstream file(filepath, std::ios::binary);
    if (!file) {
        m_error = "Cannot open output file: " + filepath.string();
        spdlog::error("IFC Writer: {}", m_error);
        return false;
    }

    file << content;
    file.close();
    if (!file) {
        m_error = "Failed writing output file: " + filepath.string();
        spdlog::error("IFC Writer: {}", m_error);
        return false;
    }

    spdlog::info("IFC Writer: Wrote {} elements ({} entities) to {} in {:.1f}ms",
                 m_stats.elements, m_stats.entity_count, filepath.string(), m_stats.write_time_ms);
    return true;
}

void IfcWriter::log_statistics() const {
    spdlog::info("=== IFC Write Statistics ===");
    spdlog::info("  Entities: {}", m_stats.entity_count);
    spdlog::info("  Storeys: {}", m_stats.storeys);
    spdlog::info("  Elements: {}", m_stats.elements);
    spdlog::info("  Faces: {}", m_stats.faces);
    spdlog::info("  Property sets: {}", m_stats.property_sets);
    spdlog::info("  Surface styles: {}", m_stats.surface_styles);
    spdlog::info("  Write time: {:.1f}ms", m_stats.write_time_ms);
}

} // namespace geobim::io
