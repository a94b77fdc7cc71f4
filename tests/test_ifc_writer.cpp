#include "convert/feature_converter.hpp"
#include "io/ifc_writer.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

using namespace geobim;
using namespace geobim::io;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

SourceRecord make_record(RecordKind kind, std::vector<glm::dvec3> vertices,
                         AttributeList attributes, const std::string& group, int64_t source_id) {
    SourceRecord entry;
    entry.group = group;
    entry.record.kind = kind;
    entry.record.vertices = std::move(vertices);
    entry.record.attributes = std::move(attributes);
    entry.record.source_id = source_id;
    return entry;
}

model::ModelGraph sample_graph() {
    style::StyleRule rule;
    rule.id = "dwelling";
    rule.conditions = {{"objtype", std::string("Bygning")}};
    rule.color = style::Color(0.8f, 0.6f, 0.4f, 1.0f);
    rule.category = "Bolig";
    style::StyleTable styles({rule});

    std::vector<SourceRecord> records = {
        make_record(RecordKind::Polygon, {{0, 0, 0}, {10, 0, 0}, {10, 10, 0}, {0, 10, 0}},
                    {{"objtype", std::string("Bygning")}, {"buildingHeight", 6.0}, {"fredet", true}},
                    "buildings", 0),
        make_record(RecordKind::Polygon, {{20, 0, 0}, {30, 0, 0}, {30, 5, 0}},
                    {{"objtype", std::string("Bygning")}}, "buildings", 1),
        make_record(RecordKind::Line, {{0, 0, 0}, {50, 0, 0}}, {}, "roads", 0),
        make_record(RecordKind::Point, {{5, 5, 0}}, {}, "trees", 0),
    };

    model::AssemblerConfig config;
    config.project_name = "Test Project";
    return convert::convert(records, styles, convert::ConversionParams{}, config).graph;
}

const std::regex GLOBAL_ID("'[0-9A-Za-z_$]{22}'");

// GlobalIds are random per write; everything else must match
std::string mask_global_ids(const std::string& text) {
    return std::regex_replace(text, GLOBAL_ID, "'<guid>'");
}

IfcWriterConfig fixed_config() {
    IfcWriterConfig config;
    config.timestamp = 0;
    return config;
}

} // namespace

// ============================================================================
// IfcWriter
// ============================================================================

class IfcWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph = sample_graph();
        writer.set_config(fixed_config());
    }

    model::ModelGraph graph;
    IfcWriter writer;
};

TEST_F(IfcWriterTest, WritesHeaderAndSections) {
    std::string text = writer.write_string(graph, "city.ifc");
    ASSERT_FALSE(text.empty()) << writer.get_error();

    EXPECT_EQ(text.rfind("ISO-10303-21;", 0), 0u);
    EXPECT_NE(text.find("FILE_NAME('city.ifc','1970-01-01T00:00:00'"), std::string::npos);
    EXPECT_NE(text.find("FILE_SCHEMA(('IFC2X3'))"), std::string::npos);
    EXPECT_NE(text.find("DATA;"), std::string::npos);
    EXPECT_NE(text.find("END-ISO-10303-21;"), std::string::npos);
}

TEST_F(IfcWriterTest, OwnerHistoryAndUnits) {
    IfcWriterConfig config = fixed_config();
    config.organization_name = "Kommune";
    writer.set_config(config);

    std::string text = writer.write_string(graph);

    EXPECT_EQ(count_occurrences(text, "=IFCOWNERHISTORY("), 1u);
    EXPECT_NE(text.find("'Kommune'"), std::string::npos);
    EXPECT_NE(text.find(".LENGTHUNIT.,$,.METRE."), std::string::npos);
    EXPECT_NE(text.find(".AREAUNIT.,$,.SQUARE_METRE."), std::string::npos);
    EXPECT_NE(text.find(".VOLUMEUNIT.,$,.CUBIC_METRE."), std::string::npos);
    EXPECT_EQ(text.find(".MILLI."), std::string::npos);
}

TEST_F(IfcWriterTest, SpatialStructureMirrorsGraph) {
    std::string text = writer.write_string(graph);

    EXPECT_EQ(count_occurrences(text, "=IFCPROJECT("), 1u);
    EXPECT_EQ(count_occurrences(text, "=IFCSITE("), 1u);
    EXPECT_EQ(count_occurrences(text, "=IFCBUILDING("), 1u);
    EXPECT_EQ(count_occurrences(text, "=IFCBUILDINGSTOREY("), 3u);
    EXPECT_EQ(count_occurrences(text, "=IFCBUILDINGELEMENTPROXY("), 4u);
    EXPECT_EQ(count_occurrences(text, "=IFCRELCONTAINEDINSPATIALSTRUCTURE("), 3u);
    EXPECT_EQ(count_occurrences(text, "=IFCRELAGGREGATES("), 3u);
    EXPECT_EQ(count_occurrences(text, "=IFCFACETEDBREP("), 4u);

    EXPECT_NE(text.find("'Test Project'"), std::string::npos);
    EXPECT_NE(text.find("'buildings'"), std::string::npos);
    EXPECT_NE(text.find("'Bolig 0'"), std::string::npos);

    const auto& stats = writer.get_stats();
    EXPECT_EQ(stats.storeys, 3u);
    EXPECT_EQ(stats.elements, 4u);
}

TEST_F(IfcWriterTest, PropertiesAndStyles) {
    std::string text = writer.write_string(graph);

    // Only the two building footprints carry attributes
    EXPECT_EQ(count_occurrences(text, "=IFCPROPERTYSET("), 2u);
    EXPECT_EQ(writer.get_stats().property_sets, 2u);
    EXPECT_NE(text.find("IFCPROPERTYSINGLEVALUE('objtype',$,IFCLABEL('Bygning'),$)"), std::string::npos);
    EXPECT_TRUE(std::regex_search(text, std::regex(R"(IFCPROPERTYSINGLEVALUE\('buildingHeight',\$,IFCREAL\(6\.0*\),\$\))")));
    EXPECT_NE(text.find("IFCPROPERTYSINGLEVALUE('fredet',$,IFCBOOLEAN(.T.),$)"), std::string::npos);
    EXPECT_NE(text.find(",'Attributes',$,"), std::string::npos);

    // Dwelling style shared by both buildings, default style by road and tree
    EXPECT_EQ(count_occurrences(text, "=IFCSURFACESTYLE("), 2u);
    EXPECT_EQ(writer.get_stats().surface_styles, 2u);
    EXPECT_EQ(count_occurrences(text, "=IFCSTYLEDITEM("), 4u);
    EXPECT_NE(text.find("IFCSURFACESTYLE('Bolig'"), std::string::npos);
}

TEST_F(IfcWriterTest, CountsInstances) {
    std::string text = writer.write_string(graph);

    std::istringstream lines(text);
    std::string line;
    size_t instances = 0;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.front() == '#') {
            ++instances;
        }
    }
    EXPECT_GT(instances, 0u);
    EXPECT_EQ(writer.get_stats().entity_count, instances);
    EXPECT_GT(writer.get_stats().faces, 0u);
}

TEST_F(IfcWriterTest, OutputIsStableApartFromGlobalIds) {
    std::string first = writer.write_string(graph);
    std::string second = writer.write_string(sample_graph());
    ASSERT_FALSE(first.empty());
    EXPECT_EQ(mask_global_ids(first), mask_global_ids(second));
}

TEST_F(IfcWriterTest, GlobalIdsAreUnique) {
    std::string text = writer.write_string(graph);

    // Rooted entities carry their GlobalId as the first attribute
    std::vector<std::string> ids;
    const std::regex rooted(R"(=IFC[A-Z]+\('([0-9A-Za-z_$]{22})',#)");
    for (auto it = std::sregex_iterator(text.begin(), text.end(), rooted); it != std::sregex_iterator(); ++it) {
        ids.push_back((*it)[1].str());
    }
    // project, site, building, 3 storeys, 4 proxies, 2 property sets and their relations
    ASSERT_GE(ids.size(), 13u);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(std::adjacent_find(ids.begin(), ids.end()), ids.end());
}

TEST_F(IfcWriterTest, RejectsGraphWithoutHierarchy) {
    model::ModelGraph empty;
    EXPECT_TRUE(writer.write_string(empty).empty());
    EXPECT_FALSE(writer.get_error().empty());
}

TEST_F(IfcWriterTest, RejectsTimestampOutsideIfcRange) {
    IfcWriterConfig config = fixed_config();
    config.timestamp = MAX_IFC_TIMESTAMP + 1;
    writer.set_config(config);
    EXPECT_TRUE(writer.write_string(graph).empty());
    EXPECT_NE(writer.get_error().find("IfcTimeStamp"), std::string::npos);

    config.timestamp = -1;
    writer.set_config(config);
    EXPECT_TRUE(writer.write_string(graph).empty());

    config.timestamp = MAX_IFC_TIMESTAMP;
    writer.set_config(config);
    EXPECT_FALSE(writer.write_string(graph).empty()) << writer.get_error();
}

TEST_F(IfcWriterTest, WritesFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "geobim_writer_test.ifc";
    std::filesystem::remove(path);

    ASSERT_TRUE(writer.write(graph, path)) << writer.get_error();

    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(mask_global_ids(content.str()),
              mask_global_ids(writer.write_string(graph, "geobim_writer_test.ifc")));

    std::filesystem::remove(path);
}

TEST_F(IfcWriterTest, UnwritablePathFails) {
    EXPECT_FALSE(writer.write(graph, "/nonexistent/geobim/out.ifc"));
    EXPECT_NE(writer.get_error().find("Cannot open"), std::string::npos);
}
