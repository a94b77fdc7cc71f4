#include "core/application.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace geobim;

namespace {

bool parse(const std::vector<std::string>& args, AppOptions& options, std::string& error) {
    options = AppOptions{};
    error.clear();
    return parse_arguments(args, options, error);
}

} // namespace

TEST(ParseArgumentsTest, PositionalInputsAndOutput) {
    AppOptions options;
    std::string error;

    ASSERT_TRUE(parse({"roads.geojson", "buildings/", "-o", "city.ifc"}, options, error)) << error;
    ASSERT_EQ(options.inputs.size(), 2u);
    EXPECT_EQ(options.inputs[0].string(), "roads.geojson");
    EXPECT_EQ(options.inputs[1].string(), "buildings/");
    EXPECT_EQ(options.output.string(), "city.ifc");
    EXPECT_FALSE(options.show_help);
}

TEST(ParseArgumentsTest, AppendsIfcExtension) {
    AppOptions options;
    std::string error;

    ASSERT_TRUE(parse({"-i", "a.geojson", "--output", "model"}, options, error));
    EXPECT_EQ(options.output.string(), "model.ifc");

    ASSERT_TRUE(parse({"-i", "a.geojson", "-o", "model.IFC"}, options, error));
    EXPECT_EQ(options.output.string(), "model.IFC");

    ASSERT_TRUE(parse({"-i", "a.geojson", "-o", "model.json"}, options, error));
    EXPECT_EQ(options.output.string(), "model.json.ifc");
}

TEST(ParseArgumentsTest, ConversionParameters) {
    AppOptions options;
    std::string error;

    ASSERT_TRUE(parse({"-i", "a.geojson", "-o", "out.ifc",
                       "--point-size", "1.5", "--pipe-radius", "0.25", "--extrusion-height", "4",
                       "--pipe-segments", "24", "--property-set", "GIS", "--use-z", "--centroids",
                       "-s", "styles.json"},
                      options, error)) << error;

    EXPECT_DOUBLE_EQ(options.params.point_size, 1.5);
    EXPECT_DOUBLE_EQ(options.params.pipe_radius, 0.25);
    EXPECT_DOUBLE_EQ(options.params.extrusion_height, 4.0);
    EXPECT_EQ(options.params.pipe_segments, 24);
    EXPECT_EQ(options.params.property_set_name, "GIS");
    EXPECT_TRUE(options.params.use_z);
    EXPECT_TRUE(options.params.polygon_centroid_markers);
    EXPECT_EQ(options.style_path.string(), "styles.json");
}

TEST(ParseArgumentsTest, ModelAndHeaderNames) {
    AppOptions options;
    std::string error;

    ASSERT_TRUE(parse({"-i", "a.geojson", "-o", "out.ifc", "--project", "Aarhus", "--site", "Midtbyen",
                       "--building", "Blok A", "--organization", "Kommune", "--timestamp", "1700000000"},
                      options, error)) << error;

    EXPECT_EQ(options.assembler.project_name, "Aarhus");
    EXPECT_EQ(options.assembler.site_name, "Midtbyen");
    EXPECT_EQ(options.writer.building_name, "Blok A");
    EXPECT_EQ(options.writer.organization_name, "Kommune");
    ASSERT_TRUE(options.writer.timestamp.has_value());
    EXPECT_EQ(*options.writer.timestamp, 1700000000);
}

TEST(ParseArgumentsTest, DefaultsAreKept) {
    AppOptions options;
    std::string error;

    ASSERT_TRUE(parse({"a.geojson", "-o", "out.ifc"}, options, error));
    EXPECT_DOUBLE_EQ(options.params.point_size, convert::ConversionParams{}.point_size);
    EXPECT_FALSE(options.params.use_z);
    EXPECT_FALSE(options.writer.timestamp.has_value());
    EXPECT_TRUE(options.style_path.empty());
}

TEST(ParseArgumentsTest, HelpShortCircuits) {
    AppOptions options;
    std::string error;

    EXPECT_TRUE(parse({"--help"}, options, error));
    EXPECT_TRUE(options.show_help);

    EXPECT_FALSE(parse({"--bogus", "-h"}, options, error));
}

TEST(ParseArgumentsTest, RejectsBadInput) {
    AppOptions options;
    std::string error;

    EXPECT_FALSE(parse({}, options, error));
    EXPECT_FALSE(parse({"-o", "out.ifc"}, options, error));
    EXPECT_NE(error.find("no input"), std::string::npos);

    EXPECT_FALSE(parse({"a.geojson"}, options, error));
    EXPECT_NE(error.find("no output"), std::string::npos);

    EXPECT_FALSE(parse({"a.geojson", "-o"}, options, error));
    EXPECT_NE(error.find("missing value"), std::string::npos);

    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--frobnicate"}, options, error));
    EXPECT_NE(error.find("unknown option"), std::string::npos);

    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "-v", "-q"}, options, error));
}

TEST(ParseArgumentsTest, RejectsBadNumbers) {
    AppOptions options;
    std::string error;

    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--point-size", "0"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--pipe-radius", "-1"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--extrusion-height", "tall"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--extrusion-height", "3m"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--pipe-segments", "2"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--pipe-segments", "8.5"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--pipe-segments", "1000"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--point-size", "nan"}, options, error));
}

TEST(ParseArgumentsTest, TimestampMustBeWholeSecondsInRange) {
    AppOptions options;
    std::string error;

    ASSERT_TRUE(parse({"a.geojson", "-o", "x", "--timestamp", "0"}, options, error)) << error;
    EXPECT_EQ(*options.writer.timestamp, 0);

    ASSERT_TRUE(parse({"a.geojson", "-o", "x", "--timestamp", "2147483647"}, options, error)) << error;
    EXPECT_EQ(*options.writer.timestamp, io::MAX_IFC_TIMESTAMP);

    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--timestamp", "1e30"}, options, error));
    EXPECT_NE(error.find("--timestamp"), std::string::npos);
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--timestamp", "1.5"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--timestamp", "-1"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--timestamp", "2147483648"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--timestamp", "99999999999999999999"}, options, error));
    EXPECT_FALSE(parse({"a.geojson", "-o", "x", "--timestamp", "nan"}, options, error));
    EXPECT_FALSE(options.writer.timestamp.has_value());
}

// ============================================================================
// Application::run
// ============================================================================

namespace {

const char* const POINT_FEATURE = R"({
    "type": "Feature",
    "properties": { "name": "Mast" },
    "geometry": { "type": "Point", "coordinates": [10.0, 20.0] } })";

std::string feature_collection(const std::vector<std::string>& features) {
    std::string text = R"({ "type": "FeatureCollection", "features": [)";
    for (size_t i = 0; i < features.size(); ++i) {
        if (i > 0) text += ",";
        text += features[i];
    }
    return text + "] }";
}

} // namespace

class ApplicationRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("geobim_app_") + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        output = dir / "out.ifc";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        std::filesystem::path path = dir / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::string read_output() const {
        std::ifstream file(output, std::ios::binary);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    // Runs the application like main() does; -1 when init() rejects the arguments
    int run_app(std::vector<std::string> args) {
        args.insert(args.begin(), {"geobim", "-q", "--timestamp", "0", "-o", output.string()});
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }

        Application app;
        if (!app.init(static_cast<int>(argv.size()), argv.data())) {
            return -1;
        }
        int status = app.run();
        app.shutdown();
        return status;
    }

    static size_t count(const std::string& text, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
            ++n;
        }
        return n;
    }

    std::filesystem::path dir;
    std::filesystem::path output;
};

TEST_F(ApplicationRunTest, WritesModelForValidInput) {
    auto input = write_file("points.geojson", feature_collection({POINT_FEATURE}));

    ASSERT_EQ(run_app({input.string()}), 0);
    ASSERT_TRUE(std::filesystem::exists(output));

    std::string text = read_output();
    EXPECT_EQ(text.rfind("ISO-10303-21;", 0), 0u);
    EXPECT_EQ(count(text, "IFCBUILDINGELEMENTPROXY("), 1u);
    EXPECT_NE(text.find("IFCLABEL('Mast')"), std::string::npos);
}

TEST_F(ApplicationRunTest, MalformedStyleFileFailsBeforeConversion) {
    auto input = write_file("points.geojson", feature_collection({POINT_FEATURE}));
    auto styles = write_file("styles.json", R"({"rules": [ { "color": "red" } ]})");

    EXPECT_EQ(run_app({"-s", styles.string(), input.string()}), 1);
    EXPECT_FALSE(std::filesystem::exists(output));

    write_file("styles.json", "{ not json");
    EXPECT_EQ(run_app({"-s", styles.string(), input.string()}), 1);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(ApplicationRunTest, SkippedRecordsStillWriteOutput) {
    const std::string degenerate_polygon = R"({
        "type": "Feature", "properties": {},
        "geometry": { "type": "Polygon", "coordinates": [[[0, 0], [1, 0], [0, 0]]] } })";
    const std::string multi_point = R"({
        "type": "Feature", "properties": {},
        "geometry": { "type": "MultiPoint", "coordinates": [[0, 0], [1, 1]] } })";
    auto input = write_file("mixed.geojson",
                            feature_collection({degenerate_polygon, POINT_FEATURE, multi_point}));

    ASSERT_EQ(run_app({input.string()}), 0);
    ASSERT_TRUE(std::filesystem::exists(output));
    EXPECT_EQ(count(read_output(), "IFCBUILDINGELEMENTPROXY("), 1u);
}

TEST_F(ApplicationRunTest, CorruptFeatureDoesNotAbortRun) {
    const std::string corrupt = R"({ "type": "Feature", "properties": {}, "geometry": "corrupt" })";
    auto input = write_file("corrupt.geojson",
                            feature_collection({POINT_FEATURE, corrupt, "42", POINT_FEATURE}));

    ASSERT_EQ(run_app({input.string()}), 0);
    ASSERT_TRUE(std::filesystem::exists(output));
    EXPECT_EQ(count(read_output(), "IFCBUILDINGELEMENTPROXY("), 2u);
}

TEST_F(ApplicationRunTest, UnreadableInputFails) {
    auto input = write_file("broken.geojson", "{ \"type\": \"FeatureCollection\", ");

    EXPECT_EQ(run_app({input.string()}), 1);
    EXPECT_FALSE(std::filesystem::exists(output));

    EXPECT_EQ(run_app({(dir / "missing.geojson").string()}), 1);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(ApplicationRunTest, InvalidArgumentsAreRejectedByInit) {
    EXPECT_EQ(run_app({"--timestamp", "1.5", "a.geojson"}), -1);
}
