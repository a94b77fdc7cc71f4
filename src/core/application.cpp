#include "core/application.hpp"
#include "convert/feature_converter.hpp"
#include "core/error.hpp"
#include "io/geojson_reader.hpp"
#include "style/style_loader.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>

namespace geobim {

// ============================================================================
// Argument Parsing
// ============================================================================

static bool parse_number(const std::string& option, const std::string& text, double& out,
                         std::string& error) {
    try {
        size_t consumed = 0;
        out = std::stod(text, &consumed);
        if (consumed != text.size()) {
            error = fmt::format("invalid number '{}' for {}", text, option);
            return false;
        }
        return true;
    } catch (const std::invalid_argument&) {
        error = fmt::format("invalid number '{}' for {}", text, option);
    } catch (const std::out_of_range&) {
        error = fmt::format("number '{}' for {} is out of range", text, option);
    }
    return false;
}

static bool parse_positive(const std::string& option, const std::string& text, double& out,
                           std::string& error) {
    if (!parse_number(option, text, out, error)) {
        return false;
    }
    if (!(out > 0.0)) {
        error = fmt::format("{} must be positive, got {}", option, text);
        return false;
    }
    return true;
}

static bool parse_timestamp(const std::string& option, const std::string& text, int64_t& out,
                            std::string& error) {
    const std::string expected = fmt::format("{} must be whole seconds between 0 and {}",
                                             option, io::MAX_IFC_TIMESTAMP);
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0 || value > io::MAX_IFC_TIMESTAMP) {
            error = fmt::format("{}, got '{}'", expected, text);
            return false;
        }
        out = static_cast<int64_t>(value);
        return true;
    } catch (const std::invalid_argument&) {
        error = fmt::format("{}, got '{}'", expected, text);
    } catch (const std::out_of_range&) {
        error = fmt::format("{}, got '{}'", expected, text);
    }
    return false;
}

static std::filesystem::path with_ifc_extension(std::filesystem::path path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext != ".ifc") {
        path += ".ifc";
    }
    return path;
}

bool parse_arguments(const std::vector<std::string>& args, AppOptions& options, std::string& error) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Options that take a value
        auto value = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                error = "missing value for " + arg;
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string text;
        double number = 0.0;

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return true;
        } else if (arg == "-i" || arg == "--input") {
            if (!value(text)) return false;
            options.inputs.emplace_back(text);
        } else if (arg == "-o" || arg == "--output") {
            if (!value(text)) return false;
            options.output = text;
        } else if (arg == "-s" || arg == "--style") {
            if (!value(text)) return false;
            options.style_path = text;
        } else if (arg == "--point-size") {
            if (!value(text) || !parse_positive(arg, text, number, error)) return false;
            options.params.point_size = number;
        } else if (arg == "--pipe-radius") {
            if (!value(text) || !parse_positive(arg, text, number, error)) return false;
            options.params.pipe_radius = number;
        } else if (arg == "--extrusion-height") {
            if (!value(text) || !parse_positive(arg, text, number, error)) return false;
            options.params.extrusion_height = number;
        } else if (arg == "--pipe-segments") {
            if (!value(text) || !parse_number(arg, text, number, error)) return false;
            if (number < 3.0 || number > 256.0 || number != static_cast<int>(number)) {
                error = "--pipe-segments must be an integer between 3 and 256";
                return false;
            }
            options.params.pipe_segments = static_cast<int>(number);
        } else if (arg == "--property-set") {
            if (!value(text)) return false;
            options.params.property_set_name = text;
        } else if (arg == "--use-z") {
            options.params.use_z = true;
        } else if (arg == "--centroids") {
            options.params.polygon_centroid_markers = true;
        } else if (arg == "--project") {
            if (!value(options.assembler.project_name)) return false;
        } else if (arg == "--site") {
            if (!value(options.assembler.site_name)) return false;
        } else if (arg == "--building") {
            if (!value(options.writer.building_name)) return false;
        } else if (arg == "--organization") {
            if (!value(options.writer.organization_name)) return false;
        } else if (arg == "--timestamp") {
            int64_t seconds = 0;
            if (!value(text) || !parse_timestamp(arg, text, seconds, error)) return false;
            options.writer.timestamp = seconds;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "unknown option " + arg;
            return false;
        } else {
            options.inputs.emplace_back(arg);
        }
    }

    if (options.verbose && options.quiet) {
        error = "--verbose and --quiet are mutually exclusive";
        return false;
    }
    if (options.inputs.empty()) {
        error = "no input files given";
        return false;
    }
    if (options.output.empty()) {
        error = "no output file given (use -o)";
        return false;
    }

    options.output = with_ifc_extension(options.output);
    return true;
}

// ============================================================================
// Application
// ============================================================================

void Application::print_usage() {
    std::puts(
        "Usage: geobim [options] -o <output.ifc> <input.geojson|dir>...\n"
        "\n"
        "Options:\n"
        "  -i, --input <path>          GeoJSON file or directory (repeatable)\n"
        "  -o, --output <path>         Output IFC file (.ifc appended when missing)\n"
        "  -s, --style <path>          Style table JSON\n"
        "  --point-size <m>            Box size for points (default 2)\n"
        "  --pipe-radius <m>           Pipe radius for lines (default 0.1)\n"
        "  --extrusion-height <m>      Extrusion height for polygons (default 0.1)\n"
        "  --pipe-segments <n>         Vertices per pipe cross-section (default 16)\n"
        "  --property-set <name>       Property set name (default Attributes)\n"
        "  --use-z                     Keep source z values\n"
        "  --centroids                 Add a marker box at each polygon centroid\n"
        "  --project <name>            Project name\n"
        "  --site <name>               Site name\n"
        "  --building <name>           Building name\n"
        "  --organization <name>       Owning organization\n"
        "  --timestamp <seconds>       Fixed creation time (reproducible output)\n"
        "  -v, --verbose               Debug logging\n"
        "  -q, --quiet                 Warnings and errors only\n"
        "  -h, --help                  Show help");
}

bool Application::init(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string error;
    if (!parse_arguments(args, m_options, error)) {
        spdlog::error("{}", error);
        print_usage();
        return false;
    }

    if (m_options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (m_options.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    m_initialized = true;
    return true;
}

int Application::run() {
    if (m_options.show_help) {
        print_usage();
        return 0;
    }

    if (!m_initialized) {
        spdlog::error("Application::run() called before init()");
        return 1;
    }

    // Styles
    style::StyleTable styles;
    if (!m_options.style_path.empty()) {
        try {
            styles = style::StyleLoader::load_file(m_options.style_path);
        } catch (const InvalidStyleRule& e) {
            spdlog::error("Failed to load style table: {}", e.what());
            return 1;
        }
    } else {
        spdlog::info("No style table given, all elements use the default style");
    }

    // Inputs
    std::vector<SourceRecord> records;
    io::GeoJSONReader reader;
    for (const auto& file : io::collect_input_files(m_options.inputs)) {
        if (!reader.parse(file)) {
            spdlog::error("Failed to read {}: {}", file.string(), reader.get_error());
            return 1;
        }
        reader.log_statistics();

        auto layer = reader.take_records();
        records.insert(records.end(), std::make_move_iterator(layer.begin()),
                       std::make_move_iterator(layer.end()));
    }

    if (records.empty()) {
        spdlog::warn("No features found in the given inputs");
    }

    // Conversion
    convert::ConversionResult result;
    try {
        result = convert::convert(records, styles, m_options.params, m_options.assembler);
    } catch (const Error& e) {
        spdlog::error("Conversion aborted ({}): {}", error_kind_name(e.kind()), e.what());
        return 1;
    }

    convert::log_statistics(result.stats, result.warnings.size());
    result.graph.log_summary();

    // Output
    io::IfcWriter writer;
    writer.set_config(m_options.writer);
    if (!writer.write(result.graph, m_options.output)) {
        spdlog::error("Failed to write {}: {}", m_options.output.string(), writer.get_error());
        return 1;
    }
    writer.log_statistics();

    if (!result.complete()) {
        spdlog::warn("Finished with {} warnings", result.warnings.size());
    }
    return 0;
}

void Application::shutdown() {
    spdlog::default_logger()->flush();
}

} // namespace geobim
