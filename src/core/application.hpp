/**
 * @file application.hpp
 * @brief Command-line application driving a GeoBIM conversion
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * This file contains the Application class which parses the command line,
 * runs the reader -> converter -> writer pipeline and reports the outcome.
 */

#pragma once

#include "convert/conversion_params.hpp"
#include "io/ifc_writer.hpp"
#include "model/model_assembler.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @namespace geobim
 * @brief Root namespace for all GeoBIM engine code
 *
 * The geobim namespace contains all classes, functions, and types
 * that turn geographic feature data into BIM models.
 */
namespace geobim {

/**
 * @brief Options collected from the command line
 */
struct AppOptions {
    std::vector<std::filesystem::path> inputs;  ///< GeoJSON files or directories
    std::filesystem::path output;               ///< Target .ifc file
    std::filesystem::path style_path;           ///< Style table JSON (optional)

    convert::ConversionParams params;
    model::AssemblerConfig assembler;
    io::IfcWriterConfig writer;

    bool verbose = false;
    bool quiet = false;
    bool show_help = false;
};

/**
 * @brief Parse command-line arguments (without the program name)
 * @param args Arguments in order
 * @param options Receives the parsed options
 * @param error Receives a description of the first problem
 * @return true if the arguments are complete and well-formed
 */
bool parse_arguments(const std::vector<std::string>& args, AppOptions& options, std::string& error);

/**
 * @brief Main application class coordinating the conversion pipeline
 *
 * Typical usage:
 * @code
 * int main(int argc, char* argv[]) {
 *     geobim::Application app;
 *
 *     if (!app.init(argc, argv)) {
 *         return 1;
 *     }
 *
 *     int status = app.run();
 *     app.shutdown();
 *
 *     return status;
 * }
 * @endcode
 */
class Application {
public:
    Application() = default;
    ~Application() = default;

    /// @name Deleted Copy Operations
    /// @{
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    /// @}

    /**
     * @brief Parse the command line and configure logging
     *
     * @return true if the application is ready to run
     * @return false on invalid arguments (errors are logged via spdlog)
     */
    bool init(int argc, char* argv[]);

    /**
     * @brief Run the pipeline: load styles, read inputs, convert, write IFC
     *
     * Record-level problems are logged as warnings and do not fail the run.
     *
     * @pre init() must have been called and returned true
     * @return Process exit code (0 on success)
     */
    int run();

    /**
     * @brief Flush log output
     */
    void shutdown();

    [[nodiscard]] const AppOptions& get_options() const { return m_options; }

    static void print_usage();

private:
    AppOptions m_options;
    bool m_initialized = false;
};

} // namespace geobim
