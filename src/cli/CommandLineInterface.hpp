/**
 * @file CommandLineInterface.hpp
 * @brief Command line front end: "hexmosaic <command> [options]"
 */

#pragma once

#include "hexmosaic.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ConfigurationManager.hpp"
#include "UnitParser.hpp"
#include "../core/AreaOfInterest.hpp"
#include "../core/Logger.hpp"
#include "../core/ProjectPaths.hpp"
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief Parses arguments, resolves the configuration and runs one command
 *
 * The configuration is the project's hexmosaic.config.json (or --config),
 * with command line options applied on top.
 */
class CommandLineInterface {
public:
    CommandLineInterface();

    /**
     * @brief Parse arguments and run the requested command
     * @return Process exit code
     */
    int run(int argc, char* argv[]);

    int run(const std::vector<std::string>& args);

    /**
     * @brief The resolved configuration of the last run
     */
    const HexMosaicConfig& get_config() const { return config_; }

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

private:
    HexMosaicConfig config_;
    UnitParser unit_parser_;  // Parser for distances and coordinates
    Logger logger_;

    void register_options(SimpleCommandLineParser& parser) const;

    // Configuration resolution
    bool resolve_config(const SimpleCommandLineParser& parser);
    void apply_option_overrides(const SimpleCommandLineParser& parser, ConfigurationManager& manager) const;
    void configure_logging() const;

    // Commands
    int dispatch(const std::string& command, const SimpleCommandLineParser& parser);
    int run_tessellate(const SimpleCommandLineParser& parser);
    int run_segment(const SimpleCommandLineParser& parser);
    int run_clear_segments(const SimpleCommandLineParser& parser);
    int run_sample_elevation(const SimpleCommandLineParser& parser);
    int run_classify(const SimpleCommandLineParser& parser);
    int run_trace(const SimpleCommandLineParser& parser);
    int run_create_aoi(const SimpleCommandLineParser& parser);
    int run_utm_zone(const SimpleCommandLineParser& parser);
    int run_create_config(const SimpleCommandLineParser& parser);

    // Helpers
    ProjectPaths project_paths() const;
    AreaOfInterest load_aoi(const SimpleCommandLineParser& parser) const;
    std::string require(const SimpleCommandLineParser& parser, const std::string& option) const;
    void report_warnings(const std::vector<std::string>& warnings) const;
};

} // namespace hexmosaic
