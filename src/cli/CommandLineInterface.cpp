/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/ElevationSampler.hpp"
#include "../core/Errors.hpp"
#include "../core/FeatureSource.hpp"
#include "../core/HexGridTessellator.hpp"
#include "../core/InputValidator.hpp"
#include "../core/LineTracer.hpp"
#include "../core/MosaicProfile.hpp"
#include "../core/RasterSource.hpp"
#include "../core/SegmentationEngine.hpp"
#include "../core/SpatialReference.hpp"
#include "../export/MosaicBuilder.hpp"
#include "../export/SegmentStore.hpp"
#include "../export/ShapefileExporter.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace hexmosaic {

namespace {

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::vector<std::string> items;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, separator)) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Command line option -> configuration key
const std::vector<std::pair<std::string, std::string>>& option_keys() {
    static const std::vector<std::pair<std::string, std::string>> keys = {
        {"hex-size", "hex_size_m"},
        {"bucket-size", "bucket_size"},
        {"method", "sampling_method"},
        {"scale", "default_scale"},
        {"alignment", "default_alignment"},
        {"offset-ns", "offset_ns"},
        {"offset-ew", "offset_ew"},
        {"area-threshold", "area_threshold"},
        {"line-buffer", "line_buffer_m"},
        {"line-step", "line_step_m"},
        {"line-behavior", "line_behavior"},
        {"max-hexes", "max_hexes_without_experimental"},
        {"log-level", "log_level"},
        {"log-file", "log_file"},
    };
    return keys;
}

} // namespace

CommandLineInterface::CommandLineInterface()
    : unit_parser_(DistanceUnit::METERS),
      logger_("CommandLineInterface") {}

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.add_command("tessellate", "tessellate --aoi aoi.shp --hex-size 500m",
                       "Build the hex lattice of an AOI and save tiles, edges, vertices and centroids");
    parser.add_command("segment", "segment --aoi aoi.shp --rows 2 --cols 3",
                       "Split an AOI into equal segments or scale-aligned map tiles");
    parser.add_command("clear-segments", "clear-segments --aoi-name \"AOI 1\"",
                       "Remove the stored segments of an AOI");
    parser.add_command("sample-elevation", "sample-elevation --dem dem.tif --hexes hex_tiles_500m.shp",
                       "Sample a DEM per hex and bucket the result");
    parser.add_command("classify", "classify --hexes hex_tiles_500m.shp --sources landuse.shp,roads.shp",
                       "Build the mosaic class layers of a profile");
    parser.add_command("trace", "trace --hexes hex_tiles_500m.shp --lines rivers.shp --line-behavior edge_path",
                       "Trace one line layer onto the hex lattice");
    parser.add_command("create-aoi", "create-aoi --crs EPSG:4326 --center 15.1,49.2 --width 20km --height 15km",
                       "Create rectangular AOIs around centre points");
    parser.add_command("utm-zone", "utm-zone --location 49.2,15.1",
                       "Print the UTM EPSG code of a lat,lon location");
    parser.add_command("create-config", "create-config hexmosaic.config.json",
                       "Write a default configuration file");

    parser.begin_section("GENERAL OPTIONS");
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("project-dir", "p", "Project root directory (default: .)");
    parser.add_flag("silent", "s", "Suppress all output except errors (same as --log-level 0)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "facility-specific: \"3,HexGridTessellator=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("version", "", "Show version information");

    parser.begin_section("AREA OF INTEREST");
    parser.add_option("aoi", "a", "AOI polygon dataset (shapefile, GeoPackage, ...)");
    parser.add_option("aoi-layer", "", "Layer of the AOI dataset (default: first layer)");
    parser.add_option("aoi-name", "", "AOI name (default: AOI layer name)");
    parser.add_option("crs", "", "CRS of --center: EPSG code, WKT or PROJ string");
    parser.add_option("center", "", "Centre point x,y in CRS units; several separated by ';'");
    parser.add_option("width", "", "AOI width (e.g. 20km)");
    parser.add_option("height", "", "AOI height (e.g. 15km)");
    parser.add_option("first-index", "", "Number of the first created AOI", false, "1");
    parser.add_option("hint", "", "Suffix added to created AOI file names");
    parser.add_option("location", "", "lat,lon in decimal degrees or DMS");

    parser.begin_section("TESSELLATION");
    parser.add_option("hex-size", "", "Hex centre-to-centre spacing (default: 500m)");
    parser.add_option("max-hexes", "", "Largest hex count per side without --experimental (default: 99)");
    parser.add_flag("experimental", "", "Allow hex grids larger than --max-hexes per side");

    parser.begin_section("SEGMENTATION");
    parser.add_option("mode", "", "equal or map-tile (default: equal when --rows/--cols are given)");
    parser.add_option("rows", "", "Segment rows");
    parser.add_option("cols", "", "Segment columns");
    parser.add_option("snap", "", "Snap equal segment borders to multiples of this distance");
    parser.add_option("scale", "", "Map-tile scale: 1:25k, 1:50k, 1:100k, 1:200k, 1:250k (default: 1:250k)");
    parser.add_option("alignment", "", "Map-tile alignment: extent, minute, degree (default: extent)");
    parser.add_option("offset-ns", "", "North-south origin offset in km or arc-minutes (e.g. 7.5arcmin)");
    parser.add_option("offset-ew", "", "East-west origin offset in km or arc-minutes");

    parser.begin_section("ELEVATION");
    parser.add_option("dem", "", "Elevation raster (GeoTIFF, VRT, ...)");
    parser.add_option("hexes", "", "Hex tile layer");
    parser.add_option("method", "m", "Sampling method: mean, median, min (default: mean)");
    parser.add_option("bucket-size", "", "Elevation bucket size (default: 10)");
    parser.add_flag("overwrite", "", "Replace an existing output layer");

    parser.begin_section("MOSAIC");
    parser.add_option("profile", "", "Mosaic profile JSON (default: <project>/hexmosaic_profile.json)");
    parser.add_option("sources", "", "Comma separated source datasets");
    parser.add_option("class", "", "Comma separated class ids to build (default: all)");
    parser.add_option("lines", "", "Line dataset to trace");
    parser.add_option("area-threshold", "", "Minimum coverage fraction of a hex (default: 0)");
    parser.add_option("line-buffer", "", "Buffer added to edge paths (default: 30m)");
    parser.add_option("line-step", "", "Minimum line sampling step (default: 200m)");
    parser.add_option("line-behavior", "", "centroid_path or edge_path (default: centroid_path)");
    parser.add_option("output", "o", "Output file");
}

int CommandLineInterface::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return run(args);
}

int CommandLineInterface::run(const std::vector<std::string>& args) {
    SimpleCommandLineParser parser("hexmosaic",
        "HexMosaic - hex-grid tessellation, segmentation, elevation sampling and\n"
        "feature classification for hex-and-counter wargame maps");
    register_options(parser);

    if (!parser.parse(args)) {
        if (parser.help_requested()) {
            parser.show_help();
            return 0;
        }
        std::cerr << "Error: " << parser.last_error() << std::endl;
        std::cerr << "Run 'hexmosaic --help' for usage." << std::endl;
        return 2;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "HexMosaic v" << HEXMOSAIC_VERSION_STRING << std::endl;
        std::cout << "Hex-grid map building for hex-and-counter wargames" << std::endl;
        std::cout << "Built with GDAL, PROJ and nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return 0;
    }

    const std::string command = parser.command();
    if (command.empty()) {
        parser.show_help();
        return 2;
    }

    try {
        if (!resolve_config(parser)) {
            return 1;
        }
        configure_logging();
        if (logger_.shouldOutput(LogLevel::DETAILED)) {
            print_config();
        }
        return dispatch(command, parser);
    } catch (const UnitParseError& e) {
        logger_.error(e.what());
        return 1;
    } catch (const HexMosaicError& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    } catch (const json::exception& e) {
        logger_.error(std::string("Error reading JSON: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}

bool CommandLineInterface::resolve_config(const SimpleCommandLineParser& parser) {
    ConfigurationManager manager;
    const std::string project_dir = parser.get("project-dir").value_or(".");

    std::optional<std::string> config_file = parser.get("config");
    if (!config_file) {
        const auto candidate = std::filesystem::path(project_dir) / ConfigurationManager::kDefaultFileName;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            config_file = candidate.string();
        }
    }
    if (config_file && parser.command() != "create-config") {
        if (!manager.load_from_file(*config_file)) {
            std::cerr << "Failed to load configuration file: " << manager.last_error() << std::endl;
            return false;
        }
    }

    apply_option_overrides(parser, manager);
    config_ = manager.to_config();
    config_.project_directory = project_dir;
    if (config_file) {
        config_.config_file = config_file;
    }

    InputValidator validator;
    ValidationResult validation = validator.validate(config_);
    if (validation.has_errors()) {
        std::cerr << validation.format_error_message();
        return false;
    }
    return true;
}

void CommandLineInterface::apply_option_overrides(const SimpleCommandLineParser& parser,
                                                  ConfigurationManager& manager) const {
    for (const auto& [option, key] : option_keys()) {
        if (auto value = parser.get(option)) {
            manager.set_value(key, *value);
        }
    }
    if (parser.get_flag("experimental")) {
        manager.set_value("experimental", "true");
    }
    if (parser.get_flag("silent")) {
        manager.set_value("log_level", "0");
    } else if (parser.get_flag("verbose")) {
        manager.set_value("log_level", "6");
    }
}

void CommandLineInterface::configure_logging() const {
    Logger::parseLogConfig(config_.log_level);
    if (config_.log_file) {
        Logger::setGlobalLogFile(config_.log_file);
    }
}

void CommandLineInterface::print_config() const {
    std::ostringstream oss;
    oss << "\n=== HexMosaic Configuration ===\n";
    oss << "Project directory: " << config_.project_directory << "\n";
    if (config_.config_file) {
        oss << "Config file: " << *config_.config_file << "\n";
    }
    oss << "Hex size: " << config_.hex_size_m << "m"
        << (config_.experimental ? " (experimental sizes allowed)" : "") << "\n";
    oss << "Sampling: " << to_string(config_.sampling_method) << ", bucket " << config_.bucket_size << "\n";
    oss << "Map tiles: " << config_.default_scale << ", " << to_string(config_.default_alignment)
        << " alignment, offsets " << config_.offset_ns << "/" << config_.offset_ew << " "
        << to_string(config_.offset_unit) << "\n";
    oss << "Mosaic: threshold " << config_.area_threshold << ", line buffer " << config_.line_buffer_m
        << "m, line step " << config_.line_step_m << "m, " << to_string(config_.line_behavior) << "\n";
    oss << "===============================\n";
    logger_.detailed(oss.str());
}

int CommandLineInterface::dispatch(const std::string& command, const SimpleCommandLineParser& parser) {
    if (command == "tessellate") return run_tessellate(parser);
    if (command == "segment") return run_segment(parser);
    if (command == "clear-segments") return run_clear_segments(parser);
    if (command == "sample-elevation") return run_sample_elevation(parser);
    if (command == "classify") return run_classify(parser);
    if (command == "trace") return run_trace(parser);
    if (command == "create-aoi") return run_create_aoi(parser);
    if (command == "utm-zone") return run_utm_zone(parser);
    if (command == "create-config") return run_create_config(parser);

    std::cerr << "Unknown command: " << command << std::endl;
    std::cerr << "Run 'hexmosaic --help' for the list of commands." << std::endl;
    return 2;
}

// ============================================================================
// Helpers
// ============================================================================

ProjectPaths CommandLineInterface::project_paths() const {
    return ProjectPaths(config_.project_directory);
}

std::string CommandLineInterface::require(const SimpleCommandLineParser& parser, const std::string& option) const {
    auto value = parser.get(option);
    if (!value || value->empty()) {
        throw InvalidArgument("Command '" + parser.command() + "' requires --" + option);
    }
    return *value;
}

AreaOfInterest CommandLineInterface::load_aoi(const SimpleCommandLineParser& parser) const {
    const std::string path = require(parser, "aoi");
    OgrFeatureSource source(path, parser.get("aoi-layer").value_or(""));
    if (!source.is_valid()) {
        throw InvalidArgument(source.last_error());
    }
    AreaOfInterest aoi = AreaOfInterest::from_source(source, parser.get("aoi-name").value_or(""));
    report_warnings(aoi.warnings);
    return aoi;
}

void CommandLineInterface::report_warnings(const std::vector<std::string>& warnings) const {
    if (!warnings.empty()) {
        logger_.detailed(std::to_string(warnings.size()) + " warning(s) reported");
    }
    for (const auto& warning : warnings) {
        logger_.warning(warning);
    }
}

// ============================================================================
// Commands
// ============================================================================

int CommandLineInterface::run_tessellate(const SimpleCommandLineParser& parser) {
    const AreaOfInterest aoi = load_aoi(parser);

    const BoundingBox bounds = aoi.bounds();
    const double unit = aoi.crs.meters_per_unit();
    InputValidator validator;
    ValidationResult validation =
        validator.validate_tessellation(config_, bounds.width() * unit, bounds.height() * unit);
    if (validation.has_errors()) {
        std::cerr << validation.format_error_message();
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    HexGridTessellator tessellator;
    TessellationResult result = tessellator.tessellate(aoi, config_.hex_size_m);
    report_warnings(result.warnings);
    if (result.empty()) {
        logger_.error("No hex tiles were created for " + aoi.name + ".");
        return 1;
    }

    ShapefileExporter exporter;
    ProjectPaths paths = project_paths();
    if (!exporter.write_tessellation(result, paths, aoi.name)) {
        logger_.error(exporter.last_error());
        return 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger_.info("Hex grid for " + aoi.name + ": " + std::to_string(result.cells.size()) + " tiles, " +
                 std::to_string(result.edges.size()) + " edges, " + std::to_string(result.vertices.size()) +
                 " vertices saved to " + paths.base_grid_dir(aoi.name).string() + " in " +
                 std::to_string(elapsed.count()) + "ms.");
    return 0;
}

int CommandLineInterface::run_segment(const SimpleCommandLineParser& parser) {
    const AreaOfInterest aoi = load_aoi(parser);
    SegmentationEngine engine;

    std::string mode = parser.get("mode").value_or("");
    if (mode.empty()) {
        mode = (parser.has("rows") || parser.has("cols")) ? "equal" : "map-tile";
    }

    SegmentationResult result;
    if (mode == "equal") {
        const auto rows = parser.get_as<int>("rows");
        const auto cols = parser.get_as<int>("cols");
        if (!rows || !cols) {
            throw InvalidArgument("Equal segmentation requires integer --rows and --cols");
        }
        double snap = 0.0;
        if (auto value = parser.get("snap")) {
            snap = unit_parser_.parse_distance(*value).value / aoi.crs.meters_per_unit();
        }
        result = engine.segment_equal(aoi, *rows, *cols, snap);
    } else if (mode == "map-tile" || mode == "map_tile") {
        TileOffsets offsets;
        offsets.ns = config_.offset_ns;
        offsets.ew = config_.offset_ew;
        offsets.unit = config_.offset_unit;
        result = engine.segment_map_tile(aoi, config_.default_scale, config_.default_alignment, offsets);
    } else {
        throw InvalidArgument("Unsupported segmentation mode: " + mode);
    }

    report_warnings(result.warnings);
    if (!result.ok) {
        logger_.error(result.message);
        return 1;
    }

    SegmentStore store(project_paths());
    if (!store.write(aoi.name, result)) {
        logger_.error(store.last_error());
        return 1;
    }
    return 0;
}

int CommandLineInterface::run_clear_segments(const SimpleCommandLineParser& parser) {
    std::string aoi_name = parser.get("aoi-name").value_or("");
    if (aoi_name.empty()) {
        aoi_name = load_aoi(parser).name;
    }
    SegmentStore store(project_paths());
    store.clear(aoi_name);
    return 0;
}

int CommandLineInterface::run_sample_elevation(const SimpleCommandLineParser& parser) {
    const std::string dem_path = require(parser, "dem");
    const std::string hexes_path = require(parser, "hexes");

    GdalRasterSource dem(dem_path);
    if (!dem.is_valid()) {
        throw InvalidArgument("Could not open elevation raster: " + dem_path);
    }
    OgrFeatureSource hexes(hexes_path);
    if (!hexes.is_valid()) {
        throw InvalidArgument(hexes.last_error());
    }

    const std::string base_name = parser.get("aoi-name").value_or(hexes.name());
    std::filesystem::path output = parser.has("output")
        ? std::filesystem::path(*parser.get("output"))
        : project_paths().elevation_hex_file(base_name);

    std::error_code ec;
    if (std::filesystem::exists(output, ec) && !parser.get_flag("overwrite")) {
        logger_.error("Hex elevation: output exists. Use --overwrite to regenerate.");
        return 1;
    }

    ElevationSampler sampler;
    SamplingResult result = sampler.sample(dem, hexes, config_.sampling_method, config_.bucket_size);
    report_warnings(result.warnings);
    if (result.samples.empty()) {
        logger_.error("Hex elevation: no features were sampled.");
        return 1;
    }

    ShapefileExporter exporter;
    const std::string dem_source = std::filesystem::path(dem_path).filename().string();
    if (!exporter.write_hex_elevation_layer(hexes, result, output.string(), dem_source,
                                            to_string(result.method))) {
        logger_.error("Hex elevation: failed to write shapefile - " + exporter.last_error());
        return 1;
    }

    logger_.info("Hex elevation: " + format_sampling_summary(result) + ", saved to " + output.string() + ".");
    return 0;
}

int CommandLineInterface::run_classify(const SimpleCommandLineParser& parser) {
    const std::string hexes_path = require(parser, "hexes");
    const std::string sources_list = require(parser, "sources");
    ProjectPaths paths = project_paths();

    const std::string profile_path = parser.get("profile").value_or(
        (paths.root() / "hexmosaic_profile.json").string());
    MosaicProfile profile;
    if (!profile.load_from_file(profile_path)) {
        logger_.error("Mosaic: " + profile.last_error());
        return 1;
    }
    if (profile.classes().empty()) {
        logger_.error("Mosaic: profile " + profile_path + " defines no classes.");
        return 1;
    }

    OgrFeatureSource hexes(hexes_path);
    if (!hexes.is_valid()) {
        throw InvalidArgument(hexes.last_error());
    }

    std::vector<std::unique_ptr<OgrFeatureSource>> sources;
    std::map<std::string, const FeatureSource*> by_name;
    std::vector<std::string> names;
    for (const auto& path : split_list(sources_list, ',')) {
        auto source = std::make_unique<OgrFeatureSource>(path);
        if (!source->is_valid()) {
            logger_.warning("Mosaic: source skipped - " + source->last_error());
            continue;
        }
        names.push_back(source->name());
        by_name[source->name()] = source.get();
        sources.push_back(std::move(source));
    }

    std::set<std::string> selected_classes;
    for (const auto& id : split_list(parser.get("class").value_or(""), ',')) {
        if (!profile.find(id)) {
            throw InvalidArgument("Unknown mosaic class: " + id);
        }
        selected_classes.insert(id);
    }

    MosaicBuilder builder(hexes, paths);
    std::size_t written = 0;
    for (MosaicClass cls : profile.classes()) {
        if (!selected_classes.empty() && !selected_classes.count(cls.class_id)) {
            continue;
        }
        MosaicClassState state = profile.default_state(cls, names);
        state.area_threshold = config_.area_threshold;
        state.line_buffer = config_.line_buffer_m;
        state.line_step = config_.line_step_m;
        if (parser.has("line-behavior")) {
            cls.line_behavior = config_.line_behavior;
        }

        const auto& chosen = cls.mode == MosaicMode::POLYGON ? state.polygon_sources : state.line_sources;
        std::vector<const FeatureSource*> class_sources;
        for (const auto& name : chosen) {
            auto it = by_name.find(name);
            if (it != by_name.end()) {
                class_sources.push_back(it->second);
            }
        }

        if (builder.run_class(cls, class_sources, state)) {
            ++written;
        }
    }

    report_warnings(builder.warnings());
    logger_.info("Mosaic: " + std::to_string(written) + " class layer(s) written to " +
                 paths.mosaic_dir().string() + ".");
    return 0;
}

int CommandLineInterface::run_trace(const SimpleCommandLineParser& parser) {
    const std::string hexes_path = require(parser, "hexes");
    const std::string lines_path = require(parser, "lines");

    OgrFeatureSource hexes(hexes_path);
    if (!hexes.is_valid()) {
        throw InvalidArgument(hexes.last_error());
    }
    OgrFeatureSource lines(lines_path);
    if (!lines.is_valid()) {
        throw InvalidArgument(lines.last_error());
    }

    MosaicClass cls;
    cls.class_id = lines.name();
    cls.target_layer = lines.name();
    cls.mode = MosaicMode::LINE;
    cls.line_behavior = config_.line_behavior;

    MosaicClassState state;
    state.line_buffer = config_.line_buffer_m;
    state.line_step = config_.line_step_m;

    MosaicBuilder builder(hexes, project_paths());
    auto output = builder.run_class(cls, {&lines}, state);
    report_warnings(builder.warnings());
    if (!output) {
        logger_.error("Trace: no hex path produced for " + lines.name() + ".");
        return 1;
    }
    return 0;
}

int CommandLineInterface::run_create_aoi(const SimpleCommandLineParser& parser) {
    const Crs crs = Crs::from_user_input(require(parser, "crs"));
    const double width_m = unit_parser_.parse_distance(require(parser, "width")).value;
    const double height_m = unit_parser_.parse_distance(require(parser, "height")).value;
    const int first_index = parser.get_as<int>("first-index").value_or(1);
    const std::string hint = parser.get("hint").value_or("");

    std::vector<Point2D> centers;
    for (const auto& item : split_list(require(parser, "center"), ';')) {
        centers.push_back(unit_parser_.parse_point(item));
    }

    ProjectPaths paths = project_paths();
    ShapefileExporter exporter;
    int index = first_index;
    for (const AreaOfInterest& aoi : aois_from_points(centers, crs, width_m, height_m, first_index)) {
        MemoryFeatureSource layer(aoi.name, aoi.crs, GeometryKind::POLYGON);
        layer.add_field(FieldDefinition("name", FieldType::STRING, 80));
        layer.add_feature(aoi.geometry, {FieldValue(aoi.name)});

        const auto path = paths.layers_dir() / aoi_file_name(index++, width_m, height_m, hint);
        if (!exporter.write_layer(layer, path.string())) {
            logger_.error(exporter.last_error());
            return 1;
        }
        logger_.info("Created " + aoi.name + " (" + aoi.crs.auth_id() + ") at " + path.string() + ".");
    }
    return 0;
}

int CommandLineInterface::run_utm_zone(const SimpleCommandLineParser& parser) {
    auto [lat, lon] = unit_parser_.parse_coordinate_pair(require(parser, "location"));
    std::cout << "EPSG:" << utm_epsg_for(lon, lat) << std::endl;
    return 0;
}

int CommandLineInterface::run_create_config(const SimpleCommandLineParser& parser) {
    std::string filename;
    if (auto value = parser.get("output")) {
        filename = *value;
    } else if (parser.get_positional().size() > 1) {
        filename = parser.get_positional()[1];
    } else {
        filename = (std::filesystem::path(config_.project_directory) /
                    ConfigurationManager::kDefaultFileName).string();
    }

    ConfigurationManager manager;
    manager.from_config(config_);
    if (!manager.save_to_file(filename)) {
        logger_.error("Could not write configuration file: " + filename);
        return 1;
    }
    std::cout << "Created default configuration file: " << filename << std::endl;
    return 0;
}

} // namespace hexmosaic
