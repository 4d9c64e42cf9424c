#include "UnitParser.hpp"
#include "cli/ConfigurationManager.hpp"
#include "cli/SimpleCommandLineParser.hpp"
#include "core/Errors.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace hexmosaic;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                         \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";             \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const double _a = static_cast<double>(a);                                                                        \
    const double _b = static_cast<double>(b);                                                                        \
    if (std::fabs(_a - _b) > (eps)) {                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (" << _a      \
                << " vs " << _b << ")\n";                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                         \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static std::string ReadAll(const fs::path& p)
{
  std::ifstream in(p);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static bool Contains(const std::string& text, const std::string& part)
{
  return text.find(part) != std::string::npos;
}

static void TestDistances()
{
  UnitParser parser;
  const ParsedValue bare = parser.parse_distance("200");
  EXPECT_NEAR(bare.value, 200.0, 0.0);
  EXPECT_FALSE(bare.had_explicit_unit);

  const ParsedValue km = parser.parse_distance("5km");
  EXPECT_NEAR(km.value, 5000.0, 1e-9);
  EXPECT_TRUE(km.had_explicit_unit);
  EXPECT_EQ(km.original_unit, DistanceUnit::KILOMETERS);

  EXPECT_NEAR(parser.parse_distance("10mi").value, 16093.4, 1e-6);
  EXPECT_NEAR(parser.parse_distance("1500ft").value, 457.2, 1e-9);
  EXPECT_NEAR(parser.parse_distance(" 2 km ").value, 2000.0, 1e-9);
  EXPECT_NEAR(UnitParser(DistanceUnit::KILOMETERS).parse_distance("3").value, 3000.0, 1e-9);

  bool threw = false;
  try {
    (void)parser.parse_distance("5 parsecs");
  } catch (const UnitParseError& e) {
    threw = Contains(e.what(), "Unrecognized unit");
  }
  EXPECT_TRUE(threw);

  threw = false;
  try {
    (void)parser.parse_distance("km");
  } catch (const UnitParseError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

static void TestOffsets()
{
  UnitParser parser;
  ParsedOffset offset = parser.parse_offset("7.5'");
  EXPECT_NEAR(offset.value, 7.5, 0.0);
  EXPECT_EQ(offset.unit, OffsetUnit::ARC_MINUTES);

  offset = parser.parse_offset("7.5arcmin");
  EXPECT_EQ(offset.unit, OffsetUnit::ARC_MINUTES);

  offset = parser.parse_offset("2km");
  EXPECT_NEAR(offset.value, 2.0, 0.0);
  EXPECT_EQ(offset.unit, OffsetUnit::KILOMETERS);

  offset = parser.parse_offset("2500m");
  EXPECT_NEAR(offset.value, 2.5, 1e-12);
  EXPECT_EQ(offset.unit, OffsetUnit::KILOMETERS);

  offset = parser.parse_offset("-3");
  EXPECT_NEAR(offset.value, -3.0, 0.0);
  EXPECT_EQ(offset.unit, OffsetUnit::KILOMETERS);
}

static void TestCoordinates()
{
  UnitParser parser;
  EXPECT_NEAR(parser.parse_latitude("63\xC2\xB0" "07'29\"N"), 63.0 + 7.0 / 60.0 + 29.0 / 3600.0, 1e-9);
  EXPECT_NEAR(parser.parse_latitude("63d07m29sN"), 63.0 + 7.0 / 60.0 + 29.0 / 3600.0, 1e-9);
  EXPECT_NEAR(parser.parse_longitude("151\xC2\xB0" "11'05\"W"), -(151.0 + 11.0 / 60.0 + 5.0 / 3600.0), 1e-9);
  EXPECT_NEAR(parser.parse_latitude("-45.5"), -45.5, 0.0);

  const auto pair = parser.parse_coordinate_pair("49.75,15.25");
  EXPECT_NEAR(pair.first, 49.75, 0.0);
  EXPECT_NEAR(pair.second, 15.25, 0.0);

  const Point2D point = parser.parse_point("500000, 5540000");
  EXPECT_NEAR(point.x(), 500000.0, 0.0);
  EXPECT_NEAR(point.y(), 5540000.0, 0.0);

  auto throws = [](auto&& call) {
    try {
      call();
    } catch (const UnitParseError&) {
      return true;
    }
    return false;
  };
  EXPECT_TRUE(throws([&] { (void)parser.parse_latitude("91"); }));
  EXPECT_TRUE(throws([&] { (void)parser.parse_longitude("181"); }));
  EXPECT_TRUE(throws([&] { (void)parser.parse_latitude("45d75mN"); }));
  EXPECT_TRUE(throws([&] { (void)parser.parse_coordinate_pair("49.75 15.25"); }));
}

static void TestConfigDocuments()
{
  ConfigurationManager config;
  EXPECT_FALSE(config.load_from_string("{\"hex_size_m\": 500}"));
  EXPECT_TRUE(Contains(config.last_error(), "no schema_version"));

  EXPECT_FALSE(config.load_from_string("{\"schema_version\": 2}"));
  EXPECT_EQ(config.last_error(), std::string("Unsupported config schema_version 2; expected 1"));

  EXPECT_FALSE(config.load_from_string("[1, 2]"));
  EXPECT_EQ(config.last_error(), std::string("Config must be a JSON object"));

  EXPECT_FALSE(config.load_from_string("{\"schema_version\": 1, \"hex_size_m\": [500]}"));
  EXPECT_TRUE(Contains(config.last_error(), "hex_size_m"));

  EXPECT_FALSE(config.load_from_string("{ not json"));
  EXPECT_TRUE(Contains(config.last_error(), "Error parsing JSON config"));
  EXPECT_TRUE(config.values().empty());

  ASSERT_TRUE(config.load_from_string(R"({
    "schema_version": 1,
    "hex_size_m": "1km",
    "bucket_size": 20,
    "sampling_method": "median",
    "default_scale": "1:50k",
    "default_alignment": "minute",
    "offset_ns": "7.5'",
    "offset_ew": "15arcmin",
    "line_behavior": "edge",
    "line_step_m": "0.5km",
    "experimental": true,
    "log_file": null
  })"));

  const HexMosaicConfig parsed = config.to_config();
  EXPECT_NEAR(parsed.hex_size_m, 1000.0, 1e-9);
  EXPECT_NEAR(parsed.bucket_size, 20.0, 0.0);
  EXPECT_EQ(parsed.sampling_method, SamplingMethod::MEDIAN);
  EXPECT_EQ(parsed.default_scale, std::string("1:50k"));
  EXPECT_EQ(parsed.default_alignment, TileAlignment::MINUTE);
  EXPECT_NEAR(parsed.offset_ns, 7.5, 0.0);
  EXPECT_NEAR(parsed.offset_ew, 15.0, 0.0);
  EXPECT_EQ(parsed.offset_unit, OffsetUnit::ARC_MINUTES);
  EXPECT_EQ(parsed.line_behavior, LineBehavior::EDGE_PATH);
  EXPECT_NEAR(parsed.line_step_m, 500.0, 1e-9);
  EXPECT_NEAR(parsed.line_buffer_m, 30.0, 0.0);
  EXPECT_TRUE(parsed.experimental);
  EXPECT_FALSE(parsed.log_file.has_value());
  EXPECT_EQ(parsed.max_hexes_without_experimental, 99);
}

static void TestConfigRejections()
{
  auto throws_invalid = [](ConfigurationManager& config) {
    try {
      (void)config.to_config();
    } catch (const InvalidArgument&) {
      return true;
    }
    return false;
  };

  ConfigurationManager mixed;
  mixed.set_value("offset_ns", "2km");
  mixed.set_value("offset_ew", "7.5'");
  EXPECT_TRUE(throws_invalid(mixed));

  ConfigurationManager method;
  method.set_value("sampling_method", "max");
  EXPECT_TRUE(throws_invalid(method));

  ConfigurationManager scale;
  scale.set_value("default_scale", "1:10k");
  EXPECT_TRUE(throws_invalid(scale));

  ConfigurationManager distance;
  distance.set_value("hex_size_m", "1 parsec");
  bool unit_error = false;
  try {
    (void)distance.to_config();
  } catch (const UnitParseError&) {
    unit_error = true;
  }
  EXPECT_TRUE(unit_error);

  ConfigurationManager numbers;
  numbers.set_value("count", "12abc");
  numbers.set_value("flag", "yes");
  bool not_int = false;
  try {
    (void)numbers.get_int("count");
  } catch (const std::invalid_argument&) {
    not_int = true;
  }
  EXPECT_TRUE(not_int);
  EXPECT_TRUE(numbers.get_bool("flag"));
  EXPECT_EQ(numbers.get_int("missing", 7), 7);
}

static void TestConfigRoundTrip()
{
  const fs::path root = MakeTempPath("hexmosaic_config");
  std::error_code ec;
  fs::create_directories(root, ec);
  ASSERT_TRUE(!ec);
  const fs::path file = root / ConfigurationManager::kDefaultFileName;

  HexMosaicConfig original;
  original.project_directory = "projects/bohemia";
  original.hex_size_m = 250.0;
  original.bucket_size = 5.0;
  original.sampling_method = SamplingMethod::MIN;
  original.default_scale = "1:100k";
  original.default_alignment = TileAlignment::DEGREE;
  original.offset_ns = 7.5;
  original.offset_unit = OffsetUnit::ARC_MINUTES;
  original.area_threshold = 0.25;
  original.line_behavior = LineBehavior::EDGE_PATH;
  original.log_file = "hexmosaic.log";

  ConfigurationManager writer;
  writer.from_config(original);
  ASSERT_TRUE(writer.save_to_file(file.string()));
  EXPECT_TRUE(Contains(ReadAll(file), "\"schema_version\": 1"));

  ConfigurationManager reader;
  ASSERT_TRUE(reader.load_from_file(file.string()));
  const HexMosaicConfig loaded = reader.to_config();
  EXPECT_EQ(loaded.project_directory, original.project_directory);
  EXPECT_NEAR(loaded.hex_size_m, 250.0, 0.0);
  EXPECT_NEAR(loaded.bucket_size, 5.0, 0.0);
  EXPECT_EQ(loaded.sampling_method, SamplingMethod::MIN);
  EXPECT_EQ(loaded.default_scale, std::string("1:100k"));
  EXPECT_EQ(loaded.default_alignment, TileAlignment::DEGREE);
  EXPECT_NEAR(loaded.offset_ns, 7.5, 0.0);
  EXPECT_NEAR(loaded.offset_ew, 0.0, 0.0);
  EXPECT_EQ(loaded.offset_unit, OffsetUnit::ARC_MINUTES);
  EXPECT_NEAR(loaded.area_threshold, 0.25, 0.0);
  EXPECT_EQ(loaded.line_behavior, LineBehavior::EDGE_PATH);
  EXPECT_EQ(loaded.log_file.value_or(""), std::string("hexmosaic.log"));

  ConfigurationManager missing;
  EXPECT_FALSE(missing.load_from_file((root / "absent.json").string()));
  EXPECT_TRUE(Contains(missing.last_error(), "Cannot open config file"));

  fs::remove_all(root, ec);
}

static void TestValidator()
{
  InputValidator validator;
  HexMosaicConfig config;
  EXPECT_FALSE(validator.validate(config).has_errors());
  EXPECT_EQ(validator.validate(config).format_error_message(), std::string());

  HexMosaicConfig sizes;
  sizes.hex_size_m = 0.0;
  sizes.bucket_size = -1.0;
  const ValidationResult bad_sizes = validator.validate(sizes);
  ASSERT_TRUE(bad_sizes.conflicts.size() == 1);
  EXPECT_EQ(bad_sizes.conflicts[0].involved_params.size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(Contains(bad_sizes.format_error_message(), "Sizes must be positive"));

  HexMosaicConfig threshold;
  threshold.area_threshold = 1.5;
  EXPECT_TRUE(validator.validate(threshold).has_errors());

  HexMosaicConfig offsets;
  offsets.offset_ns = 2.0;
  EXPECT_TRUE(validator.validate(offsets).has_errors());
  offsets.default_alignment = TileAlignment::MINUTE;
  EXPECT_FALSE(validator.validate(offsets).has_errors());

  // 500 m hexes over 60 km x 10 km: 120 across
  const ValidationResult too_many = validator.validate_tessellation(config, 60000.0, 10000.0);
  ASSERT_TRUE(too_many.conflicts.size() == 1);
  ASSERT_TRUE(too_many.conflicts[0].involved_params.size() == 3);
  EXPECT_EQ(too_many.conflicts[0].involved_params[2], std::string("Estimate: 120 x 20 hexes, limit 99 per side"));
  EXPECT_EQ(too_many.conflicts[0].suggestions[0], std::string("Use --hex-size 607m or larger"));

  EXPECT_FALSE(validator.validate_tessellation(config, 40000.0, 40000.0).has_errors());
  HexMosaicConfig experimental;
  experimental.experimental = true;
  EXPECT_FALSE(validator.validate_tessellation(experimental, 60000.0, 10000.0).has_errors());
}

static SimpleCommandLineParser MakeParser()
{
  SimpleCommandLineParser parser("hexmosaic", "HexMosaic test parser");
  parser.add_command("create-aoi", "create-aoi --center 49.75,15.25", "Create an AOI");
  parser.begin_section("TESSELLATION");
  parser.add_option("hex-size", "s", "Hex spacing");
  parser.add_option("center", "", "AOI centre");
  parser.add_flag("experimental", "x", "Allow large grids");
  parser.begin_section("ELEVATION");
  parser.add_option("bucket-size", "b", "Bucket size", false, "10");
  return parser;
}

static void TestCommandLine()
{
  SimpleCommandLineParser parser = MakeParser();
  ASSERT_TRUE(parser.parse(std::vector<std::string>{
    "create-aoi", "--center", "-151.2,63.1", "--hex-size=1km", "-x"}));
  EXPECT_EQ(parser.command(), std::string("create-aoi"));
  EXPECT_EQ(parser.get("center").value_or(""), std::string("-151.2,63.1"));
  EXPECT_EQ(parser.get("hex-size").value_or(""), std::string("1km"));
  EXPECT_TRUE(parser.get_flag("experimental"));
  EXPECT_EQ(parser.get("bucket-size").value_or(""), std::string("10"));
  EXPECT_NEAR(parser.get_as<double>("bucket-size").value_or(0.0), 10.0, 0.0);

  ASSERT_TRUE(parser.parse(std::vector<std::string>{"segment", "-s", "-5"}));
  EXPECT_EQ(parser.get("hex-size").value_or(""), std::string("-5"));
  EXPECT_FALSE(parser.get_flag("experimental"));

  EXPECT_FALSE(parser.parse(std::vector<std::string>{"tessellate", "--bogus"}));
  EXPECT_EQ(parser.last_error(), std::string("Unknown option: --bogus"));
  EXPECT_FALSE(parser.help_requested());

  EXPECT_FALSE(parser.parse(std::vector<std::string>{"tessellate", "--hex-size", "--experimental"}));
  EXPECT_EQ(parser.last_error(), std::string("Option --hex-size requires a value"));

  EXPECT_FALSE(parser.parse(std::vector<std::string>{"tessellate", "--help"}));
  EXPECT_TRUE(parser.help_requested());

  std::ostringstream help;
  parser.show_help(help);
  const std::string text = help.str();
  EXPECT_TRUE(Contains(text, "COMMANDS:"));
  EXPECT_TRUE(Contains(text, "TESSELLATION:"));
  EXPECT_TRUE(Contains(text, "-s, --hex-size VALUE"));
  EXPECT_TRUE(Contains(text, "(default: 10)"));
  EXPECT_TRUE(text.find("TESSELLATION:") < text.find("ELEVATION:"));
}

static void TestLogging()
{
  Logger::parseLogConfig("4,ZonalStatistics=6");
  EXPECT_EQ(Logger::getFacilityLevel("ZonalStatistics"), LogLevel::TRACE);
  EXPECT_EQ(Logger::getFacilityLevel("HexIndex"), LogLevel::DETAILED);

  const Logger zonal("ZonalStatistics");
  const Logger index("HexIndex");
  EXPECT_TRUE(zonal.shouldOutput(LogLevel::TRACE));
  EXPECT_TRUE(index.shouldOutput(LogLevel::DETAILED));
  EXPECT_FALSE(index.shouldOutput(LogLevel::DEBUG));

  Logger::clearFacilityLevels();
  Logger::parseLogConfig("0");
  EXPECT_FALSE(index.shouldOutput(LogLevel::WARNING));
  EXPECT_TRUE(index.shouldOutput(LogLevel::ERROR));
  Logger::setDefaultLevel(LogLevel::INFO);

  const fs::path root = MakeTempPath("hexmosaic_log");
  const fs::path file = root / "run.log";
  {
    Logger logger(LogLevel::INFO, file.string());
    logger.info("Tessellated AOI 1");
    logger.info("Tessellated AOI 1");
    logger.info("Tessellated AOI 1");
    logger.debug("hidden detail");
    logger.flush();
  }
  const std::string text = ReadAll(file);
  EXPECT_TRUE(Contains(text, "Tessellated AOI 1"));
  EXPECT_TRUE(Contains(text, "The previous message occurred 3 times."));
  EXPECT_FALSE(Contains(text, "hidden detail"));

  std::error_code ec;
  fs::remove_all(root, ec);
}

int main()
{
  TestDistances();
  TestOffsets();
  TestCoordinates();
  TestConfigDocuments();
  TestConfigRejections();
  TestConfigRoundTrip();
  TestValidator();
  TestCommandLine();
  TestLogging();

  if (g_failures == 0) {
    std::cout << "ConfigLiteTests: OK\n";
    return 0;
  }

  std::cerr << "ConfigLiteTests: FAILED (" << g_failures << ")\n";
  return 1;
}
