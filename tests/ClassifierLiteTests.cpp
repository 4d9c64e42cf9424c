#include "core/Errors.hpp"
#include "core/FeatureClassifier.hpp"
#include "core/FeatureSource.hpp"
#include "core/HexGridTessellator.hpp"
#include "core/HexIndex.hpp"
#include "core/LineTracer.hpp"
#include "core/MosaicProfile.hpp"
#include "core/ProjectPaths.hpp"
#include "export/MosaicBuilder.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
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

static bool FileExists(const fs::path& p)
{
  std::error_code ec;
  return fs::exists(p, ec) && !ec;
}

static const double kSqrt3 = std::sqrt(3.0);
static const double kRadius = 100.0 / kSqrt3;

// 1 km square in UTM 33N at 100 m. Column 2 (x = 3.5 R) holds ids 22..31
// with centres at y = 950, 850, ..., 50; id 16 sits in column 1 at y = 500.
static TessellationResult SquareLattice()
{
  AreaOfInterest aoi;
  aoi.name = "Test Square";
  aoi.crs = Crs::from_epsg(32633);
  aoi.geometry = Geometry::rectangle(BoundingBox(0.0, 0.0, 1000.0, 1000.0));
  return HexGridTessellator().tessellate(aoi, 100.0);
}

static MemoryFeatureSource PolygonSource(const std::string& name, const Geometry& geometry)
{
  MemoryFeatureSource source(name, Crs::from_epsg(32633), GeometryKind::POLYGON);
  source.add_feature(geometry);
  return source;
}

static MemoryFeatureSource LineSource(const std::string& name, const std::vector<Point2D>& points)
{
  MemoryFeatureSource source(name, Crs::from_epsg(32633), GeometryKind::LINE);
  source.add_feature(Geometry::line_string(points));
  return source;
}

static Geometry ColumnTwoLine()
{
  return Geometry::line_string({Point2D(3.5 * kRadius, 850.0), Point2D(3.5 * kRadius, 250.0)});
}

static double CoverageOf(const ClassificationResult& result, std::int64_t id)
{
  auto it = result.coverage.find(id);
  return it == result.coverage.end() ? -1.0 : it->second;
}

static void TestPolygonCoverage()
{
  const TessellationResult lattice = SquareLattice();
  const HexIndex index(lattice);
  const MemoryFeatureSource upper = PolygonSource("landcover_forest", Geometry::rectangle(BoundingBox(0.0, 520.0, 1000.0, 1000.0)));

  const ClassificationResult result = classify_polygons(index, {&upper});
  EXPECT_TRUE(result.warnings.empty());

  // Top 30 of 100 m covered, centroid outside
  EXPECT_NEAR(CoverageOf(result, 16), 0.26, 1e-9);
  // Bottom 30 m uncovered, centroid inside
  EXPECT_NEAR(CoverageOf(result, 26), 0.84, 1e-9);
  EXPECT_NEAR(CoverageOf(result, 22), 1.0, 1e-9);
  EXPECT_TRUE(result.coverage.find(27) == result.coverage.end());
  for (const auto& entry : result.coverage) {
    EXPECT_TRUE(entry.second > 0.0 && entry.second <= 1.0);
  }

  const ClassificationResult strict = classify_polygons(index, {&upper}, 0.5);
  EXPECT_TRUE(strict.coverage.find(16) == strict.coverage.end());
  EXPECT_NEAR(CoverageOf(strict, 26), 0.84, 1e-9);

  // A covered centroid keeps the cell whatever the threshold
  const ClassificationResult stricter = classify_polygons(index, {&upper}, 0.9);
  EXPECT_NEAR(CoverageOf(stricter, 26), 0.84, 1e-9);
  EXPECT_NEAR(CoverageOf(stricter, 22), 1.0, 1e-9);
}

static void TestOverlappingSourcesAreUnited()
{
  const TessellationResult lattice = SquareLattice();
  const HexIndex index(lattice);
  const MemoryFeatureSource a = PolygonSource("forest_a", Geometry::rectangle(BoundingBox(0.0, 520.0, 1000.0, 1000.0)));
  const MemoryFeatureSource b = PolygonSource("forest_b", Geometry::rectangle(BoundingBox(0.0, 520.0, 1000.0, 1000.0)));

  const ClassificationResult result = FeatureClassifier().classify_polygons(index, {&a, &b});
  EXPECT_NEAR(CoverageOf(result, 16), 0.26, 1e-9);
  EXPECT_NEAR(CoverageOf(result, 22), 1.0, 1e-9);
}

static void TestSkippedSources()
{
  const TessellationResult lattice = SquareLattice();
  const HexIndex index(lattice);

  const MemoryFeatureSource roads = LineSource("roads", {Point2D(0.0, 0.0), Point2D(1000.0, 1000.0)});
  const MemoryFeatureSource broken("broken", Crs(), GeometryKind::POLYGON);
  const ClassificationResult result = classify_polygons(index, {&roads, &broken});
  EXPECT_TRUE(result.empty());
  ASSERT_TRUE(result.warnings.size() == 2);
  EXPECT_EQ(result.warnings[0], std::string("Polygon source 'roads' has no polygonal features; skipped."));
  EXPECT_EQ(result.warnings[1], std::string("Polygon source 'broken' is invalid; skipped."));

  const MemoryFeatureSource no_hexes("hex_tiles_empty", Crs::from_epsg(32633), GeometryKind::POLYGON);
  const HexIndex empty_index(no_hexes);
  const MemoryFeatureSource forest = PolygonSource("forest", Geometry::rectangle(BoundingBox(0.0, 0.0, 10.0, 10.0)));
  const ClassificationResult nothing = classify_polygons(empty_index, {&forest});
  EXPECT_TRUE(nothing.empty());
  ASSERT_TRUE(nothing.warnings.size() == 1);
  EXPECT_EQ(nothing.warnings[0], std::string("Hex layer has no cells to classify."));

  // Self-intersecting input is repaired, not dropped
  const MemoryFeatureSource bowtie = PolygonSource(
    "bowtie", Geometry::from_wkt("POLYGON ((0 520, 1000 1000, 1000 520, 0 1000, 0 520))"));
  const ClassificationResult repaired = classify_polygons(index, {&bowtie});
  EXPECT_FALSE(repaired.empty());
}

static void TestLineBehaviorNames()
{
  EXPECT_EQ(parse_line_behavior("centroid_path"), LineBehavior::CENTROID_PATH);
  EXPECT_EQ(parse_line_behavior("Center_To_Edge"), LineBehavior::CENTROID_PATH);
  EXPECT_EQ(parse_line_behavior(""), LineBehavior::CENTROID_PATH);
  EXPECT_EQ(parse_line_behavior("EDGE"), LineBehavior::EDGE_PATH);
  EXPECT_EQ(to_string(LineBehavior::EDGE_PATH), std::string("edge_path"));

  bool threw = false;
  try {
    (void)parse_line_behavior("zigzag");
  } catch (const InvalidArgument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

static void TestVisitedHexes()
{
  const TessellationResult lattice = SquareLattice();
  const HexIndex index(lattice);
  LineTracer tracer(index);

  const std::vector<std::int64_t> ids = tracer.visited_hexes(ColumnTwoLine(), 0.0);
  ASSERT_TRUE(ids.size() == 7);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(ids[i], static_cast<std::int64_t>(23 + i));
  }

  // Large steps only see the endpoints
  const std::vector<std::int64_t> coarse = tracer.visited_hexes(ColumnTwoLine(), 1000.0);
  ASSERT_TRUE(coarse.size() == 2);
  EXPECT_EQ(coarse[0], static_cast<std::int64_t>(23));
  EXPECT_EQ(coarse[1], static_cast<std::int64_t>(29));

  EXPECT_TRUE(tracer.visited_hexes(Geometry(), 0.0).empty());
}

static void TestCentroidPath()
{
  const TessellationResult lattice = SquareLattice();
  const HexIndex index(lattice);

  auto path = trace_line(index, ColumnTwoLine(), LineBehavior::CENTROID_PATH, 0.0, 0.0);
  ASSERT_TRUE(path.has_value());
  EXPECT_NEAR(path->length(), 600.0, 1e-6);

  // Inside one cell there is no path
  const Geometry short_line = Geometry::line_string({Point2D(3.5 * kRadius, 560.0), Point2D(3.5 * kRadius, 540.0)});
  EXPECT_FALSE(trace_line(index, short_line, LineBehavior::CENTROID_PATH, 0.0, 0.0).has_value());
}

static void TestEdgePath()
{
  const TessellationResult lattice = SquareLattice();
  const HexIndex index(lattice);
  LineTracer tracer(index);

  auto edge = tracer.shared_edge(23, 24);
  ASSERT_TRUE(edge.has_value());
  EXPECT_NEAR(edge->length(), kRadius, 1e-6);
  EXPECT_FALSE(tracer.shared_edge(23, 29).has_value());
  EXPECT_EQ(tracer.cached_edges(), static_cast<std::size_t>(2));
  EXPECT_TRUE(tracer.shared_edge(24, 23).has_value());
  EXPECT_EQ(tracer.cached_edges(), static_cast<std::size_t>(2));

  auto path = tracer.trace_line(ColumnTwoLine(), LineBehavior::EDGE_PATH, 0.0, 0.0);
  ASSERT_TRUE(path.has_value());
  EXPECT_NEAR(path->length(), 6.0 * kRadius, 1e-6);
  EXPECT_NEAR(path->area(), 0.0, 0.0);
  EXPECT_EQ(tracer.cached_edges(), static_cast<std::size_t>(7));

  // Endpoints in non-adjacent cells share no edge
  EXPECT_FALSE(tracer.trace_line(ColumnTwoLine(), LineBehavior::EDGE_PATH, 0.0, 1000.0).has_value());

  auto buffered = tracer.trace_line(ColumnTwoLine(), LineBehavior::EDGE_PATH, 10.0, 0.0);
  ASSERT_TRUE(buffered.has_value());
  EXPECT_TRUE(buffered->area() > 0.0);
}

static void TestProfile()
{
  const nlohmann::json document = nlohmann::json::parse(R"({
    "classes": [
      {"id": "road_primary", "target_layer": "Roads", "priority": 20, "line": "edge_path"},
      {"id": "forest", "target_layer": "Forest", "priority": 10, "fill": "#2e7d32", "match": [{"tag": "wood"}]},
      {"id": "stream", "target_layer": "Streams", "priority": 20, "line": true},
      {"id": "orphan", "priority": 1, "fill": "#000000"}
    ]
  })");

  const MosaicProfile profile = MosaicProfile::from_json(document);
  ASSERT_TRUE(profile.classes().size() == 3);
  EXPECT_EQ(profile.classes()[0].class_id, std::string("forest"));
  EXPECT_EQ(profile.classes()[0].mode, MosaicMode::POLYGON);
  EXPECT_EQ(profile.classes()[0].matchers.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(profile.classes()[1].class_id, std::string("road_primary"));
  EXPECT_EQ(profile.classes()[1].mode, MosaicMode::LINE);
  EXPECT_EQ(profile.classes()[1].line_behavior, LineBehavior::EDGE_PATH);
  EXPECT_EQ(profile.classes()[2].class_id, std::string("stream"));
  EXPECT_EQ(profile.classes()[2].line_behavior, LineBehavior::CENTROID_PATH);
  EXPECT_TRUE(profile.find("orphan") == nullptr);

  const std::vector<std::string> layers = {"Landcover - Forest", "roads_primary", "Roads - Minor", "Buildings"};
  const MosaicClassState forest = profile.default_state(*profile.find("forest"), layers);
  EXPECT_EQ(forest.polygon_sources.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(forest.polygon_sources.count("Landcover - Forest"), static_cast<std::size_t>(1));
  EXPECT_TRUE(forest.line_sources.empty());
  EXPECT_NEAR(forest.area_threshold, 0.0, 0.0);
  EXPECT_NEAR(forest.line_buffer, 30.0, 0.0);
  EXPECT_NEAR(forest.line_step, 200.0, 0.0);

  const MosaicClassState roads = profile.default_state(*profile.find("road_primary"), layers);
  EXPECT_EQ(roads.line_sources.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(roads.line_sources.count("roads_primary"), static_cast<std::size_t>(1));

  bool threw = false;
  try {
    (void)MosaicProfile::from_json(nlohmann::json::parse(R"({"classes": {"id": "forest"}})"));
  } catch (const InvalidArgument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
  EXPECT_TRUE(MosaicProfile::from_json(nlohmann::json::object()).classes().empty());

  const fs::path root = MakeTempPath("hexmosaic_profile");
  std::error_code ec;
  fs::create_directories(root, ec);
  ASSERT_TRUE(!ec);

  MosaicProfile loaded;
  EXPECT_FALSE(loaded.load_from_file((root / "missing.json").string()));
  EXPECT_FALSE(loaded.last_error().empty());

  {
    std::ofstream out(root / "bad.json");
    out << "{ \"classes\": [";
  }
  EXPECT_FALSE(loaded.load_from_file((root / "bad.json").string()));
  EXPECT_TRUE(loaded.last_error().find("Failed to parse mosaic profile") != std::string::npos);

  {
    std::ofstream out(root / "profile.json");
    out << document.dump(2);
  }
  ASSERT_TRUE(loaded.load_from_file((root / "profile.json").string()));
  EXPECT_EQ(loaded.classes().size(), static_cast<std::size_t>(3));

  fs::remove_all(root, ec);
}

static void TestMosaicBuilder()
{
  EXPECT_EQ(MosaicBuilder::output_name("hex_tiles_500m (AOI 1)", "Forest"), std::string("hex_tiles_500m_Forest"));
  EXPECT_EQ(MosaicBuilder::output_name("", "Forest"), std::string("Forest"));

  const TessellationResult lattice = SquareLattice();
  const MemoryFeatureSource hexes = make_hex_layer(lattice, "hex_tiles_100m (AOI 1)");
  const fs::path root = MakeTempPath("hexmosaic_mosaic");
  MosaicBuilder builder(hexes, ProjectPaths(root));
  EXPECT_EQ(builder.index().size(), lattice.cells.size());

  MosaicClass forest;
  forest.class_id = "forest";
  forest.target_layer = "Forest";
  forest.mode = MosaicMode::POLYGON;

  const MemoryFeatureSource woods = PolygonSource("landcover_forest", Geometry::rectangle(BoundingBox(0.0, 520.0, 1000.0, 1000.0)));
  const MemoryFeatureSource parks = PolygonSource("landcover_park", Geometry::rectangle(BoundingBox(0.0, 900.0, 100.0, 1000.0)));
  MosaicClassState state;

  EXPECT_FALSE(builder.build_polygon_class(forest, {}, state).has_value());

  auto layer = builder.build_polygon_class(forest, {&woods, &parks}, state);
  ASSERT_TRUE(layer.has_value());
  EXPECT_EQ(layer->name(), std::string("Forest"));
  ASSERT_TRUE(layer->fields().size() == 4);
  EXPECT_EQ(layer->fields()[1].name, std::string("class_id"));
  EXPECT_EQ(layer->fields()[2].name, std::string("coverage"));
  EXPECT_EQ(layer->fields()[3].name, std::string("source_layers"));

  bool found = false;
  for (const auto& feature : layer->features()) {
    EXPECT_EQ(field_as_string(feature.attributes[1]), std::string("forest"));
    EXPECT_EQ(field_as_string(feature.attributes[3]), std::string("landcover_forest;landcover_park"));
    if (field_as_int(feature.attributes[0]).value_or(0) == 16) {
      found = true;
      EXPECT_NEAR(field_as_double(feature.attributes[2]).value_or(-1.0), 0.26, 1e-9);
    }
    EXPECT_TRUE(field_as_int(feature.attributes[0]).value_or(0) != 27);
  }
  EXPECT_TRUE(found);

  MosaicClass roads;
  roads.class_id = "road_primary";
  roads.target_layer = "Roads";
  roads.mode = MosaicMode::LINE;
  roads.line_behavior = LineBehavior::CENTROID_PATH;

  const MemoryFeatureSource primary = LineSource(
    "roads_primary", {Point2D(3.5 * kRadius, 850.0), Point2D(3.5 * kRadius, 250.0)});
  MosaicClassState line_state;
  line_state.line_step = 0.0;

  auto lines = builder.build_line_class(roads, {&primary}, line_state);
  ASSERT_TRUE(lines.has_value());
  EXPECT_EQ(lines->geometry_kind(), GeometryKind::LINE);
  EXPECT_TRUE(lines->feature_count() >= 1);
  double total = 0.0;
  for (const auto& feature : lines->features()) {
    total += feature.geometry.length();
    EXPECT_EQ(field_as_string(feature.attributes[0]), std::string("road_primary"));
    EXPECT_EQ(field_as_string(feature.attributes[1]), std::string("roads_primary"));
  }
  EXPECT_NEAR(total, 600.0, 1e-6);

  // A buffer on an edge path must not swallow the shared edges of a line layer
  MosaicClass road_edges = roads;
  road_edges.line_behavior = LineBehavior::EDGE_PATH;
  MosaicClassState buffered_state;
  buffered_state.line_step = 0.0;
  buffered_state.line_buffer = 30.0;
  auto edges = builder.build_line_class(road_edges, {&primary}, buffered_state);
  ASSERT_TRUE(edges.has_value());
  double edge_total = 0.0;
  for (const auto& feature : edges->features()) {
    edge_total += feature.geometry.length();
  }
  EXPECT_NEAR(edge_total, 6.0 * kRadius, 1e-6);

  // Polygon layers are not line sources
  EXPECT_FALSE(builder.build_line_class(roads, {&woods}, line_state).has_value());
  EXPECT_EQ(builder.warnings().back(), std::string("Line source 'landcover_forest' is not a valid line layer; skipped."));

  auto saved = builder.run_class(forest, {&woods}, state);
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->layer_name, std::string("hex_tiles_100m_Forest"));
  EXPECT_EQ(saved->path, root / "Layers" / "Mosaic" / "hex_tiles_100m_Forest.shp");
  EXPECT_TRUE(FileExists(saved->path));
  EXPECT_TRUE(saved->feature_count > 0);

  const OgrFeatureSource reread(saved->path.string());
  ASSERT_TRUE(reread.is_valid());
  EXPECT_EQ(reread.feature_count(), saved->feature_count);
  EXPECT_TRUE(reread.field_index("coverage").has_value());

  auto saved_lines = builder.run_class(roads, {&primary}, line_state);
  ASSERT_TRUE(saved_lines.has_value());
  EXPECT_TRUE(FileExists(root / "Layers" / "Mosaic" / "hex_tiles_100m_Roads.shp"));

  std::error_code ec;
  fs::remove_all(root, ec);
}

int main()
{
  TestPolygonCoverage();
  TestOverlappingSourcesAreUnited();
  TestSkippedSources();
  TestLineBehaviorNames();
  TestVisitedHexes();
  TestCentroidPath();
  TestEdgePath();
  TestProfile();
  TestMosaicBuilder();

  if (g_failures == 0) {
    std::cout << "ClassifierLiteTests: OK\n";
    return 0;
  }

  std::cerr << "ClassifierLiteTests: FAILED (" << g_failures << ")\n";
  return 1;
}
