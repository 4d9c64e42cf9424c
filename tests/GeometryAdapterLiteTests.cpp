#include "core/AreaOfInterest.hpp"
#include "core/Errors.hpp"
#include "core/FeatureSource.hpp"
#include "core/Geometry.hpp"
#include "core/ProjectPaths.hpp"
#include "core/SpatialReference.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

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

static Geometry Square(double x, double y, double size)
{
  return Geometry::rectangle(BoundingBox(x, y, x + size, y + size));
}

static void TestWktAndMeasurement()
{
  const Geometry square = Geometry::from_wkt("POLYGON ((0 0, 10 0, 10 10, 0 10, 0 0))");
  EXPECT_FALSE(square.is_empty());
  EXPECT_TRUE(square.is_polygonal());
  EXPECT_NEAR(square.area(), 100.0, 1e-9);

  const auto center = square.centroid();
  ASSERT_TRUE(center.has_value());
  EXPECT_NEAR(center->x(), 5.0, 1e-9);
  EXPECT_NEAR(center->y(), 5.0, 1e-9);

  const BoundingBox box = square.envelope();
  EXPECT_NEAR(box.width(), 10.0, 1e-12);
  EXPECT_NEAR(box.height(), 10.0, 1e-12);

  bool threw = false;
  try {
    (void)Geometry::from_wkt("POLYGON ((0 0, 10");
  } catch (const InvalidArgument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  EXPECT_TRUE(Geometry().is_empty());
  EXPECT_EQ(Geometry().kind(), GeometryKind::EMPTY);
  EXPECT_FALSE(Geometry().centroid().has_value());
}

static void TestOverlayLeavesOperandsUntouched()
{
  const Geometry a = Square(0.0, 0.0, 10.0);
  const Geometry b = Square(5.0, 5.0, 10.0);

  const Geometry overlap = a.intersection(b);
  EXPECT_NEAR(overlap.area(), 25.0, 1e-9);
  EXPECT_NEAR(a.area(), 100.0, 1e-9);
  EXPECT_NEAR(b.area(), 100.0, 1e-9);

  const Geometry both = a.union_with(b);
  EXPECT_NEAR(both.area(), 175.0, 1e-9);

  const Geometry far = Square(100.0, 100.0, 1.0);
  EXPECT_TRUE(a.intersection(far).is_empty());
  EXPECT_FALSE(a.intersects(far));
  EXPECT_TRUE(a.intersects(b));
  EXPECT_TRUE(a.contains(Geometry::point(Point2D(2.0, 2.0))));
}

static void TestUnionDissolvesSharedEdges()
{
  const std::vector<Geometry> tiles = {Square(0.0, 0.0, 10.0), Square(10.0, 0.0, 10.0), Geometry()};
  const Geometry merged = Geometry::unary_union(tiles);
  EXPECT_NEAR(merged.area(), 200.0, 1e-9);
  EXPECT_EQ(merged.rings().size(), static_cast<std::size_t>(1));

  EXPECT_TRUE(Geometry::unary_union({}).is_empty());
}

static void TestRepairOfSelfIntersection()
{
  const Geometry bowtie = Geometry::from_wkt("POLYGON ((0 0, 10 10, 10 0, 0 10, 0 0))");
  EXPECT_FALSE(bowtie.is_valid());

  const RepairResult repaired = bowtie.make_valid();
  ASSERT_TRUE(repaired.ok());
  EXPECT_TRUE(repaired.geometry.is_valid());

  const Geometry polygons = repaired.geometry.polygonal_part();
  EXPECT_TRUE(polygons.is_polygonal());
  EXPECT_NEAR(polygons.area(), 50.0, 1e-9);

  const Geometry valid = Square(0.0, 0.0, 1.0);
  const RepairResult unchanged = valid.make_valid();
  EXPECT_TRUE(unchanged.ok());
  EXPECT_NEAR(unchanged.geometry.area(), 1.0, 1e-12);
}

static void TestLinearHelpers()
{
  const Geometry path = Geometry::line_string({Point2D(0, 0), Point2D(10, 0), Point2D(10, 10)});
  EXPECT_TRUE(path.is_linear());
  EXPECT_NEAR(path.length(), 20.0, 1e-12);

  const auto mid = path.interpolate(15.0);
  ASSERT_TRUE(mid.has_value());
  EXPECT_NEAR(mid->x(), 10.0, 1e-12);
  EXPECT_NEAR(mid->y(), 5.0, 1e-12);

  const auto past_end = path.interpolate(100.0);
  ASSERT_TRUE(past_end.has_value());
  EXPECT_NEAR(past_end->y(), 10.0, 1e-12);

  const Geometry outline = Square(0.0, 0.0, 10.0).boundary().linear_part();
  EXPECT_TRUE(outline.is_linear());
  EXPECT_NEAR(outline.length(), 40.0, 1e-9);

  EXPECT_TRUE(Geometry::line_string({Point2D(1, 1)}).is_empty());
  EXPECT_NEAR(Geometry::point(Point2D(0, 0)).distance(Geometry::point(Point2D(3, 4))), 5.0, 1e-12);
  EXPECT_NEAR(Geometry().distance(path), -1.0, 0.0);
}

static void TestCrsAndTransforms()
{
  const Crs wgs84 = Crs::from_epsg(4326);
  const Crs utm33 = Crs::from_user_input("EPSG:32633");
  ASSERT_TRUE(wgs84.is_valid());
  ASSERT_TRUE(utm33.is_valid());
  EXPECT_TRUE(wgs84.is_geographic());
  EXPECT_FALSE(utm33.is_geographic());
  EXPECT_NEAR(utm33.meters_per_unit(), 1.0, 1e-12);
  EXPECT_EQ(utm33.auth_id(), std::string("EPSG:32633"));
  EXPECT_TRUE(utm33.same_as(Crs::from_epsg(32633)));
  EXPECT_FALSE(utm33.same_as(wgs84));
  EXPECT_FALSE(Crs().is_valid());

  bool threw = false;
  try {
    (void)Crs::from_user_input("not a coordinate system");
  } catch (const InvalidArgument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  // Longitude first, whatever the EPSG axis order says
  CoordinateTransformer forward(wgs84, utm33);
  const Point2D projected = forward.transform_point(Point2D(15.0, 50.0));
  EXPECT_NEAR(projected.x(), 500000.0, 1e-3);
  EXPECT_TRUE(projected.y() > 5500000.0 && projected.y() < 5600000.0);

  CoordinateTransformer back(utm33, wgs84);
  const Point2D lon_lat = back.transform_point(projected);
  EXPECT_NEAR(lon_lat.x(), 15.0, 1e-7);
  EXPECT_NEAR(lon_lat.y(), 50.0, 1e-7);

  CoordinateTransformer same(utm33, Crs::from_epsg(32633));
  EXPECT_TRUE(same.is_identity());
}

static void TestGeodesicHelpers()
{
  EXPECT_EQ(utm_epsg_for(15.1, 49.2), 32633);
  EXPECT_EQ(utm_epsg_for(-151.2, -10.0), 32705);
  EXPECT_EQ(utm_epsg_for(180.0, 10.0), 32660);

  EXPECT_NEAR(geodesic_distance(Point2D(0.0, 0.0), Point2D(1.0, 0.0)), 111319.49, 0.1);

  const MetersPerDegree equator = meters_per_degree(0.0, 0.0);
  EXPECT_NEAR(equator.lon, 111319.49, 0.1);
  EXPECT_NEAR(equator.lat, 110574.0, 5.0);

  const MetersPerDegree north = meters_per_degree(15.0, 60.0);
  EXPECT_TRUE(north.lon < equator.lon * 0.55);
  EXPECT_TRUE(north.lat > equator.lat);
}

static void TestMemoryFeatureSource()
{
  MemoryFeatureSource layer("parcels", Crs::from_epsg(32633));
  EXPECT_TRUE(layer.is_valid());
  EXPECT_EQ(layer.geometry_kind(), GeometryKind::POLYGON);

  const std::size_t name_field = layer.add_field(FieldDefinition("Name", FieldType::STRING, 40));
  EXPECT_EQ(name_field, static_cast<std::size_t>(0));

  EXPECT_EQ(layer.add_feature(Square(0, 0, 1), {std::string("a")}), static_cast<std::int64_t>(1));
  EXPECT_EQ(layer.add_feature(Square(1, 0, 1), {}, 42), static_cast<std::int64_t>(42));
  EXPECT_EQ(layer.add_feature(Square(2, 0, 1)), static_cast<std::int64_t>(43));
  EXPECT_EQ(layer.feature_count(), static_cast<std::size_t>(3));

  const std::size_t area_field = layer.add_field(FieldDefinition("area", FieldType::REAL, 12, 3));
  EXPECT_EQ(layer.features()[0].attributes.size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(layer.features()[0].attributes[area_field]));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(layer.features()[1].attributes[name_field]));

  layer.set_attribute(0, area_field, 1.5);
  EXPECT_NEAR(field_as_double(layer.features()[0].attributes[area_field]).value_or(0.0), 1.5, 1e-12);
  EXPECT_EQ(field_as_string(layer.features()[0].attributes[name_field]), std::string("a"));

  const auto found = layer.field_index("NAME");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, name_field);
  EXPECT_FALSE(layer.field_index("missing").has_value());

  EXPECT_EQ(field_as_int(FieldValue(3.0)).value_or(0), static_cast<std::int64_t>(3));
  EXPECT_FALSE(field_as_int(FieldValue(3.5)).has_value());
  EXPECT_FALSE(field_as_double(FieldValue(std::string("x"))).has_value());
}

static void TestAreaOfInterest()
{
  MemoryFeatureSource layer("aoi_layer", Crs::from_epsg(32633));
  layer.add_feature(Square(0, 0, 10));
  layer.add_feature(Square(10, 0, 10));
  layer.add_feature(Geometry::from_wkt("POLYGON ((20 0, 30 10, 30 0, 20 10, 20 0))"));

  const AreaOfInterest aoi = AreaOfInterest::from_source(layer);
  EXPECT_EQ(aoi.name, std::string("aoi_layer"));
  EXPECT_NEAR(aoi.geometry.area(), 250.0, 1e-9);
  EXPECT_NEAR(aoi.bounds().max_x, 30.0, 1e-9);

  MemoryFeatureSource lines("roads", Crs::from_epsg(32633), GeometryKind::LINE);
  bool threw = false;
  try {
    (void)AreaOfInterest::from_source(lines);
  } catch (const InvalidArgument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  const AreaOfInterest generated =
    AreaOfInterest::from_center("AOI 1", Crs::from_epsg(4326), Point2D(15.1, 49.2), 2000.0, 1500.0);
  EXPECT_EQ(generated.crs.auth_id(), std::string("EPSG:32633"));
  EXPECT_EQ(generated.source, std::string("generated"));
  EXPECT_NEAR(generated.bounds().width(), 2000.0, 1e-6);
  EXPECT_NEAR(generated.bounds().height(), 1500.0, 1e-6);

  threw = false;
  try {
    (void)AreaOfInterest::from_center("bad", Crs::from_epsg(32633), Point2D(0, 0), 0.0, 10.0);
  } catch (const InvalidArgument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  const auto batch = aois_from_points({Point2D(500000, 5000000), Point2D(510000, 5000000)},
                                      Crs::from_epsg(32633), 1000.0, 1000.0, 3);
  ASSERT_TRUE(batch.size() == 2);
  EXPECT_EQ(batch[0].name, std::string("AOI 3 1000m x 1000m"));
  EXPECT_EQ(batch[1].name, std::string("AOI 4 1000m x 1000m"));

  EXPECT_EQ(aoi_file_name(3, 2000.0, 1500.0), std::string("AOI_3_2000m_x_1500m.shp"));
  EXPECT_EQ(aoi_file_name(3, 2000.0, 1500.0, "north ridge"), std::string("AOI_3_2000m_x_1500m_north_ridge.shp"));
}

static void TestProjectPaths()
{
  EXPECT_EQ(safe_filename("Hex Grid (v2).shp"), std::string("Hex_Grid__v2_.shp"));
  EXPECT_EQ(slug("Upper Valley AOI"), std::string("upper_valley_aoi"));

  const ProjectPaths paths("/data/project");
  EXPECT_EQ(paths.base_grid_dir("AOI 1").generic_string(), std::string("/data/project/Layers/Base/Base_Grid/AOI_1"));
  EXPECT_EQ(paths.hex_tiles_file("AOI 1", 500.0).filename().string(), std::string("hex_tiles_500m.shp"));
  EXPECT_EQ(paths.segments_dir("AOI 1").filename().string(), std::string("Segments"));
  EXPECT_EQ(paths.elevation_hex_file("hex tiles").filename().string(), std::string("hex_tiles_hex_elevation.shp"));
  EXPECT_EQ(paths.mosaic_file("hex_tiles_Forest").generic_string(),
            std::string("/data/project/Layers/Mosaic/hex_tiles_Forest.shp"));
  EXPECT_EQ(paths.project_settings_file().filename().string(), std::string("hexmosaic.project.json"));
}

int main()
{
  TestWktAndMeasurement();
  TestOverlayLeavesOperandsUntouched();
  TestUnionDissolvesSharedEdges();
  TestRepairOfSelfIntersection();
  TestLinearHelpers();
  TestCrsAndTransforms();
  TestGeodesicHelpers();
  TestMemoryFeatureSource();
  TestAreaOfInterest();
  TestProjectPaths();

  if (g_failures == 0) {
    std::cout << "GeometryAdapterLiteTests: OK\n";
    return 0;
  }

  std::cerr << "GeometryAdapterLiteTests: FAILED (" << g_failures << ")\n";
  return 1;
}
