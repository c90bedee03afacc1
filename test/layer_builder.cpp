#include "common.hpp"
#include "layer_builder.hpp"
#include "geographic_context.hpp"

#include <iostream>

namespace cp = cartoposter;

namespace {

cp::feature tagged(std::int64_t id, const std::vector<std::string> &tags,
                   cp::geometry_kind kind = cp::geometry_kind::line) {
  return test::make_feature(id, kind, tags, {cp::lonlat(0, 0), cp::lonlat(1, 1)});
}

void expect(const std::vector<std::string> &tags, cp::canonical_layer layer) {
  cp::canonical_layer got = cp::classify(tagged(1, tags));
  test::assert_equal<std::string>(cp::to_string(got), cp::to_string(layer),
                                  "classification of " + (tags.empty() ? std::string("{}") : tags[0]));
}

void test_road_hierarchy() {
  expect({"highway=motorway"}, cp::canonical_layer::road_motorway);
  expect({"highway=motorway_link"}, cp::canonical_layer::road_motorway);
  expect({"highway=trunk"}, cp::canonical_layer::road_primary);
  expect({"highway=primary"}, cp::canonical_layer::road_primary);
  expect({"highway=secondary"}, cp::canonical_layer::road_secondary);
  expect({"highway=tertiary_link"}, cp::canonical_layer::road_tertiary);
  expect({"highway=residential"}, cp::canonical_layer::road_residential);
  expect({"highway=unclassified"}, cp::canonical_layer::road_residential);
  expect({"highway=footway"}, cp::canonical_layer::road_default);
  expect({"highway=service"}, cp::canonical_layer::road_default);
}

void test_water_parks_and_land() {
  expect({"natural=water"}, cp::canonical_layer::water);
  expect({"water=lake"}, cp::canonical_layer::water);
  expect({"waterway=riverbank"}, cp::canonical_layer::water);
  expect({"waterway=river"}, cp::canonical_layer::waterway);
  expect({"natural=wood"}, cp::canonical_layer::forest);
  expect({"landuse=forest"}, cp::canonical_layer::forest);
  expect({"leisure=park"}, cp::canonical_layer::parks);
  expect({"landuse=grass"}, cp::canonical_layer::parks);
  expect({"building=yes"}, cp::canonical_layer::buildings);
  expect({"natural=peak"}, cp::canonical_layer::land);
  expect({"railway=rail"}, cp::canonical_layer::rail);
  expect({"railway=subway"}, cp::canonical_layer::transit);
}

void test_cycling_and_railway_overlays() {
  expect({"highway=cycleway"}, cp::canonical_layer::cycleway);
  expect({"highway=cycleway", "bicycle=designated"}, cp::canonical_layer::cycleway);
  expect({"highway=path", "bicycle=designated"}, cp::canonical_layer::road_default);
  expect({"railway=station"}, cp::canonical_layer::rail_station);
  expect({"railway=halt"}, cp::canonical_layer::rail_station);
  expect({"railway=tram_stop"}, cp::canonical_layer::rail_station);
  expect({"railway=light_rail"}, cp::canonical_layer::transit);
  expect({"railway=funicular"}, cp::canonical_layer::transit);

  test::assert_equal<bool>(cp::is_point_layer(cp::canonical_layer::rail_station), true, "stations are markers");
  test::assert_equal<bool>(cp::is_point_layer(cp::canonical_layer::cycleway), false, "cycleways are lines");
  test::assert_equal<bool>(cp::group_of(cp::canonical_layer::cycleway) == cp::layer_group::roads, true,
                           "cycleways draw with the roads");
  test::assert_equal<bool>(cp::group_of(cp::canonical_layer::rail_station) == cp::layer_group::rail, true,
                           "stations draw with the rail");
}

void test_unmatched_is_generic() {
  expect({}, cp::canonical_layer::generic);
  expect({"amenity=cafe"}, cp::canonical_layer::generic);
  expect({"landuse=industrial"}, cp::canonical_layer::generic);
}

void test_first_rule_wins() {
  // a road which is also tagged as a building part goes with the road.
  expect({"highway=primary", "building=yes"}, cp::canonical_layer::road_primary);
  expect({"building=yes", "natural=water"}, cp::canonical_layer::water);
}

void test_draw_order() {
  const std::vector<cp::canonical_layer> &order = cp::draw_order();
  test::assert_equal<size_t>(order.size(), 18, "every layer");
  test::assert_equal<std::string>(cp::to_string(order.front()), "water", "water at the bottom");
  test::assert_equal<std::string>(cp::to_string(order.back()), "labels", "labels on top");

  for (size_t i = 1; i < order.size(); ++i) {
    test::assert_less_or_equal<int>(int(cp::group_of(order[i - 1])), int(cp::group_of(order[i])),
                                    "groups never go backwards at " + cp::to_string(order[i]));
  }
  for (cp::canonical_layer l : order) {
    test::assert_equal<bool>(cp::layer_from_string(cp::to_string(l)) == l, true,
                             "name of " + cp::to_string(l) + " round trips");
  }
  test::assert_equal<bool>(bool(cp::layer_from_string("roads")), false, "unknown layer");
}

void test_build_layers() {
  cp::geo_dataset d(cp::coordinate(0, 0), 1000.0);
  d.collections[cp::feature_category::water].push_back(
    tagged(1, {"natural=water"}, cp::geometry_kind::polygon));
  d.collections[cp::feature_category::roads].push_back(tagged(2, {"highway=primary"}));
  d.collections[cp::feature_category::roads].push_back(tagged(3, {"highway=residential"}));
  d.collections[cp::feature_category::roads].push_back(tagged(4, {"highway=primary"}));
  // also fetched as a park: only the first sighting counts.
  d.collections[cp::feature_category::parks].push_back(
    tagged(1, {"natural=water"}, cp::geometry_kind::polygon));

  cp::layer_set layers = cp::build_layers(d);
  test::assert_equal<size_t>(layers.size(), cp::draw_order().size(), "every layer present");
  for (size_t i = 0; i < layers.size(); ++i) {
    test::assert_equal<bool>(layers[i].layer == cp::draw_order()[i], true, "in draw order");
  }

  const cp::render_layer &water = layers[size_t(cp::canonical_layer::water)];
  test::assert_equal<size_t>(water.features.size(), 1, "duplicate dropped");

  const cp::render_layer &primary = layers[size_t(cp::canonical_layer::road_primary)];
  test::assert_equal<size_t>(primary.features.size(), 2, "two primaries");
  test::assert_equal<std::int64_t>(primary.features[0].id, 2, "stored order kept");
  test::assert_equal<std::int64_t>(primary.features[1].id, 4, "stored order kept");

  test::assert_equal<size_t>(layers[size_t(cp::canonical_layer::rail)].features.size(), 0, "empty");
}

void test_same_id_different_kind_is_kept() {
  cp::geo_dataset d(cp::coordinate(0, 0), 1000.0);
  d.collections[cp::feature_category::land].push_back(
    test::make_feature(5, cp::geometry_kind::point, {"natural=peak"}, {cp::lonlat(0, 0)}));
  d.collections[cp::feature_category::land].push_back(tagged(5, {"natural=ridge"}));

  cp::layer_set layers = cp::build_layers(d);
  test::assert_equal<size_t>(layers[size_t(cp::canonical_layer::land)].features.size(), 2,
                             "a node and a way may share an id");
}

cp::terrain terrain_of(const std::vector<cp::feature> &features) {
  cp::geo_dataset d(cp::coordinate(0, 0), 1000.0);
  d.collections[cp::feature_category::land] = features;
  return cp::detect_context(d).terrain_type;
}

void test_detect_terrain() {
  test::assert_equal<std::string>(cp::to_string(terrain_of({})), "urban", "empty is urban");
  test::assert_equal<std::string>(
    cp::to_string(terrain_of({ tagged(1, {"natural=peak"}), tagged(2, {"natural=coastline"}) })),
    "mountain", "mountain beats coastal");
  test::assert_equal<std::string>(
    cp::to_string(terrain_of({ tagged(1, {"natural=beach"}), tagged(2, {"natural=sand"}) })),
    "coastal", "coastal beats desert");
  test::assert_equal<std::string>(
    cp::to_string(terrain_of({ tagged(1, {"natural=sand"}) })), "desert", "desert");

  std::vector<cp::feature> woods;
  woods.push_back(tagged(1, {"natural=wood"}, cp::geometry_kind::polygon));
  woods.push_back(tagged(2, {"building=yes"}, cp::geometry_kind::polygon));
  woods.push_back(tagged(3, {"building=yes"}, cp::geometry_kind::polygon));
  test::assert_equal<std::string>(cp::to_string(terrain_of(woods)), "forest", "a third woodland");

  woods.push_back(tagged(4, {"building=yes"}, cp::geometry_kind::polygon));
  test::assert_equal<std::string>(cp::to_string(terrain_of(woods)), "urban", "a quarter isn't enough");
}

void test_season_passes_through() {
  cp::geo_dataset d(cp::coordinate(0, 0), 1000.0);
  cp::geographic_context c = cp::detect_context(d, cp::season::winter);
  test::assert_equal<std::string>(cp::to_string(c.season_type), "winter", "season");
  test::assert_equal<bool>(cp::season_from_string("autumn") == cp::season::autumn, true, "parse");
  test::assert_equal<bool>(bool(cp::season_from_string("fall")), false, "unknown season");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing layer builder ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }
  RUN_TEST(test_road_hierarchy);
  RUN_TEST(test_water_parks_and_land);
  RUN_TEST(test_cycling_and_railway_overlays);
  RUN_TEST(test_unmatched_is_generic);
  RUN_TEST(test_first_rule_wins);
  RUN_TEST(test_draw_order);
  RUN_TEST(test_build_layers);
  RUN_TEST(test_same_id_different_kind_is_kept);
  RUN_TEST(test_detect_terrain);
  RUN_TEST(test_season_passes_through);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
