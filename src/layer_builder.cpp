#include "layer_builder.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace cartoposter {

namespace {

struct rule {
  const char *key;
  // empty means any value of the key matches.
  std::vector<std::string> values;
  canonical_layer layer;
};

// priority order: first match wins.
const std::vector<rule> &rules() {
  static const std::vector<rule> table = {
    { "highway",  { "motorway", "motorway_link" }, canonical_layer::road_motorway },
    { "highway",  { "trunk", "trunk_link", "primary", "primary_link" }, canonical_layer::road_primary },
    { "highway",  { "secondary", "secondary_link" }, canonical_layer::road_secondary },
    { "highway",  { "tertiary", "tertiary_link" }, canonical_layer::road_tertiary },
    { "highway",  { "residential", "living_street", "unclassified" }, canonical_layer::road_residential },
    { "highway",  { "cycleway" }, canonical_layer::cycleway },
    { "highway",  { }, canonical_layer::road_default },
    { "railway",  { "station", "halt", "tram_stop" }, canonical_layer::rail_station },
    { "railway",  { "subway", "tram", "light_rail", "monorail", "funicular" }, canonical_layer::transit },
    { "railway",  { }, canonical_layer::rail },
    { "waterway", { "riverbank", "dock" }, canonical_layer::water },
    { "waterway", { }, canonical_layer::waterway },
    { "natural",  { "water", "bay", "strait", "wetland" }, canonical_layer::water },
    { "water",    { }, canonical_layer::water },
    { "natural",  { "wood" }, canonical_layer::forest },
    { "landuse",  { "forest" }, canonical_layer::forest },
    { "leisure",  { "park", "garden", "nature_reserve", "playground", "pitch" }, canonical_layer::parks },
    { "landuse",  { "grass", "meadow", "recreation_ground", "village_green" }, canonical_layer::parks },
    { "natural",  { "scrub", "heath", "grassland" }, canonical_layer::parks },
    { "building", { }, canonical_layer::buildings },
    { "natural",  { "peak", "ridge", "cliff", "volcano", "bare_rock", "sand", "beach",
                    "scree", "glacier", "coastline" }, canonical_layer::land },
  };
  return table;
}

bool matches(const rule &r, const feature &f) {
  boost::optional<const std::string &> value = f.tag(r.key);
  if (!value) {
    return false;
  }
  return r.values.empty() ||
    (std::find(r.values.begin(), r.values.end(), *value) != r.values.end());
}

} // anonymous namespace

const std::vector<canonical_layer> &draw_order() {
  static const std::vector<canonical_layer> order = {
    canonical_layer::water,
    canonical_layer::waterway,
    canonical_layer::parks,
    canonical_layer::forest,
    canonical_layer::land,
    canonical_layer::generic,
    canonical_layer::buildings,
    canonical_layer::road_motorway,
    canonical_layer::road_primary,
    canonical_layer::road_secondary,
    canonical_layer::road_tertiary,
    canonical_layer::road_residential,
    canonical_layer::road_default,
    canonical_layer::cycleway,
    canonical_layer::rail,
    canonical_layer::transit,
    canonical_layer::rail_station,
    canonical_layer::labels
  };
  return order;
}

std::string to_string(canonical_layer l) {
  switch (l) {
  case canonical_layer::water:            return "water";
  case canonical_layer::waterway:         return "waterway";
  case canonical_layer::parks:            return "parks";
  case canonical_layer::forest:           return "forest";
  case canonical_layer::land:             return "land";
  case canonical_layer::generic:          return "generic";
  case canonical_layer::buildings:        return "buildings";
  case canonical_layer::road_motorway:    return "road_motorway";
  case canonical_layer::road_primary:     return "road_primary";
  case canonical_layer::road_secondary:   return "road_secondary";
  case canonical_layer::road_tertiary:    return "road_tertiary";
  case canonical_layer::road_residential: return "road_residential";
  case canonical_layer::road_default:     return "road_default";
  case canonical_layer::cycleway:         return "cycleway";
  case canonical_layer::rail:             return "rail";
  case canonical_layer::transit:          return "transit";
  case canonical_layer::rail_station:     return "rail_station";
  case canonical_layer::labels:           return "labels";
  }
  throw std::logic_error("Unhandled canonical layer");
}

boost::optional<canonical_layer> layer_from_string(const std::string &s) {
  for (canonical_layer l : draw_order()) {
    if (to_string(l) == s) {
      return l;
    }
  }
  return boost::none;
}

layer_group group_of(canonical_layer l) {
  switch (l) {
  case canonical_layer::water:
  case canonical_layer::waterway:
    return layer_group::water;
  case canonical_layer::parks:
  case canonical_layer::forest:
    return layer_group::parks;
  case canonical_layer::land:
  case canonical_layer::generic:
  case canonical_layer::buildings:
    return layer_group::land;
  case canonical_layer::road_motorway:
  case canonical_layer::road_primary:
  case canonical_layer::road_secondary:
  case canonical_layer::road_tertiary:
  case canonical_layer::road_residential:
  case canonical_layer::road_default:
  case canonical_layer::cycleway:
    return layer_group::roads;
  case canonical_layer::rail:
  case canonical_layer::transit:
  case canonical_layer::rail_station:
    return layer_group::rail;
  case canonical_layer::labels:
    return layer_group::labels;
  }
  throw std::logic_error("Unhandled canonical layer");
}

bool is_area_layer(canonical_layer l) {
  switch (l) {
  case canonical_layer::water:
  case canonical_layer::parks:
  case canonical_layer::forest:
  case canonical_layer::land:
  case canonical_layer::generic:
  case canonical_layer::buildings:
    return true;
  default:
    return false;
  }
}

bool is_point_layer(canonical_layer l) {
  return l == canonical_layer::rail_station;
}

canonical_layer classify(const feature &f) {
  for (const rule &r : rules()) {
    if (matches(r, f)) {
      return r.layer;
    }
  }
  return canonical_layer::generic;
}

layer_set build_layers(const geo_dataset &dataset) {
  layer_set layers;
  for (canonical_layer l : draw_order()) {
    render_layer rl;
    rl.layer = l;
    layers.push_back(std::move(rl));
  }

  // canonical_layer values are declared in draw order, so they index
  // straight into the set.
  std::set<std::pair<std::int64_t, geometry_kind> > seen;
  for (feature_category category : all_categories()) {
    for (const feature &f : dataset.features(category)) {
      if (!seen.insert(std::make_pair(f.id, f.kind)).second) {
        continue;
      }
      layers[static_cast<size_t>(classify(f))].features.push_back(f);
    }
  }

  return layers;
}

} // namespace cartoposter
