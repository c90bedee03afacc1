#include "geographic_context.hpp"

#include <initializer_list>
#include <stdexcept>

namespace cartoposter {

namespace {

bool has_value(const feature &f, const char *key, std::initializer_list<const char *> values) {
  boost::optional<const std::string &> v = f.tag(key);
  if (!v) {
    return false;
  }
  for (const char *candidate : values) {
    if (*v == candidate) {
      return true;
    }
  }
  return false;
}

} // anonymous namespace

std::string to_string(terrain t) {
  switch (t) {
  case terrain::urban:    return "urban";
  case terrain::mountain: return "mountain";
  case terrain::coastal:  return "coastal";
  case terrain::desert:   return "desert";
  case terrain::forest:   return "forest";
  }
  throw std::logic_error("Unhandled terrain");
}

std::string to_string(season s) {
  switch (s) {
  case season::none:   return "none";
  case season::spring: return "spring";
  case season::summer: return "summer";
  case season::autumn: return "autumn";
  case season::winter: return "winter";
  }
  throw std::logic_error("Unhandled season");
}

boost::optional<terrain> terrain_from_string(const std::string &s) {
  for (terrain t : { terrain::urban, terrain::mountain, terrain::coastal, terrain::desert, terrain::forest }) {
    if (to_string(t) == s) {
      return t;
    }
  }
  return boost::none;
}

boost::optional<season> season_from_string(const std::string &s) {
  for (season v : { season::none, season::spring, season::summer, season::autumn, season::winter }) {
    if (to_string(v) == s) {
      return v;
    }
  }
  return boost::none;
}

geographic_context::geographic_context()
  : terrain_type(terrain::urban), season_type(season::none) {
}

geographic_context::geographic_context(terrain t, season s)
  : terrain_type(t), season_type(s) {
}

geographic_context detect_context(const geo_dataset &dataset, season s) {
  size_t mountain = 0, coastal = 0, desert = 0, woodland = 0, areas = 0;

  for (feature_category category : all_categories()) {
    for (const feature &f : dataset.features(category)) {
      if (has_value(f, "natural", { "peak", "ridge", "cliff", "bare_rock", "volcano", "scree", "glacier" })) {
        ++mountain;
      }
      if (has_value(f, "natural", { "coastline", "beach", "bay", "strait" }) ||
          has_value(f, "place", { "sea", "ocean" })) {
        ++coastal;
      }
      if (has_value(f, "natural", { "sand", "desert" }) ||
          has_value(f, "landuse", { "desert" })) {
        ++desert;
      }
      if (f.kind == geometry_kind::polygon) {
        ++areas;
        if (has_value(f, "natural", { "wood" }) || has_value(f, "landuse", { "forest" })) {
          ++woodland;
        }
      }
    }
  }

  terrain t = terrain::urban;
  if (mountain > 0) {
    t = terrain::mountain;
  } else if (coastal > 0) {
    t = terrain::coastal;
  } else if (desert > 0) {
    t = terrain::desert;
  } else if ((areas > 0) && (woodland * 10 >= areas * 3)) {
    t = terrain::forest;
  }

  return geographic_context(t, s);
}

} // namespace cartoposter
