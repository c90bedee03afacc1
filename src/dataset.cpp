#include "dataset.hpp"

#include <stdexcept>

namespace cartoposter {

const std::vector<feature_category> &all_categories() {
  static const std::vector<feature_category> categories = {
    feature_category::water,
    feature_category::parks,
    feature_category::land,
    feature_category::buildings,
    feature_category::roads,
    feature_category::rail
  };
  return categories;
}

std::string to_string(feature_category c) {
  switch (c) {
  case feature_category::water:     return "water";
  case feature_category::parks:     return "parks";
  case feature_category::land:      return "land";
  case feature_category::buildings: return "buildings";
  case feature_category::roads:     return "roads";
  case feature_category::rail:      return "rail";
  }
  throw std::logic_error("Unhandled feature category");
}

boost::optional<feature_category> category_from_string(const std::string &s) {
  for (feature_category c : all_categories()) {
    if (to_string(c) == s) {
      return c;
    }
  }
  return boost::none;
}

feature::feature()
  : id(0), kind(geometry_kind::point) {
}

feature::feature(std::int64_t id_, geometry_kind kind_)
  : id(id_), kind(kind_) {
}

boost::optional<const std::string &> feature::tag(const std::string &key) const {
  std::map<std::string, std::string>::const_iterator itr = tags.find(key);
  if (itr == tags.end()) {
    return boost::none;
  }
  return itr->second;
}

geo_dataset::geo_dataset(const coordinate &center_, double radius_)
  : center(center_), radius(radius_) {
  for (feature_category c : all_categories()) {
    collections[c];
  }
}

const feature_collection &geo_dataset::features(feature_category c) const {
  return collections.at(c);
}

size_t geo_dataset::size() const {
  size_t total = 0;
  for (const auto &entry : collections) {
    total += entry.second.size();
  }
  return total;
}

} // namespace cartoposter
