#ifndef CARTOPOSTER_DATASET_HPP
#define CARTOPOSTER_DATASET_HPP

#include "location.hpp"

#include <boost/optional.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cartoposter {

/* The categories features are fetched in. Each one is requested
 * separately, so each one can go missing separately.
 */
enum class feature_category { water, parks, land, buildings, roads, rail };

// every category, in the fixed order they're fetched and visited.
const std::vector<feature_category> &all_categories();

std::string to_string(feature_category c);
boost::optional<feature_category> category_from_string(const std::string &s);

enum class geometry_kind { point, line, polygon };

struct lonlat {
  lonlat() : lon(0.0), lat(0.0) {}
  lonlat(double lon_, double lat_) : lon(lon_), lat(lat_) {}
  double lon, lat;
};

/* A single piece of tagged geometry. Polygons are a single closed ring.
 */
struct feature {
  feature();
  feature(std::int64_t id_, geometry_kind kind_);

  std::int64_t id;
  geometry_kind kind;
  std::vector<lonlat> points;
  std::map<std::string, std::string> tags;

  boost::optional<const std::string &> tag(const std::string &key) const;
};

typedef std::vector<feature> feature_collection;

/* Everything fetched around a center. Always holds a collection for
 * every category, even if some are empty.
 */
struct geo_dataset {
  geo_dataset(const coordinate &center_, double radius_);

  coordinate center;
  double radius;
  std::map<feature_category, feature_collection> collections;

  const feature_collection &features(feature_category c) const;
  size_t size() const;
};

// datasets are shared around read-only once fetched.
typedef std::shared_ptr<const geo_dataset> dataset_ptr;

} // namespace cartoposter

#endif // CARTOPOSTER_DATASET_HPP
