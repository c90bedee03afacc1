#ifndef CARTOPOSTER_LAYER_BUILDER_HPP
#define CARTOPOSTER_LAYER_BUILDER_HPP

#include "dataset.hpp"

#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace cartoposter {

/* The fixed set of layers a poster is drawn from, declared in the order
 * they are drawn, bottom first. The order doesn't depend on the theme.
 */
enum class canonical_layer {
  water,
  waterway,
  parks,
  forest,
  land,
  generic,
  buildings,
  road_motorway,
  road_primary,
  road_secondary,
  road_tertiary,
  road_residential,
  road_default,
  cycleway,
  rail,
  transit,
  rail_station,
  labels
};

/* The coarser grouping used for ordering: water < parks < land and
 * buildings < roads < rail and transit < labels.
 */
enum class layer_group { water, parks, land, roads, rail, labels };

// all canonical layers, in draw order.
const std::vector<canonical_layer> &draw_order();

std::string to_string(canonical_layer l);
boost::optional<canonical_layer> layer_from_string(const std::string &s);
layer_group group_of(canonical_layer l);

// true for layers drawn as filled areas, false for those drawn as lines.
bool is_area_layer(canonical_layer l);

// true for layers drawn as a marker at each point.
bool is_point_layer(canonical_layer l);

struct render_layer {
  canonical_layer layer;
  std::vector<feature> features;
};

// every canonical layer, in draw order, possibly empty.
typedef std::vector<render_layer> layer_set;

/* Picks the canonical layer for a feature from its tags. Rules are tried
 * in priority order and the first match wins; a feature no rule matches
 * goes to the generic layer.
 */
canonical_layer classify(const feature &f);

/* Sorts every feature in the dataset into its canonical layer. Categories
 * are visited in their fixed order and features in stored order, and a
 * feature already seen in an earlier category (same id and geometry kind)
 * is not added again.
 */
layer_set build_layers(const geo_dataset &dataset);

} // namespace cartoposter

#endif // CARTOPOSTER_LAYER_BUILDER_HPP
