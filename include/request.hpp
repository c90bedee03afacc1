#ifndef CARTOPOSTER_REQUEST_HPP
#define CARTOPOSTER_REQUEST_HPP

#include "location.hpp"
#include "poster_spec.hpp"
#include "theme.hpp"
#include "geographic_context.hpp"

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <string>

namespace cartoposter {

/* A poster request as it arrives, before any checking. Enumerations are
 * still strings, and "none" means no texture, effect or enhancement.
 */
struct generation_request {
  generation_request();

  location_query location;
  std::string theme;
  // meters.
  double radius;
  // inches.
  double width, height;
  std::string format, font, texture, shape, effect, enhancement;
  // per-layer style overrides, in the same format as a theme variant.
  boost::property_tree::ptree overrides;
  boost::optional<std::string> season;
  // replaces the country on the poster's country line.
  boost::optional<std::string> country_label;
  boost::optional<unsigned int> dpi;
};

/* Reads a request from a JSON-style document with the keys location
 * (city, country, state), theme, distanceRadius, posterWidth,
 * posterHeight, outputFormat, font, texture, mapShape, artisticEffect,
 * colorEnhancement, perLayerStyleOverrides, season, countryLabel and dpi.
 * Missing keys keep their defaults.
 *
 * Throws poster_error(invalid_request) for values of the wrong type.
 */
generation_request parse_request(const boost::property_tree::ptree &doc);

/* A request that has passed validation, ready to run.
 */
struct validated_request {
  location_query location;
  std::string theme;
  double radius;
  poster_spec spec;
  style_set overrides;
  season season_type;
  std::string country_label;
};

/* Checks every field of a request against its bounds:
 *
 *   city 1-100 characters, country up to 100, state up to 50, with no
 *   control characters or path-like sequences ("..", "//", "\");
 *   width and height 4-48 inches, with an area of at most 1000 sq in;
 *   radius 1000-500000 meters; dpi 10-1200;
 *   format, shape, effect, enhancement and season from their sets.
 *
 * The dpi falls back to `default_dpi` when the request doesn't give one.
 * Throws poster_error(invalid_request) on the first violation.
 */
validated_request validate(const generation_request &request, unsigned int default_dpi);

} // namespace cartoposter

#endif // CARTOPOSTER_REQUEST_HPP
