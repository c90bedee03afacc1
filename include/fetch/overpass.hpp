#ifndef CARTOPOSTER_FETCH_OVERPASS_HPP
#define CARTOPOSTER_FETCH_OVERPASS_HPP

#include "feature_source.hpp"

#include <istream>
#include <string>

namespace cartoposter { namespace fetch {

/* Feature source which queries an Overpass API interpreter endpoint for
 * OpenStreetMap data inside the bounding box of the requested circle.
 */
struct overpass : public feature_source {
  overpass(const std::string &base_url, const std::string &user_agent, long timeout);
  virtual ~overpass();

  fetch_response operator()(feature_category category, const coordinate &center, double radius);

  // the Overpass QL query for a category around a center.
  static std::string query_for(feature_category category, const coordinate &center, double radius);

  // parses an Overpass JSON ("out geom") response into features. closed
  // ways become polygons unless the category is linear (roads, rail) or
  // the way is a waterway or coastline; the outer members of relations
  // become one polygon each.
  static feature_collection parse(feature_category category, std::istream &body);

private:
  const std::string m_base_url, m_user_agent;
  const long m_timeout;
};

} } // namespace cartoposter::fetch

#endif // CARTOPOSTER_FETCH_OVERPASS_HPP
