#ifndef CARTOPOSTER_FETCH_NOMINATIM_HPP
#define CARTOPOSTER_FETCH_NOMINATIM_HPP

#include "geocoder.hpp"

#include <istream>
#include <string>

namespace cartoposter { namespace fetch {

/* Geocoder backed by an OpenStreetMap Nominatim search endpoint.
 */
struct nominatim : public geocoder {
  // base_url is the search endpoint, e.g:
  // https://nominatim.openstreetmap.org/search
  nominatim(const std::string &base_url, const std::string &user_agent, long timeout);
  virtual ~nominatim();

  geocode_response operator()(const location_query &query);

  // interprets a JSON search response body: the first result wins, no
  // results means not found.
  static geocode_response parse(std::istream &body);

private:
  const std::string m_base_url, m_user_agent;
  const long m_timeout;
};

} } // namespace cartoposter::fetch

#endif // CARTOPOSTER_FETCH_NOMINATIM_HPP
