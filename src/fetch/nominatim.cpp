#include "fetch/nominatim.hpp"
#include "fetch/http.hpp"

#include <boost/format.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <spdlog/spdlog.h>

namespace bpt = boost::property_tree;

namespace cartoposter { namespace fetch {

namespace {

geocode_response error_response(geocode_status status, const std::string &message) {
  geocode_error err;
  err.status = status;
  err.message = message;
  return geocode_response(err);
}

std::string uri_for(const std::string &base_url, const location_query &query, http_client &client) {
  std::string uri = (boost::format("%1%?format=json&limit=1&city=%2%&country=%3%")
                     % base_url
                     % client.escape(query.clean_city())
                     % client.escape(query.country)).str();
  if (query.state && !query.state->empty()) {
    uri += "&state=" + client.escape(*query.state);
  }
  return uri;
}

} // anonymous namespace

nominatim::nominatim(const std::string &base_url, const std::string &user_agent, long timeout)
  : m_base_url(base_url), m_user_agent(user_agent), m_timeout(timeout) {
}

nominatim::~nominatim() {
}

geocode_response nominatim::operator()(const location_query &query) {
  http_client client(m_user_agent, m_timeout);
  std::stringstream body;
  const std::string uri = uri_for(m_base_url, query, client);

  long status_code = 0;
  try {
    status_code = client.get(uri, body);

  } catch (const http_error &e) {
    return error_response(e.timed_out() ? geocode_status::timeout : geocode_status::server_error,
                          e.what());
  }

  if (status_code == 429) {
    return error_response(geocode_status::rate_limited, "Geocoding service is rate limiting requests.");
  }
  if (status_code == 504 || status_code == 408) {
    return error_response(geocode_status::timeout, "Geocoding service timed out.");
  }
  if (status_code != 200) {
    return error_response(geocode_status::server_error,
                          (boost::format("Geocoding service returned HTTP status %1%.") % status_code).str());
  }

  return parse(body);
}

geocode_response nominatim::parse(std::istream &body) {
  bpt::ptree results;
  try {
    bpt::read_json(body, results);

  } catch (const bpt::ptree_error &e) {
    return error_response(geocode_status::server_error,
                          std::string("Unable to parse geocoding response: ") + e.what());
  }

  if (results.empty()) {
    return error_response(geocode_status::not_found, "No results for location.");
  }

  const bpt::ptree &first = results.begin()->second;
  boost::optional<double> lat = first.get_optional<double>("lat");
  boost::optional<double> lon = first.get_optional<double>("lon");
  if (!lat || !lon) {
    return error_response(geocode_status::server_error, "Geocoding result is missing lat/lon.");
  }

  return geocode_response(coordinate(*lat, *lon));
}

} } // namespace cartoposter::fetch
