#include "fetch/overpass.hpp"
#include "fetch/http.hpp"
#include "util.hpp"

#include <boost/format.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <sstream>

namespace bpt = boost::property_tree;

// meters per degree of latitude, near enough everywhere.
#define METERS_PER_DEGREE (111320.0)

namespace cartoposter { namespace fetch {

namespace {

fetch_response error_response(fetch_status status, const std::string &message) {
  fetch_error err;
  err.status = status;
  err.message = message;
  return fetch_response(err);
}

// the statements selecting each category, without the bounding box.
std::vector<std::string> selectors_for(feature_category category) {
  switch (category) {
  case feature_category::water:
    return { "way[\"natural\"~\"^(water|bay|strait|wetland)$\"]",
             "relation[\"natural\"=\"water\"]",
             "way[\"waterway\"]",
             "way[\"water\"]",
             "relation[\"water\"]" };
  case feature_category::parks:
    return { "way[\"leisure\"~\"^(park|garden|nature_reserve|playground|pitch)$\"]",
             "relation[\"leisure\"=\"park\"]",
             "way[\"landuse\"~\"^(grass|meadow|forest|recreation_ground|village_green)$\"]",
             "way[\"natural\"~\"^(wood|scrub|heath|grassland)$\"]",
             "relation[\"natural\"=\"wood\"]" };
  case feature_category::land:
    return { "node[\"natural\"~\"^(peak|ridge|cliff|volcano)$\"]",
             "way[\"natural\"~\"^(ridge|cliff|bare_rock|sand|beach|scree|glacier|coastline)$\"]" };
  case feature_category::buildings:
    return { "way[\"building\"]" };
  case feature_category::roads:
    return { "way[\"highway\"]" };
  case feature_category::rail:
    return { "way[\"railway\"]",
             "node[\"railway\"~\"^(station|halt|tram_stop)$\"]" };
  }
  return std::vector<std::string>();
}

bool is_linear(feature_category category) {
  return (category == feature_category::roads) || (category == feature_category::rail);
}

std::map<std::string, std::string> read_tags(const bpt::ptree &element) {
  std::map<std::string, std::string> tags;
  boost::optional<const bpt::ptree &> child = element.get_child_optional("tags");
  if (child) {
    for (const auto &kv : *child) {
      tags[kv.first] = kv.second.data();
    }
  }
  return tags;
}

std::vector<lonlat> read_geometry(const bpt::ptree &element) {
  std::vector<lonlat> points;
  boost::optional<const bpt::ptree &> child = element.get_child_optional("geometry");
  if (child) {
    for (const auto &vertex : *child) {
      points.push_back(lonlat(vertex.second.get<double>("lon"), vertex.second.get<double>("lat")));
    }
  }
  return points;
}

bool is_closed(const std::vector<lonlat> &points) {
  return (points.size() >= 4) &&
    (points.front().lon == points.back().lon) &&
    (points.front().lat == points.back().lat);
}

geometry_kind kind_for(feature_category category, const std::vector<lonlat> &points,
                       const std::map<std::string, std::string> &tags) {
  if (!is_closed(points) || is_linear(category)) {
    return geometry_kind::line;
  }
  if (tags.count("waterway") && !tags.count("area")) {
    std::map<std::string, std::string>::const_iterator itr = tags.find("waterway");
    if (itr->second != "riverbank" && itr->second != "dock") {
      return geometry_kind::line;
    }
  }
  std::map<std::string, std::string>::const_iterator natural = tags.find("natural");
  if (natural != tags.end() && (natural->second == "coastline" || natural->second == "ridge" ||
                                natural->second == "cliff")) {
    return geometry_kind::line;
  }
  return geometry_kind::polygon;
}

} // anonymous namespace

overpass::overpass(const std::string &base_url, const std::string &user_agent, long timeout)
  : m_base_url(base_url), m_user_agent(user_agent), m_timeout(timeout) {
}

overpass::~overpass() {
}

std::string overpass::query_for(feature_category category, const coordinate &center, double radius) {
  const double dlat = radius / METERS_PER_DEGREE;
  const double dlon = radius / (METERS_PER_DEGREE * std::cos(util::radians(center.latitude)));
  const std::string bbox = (boost::format("(%.6f,%.6f,%.6f,%.6f)")
                            % (center.latitude - dlat) % (center.longitude - dlon)
                            % (center.latitude + dlat) % (center.longitude + dlon)).str();

  std::ostringstream query;
  query << "[out:json][timeout:90];(";
  for (const std::string &selector : selectors_for(category)) {
    query << selector << bbox << ";";
  }
  query << ");out geom;";
  return query.str();
}

fetch_response overpass::operator()(feature_category category, const coordinate &center, double radius) {
  if (radius <= 0.0) {
    return error_response(fetch_status::bad_request, "Radius must be positive.");
  }

  http_client client(m_user_agent, m_timeout);
  std::stringstream body;
  const std::string form = "data=" + client.escape(query_for(category, center, radius));

  long status_code = 0;
  try {
    status_code = client.post(m_base_url, form, body);

  } catch (const http_error &e) {
    return error_response(e.timed_out() ? fetch_status::timeout : fetch_status::server_error, e.what());
  }

  switch (status_code) {
  case 200: break;
  case 400: return error_response(fetch_status::bad_request, "Overpass rejected the query.");
  case 404: return error_response(fetch_status::not_found, "Overpass endpoint not found.");
  case 429: return error_response(fetch_status::rate_limited, "Overpass is rate limiting requests.");
  case 504: return error_response(fetch_status::timeout, "Overpass timed out.");
  default:
    return error_response(fetch_status::server_error,
                          (boost::format("Overpass returned HTTP status %1%.") % status_code).str());
  }

  try {
    return fetch_response(parse(category, body));

  } catch (const bpt::ptree_error &e) {
    return error_response(fetch_status::server_error,
                          std::string("Unable to parse Overpass response: ") + e.what());
  }
}

feature_collection overpass::parse(feature_category category, std::istream &body) {
  bpt::ptree root;
  bpt::read_json(body, root);

  feature_collection features;
  boost::optional<const bpt::ptree &> elements = root.get_child_optional("elements");
  if (!elements) {
    return features;
  }

  for (const auto &child : *elements) {
    const bpt::ptree &element = child.second;
    const std::string type = element.get<std::string>("type");
    const std::int64_t id = element.get<std::int64_t>("id", 0);

    if (type == "node") {
      feature f(id, geometry_kind::point);
      f.points.push_back(lonlat(element.get<double>("lon"), element.get<double>("lat")));
      f.tags = read_tags(element);
      features.push_back(std::move(f));

    } else if (type == "way") {
      std::vector<lonlat> points = read_geometry(element);
      if (points.size() < 2) {
        continue;
      }
      std::map<std::string, std::string> tags = read_tags(element);
      feature f(id, kind_for(category, points, tags));
      f.points = std::move(points);
      f.tags = std::move(tags);
      features.push_back(std::move(f));

    } else if (type == "relation") {
      std::map<std::string, std::string> tags = read_tags(element);
      boost::optional<const bpt::ptree &> members = element.get_child_optional("members");
      if (!members) {
        continue;
      }
      for (const auto &m : *members) {
        const bpt::ptree &member = m.second;
        if (member.get<std::string>("type", "") != "way" ||
            member.get<std::string>("role", "") != "outer") {
          continue;
        }
        std::vector<lonlat> points = read_geometry(member);
        if (points.size() < 2) {
          continue;
        }
        feature f(member.get<std::int64_t>("ref", id), is_closed(points) ? geometry_kind::polygon : geometry_kind::line);
        f.points = std::move(points);
        f.tags = tags;
        features.push_back(std::move(f));
      }
    }
  }

  spdlog::debug("Parsed {} {} features", features.size(), to_string(category));
  return features;
}

} } // namespace cartoposter::fetch
