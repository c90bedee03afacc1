#include "location.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/format.hpp>

#include <cmath>

namespace bal = boost::algorithm;

namespace cartoposter {

namespace {

std::string normalise(const std::string &s) {
  return bal::to_lower_copy(bal::trim_copy(s));
}

} // anonymous namespace

location_query::location_query() {
}

location_query::location_query(const std::string &city_, const std::string &country_,
                               boost::optional<std::string> state_)
  : city(city_), country(country_), state(state_) {
}

std::string location_query::clean_city() const {
  return bal::trim_copy(city.substr(0, city.find(',')));
}

std::string location_query::key() const {
  std::string k = normalise(clean_city()) + "|" + normalise(country);
  if (state && !bal::trim_copy(*state).empty()) {
    k += "|" + normalise(*state);
  }
  return k;
}

std::ostream &operator<<(std::ostream &out, const location_query &q) {
  out << q.city;
  if (q.state) {
    out << ", " << *q.state;
  }
  return out << ", " << q.country;
}

coordinate::coordinate() : latitude(0.0), longitude(0.0) {
}

coordinate::coordinate(double lat, double lon) : latitude(lat), longitude(lon) {
}

bool operator==(const coordinate &a, const coordinate &b) {
  return (a.latitude == b.latitude) && (a.longitude == b.longitude);
}

bool operator!=(const coordinate &a, const coordinate &b) {
  return !(a == b);
}

std::ostream &operator<<(std::ostream &out, const coordinate &c) {
  return out << "(" << c.latitude << ", " << c.longitude << ")";
}

std::string format_coordinate(const coordinate &c) {
  const char *ns = (c.latitude >= 0.0) ? "N" : "S";
  const char *ew = (c.longitude >= 0.0) ? "E" : "W";
  return (boost::format("%.4f\xC2\xB0 %s / %.4f\xC2\xB0 %s")
          % std::fabs(c.latitude) % ns % std::fabs(c.longitude) % ew).str();
}

} // namespace cartoposter
