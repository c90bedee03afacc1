#ifndef CARTOPOSTER_LOCATION_HPP
#define CARTOPOSTER_LOCATION_HPP

#include <boost/optional.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <string>
#include <ostream>

namespace cartoposter {

/* A place, as the user typed it.
 */
struct location_query {
  location_query();
  location_query(const std::string &city_, const std::string &country_,
                 boost::optional<std::string> state_ = boost::none);

  std::string city, country;
  boost::optional<std::string> state;

  // the city with anything after the first comma dropped and the
  // surrounding whitespace trimmed. "Paris, Ile-de-France" -> "Paris".
  std::string clean_city() const;

  // normalised identity of the query: trimmed, lower-cased parts joined
  // with '|'. two queries with the same key resolve to the same place.
  std::string key() const;
};

std::ostream &operator<<(std::ostream &out, const location_query &q);

struct coordinate {
  coordinate();
  coordinate(double lat, double lon);

  double latitude, longitude;
};

bool operator==(const coordinate &a, const coordinate &b);
bool operator!=(const coordinate &a, const coordinate &b);
std::ostream &operator<<(std::ostream &out, const coordinate &c);

enum class coordinate_source { cache, service };

/* The answer to a location query. Once produced it is never changed;
 * a refresh produces a new one.
 */
struct resolved_coordinate {
  coordinate position;
  coordinate_source source;
  boost::posix_time::ptime resolved_at;
};

// "41.88° N / 87.63° W"
std::string format_coordinate(const coordinate &c);

} // namespace cartoposter

#endif // CARTOPOSTER_LOCATION_HPP
