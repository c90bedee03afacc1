#ifndef CARTOPOSTER_GEOCODER_HPP
#define CARTOPOSTER_GEOCODER_HPP

#include "location.hpp"
#include "either.hpp"

#include <cstdint>
#include <string>

namespace cartoposter {

/* Why a geocoding call didn't produce a coordinate. Modelled on HTTP
 * status codes, which is what most of them are anyway.
 */
enum class geocode_status : std::uint16_t {
  /* the service answered, and there is no such place. */
  not_found = 404,
  /* the service told us to slow down. */
  rate_limited = 429,
  /* an unexpected error, which may or may not be temporary. */
  server_error = 500,
  /* the service didn't answer in time. */
  timeout = 504,
};

struct geocode_error {
  geocode_status status;
  std::string message;
};

typedef either<coordinate, geocode_error> geocode_response;

/* Interface for anything which can turn a place name into coordinates.
 */
struct geocoder {
  virtual ~geocoder();

  virtual geocode_response operator()(const location_query &query) = 0;
};

} // namespace cartoposter

#endif // CARTOPOSTER_GEOCODER_HPP
