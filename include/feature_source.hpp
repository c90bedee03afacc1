#ifndef CARTOPOSTER_FEATURE_SOURCE_HPP
#define CARTOPOSTER_FEATURE_SOURCE_HPP

#include "dataset.hpp"
#include "either.hpp"

#include <cstdint>
#include <string>

namespace cartoposter {

/* Status codes for category fetches. Because they're an easy short-hand,
 * we model them on HTTP status codes.
 */
enum class fetch_status : std::uint16_t {
  /* the request was malformed in some way, e.g: a zero radius. */
  bad_request = 400,
  /* the source has nothing for this category here. */
  not_found = 404,
  /* the source asked us to slow down. worth another try. */
  rate_limited = 429,
  /* an unspecified and unexpected kind of error occurred. it may, or
   * may not, be temporary. */
  server_error = 500,
  /* the source didn't answer in time. worth another try. */
  timeout = 504,
};

struct fetch_error {
  fetch_status status;
  std::string message;
};

typedef either<feature_collection, fetch_error> fetch_response;

/* Interface for objects which fetch one category of features around a
 * point. Implementations must be safe to call from several threads at
 * once, as categories may be fetched in parallel.
 */
struct feature_source {
  virtual ~feature_source();

  virtual fetch_response operator()(feature_category category,
                                    const coordinate &center,
                                    double radius) = 0;
};

} // namespace cartoposter

#endif // CARTOPOSTER_FEATURE_SOURCE_HPP
