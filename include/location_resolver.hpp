#ifndef CARTOPOSTER_LOCATION_RESOLVER_HPP
#define CARTOPOSTER_LOCATION_RESOLVER_HPP

#include "location.hpp"
#include "geocoder.hpp"
#include "cache.hpp"
#include "rate_limiter.hpp"

#include <boost/noncopyable.hpp>
#include <memory>

namespace cartoposter {

struct resolver_options {
  resolver_options();

  // total number of geocoding calls made for one query before giving up.
  int max_attempts;
  // delay before the second attempt, doubled for each one after.
  clock_source::duration backoff_base;
  // extra wait added after the service says it is rate limiting us.
  clock_source::duration rate_limit_penalty;
};

/* Turns location queries into coordinates, going to the cache first and
 * to the geocoder only on a miss. Calls to the geocoder are gated by a
 * shared rate limiter and retried with exponential backoff when they
 * fail for reasons which might go away.
 */
class location_resolver : boost::noncopyable {
public:
  location_resolver(std::shared_ptr<geocoder> service,
                    std::shared_ptr<cache_store> cache,
                    std::shared_ptr<rate_limiter> limiter,
                    std::shared_ptr<clock_source> clk,
                    const resolver_options &options = resolver_options());

  // resolves the query. if refresh is set, the cache is bypassed on the
  // way in and overwritten on the way out.
  //
  // throws poster_error with location_not_found if the place doesn't
  // exist, or service_unavailable if the geocoder kept failing.
  resolved_coordinate resolve(const location_query &query, bool refresh = false);

  static std::string cache_key(const location_query &query);

private:
  coordinate call_service(const location_query &query);

  std::shared_ptr<geocoder> m_service;
  std::shared_ptr<cache_store> m_cache;
  std::shared_ptr<rate_limiter> m_limiter;
  std::shared_ptr<clock_source> m_clock;
  const resolver_options m_options;
};

} // namespace cartoposter

#endif // CARTOPOSTER_LOCATION_RESOLVER_HPP
