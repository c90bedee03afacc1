#include "location_resolver.hpp"
#include "cache_codec.hpp"
#include "error.hpp"

#include <boost/format.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <spdlog/spdlog.h>

#include <sstream>

namespace cartoposter {

namespace {

std::string describe(const location_query &query) {
  std::ostringstream out;
  out << query;
  return out.str();
}

} // anonymous namespace

resolver_options::resolver_options()
  : max_attempts(3),
    backoff_base(std::chrono::seconds(1)),
    rate_limit_penalty(std::chrono::seconds(5)) {
}

location_resolver::location_resolver(std::shared_ptr<geocoder> service,
                                     std::shared_ptr<cache_store> cache,
                                     std::shared_ptr<rate_limiter> limiter,
                                     std::shared_ptr<clock_source> clk,
                                     const resolver_options &options)
  : m_service(service), m_cache(cache), m_limiter(limiter),
    m_clock(clk), m_options(options) {
}

std::string location_resolver::cache_key(const location_query &query) {
  return "coords|" + query.key();
}

resolved_coordinate location_resolver::resolve(const location_query &query, bool refresh) {
  const std::string key = cache_key(query);

  if (!refresh) {
    boost::optional<std::string> payload = m_cache->get(key);
    if (payload) {
      try {
        resolved_coordinate cached = decode_coordinate(*payload);
        spdlog::info("Using cached coordinates for {}: {}, {}", describe(query),
                     cached.position.latitude, cached.position.longitude);
        return cached;

      } catch (const std::exception &e) {
        spdlog::warn("Ignoring unreadable cache entry for {}: {}", describe(query), e.what());
      }
    }
  }

  resolved_coordinate result;
  result.position = call_service(query);
  result.source = coordinate_source::service;
  result.resolved_at = boost::posix_time::second_clock::universal_time();

  m_cache->put(key, encode_coordinate(result));
  spdlog::info("Resolved {} to {}, {}", describe(query),
               result.position.latitude, result.position.longitude);
  return result;
}

coordinate location_resolver::call_service(const location_query &query) {
  std::string last_error;

  for (int attempt = 1; attempt <= m_options.max_attempts; ++attempt) {
    if (attempt > 1) {
      m_clock->sleep_for(m_options.backoff_base * (1 << (attempt - 2)));
    }

    m_limiter->acquire();
    geocode_response response = (*m_service)(query);

    if (response.is_left()) {
      return response.left();
    }

    const geocode_error &err = response.right();
    switch (err.status) {
    case geocode_status::not_found:
      throw poster_error(error_kind::location_not_found,
                         (boost::format("Could not find coordinates for %1%") % describe(query)).str());

    case geocode_status::rate_limited:
      spdlog::warn("Geocoding rate limited on attempt {} of {}", attempt, m_options.max_attempts);
      if (attempt < m_options.max_attempts) {
        m_clock->sleep_for(m_options.rate_limit_penalty);
      }
      break;

    case geocode_status::timeout:
    case geocode_status::server_error:
      spdlog::warn("Geocoding attempt {} of {} failed: {}", attempt, m_options.max_attempts, err.message);
      break;
    }

    last_error = err.message;
  }

  throw poster_error(error_kind::service_unavailable,
                     (boost::format("Geocoding service unavailable after %1% attempts: %2%")
                      % m_options.max_attempts % last_error).str());
}

} // namespace cartoposter
