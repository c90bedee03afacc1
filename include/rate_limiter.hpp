#ifndef CARTOPOSTER_RATE_LIMITER_HPP
#define CARTOPOSTER_RATE_LIMITER_HPP

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <chrono>
#include <memory>
#include <mutex>

namespace cartoposter {

/* Source of time for anything which waits: the rate limiter and the
 * retry backoff. Tests swap in a clock which only pretends to sleep.
 */
struct clock_source {
  typedef std::chrono::steady_clock::time_point time_point;
  typedef std::chrono::steady_clock::duration duration;

  virtual ~clock_source();
  virtual time_point now() const = 0;
  virtual void sleep_for(duration d) = 0;
};

// the real, monotonic clock. shared, stateless.
std::shared_ptr<clock_source> real_clock_source();

/* Enforces a minimum interval between successive acquisitions across
 * every thread that shares the limiter. A caller that arrives early is
 * held inside acquire() until its slot comes round, and holds the lock
 * while it waits, so callers are served strictly one after another.
 */
class rate_limiter : boost::noncopyable {
public:
  rate_limiter(std::shared_ptr<clock_source> clk, clock_source::duration min_interval);

  // blocks until at least min_interval has passed since the previous
  // acquisition, then records this one.
  void acquire();

  clock_source::duration min_interval() const { return m_interval; }

private:
  std::shared_ptr<clock_source> m_clock;
  const clock_source::duration m_interval;
  std::mutex m_mutex;
  boost::optional<clock_source::time_point> m_last;
};

// the process-wide limiter for geocoding calls. it is created by the
// first call, with that call's interval, and shared by all later ones.
// a later call asking for a different interval gets a logged warning.
std::shared_ptr<rate_limiter> shared_geocode_limiter(
  clock_source::duration min_interval = std::chrono::seconds(1));

} // namespace cartoposter

#endif // CARTOPOSTER_RATE_LIMITER_HPP
