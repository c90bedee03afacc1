#include "rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace cartoposter {

namespace {

struct real_clock : public clock_source {
  virtual ~real_clock() {}

  time_point now() const {
    return std::chrono::steady_clock::now();
  }

  void sleep_for(duration d) {
    if (d > duration::zero()) {
      std::this_thread::sleep_for(d);
    }
  }
};

} // anonymous namespace

clock_source::~clock_source() {
}

std::shared_ptr<clock_source> real_clock_source() {
  static std::shared_ptr<clock_source> instance = std::make_shared<real_clock>();
  return instance;
}

rate_limiter::rate_limiter(std::shared_ptr<clock_source> clk, clock_source::duration min_interval)
  : m_clock(clk), m_interval(min_interval), m_mutex(), m_last() {
}

void rate_limiter::acquire() {
  std::unique_lock<std::mutex> lock(m_mutex);

  if (m_last) {
    const clock_source::time_point next = *m_last + m_interval;
    const clock_source::time_point now = m_clock->now();
    if (now < next) {
      m_clock->sleep_for(next - now);
    }
  }

  m_last = m_clock->now();
}

std::shared_ptr<rate_limiter> shared_geocode_limiter(clock_source::duration min_interval) {
  static std::shared_ptr<rate_limiter> instance =
    std::make_shared<rate_limiter>(real_clock_source(), min_interval);
  if (instance->min_interval() != min_interval) {
    typedef std::chrono::milliseconds ms;
    spdlog::warn("Geocoding rate limit already set to {}ms, ignoring request for {}ms",
                 std::chrono::duration_cast<ms>(instance->min_interval()).count(),
                 std::chrono::duration_cast<ms>(min_interval).count());
  }
  return instance;
}

} // namespace cartoposter
