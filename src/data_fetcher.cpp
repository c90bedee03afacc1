#include "data_fetcher.hpp"
#include "cache_codec.hpp"

#include <boost/format.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <future>

namespace cartoposter {

namespace {

bool is_transient(fetch_status status) {
  return (status == fetch_status::rate_limited) || (status == fetch_status::timeout);
}

} // anonymous namespace

data_fetcher::data_fetcher(std::shared_ptr<feature_source> source,
                           std::shared_ptr<cache_store> cache,
                           bool parallel)
  : m_source(source), m_cache(cache), m_parallel(parallel) {
}

std::string data_fetcher::cache_key(const coordinate &center, double radius) {
  return (boost::format("dataset|%.6f|%.6f|%d")
          % center.latitude % center.longitude % long(std::lround(radius))).str();
}

fetch_outcome data_fetcher::fetch(const coordinate &center, double radius) {
  const std::string key = cache_key(center, radius);

  boost::optional<std::string> payload = m_cache->get(key);
  if (payload) {
    try {
      fetch_outcome outcome;
      outcome.dataset = decode_dataset(*payload);
      outcome.from_cache = true;
      spdlog::info("Using cached dataset for {} ({} features)", key, outcome.dataset->size());
      return outcome;

    } catch (const std::exception &e) {
      spdlog::warn("Ignoring unreadable cached dataset {}: {}", key, e.what());
    }
  }

  const std::vector<feature_category> &categories = all_categories();
  std::vector<fetch_response> responses;

  if (m_parallel) {
    std::vector<std::future<fetch_response> > futures;
    for (feature_category c : categories) {
      futures.emplace_back(std::async(std::launch::async,
                                      &data_fetcher::fetch_category, this, c, center, radius));
    }
    // collected in category order, whatever order they finish in.
    for (auto &fut : futures) {
      responses.push_back(fut.get());
    }

  } else {
    for (feature_category c : categories) {
      responses.push_back(fetch_category(c, center, radius));
    }
  }

  std::shared_ptr<geo_dataset> dataset = std::make_shared<geo_dataset>(center, radius);
  fetch_outcome outcome;
  outcome.from_cache = false;

  for (size_t i = 0; i < categories.size(); ++i) {
    if (responses[i].is_left()) {
      dataset->collections[categories[i]] = responses[i].take_left();

    } else {
      const fetch_error &err = responses[i].right();
      warning w;
      w.kind = error_kind::data_fetch_partial;
      w.message = (boost::format("No %1% data: %2%") % to_string(categories[i]) % err.message).str();
      spdlog::warn("{}", w.message);
      outcome.warnings.push_back(w);
    }
  }

  if (outcome.warnings.empty()) {
    m_cache->put(key, encode_dataset(*dataset));
  }

  spdlog::info("Fetched {} features around {}, {}", dataset->size(), center.latitude, center.longitude);
  outcome.dataset = dataset;
  return outcome;
}

fetch_response data_fetcher::fetch_category(feature_category category, const coordinate &center, double radius) {
  fetch_response response = call_source(category, center, radius);

  // one more go for the failures which might clear up on their own.
  if (response.is_right() && is_transient(response.right().status)) {
    spdlog::warn("Retrying {} fetch after: {}", to_string(category), response.right().message);
    response = call_source(category, center, radius);
  }

  return response;
}

fetch_response data_fetcher::call_source(feature_category category, const coordinate &center, double radius) {
  try {
    return (*m_source)(category, center, radius);

  } catch (const std::exception &e) {
    fetch_error err;
    err.status = fetch_status::server_error;
    err.message = e.what();
    return fetch_response(err);
  }
}

} // namespace cartoposter
