#ifndef CARTOPOSTER_DATA_FETCHER_HPP
#define CARTOPOSTER_DATA_FETCHER_HPP

#include "dataset.hpp"
#include "feature_source.hpp"
#include "cache.hpp"
#include "error.hpp"

#include <boost/noncopyable.hpp>
#include <memory>
#include <vector>

namespace cartoposter {

struct fetch_outcome {
  dataset_ptr dataset;
  // one data_fetch_partial warning per category which came back empty
  // because its fetch failed.
  std::vector<warning> warnings;
  bool from_cache;
};

/* Assembles a complete dataset around a point from per-category fetches,
 * going through the cache. A category which can't be fetched is replaced
 * by an empty collection, so the dataset is always complete; only fully
 * successful datasets are cached.
 */
class data_fetcher : boost::noncopyable {
public:
  // if parallel is set, the categories are fetched concurrently. the
  // result doesn't depend on it.
  data_fetcher(std::shared_ptr<feature_source> source,
               std::shared_ptr<cache_store> cache,
               bool parallel = false);

  fetch_outcome fetch(const coordinate &center, double radius);

  // center rounded to 6 decimals, radius to whole meters.
  static std::string cache_key(const coordinate &center, double radius);

private:
  fetch_response fetch_category(feature_category category, const coordinate &center, double radius);
  // a source which throws is treated as a server error.
  fetch_response call_source(feature_category category, const coordinate &center, double radius);

  std::shared_ptr<feature_source> m_source;
  std::shared_ptr<cache_store> m_cache;
  const bool m_parallel;
};

} // namespace cartoposter

#endif // CARTOPOSTER_DATA_FETCHER_HPP
