#include "common.hpp"
#include "data_fetcher.hpp"
#include "cache_codec.hpp"

#include <iostream>

namespace cp = cartoposter;

namespace {

const cp::coordinate center(40.0, -89.0);

cp::feature_collection one_road() {
  return { test::make_feature(1, cp::geometry_kind::line, {"highway=primary"},
                              {cp::lonlat(-89.01, 40.0), cp::lonlat(-88.99, 40.0)}) };
}

cp::feature_collection one_lake() {
  return { test::make_feature(2, cp::geometry_kind::polygon, {"natural=water"},
                              test::square(-89.0, 40.0, 0.005)) };
}

void test_every_category_requested() {
  std::shared_ptr<test::stub_feature_source> source = std::make_shared<test::stub_feature_source>();
  source->set(cp::feature_category::roads, one_road());
  source->set(cp::feature_category::water, one_lake());
  std::shared_ptr<cp::memory_cache> cache = std::make_shared<cp::memory_cache>();

  cp::data_fetcher fetcher(source, cache);
  cp::fetch_outcome outcome = fetcher.fetch(center, 5000.0);

  for (cp::feature_category c : cp::all_categories()) {
    test::assert_equal<size_t>(source->calls(c), 1, "one request for " + cp::to_string(c));
  }
  test::assert_equal<size_t>(outcome.dataset->size(), 2, "road and lake");
  test::assert_equal<size_t>(outcome.dataset->collections.size(), cp::all_categories().size(),
                             "every category present");
  test::assert_equal<size_t>(outcome.warnings.size(), 0, "no warnings");
  test::assert_equal<bool>(outcome.from_cache, false, "fresh");
  test::assert_equal<size_t>(cache->writes(), 1, "complete dataset cached");
}

void test_second_fetch_is_cached() {
  std::shared_ptr<test::stub_feature_source> source = std::make_shared<test::stub_feature_source>();
  source->set(cp::feature_category::roads, one_road());
  std::shared_ptr<cp::memory_cache> cache = std::make_shared<cp::memory_cache>();

  cp::data_fetcher fetcher(source, cache);
  fetcher.fetch(center, 5000.0);
  const size_t calls = source->calls();

  cp::fetch_outcome again = fetcher.fetch(cp::coordinate(40.0000001, -89.0), 5000.2);
  test::assert_equal<size_t>(source->calls(), calls, "no new requests");
  test::assert_equal<bool>(again.from_cache, true, "from cache");
  test::assert_equal<size_t>(again.dataset->features(cp::feature_category::roads).size(), 1,
                             "cached content");
}

void test_failed_category_is_partial() {
  std::shared_ptr<test::stub_feature_source> source = std::make_shared<test::stub_feature_source>();
  source->set(cp::feature_category::roads, one_road());
  source->fail(cp::feature_category::buildings, cp::fetch_status::server_error);
  std::shared_ptr<cp::memory_cache> cache = std::make_shared<cp::memory_cache>();

  cp::data_fetcher fetcher(source, cache);
  cp::fetch_outcome outcome = fetcher.fetch(center, 5000.0);

  test::assert_equal<size_t>(outcome.warnings.size(), 1, "one warning");
  test::assert_equal<cp::error_kind>(outcome.warnings[0].kind, cp::error_kind::data_fetch_partial, "kind");
  test::assert_equal<size_t>(outcome.dataset->features(cp::feature_category::buildings).size(), 0,
                             "failed category is empty");
  test::assert_equal<size_t>(outcome.dataset->features(cp::feature_category::roads).size(), 1,
                             "others still there");
  test::assert_equal<size_t>(source->calls(cp::feature_category::buildings), 1,
                             "server errors aren't retried");
  test::assert_equal<size_t>(cache->writes(), 0, "partial datasets aren't cached");
}

void test_transient_failure_retried_once() {
  std::shared_ptr<test::stub_feature_source> source = std::make_shared<test::stub_feature_source>();
  source->set(cp::feature_category::rail, one_road());
  source->fail_first(cp::feature_category::rail, cp::fetch_status::timeout, 1);
  std::shared_ptr<cp::memory_cache> cache = std::make_shared<cp::memory_cache>();

  cp::data_fetcher fetcher(source, cache);
  cp::fetch_outcome outcome = fetcher.fetch(center, 5000.0);

  test::assert_equal<size_t>(source->calls(cp::feature_category::rail), 2, "retried");
  test::assert_equal<size_t>(outcome.warnings.size(), 0, "recovered");
  test::assert_equal<size_t>(outcome.dataset->features(cp::feature_category::rail).size(), 1, "data");
}

void test_everything_fails() {
  std::shared_ptr<test::stub_feature_source> source = std::make_shared<test::stub_feature_source>();
  for (cp::feature_category c : cp::all_categories()) {
    source->fail(c, cp::fetch_status::rate_limited);
  }
  std::shared_ptr<cp::memory_cache> cache = std::make_shared<cp::memory_cache>();

  cp::data_fetcher fetcher(source, cache);
  cp::fetch_outcome outcome = fetcher.fetch(center, 5000.0);

  test::assert_equal<size_t>(outcome.warnings.size(), cp::all_categories().size(), "one per category");
  test::assert_equal<size_t>(outcome.dataset->size(), 0, "empty but usable");
}

void test_parallel_matches_sequential() {
  std::shared_ptr<test::stub_feature_source> source = std::make_shared<test::stub_feature_source>();
  source->set(cp::feature_category::roads, one_road());
  source->set(cp::feature_category::water, one_lake());
  source->fail(cp::feature_category::parks, cp::fetch_status::not_found);

  cp::data_fetcher sequential(source, std::make_shared<cp::memory_cache>(), false);
  cp::data_fetcher parallel(source, std::make_shared<cp::memory_cache>(), true);

  cp::fetch_outcome a = sequential.fetch(center, 5000.0);
  cp::fetch_outcome b = parallel.fetch(center, 5000.0);

  test::assert_equal<std::string>(cp::encode_dataset(*b.dataset), cp::encode_dataset(*a.dataset),
                                  "same dataset either way");
  test::assert_equal<size_t>(b.warnings.size(), a.warnings.size(), "same warnings");
  test::assert_equal<std::string>(b.warnings.at(0).message, a.warnings.at(0).message, "same message");
}

void test_cache_key_rounding() {
  test::assert_equal<std::string>(cp::data_fetcher::cache_key(cp::coordinate(40.12345678, -89.0), 4999.6),
                                  "dataset|40.123457|-89.000000|5000", "rounded");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing data fetcher ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }
  RUN_TEST(test_every_category_requested);
  RUN_TEST(test_second_fetch_is_cached);
  RUN_TEST(test_failed_category_is_partial);
  RUN_TEST(test_transient_failure_retried_once);
  RUN_TEST(test_everything_fails);
  RUN_TEST(test_parallel_matches_sequential);
  RUN_TEST(test_cache_key_rounding);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
