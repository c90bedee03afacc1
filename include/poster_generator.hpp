#ifndef CARTOPOSTER_POSTER_GENERATOR_HPP
#define CARTOPOSTER_POSTER_GENERATOR_HPP

#include "either.hpp"
#include "error.hpp"
#include "request.hpp"
#include "settings.hpp"
#include "location_resolver.hpp"
#include "data_fetcher.hpp"
#include "theme.hpp"
#include "renderer.hpp"
#include "post_processor.hpp"
#include "exporter.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cartoposter {

enum class progress_stage { fetch_start, data_downloaded, processing, rendering, saving, done, failed };

std::string to_string(progress_stage stage);

// called as each stage starts, with a short human-readable note. purely
// advisory: nothing it does affects the poster.
typedef boost::function<void (progress_stage, const std::string &)> progress_callback;

struct generation_result {
  generation_result(const boost::filesystem::path &p, const std::vector<warning> &w);
  generation_result(const failure &f, const std::vector<warning> &w);

  // the written file, or why there isn't one.
  either<boost::filesystem::path, failure> outcome;
  std::vector<warning> warnings;
};

/* The collaborators a generator runs a request through.
 */
struct generator_services {
  generator_services();

  std::shared_ptr<location_resolver> resolver;
  std::shared_ptr<data_fetcher> fetcher;
  std::shared_ptr<theme_engine> themes;
  std::shared_ptr<renderer> painter;
  std::shared_ptr<post_processor> post;
  std::shared_ptr<exporter> output;
  // the time stamped on output files.
  boost::function<boost::posix_time::ptime ()> now;
  std::string artist;
  unsigned int default_dpi;
};

/* Runs a request through the whole pipeline: validation, location
 * resolution, data fetch, classification, styling, rendering,
 * post-processing and export.
 *
 * Failures never escape as exceptions. Each comes back as a `failure`
 * in the result, and no output file is left behind for it.
 */
class poster_generator : boost::noncopyable {
public:
  explicit poster_generator(const generator_services &services);

  generation_result generate(const generation_request &request,
                             const progress_callback &progress = progress_callback()) const;

private:
  boost::filesystem::path run(const generation_request &request, const progress_callback &progress,
                              progress_stage &stage, std::vector<warning> &warnings) const;

  generator_services m_services;
};

// the generator wired to the real services, as configured. with
// no_cache set, results are cached in memory only. this sets up
// libcurl's global state (see fetch::http_global_init) if nothing has
// yet, so it should be called before other threads use libcurl.
std::unique_ptr<poster_generator> make_generator(const settings &s, bool no_cache = false);

} // namespace cartoposter

#endif // CARTOPOSTER_POSTER_GENERATOR_HPP
