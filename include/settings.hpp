#ifndef CARTOPOSTER_SETTINGS_HPP
#define CARTOPOSTER_SETTINGS_HPP

#include <boost/property_tree/ptree.hpp>
#include <string>

namespace cartoposter {

/* Everything about the environment a poster is generated in, as opposed
 * to what the poster is. Read from a JSON file, any key of which may be
 * left out to keep its default, and then from the environment.
 */
struct settings {
  settings();

  std::string theme_dir;
  std::string texture_dir;
  std::string font_dir;
  // the SQLite file coordinates and datasets are cached in.
  std::string cache_path;
  std::string output_dir;
  unsigned int dpi;
  // written into the output file's metadata.
  std::string artist;

  std::string nominatim_url;
  std::string overpass_url;
  std::string user_agent;
  // seconds.
  long http_timeout;

  int geocode_attempts;
  // seconds.
  double backoff_base;
  double rate_limit_interval;
  double rate_limit_penalty;

  bool parallel_fetch;
  int jpeg_quality;

  // stage parameters, passed to post_processor::load.
  boost::property_tree::ptree post_process;

  // overwrites settings with the keys present in `doc`. unknown keys
  // and badly typed values throw std::runtime_error.
  void load(const boost::property_tree::ptree &doc);

  // CACHE_DIR, if set, moves the cache file into that directory.
  void apply_environment();

  // defaults, then the file if a path is given, then the environment.
  static settings from_file(const std::string &path);
};

} // namespace cartoposter

#endif // CARTOPOSTER_SETTINGS_HPP
