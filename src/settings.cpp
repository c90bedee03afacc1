#include "settings.hpp"
#include "config.h"

#include <boost/filesystem/path.hpp>
#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace bpt = boost::property_tree;

#define CACHE_FILE_NAME "cartoposter.sqlite"

namespace cartoposter {

namespace {

const std::set<std::string> &known_keys() {
  static const std::set<std::string> keys = {
    "theme_dir", "texture_dir", "font_dir", "cache_path", "output_dir", "dpi", "artist",
    "nominatim_url", "overpass_url", "user_agent", "http_timeout", "geocode_attempts",
    "backoff_base", "rate_limit_interval", "rate_limit_penalty", "parallel_fetch",
    "jpeg_quality", "post_process"
  };
  return keys;
}

template <typename T>
void read(const bpt::ptree &doc, const std::string &key, T &value) {
  try {
    value = doc.get<T>(key, value);

  } catch (const bpt::ptree_bad_data &e) {
    throw std::runtime_error((boost::format("Bad value for setting %1%: %2%") % key % e.what()).str());
  }
}

} // anonymous namespace

settings::settings()
  : theme_dir("themes"),
    texture_dir("textures"),
    font_dir(MAPNIK_DEFAULT_FONT_DIR),
    cache_path("cache/" CACHE_FILE_NAME),
    output_dir("posters"),
    dpi(300),
    artist("cartoposter"),
    nominatim_url("https://nominatim.openstreetmap.org/search"),
    overpass_url("https://overpass-api.de/api/interpreter"),
    user_agent("cartoposter/" VERSION " (" PACKAGE_BUGREPORT ")"),
    http_timeout(60),
    geocode_attempts(3),
    backoff_base(1.0),
    rate_limit_interval(1.0),
    rate_limit_penalty(5.0),
    parallel_fetch(false),
    jpeg_quality(95),
    post_process() {
}

void settings::load(const bpt::ptree &doc) {
  for (const auto &child : doc) {
    if (known_keys().count(child.first) == 0) {
      throw std::runtime_error((boost::format("Unknown setting \"%1%\"") % child.first).str());
    }
  }

  read(doc, "theme_dir", theme_dir);
  read(doc, "texture_dir", texture_dir);
  read(doc, "font_dir", font_dir);
  read(doc, "cache_path", cache_path);
  read(doc, "output_dir", output_dir);
  read(doc, "dpi", dpi);
  read(doc, "artist", artist);
  read(doc, "nominatim_url", nominatim_url);
  read(doc, "overpass_url", overpass_url);
  read(doc, "user_agent", user_agent);
  read(doc, "http_timeout", http_timeout);
  read(doc, "geocode_attempts", geocode_attempts);
  read(doc, "backoff_base", backoff_base);
  read(doc, "rate_limit_interval", rate_limit_interval);
  read(doc, "rate_limit_penalty", rate_limit_penalty);
  read(doc, "parallel_fetch", parallel_fetch);
  read(doc, "jpeg_quality", jpeg_quality);

  boost::optional<const bpt::ptree &> pp = doc.get_child_optional("post_process");
  if (pp) {
    post_process = *pp;
  }

  if (geocode_attempts < 1) {
    throw std::runtime_error("geocode_attempts must be at least 1");
  }
  if (backoff_base < 0.0 || rate_limit_interval < 0.0 || rate_limit_penalty < 0.0) {
    throw std::runtime_error("Delays and intervals cannot be negative");
  }
  if (http_timeout < 1) {
    throw std::runtime_error("http_timeout must be at least 1 second");
  }
}

void settings::apply_environment() {
  const char *cache_dir = std::getenv("CACHE_DIR");
  if (cache_dir != nullptr && *cache_dir != '\0') {
    cache_path = (boost::filesystem::path(cache_dir) / CACHE_FILE_NAME).string();
  }
}

settings settings::from_file(const std::string &path) {
  settings s;
  if (!path.empty()) {
    bpt::ptree doc;
    bpt::read_json(path, doc);
    s.load(doc);
  }
  s.apply_environment();
  return s;
}

} // namespace cartoposter
