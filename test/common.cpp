#include "common.hpp"
#include "config.h"

#include <algorithm>
#include <limits>
#include <boost/filesystem/fstream.hpp>
#include <boost/system/error_code.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <iomanip>
#include <iostream>

using boost::function;
using std::runtime_error;
using std::exception;
using std::cout;
using std::cerr;
using std::endl;
using std::setw;
using std::flush;
using std::string;
using std::vector;
namespace fs = boost::filesystem;
namespace cp = cartoposter;

#define TEST_NAME_WIDTH (45)

namespace {

void unwind_nested_exception(std::ostream &out, const std::exception &e) {
  out << e.what();
  try {
    std::rethrow_if_nested(e);

  } catch (const std::exception &nested) {
    out << ". Caused by: ";
    unwind_nested_exception(out, nested);

  } catch (...) {
    out << ". Caused by UNKNOWN EXCEPTION";
  }
}

std::string script_key(const std::string &city, const std::string &country) {
  return cp::location_query(city, country).key();
}

} // anonymous namespace

namespace test {

int run(const string &name, function<void ()> test) {
  cout << setw(TEST_NAME_WIDTH) << name << flush;
  try {
    test();
    cout << "  [PASS]" << endl;
    return 0;

  } catch (const exception &ex) {
    cout << "  [FAIL: ";
    unwind_nested_exception(cout, ex);
    cout << "]" << endl;
    return 1;

  } catch (...) {
    cerr << "  [FAIL: Unexpected error]" << endl;
    throw;
  }
}

json::json() : m_type(json::type_NONE) {}
json::json(const json &j) : m_type(j.m_type), m_buf(j.m_buf.str()) {}

std::ostream &operator<<(std::ostream &out, const json &j) {
   if (j.m_type == json::type_NONE) {
      out << "null";

   } else {
      out << j.m_buf.str();
      if (j.m_type == json::type_DICT) {
         out << "}";
      } else {
         out << "]";
      }
   }
   return out;
}

std::string json::str() const {
   std::ostringstream out;
   out << *this;
   return out.str();
}

void json::quote(const json &j) { m_buf << j; }
void json::quote(const std::string &s) { m_buf << "\"" << s << "\""; }
void json::quote(const char *s) { m_buf << "\"" << s << "\""; }
void json::quote(int i) { m_buf << i; }
void json::quote(bool b) { m_buf << (b ? "true" : "false"); }
void json::quote(double d) { m_buf << d; }

void write_file(const fs::path &path, const std::string &content) {
   fs::create_directories(path.parent_path());
   fs::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
   if (!out) {
      throw runtime_error((boost::format("Unable to open %1% for writing") % path).str());
   }
   out << content;
}

temp_dir::temp_dir()
   : m_path(fs::temp_directory_path() / fs::unique_path("cartoposter-test-%%%%-%%%%-%%%%-%%%%")) {
   fs::create_directories(m_path);
}

temp_dir::~temp_dir() {
   boost::system::error_code err;

   // catch all errors - we don't want to throw in the destructor
   try {
      while (fs::exists(m_path)) {
         fs::remove_all(m_path, err);

         // for any non-ignorable error, there's not much we can
         // do from the destructor except complain loudly.
         if (err && (err != boost::system::errc::no_such_file_or_directory)) {
            spdlog::warn("Unable to remove temporary directory {}: {}",
                         m_path.string(), err.message());
            break;
         }
      }

   } catch (const std::exception &e) {
      spdlog::error("Exception caught while trying to remove temporary directory {}: {}",
                    m_path.string(), e.what());
   }
}

fake_clock::fake_clock()
   : m_now(std::chrono::steady_clock::time_point() + std::chrono::hours(1)),
     m_slept(0), m_sleeps(0) {
}

fake_clock::~fake_clock() {
}

fake_clock::time_point fake_clock::now() const {
   std::lock_guard<std::mutex> lock(m_mutex);
   return m_now;
}

void fake_clock::sleep_for(duration d) {
   std::lock_guard<std::mutex> lock(m_mutex);
   if (d > duration::zero()) {
      m_now += d;
      m_slept += d;
   }
   ++m_sleeps;
}

void fake_clock::advance(duration d) {
   std::lock_guard<std::mutex> lock(m_mutex);
   m_now += d;
}

fake_clock::duration fake_clock::total_slept() const {
   std::lock_guard<std::mutex> lock(m_mutex);
   return m_slept;
}

size_t fake_clock::sleeps() const {
   std::lock_guard<std::mutex> lock(m_mutex);
   return m_sleeps;
}

stub_geocoder::stub_geocoder() : m_calls(0) {
}

stub_geocoder::~stub_geocoder() {
}

cp::geocode_response stub_geocoder::operator()(const cp::location_query &query) {
   std::lock_guard<std::mutex> lock(m_mutex);
   ++m_calls;

   const std::string key = cp::location_query(query.clean_city(), query.country).key();
   auto itr = m_script.find(key);
   if (itr == m_script.end() || itr->second.empty()) {
      cp::geocode_error err{cp::geocode_status::not_found, "No such place."};
      return cp::geocode_response(err);
   }

   size_t &pos = m_position[key];
   const cp::geocode_response &r = itr->second[std::min(pos, itr->second.size() - 1)];
   ++pos;
   return r;
}

void stub_geocoder::answer(const std::string &city, const std::string &country,
                           const cp::coordinate &c) {
   std::lock_guard<std::mutex> lock(m_mutex);
   const std::string key = script_key(city, country);
   m_script[key].assign(1, cp::geocode_response(c));
   m_position[key] = 0;
}

void stub_geocoder::fail(const std::string &city, const std::string &country,
                         cp::geocode_status status) {
   std::lock_guard<std::mutex> lock(m_mutex);
   const std::string key = script_key(city, country);
   cp::geocode_error err{status, "Scripted failure."};
   m_script[key].assign(1, cp::geocode_response(err));
   m_position[key] = 0;
}

void stub_geocoder::then(const std::string &city, const std::string &country,
                         const cp::geocode_response &r) {
   std::lock_guard<std::mutex> lock(m_mutex);
   m_script[script_key(city, country)].push_back(r);
}

size_t stub_geocoder::calls() const {
   std::lock_guard<std::mutex> lock(m_mutex);
   return m_calls;
}

stub_feature_source::stub_feature_source() {
}

stub_feature_source::~stub_feature_source() {
}

cp::fetch_response stub_feature_source::operator()(cp::feature_category category,
                                                   const cp::coordinate &,
                                                   double) {
   std::lock_guard<std::mutex> lock(m_mutex);
   size_t &calls = m_calls[category];
   ++calls;

   auto fail_itr = m_failures.find(category);
   if (fail_itr != m_failures.end() && calls <= fail_itr->second.second) {
      cp::fetch_error err{fail_itr->second.first,
                          "Scripted failure for " + cp::to_string(category) + "."};
      return cp::fetch_response(err);
   }

   auto itr = m_features.find(category);
   if (itr == m_features.end()) {
      return cp::fetch_response(cp::feature_collection());
   }
   return cp::fetch_response(itr->second);
}

void stub_feature_source::set(cp::feature_category category,
                              const cp::feature_collection &features) {
   std::lock_guard<std::mutex> lock(m_mutex);
   m_features[category] = features;
}

void stub_feature_source::fail(cp::feature_category category, cp::fetch_status status) {
   fail_first(category, status, std::numeric_limits<size_t>::max());
}

void stub_feature_source::fail_first(cp::feature_category category,
                                     cp::fetch_status status, size_t n) {
   std::lock_guard<std::mutex> lock(m_mutex);
   m_failures[category] = std::make_pair(status, n);
}

size_t stub_feature_source::calls() const {
   std::lock_guard<std::mutex> lock(m_mutex);
   size_t total = 0;
   for (const auto &entry : m_calls) { total += entry.second; }
   return total;
}

size_t stub_feature_source::calls(cp::feature_category category) const {
   std::lock_guard<std::mutex> lock(m_mutex);
   auto itr = m_calls.find(category);
   return (itr == m_calls.end()) ? 0 : itr->second;
}

cp::feature make_feature(std::int64_t id, cp::geometry_kind kind,
                         const vector<string> &tags,
                         const vector<cp::lonlat> &points) {
   cp::feature f(id, kind);
   for (const string &tag : tags) {
      const size_t eq = tag.find('=');
      if (eq == string::npos) {
         throw runtime_error("Tag \"" + tag + "\" is not of the form key=value.");
      }
      f.tags[tag.substr(0, eq)] = tag.substr(eq + 1);
   }
   f.points = points;
   return f;
}

vector<cp::lonlat> square(double lon, double lat, double half) {
   vector<cp::lonlat> ring;
   ring.push_back(cp::lonlat(lon - half, lat - half));
   ring.push_back(cp::lonlat(lon + half, lat - half));
   ring.push_back(cp::lonlat(lon + half, lat + half));
   ring.push_back(cp::lonlat(lon - half, lat + half));
   ring.push_back(cp::lonlat(lon - half, lat - half));
   return ring;
}

std::string color_hex(const mapnik::color &c) {
   return (boost::format("#%02x%02x%02x%02x")
           % int(c.red()) % int(c.green()) % int(c.blue()) % int(c.alpha())).str();
}

std::string pixel_hex(const mapnik::image_rgba8 &image, unsigned int x, unsigned int y) {
   if (x >= image.width() || y >= image.height()) {
      throw runtime_error((boost::format("Pixel (%1%, %2%) is outside a %3%x%4% image.")
                           % x % y % image.width() % image.height()).str());
   }
   const std::uint32_t p = image.get_row(y)[x];
   return color_hex(mapnik::color(p & 0xff, (p >> 8) & 0xff, (p >> 16) & 0xff, (p >> 24) & 0xff));
}

mapnik::image_rgba8 solid_image(unsigned int w, unsigned int h, const mapnik::color &c) {
   mapnik::image_rgba8 image(w, h);
   const std::uint32_t p = (std::uint32_t(c.alpha()) << 24) | (std::uint32_t(c.blue()) << 16)
      | (std::uint32_t(c.green()) << 8) | std::uint32_t(c.red());
   for (unsigned int y = 0; y < h; ++y) {
      std::uint32_t *row = image.get_row(y);
      for (unsigned int x = 0; x < w; ++x) {
         row[x] = p;
      }
   }
   return image;
}

std::string font_dir() {
   return MAPNIK_DEFAULT_FONT_DIR;
}

} // namespace test
