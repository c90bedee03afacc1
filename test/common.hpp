#ifndef CARTOPOSTER_TEST_COMMON_HPP
#define CARTOPOSTER_TEST_COMMON_HPP

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <sstream>
#include <boost/function.hpp>
#include <boost/format.hpp>
#include <boost/noncopyable.hpp>
#include <boost/filesystem.hpp>
#include <stdexcept>

#include <mapnik/color.hpp>
#include <mapnik/image.hpp>

#include "rate_limiter.hpp"
#include "geocoder.hpp"
#include "feature_source.hpp"
#include "dataset.hpp"

namespace test {

template <typename T>
void assert_equal(T actual, T expected, std::string message = std::string()) {
   if (actual != expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_not_equal(T actual, T expected, std::string message = std::string()) {
   if (actual == expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_less_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual > expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_greater_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual < expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

inline void assert_true(bool condition, std::string message = std::string()) {
   if (!condition) {
      throw std::runtime_error(message);
   }
}

/* runs the test function, formats the output nicely and returns 1
 * if the test failed.
 */
int run(const std::string &name, boost::function<void ()> test);

/* a DSL to make JSON format files. this is nicer than simply
 * quoting the JSON file because C++ lacks heredoc support and
 * uses the same quote character as JSON, so the quoted strings
 * end up looking really ugly.
 */
struct json {
   enum type { type_NONE, type_DICT, type_LIST };

   json();
   json(const json &j);

   /* use operator() to add dictionary key-value entries.
    */
   template <typename T>
   json &operator()(const std::string &key, const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_DICT; }
      if (m_type != type_DICT) { throw std::runtime_error("Mixed type in JSON: expecting DICT."); }
      if (first) { m_buf << "{"; } else { m_buf << ","; }
      m_buf << "\"" << key << "\":";
      quote(t);
      return *this;
   }

   /* use operator[] to add list entries.
    */
   template <typename T>
   json &operator[](const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_LIST; }
      if (m_type != type_LIST) { throw std::runtime_error("Mixed type in JSON: expecting LIST."); }
      if (first) { m_buf << "["; } else { m_buf << ","; }
      quote(t);
      return *this;
   }

   friend std::ostream &operator<<(std::ostream &, const json &);

   // the JSON text.
   std::string str() const;

private:

   void quote(const json &);
   void quote(const std::string &);
   void quote(const char *);
   void quote(int);
   void quote(bool);
   void quote(double);

   type m_type;
   std::ostringstream m_buf;
};

std::ostream &operator<<(std::ostream &, const json &);

// writes the JSON text to a file.
void write_file(const boost::filesystem::path &path, const std::string &content);

/* an RAII temporary directory.
 *
 * on construction, creates a temporary directory. the path to it
 * is available via the path() accessor. upon destruction, it will
 * recursively delete the whole temporary directory tree.
 */
struct temp_dir : boost::noncopyable {
   temp_dir();
   ~temp_dir();
   inline boost::filesystem::path path() const { return m_path; }
private:
   boost::filesystem::path m_path;
};

/* a clock which never really sleeps: sleeping just moves its time
 * along, and is counted.
 */
struct fake_clock : public cartoposter::clock_source {
   fake_clock();
   virtual ~fake_clock();

   time_point now() const;
   void sleep_for(duration d);

   // moves time along without counting a sleep.
   void advance(duration d);

   duration total_slept() const;
   size_t sleeps() const;

private:
   mutable std::mutex m_mutex;
   time_point m_now;
   duration m_slept;
   size_t m_sleeps;
};

/* a geocoder which answers from a script. each query key maps to the
 * responses to give on successive calls; the last one repeats. queries
 * which aren't scripted are not found.
 */
struct stub_geocoder : public cartoposter::geocoder {
   stub_geocoder();
   virtual ~stub_geocoder();

   cartoposter::geocode_response operator()(const cartoposter::location_query &query);

   void answer(const std::string &city, const std::string &country, const cartoposter::coordinate &c);
   void fail(const std::string &city, const std::string &country, cartoposter::geocode_status status);
   // appends a response to the query's script.
   void then(const std::string &city, const std::string &country, const cartoposter::geocode_response &r);

   size_t calls() const;

private:
   mutable std::mutex m_mutex;
   std::map<std::string, std::vector<cartoposter::geocode_response> > m_script;
   std::map<std::string, size_t> m_position;
   size_t m_calls;
};

/* a feature source serving fixed collections per category. categories
 * with nothing set come back empty; categories set to fail always fail.
 */
struct stub_feature_source : public cartoposter::feature_source {
   stub_feature_source();
   virtual ~stub_feature_source();

   cartoposter::fetch_response operator()(cartoposter::feature_category category,
                                          const cartoposter::coordinate &center, double radius);

   void set(cartoposter::feature_category category, const cartoposter::feature_collection &features);
   void fail(cartoposter::feature_category category, cartoposter::fetch_status status);
   // the first `n` calls for the category fail with `status`, then it
   // serves normally.
   void fail_first(cartoposter::feature_category category, cartoposter::fetch_status status, size_t n);

   size_t calls() const;
   size_t calls(cartoposter::feature_category category) const;

private:
   mutable std::mutex m_mutex;
   std::map<cartoposter::feature_category, cartoposter::feature_collection> m_features;
   std::map<cartoposter::feature_category, std::pair<cartoposter::fetch_status, size_t> > m_failures;
   std::map<cartoposter::feature_category, size_t> m_calls;
};

// a feature with tags given as "k=v" strings and points as lon, lat pairs.
cartoposter::feature make_feature(std::int64_t id, cartoposter::geometry_kind kind,
                                  const std::vector<std::string> &tags,
                                  const std::vector<cartoposter::lonlat> &points);

// a closed square ring of the given half-size in degrees.
std::vector<cartoposter::lonlat> square(double lon, double lat, double half);

// "#rrggbbaa" for an image pixel, so pixels can be compared and printed.
std::string pixel_hex(const mapnik::image_rgba8 &image, unsigned int x, unsigned int y);
std::string color_hex(const mapnik::color &c);

// an image filled with one color.
mapnik::image_rgba8 solid_image(unsigned int w, unsigned int h, const mapnik::color &c);

// the directory of the fonts the tests draw text with.
std::string font_dir();

} // namespace test

#endif // CARTOPOSTER_TEST_COMMON_HPP
