#include "util.hpp"

#include <cctype>
#include <cmath>

#define WORLD_SIZE (40075016.68)
#define PI (3.14159265358979323846)

namespace cartoposter { namespace util {

double radians(double degrees) {
  return degrees * PI / 180.0;
}

void lonlat_to_merc(double lon, double lat, double &x, double &y) {
  const double half_world = 0.5 * WORLD_SIZE;
  // clamp to the usual web mercator limit, beyond which y runs off to
  // infinity.
  if (lat > 85.0511) { lat = 85.0511; }
  if (lat < -85.0511) { lat = -85.0511; }

  x = lon * half_world / 180.0;
  y = std::log(std::tan(PI / 4.0 + radians(lat) / 2.0)) * half_world / PI;
}

mapnik::box2d<double> box_for_radius(double lon, double lat, double radius, double aspect) {
  double half_x = radius, half_y = radius;
  if (aspect > 1.0) {
    half_y = half_x / aspect;
  } else {
    half_x = half_y * aspect;
  }

  const double stretch = 1.0 / std::cos(radians(lat));
  double cx = 0.0, cy = 0.0;
  lonlat_to_merc(lon, lat, cx, cy);

  return mapnik::box2d<double>(
    cx - half_x * stretch,
    cy - half_y * stretch,
    cx + half_x * stretch,
    cy + half_y * stretch);
}

std::string slugify(const std::string &s) {
  std::string slug;
  bool pending_sep = false;
  for (char c : s) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      if (pending_sep && !slug.empty()) {
        slug.push_back('_');
      }
      pending_sep = false;
      slug.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      pending_sep = true;
    }
  }
  return slug.empty() ? std::string("poster") : slug;
}

} } // namespace cartoposter::util
