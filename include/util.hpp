#ifndef CARTOPOSTER_UTIL_HPP
#define CARTOPOSTER_UTIL_HPP

#include <mapnik/box2d.hpp>
#include <string>

namespace cartoposter { namespace util {

double radians(double degrees);

// spherical mercator, in meters, as used by the renderer.
void lonlat_to_merc(double lon, double lat, double &x, double &y);

// the mercator box showing `radius` ground meters either side of the
// center horizontally, shrunk along one axis to the given width/height
// aspect ratio. mercator stretches distances by 1/cos(latitude), so the
// box is scaled up to match.
mapnik::box2d<double> box_for_radius(double lon, double lat, double radius, double aspect);

// lower-cased, with runs of anything that isn't a letter or digit
// collapsed to a single '_'. used in output file names.
std::string slugify(const std::string &s);

} } // namespace cartoposter::util

#endif // CARTOPOSTER_UTIL_HPP
