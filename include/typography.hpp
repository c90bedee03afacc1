#ifndef CARTOPOSTER_TYPOGRAPHY_HPP
#define CARTOPOSTER_TYPOGRAPHY_HPP

#include "location.hpp"
#include "error.hpp"

#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace cartoposter {

/* The words on a poster.
 */
struct poster_text {
  std::string city;
  std::string country;
  coordinate center;
  std::string attribution;
};

enum class font_weight { bold, regular, light };

/* One piece of text, positioned in pixels from the top left of the
 * poster, centered on (x, y).
 */
struct text_element {
  std::string name;
  std::string text;
  double x, y;
  // pixels.
  double size;
  font_weight weight;
  double opacity;
};

struct text_layout {
  std::vector<text_element> elements;
  // the short rule between the title and the country line.
  double divider_x0, divider_x1, divider_y, divider_width;
};

// "paris" -> "P  A  R  I  S".
std::string spaced_title(const std::string &city);

/* Lays out the title block for a poster of the given pixel size. Sizes
 * are chosen in points for a 12 inch wide poster and scaled to the real
 * width; long city names get a smaller title.
 */
text_layout layout_text(const poster_text &text, unsigned int width, unsigned int height,
                        double width_inches, unsigned int dpi);

/* The faces used for each weight of a font family.
 */
struct font_faces {
  std::string bold, regular, light;

  const std::string &face_for(font_weight w) const;
};

/* Picks faces from those the font engine knows about. Each weight is
 * looked for in the requested family, then in DejaVu Sans, then any
 * face at all is used. Falling back records an asset_missing warning;
 * if no faces are registered at all there is nothing to draw with and
 * none is returned.
 */
boost::optional<font_faces> resolve_fonts(const std::string &family,
                                          const std::vector<std::string> &available,
                                          std::vector<warning> &warnings);

} // namespace cartoposter

#endif // CARTOPOSTER_TYPOGRAPHY_HPP
