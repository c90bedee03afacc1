#ifndef CARTOPOSTER_RENDERER_HPP
#define CARTOPOSTER_RENDERER_HPP

#include "theme.hpp"
#include "poster_spec.hpp"
#include "typography.hpp"
#include "error.hpp"

#include <mapnik/map.hpp>
#include <mapnik/image.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cartoposter {

/* A drawn poster. Raster formats carry the rendered image, which the
 * post-processing stages work on. The prepared map is always kept, and
 * is what vector formats are drawn from at export time.
 */
struct canvas {
  unsigned int width, height;
  mapnik::color background;
  std::shared_ptr<mapnik::image_rgba8> image;
  std::shared_ptr<mapnik::Map> map;

  bool is_raster() const { return bool(image); }
};

/* Draws styled layers into a poster with Mapnik. Layers are drawn in the
 * canonical order, then the edge fades, then the title block, and last
 * of all the shape mask.
 */
class renderer {
public:
  // registers the fonts in font_dir with the font engine, if given.
  explicit renderer(const std::string &font_dir = std::string());

  // `radius` is in ground meters around the center. conditions the
  // poster can be drawn without, such as a missing font, are appended
  // to `warnings`.
  canvas render(const styled_map &styles, const poster_spec &spec,
                const poster_text &text, double radius,
                std::vector<warning> &warnings) const;

  // builds the map without drawing it.
  std::shared_ptr<mapnik::Map> build_map(const styled_map &styles, const poster_spec &spec,
                                         const poster_text &text, double radius,
                                         std::vector<warning> &warnings) const;
};

} // namespace cartoposter

#endif // CARTOPOSTER_RENDERER_HPP
