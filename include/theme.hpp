#ifndef CARTOPOSTER_THEME_HPP
#define CARTOPOSTER_THEME_HPP

#include "layer_builder.hpp"
#include "geographic_context.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <mapnik/color.hpp>

#include <map>
#include <string>
#include <vector>

namespace cartoposter {

/* How a layer is composited over everything drawn below it. Each maps
 * onto one of Mapnik's compositing operations.
 */
enum class blend_mode {
  normal, multiply, screen, overlay, soft_light, hard_light, color_dodge,
  color_burn, darken, lighten, difference, exclusion, hue, saturation,
  color, luminosity
};

std::string to_string(blend_mode b);
boost::optional<blend_mode> blend_from_string(const std::string &s);

/* How one layer is drawn. Widths are in points on a poster 12 inches
 * wide, and scale with the poster. For point layers the width is the
 * marker's diameter.
 */
struct layer_style {
  mapnik::color fill;
  mapnik::color stroke;
  double stroke_width;
  double opacity;
  bool visible;
  blend_mode blend;
};

/* Poster-wide colors. The gradient color is what the top and bottom
 * edges fade into.
 */
struct palette {
  mapnik::color background;
  mapnik::color text;
  mapnik::color gradient;
};

/* A partial layer style: whatever is set replaces the same property of
 * whatever it's applied over.
 */
struct style_patch {
  boost::optional<mapnik::color> fill, stroke;
  boost::optional<double> stroke_width, opacity;
  boost::optional<bool> visible;
  boost::optional<blend_mode> blend;

  void apply_to(layer_style &style) const;
};

struct palette_patch {
  boost::optional<mapnik::color> background, text, gradient;

  void apply_to(palette &p) const;
};

/* A set of patches over the palette and any number of layers. Themes are
 * made of these: one for the base, one per variant, and request
 * overrides are one too.
 */
struct style_set {
  palette_patch colors;
  std::map<canonical_layer, style_patch> layers;

  bool empty() const;
};

struct theme {
  // the name the theme was loaded by, i.e: its file name.
  std::string id;
  std::string name, description, author, version;
  style_set base;
  // keyed by terrain ("coastal"), season ("winter") or both
  // ("coastal:winter").
  std::map<std::string, style_set> variants;
  boost::optional<std::string> texture, effect, font;
};

/* Every canonical layer's style and the palette, after all patches have
 * been applied.
 */
struct resolved_styles {
  palette colors;
  std::map<canonical_layer, layer_style> layers;
};

struct styled_layer {
  canonical_layer layer;
  std::vector<feature> features;
  layer_style style;
};

struct styled_map {
  std::string theme_id;
  palette colors;
  // in draw order.
  std::vector<styled_layer> layers;
};

/* Loads theme documents from a directory of JSON files, one per theme,
 * and resolves them into concrete styles.
 */
class theme_engine {
public:
  explicit theme_engine(const boost::filesystem::path &theme_dir);

  // loads "<theme_dir>/<name>.json". throws poster_error with
  // theme_load_error if it's missing, unreadable or malformed.
  theme load(const std::string &name) const;

  // names of the themes in the directory, sorted.
  std::vector<std::string> available() const;

  const boost::filesystem::path &directory() const { return m_dir; }

  // validates and converts a theme document. unknown keys, malformed
  // colors and out of range numbers are all errors.
  static theme parse(const boost::property_tree::ptree &doc, const std::string &id);

  // parses per-layer overrides from a request. same format as a variant.
  static style_set parse_overrides(const boost::property_tree::ptree &doc);

  // the built-in palette and layer styles every theme is applied over.
  static palette default_palette();
  static std::map<canonical_layer, layer_style> default_styles();

  // applies, lowest precedence first: the defaults, the theme's base,
  // its terrain variant, its season variant, its "terrain:season"
  // variant and finally the overrides.
  static resolved_styles resolve_styles(const theme &t,
                                        const geographic_context &context,
                                        const style_set &overrides = style_set());

  // resolves the styles and attaches them to the layers.
  static styled_map resolve(const theme &t, layer_set layers,
                            const geographic_context &context,
                            const style_set &overrides = style_set());

private:
  boost::filesystem::path m_dir;
};

} // namespace cartoposter

#endif // CARTOPOSTER_THEME_HPP
