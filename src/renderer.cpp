#include "renderer.hpp"
#include "util.hpp"

#include <boost/format.hpp>

#include <mapnik/agg_renderer.hpp>
#include <mapnik/datasource.hpp>
#include <mapnik/expression.hpp>
#include <mapnik/feature.hpp>
#include <mapnik/feature_factory.hpp>
#include <mapnik/feature_type_style.hpp>
#include <mapnik/font_engine_freetype.hpp>
#include <mapnik/geometry.hpp>
#include <mapnik/image_compositing.hpp>
#include <mapnik/layer.hpp>
#include <mapnik/memory_datasource.hpp>
#include <mapnik/rule.hpp>
#include <mapnik/symbolizer.hpp>
#include <mapnik/text/formatting/text.hpp>
#include <mapnik/text/placements/dummy.hpp>
#include <mapnik/well_known_srs.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

// number of bands each edge fade is drawn with.
#define FADE_BANDS (32)
// fraction of the height each edge fade covers.
#define FADE_EXTENT (0.25)
// vertices used to approximate a circular mask.
#define CIRCLE_SEGMENTS (360)

namespace cartoposter {

namespace {

typedef mapnik::geometry::point<double> point_t;
typedef mapnik::geometry::line_string<double> line_t;
typedef mapnik::geometry::linear_ring<double> ring_t;
typedef mapnik::geometry::polygon<double> polygon_t;

/* Converts between poster pixels and map coordinates once the map has
 * been zoomed to its final extent.
 */
struct pixel_transform {
  pixel_transform(const mapnik::Map &map)
    : extent(map.get_current_extent()), width(map.width()), height(map.height()) {}

  void operator()(double px, double py, double &x, double &y) const {
    x = extent.minx() + px * extent.width() / width;
    y = extent.maxy() - py * extent.height() / height;
  }

  mapnik::box2d<double> extent;
  double width, height;
};

mapnik::context_ptr make_context() {
  mapnik::context_ptr ctx = std::make_shared<mapnik::context_type>();
  ctx->push("band");
  ctx->push("label");
  return ctx;
}

std::shared_ptr<mapnik::memory_datasource> make_datasource() {
  mapnik::parameters params;
  params["type"] = "memory";
  return std::make_shared<mapnik::memory_datasource>(params);
}

void add_layer(mapnik::Map &map, const std::string &name,
               std::shared_ptr<mapnik::memory_datasource> ds,
               mapnik::feature_type_style &&style) {
  map.insert_style(name, std::move(style));
  mapnik::layer lyr(name, mapnik::MAPNIK_GMERC_PROJ);
  lyr.set_datasource(ds);
  lyr.add_style(name);
  map.add_layer(lyr);
}

ring_t to_ring(const std::vector<lonlat> &points) {
  ring_t ring;
  for (const lonlat &p : points) {
    double x = 0.0, y = 0.0;
    util::lonlat_to_merc(p.lon, p.lat, x, y);
    ring.emplace_back(x, y);
  }
  // rings must be closed.
  if (!ring.empty() && ((ring.front().x != ring.back().x) || (ring.front().y != ring.back().y))) {
    ring.emplace_back(ring.front().x, ring.front().y);
  }
  return ring;
}

mapnik::geometry::geometry<double> to_geometry(const feature &f) {
  if (f.kind == geometry_kind::point) {
    double x = 0.0, y = 0.0;
    util::lonlat_to_merc(f.points.front().lon, f.points.front().lat, x, y);
    return mapnik::geometry::geometry<double>(point_t(x, y));
  }

  if (f.kind == geometry_kind::polygon && f.points.size() >= 3) {
    polygon_t poly;
    poly.set_exterior_ring(to_ring(f.points));
    return mapnik::geometry::geometry<double>(std::move(poly));
  }

  line_t line;
  for (const lonlat &p : f.points) {
    double x = 0.0, y = 0.0;
    util::lonlat_to_merc(p.lon, p.lat, x, y);
    line.emplace_back(x, y);
  }
  return mapnik::geometry::geometry<double>(std::move(line));
}

// converts a width in points on a 12 inch poster to pixels on this one.
double to_pixels(double points, const poster_spec &spec, unsigned int dpi) {
  return points * (spec.width / 12.0) * (dpi / 72.0);
}

mapnik::composite_mode_e comp_op_for(blend_mode b) {
  switch (b) {
  case blend_mode::normal:      return mapnik::src_over;
  case blend_mode::multiply:    return mapnik::multiply;
  case blend_mode::screen:      return mapnik::screen;
  case blend_mode::overlay:     return mapnik::overlay;
  case blend_mode::soft_light:  return mapnik::soft_light;
  case blend_mode::hard_light:  return mapnik::hard_light;
  case blend_mode::color_dodge: return mapnik::color_dodge;
  case blend_mode::color_burn:  return mapnik::color_burn;
  case blend_mode::darken:      return mapnik::darken;
  case blend_mode::lighten:     return mapnik::lighten;
  case blend_mode::difference:  return mapnik::difference;
  case blend_mode::exclusion:   return mapnik::exclusion;
  case blend_mode::hue:         return mapnik::hue;
  case blend_mode::saturation:  return mapnik::saturation;
  case blend_mode::color:       return mapnik::_color;
  case blend_mode::luminosity:  return mapnik::_value;
  }
  return mapnik::src_over;
}

void add_feature_layer(mapnik::Map &map, const styled_layer &sl, const poster_spec &spec, unsigned int dpi) {
  mapnik::context_ptr ctx = make_context();
  std::shared_ptr<mapnik::memory_datasource> ds = make_datasource();

  mapnik::value_integer id = 1;
  for (const feature &f : sl.features) {
    if (f.points.empty() || (f.kind != geometry_kind::point && f.points.size() < 2)) {
      continue;
    }
    mapnik::feature_ptr feat(mapnik::feature_factory::create(ctx, id++));
    feat->set_geometry(to_geometry(f));
    ds->push(feat);
  }

  mapnik::rule r;
  if (is_point_layer(sl.layer)) {
    const double size = to_pixels(sl.style.stroke_width, spec, dpi);
    mapnik::markers_symbolizer marker;
    mapnik::put(marker, mapnik::keys::fill, sl.style.fill);
    mapnik::put(marker, mapnik::keys::fill_opacity, sl.style.opacity);
    mapnik::put(marker, mapnik::keys::stroke, sl.style.stroke);
    mapnik::put(marker, mapnik::keys::stroke_opacity, sl.style.opacity);
    mapnik::put(marker, mapnik::keys::width, size);
    mapnik::put(marker, mapnik::keys::height, size);
    mapnik::put(marker, mapnik::keys::allow_overlap, true);
    r.append(std::move(marker));

  } else {
    if (is_area_layer(sl.layer)) {
      mapnik::polygon_symbolizer poly;
      mapnik::put(poly, mapnik::keys::fill, sl.style.fill);
      mapnik::put(poly, mapnik::keys::fill_opacity, sl.style.opacity);
      r.append(std::move(poly));
    }

    mapnik::line_symbolizer line;
    mapnik::put(line, mapnik::keys::stroke, sl.style.stroke);
    mapnik::put(line, mapnik::keys::stroke_width, to_pixels(sl.style.stroke_width, spec, dpi));
    mapnik::put(line, mapnik::keys::stroke_opacity, sl.style.opacity);
    mapnik::put(line, mapnik::keys::stroke_linecap, mapnik::ROUND_CAP);
    mapnik::put(line, mapnik::keys::stroke_linejoin, mapnik::ROUND_JOIN);
    r.append(std::move(line));
  }

  mapnik::feature_type_style style;
  style.add_rule(std::move(r));
  // the whole layer is drawn into its own buffer and composited over
  // what's below with the blend mode.
  if (sl.style.blend != blend_mode::normal) {
    style.set_comp_op(comp_op_for(sl.style.blend));
  }
  add_layer(map, to_string(sl.layer), ds, std::move(style));
}

ring_t pixel_rect(const pixel_transform &tr, double x0, double y0, double x1, double y1) {
  ring_t ring;
  double x = 0.0, y = 0.0;
  // anticlockwise, with y up.
  tr(x0, y1, x, y); ring.emplace_back(x, y);
  tr(x1, y1, x, y); ring.emplace_back(x, y);
  tr(x1, y0, x, y); ring.emplace_back(x, y);
  tr(x0, y0, x, y); ring.emplace_back(x, y);
  ring.emplace_back(ring.front().x, ring.front().y);
  return ring;
}

// the top and bottom edges fade into the gradient color: opaque at the
// edge, clear at FADE_EXTENT of the height in from it.
void add_fades(mapnik::Map &map, const pixel_transform &tr, const mapnik::color &color) {
  mapnik::context_ptr ctx = make_context();
  std::shared_ptr<mapnik::memory_datasource> ds = make_datasource();
  mapnik::feature_type_style style;

  const double band = FADE_EXTENT * tr.height / FADE_BANDS;
  mapnik::value_integer id = 1;

  for (int i = 0; i < FADE_BANDS; ++i) {
    const double opacity = 1.0 - (i + 0.5) / FADE_BANDS;

    mapnik::rule r;
    r.set_filter(mapnik::parse_expression((boost::format("[band] = %1%") % i).str()));
    mapnik::polygon_symbolizer poly;
    mapnik::put(poly, mapnik::keys::fill, color);
    mapnik::put(poly, mapnik::keys::fill_opacity, opacity);
    r.append(std::move(poly));
    style.add_rule(std::move(r));

    const double top = i * band;
    const double bottom = tr.height - (i + 1) * band;
    for (double y0 : { top, bottom }) {
      polygon_t poly_geom;
      poly_geom.set_exterior_ring(pixel_rect(tr, 0.0, y0, tr.width, y0 + band));
      mapnik::feature_ptr feat(mapnik::feature_factory::create(ctx, id++));
      feat->set_geometry(mapnik::geometry::geometry<double>(std::move(poly_geom)));
      feat->put("band", mapnik::value_integer(i));
      ds->push(feat);
    }
  }

  add_layer(map, "fade", ds, std::move(style));
}

void add_divider(mapnik::Map &map, const pixel_transform &tr, const text_layout &layout,
                 const layer_style &style) {
  mapnik::context_ptr ctx = make_context();
  std::shared_ptr<mapnik::memory_datasource> ds = make_datasource();

  line_t line;
  double x = 0.0, y = 0.0;
  tr(layout.divider_x0, layout.divider_y, x, y); line.emplace_back(x, y);
  tr(layout.divider_x1, layout.divider_y, x, y); line.emplace_back(x, y);
  mapnik::feature_ptr feat(mapnik::feature_factory::create(ctx, 1));
  feat->set_geometry(mapnik::geometry::geometry<double>(std::move(line)));
  ds->push(feat);

  mapnik::rule r;
  mapnik::line_symbolizer sym;
  mapnik::put(sym, mapnik::keys::stroke, style.fill);
  mapnik::put(sym, mapnik::keys::stroke_width, layout.divider_width);
  mapnik::put(sym, mapnik::keys::stroke_opacity, style.opacity);
  r.append(std::move(sym));

  mapnik::feature_type_style fts;
  fts.add_rule(std::move(r));
  add_layer(map, "labels_divider", ds, std::move(fts));
}

void add_text(mapnik::Map &map, const pixel_transform &tr, const text_element &element,
              const std::string &face, const layer_style &style) {
  mapnik::context_ptr ctx = make_context();
  std::shared_ptr<mapnik::memory_datasource> ds = make_datasource();

  double x = 0.0, y = 0.0;
  tr(element.x, element.y, x, y);
  mapnik::feature_ptr feat(mapnik::feature_factory::create(ctx, 1));
  feat->set_geometry(mapnik::geometry::geometry<double>(point_t(x, y)));
  feat->put("label", mapnik::value_unicode_string::fromUTF8(element.text));
  ds->push(feat);

  mapnik::text_symbolizer sym;
  mapnik::text_placements_ptr placements = std::make_shared<mapnik::text_placements_dummy>();
  placements->defaults.format_defaults.face_name = face;
  placements->defaults.format_defaults.text_size = element.size;
  placements->defaults.format_defaults.fill = style.fill;
  placements->defaults.format_defaults.text_opacity = element.opacity * style.opacity;
  placements->defaults.expressions.allow_overlap = true;
  placements->defaults.set_format_tree(
    std::make_shared<mapnik::formatting::text_node>(mapnik::parse_expression("[label]")));
  mapnik::put<mapnik::text_placements_ptr>(sym, mapnik::keys::text_placements_, placements);

  mapnik::rule r;
  r.append(std::move(sym));
  mapnik::feature_type_style fts;
  fts.add_rule(std::move(r));
  add_layer(map, "labels_" + element.name, ds, std::move(fts));
}

// everything outside the shape is covered with the background. the hole
// winds the other way to the outer ring, so it stays clear whichever
// fill rule is in force.
void add_shape_mask(mapnik::Map &map, const pixel_transform &tr, map_shape shape,
                    const mapnik::color &background) {
  const double w = tr.width, h = tr.height;
  // a little beyond the edges, so antialiasing doesn't leave a seam.
  const double pad = 2.0;

  ring_t hole;
  double x = 0.0, y = 0.0;
  if (shape == map_shape::circle) {
    const double cx = 0.5 * w, cy = 0.5 * h, r = 0.5 * std::min(w, h);
    // traced anticlockwise on the map, then reversed.
    for (int i = 0; i <= CIRCLE_SEGMENTS; ++i) {
      const double a = util::radians(360.0 * i / CIRCLE_SEGMENTS);
      tr(cx + r * std::cos(a), cy - r * std::sin(a), x, y);
      hole.emplace_back(x, y);
    }
    std::reverse(hole.begin(), hole.end());

  } else {
    const double m = 0.05 * std::min(w, h);
    tr(0.5 * w, m, x, y);     hole.emplace_back(x, y);
    tr(w - m, h - m, x, y);   hole.emplace_back(x, y);
    tr(m, h - m, x, y);       hole.emplace_back(x, y);
    hole.emplace_back(hole.front().x, hole.front().y);
  }

  polygon_t mask;
  mask.set_exterior_ring(pixel_rect(tr, -pad, -pad, w + pad, h + pad));
  mask.add_hole(std::move(hole));

  mapnik::context_ptr ctx = make_context();
  std::shared_ptr<mapnik::memory_datasource> ds = make_datasource();
  mapnik::feature_ptr feat(mapnik::feature_factory::create(ctx, 1));
  feat->set_geometry(mapnik::geometry::geometry<double>(std::move(mask)));
  ds->push(feat);

  mapnik::rule r;
  mapnik::polygon_symbolizer poly;
  mapnik::put(poly, mapnik::keys::fill, background);
  r.append(std::move(poly));
  mapnik::feature_type_style fts;
  fts.add_rule(std::move(r));
  add_layer(map, "shape_mask", ds, std::move(fts));
}

// vector output is laid out in points.
unsigned int effective_dpi(const poster_spec &spec) {
  return is_raster(spec.format) ? spec.dpi : 72;
}

} // anonymous namespace

renderer::renderer(const std::string &font_dir) {
  if (!font_dir.empty()) {
    if (!mapnik::freetype_engine::register_fonts(font_dir, true)) {
      spdlog::warn("No fonts registered from {}", font_dir);
    }
  }
}

std::shared_ptr<mapnik::Map> renderer::build_map(const styled_map &styles, const poster_spec &spec,
                                                 const poster_text &text, double radius,
                                                 std::vector<warning> &warnings) const {
  const unsigned int dpi = effective_dpi(spec);
  const unsigned int width = static_cast<unsigned int>(std::lround(spec.width * dpi));
  const unsigned int height = static_cast<unsigned int>(std::lround(spec.height * dpi));

  std::shared_ptr<mapnik::Map> map = std::make_shared<mapnik::Map>(width, height, mapnik::MAPNIK_GMERC_PROJ);
  map->set_background(styles.colors.background);
  map->zoom_to_box(util::box_for_radius(text.center.longitude, text.center.latitude,
                                        radius, double(width) / height));
  const pixel_transform tr(*map);

  const layer_style *labels_style = nullptr;
  for (const styled_layer &sl : styles.layers) {
    if (sl.layer == canonical_layer::labels) {
      labels_style = &sl.style;
      continue;
    }
    if (!sl.features.empty() && sl.style.visible) {
      add_feature_layer(*map, sl, spec, dpi);
    }
  }

  add_fades(*map, tr, styles.colors.gradient);

  if (labels_style != nullptr && labels_style->visible) {
    boost::optional<font_faces> faces =
      resolve_fonts(spec.font, mapnik::freetype_engine::face_names(), warnings);

    if (faces) {
      text_layout layout = layout_text(text, width, height, spec.width, dpi);
      add_divider(*map, tr, layout, *labels_style);
      for (const text_element &element : layout.elements) {
        add_text(*map, tr, element, faces->face_for(element.weight), *labels_style);
      }
    }
  }

  if (spec.shape != map_shape::rectangle) {
    add_shape_mask(*map, tr, spec.shape, styles.colors.background);
  }

  return map;
}

canvas renderer::render(const styled_map &styles, const poster_spec &spec,
                        const poster_text &text, double radius,
                        std::vector<warning> &warnings) const {
  canvas c;
  c.map = build_map(styles, spec, text, radius, warnings);
  c.width = c.map->width();
  c.height = c.map->height();
  c.background = styles.colors.background;

  if (is_raster(spec.format)) {
    c.image = std::make_shared<mapnik::image_rgba8>(c.width, c.height);
    mapnik::agg_renderer<mapnik::image_rgba8> ren(*c.map, *c.image);
    ren.apply();
    spdlog::info("Rendered {}x{} poster with theme {}", c.width, c.height, styles.theme_id);
  }

  return c;
}

} // namespace cartoposter
