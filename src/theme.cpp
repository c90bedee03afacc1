#include "theme.hpp"
#include "error.hpp"
#include "poster_spec.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bfs = boost::filesystem;
namespace bpt = boost::property_tree;

namespace cartoposter {

namespace {

poster_error load_error(const std::string &message) {
  return poster_error(error_kind::theme_load_error, message);
}

bool is_array(const bpt::ptree &node) {
  return !node.empty() && node.begin()->first.empty();
}

bool is_object(const bpt::ptree &node) {
  return !node.empty() && !node.begin()->first.empty();
}

// what an empty JSON object reads as: no children and no value.
bool is_blank(const bpt::ptree &node) {
  return node.empty() && node.data().empty();
}

// a color is a string, or an array whose first entry is one.
mapnik::color parse_color(const bpt::ptree &node, const std::string &where) {
  std::string str;
  if (is_array(node)) {
    const bpt::ptree &first = node.begin()->second;
    if (!first.empty()) {
      throw load_error((boost::format("Expected a color as the first entry of %1%") % where).str());
    }
    str = first.data();
  } else if (node.empty()) {
    str = node.data();
  } else {
    throw load_error((boost::format("Expected a color for %1%") % where).str());
  }

  try {
    return mapnik::color(str);

  } catch (const std::exception &e) {
    throw load_error((boost::format("Invalid color \"%1%\" for %2%: %3%") % str % where % e.what()).str());
  }
}

double parse_number(const bpt::ptree &node, const std::string &where, double min, double max) {
  boost::optional<double> value;
  if (node.empty()) {
    value = node.get_value_optional<double>();
  }
  if (!value) {
    throw load_error((boost::format("Expected a number for %1%") % where).str());
  }
  if ((*value < min) || (*value > max)) {
    throw load_error((boost::format("Value %1% for %2% is out of range [%3%, %4%]")
                      % *value % where % min % max).str());
  }
  return *value;
}

bool parse_bool(const bpt::ptree &node, const std::string &where) {
  boost::optional<bool> value;
  if (node.empty()) {
    value = node.get_value_optional<bool>();
  }
  if (!value) {
    throw load_error((boost::format("Expected true or false for %1%") % where).str());
  }
  return *value;
}

std::string parse_string(const bpt::ptree &node, const std::string &where) {
  if (!node.empty()) {
    throw load_error((boost::format("Expected a string for %1%") % where).str());
  }
  return node.data();
}

// a texture or effect suggestion. "none" and empty both mean the theme
// suggests nothing.
boost::optional<std::string> parse_suggestion(const bpt::ptree &node, const std::string &where) {
  const std::string value = boost::algorithm::trim_copy(parse_string(node, where));
  if (value.empty() || boost::algorithm::iequals(value, "none")) {
    return boost::none;
  }
  return value;
}

// a layer entry is either a bare color, applied to both fill and stroke,
// or an object spelling the properties out.
style_patch parse_layer(const bpt::ptree &node, const std::string &where) {
  style_patch patch;

  if (is_blank(node)) {
    return patch;
  }
  if (!is_object(node)) {
    mapnik::color c = parse_color(node, where);
    patch.fill = c;
    patch.stroke = c;
    return patch;
  }

  for (const auto &child : node) {
    const std::string &key = child.first;
    const std::string child_where = where + "." + key;

    if (key == "fill") {
      patch.fill = parse_color(child.second, child_where);
    } else if (key == "stroke") {
      patch.stroke = parse_color(child.second, child_where);
    } else if (key == "width") {
      patch.stroke_width = parse_number(child.second, child_where, 0.0, 100.0);
    } else if (key == "opacity") {
      patch.opacity = parse_number(child.second, child_where, 0.0, 1.0);
    } else if (key == "visible") {
      patch.visible = parse_bool(child.second, child_where);
    } else if (key == "blend") {
      const std::string name = parse_string(child.second, child_where);
      patch.blend = blend_from_string(name);
      if (!patch.blend) {
        throw load_error((boost::format("Unknown blend mode \"%1%\" for %2%") % name % child_where).str());
      }
    } else {
      throw load_error((boost::format("Unknown key \"%1%\" in %2%") % key % where).str());
    }
  }

  return patch;
}

// keys shared by the top level, variants and overrides. returns false if
// the key isn't one of them.
bool parse_style_key(const std::string &key, const bpt::ptree &value, const std::string &where,
                     style_set &set) {
  if (key == "bg") {
    set.colors.background = parse_color(value, where);

  } else if (key == "text") {
    set.colors.text = parse_color(value, where);

  } else if (key == "gradient_color") {
    set.colors.gradient = parse_color(value, where);

  } else if ((key == "colors") || (key == "layers")) {
    if (!is_object(value) && !is_blank(value)) {
      throw load_error((boost::format("Expected an object for %1%") % where).str());
    }
    for (const auto &child : value) {
      if (!parse_style_key(child.first, child.second, where + "." + child.first, set) ||
          (child.first == "colors") || (child.first == "layers")) {
        throw load_error((boost::format("Unknown key \"%1%\" in %2%") % child.first % where).str());
      }
    }

  } else {
    boost::optional<canonical_layer> layer = layer_from_string(key);
    if (!layer) {
      return false;
    }
    set.layers[*layer] = parse_layer(value, where);
  }

  return true;
}

style_set parse_style_set(const bpt::ptree &node, const std::string &where) {
  style_set set;
  for (const auto &child : node) {
    if (!parse_style_key(child.first, child.second, where + "." + child.first, set)) {
      throw load_error((boost::format("Unknown key \"%1%\" in %2%") % child.first % where).str());
    }
  }
  return set;
}

void check_variant_name(const std::string &name) {
  const size_t colon = name.find(':');
  if (colon == std::string::npos) {
    if (!terrain_from_string(name) && !season_from_string(name)) {
      throw load_error((boost::format("Variant \"%1%\" is not a terrain or season") % name).str());
    }
    return;
  }

  if (!terrain_from_string(name.substr(0, colon)) || !season_from_string(name.substr(colon + 1))) {
    throw load_error((boost::format("Variant \"%1%\" is not of the form terrain:season") % name).str());
  }
}

void apply(const style_set &set, resolved_styles &styles, bool &labels_touched) {
  set.colors.apply_to(styles.colors);
  for (const auto &entry : set.layers) {
    entry.second.apply_to(styles.layers[entry.first]);
    if (entry.first == canonical_layer::labels) {
      labels_touched = true;
    }
  }
}

layer_style make_style(const char *color, double width, double opacity = 1.0) {
  layer_style style;
  style.fill = mapnik::color(color);
  style.stroke = mapnik::color(color);
  style.stroke_width = width;
  style.opacity = opacity;
  style.visible = true;
  style.blend = blend_mode::normal;
  return style;
}

const std::vector<std::pair<blend_mode, const char *> > &blend_names() {
  static const std::vector<std::pair<blend_mode, const char *> > names = {
    { blend_mode::normal,      "normal" },
    { blend_mode::multiply,    "multiply" },
    { blend_mode::screen,      "screen" },
    { blend_mode::overlay,     "overlay" },
    { blend_mode::soft_light,  "soft_light" },
    { blend_mode::hard_light,  "hard_light" },
    { blend_mode::color_dodge, "color_dodge" },
    { blend_mode::color_burn,  "color_burn" },
    { blend_mode::darken,      "darken" },
    { blend_mode::lighten,     "lighten" },
    { blend_mode::difference,  "difference" },
    { blend_mode::exclusion,   "exclusion" },
    { blend_mode::hue,         "hue" },
    { blend_mode::saturation,  "saturation" },
    { blend_mode::color,       "color" },
    { blend_mode::luminosity,  "luminosity" },
  };
  return names;
}

} // anonymous namespace

std::string to_string(blend_mode b) {
  for (const auto &entry : blend_names()) {
    if (entry.first == b) {
      return entry.second;
    }
  }
  throw std::logic_error("Unhandled blend mode");
}

boost::optional<blend_mode> blend_from_string(const std::string &s) {
  for (const auto &entry : blend_names()) {
    if (s == entry.second) {
      return entry.first;
    }
  }
  return boost::none;
}

void style_patch::apply_to(layer_style &style) const {
  if (fill) { style.fill = *fill; }
  if (stroke) { style.stroke = *stroke; }
  if (stroke_width) { style.stroke_width = *stroke_width; }
  if (opacity) { style.opacity = *opacity; }
  if (visible) { style.visible = *visible; }
  if (blend) { style.blend = *blend; }
}

void palette_patch::apply_to(palette &p) const {
  if (background) { p.background = *background; }
  if (text) { p.text = *text; }
  if (gradient) { p.gradient = *gradient; }
}

bool style_set::empty() const {
  return !colors.background && !colors.text && !colors.gradient && layers.empty();
}

theme_engine::theme_engine(const bfs::path &theme_dir)
  : m_dir(theme_dir) {
}

theme theme_engine::load(const std::string &name) const {
  // theme names are file names, and nothing else.
  if (name.empty() || (name.find_first_of("/\\") != std::string::npos) || (name[0] == '.')) {
    throw load_error((boost::format("Invalid theme name \"%1%\"") % name).str());
  }

  const bfs::path file = m_dir / (name + ".json");
  if (!bfs::exists(file)) {
    throw load_error((boost::format("Theme \"%1%\" not found in %2%") % name % m_dir).str());
  }

  bpt::ptree doc;
  try {
    bpt::read_json(file.string(), doc);

  } catch (const bpt::ptree_error &e) {
    throw load_error((boost::format("Unable to read theme \"%1%\": %2%") % name % e.what()).str());
  }

  theme t = parse(doc, name);
  spdlog::info("Loaded theme {} ({})", name, t.name);
  return t;
}

std::vector<std::string> theme_engine::available() const {
  std::vector<std::string> names;
  boost::system::error_code ec;
  if (!bfs::is_directory(m_dir, ec)) {
    return names;
  }

  for (bfs::directory_iterator itr(m_dir), end; itr != end; ++itr) {
    const bfs::path &p = itr->path();
    if (bfs::is_regular_file(p) && (p.extension() == ".json")) {
      names.push_back(p.stem().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

theme theme_engine::parse(const bpt::ptree &doc, const std::string &id) {
  theme t;
  t.id = id;
  t.name = id;

  if (!is_object(doc) && !is_blank(doc)) {
    throw load_error((boost::format("Theme \"%1%\" is not a JSON object") % id).str());
  }

  for (const auto &child : doc) {
    const std::string &key = child.first;
    const std::string where = id + "." + key;

    if (key == "name") {
      t.name = parse_string(child.second, where);
    } else if (key == "description") {
      t.description = parse_string(child.second, where);
    } else if (key == "author") {
      t.author = parse_string(child.second, where);
    } else if (key == "version") {
      t.version = parse_string(child.second, where);
    } else if (key == "texture") {
      t.texture = parse_suggestion(child.second, where);
    } else if (key == "effect") {
      t.effect = parse_suggestion(child.second, where);
      if (t.effect) {
        boost::algorithm::to_lower(*t.effect);
        if (!effect_from_string(*t.effect)) {
          throw load_error((boost::format("Theme \"%1%\" names unknown effect \"%2%\"")
                            % id % *t.effect).str());
        }
      }
    } else if (key == "font") {
      t.font = parse_string(child.second, where);

    } else if (key == "variants") {
      if (!is_object(child.second) && !is_blank(child.second)) {
        throw load_error((boost::format("Expected an object for %1%") % where).str());
      }
      for (const auto &variant : child.second) {
        check_variant_name(variant.first);
        t.variants[variant.first] = parse_style_set(variant.second, where + "." + variant.first);
      }

    } else if (!parse_style_key(key, child.second, where, t.base)) {
      throw load_error((boost::format("Unknown key \"%1%\" in theme \"%2%\"") % key % id).str());
    }
  }

  return t;
}

style_set theme_engine::parse_overrides(const bpt::ptree &doc) {
  return parse_style_set(doc, "overrides");
}

palette theme_engine::default_palette() {
  palette p;
  p.background = mapnik::color("#FFFFFF");
  p.text = mapnik::color("#000000");
  p.gradient = mapnik::color("#FFFFFF");
  return p;
}

std::map<canonical_layer, layer_style> theme_engine::default_styles() {
  std::map<canonical_layer, layer_style> styles;
  styles[canonical_layer::water]            = make_style("#C0C0C0", 0.5);
  styles[canonical_layer::waterway]         = make_style("#C0C0C0", 0.6);
  styles[canonical_layer::parks]            = make_style("#F0F0F0", 0.3);
  styles[canonical_layer::forest]           = make_style("#E6E6E6", 0.3);
  styles[canonical_layer::land]             = make_style("#F5F5F5", 0.3);
  styles[canonical_layer::generic]          = make_style("#EBEBEB", 0.3);
  styles[canonical_layer::buildings]        = make_style("#E0E0E0", 0.2);
  styles[canonical_layer::road_motorway]    = make_style("#0A0A0A", 1.2);
  styles[canonical_layer::road_primary]     = make_style("#1A1A1A", 1.0);
  styles[canonical_layer::road_secondary]   = make_style("#2A2A2A", 0.8);
  styles[canonical_layer::road_tertiary]    = make_style("#3A3A3A", 0.6);
  styles[canonical_layer::road_residential] = make_style("#4A4A4A", 0.4);
  styles[canonical_layer::road_default]     = make_style("#3A3A3A", 0.4);
  styles[canonical_layer::cycleway]         = make_style("#16C79A", 0.4);
  styles[canonical_layer::rail]             = make_style("#5A5A5A", 0.5);
  styles[canonical_layer::transit]          = make_style("#6A6A6A", 0.4);
  styles[canonical_layer::rail_station]     = make_style("#5A5A5A", 1.5);
  styles[canonical_layer::labels]           = make_style("#000000", 1.0);
  return styles;
}

resolved_styles theme_engine::resolve_styles(const theme &t,
                                             const geographic_context &context,
                                             const style_set &overrides) {
  resolved_styles styles;
  styles.colors = default_palette();
  styles.layers = default_styles();
  bool labels_touched = false;

  apply(t.base, styles, labels_touched);

  const std::string terrain_key = to_string(context.terrain_type);
  std::vector<std::string> keys;
  keys.push_back(terrain_key);
  if (context.season_type != season::none) {
    const std::string season_key = to_string(context.season_type);
    keys.push_back(season_key);
    keys.push_back(terrain_key + ":" + season_key);
  }

  for (const std::string &key : keys) {
    std::map<std::string, style_set>::const_iterator itr = t.variants.find(key);
    if (itr != t.variants.end()) {
      apply(itr->second, styles, labels_touched);
    }
  }

  apply(overrides, styles, labels_touched);

  // labels follow the text color unless somebody styled them directly.
  if (!labels_touched) {
    styles.layers[canonical_layer::labels].fill = styles.colors.text;
    styles.layers[canonical_layer::labels].stroke = styles.colors.text;
  }

  return styles;
}

styled_map theme_engine::resolve(const theme &t, layer_set layers,
                                 const geographic_context &context,
                                 const style_set &overrides) {
  resolved_styles styles = resolve_styles(t, context, overrides);

  styled_map result;
  result.theme_id = t.id;
  result.colors = styles.colors;
  for (render_layer &rl : layers) {
    styled_layer sl;
    sl.layer = rl.layer;
    sl.features = std::move(rl.features);
    sl.style = styles.layers.at(rl.layer);
    result.layers.push_back(std::move(sl));
  }
  return result;
}

} // namespace cartoposter
