#include "request.hpp"
#include "error.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>

namespace bpt = boost::property_tree;

#define MAX_CITY_LENGTH (100)
#define MAX_COUNTRY_LENGTH (100)
#define MAX_STATE_LENGTH (50)

#define MIN_DIMENSION (4.0)
#define MAX_DIMENSION (48.0)
#define MAX_AREA (1000.0)

#define MIN_RADIUS (1000.0)
#define MAX_RADIUS (500000.0)

#define MIN_DPI (10)
#define MAX_DPI (1200)

namespace cartoposter {

namespace {

poster_error invalid(const std::string &message) {
  return poster_error(error_kind::invalid_request, message);
}

// length in code points, assuming UTF-8.
size_t utf8_length(const std::string &s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xc0) != 0x80) { ++n; }
  }
  return n;
}

std::string check_name(const std::string &value, const char *field, size_t max_length, bool required) {
  const std::string name = boost::algorithm::trim_copy(value);

  if (name.empty()) {
    if (required) {
      throw invalid((boost::format("%1% cannot be empty") % field).str());
    }
    return name;
  }
  if (utf8_length(name) > max_length) {
    throw invalid((boost::format("%1% is too long (maximum %2% characters)") % field % max_length).str());
  }
  for (unsigned char c : name) {
    if (c < 32 || c == 127) {
      throw invalid((boost::format("%1% contains invalid control characters") % field).str());
    }
  }
  if (name.find("..") != std::string::npos || name.find("//") != std::string::npos ||
      name.find('\\') != std::string::npos) {
    throw invalid((boost::format("%1% contains invalid characters") % field).str());
  }
  return name;
}

// "none" and empty both mean nothing was asked for.
boost::optional<std::string> optional_choice(const std::string &value) {
  const std::string v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
  if (v.empty() || v == "none") {
    return boost::none;
  }
  return v;
}

// like optional_choice, but a name keeps its case.
boost::optional<std::string> optional_name(const std::string &value) {
  const std::string v = boost::algorithm::trim_copy(value);
  if (v.empty() || boost::algorithm::iequals(v, "none")) {
    return boost::none;
  }
  return v;
}

template <typename T>
T get_value(const bpt::ptree &doc, const std::string &key, const T &def) {
  try {
    return doc.get<T>(key, def);

  } catch (const bpt::ptree_bad_data &) {
    throw invalid((boost::format("Invalid value for %1%: \"%2%\"") % key % doc.get<std::string>(key, "")).str());
  }
}

} // anonymous namespace

generation_request::generation_request()
  : location(), theme("feature_based"), radius(10000.0), width(12.0), height(16.0),
    format("png"), font(), texture("none"), shape("rectangle"),
    effect("none"), enhancement("none"), overrides(), season(), country_label(), dpi() {
}

generation_request parse_request(const bpt::ptree &doc) {
  generation_request r;

  r.location.city = get_value<std::string>(doc, "location.city", "");
  r.location.country = get_value<std::string>(doc, "location.country", "");
  r.location.state = doc.get_optional<std::string>("location.state");

  r.theme = get_value(doc, "theme", r.theme);
  r.radius = get_value(doc, "distanceRadius", r.radius);
  r.width = get_value(doc, "posterWidth", r.width);
  r.height = get_value(doc, "posterHeight", r.height);
  r.format = get_value(doc, "outputFormat", r.format);
  r.font = get_value(doc, "font", r.font);
  r.texture = get_value(doc, "texture", r.texture);
  r.shape = get_value(doc, "mapShape", r.shape);
  r.effect = get_value(doc, "artisticEffect", r.effect);
  r.enhancement = get_value(doc, "colorEnhancement", r.enhancement);

  boost::optional<const bpt::ptree &> overrides = doc.get_child_optional("perLayerStyleOverrides");
  if (overrides) {
    r.overrides = *overrides;
  }

  r.season = doc.get_optional<std::string>("season");
  r.country_label = doc.get_optional<std::string>("countryLabel");
  if (doc.get_child_optional("dpi")) {
    r.dpi = get_value<unsigned int>(doc, "dpi", 0);
  }

  return r;
}

validated_request validate(const generation_request &request, unsigned int default_dpi) {
  validated_request v;

  v.location.city = check_name(request.location.city, "City", MAX_CITY_LENGTH, true);
  v.location.country = check_name(request.location.country, "Country", MAX_COUNTRY_LENGTH, false);
  if (request.location.state) {
    const std::string state = check_name(*request.location.state, "State", MAX_STATE_LENGTH, false);
    if (!state.empty()) {
      v.location.state = state;
    }
  }

  v.theme = boost::algorithm::trim_copy(request.theme);
  if (v.theme.empty() || v.theme[0] == '.' || v.theme.find_first_of("/\\") != std::string::npos) {
    throw invalid((boost::format("Invalid theme name \"%1%\"") % request.theme).str());
  }

  const double w = request.width, h = request.height;
  if (!(w >= MIN_DIMENSION && h >= MIN_DIMENSION)) {
    throw invalid((boost::format("Dimensions must be at least %1% inches") % MIN_DIMENSION).str());
  }
  if (w > MAX_DIMENSION || h > MAX_DIMENSION) {
    throw invalid((boost::format("Dimensions cannot exceed %1% inches") % MAX_DIMENSION).str());
  }
  if (w * h > MAX_AREA) {
    throw invalid((boost::format("Total poster area cannot exceed %1% square inches") % MAX_AREA).str());
  }

  if (!(request.radius >= MIN_RADIUS)) {
    throw invalid((boost::format("Distance must be at least %1% meters") % MIN_RADIUS).str());
  }
  if (request.radius > MAX_RADIUS) {
    throw invalid((boost::format("Distance cannot exceed %1% meters") % MAX_RADIUS).str());
  }
  v.radius = request.radius;

  poster_spec &spec = v.spec;
  spec.width = w;
  spec.height = h;
  spec.dpi = request.dpi ? *request.dpi : default_dpi;
  if (spec.dpi < MIN_DPI || spec.dpi > MAX_DPI) {
    throw invalid((boost::format("DPI must be between %1% and %2%") % MIN_DPI % MAX_DPI).str());
  }

  boost::optional<output_format> format =
    format_from_string(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(request.format)));
  if (!format) {
    throw invalid((boost::format("Invalid output format \"%1%\". Must be one of: png, jpg, jpeg, svg, pdf")
                   % request.format).str());
  }
  spec.format = *format;

  boost::optional<map_shape> shape =
    shape_from_string(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(request.shape)));
  if (!shape) {
    throw invalid((boost::format("Invalid map shape \"%1%\". Must be one of: rectangle, circle, triangle")
                   % request.shape).str());
  }
  spec.shape = *shape;

  // left empty for the theme's font, or the default, to fill in.
  spec.font = boost::algorithm::trim_copy(request.font);

  boost::optional<std::string> texture = optional_name(request.texture);
  if (texture) {
    spec.texture = check_name(*texture, "Texture", MAX_CITY_LENGTH, true);
    if (spec.texture->find('/') != std::string::npos) {
      throw invalid((boost::format("Invalid texture name \"%1%\"") % request.texture).str());
    }
  }

  boost::optional<std::string> effect = optional_choice(request.effect);
  if (effect) {
    spec.effect = effect_from_string(*effect);
    if (!spec.effect) {
      throw invalid((boost::format("Invalid artistic effect \"%1%\". Must be one of: %2%")
                     % request.effect % boost::algorithm::join(effect_names(), ", ")).str());
    }
  }

  boost::optional<std::string> enhancement = optional_choice(request.enhancement);
  if (enhancement) {
    spec.enhancement = enhancement_from_string(*enhancement);
    if (!spec.enhancement) {
      throw invalid((boost::format("Invalid color enhancement \"%1%\". Must be one of: %2%")
                     % request.enhancement % boost::algorithm::join(enhancement_names(), ", ")).str());
    }
  }

  v.season_type = season::none;
  if (request.season) {
    boost::optional<std::string> s = optional_choice(*request.season);
    if (s) {
      boost::optional<season> parsed = season_from_string(*s);
      if (!parsed) {
        throw invalid((boost::format("Invalid season \"%1%\"") % *request.season).str());
      }
      v.season_type = *parsed;
    }
  }

  v.country_label = v.location.country;
  if (request.country_label) {
    v.country_label = check_name(*request.country_label, "Country label", MAX_COUNTRY_LENGTH, false);
  }

  try {
    v.overrides = theme_engine::parse_overrides(request.overrides);

  } catch (const poster_error &e) {
    throw invalid(e.what());
  }

  return v;
}

} // namespace cartoposter
