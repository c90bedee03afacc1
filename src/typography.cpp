#include "typography.hpp"

#include <boost/format.hpp>
#include <unicode/unistr.h>

#include <algorithm>
#include <cmath>

// title block sizes, in points, for a poster 12 inches wide.
#define BASE_MAIN (60.0)
#define BASE_SUB (22.0)
#define BASE_COORDS (14.0)
#define BASE_ATTR (8.0)
#define REFERENCE_WIDTH (12.0)

// the title starts shrinking beyond this many characters.
#define TITLE_LENGTH_LIMIT (10)

namespace cartoposter {

namespace {

const char *weight_name(font_weight w) {
  switch (w) {
  case font_weight::bold:    return "Bold";
  case font_weight::regular: return "Regular";
  case font_weight::light:   return "Light";
  }
  return "Regular";
}

// the face names a weight goes by in a family, best first.
std::vector<std::string> candidates(const std::string &family, font_weight w) {
  std::vector<std::string> names;
  names.push_back(family + " " + weight_name(w));
  if (w == font_weight::regular) {
    names.push_back(family + " Book");
    names.push_back(family);
  } else if (w == font_weight::light) {
    names.push_back(family + " ExtraLight");
    names.push_back(family + " Book");
    names.push_back(family + " Regular");
  }
  return names;
}

boost::optional<std::string> find_face(const std::string &family, font_weight w,
                                       const std::vector<std::string> &available) {
  for (const std::string &name : candidates(family, w)) {
    if (std::find(available.begin(), available.end(), name) != available.end()) {
      return name;
    }
  }
  return boost::none;
}

std::string upper(const std::string &s) {
  std::string out;
  icu::UnicodeString::fromUTF8(s).toUpper().toUTF8String(out);
  return out;
}

} // anonymous namespace

std::string spaced_title(const std::string &city) {
  const icu::UnicodeString title = icu::UnicodeString::fromUTF8(city).toUpper();

  icu::UnicodeString spaced;
  for (int32_t i = 0; i < title.length(); i = title.moveIndex32(i, 1)) {
    if (!spaced.isEmpty()) {
      spaced.append(icu::UnicodeString("  "));
    }
    spaced.append(title.char32At(i));
  }

  std::string out;
  spaced.toUTF8String(out);
  return out;
}

text_layout layout_text(const poster_text &text, unsigned int width, unsigned int height,
                        double width_inches, unsigned int dpi) {
  const double scale = width_inches / REFERENCE_WIDTH;
  // points to pixels.
  const double px = scale * dpi / 72.0;

  const int32_t city_length = icu::UnicodeString::fromUTF8(text.city).countChar32();
  double main_size = BASE_MAIN * scale;
  if (city_length > TITLE_LENGTH_LIMIT) {
    main_size = std::max(main_size * TITLE_LENGTH_LIMIT / city_length, 10.0 * scale);
  }
  main_size *= dpi / 72.0;

  // positions are fractions of the height measured up from the bottom.
  const double w = width, h = height;
  text_layout layout;

  text_element title = { "title", spaced_title(text.city), 0.5 * w, (1.0 - 0.14) * h,
                         main_size, font_weight::bold, 1.0 };
  text_element country = { "country", upper(text.country), 0.5 * w, (1.0 - 0.10) * h,
                           BASE_SUB * px, font_weight::light, 1.0 };
  text_element coords = { "coordinates", format_coordinate(text.center), 0.5 * w, (1.0 - 0.07) * h,
                          BASE_COORDS * px, font_weight::regular, 0.7 };
  layout.elements.push_back(title);
  layout.elements.push_back(country);
  layout.elements.push_back(coords);

  if (!text.attribution.empty()) {
    text_element attribution = { "attribution", text.attribution, 0.88 * w, (1.0 - 0.02) * h,
                                 BASE_ATTR * px, font_weight::light, 0.5 };
    layout.elements.push_back(attribution);
  }

  layout.divider_x0 = 0.4 * w;
  layout.divider_x1 = 0.6 * w;
  layout.divider_y = (1.0 - 0.125) * h;
  layout.divider_width = std::max(1.0 * px, 0.5);

  return layout;
}

const std::string &font_faces::face_for(font_weight w) const {
  switch (w) {
  case font_weight::bold:    return bold;
  case font_weight::light:   return light;
  case font_weight::regular: return regular;
  }
  return regular;
}

boost::optional<font_faces> resolve_fonts(const std::string &family,
                                          const std::vector<std::string> &available,
                                          std::vector<warning> &warnings) {
  if (available.empty()) {
    warning w;
    w.kind = error_kind::asset_missing;
    w.message = "No font faces are available; skipping text.";
    warnings.push_back(w);
    return boost::none;
  }

  font_faces faces;
  bool fell_back = false;
  for (font_weight weight : { font_weight::bold, font_weight::regular, font_weight::light }) {
    boost::optional<std::string> face = find_face(family, weight, available);
    if (!face) {
      fell_back = true;
      face = find_face("DejaVu Sans", weight, available);
    }
    if (!face) {
      face = available.front();
    }

    switch (weight) {
    case font_weight::bold:    faces.bold = *face; break;
    case font_weight::regular: faces.regular = *face; break;
    case font_weight::light:   faces.light = *face; break;
    }
  }

  if (fell_back) {
    warning w;
    w.kind = error_kind::asset_missing;
    w.message = (boost::format("Font \"%1%\" is not available; using a fallback face.") % family).str();
    warnings.push_back(w);
  }

  return faces;
}

} // namespace cartoposter
