#include "common.hpp"
#include "post_processor.hpp"
#include "post_process/texture_overlay.hpp"
#include "post_process/artistic_effect.hpp"
#include "post_process/color_enhancer.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <mapnik/image_util.hpp>

#include <cstring>
#include <iostream>
#include <sstream>

namespace cp = cartoposter;
namespace pp = cartoposter::post_process;
namespace pt = boost::property_tree;
namespace bfs = boost::filesystem;
using test::json;

namespace {

pt::ptree to_ptree(const json &doc) {
  std::istringstream in(doc.str());
  pt::ptree tree;
  pt::read_json(in, tree);
  return tree;
}

cp::canvas raster_canvas(const mapnik::color &c, unsigned int w = 16, unsigned int h = 16) {
  cp::canvas canvas;
  canvas.width = w;
  canvas.height = h;
  canvas.background = c;
  canvas.image = std::make_shared<mapnik::image_rgba8>(test::solid_image(w, h, c));
  return canvas;
}

unsigned int channel(const mapnik::image_rgba8 &image, unsigned int x, unsigned int y, int shift) {
  return (image.get_row(y)[x] >> shift) & 0xff;
}

bool same_pixels(const mapnik::image_rgba8 &a, const mapnik::image_rgba8 &b) {
  if (a.width() != b.width() || a.height() != b.height()) { return false; }
  for (unsigned int y = 0; y < a.height(); ++y) {
    if (std::memcmp(a.get_row(y), b.get_row(y), a.width() * 4) != 0) { return false; }
  }
  return true;
}

// a black texture, saved as PNG.
void write_texture(const bfs::path &path) {
  bfs::create_directories(path.parent_path());
  mapnik::save_to_file(test::solid_image(4, 4, mapnik::color(0, 0, 0)), path.string(), "png");
}

// a diagonal gradient, so that effects have something to work on.
mapnik::image_rgba8 gradient_image(unsigned int w, unsigned int h) {
  mapnik::image_rgba8 image(w, h);
  for (unsigned int y = 0; y < h; ++y) {
    std::uint32_t *row = image.get_row(y);
    for (unsigned int x = 0; x < w; ++x) {
      const std::uint32_t r = 50 + (150 * x) / (w - 1);
      const std::uint32_t g = 50 + (150 * y) / (h - 1);
      const std::uint32_t b = 120;
      row[x] = (0xffu << 24) | (b << 16) | (g << 8) | r;
    }
  }
  return image;
}

void test_nothing_requested() {
  cp::post_processor post;
  cp::canvas c = raster_canvas(mapnik::color(10, 20, 30));
  const mapnik::image_rgba8 before = *c.image;
  std::vector<cp::warning> warnings;

  post.process(c, cp::poster_spec(), warnings);
  test::assert_equal<bool>(same_pixels(*c.image, before), true, "untouched");
  test::assert_equal<size_t>(warnings.size(), 0, "no warnings");
}

void test_vector_canvas_skipped() {
  cp::post_processor post;
  cp::canvas c;
  c.width = c.height = 10;
  cp::poster_spec spec;
  spec.format = cp::output_format::pdf;
  spec.effect = cp::artistic_effect::vintage;
  std::vector<cp::warning> warnings;

  post.process(c, spec, warnings);
  test::assert_equal<size_t>(warnings.size(), 1, "one warning");
  test::assert_equal<cp::error_kind>(warnings[0].kind, cp::error_kind::asset_missing, "kind");
}

void test_missing_texture_warns_and_continues() {
  test::temp_dir dir;
  cp::post_processor post(dir.path().string());
  cp::canvas c = raster_canvas(mapnik::color(100, 100, 100));
  cp::poster_spec spec;
  spec.texture = std::string("paper");
  spec.enhancement = cp::color_enhancement::seasonal_winter;
  std::vector<cp::warning> warnings;

  post.process(c, spec, warnings);
  test::assert_equal<size_t>(warnings.size(), 1, "one warning");
  test::assert_equal<cp::error_kind>(warnings[0].kind, cp::error_kind::asset_missing, "kind");
  test::assert_greater_or_equal<unsigned int>(channel(*c.image, 3, 3, 16), 110,
                                              "enhancement still ran");
}

void test_texture_blend() {
  test::temp_dir dir;
  write_texture(dir.path() / "base" / "paper.png");

  cp::post_processor post(dir.path().string());
  post.load(to_ptree(json()("texture", json()("intensity", 0.5))));

  cp::canvas c = raster_canvas(mapnik::color(255, 255, 255));
  cp::poster_spec spec;
  spec.texture = std::string("paper");
  std::vector<cp::warning> warnings;
  post.process(c, spec, warnings);

  test::assert_equal<size_t>(warnings.size(), 0, "texture found");
  // (255 * 0.5 + 0 * 0.5) * 1.1, and contrast leaves a flat image alone.
  test::assert_greater_or_equal<unsigned int>(channel(*c.image, 8, 8, 0), 139, "blended");
  test::assert_less_or_equal<unsigned int>(channel(*c.image, 8, 8, 0), 141, "blended");
  test::assert_equal<unsigned int>(channel(*c.image, 8, 8, 24), 255, "alpha kept");
}

void test_find_texture() {
  test::temp_dir dir;
  write_texture(dir.path() / "stains" / "coffee.jpg");
  write_texture(dir.path() / "grain.png");
  write_texture(dir.path() / "library" / "linen-01.png");
  test::write_file(dir.path() / "manifest.json",
                   json()("categories", json()
                          ("fabric", json()("textures", json()
                            [json()("filename", "linen.png")("path", "library/linen-01.png")]))).str());

  boost::optional<bfs::path> coffee = pp::find_texture(dir.path(), "coffee");
  test::assert_equal<bool>(bool(coffee), true, "found in a sub-directory");
  test::assert_equal<std::string>(coffee->filename().string(), "coffee.jpg", "right file");

  test::assert_equal<bool>(bool(pp::find_texture(dir.path(), "grain")), true, "found at the top");

  boost::optional<bfs::path> linen = pp::find_texture(dir.path(), "linen");
  test::assert_equal<bool>(bool(linen), true, "found through the manifest");
  test::assert_equal<std::string>(linen->filename().string(), "linen-01.png", "manifest path");

  test::assert_equal<bool>(bool(pp::find_texture(dir.path(), "canvas")), false, "missing");
  test::assert_equal<bool>(bool(pp::find_texture(dir.path() / "nope", "coffee")), false, "no directory");
}

void test_mixed_case_texture_found() {
  test::temp_dir dir;
  write_texture(dir.path() / "artistic" / "Paper_Grain.png");

  boost::optional<bfs::path> found = pp::find_texture(dir.path(), "Paper_Grain");
  test::assert_equal<bool>(bool(found), true, "found by its own name");
  test::assert_equal<std::string>(found->filename().string(), "Paper_Grain.png", "right file");

  cp::post_processor post(dir.path().string());
  cp::canvas c = raster_canvas(mapnik::color(255, 255, 255));
  cp::poster_spec spec;
  spec.texture = std::string("Paper_Grain");
  std::vector<cp::warning> warnings;
  post.process(c, spec, warnings);
  test::assert_equal<size_t>(warnings.size(), 0, "applied");
  test::assert_less_or_equal<unsigned int>(channel(*c.image, 8, 8, 0), 254, "darkened by the texture");
}

void test_unreadable_texture_warns() {
  test::temp_dir dir;
  test::write_file(dir.path() / "paper.png", "not really a png");

  cp::post_processor post(dir.path().string());
  cp::canvas c = raster_canvas(mapnik::color(200, 200, 200));
  cp::poster_spec spec;
  spec.texture = std::string("paper");
  std::vector<cp::warning> warnings;
  post.process(c, spec, warnings);

  test::assert_equal<size_t>(warnings.size(), 1, "one warning");
  test::assert_equal<unsigned int>(channel(*c.image, 0, 0, 0), 200, "image untouched");
}

void test_bad_config_keeps_previous() {
  cp::post_processor post;
  post.load(to_ptree(json()("seasonal_autumn", json()("red", 2.0))));

  bool thrown = false;
  try {
    post.load(to_ptree(json()("sparkle", json()("amount", 1))));
  } catch (const std::runtime_error &) {
    thrown = true;
  }
  test::assert_equal<bool>(thrown, true, "unknown stage");

  thrown = false;
  try {
    post.load(to_ptree(json()("texture", json()("intensity", 2.5))));
  } catch (const std::runtime_error &) {
    thrown = true;
  }
  test::assert_equal<bool>(thrown, true, "intensity out of range");

  thrown = false;
  try {
    post.load(to_ptree(json()("watercolor", json()("blur_size", 4))));
  } catch (const std::runtime_error &) {
    thrown = true;
  }
  test::assert_equal<bool>(thrown, true, "even kernel size");

  // the autumn configuration from before is still in force.
  cp::canvas c = raster_canvas(mapnik::color(100, 100, 100));
  cp::poster_spec spec;
  spec.enhancement = cp::color_enhancement::seasonal_autumn;
  std::vector<cp::warning> warnings;
  post.process(c, spec, warnings);
  test::assert_equal<unsigned int>(channel(*c.image, 0, 0, 0), 200, "configured red multiplier");
}

void test_every_stage_configurable() {
  cp::post_processor post;
  post.load(to_ptree(json()
                     ("texture", json()("intensity", 0.2))
                     ("watercolor", json()("blur_size", 5))
                     ("pencil_sketch", json()("shade_factor", 0.05))
                     ("oil_painting", json()("size", 3))
                     ("vintage", json()("noise", 0))
                     ("intelligent_palette", json()("cutoff", 2))
                     ("geographic_colors", json()("saturation", 1.2))
                     ("seasonal_spring", json()("green", 1.1))
                     ("seasonal_summer", json()("red", 1.0))
                     ("seasonal_autumn", json()("red", 1.3))
                     ("seasonal_winter", json()("desaturate", 0.5))));

  cp::canvas c = raster_canvas(mapnik::color(100, 100, 100));
  cp::poster_spec spec;
  spec.effect = cp::artistic_effect::oil_painting;
  spec.enhancement = cp::color_enhancement::seasonal_autumn;
  std::vector<cp::warning> warnings;
  post.process(c, spec, warnings);
  test::assert_equal<unsigned int>(channel(*c.image, 0, 0, 0), 130, "configured autumn red");
  test::assert_equal<size_t>(warnings.size(), 0, "no warnings");
}

void test_seasonal_shifts() {
  mapnik::image_rgba8 winter = test::solid_image(4, 4, mapnik::color(100, 100, 100));
  pp::create_seasonal_winter(pt::ptree())->process(winter);
  test::assert_greater_or_equal<unsigned int>(channel(winter, 0, 0, 16), channel(winter, 0, 0, 0) + 10,
                                              "winter is bluer");

  mapnik::image_rgba8 autumn = test::solid_image(4, 4, mapnik::color(100, 100, 100));
  pp::create_seasonal_autumn(pt::ptree())->process(autumn);
  test::assert_equal<unsigned int>(channel(autumn, 0, 0, 0), 120, "autumn red");
  test::assert_equal<unsigned int>(channel(autumn, 0, 0, 8), 90, "autumn green");

  mapnik::image_rgba8 summer = test::solid_image(4, 4, mapnik::color(250, 100, 100));
  pp::create_seasonal_summer(pt::ptree())->process(summer);
  test::assert_equal<unsigned int>(channel(summer, 0, 0, 0), 255, "clamped");
  test::assert_equal<unsigned int>(channel(summer, 0, 0, 8), 110, "summer green");
}

void test_intelligent_palette_stretches() {
  mapnik::image_rgba8 image = gradient_image(32, 32);
  pp::create_intelligent_palette(to_ptree(json()("cutoff", 0)))->process(image);

  test::assert_equal<unsigned int>(channel(image, 0, 0, 0), 0, "darkest red stretched to 0");
  test::assert_equal<unsigned int>(channel(image, 31, 0, 0), 255, "lightest red stretched to 255");
  test::assert_equal<unsigned int>(channel(image, 0, 31, 8), 255, "lightest green stretched to 255");
  test::assert_equal<unsigned int>(channel(image, 5, 5, 16), 120, "flat blue left alone");
}

void test_geographic_colors_identity() {
  mapnik::image_rgba8 image = gradient_image(8, 8);
  const mapnik::image_rgba8 before = image;
  pp::create_geographic_colors(to_ptree(json()("saturation", 1.0)("contrast", 1.0)))->process(image);
  test::assert_equal<bool>(same_pixels(image, before), true, "no-op factors change nothing");

  pp::create_geographic_colors(pt::ptree())->process(image);
  test::assert_equal<bool>(same_pixels(image, before), false, "defaults do something");
}

void test_effects_keep_flat_images_flat() {
  const mapnik::color grey(128, 128, 128);
  const pp::stage_ptr stages[] = {
    pp::create_watercolor(pt::ptree()),
    pp::create_oil_painting(pt::ptree()),
  };
  for (const pp::stage_ptr &s : stages) {
    mapnik::image_rgba8 image = test::solid_image(12, 12, grey);
    s->process(image);
    test::assert_equal<std::string>(test::pixel_hex(image, 0, 0), test::color_hex(grey), "corner");
    test::assert_equal<std::string>(test::pixel_hex(image, 6, 6), test::color_hex(grey), "middle");
  }
}

void test_pencil_sketch_draws() {
  mapnik::image_rgba8 a = gradient_image(24, 24);
  // a dark block gives the sketch an edge to draw.
  for (unsigned int y = 8; y < 16; ++y) {
    for (unsigned int x = 8; x < 16; ++x) {
      a.get_row(y)[x] = (0xffu << 24) | (0x20u << 16) | (0x20u << 8) | 0x20u;
    }
  }
  const mapnik::image_rgba8 before = a;
  mapnik::image_rgba8 b = a;

  pp::create_pencil_sketch(pt::ptree())->process(a);
  pp::create_pencil_sketch(pt::ptree())->process(b);
  test::assert_equal<bool>(same_pixels(a, before), false, "sketched");
  test::assert_equal<bool>(same_pixels(a, b), true, "same sketch every time");
  test::assert_equal<unsigned int>(channel(a, 12, 12, 24), 255, "alpha kept");
}

void test_effect_parameters_checked() {
  const char *bad[][2] = {
    { "pencil_sketch", "shade_factor" },
    { "pencil_sketch", "sigma_r" },
    { "oil_painting", "dyn_ratio" },
    { "vintage", "sepia" },
  };
  for (const auto &entry : bad) {
    cp::post_processor post;
    bool thrown = false;
    try {
      post.load(to_ptree(json()(entry[0], json()(entry[1], -1))));
    } catch (const std::runtime_error &) {
      thrown = true;
    }
    test::assert_equal<bool>(thrown, true, std::string(entry[0]) + " " + entry[1]);
  }
}

void test_large_canvas_in_place() {
  // the stages work on the image's own buffer: the pixel memory is the
  // same before and after, and a print-sized canvas fits.
  mapnik::image_rgba8 image = test::solid_image(3000, 2000, mapnik::color(100, 100, 100));
  const unsigned char *data = image.bytes();
  pp::create_seasonal_autumn(pt::ptree())->process(image);
  pp::create_geographic_colors(pt::ptree())->process(image);
  test::assert_equal<bool>(image.bytes() == data, true, "same buffer");
  test::assert_equal<unsigned int>(image.width(), 3000, "width");
  test::assert_not_equal<std::string>(test::pixel_hex(image, 2999, 1999),
                                      test::color_hex(mapnik::color(100, 100, 100)), "changed");
}

void test_vintage_is_seeded() {
  mapnik::image_rgba8 a = gradient_image(20, 20);
  mapnik::image_rgba8 b = gradient_image(20, 20);
  pp::create_vintage(pt::ptree())->process(a);
  pp::create_vintage(pt::ptree())->process(b);
  test::assert_equal<bool>(same_pixels(a, b), true, "same grain every time");

  // the vignette darkens the corners more than the middle.
  mapnik::image_rgba8 flat = test::solid_image(21, 21, mapnik::color(200, 200, 200));
  pp::create_vintage(to_ptree(json()("noise", 0)("sepia", 0)))->process(flat);
  test::assert_less_or_equal<unsigned int>(channel(flat, 0, 0, 0), channel(flat, 10, 10, 0),
                                           "corner darker");
  test::assert_equal<unsigned int>(channel(flat, 10, 10, 0), 200, "center untouched");
}

void test_stage_order() {
  // the texture goes on first and the colour shift applies to the
  // blended result. shifting first would clip 250 * 1.1 to 255 and end
  // up at 128.
  test::temp_dir dir;
  write_texture(dir.path() / "paper.png");
  cp::post_processor post(dir.path().string());
  post.load(to_ptree(json()("texture", json()("intensity", 0.5)("brightness", 1.0)("contrast", 1.0))));

  cp::canvas c = raster_canvas(mapnik::color(250, 250, 250));
  cp::poster_spec spec;
  spec.texture = std::string("paper");
  spec.enhancement = cp::color_enhancement::seasonal_summer;
  std::vector<cp::warning> warnings;
  post.process(c, spec, warnings);

  // 250 * 0.5 = 125, then 125 * 1.1.
  test::assert_equal<unsigned int>(channel(*c.image, 4, 4, 0), 138, "red");
  test::assert_equal<size_t>(warnings.size(), 0, "no warnings");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing post-processing ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }
  RUN_TEST(test_nothing_requested);
  RUN_TEST(test_vector_canvas_skipped);
  RUN_TEST(test_missing_texture_warns_and_continues);
  RUN_TEST(test_texture_blend);
  RUN_TEST(test_find_texture);
  RUN_TEST(test_mixed_case_texture_found);
  RUN_TEST(test_unreadable_texture_warns);
  RUN_TEST(test_bad_config_keeps_previous);
  RUN_TEST(test_every_stage_configurable);
  RUN_TEST(test_seasonal_shifts);
  RUN_TEST(test_intelligent_palette_stretches);
  RUN_TEST(test_geographic_colors_identity);
  RUN_TEST(test_effects_keep_flat_images_flat);
  RUN_TEST(test_pencil_sketch_draws);
  RUN_TEST(test_effect_parameters_checked);
  RUN_TEST(test_large_canvas_in_place);
  RUN_TEST(test_vintage_is_seeded);
  RUN_TEST(test_stage_order);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
