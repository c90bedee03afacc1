#include "post_process/texture_overlay.hpp"
#include "post_process/raster.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <mapnik/image_reader.hpp>

#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>

namespace bfs = boost::filesystem;
namespace pt = boost::property_tree;

namespace cartoposter {
namespace post_process {

namespace {

const char *SEARCH_DIRS[] = { "base", "specialty", "artistic", "edges", "stains", "" };
const char *SEARCH_EXTENSIONS[] = { ".jpg", ".png", ".jpeg" };

boost::optional<bfs::path> from_manifest(const bfs::path &texture_dir, const std::string &name) {
  const bfs::path manifest = texture_dir / "manifest.json";
  if (!bfs::is_regular_file(manifest)) {
    return boost::none;
  }

  pt::ptree doc;
  try {
    pt::read_json(manifest.string(), doc);
  } catch (const pt::ptree_error &e) {
    spdlog::warn("Ignoring unreadable texture manifest {}: {}", manifest.string(), e.what());
    return boost::none;
  }

  boost::optional<pt::ptree &> categories = doc.get_child_optional("categories");
  if (!categories) {
    return boost::none;
  }

  for (auto &category : *categories) {
    boost::optional<pt::ptree &> textures = category.second.get_child_optional("textures");
    if (!textures) { continue; }

    for (auto &entry : *textures) {
      const std::string filename = entry.second.get<std::string>("filename", "");
      if (bfs::path(filename).stem().string() != name) { continue; }

      const std::string relative = entry.second.get<std::string>("path", filename);
      const bfs::path candidate = texture_dir / relative;
      if (bfs::is_regular_file(candidate)) {
        return candidate;
      }
    }
  }

  return boost::none;
}

class texture_overlay : public stage {
public:
  texture_overlay(pt::ptree const& config);
  virtual ~texture_overlay() {}

  virtual void process(mapnik::image_rgba8 &image) const;

private:
  cv::Mat m_texture;
  double m_intensity, m_brightness, m_contrast;
};

texture_overlay::texture_overlay(pt::ptree const& config)
  : m_intensity(config.get<double>("intensity", 0.3)),
    m_brightness(config.get<double>("brightness", 1.1)),
    m_contrast(config.get<double>("contrast", 1.1)) {

  const std::string path = config.get<std::string>("path");
  if (m_intensity < 0.0 || m_intensity > 1.0) {
    throw std::runtime_error("Texture intensity must be between 0 and 1.");
  }

  std::unique_ptr<mapnik::image_reader> reader(mapnik::get_image_reader(path));
  if (!reader) {
    throw std::runtime_error("Unable to read texture image " + path);
  }

  mapnik::image_rgba8 texture(reader->width(), reader->height());
  reader->read(0, 0, texture);
  if (texture.width() == 0 || texture.height() == 0) {
    throw std::runtime_error("Texture image " + path + " is empty.");
  }
  m_texture = as_mat(texture).clone();
}

void texture_overlay::process(mapnik::image_rgba8 &image) const {
  cv::Mat pixels = as_mat(image);
  if (pixels.empty()) { return; }

  cv::Mat alpha;
  cv::extractChannel(pixels, alpha, 3);

  // the texture is stretched over the whole poster.
  cv::Mat texture;
  cv::resize(m_texture, texture, pixels.size(), 0, 0, cv::INTER_LINEAR);
  cv::addWeighted(pixels, 1.0 - m_intensity, texture, m_intensity, 0.0, pixels);
  cv::insertChannel(alpha, pixels, 3);

  // brightness is applied to the stored 8-bit values before contrast.
  scale_channels(pixels, m_brightness, m_brightness, m_brightness);
  adjust_contrast(pixels, m_contrast);
}

} // anonymous namespace

boost::optional<bfs::path> find_texture(const bfs::path &texture_dir, const std::string &name) {
  if (name.empty() || !bfs::is_directory(texture_dir)) {
    return boost::none;
  }

  boost::optional<bfs::path> found = from_manifest(texture_dir, name);
  if (found) {
    return found;
  }

  for (const char *dir : SEARCH_DIRS) {
    for (const char *ext : SEARCH_EXTENSIONS) {
      const bfs::path candidate = texture_dir / dir / (name + ext);
      if (bfs::is_regular_file(candidate)) {
        return candidate;
      }
    }
  }

  return boost::none;
}

stage_ptr create_texture_overlay(pt::ptree const& config) {
  return std::make_shared<texture_overlay>(config);
}

} // namespace post_process
} // namespace cartoposter
