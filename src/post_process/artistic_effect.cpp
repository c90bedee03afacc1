#include "post_process/artistic_effect.hpp"
#include "post_process/raster.hpp"

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/normal_distribution.hpp>

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>
#include <opencv2/xphoto.hpp>

#include <stdexcept>

namespace pt = boost::property_tree;

namespace cartoposter {
namespace post_process {

namespace {

int odd_size(pt::ptree const& config, const std::string &key, int def) {
  const int size = config.get<int>(key, def);
  if (size < 1 || (size % 2) == 0) {
    throw std::runtime_error("Post-processing parameter " + key + " must be a positive odd number.");
  }
  return size;
}

double positive(pt::ptree const& config, const std::string &key, double def) {
  const double value = config.get<double>(key, def);
  if (value <= 0.0) {
    throw std::runtime_error("Post-processing parameter " + key + " must be positive.");
  }
  return value;
}

class watercolor : public stage {
public:
  watercolor(pt::ptree const& config)
    : m_diameter(odd_size(config, "diameter", 15)),
      m_sigma_color(positive(config, "sigma_color", 80.0)),
      m_sigma_space(positive(config, "sigma_space", 80.0)),
      m_blur_size(odd_size(config, "blur_size", 3)) {}

  virtual ~watercolor() {}

  virtual void process(mapnik::image_rgba8 &image) const {
    cv::Mat pixels = as_mat(image);
    if (pixels.empty()) { return; }

    const cv::Mat bgr = to_bgr(pixels);
    cv::Mat smooth;
    cv::bilateralFilter(bgr, smooth, m_diameter, m_sigma_color, m_sigma_space);
    if (m_blur_size > 1) {
      cv::GaussianBlur(smooth, smooth, cv::Size(m_blur_size, m_blur_size), 0);
    }
    store_bgr(smooth, pixels);
  }

private:
  int m_diameter;
  double m_sigma_color, m_sigma_space;
  int m_blur_size;
};

class pencil_sketch : public stage {
public:
  pencil_sketch(pt::ptree const& config)
    : m_sigma_s(positive(config, "sigma_s", 60.0)),
      m_sigma_r(config.get<double>("sigma_r", 0.07)),
      m_shade_factor(config.get<double>("shade_factor", 0.08)) {
    if (m_sigma_r <= 0.0 || m_sigma_r > 1.0) {
      throw std::runtime_error("Pencil sketch sigma_r must be above 0 and at most 1.");
    }
    if (m_shade_factor < 0.0 || m_shade_factor > 0.1) {
      throw std::runtime_error("Pencil sketch shade_factor must be between 0 and 0.1.");
    }
  }

  virtual ~pencil_sketch() {}

  virtual void process(mapnik::image_rgba8 &image) const {
    cv::Mat pixels = as_mat(image);
    if (pixels.empty()) { return; }

    cv::Mat grey, colour;
    cv::pencilSketch(to_bgr(pixels), grey, colour,
                     float(m_sigma_s), float(m_sigma_r), float(m_shade_factor));
    store_bgr(colour, pixels);
  }

private:
  double m_sigma_s, m_sigma_r, m_shade_factor;
};

class oil_painting : public stage {
public:
  oil_painting(pt::ptree const& config)
    : m_size(odd_size(config, "size", 5)),
      m_dyn_ratio(config.get<int>("dyn_ratio", 1)) {
    if (m_dyn_ratio < 1) {
      throw std::runtime_error("Oil painting dyn_ratio must be at least 1.");
    }
  }

  virtual ~oil_painting() {}

  virtual void process(mapnik::image_rgba8 &image) const {
    cv::Mat pixels = as_mat(image);
    if (pixels.empty()) { return; }

    cv::Mat painted;
    cv::xphoto::oilPainting(to_bgr(pixels), painted, m_size, m_dyn_ratio);
    store_bgr(painted, pixels);
  }

private:
  int m_size, m_dyn_ratio;
};

class vintage : public stage {
public:
  vintage(pt::ptree const& config)
    : m_sepia(config.get<double>("sepia", 0.2)),
      m_vignette(config.get<bool>("vignette", true)),
      m_noise(config.get<double>("noise", 0.02)),
      m_seed(config.get<unsigned int>("seed", 1)) {
    if (m_sepia < 0.0 || m_sepia > 1.0) {
      throw std::runtime_error("Vintage sepia weight must be between 0 and 1.");
    }
  }

  virtual ~vintage() {}

  virtual void process(mapnik::image_rgba8 &image) const {
    cv::Mat pixels = as_mat(image);
    if (pixels.empty()) { return; }

    if (m_sepia > 0.0) {
      cv::Mat toned = pixels.clone();
      apply_color_matrix(toned, cv::Matx34d(0.393, 0.769, 0.189, 0,
                                            0.349, 0.686, 0.168, 0,
                                            0.272, 0.534, 0.131, 0));
      // alpha is the same in both, so the blend leaves it alone.
      cv::addWeighted(pixels, 1.0 - m_sepia, toned, m_sepia, 0.0, pixels);
    }

    if (!m_vignette && m_noise <= 0.0) { return; }

    const cv::Mat fx = falloff(pixels.cols), fy = falloff(pixels.rows);
    boost::random::mt19937 gen(m_seed);
    boost::random::normal_distribution<double> grain(0.0, m_noise > 0.0 ? m_noise * 255.0 : 1.0);

    // one row at a time in floating point, so the whole poster is never
    // held at more than a byte per channel.
    cv::Mat row;
    for (int y = 0; y < pixels.rows; ++y) {
      cv::Mat target = pixels.row(y);
      target.convertTo(row, CV_32F);
      cv::Vec4f *p = row.ptr<cv::Vec4f>(0);

      for (int x = 0; x < pixels.cols; ++x) {
        const float keep = m_vignette
          ? float(0.7 + 0.3 * fx.at<double>(x) * fy.at<double>(y)) : 1.0f;
        for (int c = 0; c < 3; ++c) {
          p[x][c] *= keep;
          if (m_noise > 0.0) {
            p[x][c] += float(grain(gen));
          }
        }
      }

      row.convertTo(target, CV_8U);
    }
  }

private:
  // gaussian with sigma of half the length, scaled to 1 at its peak.
  static cv::Mat falloff(int length) {
    cv::Mat k = cv::getGaussianKernel(length, 0.5 * length, CV_64F);
    double peak = 0.0;
    cv::minMaxLoc(k, nullptr, &peak);
    return k / peak;
  }

  double m_sepia;
  bool m_vignette;
  double m_noise;
  unsigned int m_seed;
};

} // anonymous namespace

stage_ptr create_watercolor(pt::ptree const& config) {
  return std::make_shared<watercolor>(config);
}

stage_ptr create_pencil_sketch(pt::ptree const& config) {
  return std::make_shared<pencil_sketch>(config);
}

stage_ptr create_oil_painting(pt::ptree const& config) {
  return std::make_shared<oil_painting>(config);
}

stage_ptr create_vintage(pt::ptree const& config) {
  return std::make_shared<vintage>(config);
}

} // namespace post_process
} // namespace cartoposter
