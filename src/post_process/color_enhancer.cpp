#include "post_process/color_enhancer.hpp"
#include "post_process/raster.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <stdexcept>

namespace pt = boost::property_tree;

namespace cartoposter {
namespace post_process {

namespace {

class intelligent_palette : public stage {
public:
  intelligent_palette(pt::ptree const& config)
    : m_cutoff(config.get<double>("cutoff", 1.0)) {
    if (m_cutoff < 0.0 || m_cutoff >= 50.0) {
      throw std::runtime_error("Auto-contrast cutoff must be at least 0 and under 50 percent.");
    }
  }

  virtual ~intelligent_palette() {}

  virtual void process(mapnik::image_rgba8 &image) const {
    cv::Mat pixels = as_mat(image);
    if (pixels.empty()) { return; }

    // one table per channel, alpha maps to itself.
    cv::Mat lut(1, 256, CV_8UC4);
    cv::Vec4b *entry = lut.ptr<cv::Vec4b>(0);
    for (int c = 0; c < 4; ++c) {
      int lo = 0, hi = 255;
      if (c < 3) {
        stretch_range(pixels, c, lo, hi);
      }
      const double scale = 255.0 / (hi - lo);
      for (int v = 0; v < 256; ++v) {
        entry[v][c] = cv::saturate_cast<uchar>((v - lo) * scale);
      }
    }

    cv::Mat out;
    cv::LUT(pixels, lut, out);
    out.copyTo(pixels);
  }

private:
  // the darkest and lightest values left after dropping `cutoff`
  // percent of the pixels from each end. a flat channel keeps 0-255.
  void stretch_range(const cv::Mat &pixels, int c, int &lo, int &hi) const {
    cv::Mat histogram;
    const int channels[] = { c };
    const int bins[] = { 256 };
    const float range[] = { 0.0f, 256.0f };
    const float *ranges[] = { range };
    cv::calcHist(&pixels, 1, channels, cv::Mat(), histogram, 1, bins, ranges);

    const double cut = std::floor(double(pixels.total()) * m_cutoff / 100.0);
    int low = 0, high = 255;
    double seen = 0.0;
    for (; low < 255; ++low) {
      seen += histogram.at<float>(low);
      if (seen > cut) { break; }
    }
    seen = 0.0;
    for (; high > 0; --high) {
      seen += histogram.at<float>(high);
      if (seen > cut) { break; }
    }

    if (high > low) {
      lo = low;
      hi = high;
    }
  }

  double m_cutoff;
};

class geographic_colors : public stage {
public:
  geographic_colors(pt::ptree const& config)
    : m_saturation(config.get<double>("saturation", 1.4)),
      m_contrast(config.get<double>("contrast", 1.1)) {}

  virtual ~geographic_colors() {}

  virtual void process(mapnik::image_rgba8 &image) const {
    cv::Mat pixels = as_mat(image);
    // contrast works from the saturated 8-bit image.
    adjust_saturation(pixels, m_saturation);
    adjust_contrast(pixels, m_contrast);
  }

private:
  double m_saturation, m_contrast;
};

struct channel_shift {
  double red, green, blue, desaturate;
};

class seasonal : public stage {
public:
  seasonal(pt::ptree const& config, const channel_shift &defaults)
    : m_shift(defaults) {
    m_shift.red = config.get<double>("red", defaults.red);
    m_shift.green = config.get<double>("green", defaults.green);
    m_shift.blue = config.get<double>("blue", defaults.blue);
    m_shift.desaturate = config.get<double>("desaturate", defaults.desaturate);
    if (m_shift.desaturate < 0.0 || m_shift.desaturate > 1.0) {
      throw std::runtime_error("Seasonal desaturate weight must be between 0 and 1.");
    }
  }

  virtual ~seasonal() {}

  virtual void process(mapnik::image_rgba8 &image) const {
    cv::Mat pixels = as_mat(image);

    // scale each channel, then pull towards the mean of the scaled
    // channels, as a single matrix.
    const double scale[3] = { m_shift.red, m_shift.green, m_shift.blue };
    const double keep = 1.0 - m_shift.desaturate;
    cv::Matx34d m;
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 3; ++j) {
        m(i, j) = scale[j] * (m_shift.desaturate / 3.0 + (i == j ? keep : 0.0));
      }
      m(i, 3) = 0.0;
    }
    apply_color_matrix(pixels, m);
  }

private:
  channel_shift m_shift;
};

} // anonymous namespace

stage_ptr create_intelligent_palette(pt::ptree const& config) {
  return std::make_shared<intelligent_palette>(config);
}

stage_ptr create_geographic_colors(pt::ptree const& config) {
  return std::make_shared<geographic_colors>(config);
}

stage_ptr create_seasonal_spring(pt::ptree const& config) {
  const channel_shift shift = { 1.0, 1.15, 1.05, 0.0 };
  return std::make_shared<seasonal>(config, shift);
}

stage_ptr create_seasonal_summer(pt::ptree const& config) {
  const channel_shift shift = { 1.1, 1.1, 1.1, 0.0 };
  return std::make_shared<seasonal>(config, shift);
}

stage_ptr create_seasonal_autumn(pt::ptree const& config) {
  const channel_shift shift = { 1.2, 0.9, 1.0, 0.0 };
  return std::make_shared<seasonal>(config, shift);
}

stage_ptr create_seasonal_winter(pt::ptree const& config) {
  const channel_shift shift = { 1.0, 1.0, 1.2, 0.3 };
  return std::make_shared<seasonal>(config, shift);
}

} // namespace post_process
} // namespace cartoposter
