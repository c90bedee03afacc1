#include "post_process/raster.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>

namespace cartoposter {
namespace post_process {

namespace {

const double LUMA[3] = { 0.299, 0.587, 0.114 };

} // anonymous namespace

cv::Mat as_mat(mapnik::image_rgba8 &image) {
  return cv::Mat(image.height(), image.width(), CV_8UC4, image.bytes());
}

cv::Mat to_bgr(const cv::Mat &rgba) {
  cv::Mat bgr;
  cv::cvtColor(rgba, bgr, cv::COLOR_RGBA2BGR);
  return bgr;
}

void store_bgr(const cv::Mat &bgr, cv::Mat &rgba) {
  const int from_to[] = { 0, 2, 1, 1, 2, 0 };
  cv::mixChannels(&bgr, 1, &rgba, 1, from_to, 3);
}

void apply_color_matrix(cv::Mat &rgba, const cv::Matx34d &m) {
  if (rgba.empty()) { return; }

  // alpha passes through its own row untouched.
  cv::Mat full = cv::Mat::zeros(4, 5, CV_64F);
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      full.at<double>(i, j) = m(i, j);
    }
    full.at<double>(i, 4) = m(i, 3);
  }
  full.at<double>(3, 3) = 1.0;

  cv::Mat out;
  cv::transform(rgba, out, full);
  out.copyTo(rgba);
}

void scale_channels(cv::Mat &rgba, double r, double g, double b) {
  if (r == 1.0 && g == 1.0 && b == 1.0) { return; }
  apply_color_matrix(rgba, cv::Matx34d(r, 0, 0, 0,
                                       0, g, 0, 0,
                                       0, 0, b, 0));
}

void adjust_contrast(cv::Mat &rgba, double factor) {
  if (factor == 1.0 || rgba.empty()) { return; }

  const cv::Scalar means = cv::mean(rgba);
  const double mean = std::floor(LUMA[0] * means[0] + LUMA[1] * means[1] + LUMA[2] * means[2] + 0.5);
  const double offset = mean * (1.0 - factor);
  apply_color_matrix(rgba, cv::Matx34d(factor, 0, 0, offset,
                                       0, factor, 0, offset,
                                       0, 0, factor, offset));
}

void adjust_saturation(cv::Mat &rgba, double factor) {
  if (factor == 1.0) { return; }

  cv::Matx34d m;
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      m(i, j) = (1.0 - factor) * LUMA[j] + (i == j ? factor : 0.0);
    }
    m(i, 3) = 0.0;
  }
  apply_color_matrix(rgba, m);
}

} // namespace post_process
} // namespace cartoposter
