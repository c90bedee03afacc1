#ifndef CARTOPOSTER_POST_PROCESS_RASTER_HPP
#define CARTOPOSTER_POST_PROCESS_RASTER_HPP

#include <mapnik/image.hpp>
#include <opencv2/core.hpp>

namespace cartoposter {
namespace post_process {

/* A CV_8UC4 header over the image's own pixels, so the channels are in
 * R, G, B, A order. Nothing is copied: writes through the returned
 * matrix land in the image.
 */
cv::Mat as_mat(mapnik::image_rgba8 &image);

// 3-channel BGR copy of an RGBA matrix, for the OpenCV filters which
// want 8-bit colour without alpha.
cv::Mat to_bgr(const cv::Mat &rgba);

// writes a BGR matrix back over the colour channels of `rgba`. alpha
// is left as it was.
void store_bgr(const cv::Mat &bgr, cv::Mat &rgba);

/* Applies a 3x4 colour matrix (RGB rows, the fourth column an offset)
 * to the colour channels of `rgba` in place, saturating to 0-255.
 */
void apply_color_matrix(cv::Mat &rgba, const cv::Matx34d &m);

// multiplies each colour channel by its own factor.
void scale_channels(cv::Mat &rgba, double r, double g, double b);

// moves every channel away from the mean luma by `factor`.
void adjust_contrast(cv::Mat &rgba, double factor);

// moves every pixel away from its own ITU-R 601 grey by `factor`.
void adjust_saturation(cv::Mat &rgba, double factor);

} // namespace post_process
} // namespace cartoposter

#endif // CARTOPOSTER_POST_PROCESS_RASTER_HPP
