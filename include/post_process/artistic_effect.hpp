#ifndef CARTOPOSTER_POST_PROCESS_ARTISTIC_EFFECT_HPP
#define CARTOPOSTER_POST_PROCESS_ARTISTIC_EFFECT_HPP

#include "post_process/stage.hpp"
#include <boost/property_tree/ptree.hpp>

namespace cartoposter {
namespace post_process {

// edge-preserving bilateral smoothing followed by a soft gaussian
// blur. keys: diameter (15), sigma_color (80), sigma_space (80),
// blur_size (3, 1 skips the blur).
stage_ptr create_watercolor(boost::property_tree::ptree const& config);

// OpenCV's colour pencil sketch. keys: sigma_s (60), sigma_r (0.07),
// shade_factor (0.08).
stage_ptr create_pencil_sketch(boost::property_tree::ptree const& config);

// xphoto oil painting: each pixel takes the average colour of the most
// common intensity around it. keys: size (5), dyn_ratio (1).
stage_ptr create_oil_painting(boost::property_tree::ptree const& config);

// sepia toning, a darkened border and film grain. keys: sepia (0.2),
// vignette (true), noise (0.02), seed (1). the grain is seeded, so the
// same image always comes out the same.
stage_ptr create_vintage(boost::property_tree::ptree const& config);

} // namespace post_process
} // namespace cartoposter

#endif // CARTOPOSTER_POST_PROCESS_ARTISTIC_EFFECT_HPP
