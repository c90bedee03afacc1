#ifndef CARTOPOSTER_POST_PROCESS_COLOR_ENHANCER_HPP
#define CARTOPOSTER_POST_PROCESS_COLOR_ENHANCER_HPP

#include "post_process/stage.hpp"
#include <boost/property_tree/ptree.hpp>

namespace cartoposter {
namespace post_process {

// stretches each channel to the full range, ignoring `cutoff` percent
// (default 1) of the pixels at either end.
stage_ptr create_intelligent_palette(boost::property_tree::ptree const& config);

// keys: saturation (1.4), contrast (1.1).
stage_ptr create_geographic_colors(boost::property_tree::ptree const& config);

/* Seasonal channel shifts. Each takes optional red, green and blue
 * multipliers, and a desaturate weight pulling towards the channel mean,
 * defaulting to:
 *
 *   spring  green 1.15, blue 1.05
 *   summer  all channels 1.1
 *   autumn  red 1.2, green 0.9
 *   winter  blue 1.2, desaturate 0.3
 */
stage_ptr create_seasonal_spring(boost::property_tree::ptree const& config);
stage_ptr create_seasonal_summer(boost::property_tree::ptree const& config);
stage_ptr create_seasonal_autumn(boost::property_tree::ptree const& config);
stage_ptr create_seasonal_winter(boost::property_tree::ptree const& config);

} // namespace post_process
} // namespace cartoposter

#endif // CARTOPOSTER_POST_PROCESS_COLOR_ENHANCER_HPP
