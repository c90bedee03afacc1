#ifndef CARTOPOSTER_POST_PROCESS_TEXTURE_OVERLAY_HPP
#define CARTOPOSTER_POST_PROCESS_TEXTURE_OVERLAY_HPP

#include "post_process/stage.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

namespace cartoposter {
namespace post_process {

/* Looks up a texture by name under `texture_dir`: first in the
 * directory's manifest.json, then in its usual sub-directories with
 * the usual image extensions. None if it isn't there.
 */
boost::optional<boost::filesystem::path>
find_texture(const boost::filesystem::path &texture_dir, const std::string &name);

/* Blends a paper texture over the poster. Config keys:
 *
 *   path        the texture image, required.
 *   intensity   weight of the texture in the blend, default 0.3.
 *   brightness  multiplier applied after blending, default 1.1.
 *   contrast    contrast factor applied after blending, default 1.1.
 *
 * Throws if the texture can't be read.
 */
stage_ptr create_texture_overlay(boost::property_tree::ptree const& config);

} // namespace post_process
} // namespace cartoposter

#endif // CARTOPOSTER_POST_PROCESS_TEXTURE_OVERLAY_HPP
