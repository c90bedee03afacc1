#ifndef CARTOPOSTER_POST_PROCESSOR_HPP
#define CARTOPOSTER_POST_PROCESSOR_HPP

#include "renderer.hpp"
#include "poster_spec.hpp"
#include "error.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/noncopyable.hpp>
#include <memory>
#include <vector>
#include <string>

namespace cartoposter {

/**
 * Post processor runs the optional raster stages on a rendered poster,
 * always in the same order: texture overlay, artistic effect, colour
 * enhancement. Which stages run comes from the poster spec; how each
 * behaves comes from the configuration given to load().
 */
class post_processor : public boost::noncopyable {
public:
  /**
   * Arguments:
   *
   *   texture_dir
   *     Directory textures are looked up in by name.
   */
  explicit post_processor(const std::string &texture_dir = "textures");
  ~post_processor();

  /**
   * Parse the configuration of the stages.
   *
   * Arguments:
   *
   *   config
   *     Tree keyed by stage name ("texture", "watercolor", "vintage",
   *     "seasonal_winter" and so on), each child holding that stage's
   *     parameters. Stages not mentioned use their defaults.
   *
   * Throws an exception if a stage name is unknown or its parameters
   * are invalid. The previous configuration stays in place if so.
   */
  void load(boost::property_tree::ptree const& config);

  /**
   * Run the stages the poster_spec asks for on the canvas's image.
   *
   * A texture that can't be found or read is reported as an
   * asset_missing warning and its stage is skipped. Vector canvases have
   * no pixels to work on, so any requested stages are skipped with a
   * warning.
   *
   * Throws an exception if a stage fails in an unrecoverable way.
   */
  void process(canvas &c, const poster_spec &spec, std::vector<warning> &warnings) const;

private:
  class pimpl;
  std::unique_ptr<pimpl> m_impl;
};

} // namespace cartoposter

#endif // CARTOPOSTER_POST_PROCESSOR_HPP
