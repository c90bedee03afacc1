#ifndef CARTOPOSTER_POST_PROCESS_STAGE_HPP
#define CARTOPOSTER_POST_PROCESS_STAGE_HPP

#include <mapnik/image.hpp>
#include <memory>

namespace cartoposter {
namespace post_process {

/**
 * Base class for post-processing stages. A stage alters the pixels of
 * a rendered poster in place, after all drawing is done.
 */
class stage {
public:
  virtual ~stage() {}
  virtual void process(mapnik::image_rgba8 &image) const = 0;
};

typedef std::shared_ptr<stage> stage_ptr;

} // namespace post_process
} // namespace cartoposter

#endif // CARTOPOSTER_POST_PROCESS_STAGE_HPP
