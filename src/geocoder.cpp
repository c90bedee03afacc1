#include "geocoder.hpp"

namespace cartoposter {

geocoder::~geocoder() {
}

} // namespace cartoposter
