#include "feature_source.hpp"

namespace cartoposter {

feature_source::~feature_source() {
}

} // namespace cartoposter
