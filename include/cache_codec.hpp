#ifndef CARTOPOSTER_CACHE_CODEC_HPP
#define CARTOPOSTER_CACHE_CODEC_HPP

#include "location.hpp"
#include "dataset.hpp"

#include <string>

namespace cartoposter {

/* Conversion of cached values to and from their stored payloads. The
 * decoders throw std::runtime_error on a payload they can't read.
 */

std::string encode_coordinate(const resolved_coordinate &c);
resolved_coordinate decode_coordinate(const std::string &payload);

// datasets are gzip-compressed, as they can be large.
std::string encode_dataset(const geo_dataset &d, int compression_level = -1);
dataset_ptr decode_dataset(const std::string &payload);

} // namespace cartoposter

#endif // CARTOPOSTER_CACHE_CODEC_HPP
