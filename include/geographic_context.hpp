#ifndef CARTOPOSTER_GEOGRAPHIC_CONTEXT_HPP
#define CARTOPOSTER_GEOGRAPHIC_CONTEXT_HPP

#include "dataset.hpp"

#include <boost/optional.hpp>
#include <string>

namespace cartoposter {

enum class terrain { urban, mountain, coastal, desert, forest };
enum class season { none, spring, summer, autumn, winter };

std::string to_string(terrain t);
std::string to_string(season s);
boost::optional<terrain> terrain_from_string(const std::string &s);
boost::optional<season> season_from_string(const std::string &s);

/* What kind of place a poster shows. Themes may carry variants keyed on
 * these.
 */
struct geographic_context {
  geographic_context();
  geographic_context(terrain t, season s);

  terrain terrain_type;
  season season_type;
};

/* Works out the terrain from a census of the dataset's tags. The first
 * test to pass wins: any peaks, ridges, cliffs or bare rock make it
 * mountain; coastline, beaches, bays or sea make it coastal; sand or
 * desert make it desert; woodland making up at least 30% of the area
 * features makes it forest; anything else is urban. The season isn't in
 * the data, so it's passed through from the request.
 */
geographic_context detect_context(const geo_dataset &dataset, season s = season::none);

} // namespace cartoposter

#endif // CARTOPOSTER_GEOGRAPHIC_CONTEXT_HPP
