#ifndef CARTOPOSTER_ERROR_HPP
#define CARTOPOSTER_ERROR_HPP

#include <stdexcept>
#include <string>
#include <ostream>

namespace cartoposter {

/* Classes of failure a poster generation can run into. Some are
 * terminal for the whole request, others (data_fetch_partial,
 * asset_missing) only ever show up as warnings.
 */
enum class error_kind {
  // geocoding answered, but there is no such place. never retried.
  location_not_found,
  // geocoding kept failing with rate-limits or timeouts.
  service_unavailable,
  // one or more feature categories could not be fetched.
  data_fetch_partial,
  // theme file missing, unreadable or malformed.
  theme_load_error,
  // a font, texture or other optional asset is not available.
  asset_missing,
  // the output file could not be written.
  export_error,
  // the request itself is out of bounds or malformed.
  invalid_request,
  // the cache store could not be read, written or cleared.
  cache_error,
  // anything else that went wrong. always a bug or an environment
  // problem (out of memory, say), never a problem with the request.
  internal_error
};

std::string to_string(error_kind kind);
std::ostream &operator<<(std::ostream &out, error_kind kind);

/* A terminal failure, as reported back to the caller.
 */
struct failure {
  error_kind kind;
  std::string message;
};

/* A non-fatal condition. The pipeline carries on and reports these
 * alongside the result.
 */
struct warning {
  error_kind kind;
  std::string message;
};

std::ostream &operator<<(std::ostream &out, const failure &f);
std::ostream &operator<<(std::ostream &out, const warning &w);

/* Exception thrown by components for terminal conditions. The generator
 * turns these into a `failure` at its boundary.
 */
class poster_error : public std::runtime_error {
public:
  poster_error(error_kind kind, const std::string &message);
  virtual ~poster_error() noexcept;

  error_kind kind() const { return m_kind; }
  failure as_failure() const;

private:
  error_kind m_kind;
};

} // namespace cartoposter

#endif // CARTOPOSTER_ERROR_HPP
