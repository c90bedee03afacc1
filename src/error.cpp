#include "error.hpp"

namespace cartoposter {

std::string to_string(error_kind kind) {
  switch (kind) {
  case error_kind::location_not_found:  return "LocationNotFound";
  case error_kind::service_unavailable: return "ServiceUnavailable";
  case error_kind::data_fetch_partial:  return "DataFetchPartial";
  case error_kind::theme_load_error:    return "ThemeLoadError";
  case error_kind::asset_missing:       return "AssetMissing";
  case error_kind::export_error:        return "ExportError";
  case error_kind::invalid_request:     return "InvalidRequest";
  case error_kind::cache_error:         return "CacheError";
  case error_kind::internal_error:      return "InternalError";
  }
  return "Unknown";
}

std::ostream &operator<<(std::ostream &out, error_kind kind) {
  return out << to_string(kind);
}

std::ostream &operator<<(std::ostream &out, const failure &f) {
  return out << f.kind << ": " << f.message;
}

std::ostream &operator<<(std::ostream &out, const warning &w) {
  return out << w.kind << ": " << w.message;
}

poster_error::poster_error(error_kind kind, const std::string &message)
  : std::runtime_error(message), m_kind(kind) {
}

poster_error::~poster_error() noexcept {
}

failure poster_error::as_failure() const {
  failure f;
  f.kind = m_kind;
  f.message = what();
  return f;
}

} // namespace cartoposter
