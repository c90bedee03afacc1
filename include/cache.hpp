#ifndef CARTOPOSTER_CACHE_HPP
#define CARTOPOSTER_CACHE_HPP

#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>
#include <map>
#include <mutex>
#include <string>

namespace cartoposter {

/* Key-value store for geocode results and fetched datasets.
 *
 * The cache is never required for correctness: a miss, an absent
 * store or an unreadable entry all look the same to the caller, and
 * write failures are logged and otherwise ignored.
 */
struct cache_store : boost::noncopyable {
  virtual ~cache_store();

  // returns the payload stored under the key, if any.
  virtual boost::optional<std::string> get(const std::string &key) = 0;

  // stores the payload, replacing any previous entry under the same
  // key. readers see either the old or the new entry, never a mix.
  virtual void put(const std::string &key, const std::string &payload) = 0;

  // removes every entry.
  virtual void clear() = 0;
};

/* Cache backed by an SQLite3 database file. Each operation opens its
 * own connection, so the file may be removed from under a running
 * process and will simply be re-created on the next write.
 */
class sqlite_cache : public cache_store {
public:
  explicit sqlite_cache(const std::string &location);
  virtual ~sqlite_cache();

  boost::optional<std::string> get(const std::string &key);
  void put(const std::string &key, const std::string &payload);
  void clear();

  const std::string &location() const { return m_location; }

private:
  const std::string m_location;
};

/* In-process cache, used when persistence is turned off and by the
 * tests. Counts lookups so tests can check what was served from it.
 */
class memory_cache : public cache_store {
public:
  memory_cache();
  virtual ~memory_cache();

  boost::optional<std::string> get(const std::string &key);
  void put(const std::string &key, const std::string &payload);
  void clear();

  size_t size() const;
  size_t hits() const;
  size_t writes() const;

private:
  mutable std::mutex m_mutex;
  std::map<std::string, std::string> m_entries;
  size_t m_hits, m_writes;
};

} // namespace cartoposter

#endif // CARTOPOSTER_CACHE_HPP
