#include "cache.hpp"
#include "error.hpp"

#include <boost/format.hpp>
#include <boost/filesystem.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>

// milliseconds a connection waits on another writer's lock before
// giving up with SQLITE_BUSY.
#define BUSY_TIMEOUT_MS (5000)

namespace bfs = boost::filesystem;

namespace cartoposter {

namespace {

namespace sqlite {

struct sqlite_db_deleter {
  void operator()(sqlite3 *ptr) const {
    if (ptr != nullptr) {
      int status = sqlite3_close(ptr);
      if (status != SQLITE_OK) {
        spdlog::warn("Unable to close SQLite3 database");
      }
    }
  }
};

struct sqlite_statement_finalizer {
  void operator()(sqlite3_stmt *ptr) const {
    if (ptr != nullptr) {
      int status = sqlite3_finalize(ptr);
      if (status != SQLITE_OK) {
        spdlog::warn("Unable to finalize SQLite3 statement");
      }
    }
  }
};

struct statement {
  boost::optional<std::string> column_blob(int i) {
    if (sqlite3_column_type(ptr.get(), i) == SQLITE_NULL) {
      return boost::none;
    }
    const char *bytes = static_cast<const char *>(sqlite3_column_blob(ptr.get(), i));
    int sz = sqlite3_column_bytes(ptr.get(), i);
    return std::string(bytes, sz);
  }

  bool step() {
    int status = sqlite3_step(ptr.get());
    if (status == SQLITE_DONE) { return false; }
    if (status != SQLITE_ROW) {
      throw std::runtime_error((boost::format("Unable to step row in query result: %1%") % sqlite3_errmsg(db_for_errors)).str());
    }
    return true;
  }

  void bind_text(int i, const std::string &str) {
    int status = sqlite3_bind_text(ptr.get(), i, str.data(), str.size(), SQLITE_TRANSIENT);
    if (status != SQLITE_OK) {
      throw std::runtime_error((boost::format("Argument bind failed: %1%") % sqlite3_errmsg(db_for_errors)).str());
    }
  }

  void bind_blob(int i, const std::string &bytes) {
    int status = sqlite3_bind_blob(ptr.get(), i, bytes.data(), bytes.size(), SQLITE_TRANSIENT);
    if (status != SQLITE_OK) {
      throw std::runtime_error((boost::format("Argument bind failed: %1%") % sqlite3_errmsg(db_for_errors)).str());
    }
  }

  void bind_int64(int i, sqlite3_int64 v) {
    int status = sqlite3_bind_int64(ptr.get(), i, v);
    if (status != SQLITE_OK) {
      throw std::runtime_error((boost::format("Argument bind failed: %1%") % sqlite3_errmsg(db_for_errors)).str());
    }
  }

private:
  friend struct db;
  statement(sqlite3 *db, const std::string &sql)
    : ptr(), db_for_errors(db) {
    const char *tail = nullptr;
    sqlite3_stmt *ptr_ = nullptr;
    int status = sqlite3_prepare_v2(db, sql.c_str(), sql.size(), &ptr_, &tail);
    if (status != SQLITE_OK) {
      throw std::runtime_error((boost::format("Unable to prepare SQLite3 statement \"%1%\": %2%") % sql % sqlite3_errmsg(db_for_errors)).str());
    }
    ptr.reset(ptr_);
  }

  std::unique_ptr<sqlite3_stmt, sqlite_statement_finalizer> ptr;
  sqlite3 *db_for_errors; // use for ERRORS only.
};

struct db {
  db(const std::string &loc, int flags) {
    sqlite3 *ptr_ = nullptr;
    int status = sqlite3_open_v2(loc.c_str(), &ptr_, flags, nullptr);
    // sqlite hands back a handle even when the open fails, and it has to
    // be closed either way.
    ptr.reset(ptr_);
    if (status != SQLITE_OK) {
      throw std::runtime_error((boost::format("Unable to open SQLite3 database \"%1%\": %2%") % loc % sqlite3_errmsg(ptr_)).str());
    }
    sqlite3_busy_timeout(ptr_, BUSY_TIMEOUT_MS);
  }

  statement prepare(const std::string &sql) {
    return statement(ptr.get(), sql);
  }

  bool has_cache_table() {
    statement s(prepare("SELECT name FROM sqlite_master WHERE type='table' AND name='cache'"));
    return s.step();
  }

private:
  std::unique_ptr<sqlite3, sqlite_db_deleter> ptr;
};

} // namespace sqlite

sqlite3_int64 unix_now() {
  using namespace boost::posix_time;
  static const ptime epoch(boost::gregorian::date(1970, 1, 1));
  return (second_clock::universal_time() - epoch).total_seconds();
}

} // anonymous namespace

cache_store::~cache_store() {
}

sqlite_cache::sqlite_cache(const std::string &location)
  : m_location(location) {
}

sqlite_cache::~sqlite_cache() {
}

boost::optional<std::string> sqlite_cache::get(const std::string &key) {
  // an absent file is an empty cache. opening it read-only means a
  // lookup never creates one.
  boost::system::error_code ec;
  if (!bfs::exists(m_location, ec)) {
    return boost::none;
  }

  try {
    sqlite::db conn(m_location, SQLITE_OPEN_READONLY);
    if (!conn.has_cache_table()) {
      return boost::none;
    }

    sqlite::statement s(conn.prepare("SELECT payload FROM cache WHERE key=?"));
    s.bind_text(1, key);
    if (s.step()) {
      return s.column_blob(0);
    }

  } catch (const std::exception &e) {
    spdlog::warn("Cache read for \"{}\" failed, treating as a miss: {}", key, e.what());
  }

  return boost::none;
}

void sqlite_cache::put(const std::string &key, const std::string &payload) {
  try {
    bfs::path parent = bfs::path(m_location).parent_path();
    if (!parent.empty()) {
      bfs::create_directories(parent);
    }

    sqlite::db conn(m_location, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    conn.prepare("CREATE TABLE IF NOT EXISTS cache (key TEXT PRIMARY KEY, payload BLOB, created INTEGER)").step();

    sqlite::statement s(conn.prepare("INSERT OR REPLACE INTO cache (key, payload, created) VALUES (?, ?, ?)"));
    s.bind_text(1, key);
    s.bind_blob(2, payload);
    s.bind_int64(3, unix_now());
    s.step();

  } catch (const std::exception &e) {
    spdlog::warn("Unable to write cache entry \"{}\": {}", key, e.what());
  }
}

void sqlite_cache::clear() {
  boost::system::error_code ec;
  if (!bfs::exists(m_location, ec)) {
    return;
  }

  // unlike a failed read or write, a failed clear is reported: the
  // caller asked for exactly this and nothing else.
  try {
    sqlite::db conn(m_location, SQLITE_OPEN_READWRITE);
    if (conn.has_cache_table()) {
      conn.prepare("DELETE FROM cache").step();
    }
  } catch (const std::exception &e) {
    throw poster_error(error_kind::cache_error,
                       (boost::format("Unable to clear cache at %1%: %2%") % m_location % e.what()).str());
  }
  spdlog::info("Cleared cache at {}", m_location);
}

memory_cache::memory_cache()
  : m_hits(0), m_writes(0) {
}

memory_cache::~memory_cache() {
}

boost::optional<std::string> memory_cache::get(const std::string &key) {
  std::unique_lock<std::mutex> lock(m_mutex);
  std::map<std::string, std::string>::const_iterator itr = m_entries.find(key);
  if (itr == m_entries.end()) {
    return boost::none;
  }
  ++m_hits;
  return itr->second;
}

void memory_cache::put(const std::string &key, const std::string &payload) {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_entries[key] = payload;
  ++m_writes;
}

void memory_cache::clear() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_entries.clear();
}

size_t memory_cache::size() const {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_entries.size();
}

size_t memory_cache::hits() const {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_hits;
}

size_t memory_cache::writes() const {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_writes;
}

} // namespace cartoposter
