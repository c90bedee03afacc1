#ifndef CARTOPOSTER_FETCH_HTTP_HPP
#define CARTOPOSTER_FETCH_HTTP_HPP

#include <boost/noncopyable.hpp>
#include <curl/curl.h>
#include <stdexcept>
#include <sstream>
#include <string>

namespace cartoposter { namespace fetch {

/* Thrown when a request couldn't be completed at the transport level,
 * i.e: there is no HTTP status to look at.
 */
struct http_error : public std::runtime_error {
  http_error(const std::string &message, bool timed_out);
  virtual ~http_error() noexcept;

  bool timed_out() const { return m_timed_out; }

private:
  bool m_timed_out;
};

/* Sets up libcurl's global state. This has to happen before any thread
 * makes an http_client, because curl_easy_init would otherwise do it
 * implicitly and that is not thread-safe. Only the first call does any
 * work; throws std::runtime_error if libcurl can't be initialised.
 */
void http_global_init();

/* Blocking HTTP client wrapping a single cURL easy handle. Not safe to
 * share between threads; make one per request or per thread.
 */
class http_client : boost::noncopyable {
public:
  // timeout is in seconds for the whole transfer.
  http_client(const std::string &user_agent, long timeout);
  ~http_client();

  // GETs the uri, writing the body to the stream and returning the
  // HTTP status code.
  long get(const std::string &uri, std::stringstream &stream);

  // POSTs a form-encoded body to the uri.
  long post(const std::string &uri, const std::string &body, std::stringstream &stream);

  // percent-escapes a string for use in a query string or form body.
  std::string escape(const std::string &str);

private:
  long perform(const std::string &uri, std::stringstream &stream);

  CURL *m_curl;
  char m_error_buffer[CURL_ERROR_SIZE];
  const std::string m_user_agent;
  const long m_timeout;
};

} } // namespace cartoposter::fetch

#endif // CARTOPOSTER_FETCH_HTTP_HPP
