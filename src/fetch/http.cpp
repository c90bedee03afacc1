#include "fetch/http.hpp"

#include <boost/format.hpp>

#include <mutex>

namespace cartoposter { namespace fetch {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  std::stringstream *stream = static_cast<std::stringstream*>(userdata);
  size_t total_bytes = size * nmemb;
  stream->write(ptr, total_bytes);
  return stream->good() ? total_bytes : 0;
}

#define CURL_SETOPT(curl, opt, arg) { \
  CURLcode res = curl_easy_setopt((curl), (opt), (arg)); \
  if (res != CURLE_OK) { \
    throw std::runtime_error("Unable to set cURL option " #opt); \
  } \
}

} // anonymous namespace

void http_global_init() {
  static std::once_flag once;
  // a throwing call leaves the flag unset, so a later call tries again.
  std::call_once(once, []() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
      throw std::runtime_error((boost::format("Unable to initialise libcurl: %1%") % curl_easy_strerror(res)).str());
    }
  });
}

http_error::http_error(const std::string &message, bool timed_out)
  : std::runtime_error(message), m_timed_out(timed_out) {
}

http_error::~http_error() noexcept {
}

http_client::http_client(const std::string &user_agent, long timeout)
  : m_curl(curl_easy_init()), m_user_agent(user_agent), m_timeout(timeout) {
  if (m_curl == nullptr) {
    throw std::runtime_error("unable to initialise the cURL easy handle");
  }
  m_error_buffer[0] = '\0';
}

http_client::~http_client() {
  if (m_curl != nullptr) {
    curl_easy_cleanup(m_curl);
    m_curl = nullptr;
  }
}

long http_client::get(const std::string &uri, std::stringstream &stream) {
  CURL_SETOPT(m_curl, CURLOPT_HTTPGET, 1L);
  return perform(uri, stream);
}

long http_client::post(const std::string &uri, const std::string &body, std::stringstream &stream) {
  CURL_SETOPT(m_curl, CURLOPT_POST, 1L);
  CURL_SETOPT(m_curl, CURLOPT_POSTFIELDSIZE, long(body.size()));
  CURL_SETOPT(m_curl, CURLOPT_COPYPOSTFIELDS, body.c_str());
  return perform(uri, stream);
}

std::string http_client::escape(const std::string &str) {
  char *escaped = curl_easy_escape(m_curl, str.c_str(), str.size());
  if (escaped == nullptr) {
    throw std::runtime_error("Unable to URL-escape string.");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

long http_client::perform(const std::string &uri, std::stringstream &stream) {
  CURL_SETOPT(m_curl, CURLOPT_URL, uri.c_str());
  CURL_SETOPT(m_curl, CURLOPT_WRITEFUNCTION, write_callback);
  CURL_SETOPT(m_curl, CURLOPT_WRITEDATA, &stream);
  CURL_SETOPT(m_curl, CURLOPT_ERRORBUFFER, &m_error_buffer[0]);
  CURL_SETOPT(m_curl, CURLOPT_USERAGENT, m_user_agent.c_str());
  CURL_SETOPT(m_curl, CURLOPT_TIMEOUT, m_timeout);
  CURL_SETOPT(m_curl, CURLOPT_FOLLOWLOCATION, 1L);
  CURL_SETOPT(m_curl, CURLOPT_NOSIGNAL, 1L);

  // get curl to send the Accept-Encoding header, and also transparently
  // handle decoding before passing the data back to us.
  CURL_SETOPT(m_curl, CURLOPT_ACCEPT_ENCODING, "gzip");

  CURLcode res = curl_easy_perform(m_curl);
  if (res != CURLE_OK) {
    const char *detail = (m_error_buffer[0] != '\0') ? m_error_buffer : curl_easy_strerror(res);
    throw http_error((boost::format("cURL operation on \"%1%\" failed: %2%") % uri % detail).str(),
                     res == CURLE_OPERATION_TIMEDOUT);
  }

  long status_code = 0;
  curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &status_code);
  return status_code;
}

#undef CURL_SETOPT

} } // namespace cartoposter::fetch
