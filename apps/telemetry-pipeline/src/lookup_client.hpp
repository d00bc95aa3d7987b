#ifndef TELEMETRY_PIPELINE_LOOKUP_CLIENT_HPP
#define TELEMETRY_PIPELINE_LOOKUP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "value.hpp"

namespace telemetry {

struct LookupResult {
  bool ok = false;
  Object data;
  long http_status = 0;
  std::string error;
};

// Fetch-and-decode client for enrichment services: GET <endpoint>/<key>, JSON
// object body expected.
class LookupClient {
 public:
  virtual ~LookupClient() = default;

  virtual LookupResult fetch(const std::string& endpoint, const std::string& key, std::chrono::milliseconds timeout) = 0;
};

struct LookupClientConfig {
  std::chrono::milliseconds default_timeout{5000};
  long max_connections = 16;
  std::size_t max_response_bytes = 1024 * 1024;
  std::string user_agent = "telemetry-pipeline/1.0";
};

// libcurl-backed client. One easy handle per call; the connection and DNS caches
// are shared between calls through a lock-protected share handle, so a single
// instance may be used from any number of threads.
class CurlLookupClient : public LookupClient {
 public:
  explicit CurlLookupClient(LookupClientConfig config);
  ~CurlLookupClient() override;

  CurlLookupClient(const CurlLookupClient&) = delete;
  CurlLookupClient& operator=(const CurlLookupClient&) = delete;

  LookupResult fetch(const std::string& endpoint, const std::string& key, std::chrono::milliseconds timeout) override;

  const LookupClientConfig& config() const { return config_; }

 private:
  static void lockShare(CURL* handle, curl_lock_data data, curl_lock_access access, void* user);
  static void unlockShare(CURL* handle, curl_lock_data data, void* user);

  LookupClientConfig config_;
  CURLSH* share_ = nullptr;
  std::mutex share_locks_[CURL_LOCK_DATA_LAST];
};

constexpr std::size_t kErrorBodyLimit = 1024;

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string escapePathSegment(const std::string& segment);

// Joins endpoint and key with exactly one '/', escaping the key.
std::string buildLookupUrl(const std::string& endpoint, const std::string& key);

// Status >= 400 is a failure carrying up to kErrorBodyLimit bytes of the body;
// otherwise the body has to be a JSON object.
LookupResult decodeLookupResponse(long http_status, const std::string& body);

} // namespace telemetry

#endif
