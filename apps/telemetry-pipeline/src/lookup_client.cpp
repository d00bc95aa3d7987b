#include "lookup_client.hpp"

#include <cstdio>
#include <utility>

namespace telemetry {

namespace {

struct ResponseBuffer {
  std::string data;
  std::size_t limit = 0;
  bool overflow = false;
};

// curl write callback: collect the body, refusing anything past the limit. The
// bytes that still fit are kept so error responses can quote them.
std::size_t WriteCallback(char* contents, std::size_t size, std::size_t nmemb, void* user) {
  auto* buffer = static_cast<ResponseBuffer*>(user);
  const std::size_t total_size = size * nmemb;
  if (buffer->data.size() + total_size > buffer->limit) {
    buffer->data.append(contents, buffer->limit - buffer->data.size());
    buffer->overflow = true;
    return 0;
  }
  buffer->data.append(contents, total_size);
  return total_size;
}

bool isUnreserved(unsigned char ch) {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' ||
         ch == '.' || ch == '_' || ch == '~';
}

} // namespace

std::string escapePathSegment(const std::string& segment) {
  std::string out;
  out.reserve(segment.size());
  for (const char raw : segment) {
    const auto ch = static_cast<unsigned char>(raw);
    if (isUnreserved(ch)) {
      out.push_back(raw);
      continue;
    }
    char encoded[4];
    std::snprintf(encoded, sizeof(encoded), "%%%02X", ch);
    out.append(encoded, 3);
  }
  return out;
}

std::string buildLookupUrl(const std::string& endpoint, const std::string& key) {
  std::string base = endpoint;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + escapePathSegment(key);
}

LookupResult decodeLookupResponse(long http_status, const std::string& body) {
  LookupResult result;
  result.http_status = http_status;

  if (http_status >= 400) {
    result.error = "http status " + std::to_string(http_status) + ": " + body.substr(0, kErrorBodyLimit);
    return result;
  }

  if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
    result.error = "empty body";
    return result;
  }

  Value decoded;
  std::string parse_error;
  if (!parseJson(body, decoded, parse_error)) {
    result.error = "invalid json: " + parse_error;
    return result;
  }
  if (decoded.kind_case() == Value::kNullValue) {
    result.error = "empty body";
    return result;
  }
  if (!isObject(decoded)) {
    result.error = "response is not a JSON object";
    return result;
  }

  result.data = std::move(*decoded.mutable_struct_value());
  result.ok = true;
  return result;
}

CurlLookupClient::CurlLookupClient(LookupClientConfig config) : config_(std::move(config)) {
  share_ = curl_share_init();
  if (share_ != nullptr) {
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlLookupClient::lockShare);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlLookupClient::unlockShare);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
  }
}

CurlLookupClient::~CurlLookupClient() {
  if (share_ != nullptr) {
    curl_share_cleanup(share_);
  }
}

void CurlLookupClient::lockShare(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* user) {
  auto* self = static_cast<CurlLookupClient*>(user);
  self->share_locks_[data].lock();
}

void CurlLookupClient::unlockShare(CURL* /*handle*/, curl_lock_data data, void* user) {
  auto* self = static_cast<CurlLookupClient*>(user);
  self->share_locks_[data].unlock();
}

LookupResult CurlLookupClient::fetch(const std::string& endpoint, const std::string& key, std::chrono::milliseconds timeout) {
  LookupResult result;
  if (timeout.count() <= 0) {
    timeout = config_.default_timeout;
  }

  CURL* curl = curl_easy_init();
  if (!curl) {
    result.error = "curl_easy_init failed";
    return result;
  }

  const std::string url = buildLookupUrl(endpoint, key);
  ResponseBuffer response;
  response.limit = config_.max_response_bytes;

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, config_.max_connections);
  if (share_ != nullptr) {
    curl_easy_setopt(curl, CURLOPT_SHARE, share_);
  }

  const CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (response.overflow && http_code >= 400) {
    return decodeLookupResponse(http_code, response.data);
  }
  if (res != CURLE_OK) {
    if (response.overflow) {
      result.error = "response exceeds " + std::to_string(config_.max_response_bytes) + " bytes";
    } else {
      result.error = std::string("request failed: ") + curl_easy_strerror(res);
    }
    result.http_status = http_code;
    return result;
  }

  return decodeLookupResponse(http_code, response.data);
}

} // namespace telemetry
