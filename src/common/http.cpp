#include "prdguard/common/http.hpp"

#include "prdguard/common/fs.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace prdguard::common {

namespace {

constexpr std::size_t kMaxResponseBytes = 1024 * 1024;

struct EasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct BodySink {
  std::string *body = nullptr;
  bool truncated = false;
};

// Returning less than the chunk size makes curl abort the transfer with CURLE_WRITE_ERROR.
size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userdata);
  if (sink->body->size() + total > kMaxResponseBytes) {
    sink->truncated = true;
    return 0;
  }
  sink->body->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string line(buffer, total);
  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);
    (*headers)[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return total;
}

void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HeaderList build_headers(const std::unordered_map<std::string, std::string> &headers) {
  HeaderList list(curl_slist_append(nullptr, "Content-Type: application/json"));
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    // Appending to a non-empty list returns the same head.
    curl_slist *head = curl_slist_append(list.get(), line.c_str());
    if (list == nullptr) {
      list.reset(head);
    }
  }
  return list;
}

} // namespace

CurlHttpClient::CurlHttpClient() { ensure_curl_initialized(); }

HttpResponse CurlHttpClient::post_json(const std::string &url,
                                       const std::unordered_map<std::string, std::string> &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  EasyHandle curl(curl_easy_init());
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  BodySink sink{.body = &response.body};
  const HeaderList header_list = build_headers(headers);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "prdguard/0.1");
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

  const CURLcode code = curl_easy_perform(curl.get());
  if (sink.truncated) {
    response.network_error = true;
    response.network_error_message =
        "response exceeded " + std::to_string(kMaxResponseBytes) + " bytes";
    response.body.clear();
    return response;
  }
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    return response;
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

} // namespace prdguard::common
