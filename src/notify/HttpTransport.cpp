// Repository: Reprise
// Component: HTTP Transport
// Purpose: Blocking HTTP POST and GET for JSON-RPC delivery and stream lookups.
// Copyright (c) 2026 Reprise

#include "reprise/notify/HttpTransport.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

#include <curl/curl.h>

namespace reprise::notify {

namespace {

// curl_global_init is not thread-safe; run it once, before the first handle.
CURLcode GlobalInit() {
  static const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
  return code;
}

size_t AppendBody(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

template <typename T>
void SetOption(CURL* curl, CURLoption option, T value, CURLcode* rc) {
  if (*rc == CURLE_OK) *rc = curl_easy_setopt(curl, option, value);
}

using HandlePtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

bool AppendHeader(HeaderPtr& headers, const char* line) {
  curl_slist* head = curl_slist_append(headers.get(), line);
  if (head == nullptr) return false;
  headers.release();
  headers.reset(head);
  return true;
}

}  // namespace

bool IsSupportedHttpUrl(const std::string& url) {
  std::string prefix = url.substr(0, 8);
  std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  size_t host_start = 0;
  if (prefix.compare(0, 7, "http://") == 0) {
    host_start = 7;
  } else if (prefix == "https://") {
    host_start = 8;
  } else {
    return false;
  }
  return url.size() > host_start && url[host_start] != '/' && url[host_start] != '?';
}

HttpResponse CurlHttpTransport::PostJson(const std::string& url, const std::string& body,
                                         int timeout_ms) {
  return Execute(true, url, body, timeout_ms);
}

HttpResponse CurlHttpTransport::Get(const std::string& url, int timeout_ms) {
  return Execute(false, url, std::string(), timeout_ms);
}

HttpResponse CurlHttpTransport::Execute(bool post, const std::string& url,
                                        const std::string& body, int timeout_ms) {
  HttpResponse response;
  if (!IsSupportedHttpUrl(url)) {
    response.error = "unsupported url: " + url;
    return response;
  }
  const CURLcode init = GlobalInit();
  if (init != CURLE_OK) {
    response.error = std::string("curl init failed: ") + curl_easy_strerror(init);
    return response;
  }
  HandlePtr curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    response.error = "curl_easy_init failed";
    return response;
  }

  HeaderPtr headers(nullptr, &curl_slist_free_all);
  bool headers_ok = AppendHeader(headers, "Accept: application/json");
  if (post) {
    headers_ok = headers_ok &&
                 AppendHeader(headers, "Content-Type: application/json; charset=utf-8") &&
                 AppendHeader(headers, "Expect:");
  }
  if (!headers_ok) {
    response.error = "curl_slist_append failed";
    return response;
  }

  char error_buffer[CURL_ERROR_SIZE] = {0};
  CURLcode rc = CURLE_OK;
  SetOption(curl.get(), CURLOPT_URL, url.c_str(), &rc);
  SetOption(curl.get(), CURLOPT_NOSIGNAL, 1L, &rc);
  SetOption(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms), &rc);
  SetOption(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms), &rc);
  SetOption(curl.get(), CURLOPT_HTTPHEADER, headers.get(), &rc);
  SetOption(curl.get(), CURLOPT_ERRORBUFFER, error_buffer, &rc);
  SetOption(curl.get(), CURLOPT_WRITEFUNCTION, &AppendBody, &rc);
  SetOption(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&response.body), &rc);
  if (post) {
    SetOption(curl.get(), CURLOPT_POST, 1L, &rc);
    SetOption(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()), &rc);
    SetOption(curl.get(), CURLOPT_POSTFIELDS, body.c_str(), &rc);
  } else {
    SetOption(curl.get(), CURLOPT_HTTPGET, 1L, &rc);
  }
  if (rc != CURLE_OK) {
    response.error = std::string("curl setup failed: ") + curl_easy_strerror(rc);
    return response;
  }

  rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    response.error = error_buffer[0] != '\0' ? std::string(error_buffer)
                                             : std::string(curl_easy_strerror(rc));
    response.body.clear();
    return response;
  }

  long status = 0;
  rc = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (rc != CURLE_OK) {
    response.error = std::string("no response code: ") + curl_easy_strerror(rc);
    return response;
  }
  response.status = static_cast<int>(status);
  response.ok = status >= 200 && status < 300;
  return response;
}

}  // namespace reprise::notify
