// Repository: Reprise
// Component: HTTP Transport
// Purpose: Blocking HTTP POST and GET for JSON-RPC delivery and stream lookups.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_NOTIFY_HTTP_TRANSPORT_HPP_
#define REPRISE_NOTIFY_HTTP_TRANSPORT_HPP_

#include <string>

namespace reprise::notify {

// True for "http://" or "https://" (any case) followed by a host.
bool IsSupportedHttpUrl(const std::string& url);

struct HttpResponse {
  bool ok = false;      // Transport succeeded and status is 2xx.
  int status = 0;       // 0 when no response was received.
  std::string error;    // Transport failure description.
  std::string body;
};

// Blocking transport. Called only from worker threads, never from the
// controller's serial queue.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  virtual HttpResponse PostJson(const std::string& url, const std::string& body,
                                int timeout_ms) = 0;
  virtual HttpResponse Get(const std::string& url, int timeout_ms) = 0;
};

// CurlHttpTransport: one libcurl easy handle per request, so a single
// instance may be shared by the notifier sender and lookup threads. The
// whole request (connect included) is bounded by timeout_ms.
class CurlHttpTransport : public IHttpTransport {
 public:
  HttpResponse PostJson(const std::string& url, const std::string& body,
                        int timeout_ms) override;
  HttpResponse Get(const std::string& url, int timeout_ms) override;

 private:
  HttpResponse Execute(bool post, const std::string& url, const std::string& body,
                       int timeout_ms);
};

}  // namespace reprise::notify

#endif  // REPRISE_NOTIFY_HTTP_TRANSPORT_HPP_
