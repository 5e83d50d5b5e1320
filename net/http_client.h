#pragma once

#include <chrono>
#include <map>
#include <string>

#include <openssl/ssl.h>

namespace sweepflux {

struct HttpResponse {
  int status{0};
  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;
};

// Minimal blocking HTTP/1.1 client used by readiness probes. Speaks plain
// HTTP and HTTPS (OpenSSL); one connection per request, closed by the server.
// Connect, send and receive are each bounded by `io_timeout`.
class HttpClient {
public:
  explicit HttpClient(
      std::chrono::milliseconds io_timeout = std::chrono::milliseconds(5000));
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Throws std::runtime_error when the URL is malformed or the host cannot be
  // resolved, reached or read from.
  HttpResponse
  Get(const std::string &url,
      const std::map<std::string, std::string> &headers = {}) const;

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::map<std::string, std::string> &headers) const;

  std::chrono::milliseconds io_timeout_;
  SSL_CTX *ssl_ctx_{nullptr};
};

// Splits a raw HTTP/1.1 response into status, headers and body, decoding a
// chunked body. Exposed for tests.
HttpResponse ParseHttpResponse(const std::string &raw);

} // namespace sweepflux
