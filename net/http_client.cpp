#include "net/http_client.h"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace sweepflux {
namespace {

struct Url {
  bool tls{false};
  std::string host;
  int port{80};
  std::string target{"/"};
};

Url ParseUrl(const std::string &text) {
  Url url;
  std::string rest = text;
  auto scheme_end = text.find("://");
  if (scheme_end != std::string::npos) {
    std::string scheme = text.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
      throw std::runtime_error("unsupported URL scheme: " + scheme);
    url.tls = scheme == "https";
    rest = text.substr(scheme_end + 3);
  }
  url.port = url.tls ? 443 : 80;

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos)
    url.target = rest.substr(slash);

  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    std::string port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos)
      throw std::runtime_error("invalid port in URL: " + text);
    url.port = std::stoi(port);
    authority.resize(colon);
  }
  if (authority.empty())
    throw std::runtime_error("missing host in URL: " + text);
  url.host = authority;
  return url;
}

// Owns a socket descriptor.
class Socket {
public:
  explicit Socket(int fd = -1) : fd_(fd) {}
  ~Socket() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;
  Socket(Socket &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  int fd() const { return fd_; }

private:
  int fd_;
};

// Non-blocking connect bounded by `timeout`, then back to blocking mode with
// send/receive timeouts.
Socket Connect(const Url &url, std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(url.host.c_str(), std::to_string(url.port).c_str(), &hints,
                  &result) != 0) {
    throw std::runtime_error("failed to resolve host " + url.host);
  }

  int last_errno = 0;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    Socket sock(::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC,
                         rp->ai_protocol));
    if (sock.fd() < 0)
      continue;
    int flags = ::fcntl(sock.fd(), F_GETFL, 0);
    ::fcntl(sock.fd(), F_SETFL, flags | O_NONBLOCK);

    bool connected = ::connect(sock.fd(), rp->ai_addr, rp->ai_addrlen) == 0;
    if (!connected && errno == EINPROGRESS) {
      pollfd pfd{sock.fd(), POLLOUT, 0};
      if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &err, &len);
        connected = err == 0;
        last_errno = err;
      } else {
        last_errno = ETIMEDOUT;
      }
    } else if (!connected) {
      last_errno = errno;
    }
    if (!connected)
      continue;

    ::fcntl(sock.fd(), F_SETFL, flags);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(sock.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(sock.fd(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    freeaddrinfo(result);
    return sock;
  }
  freeaddrinfo(result);
  throw std::runtime_error("failed to connect to " + url.host + ":" +
                           std::to_string(url.port) +
                           (last_errno ? std::string(": ") + std::strerror(last_errno)
                                       : std::string()));
}

// Owns an OpenSSL session on a connected socket.
class TlsSession {
public:
  TlsSession(SSL_CTX *ctx, int fd, const std::string &host)
      : ssl_(SSL_new(ctx)) {
    if (!ssl_)
      throw std::runtime_error("failed to allocate TLS session");
    SSL_set_tlsext_host_name(ssl_, host.c_str());
    SSL_set1_host(ssl_, host.c_str());
    SSL_set_fd(ssl_, fd);
    if (SSL_connect(ssl_) != 1)
      Fail("TLS handshake with " + host + " failed");
    if (SSL_get_verify_result(ssl_) != X509_V_OK)
      Fail("TLS certificate verification failed for " + host);
  }
  ~TlsSession() {
    if (ssl_) {
      SSL_shutdown(ssl_);
      SSL_free(ssl_);
    }
  }
  TlsSession(const TlsSession &) = delete;
  TlsSession &operator=(const TlsSession &) = delete;

  SSL *get() const { return ssl_; }

private:
  // The destructor does not run for a throwing constructor.
  [[noreturn]] void Fail(const std::string &message) {
    SSL_free(ssl_);
    ssl_ = nullptr;
    throw std::runtime_error(message);
  }

  SSL *ssl_;
};

std::string BuildRequest(const Url &url, const std::string &method,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << url.target << " HTTP/1.1\r\n";
  request << "Host: " << url.host << ":" << url.port << "\r\n";
  request << "Accept: application/json\r\n";
  request << "User-Agent: sweepflux\r\n";
  for (const auto &[key, value] : headers)
    request << key << ": " << value << "\r\n";
  request << "Connection: close\r\n\r\n";
  return request.str();
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t");
  if (start == std::string::npos)
    return {};
  auto end = s.find_last_not_of(" \t\r");
  return s.substr(start, end - start + 1);
}

std::string DecodeChunked(const std::string &body) {
  std::string out;
  std::size_t pos = 0;
  while (pos < body.size()) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos)
      break;
    std::size_t size = 0;
    try {
      size = std::stoul(body.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception &) {
      break;
    }
    if (size == 0)
      break;
    pos = line_end + 2;
    out.append(body, pos, std::min(size, body.size() - pos));
    pos += size + 2;
  }
  return out;
}

} // namespace

HttpResponse ParseHttpResponse(const std::string &raw) {
  HttpResponse response;
  auto head_end = raw.find("\r\n\r\n");
  std::string head = raw.substr(0, head_end);
  std::string body =
      head_end == std::string::npos ? std::string() : raw.substr(head_end + 4);

  std::istringstream lines(head);
  std::string status_line;
  std::getline(lines, status_line);
  auto sp = status_line.find(' ');
  if (sp != std::string::npos) {
    try {
      response.status = std::stoi(status_line.substr(sp + 1));
    } catch (const std::exception &) {
      response.status = 0;
    }
  }
  std::string line;
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    response.headers[Lower(Trim(line.substr(0, colon)))] =
        Trim(line.substr(colon + 1));
  }

  auto te = response.headers.find("transfer-encoding");
  if (te != response.headers.end() && Lower(te->second) == "chunked")
    body = DecodeChunked(body);
  response.body = std::move(body);
  return response;
}

HttpClient::HttpClient(std::chrono::milliseconds io_timeout)
    : io_timeout_(io_timeout) {
  OPENSSL_init_ssl(0, nullptr);
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_)
    SSL_CTX_free(ssl_ctx_);
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, headers);
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::map<std::string, std::string> &headers) const {
  const Url parsed = ParseUrl(url);
  const std::string request = BuildRequest(parsed, method, headers);
  Socket sock = Connect(parsed, io_timeout_);
  std::string raw;
  char buffer[4096];

  if (parsed.tls) {
    if (!ssl_ctx_)
      throw std::runtime_error("TLS not available in HttpClient");
    TlsSession tls(ssl_ctx_, sock.fd(), parsed.host);
    std::size_t offset = 0;
    while (offset < request.size()) {
      int sent = SSL_write(tls.get(), request.data() + offset,
                           static_cast<int>(request.size() - offset));
      if (sent <= 0)
        throw std::runtime_error("failed to send TLS request to " + parsed.host);
      offset += static_cast<std::size_t>(sent);
    }
    int n = 0;
    while ((n = SSL_read(tls.get(), buffer, sizeof(buffer))) > 0)
      raw.append(buffer, static_cast<std::size_t>(n));
  } else {
    std::size_t offset = 0;
    while (offset < request.size()) {
      ssize_t sent = ::send(sock.fd(), request.data() + offset,
                            request.size() - offset, MSG_NOSIGNAL);
      if (sent < 0 && errno == EINTR)
        continue;
      if (sent <= 0)
        throw std::runtime_error("failed to send request to " + parsed.host);
      offset += static_cast<std::size_t>(sent);
    }
    while (true) {
      ssize_t n = ::recv(sock.fd(), buffer, sizeof(buffer), 0);
      if (n < 0 && errno == EINTR)
        continue;
      if (n < 0 && raw.empty())
        throw std::runtime_error("no response from " + parsed.host + ": " +
                                 std::strerror(errno));
      if (n <= 0)
        break;
      raw.append(buffer, static_cast<std::size_t>(n));
    }
  }

  if (raw.empty())
    throw std::runtime_error("empty response from " + parsed.host);
  return ParseHttpResponse(raw);
}

} // namespace sweepflux
