#pragma once
#include <string>
#include <unordered_map>

// status == 0 means the request never got an HTTP response; error says why.
struct HttpResponse {
  long status = 0;
  std::string body;
  std::string error;
  bool timed_out = false;

  bool Ok() const { return status >= 200 && status < 300; }
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const HttpHeaders& headers,
                            int timeout_ms) = 0;
  virtual HttpResponse Get(const std::string& url,
                           const HttpHeaders& headers,
                           int timeout_ms) = 0;
};

// Tuning knobs for persistent HTTP client behavior
struct HttpClientTuning {
  int num_handles = 8;           // idle easy handles kept for connection reuse
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  bool tcp_nodelay = true;       // no write coalescing
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  int max_idle_connection_s = 30; // drop pooled connections idle longer than this
  int connect_timeout_ms = 2000;
  bool verify_tls = true;
};

// Factory for a libcurl-based client
HttpClient* CreateCurlHttpClient();
HttpClient* CreateCurlHttpClientTuned(const HttpClientTuning& tuning);
