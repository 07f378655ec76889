#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <mutex>
#include <vector>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

std::once_flag g_curl_init;
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    std::call_once(g_curl_init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  ~CurlHttpClient() override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (CURL* h : idle_) curl_easy_cleanup(h);
    idle_.clear();
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const HttpHeaders& headers,
                    int timeout_ms) override {
    return Perform(url, &body, headers, timeout_ms);
  }

  HttpResponse Get(const std::string& url,
                   const HttpHeaders& headers,
                   int timeout_ms) override {
    return Perform(url, nullptr, headers, timeout_ms);
  }

private:
  // Handles keep their connection cache, so reusing them keeps TCP/TLS sessions warm.
  CURL* Acquire() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!idle_.empty()) {
        CURL* h = idle_.back();
        idle_.pop_back();
        curl_easy_reset(h);
        return h;
      }
    }
    return curl_easy_init();
  }

  void Release(CURL* h) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(idle_.size()) < tuning_.num_handles) {
      idle_.push_back(h);
      return;
    }
    curl_easy_cleanup(h);
  }

  void ApplyTuning(CURL* curl, int timeout_ms) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning_.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, tuning_.tcp_nodelay ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    curl_easy_setopt(curl, CURLOPT_MAXAGE_CONN, static_cast<long>(tuning_.max_idle_connection_s));
    if (tuning_.enable_http2) curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (!tuning_.verify_tls) {
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
  }

  HttpResponse Perform(const std::string& url,
                       const std::string* body,
                       const HttpHeaders& headers,
                       int timeout_ms) {
    HttpResponse resp;
    CURL* curl = Acquire();
    if (!curl) {
      resp.error = "curl_easy_init failed";
      Logger::Error(resp.error);
      return resp;
    }
    std::string response_string;
    struct curl_slist* header_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (body) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else {
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
    ApplyTuning(curl, timeout_ms);
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      resp.error = curl_easy_strerror(rc);
      resp.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
      Logger::Warning("curl_easy_perform failed for " + url + ": " + resp.error);
    } else {
      long code = 0;
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
      resp.status = code;
      resp.body = std::move(response_string);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    if (header_list) curl_slist_free_all(header_list);
    Release(curl);
    return resp;
  }

  HttpClientTuning tuning_;
  std::mutex mutex_;
  std::vector<CURL*> idle_;
};

HttpClient* CreateCurlHttpClient() {
  return new CurlHttpClient(HttpClientTuning());
}

HttpClient* CreateCurlHttpClientTuned(const HttpClientTuning& tuning) {
  return new CurlHttpClient(tuning);
}
