#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

struct HttpResponse {
  long status = 0;
  std::string body;
};

// ============================================================================
// HttpClient - libcurl easy 句柄的封装
//
// 非线程安全: 每个线程持有自己的实例。所有请求带超时,
// 传输层失败 (DNS / 连接 / 超时) 抛 std::runtime_error。
// ============================================================================
class HttpClient {
public:
  explicit HttpClient(int timeout_seconds = 30) : timeout_seconds_(timeout_seconds) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
      curl_global_cleanup();
      throw std::runtime_error("curl 初始化失败");
    }
  }

  ~HttpClient() {
    if (curl_) {
      curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
  }

  // 禁止拷贝
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse get(const std::string &url, const std::vector<std::string> &headers = {}) {
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    return perform(url, headers);
  }

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers = {}) {
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    return perform(url, headers);
  }

  // long poll 需要临时放宽超时
  void set_timeout(int timeout_seconds) { timeout_seconds_ = timeout_seconds; }
  int timeout() const { return timeout_seconds_; }

private:
  HttpResponse perform(const std::string &url, const std::vector<std::string> &headers) {
    HttpResponse response;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "kaiawatch/1.0");

    // 设置请求头
    struct curl_slist *header_list = nullptr;
    for (const auto &h : headers) {
      header_list = curl_slist_append(header_list, h.c_str());
    }
    if (header_list) {
      curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    // 执行请求
    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
      throw std::runtime_error(std::string("HTTP 请求失败: ") + curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
  }

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
    size_t total = size * nmemb;
    userp->append(static_cast<char *>(contents), total);
    return total;
  }

  CURL *curl_ = nullptr;
  int timeout_seconds_;
};
