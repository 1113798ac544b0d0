#pragma once

#include <functional>
#include <string>

#include <curl/curl.h>

namespace scriptbox {

/**
 * Result of fetching a remote module source.
 */
struct FetchResponse {
  long status_code = 0;
  std::string body;
  std::string effective_url;  // URL after redirects
  std::string error;          // Transport error, empty when the request completed
  bool timed_out = false;     // Transfer hit its timeout
  bool aborted = false;       // Transfer stopped by the abort callback

  bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

/**
 * Base interface for remote module fetchers.
 */
class ModuleFetcher {
 public:
  virtual ~ModuleFetcher() = default;

  /**
   * GET a URL.
   * @param timeout_ms   Upper bound for the whole transfer
   * @param should_abort Polled during the transfer; returning true stops it
   */
  virtual FetchResponse Get(const std::string& url, long timeout_ms,
                            const std::function<bool()>& should_abort) = 0;
};

/**
 * ModuleFetcher over a libcurl easy handle. Not shared between threads.
 */
class CurlFetcher : public ModuleFetcher {
 public:
  CurlFetcher();
  ~CurlFetcher() override;

  CurlFetcher(const CurlFetcher&) = delete;
  CurlFetcher& operator=(const CurlFetcher&) = delete;

  FetchResponse Get(const std::string& url, long timeout_ms,
                    const std::function<bool()>& should_abort) override;

 private:
  CURL* curl_;

  static size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
  static int ProgressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                              curl_off_t ultotal, curl_off_t ulnow);
};

}  // namespace scriptbox
