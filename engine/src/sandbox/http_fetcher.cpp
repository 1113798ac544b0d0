#include "sandbox/http_fetcher.h"

#include <mutex>

namespace scriptbox {

namespace {

// Module sources larger than this are refused
constexpr size_t kMaxModuleBytes = 16 * 1024 * 1024;

struct TransferState {
  std::string* body;
  const std::function<bool()>* should_abort;
  bool aborted = false;
};

void GlobalInitOnce() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

CurlFetcher::CurlFetcher() : curl_(nullptr) {
  GlobalInitOnce();
  curl_ = curl_easy_init();
}

CurlFetcher::~CurlFetcher() {
  if (curl_) {
    curl_easy_cleanup(curl_);
    curl_ = nullptr;
  }
}

size_t CurlFetcher::WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  size_t total = size * nmemb;
  auto* state = static_cast<TransferState*>(userdata);
  if (state->body->size() + total > kMaxModuleBytes) {
    return 0;  // Fails the transfer with CURLE_WRITE_ERROR
  }
  state->body->append(ptr, total);
  return total;
}

int CurlFetcher::ProgressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                  curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  auto* state = static_cast<TransferState*>(clientp);
  if (state->should_abort && *state->should_abort && (*state->should_abort)()) {
    state->aborted = true;
    return 1;
  }
  return 0;
}

FetchResponse CurlFetcher::Get(const std::string& url, long timeout_ms,
                               const std::function<bool()>& should_abort) {
  FetchResponse resp;
  resp.effective_url = url;

  if (!curl_) {
    resp.error = "CURL not initialized";
    return resp;
  }
  if (timeout_ms <= 0) {
    resp.timed_out = true;
    resp.error = "Timeout was reached";
    return resp;
  }

  // Reset curl handle for reuse
  curl_easy_reset(curl_);

  TransferState state{&resp.body, &should_abort};

  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &state);

  curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
  curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &state);

  // Follow redirects (registries redirect unpinned versions)
  curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl_, CURLOPT_PROTOCOLS_STR, "http,https");

  // SSL verification (enabled by default)
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

  curl_easy_setopt(curl_, CURLOPT_USERAGENT, "scriptbox/1.0");

  CURLcode res = curl_easy_perform(curl_);

  if (res != CURLE_OK) {
    resp.aborted = state.aborted || res == CURLE_ABORTED_BY_CALLBACK;
    resp.timed_out = res == CURLE_OPERATION_TIMEDOUT;
    resp.error = curl_easy_strerror(res);
    return resp;
  }

  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status_code);

  char* effective = nullptr;
  if (curl_easy_getinfo(curl_, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
    resp.effective_url = effective;
  }

  return resp;
}

}  // namespace scriptbox
