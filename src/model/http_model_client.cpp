#include "injguard/model/http_model_client.h"

#include "injguard/core/errors.h"
#include "injguard/model/converse_envelope.h"

#include <curl/curl.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace injguard::model {

namespace {

// libcurl wants one process-wide init before any handle exists.
void ensure_curl_global_init() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw core::TransportError("curl_global_init failed");
    }
  });
}

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
  auto* out = static_cast<std::string*>(userp);
  out->append(data, size * nmemb);
  return size * nmemb;
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    if (curl != nullptr) {
      curl_easy_cleanup(curl);
    }
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    if (list != nullptr) {
      curl_slist_free_all(list);
    }
  }
};

// Provider errors usually carry {"message": "..."}; fall back to the raw body.
std::string error_detail(const std::string& body) {
  const auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
    return parsed["message"].get<std::string>();
  }
  return body;
}

}  // namespace

HttpModelClient::HttpModelClient(HttpModelClientOptions options)
    : options_(std::move(options)), backoff_(options_.retry), jitter_engine_(std::random_device{}()) {
  ensure_curl_global_init();
}

std::string HttpModelClient::converse_url(const std::string& model_id) const {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw core::TransportError("curl_easy_init failed");
  }
  char* escaped = curl_easy_escape(curl.get(), model_id.c_str(), static_cast<int>(model_id.size()));
  if (escaped == nullptr) {
    throw core::TransportError("Failed to URL-encode model id");
  }
  std::string url = options_.endpoint;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  url += "/model/";
  url += escaped;
  url += "/converse";
  curl_free(escaped);
  return url;
}

HttpModelClient::HttpResponse HttpModelClient::post_once(const std::string& url,
                                                         const std::string& body) const {
  HttpResponse response;

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    response.error = "curl_easy_init failed";
    return response;
  }

  std::unique_ptr<curl_slist, SlistDeleter> headers;
  auto append_header = [&headers](const std::string& line) {
    curl_slist* next = curl_slist_append(headers.get(), line.c_str());
    if (next != nullptr) {
      (void)headers.release();
      headers.reset(next);
    }
  };
  append_header("Content-Type: application/json");
  append_header("Accept: application/json");
  if (options_.api_key.has_value()) {
    append_header("Authorization: Bearer " + options_.api_key.value());
  }

  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_POST, 1L);
  curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, options_.retry.connect_timeout_seconds);
  // Read timeout: abort when fewer than 1 byte/s arrives for read_timeout_seconds.
  curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, options_.retry.read_timeout_seconds);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

  const CURLcode rc = curl_easy_perform(h);
  if (rc != CURLE_OK) {
    response.error = curl_easy_strerror(rc);
    return response;
  }

  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
  response.transport_ok = true;
  return response;
}

nlohmann::json HttpModelClient::converse(const ConverseRequest& request) {
  const std::string url = converse_url(request.model_id);
  const std::string body = build_converse_body(request).dump();
  const int max_attempts = std::max(1, options_.retry.max_attempts);

  std::string last_error;
  long last_status = 0;

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    const HttpResponse response = post_once(url, body);

    if (response.transport_ok && response.status >= 200 && response.status < 300) {
      {
        std::lock_guard<std::mutex> lock(backoff_mutex_);
        backoff_.on_success();
      }
      auto envelope = nlohmann::json::parse(response.body, nullptr, false);
      if (envelope.is_discarded()) {
        throw core::InvalidValueError("Model response body is not valid JSON");
      }
      return envelope;
    }

    if (response.transport_ok) {
      last_status = response.status;
      last_error = "HTTP " + std::to_string(response.status) + ": " + error_detail(response.body);
      if (!is_retryable_status(response.status)) {
        throw core::TransportError("Model call failed: " + last_error, response.status);
      }
    } else {
      last_status = 0;
      last_error = response.error;
    }

    if (attempt == max_attempts) {
      break;
    }

    std::chrono::milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lock(backoff_mutex_);
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      delay = backoff_.next_delay(attempt, is_throttling_status(last_status), dist(jitter_engine_));
    }
    std::cerr << "Model call attempt " << attempt << "/" << max_attempts << " failed ("
              << last_error << "); retrying in " << delay.count() << " ms\n";
    std::this_thread::sleep_for(delay);
  }

  throw core::TransportError("Model call failed after " + std::to_string(max_attempts) +
                                 " attempts: " + last_error,
                             last_status);
}

}  // namespace injguard::model
