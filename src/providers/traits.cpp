#include "cmdgate/providers/traits.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/common/json_util.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string_view>

#ifndef CMDGATE_VERSION
#define CMDGATE_VERSION "0.1.0"
#endif

namespace cmdgate::providers {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};
struct CurlSlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// curl_global_init is not thread-safe and must run once per process; the provider and the
// chat channel each own a client.
void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t append_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

// Header names are stored lowercased; status lines and blank lines carry no ':'.
size_t record_header(char *buffer, size_t size, size_t nitems, void *userdata) {
  const std::string_view line(buffer, size * nitems);
  const auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    auto &headers = *static_cast<HttpHeaders *>(userdata);
    headers[common::to_lower(common::trim(std::string(line.substr(0, colon))))] =
        common::trim(std::string(line.substr(colon + 1)));
  }
  return size * nitems;
}

HttpResponse perform(const std::string &url, const HttpHeaders &headers,
                     const std::string *body, const std::uint64_t timeout_ms) {
  ensure_curl_initialized();
  HttpResponse response;

  CurlEasy curl(curl_easy_init());
  if (!curl) {
    response.network_error = true;
    response.network_error_message = "unable to create curl handle";
    return response;
  }

  CurlSlist header_list;
  for (const auto &[name, value] : headers) {
    const std::string line = name + ": " + value;
    curl_slist *grown = curl_slist_append(header_list.get(), line.c_str());
    if (grown == nullptr) {
      response.network_error = true;
      response.network_error_message = "unable to build request headers";
      return response;
    }
    (void)header_list.release();
    header_list.reset(grown);
  }

  CURL *handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, "cmdgate/" CMDGATE_VERSION);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, record_header);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
  if (header_list) {
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
  }
  if (body != nullptr) {
    curl_easy_setopt(handle, CURLOPT_POST, 1L);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body->data());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
  } else {
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
  }

  if (const CURLcode code = curl_easy_perform(handle); code != CURLE_OK) {
    response.network_error = true;
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.network_error_message = curl_easy_strerror(code);
    return response;
  }
  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

} // namespace

std::string provider_error_code_name(const ProviderErrorCode code) {
  switch (code) {
  case ProviderErrorCode::ApiError:
    return "api";
  case ProviderErrorCode::NetworkError:
    return "network";
  case ProviderErrorCode::AuthError:
    return "auth";
  case ProviderErrorCode::RateLimitError:
    return "rate_limit";
  case ProviderErrorCode::ModelNotFound:
    return "model_not_found";
  case ProviderErrorCode::InvalidResponse:
    return "invalid_response";
  case ProviderErrorCode::Timeout:
    return "timeout";
  }
  return "unknown";
}

std::string ProviderError::to_string() const {
  std::string out = "Provider error [" + provider_error_code_name(code) + "]";
  if (status != 0) {
    out += " status=" + std::to_string(status);
  }
  if (retry_after.has_value()) {
    out += " retry_after=" + std::to_string(*retry_after);
  }
  if (!message.empty()) {
    out += " " + message;
  }
  return out;
}

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return perform(url, headers, &body, timeout_ms);
}

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms) {
  return perform(url, headers, nullptr, timeout_ms);
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  if (choices.empty()) {
    return common::Result<std::string>::failure("choices field missing");
  }
  const auto entries = common::json_split_top_level_objects(choices);
  if (entries.empty()) {
    return common::Result<std::string>::failure("choices array is empty");
  }

  const std::string message = common::json_get_object(entries.front(), "message");
  if (message.empty()) {
    return common::Result<std::string>::failure("choices[0].message missing");
  }
  if (message.find("\"content\"") == std::string::npos) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(common::json_get_string(message, "content"));
}

} // namespace cmdgate::providers
