#include "cmdgate/providers/compatible.hpp"

#include "cmdgate/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace cmdgate::providers {

namespace {

common::Result<std::string> provider_error_result(const ProviderError &error) {
  return common::Result<std::string>::failure(error.to_string());
}

std::optional<std::uint64_t> parse_retry_after(const std::string &value) {
  std::uint64_t parsed = 0;
  const auto *begin = value.data();
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const std::uint64_t timeout_ms)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::name() const { return name_; }

std::string CompatibleProvider::build_body(const ChatRequest &request) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"messages\":[";
  for (std::size_t i = 0; i < request.messages.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    const auto &message = request.messages[i];
    body << "{\"role\":\"" << common::json_escape(message.role) << "\",\"content\":\""
         << common::json_escape(message.content) << "\"}";
  }
  body << "],";
  body << "\"temperature\":" << request.temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Status CompatibleProvider::validate_response_status(const HttpResponse &response) const {
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}.to_string());
  }

  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }

  if (response.status == 401 || response.status == 403) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::AuthError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }

  if (response.status == 404) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ModelNotFound,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }

  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    if (auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      error.retry_after = parse_retry_after(it->second);
    }
    return common::Status::error(error.to_string());
  }

  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ApiError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }

  return common::Status::success();
}

common::Result<std::string> CompatibleProvider::chat(const ChatRequest &request) {
  if (api_key_.empty()) {
    return provider_error_result(
        {.code = ProviderErrorCode::AuthError, .message = "missing API key"});
  }

  const HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response =
      http_client_->post_json(base_url_ + "/chat/completions", headers, build_body(request),
                              timeout_ms_);
  auto status = validate_response_status(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return provider_error_result(
        {.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return parsed;
}

} // namespace cmdgate::providers
