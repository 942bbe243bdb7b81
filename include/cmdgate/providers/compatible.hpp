#pragma once

#include "cmdgate/providers/traits.hpp"

#include <memory>
#include <string>

namespace cmdgate::providers {

/// OpenAI-compatible `/chat/completions` client.
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     std::uint64_t timeout_ms = 60'000);

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] static std::string build_body(const ChatRequest &request);

private:
  [[nodiscard]] common::Status validate_response_status(const HttpResponse &response) const;

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  std::uint64_t timeout_ms_;
};

} // namespace cmdgate::providers
