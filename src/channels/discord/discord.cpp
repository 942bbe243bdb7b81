#include "cmdgate/channels/discord/discord.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/common/json_util.hpp"
#include "cmdgate/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace cmdgate::channels::discord {

namespace {

constexpr std::uint64_t kRequestTimeoutMs = 15000;
constexpr std::size_t kFetchLimit = 50;

struct IncomingMessage {
  std::string id;
  std::string content;
  std::string author_id;
  std::string author_name;
  bool author_is_bot = false;
};

std::vector<IncomingMessage> parse_messages(const std::string &body) {
  std::vector<IncomingMessage> out;
  for (const auto &object : common::json_split_top_level_objects(common::trim(body))) {
    auto fields = common::json_parse_flat(object);
    IncomingMessage message;
    message.id = fields["id"];
    message.content = fields["content"];
    if (message.id.empty()) {
      continue;
    }
    const std::string author = fields["author"];
    if (!author.empty()) {
      auto author_fields = common::json_parse_flat(author);
      message.author_id = author_fields["id"];
      message.author_name = author_fields["username"];
      message.author_is_bot = common::json_get_bool(author, "bot", false);
    }
    out.push_back(std::move(message));
  }
  std::sort(out.begin(), out.end(), [](const IncomingMessage &a, const IncomingMessage &b) {
    return snowflake_less(a.id, b.id);
  });
  return out;
}

} // namespace

bool snowflake_less(const std::string &lhs, const std::string &rhs) {
  if (lhs.size() != rhs.size()) {
    return lhs.size() < rhs.size();
  }
  return lhs < rhs;
}

std::vector<std::string> split_message(const std::string &text, const std::size_t max_chars) {
  std::vector<std::string> parts;
  if (max_chars == 0) {
    return parts;
  }
  std::size_t pos = 0;
  while (pos < text.size()) {
    // Window of max_chars code points; end lands on a sequence boundary.
    std::size_t end = common::utf8_advance(text, pos, max_chars);
    if (end < text.size()) {
      // Prefer breaking at a newline inside the window.
      const auto newline = text.rfind('\n', end - 1);
      if (newline != std::string::npos && newline > pos) {
        end = newline + 1;
      }
    }
    parts.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return parts;
}

DiscordChannel::DiscordChannel(DiscordOptions options,
                               std::shared_ptr<providers::HttpClient> http_client)
    : options_(std::move(options)), allowlist_(options_.allowed_users),
      http_client_(std::move(http_client)) {
  options_.bot_token = common::trim(options_.bot_token);
  options_.channel_id = common::trim(options_.channel_id);
  while (!options_.api_base.empty() && options_.api_base.back() == '/') {
    options_.api_base.pop_back();
  }
}

DiscordChannel::~DiscordChannel() { stop(); }

std::string_view DiscordChannel::name() const { return "discord"; }

common::Status DiscordChannel::start() {
  if (running_.load()) {
    return common::Status::success();
  }
  if (http_client_ == nullptr) {
    return common::Status::error("discord http client unavailable");
  }
  if (options_.bot_token.empty()) {
    return common::Status::error("discord bot_token is required");
  }
  if (options_.channel_id.empty()) {
    return common::Status::error("discord channel_id is required");
  }

  healthy_.store(true);
  running_.store(true);
  poll_thread_ = std::thread([this] { poll_loop(); });
  return common::Status::success();
}

void DiscordChannel::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  if (poll_thread_.joinable()) {
    poll_thread_.join();
  }
}

void DiscordChannel::poll_loop() {
  while (running_.load()) {
    const auto status = poll_once();
    if (!status.ok()) {
      observability::record_error("discord", status.error());
    }
    if (!healthy_.load()) {
      running_.store(false);
      break;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    stop_cv_.wait_for(lock, std::chrono::milliseconds(options_.poll_interval_ms),
                      [this] { return !running_.load(); });
  }
}

providers::HttpHeaders DiscordChannel::auth_headers() const {
  return {{"Authorization", "Bot " + options_.bot_token}, {"Content-Type", "application/json"}};
}

common::Status DiscordChannel::poll_once() {
  std::string after;
  bool baseline = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    after = last_seen_id_;
    baseline = !baseline_done_;
  }

  std::string url = options_.api_base + "/channels/" + options_.channel_id + "/messages?limit=";
  if (baseline) {
    url += "1";
  } else {
    url += std::to_string(kFetchLimit);
    if (!after.empty()) {
      url += "&after=" + after;
    }
  }

  const auto response = http_client_->get(url, auth_headers(), kRequestTimeoutMs);
  if (auto status = check_response(response, "discord poll"); !status.ok()) {
    if (response.status == 401 || response.status == 403 || response.status == 404) {
      healthy_.store(false);
    }
    return status;
  }

  const auto messages = parse_messages(response.body);
  MessageCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &message : messages) {
      if (last_seen_id_.empty() || snowflake_less(last_seen_id_, message.id)) {
        last_seen_id_ = message.id;
      }
    }
    baseline_done_ = true;
    callback = callback_;
  }
  if (baseline || !callback) {
    return common::Status::success();
  }

  for (const auto &message : messages) {
    if (message.author_is_bot || common::trim(message.content).empty()) {
      continue;
    }
    if (!is_allowed(message.author_name, message.author_id)) {
      continue;
    }
    ChannelMessage incoming;
    incoming.id = message.id;
    incoming.sender = message.author_name.empty() ? message.author_id : message.author_name;
    incoming.recipient = options_.channel_id;
    incoming.content = message.content;
    incoming.channel = "discord";
    incoming.timestamp = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
    callback(incoming);
  }
  return common::Status::success();
}

std::string DiscordChannel::last_seen_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_seen_id_;
}

bool DiscordChannel::is_allowed(const std::string &username, const std::string &user_id) const {
  if (options_.allowed_users.empty()) {
    return true;
  }
  return allowlist_.admits_any({username, user_id});
}

common::Status DiscordChannel::send(const std::string &recipient, const std::string &message) {
  const std::string payload = common::trim(message);
  if (payload.empty()) {
    return common::Status::error("discord text is required");
  }
  const std::string channel_id =
      common::trim(recipient).empty() ? options_.channel_id : common::trim(recipient);
  if (channel_id.empty()) {
    return common::Status::error("discord recipient channel id is required");
  }

  for (const auto &part : split_message(payload)) {
    std::ostringstream body;
    body << "{\"content\":\"" << common::json_escape(part) << "\"}";
    const auto response =
        http_client_->post_json(options_.api_base + "/channels/" + channel_id + "/messages",
                                auth_headers(), body.str(), kRequestTimeoutMs);
    if (auto status = check_response(response, "discord send message"); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

void DiscordChannel::on_message(MessageCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
}

bool DiscordChannel::health_check() { return healthy_.load(); }

common::Status DiscordChannel::check_response(const providers::HttpResponse &response,
                                              const std::string_view operation) const {
  if (response.timeout) {
    return common::Status::error(std::string(operation) + " timeout");
  }
  if (response.network_error) {
    return common::Status::error(std::string(operation) + " network error: " +
                                 response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    std::string body = common::trim(response.body);
    if (body.size() > 200) {
      body.resize(200);
    }
    return common::Status::error(std::string(operation) + " failed status=" +
                                 std::to_string(response.status) + " body=" + body);
  }
  return common::Status::success();
}

} // namespace cmdgate::channels::discord
