#include "cmdgate/agent/assistant.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/observability/global.hpp"

#include <chrono>

namespace cmdgate::agent {

namespace {

constexpr const char *kCommandMarker = "COMMAND:";

std::string strip_markers(std::string line) {
  const std::string marker = kCommandMarker;
  std::size_t pos = 0;
  while ((pos = line.find(marker, pos)) != std::string::npos) {
    line.erase(pos, marker.size());
  }
  return common::trim(line);
}

} // namespace

CompletionSplit split_completion(const std::string &text) {
  CompletionSplit split;
  std::vector<std::string> prose_lines;
  for (const auto &line : common::split_lines(text)) {
    if (common::starts_with(common::trim(line), kCommandMarker)) {
      std::string command = strip_markers(line);
      if (!command.empty()) {
        split.commands.push_back(std::move(command));
      }
      continue;
    }
    prose_lines.push_back(line);
  }
  split.prose = common::trim(common::join(prose_lines, "\n"));
  return split;
}

std::string build_system_prompt(const std::string &os_type) {
  return "You are an assistant that runs commands on " + os_type +
         ". When a command needs to be run, write it on its own line in the format: "
         "COMMAND: <command>";
}

Assistant::Assistant(std::shared_ptr<providers::Provider> provider, AssistantOptions options)
    : provider_(std::move(provider)), options_(std::move(options)) {}

providers::ChatRequest Assistant::build_request(const std::string &question,
                                                const history::ConversationHistory &conversation) const {
  providers::ChatRequest request;
  request.model = options_.model;
  request.temperature = options_.temperature;
  request.messages.push_back({.role = "system", .content = build_system_prompt(options_.os_type)});
  request.messages.push_back(
      {.role = "system", .content = "History: " + conversation.recent_context(options_.context_entries)});
  request.messages.push_back({.role = "user", .content = question});
  return request;
}

common::Result<AssistantReply> Assistant::ask(const std::string &question,
                                              history::ConversationHistory &conversation) {
  if (provider_ == nullptr) {
    return common::Result<AssistantReply>::failure("no completion provider configured");
  }

  const auto started = std::chrono::steady_clock::now();
  auto completion = provider_->chat(build_request(question, conversation));
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_completion(options_.model, elapsed, completion.ok());
  if (!completion.ok()) {
    return common::Result<AssistantReply>::failure(completion.error());
  }

  AssistantReply reply;
  reply.text = completion.take();
  reply.split = split_completion(reply.text);

  conversation.append(history::Role::User, question);
  conversation.append(history::Role::Assistant, reply.text);
  return common::Result<AssistantReply>::success(std::move(reply));
}

} // namespace cmdgate::agent
