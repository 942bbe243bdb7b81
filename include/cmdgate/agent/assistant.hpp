#pragma once

#include "cmdgate/common/result.hpp"
#include "cmdgate/history/history.hpp"
#include "cmdgate/providers/traits.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cmdgate::agent {

/// Completion text split into what to show and what to gate.
struct CompletionSplit {
  std::string prose;
  std::vector<std::string> commands;
};

/// Lines whose trimmed form starts with `COMMAND:` become commands; everything else is prose.
[[nodiscard]] CompletionSplit split_completion(const std::string &text);

[[nodiscard]] std::string build_system_prompt(const std::string &os_type);

struct AssistantOptions {
  std::string os_type = "linux";
  std::string model = "gpt-4o-mini";
  double temperature = 0.7;
  std::size_t context_entries = 5;
};

struct AssistantReply {
  std::string text;
  CompletionSplit split;
};

class Assistant {
public:
  Assistant(std::shared_ptr<providers::Provider> provider, AssistantOptions options);

  [[nodiscard]] providers::ChatRequest build_request(const std::string &question,
                                                     const history::ConversationHistory &conversation) const;

  /// On success the question and the reply are appended to `conversation`; on failure it is
  /// left untouched.
  [[nodiscard]] common::Result<AssistantReply> ask(const std::string &question,
                                                   history::ConversationHistory &conversation);

private:
  std::shared_ptr<providers::Provider> provider_;
  AssistantOptions options_;
};

} // namespace cmdgate::agent
