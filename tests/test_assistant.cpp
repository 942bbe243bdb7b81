#include "test_framework.hpp"

#include "cmdgate/agent/assistant.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_assistant_tests(std::vector<cmdgate::tests::TestCase> &tests) {
  using cmdgate::tests::require;
  namespace ag = cmdgate::agent;
  namespace hist = cmdgate::history;

  tests.push_back({"assistant_split_extracts_command_lines", [] {
                     const auto split = ag::split_completion(
                         "Here is how:\n  COMMAND: ls -la\nThat lists files.\nCOMMAND: df -h");
                     require(split.commands.size() == 2, "two commands");
                     require(split.commands[0] == "ls -la", "first command trimmed");
                     require(split.commands[1] == "df -h", "second command");
                     require(split.prose == "Here is how:\nThat lists files.", "prose kept");
                   }});

  tests.push_back({"assistant_split_ignores_inline_marker", [] {
                     const auto split = ag::split_completion("use COMMAND: syntax for commands");
                     require(split.commands.empty(), "marker must start the line");
                     require(!split.prose.empty(), "line stays prose");
                   }});

  tests.push_back({"assistant_split_drops_empty_command", [] {
                     const auto split = ag::split_completion("COMMAND:   \nok");
                     require(split.commands.empty(), "empty command dropped");
                     require(split.prose == "ok", "prose");
                   }});

  tests.push_back({"assistant_system_prompt_names_os", [] {
                     const auto prompt = ag::build_system_prompt("windows");
                     require(prompt.find("windows") != std::string::npos, "os type in prompt");
                     require(prompt.find("COMMAND: <command>") != std::string::npos,
                             "marker format explained");
                   }});

  tests.push_back({"assistant_request_layout", [] {
                     auto provider = std::make_shared<cmdgate::testing::MockProvider>();
                     ag::Assistant assistant(provider, ag::AssistantOptions{.model = "m1",
                                                                            .temperature = 0.2});
                     hist::ConversationHistory conversation;
                     conversation.append(hist::Role::User, "earlier");
                     const auto request = assistant.build_request("now?", conversation);
                     require(request.model == "m1", "model");
                     require(request.temperature == 0.2, "temperature");
                     require(request.messages.size() == 3, "system, history, user");
                     require(request.messages[0].role == "system", "system first");
                     require(request.messages[1].content == "History: User: earlier\n",
                             "history context");
                     require(request.messages[2].role == "user" &&
                                 request.messages[2].content == "now?",
                             "user last");
                   }});

  tests.push_back({"assistant_ask_appends_on_success", [] {
                     auto provider = std::make_shared<cmdgate::testing::MockProvider>();
                     provider->set_response("Sure.\nCOMMAND: uptime");
                     ag::Assistant assistant(provider, ag::AssistantOptions{});
                     hist::ConversationHistory conversation;
                     auto reply = assistant.ask("how long up?", conversation);
                     require(reply.ok(), "ask succeeds");
                     require(reply.value().split.commands.size() == 1, "one command");
                     const auto entries = conversation.snapshot();
                     require(entries.size() == 2, "question and answer stored");
                     require(entries[0].role == hist::Role::User &&
                                 entries[0].content == "how long up?",
                             "question first");
                     require(entries[1].content == "Sure.\nCOMMAND: uptime", "raw reply stored");
                   }});

  tests.push_back({"assistant_ask_failure_leaves_history", [] {
                     auto provider = std::make_shared<cmdgate::testing::MockProvider>();
                     provider->set_error("rate limited");
                     ag::Assistant assistant(provider, ag::AssistantOptions{});
                     hist::ConversationHistory conversation;
                     auto reply = assistant.ask("anything", conversation);
                     require(!reply.ok(), "failure propagates");
                     require(reply.error() == "rate limited", "error text");
                     require(conversation.size() == 0, "nothing appended");
                   }});

  tests.push_back({"assistant_without_provider_fails", [] {
                     ag::Assistant assistant(nullptr, ag::AssistantOptions{});
                     hist::ConversationHistory conversation;
                     require(!assistant.ask("q", conversation).ok(), "no provider");
                   }});
}
