#include "cmdgate/dispatch/dispatcher.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/observability/global.hpp"

#include <cctype>

namespace cmdgate::dispatch {

namespace {

constexpr std::size_t kHistoryDisplayChars = 100;

Reply execution_reply(const std::string &command, const exec::ExecutionResult &result) {
  if (!result.succeeded) {
    Reply reply = error_reply(result.timed_out ? gate::GateErrorKind::ExecutionTimeout
                                               : gate::GateErrorKind::ExecutionLaunchFailure,
                              result.error_message);
    reply.command = command;
    reply.result = result;
    return reply;
  }
  Reply reply;
  reply.kind = ReplyKind::ExecutionResult;
  reply.command = command;
  reply.result = result;
  return reply;
}

} // namespace

std::optional<ParsedAction> parse_action(const std::string &text, const std::string &prefix) {
  const std::string trimmed = common::trim(text);
  if (prefix.empty() || !common::starts_with(trimmed, prefix)) {
    return std::nullopt;
  }

  const std::string body = trimmed.substr(prefix.size());
  std::size_t name_end = 0;
  while (name_end < body.size() && std::isspace(static_cast<unsigned char>(body[name_end])) == 0) {
    ++name_end;
  }

  ParsedAction parsed;
  parsed.name = common::to_lower(body.substr(0, name_end));
  parsed.argument = common::trim(body.substr(name_end));
  return parsed;
}

Dispatcher::Dispatcher(DispatcherOptions options, std::shared_ptr<gate::CommandGate> gate,
                       std::shared_ptr<agent::Assistant> assistant,
                       std::shared_ptr<history::HistoryStore> histories)
    : options_(std::move(options)), gate_(std::move(gate)), assistant_(std::move(assistant)),
      histories_(std::move(histories)) {}

common::Status Dispatcher::init() {
  const std::vector<ActionSpec> builtins = {
      {.name = "ask",
       .usage = "ask <question>",
       .description = "ask the assistant; suggested commands go through the gate",
       .handler = [this](const ActionContext &ctx) { handle_ask(ctx); }},
      {.name = "exec",
       .usage = "exec <command>",
       .description = "run a command, asking for approval when it looks dangerous",
       .handler = [this](const ActionContext &ctx) { handle_exec(ctx); }},
      {.name = "approve",
       .usage = "approve <id>",
       .description = "run a command that is waiting for approval",
       .handler = [this](const ActionContext &ctx) { handle_approve(ctx); }},
      {.name = "history",
       .usage = "history",
       .description = "show the latest conversation entries",
       .handler = [this](const ActionContext &ctx) { handle_history(ctx); }},
      {.name = "clear",
       .usage = "clear",
       .description = "forget the conversation",
       .handler = [this](const ActionContext &ctx) { handle_clear(ctx); }},
      {.name = "pending",
       .usage = "pending",
       .description = "list commands waiting for approval",
       .handler = [this](const ActionContext &ctx) { handle_pending(ctx); }},
      {.name = "help",
       .usage = "help",
       .description = "list the available actions",
       .handler = [this](const ActionContext &ctx) { handle_help(ctx); }},
  };

  for (const auto &spec : builtins) {
    if (auto status = registry_.add(spec); !status.ok()) {
      return status;
    }
  }
  return registry_.validate(required_actions());
}

bool Dispatcher::handle(const std::string &session_key, const std::string &text,
                        const ReplySink &sink) {
  const auto parsed = parse_action(text, options_.prefix);
  if (!parsed.has_value()) {
    return false;
  }

  const ActionSpec *spec = registry_.find(parsed->name);
  if (spec == nullptr) {
    Reply reply;
    reply.kind = ReplyKind::Unrecognized;
    reply.text = "unrecognized command: " + parsed->name;
    sink(reply);
    return true;
  }

  spec->handler(ActionContext{.session_key = session_key, .argument = parsed->argument, .sink = sink});
  return true;
}

void Dispatcher::handle_ask(const ActionContext &ctx) {
  if (ctx.argument.empty()) {
    ctx.sink(error_reply(gate::GateErrorKind::PolicyRejection,
                         "usage: " + options_.prefix + "ask <question>"));
    return;
  }
  if (assistant_ == nullptr) {
    ctx.sink(error_reply(gate::GateErrorKind::CompletionFailure, "no assistant configured"));
    return;
  }

  ctx.sink(info_reply("processing request..."));
  auto history = histories_->get(ctx.session_key);
  auto answer = assistant_->ask(ctx.argument, *history);
  if (!answer.ok()) {
    observability::record_error("assistant", answer.error());
    ctx.sink(error_reply(gate::GateErrorKind::CompletionFailure,
                         "completion failed: " + answer.error()));
    return;
  }

  const auto &split = answer.value().split;
  if (!split.prose.empty()) {
    Reply reply;
    reply.kind = ReplyKind::AiText;
    reply.text = split.prose;
    ctx.sink(reply);
  } else if (split.commands.empty()) {
    ctx.sink(info_reply("the assistant returned an empty response"));
  }

  for (const auto &command : split.commands) {
    gate_command(command, ctx.sink);
  }
}

void Dispatcher::handle_exec(const ActionContext &ctx) {
  if (ctx.argument.empty()) {
    ctx.sink(error_reply(gate::GateErrorKind::PolicyRejection,
                         "usage: " + options_.prefix + "exec <command>"));
    return;
  }
  gate_command(ctx.argument, ctx.sink);
}

void Dispatcher::handle_approve(const ActionContext &ctx) {
  const std::string id = common::to_lower(common::trim(ctx.argument));
  auto ticket = id.empty() ? common::Result<security::ApprovalTicket>::failure("no id given")
                           : gate_->approve(id);
  if (!ticket.ok()) {
    ctx.sink(error_reply(gate::GateErrorKind::TicketNotFound,
                         "command not found or already executed"));
    return;
  }
  execute(ticket.value().command, ctx.sink);
}

void Dispatcher::handle_history(const ActionContext &ctx) {
  const auto entries = histories_->get(ctx.session_key)->snapshot();
  if (entries.empty()) {
    ctx.sink(info_reply("history is empty"));
    return;
  }

  const std::size_t start = entries.size() > options_.history_display_entries
                                ? entries.size() - options_.history_display_entries
                                : 0;
  std::string text = "conversation history:";
  for (std::size_t i = start; i < entries.size(); ++i) {
    text += "\n";
    text += entries[i].role == history::Role::User ? "[user] " : "[ai] ";
    text += common::truncate_with_marker(entries[i].content, kHistoryDisplayChars, "...");
  }
  ctx.sink(info_reply(std::move(text)));
}

void Dispatcher::handle_clear(const ActionContext &ctx) {
  histories_->get(ctx.session_key)->clear();
  ctx.sink(info_reply("history cleared"));
}

void Dispatcher::handle_pending(const ActionContext &ctx) {
  const auto tickets = gate_->pending();
  if (tickets.empty()) {
    ctx.sink(info_reply("no commands are waiting for approval"));
    return;
  }
  std::string text = "waiting for approval:";
  for (const auto &ticket : tickets) {
    text += "\n" + ticket.id + ": `" + ticket.command + "`";
  }
  ctx.sink(info_reply(std::move(text)));
}

void Dispatcher::handle_help(const ActionContext &ctx) {
  std::string text = "available actions:";
  for (const auto &spec : registry_.actions()) {
    text += "\n" + options_.prefix + spec.usage + " - " + spec.description;
  }
  ctx.sink(info_reply(std::move(text)));
}

void Dispatcher::gate_command(const std::string &command, const ReplySink &sink) {
  auto decision = gate_->evaluate(command);
  switch (decision.kind) {
  case gate::DecisionKind::Rejected:
    sink(error_reply(gate::GateErrorKind::PolicyRejection, decision.reason));
    return;
  case gate::DecisionKind::PendingApproval: {
    Reply reply;
    reply.kind = ReplyKind::ApprovalRequired;
    reply.command = decision.command;
    reply.ticket_id = decision.ticket_id;
    reply.risk_level = decision.classification.risk_level;
    reply.warnings = decision.classification.warnings;
    reply.error_kind = gate::GateErrorKind::UnsafeCommand;
    reply.text = options_.prefix + "approve " + decision.ticket_id;
    sink(reply);
    return;
  }
  case gate::DecisionKind::AutoRun:
    execute(decision.command, sink);
    return;
  }
}

void Dispatcher::execute(const std::string &command, const ReplySink &sink) {
  Reply executing;
  executing.kind = ReplyKind::Executing;
  executing.command = command;
  sink(executing);

  // The future is not kept; the worker delivers the result through the sink.
  auto submitted = gate_->dispatch(command, [sink, command](const exec::ExecutionResult &result) {
    sink(execution_reply(command, result));
  });
  if (!submitted.ok()) {
    observability::record_error("exec", submitted.error());
    sink(error_reply(gate::GateErrorKind::ExecutionLaunchFailure, submitted.error()));
  }
}

} // namespace cmdgate::dispatch
