#include "cmdgate/dispatch/reply.hpp"

namespace cmdgate::dispatch {

std::string reply_kind_to_string(const ReplyKind kind) {
  switch (kind) {
  case ReplyKind::Info:
    return "info";
  case ReplyKind::AiText:
    return "ai_text";
  case ReplyKind::ApprovalRequired:
    return "approval_required";
  case ReplyKind::Executing:
    return "executing";
  case ReplyKind::ExecutionResult:
    return "execution_result";
  case ReplyKind::Error:
    return "error";
  case ReplyKind::Unrecognized:
    return "unrecognized";
  }
  return "info";
}

Reply info_reply(std::string text) {
  Reply reply;
  reply.kind = ReplyKind::Info;
  reply.text = std::move(text);
  return reply;
}

Reply error_reply(const gate::GateErrorKind kind, std::string text) {
  Reply reply;
  reply.kind = ReplyKind::Error;
  reply.error_kind = kind;
  reply.text = std::move(text);
  return reply;
}

std::string render_reply(const Reply &reply, const std::size_t output_budget) {
  switch (reply.kind) {
  case ReplyKind::Info:
    return reply.text;
  case ReplyKind::AiText:
    return "assistant:\n" + reply.text;
  case ReplyKind::ApprovalRequired: {
    std::string out = "potentially dangerous command\n";
    out += "command: `" + reply.command + "`\n";
    out += "risk level: " + security::risk_level_to_string(reply.risk_level) + "\n";
    if (!reply.warnings.empty()) {
      out += "warnings:\n";
      for (const auto &warning : reply.warnings) {
        out += "- " + warning + "\n";
      }
    }
    out += "\nto run it, send: `" + reply.text + "`";
    return out;
  }
  case ReplyKind::Executing:
    return "running command: `" + reply.command + "`";
  case ReplyKind::ExecutionResult:
    if (reply.result.has_value()) {
      return exec::render_execution_result(*reply.result, output_budget);
    }
    return reply.text;
  case ReplyKind::Error:
    return "error: " + reply.text;
  case ReplyKind::Unrecognized:
    return reply.text;
  }
  return reply.text;
}

} // namespace cmdgate::dispatch
