#include "ask_tool.hpp"

#include "reply_parser.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <utility>

namespace ask_continue {
namespace {

constexpr const char* kDefaultReason = "Task completed";
constexpr size_t kFilePreviewChars = 100;

constexpr const char* kContinueReminder =
    "Carry out the instructions above now. When you are done you MUST call ask_continue again; "
    "this is required and may not be skipped.";

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace

ToolSchema AskContinueToolSchema() {
  ToolSchema schema;
  schema.name = kAskContinueToolName;
  schema.description =
      "Ask the user whether to continue the conversation. Call this tool before ending every reply: "
      "at the start of a conversation, after completing any task and after answering any question. "
      "Even when you believe the conversation is over, call it and let the user decide. "
      "This tool is the only way the conversation can continue.";
  schema.input_schema = {
      {"type", "object"},
      {"properties",
       {{"reason",
         {{"type", "string"},
          {"description", "Short summary of the work just completed and why you are asking whether to continue"}}}}},
      {"required", {"reason"}}};
  return schema;
}

nlohmann::json FormatAskOutcome(const AskOutcome& outcome) {
  nlohmann::json content = nlohmann::json::array();
  switch (outcome.kind) {
    case AskOutcomeKind::kConnectFailed:
      content.push_back(TextContent(
          "The companion extension is not connected: " + outcome.text +
          "\n\nMake sure the Ask Continue extension is installed and running, then reload the editor window."
          "\n\nNote: this conversation continues; do not retry this tool call."));
      return content;
    case AskOutcomeKind::kCancelled:
      content.push_back(TextContent("The user cancelled the conversation."));
      return content;
    case AskOutcomeKind::kAnswered:
      break;
  }

  if (IsBlank(outcome.text)) {
    content.push_back(TextContent("The user chose to end the conversation."));
    return content;
  }

  auto parsed = ParseUserReply(outcome.text);
  if (parsed.attachments.empty()) {
    content.push_back(TextContent("The user wants to continue with these instructions:\n\n" + outcome.text +
                                  "\n\n" + kContinueReminder));
    return content;
  }

  if (!parsed.text.empty()) {
    content.push_back(TextContent("The user wants to continue with these instructions:\n\n" + parsed.text));
  } else {
    content.push_back(TextContent("The user wants to continue and attached files:"));
  }
  for (const auto& a : parsed.attachments) {
    if (a.IsImage()) {
      content.push_back(ImageContent(a.base64_data, a.mime_type));
      continue;
    }
    content.push_back(TextContent("\n[Attachment: " + a.name + "]\nType: " + a.mime_type +
                                  "\nContent (base64): " + a.base64_data.substr(0, kFilePreviewChars) +
                                  "...(truncated)"));
  }
  content.push_back(TextContent(std::string("\n\n") + kContinueReminder));
  return content;
}

void RegisterAskContinueTool(ToolRegistry* tools, AskCoordinator* coordinator) {
  auto schema = AskContinueToolSchema();
  const auto name = schema.name;
  tools->RegisterTool(std::move(schema), [coordinator, name](const std::string& tool_call_id,
                                                             const nlohmann::json& arguments) {
    ToolResult tr;
    tr.tool_call_id = tool_call_id;
    tr.name = name;

    std::string reason = kDefaultReason;
    if (arguments.is_object() && arguments.contains("reason") && arguments["reason"].is_string()) {
      auto r = arguments["reason"].get<std::string>();
      if (!r.empty()) reason = std::move(r);
    }

    auto outcome = coordinator->AskAndWait(reason);
    std::cerr << "[mcp] ask_continue id=" << tool_call_id << " outcome=" << AskOutcomeKindName(outcome.kind) << "\n";
    tr.content = FormatAskOutcome(outcome);
    return tr;
  });
}

}  // namespace ask_continue
