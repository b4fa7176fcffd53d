#pragma once

#include "ask_coordinator.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ask_continue {

constexpr const char* kAskContinueToolName = "ask_continue";

ToolSchema AskContinueToolSchema();

// MCP content for one finished ask.
nlohmann::json FormatAskOutcome(const AskOutcome& outcome);

void RegisterAskContinueTool(ToolRegistry* tools, AskCoordinator* coordinator);

}  // namespace ask_continue
