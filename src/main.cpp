#include "ask_coordinator.hpp"
#include "ask_tool.hpp"
#include "callback_listener.hpp"
#include "companion_connector.hpp"
#include "config.hpp"
#include "mcp_server.hpp"
#include "request_registry.hpp"
#include "tooling.hpp"

#include <cstdlib>
#include <iostream>

#ifndef ASK_CONTINUE_VERSION
#define ASK_CONTINUE_VERSION "0.1.0"
#endif

int main() {
  std::cerr.setf(std::ios::unitbuf);

  const auto cfg = ask_continue::DefaultBridgeConfig();
  std::cerr << "[bridge] version=" << ASK_CONTINUE_VERSION << " port_file_dir=" << cfg.port_file_dir
            << " default_companion_port=" << cfg.default_companion_port << "\n";

  ask_continue::RequestRegistry registry;
  ask_continue::CallbackListener listener(cfg, &registry);
  listener.Start();

  const auto state = listener.WaitUntilReady();
  if (state == ask_continue::ListenerState::kBound) {
    std::cerr << "[bridge] callback port=" << listener.Port() << "\n";
  } else {
    std::cerr << "[listener] FATAL callback listener could not bind: " << listener.FailureDetail()
              << " (every ask_continue call will fail until restart)\n";
  }

  ask_continue::CompanionConnector connector(cfg);
  ask_continue::AskCoordinator coordinator(&registry, &connector, &listener);

  ask_continue::ToolRegistry tools;
  ask_continue::RegisterAskContinueTool(&tools, &coordinator);

  ask_continue::McpStdioServer server(&tools, "ask-continue-mcp", ASK_CONTINUE_VERSION);
  std::cerr << "[bridge] serving MCP on stdio\n";
  server.Run(std::cin, std::cout);

  listener.Stop();
  std::cerr << "[bridge] shutdown pending=" << registry.Size() << "\n";
  std::cout.flush();
  // Pending asks are abandoned; detached tool workers may still hold
  // pointers to the objects above, so skip their destructors.
  std::quick_exit(0);
}
