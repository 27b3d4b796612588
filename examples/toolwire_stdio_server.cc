/**
 * @file toolwire_stdio_server.cc
 * @brief Tool server speaking Content-Length framed JSON-RPC over stdio
 *
 * Usage: toolwire_stdio_server [--config <file>]
 *
 * Protocol traffic uses stdin/stdout; logging goes to stderr unless the
 * configuration names a log_file. The server exits on end of input, after a
 * shutdown request, or on SIGINT/SIGTERM.
 */

#define TOOLWIRE_LOG_COMPONENT "stdio_server"

#include <signal.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "toolwire/config/config_loader.h"
#include "toolwire/logging/log_macros.h"
#include "toolwire/server/tool_server.h"
#include "toolwire/tools/tool.h"
#include "toolwire/transport/stream_transport.h"

using namespace toolwire;

namespace {

server::ToolServer* g_server = nullptr;

void signalHandler(int signal) {
  if ((signal == SIGINT || signal == SIGTERM) && g_server) {
    g_server->stop();
  }
}

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " [--config <file>]\n";
}

std::vector<tools::ToolPtr> exampleTools() {
  auto echo = tools::ToolBuilder("echo")
                  .description("Echo the given text back")
                  .parameter("text", "string", "Text to echo", true)
                  .handler([](const json::JsonValue& args) {
                    return ToolResult::text(args["text"].getString(""));
                  })
                  .build();

  auto add = tools::ToolBuilder("add")
                 .description("Add two numbers")
                 .parameter("a", "number", "First operand", true)
                 .parameter("b", "number", "Second operand", true)
                 .handler([](const json::JsonValue& args) {
                   const auto& a = args["a"];
                   const auto& b = args["b"];
                   if (!a.isNumber() || !b.isNumber()) {
                     return ToolResult::failure("a and b must be numbers");
                   }
                   if (a.isInteger() && b.isInteger()) {
                     return ToolResult::structured(json::JsonValue(
                         a.getInt64() + b.getInt64()));
                   }
                   return ToolResult::structured(
                       json::JsonValue(a.getFloat() + b.getFloat()));
                 })
                 .build();

  return {echo, add};
}

}  // namespace

int main(int argc, char* argv[]) {
  config::ConfigLoader::Options options;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      options.explicit_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  // A closed stdout must surface as a write error, not kill the process
  signal(SIGPIPE, SIG_IGN);
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  config::ServerConfig server_config;
  try {
    server_config = config::ConfigLoader(options).load();
    config::configureLogging(server_config);
  } catch (const config::ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  }

  auto tool_server = server::createServer(server_config, exampleTools());
  g_server = tool_server.get();

  int exit_code = 0;
  try {
    auto stdio = transport::StreamTransport::createStdio();
    tool_server->run(*stdio);
  } catch (const transport::TransportException& e) {
    TOOLWIRE_LOG(Error, "Server terminated: {}", e.what());
    exit_code = 1;
  }

  g_server = nullptr;
  return exit_code;
}
