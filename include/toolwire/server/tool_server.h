/**
 * @file tool_server.h
 * @brief JSON-RPC dispatcher serving a tool registry over one transport
 */

#ifndef TOOLWIRE_SERVER_TOOL_SERVER_H
#define TOOLWIRE_SERVER_TOOL_SERVER_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolwire/config/server_config.h"
#include "toolwire/event/event_loop.h"
#include "toolwire/server/admission_gate.h"
#include "toolwire/tools/tool_registry.h"
#include "toolwire/transport/transport.h"
#include "toolwire/types.h"

namespace toolwire {
namespace server {

enum class ServerState { Created, Running, Stopped };

const char* serverStateToString(ServerState state);

// params is null when the request carried none
using RequestHandler =
    std::function<json::JsonValue(const json::JsonValue& params)>;

using ResponseCallback = std::function<void(const jsonrpc::Response&)>;

/**
 * Tool server
 *
 * Built-in methods: initialize, initialized, tools/list, tools/call,
 * shutdown and ping. registerHandler() adds or replaces methods.
 *
 * Handlers run on a pool of max_concurrent_requests worker threads behind
 * an AdmissionGate of the same size. Each request runs under a deadline of
 * request_timeout; when it passes the caller gets a timeout error while the
 * handler keeps its slot until it returns. Destroying the server waits for
 * running handlers, so a handler that never returns blocks destruction.
 */
class ToolServer {
 public:
  explicit ToolServer(
      const config::ServerConfig& config = config::ServerConfig(),
      std::shared_ptr<tools::ToolRegistry> registry = nullptr);
  ~ToolServer();

  ToolServer(const ToolServer&) = delete;
  ToolServer& operator=(const ToolServer&) = delete;

  void registerTool(tools::ToolPtr tool);

  void registerHandler(const std::string& method, RequestHandler handler);

  bool hasHandler(const std::string& method) const;

  /**
   * Run the request through its handler and wait for the response. Unknown
   * methods, handler exceptions and timeouts come back as error responses.
   */
  jsonrpc::Response processRequest(const jsonrpc::Request& request);

  /**
   * Non-blocking form of processRequest() except for admission: blocks
   * while every slot is taken. callback runs exactly once, on the calling
   * thread for unknown methods, otherwise on a worker or timer thread.
   */
  void dispatchAsync(const jsonrpc::Request& request,
                     ResponseCallback callback);

  /**
   * Parse and process one message. Returns the serialized response for a
   * request carrying an id, nullopt for notifications and for responses or
   * bare messages. Malformed input yields an error response carrying the
   * message's id when it can be recovered.
   */
  optional<json::JsonValue> handleMessage(const json::JsonValue& raw);
  optional<json::JsonValue> handleMessage(const std::string& raw);

  /**
   * Serve transport until end of stream, shutdown or stop(). The transport
   * is closed on every exit path and the server ends Stopped.
   *
   * @throws transport::TransportException on a read or write failure;
   *         any other exception escaping the loop is rethrown after cleanup
   */
  void run(transport::Transport& transport);

  /**
   * Stop serving. A run() blocked on input is woken through
   * Transport::interrupt(); a message already being read is finished first.
   * Async-signal-safe.
   */
  void stop();

  ServerState state() const { return state_; }
  bool isRunning() const { return running_; }

  const config::ServerConfig& config() const { return config_; }
  tools::ToolRegistry& registry() { return *registry_; }

 private:
  void registerBuiltinHandlers();
  RequestHandler findHandler(const std::string& method) const;

  json::JsonValue handleInitialize(const json::JsonValue& params);
  json::JsonValue handleInitialized(const json::JsonValue& params);
  json::JsonValue handleListTools(const json::JsonValue& params);
  json::JsonValue handleCallTool(const json::JsonValue& params);
  json::JsonValue handleShutdown(const json::JsonValue& params);
  json::JsonValue handlePing(const json::JsonValue& params);

  void armTimer(uint64_t serial, std::function<void()> on_expire);
  void disarmTimer(uint64_t serial);

  void serve(transport::Transport& transport);
  void dispatchFromLoop(transport::Transport& transport,
                        const json::JsonValue& raw);
  void sendFromLoop(transport::Transport& transport,
                    const jsonrpc::Response& response);
  void sendFromCallback(transport::Transport& transport,
                        const jsonrpc::Response& response);
  void finishInFlight();
  void waitForInFlight();

  config::ServerConfig config_;
  std::shared_ptr<tools::ToolRegistry> registry_;

  mutable std::mutex handlers_mutex_;
  std::unordered_map<std::string, RequestHandler> handlers_;

  std::atomic<ServerState> state_{ServerState::Created};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<transport::Transport*> active_transport_{nullptr};

  AdmissionGate gate_;
  std::mutex dispatch_mutex_;
  std::atomic<uint64_t> next_serial_{0};

  // Run-loop bookkeeping
  std::mutex send_mutex_;
  std::mutex in_flight_mutex_;
  std::condition_variable in_flight_done_;
  size_t in_flight_{0};
  std::exception_ptr send_failure_;

  event::DispatcherFactoryPtr dispatcher_factory_;
  event::ThreadPoolPtr pool_;
  event::WorkerPtr timer_worker_;
  // Only touched on the timer worker's thread; declared after it so the
  // timers are destroyed first
  std::map<uint64_t, event::TimerPtr> timers_;
};

/**
 * Build a server for config and register tools with it.
 */
std::unique_ptr<ToolServer> createServer(
    const config::ServerConfig& config,
    const std::vector<tools::ToolPtr>& tools = {});

}  // namespace server
}  // namespace toolwire

#endif  // TOOLWIRE_SERVER_TOOL_SERVER_H
