#define TOOLWIRE_LOG_COMPONENT "server"

#include "toolwire/server/tool_server.h"

#include <cmath>
#include <future>
#include <stdexcept>

#include <fmt/format.h>

#include "toolwire/json/json_serialization.h"
#include "toolwire/logging/log_macros.h"
#include "toolwire/protocol/message.h"

namespace toolwire {
namespace server {

namespace {

// Whole seconds keep one decimal ("60.0"), others print shortest ("0.25")
std::string formatSeconds(double seconds) {
  if (seconds == std::floor(seconds)) {
    return fmt::format("{:.1f}", seconds);
  }
  return fmt::format("{}", seconds);
}

constexpr const char* kProtocolVersion = "2024-11-05";

std::string idToString(const optional<RequestId>& id) {
  if (!id) {
    return "null";
  }
  if (holds_alternative<int64_t>(*id)) {
    return std::to_string(get<int64_t>(*id));
  }
  return get<std::string>(*id);
}

logging::LogContext requestContext(const jsonrpc::Request& request) {
  logging::LogContext ctx;
  ctx.request_id = idToString(request.id);
  ctx.method_name = request.method;
  ctx.component = logging::Component::Server;
  ctx.component_name = TOOLWIRE_LOG_COMPONENT;
  return ctx;
}

json::JsonValue textContent(const std::string& text) {
  return json::JsonArrayBuilder()
      .add(json::JsonObjectBuilder()
               .add("type", "text")
               .add("text", text)
               .build())
      .build();
}

json::JsonValue callToolError(const std::string& message) {
  return json::JsonObjectBuilder()
      .add("content", textContent("Error: " + message))
      .add("isError", true)
      .build();
}

std::string renderContent(const ToolResult& result) {
  if (result.content_type == ContentType::Json) {
    return result.content.toString(true);
  }
  if (result.content.isString()) {
    return result.content.getString();
  }
  return result.content.toString();
}

/**
 * One dispatched request. Whichever of the handler and the deadline timer
 * settles first delivers the response; the other is discarded.
 */
class PendingRequest {
 public:
  PendingRequest(const optional<RequestId>& id, ResponseCallback callback)
      : id_(id), callback_(std::move(callback)) {}

  bool settle(const jsonrpc::Response& response) {
    ResponseCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (settled_) {
        return false;
      }
      settled_ = true;
      callback.swap(callback_);
    }
    callback(response);
    return true;
  }

  bool isSettled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settled_;
  }

  const optional<RequestId>& id() const { return id_; }

 private:
  const optional<RequestId> id_;
  mutable std::mutex mutex_;
  bool settled_{false};
  ResponseCallback callback_;
};

}  // namespace

const char* serverStateToString(ServerState state) {
  switch (state) {
    case ServerState::Created:
      return "created";
    case ServerState::Running:
      return "running";
    case ServerState::Stopped:
      return "stopped";
  }
  return "unknown";
}

ToolServer::ToolServer(const config::ServerConfig& config,
                       std::shared_ptr<tools::ToolRegistry> registry)
    : config_(config),
      registry_(registry ? std::move(registry)
                         : std::make_shared<tools::ToolRegistry>()),
      gate_(config.max_concurrent_requests > 0
                ? static_cast<size_t>(config.max_concurrent_requests)
                : 1) {
  config_.validate();

  dispatcher_factory_ = event::createLibeventDispatcherFactory();

  auto handler_workers = event::createDefaultWorkerFactory("handler");
  pool_ = event::createThreadPool();
  pool_->initialize(gate_.capacity(), *dispatcher_factory_, *handler_workers);
  pool_->start();

  auto timer_workers = event::createDefaultWorkerFactory("timer");
  timer_worker_ = timer_workers->createWorker(0, *dispatcher_factory_);
  timer_worker_->start();

  registerBuiltinHandlers();

  TOOLWIRE_LOG(Debug, "Server {} created with {} handler threads",
               config_.name, pool_->size());
}

ToolServer::~ToolServer() {
  stop();
  pool_->stop();
  timer_worker_->stop();
  timers_.clear();
}

void ToolServer::registerBuiltinHandlers() {
  registerHandler("initialize", [this](const json::JsonValue& params) {
    return handleInitialize(params);
  });
  registerHandler("initialized", [this](const json::JsonValue& params) {
    return handleInitialized(params);
  });
  registerHandler("tools/list", [this](const json::JsonValue& params) {
    return handleListTools(params);
  });
  registerHandler("tools/call", [this](const json::JsonValue& params) {
    return handleCallTool(params);
  });
  registerHandler("shutdown", [this](const json::JsonValue& params) {
    return handleShutdown(params);
  });
  registerHandler("ping", [this](const json::JsonValue& params) {
    return handlePing(params);
  });
}

void ToolServer::registerTool(tools::ToolPtr tool) {
  registry_->registerTool(std::move(tool));
}

void ToolServer::registerHandler(const std::string& method,
                                 RequestHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Handler for " + method + " is empty");
  }
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[method] = std::move(handler);
}

bool ToolServer::hasHandler(const std::string& method) const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return handlers_.find(method) != handlers_.end();
}

RequestHandler ToolServer::findHandler(const std::string& method) const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return nullptr;
  }
  return it->second;
}

jsonrpc::Response ToolServer::processRequest(const jsonrpc::Request& request) {
  auto promise = std::make_shared<std::promise<jsonrpc::Response>>();
  auto future = promise->get_future();
  dispatchAsync(request, [promise](const jsonrpc::Response& response) {
    promise->set_value(response);
  });
  return future.get();
}

void ToolServer::dispatchAsync(const jsonrpc::Request& request,
                               ResponseCallback callback) {
  auto handler = findHandler(request.method);
  if (!handler) {
    TOOLWIRE_LOG(Debug, "Unknown method {}", request.method);
    callback(jsonrpc::make_error_response(
        request.id, jsonrpc::METHOD_NOT_FOUND,
        "Unknown method: " + request.method));
    return;
  }

  gate_.acquire();

  auto pending = std::make_shared<PendingRequest>(request.id,
                                                  std::move(callback));
  const uint64_t serial = ++next_serial_;

  std::weak_ptr<PendingRequest> weak_pending = pending;
  const auto ctx = requestContext(request);
  armTimer(serial, [this, weak_pending, ctx]() {
    auto expired = weak_pending.lock();
    if (!expired) {
      return;
    }
    auto response = jsonrpc::make_error_response(
        expired->id(), jsonrpc::TIMEOUT,
        fmt::format("Request timed out after {}s",
                    formatSeconds(config_.request_timeout)));
    if (expired->settle(response)) {
      TOOLWIRE_LOG_WITH_CONTEXT(Warning, ctx, "{}", response.error->message);
    }
  });

  json::JsonValue params =
      request.params ? *request.params : json::JsonValue::null();

  auto task = [this, pending, handler, params, serial, ctx]() {
    jsonrpc::Response response;
    try {
      response = jsonrpc::Response::success(pending->id(), handler(params));
    } catch (const std::exception& e) {
      TOOLWIRE_LOG_WITH_CONTEXT(Error, ctx, "Handler failed: {}", e.what());
      response = jsonrpc::make_error_response(
          pending->id(), jsonrpc::INTERNAL_ERROR, e.what());
    } catch (...) {
      TOOLWIRE_LOG_WITH_CONTEXT(Error, ctx,
                                "Handler failed with a non-standard exception");
      response = jsonrpc::make_error_response(
          pending->id(), jsonrpc::INTERNAL_ERROR, "Unknown error");
    }
    if (!pending->settle(response)) {
      TOOLWIRE_LOG_WITH_CONTEXT(Debug, ctx,
                                "Discarding result of timed out request");
    }
    disarmTimer(serial);
  };

  // Picking the worker and queueing on it must not interleave with another
  // dispatch, or two requests could land on the same idle worker
  std::lock_guard<std::mutex> lock(dispatch_mutex_);
  pool_->nextWorker().post(std::move(task), [this]() { gate_.release(); });
}

void ToolServer::armTimer(uint64_t serial, std::function<void()> on_expire) {
  const auto timeout = config_.requestTimeout();
  timer_worker_->post([this, serial, timeout, on_expire]() {
    auto timer = timer_worker_->dispatcher().createTimer([this, serial,
                                                          on_expire]() {
      on_expire();
      // Not from inside the callback: the timer is still on the stack
      disarmTimer(serial);
    });
    timer->enableTimer(timeout);
    timers_[serial] = std::move(timer);
  });
}

void ToolServer::disarmTimer(uint64_t serial) {
  timer_worker_->post([this, serial]() { timers_.erase(serial); });
}

optional<json::JsonValue> ToolServer::handleMessage(
    const json::JsonValue& raw) {
  protocol::ParsedMessage message;
  try {
    message = protocol::parseMessage(raw);
  } catch (const protocol::ProtocolException& e) {
    TOOLWIRE_LOG(Warning, "Rejected message: {}", e.what());
    return json::to_json(jsonrpc::make_error_response(
        protocol::recoverId(raw), e.code(), e.what()));
  }

  if (!protocol::isRequest(message)) {
    return nullopt;
  }

  const auto& request = get<jsonrpc::Request>(message);
  auto response = processRequest(request);
  if (request.isNotification()) {
    return nullopt;
  }
  return json::to_json(response);
}

optional<json::JsonValue> ToolServer::handleMessage(const std::string& raw) {
  json::JsonValue value;
  try {
    value = json::JsonValue::parse(raw);
  } catch (const json::JsonException& e) {
    TOOLWIRE_LOG(Warning, "Parse error: {}", e.what());
    return json::to_json(jsonrpc::make_error_response(
        protocol::recoverId(raw), jsonrpc::PARSE_ERROR,
        std::string("Invalid JSON: ") + e.what()));
  }
  return handleMessage(value);
}

void ToolServer::run(transport::Transport& transport) {
  transport::TransportGuard guard(transport);

  ServerState expected = ServerState::Created;
  if (!state_.compare_exchange_strong(expected, ServerState::Running)) {
    TOOLWIRE_LOG(Error, "Server {} cannot run from state {}", config_.name,
                 serverStateToString(expected));
    return;
  }
  running_ = true;

  TOOLWIRE_LOG(Info, "Server {} v{} starting", config_.name, config_.version);

  active_transport_ = &transport;
  if (stop_requested_) {
    // stop() came in before the transport was published
    running_ = false;
    transport.interrupt();
  }

  std::exception_ptr failure;
  try {
    serve(*guard);
  } catch (const transport::TransportException& e) {
    TOOLWIRE_LOG(Error, "Transport failed: {}", e.what());
    failure = std::current_exception();
  } catch (const std::exception& e) {
    TOOLWIRE_LOG(Error, "Serve loop failed: {}", e.what());
    failure = std::current_exception();
  } catch (...) {
    TOOLWIRE_LOG(Error, "Serve loop failed with a non-standard exception");
    failure = std::current_exception();
  }

  running_ = false;
  active_transport_ = nullptr;
  waitForInFlight();
  guard->close();
  state_ = ServerState::Stopped;

  TOOLWIRE_LOG(Info, "Server stopped");

  if (!failure) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    failure = send_failure_;
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
}

void ToolServer::serve(transport::Transport& transport) {
  while (running_) {
    optional<json::JsonValue> raw;
    try {
      raw = transport.receive();
    } catch (const protocol::ParseError& e) {
      TOOLWIRE_LOG(Warning, "Parse error: {}", e.what());
      sendFromLoop(transport, jsonrpc::make_error_response(
                                  nullopt, jsonrpc::PARSE_ERROR, e.what()));
      continue;
    }

    if (!raw) {
      if (running_) {
        TOOLWIRE_LOG(Info, "EOF received, shutting down");
      } else {
        TOOLWIRE_LOG(Info, "Stop requested, shutting down");
      }
      break;
    }

    dispatchFromLoop(transport, *raw);
  }
}

void ToolServer::dispatchFromLoop(transport::Transport& transport,
                                  const json::JsonValue& raw) {
  protocol::ParsedMessage message;
  try {
    message = protocol::parseMessage(raw);
  } catch (const protocol::ProtocolException& e) {
    TOOLWIRE_LOG(Warning, "Rejected message: {}", e.what());
    sendFromLoop(transport,
                 jsonrpc::make_error_response(protocol::recoverId(raw),
                                              e.code(), e.what()));
    return;
  }

  if (!protocol::isRequest(message)) {
    TOOLWIRE_LOG(Debug, "Ignoring message that is not a request");
    return;
  }

  const auto& request = get<jsonrpc::Request>(message);
  const bool notification = request.isNotification();

  // shutdown has to finish before the next read so the loop sees running_
  // drop
  std::shared_ptr<std::promise<void>> barrier;
  std::future<void> barrier_done;
  if (request.method == "shutdown") {
    barrier = std::make_shared<std::promise<void>>();
    barrier_done = barrier->get_future();
  }

  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    ++in_flight_;
  }

  dispatchAsync(request, [this, &transport, notification,
                          barrier](const jsonrpc::Response& response) {
    if (!notification) {
      sendFromCallback(transport, response);
    }
    finishInFlight();
    if (barrier) {
      barrier->set_value();
    }
  });

  if (barrier) {
    barrier_done.wait();
  }
}

void ToolServer::sendFromLoop(transport::Transport& transport,
                              const jsonrpc::Response& response) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  transport.send(json::to_json(response));
}

void ToolServer::sendFromCallback(transport::Transport& transport,
                                  const jsonrpc::Response& response) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  try {
    transport.send(json::to_json(response));
  } catch (const transport::TransportException& e) {
    TOOLWIRE_LOG(Error, "Failed to send response {}: {}",
                 idToString(response.id), e.what());
    if (!send_failure_) {
      send_failure_ = std::current_exception();
    }
    running_ = false;
  }
}

void ToolServer::finishInFlight() {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  if (--in_flight_ == 0) {
    in_flight_done_.notify_all();
  }
}

void ToolServer::waitForInFlight() {
  std::unique_lock<std::mutex> lock(in_flight_mutex_);
  in_flight_done_.wait(lock, [this]() { return in_flight_ == 0; });
}

void ToolServer::stop() {
  stop_requested_ = true;
  running_ = false;
  ServerState expected = ServerState::Created;
  state_.compare_exchange_strong(expected, ServerState::Stopped);
  if (auto* transport = active_transport_.load()) {
    transport->interrupt();
  }
}

json::JsonValue ToolServer::handleInitialize(const json::JsonValue& params) {
  if (params.isObject() && params["clientInfo"].isObject()) {
    const auto& client = params["clientInfo"];
    TOOLWIRE_LOG(Info, "Initialize from {} {}", client["name"].getString(""),
                 client["version"].getString(""));
  }

  return json::JsonObjectBuilder()
      .add("protocolVersion", kProtocolVersion)
      .add("capabilities",
           json::JsonObjectBuilder()
               .add("tools",
                    json::JsonObjectBuilder().add("listChanged", true).build())
               .build())
      .add("serverInfo", json::JsonObjectBuilder()
                             .add("name", config_.name)
                             .add("version", config_.version)
                             .build())
      .build();
}

json::JsonValue ToolServer::handleInitialized(const json::JsonValue&) {
  TOOLWIRE_LOG(Info, "Client initialized");
  return json::JsonValue::object();
}

json::JsonValue ToolServer::handleListTools(const json::JsonValue&) {
  return json::JsonObjectBuilder()
      .add("tools", json::to_json(registry_->listTools()))
      .build();
}

json::JsonValue ToolServer::handleCallTool(const json::JsonValue& params) {
  if (!params.isObject() || params.empty()) {
    return callToolError("Missing parameters");
  }

  if (!params.contains("name") || !params["name"].isString() ||
      params["name"].getString().empty()) {
    return callToolError("Missing tool name");
  }
  const std::string name = params["name"].getString();

  json::JsonValue arguments = json::JsonValue::object();
  if (params.contains("arguments") && !params["arguments"].isNull()) {
    arguments = params["arguments"];
    if (!arguments.isObject()) {
      return callToolError("Arguments must be an object");
    }
  }

  TOOLWIRE_LOG(Debug, "Calling tool {}", name);
  ToolResult result = registry_->execute(name, arguments);
  if (!result.success) {
    return callToolError(result.error ? *result.error : "Unknown error");
  }

  return json::JsonObjectBuilder()
      .add("content", textContent(renderContent(result)))
      .build();
}

json::JsonValue ToolServer::handleShutdown(const json::JsonValue&) {
  TOOLWIRE_LOG(Info, "Shutdown requested");
  running_ = false;
  return json::JsonValue::object();
}

json::JsonValue ToolServer::handlePing(const json::JsonValue&) {
  return json::JsonObjectBuilder().add("pong", true).build();
}

std::unique_ptr<ToolServer> createServer(
    const config::ServerConfig& config,
    const std::vector<tools::ToolPtr>& tools) {
  auto server = std::make_unique<ToolServer>(config);
  for (const auto& tool : tools) {
    server->registerTool(tool);
  }
  return server;
}

}  // namespace server
}  // namespace toolwire
