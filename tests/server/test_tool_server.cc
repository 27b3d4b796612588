/**
 * @file test_tool_server.cc
 * @brief Dispatch, admission, deadlines and the serve loop of ToolServer
 */

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "toolwire/json/json_serialization.h"
#include "toolwire/server/admission_gate.h"
#include "toolwire/server/tool_server.h"
#include "toolwire/transport/stream_transport.h"

#include "mocks/transport_mocks.h"

namespace toolwire {
namespace server {
namespace {

using namespace std::chrono_literals;

jsonrpc::Request request(const std::string& id,
                         const std::string& method,
                         const json::JsonValue& params = json::JsonValue()) {
  if (params.isNull()) {
    return jsonrpc::make_request(RequestId(id), method);
  }
  return jsonrpc::make_request(RequestId(id), method, params);
}

json::JsonValue callParams(const std::string& name,
                           const json::JsonValue& arguments) {
  return json::JsonObjectBuilder()
      .add("name", name)
      .add("arguments", arguments)
      .build();
}

std::string firstText(const json::JsonValue& result) {
  return result["content"][0]["text"].getString();
}

class ToolServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.name = "test-server";
    config_.version = "1.2.3";
    config_.max_concurrent_requests = 2;
    config_.request_timeout = 5.0;
  }

  std::unique_ptr<ToolServer> makeServer() {
    auto server = std::make_unique<ToolServer>(config_);
    server->registerTool(
        tools::ToolBuilder("echo")
            .description("Echo text")
            .parameter("text", "string", "Text", true)
            .handler([](const json::JsonValue& args) {
              return ToolResult::text(args["text"].getString(""));
            })
            .build());
    return server;
  }

  config::ServerConfig config_;
};

TEST_F(ToolServerTest, Ping) {
  auto server = makeServer();
  auto response = server->processRequest(request("1", "ping"));

  ASSERT_FALSE(response.isError());
  EXPECT_TRUE((*response.result)["pong"].getBool());
  EXPECT_EQ(get<std::string>(*response.id), "1");
}

TEST_F(ToolServerTest, UnknownMethod) {
  auto server = makeServer();
  auto response = server->processRequest(request("7", "foo/bar"));

  ASSERT_TRUE(response.isError());
  EXPECT_EQ(response.error->code, jsonrpc::METHOD_NOT_FOUND);
  EXPECT_EQ(response.error->message, "Unknown method: foo/bar");
  EXPECT_EQ(get<std::string>(*response.id), "7");
}

TEST_F(ToolServerTest, Initialize) {
  auto server = makeServer();
  auto params = json::JsonValue::parse(
      R"({"clientInfo":{"name":"client","version":"0.1"}})");
  auto response = server->processRequest(request("1", "initialize", params));

  ASSERT_FALSE(response.isError());
  const auto& result = *response.result;
  EXPECT_EQ(result["protocolVersion"].getString(), "2024-11-05");
  EXPECT_TRUE(result["capabilities"]["tools"]["listChanged"].getBool());
  EXPECT_EQ(result["serverInfo"]["name"].getString(), "test-server");
  EXPECT_EQ(result["serverInfo"]["version"].getString(), "1.2.3");

  auto initialized = server->processRequest(request("2", "initialized"));
  EXPECT_TRUE(initialized.result->isObject());
  EXPECT_TRUE(initialized.result->empty());
}

TEST_F(ToolServerTest, ListTools) {
  auto server = makeServer();
  auto response = server->processRequest(request("1", "tools/list"));

  const auto& tools = (*response.result)["tools"];
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0]["name"].getString(), "echo");
  EXPECT_EQ(tools[0]["inputSchema"]["required"][0].getString(), "text");
}

TEST_F(ToolServerTest, CallToolSuccess) {
  auto server = makeServer();
  auto response = server->processRequest(request(
      "1", "tools/call",
      callParams("echo", json::JsonObjectBuilder().add("text", "hi").build())));

  ASSERT_FALSE(response.isError());
  EXPECT_EQ(firstText(*response.result), "hi");
  EXPECT_EQ((*response.result)["content"][0]["type"].getString(), "text");
  EXPECT_FALSE(response.result->contains("isError"));
}

TEST_F(ToolServerTest, StructuredContentIsPrettyPrinted) {
  auto server = makeServer();
  server->registerTool(tools::ToolBuilder("stats")
                           .handler([](const json::JsonValue&) {
                             return ToolResult::structured(
                                 json::JsonObjectBuilder().add("n", 1).build());
                           })
                           .build());

  auto response = server->processRequest(request(
      "1", "tools/call", callParams("stats", json::JsonValue::object())));
  EXPECT_EQ(firstText(*response.result), "{\n  \"n\": 1\n}");
}

TEST_F(ToolServerTest, CallToolErrorsAreResults) {
  auto server = makeServer();
  struct Case {
    json::JsonValue params;
    std::string text;
  };
  std::vector<Case> cases = {
      {json::JsonValue(), "Error: Missing parameters"},
      {json::JsonValue::object(), "Error: Missing parameters"},
      {json::JsonValue::parse(R"({"arguments":{}})"),
       "Error: Missing tool name"},
      {json::JsonValue::parse(R"({"name":""})"), "Error: Missing tool name"},
      {json::JsonValue::parse(R"({"name":3})"), "Error: Missing tool name"},
      {json::JsonValue::parse(R"({"name":"echo","arguments":[1]})"),
       "Error: Arguments must be an object"},
      {json::JsonValue::parse(R"({"name":"nope"})"),
       "Error: Tool not found: nope"},
      {json::JsonValue::parse(R"({"name":"echo","arguments":{}})"),
       "Error: Missing required parameter: text"},
  };

  for (const auto& c : cases) {
    jsonrpc::Request req(RequestId("1"), "tools/call");
    if (!c.params.isNull()) {
      req.params = c.params;
    }
    auto response = server->processRequest(req);

    ASSERT_FALSE(response.isError()) << c.text;
    EXPECT_TRUE((*response.result)["isError"].getBool()) << c.text;
    EXPECT_EQ(firstText(*response.result), c.text);
  }
}

TEST_F(ToolServerTest, MissingParameterDoesNotInvokeTool) {
  auto server = makeServer();
  std::atomic<int> calls{0};
  server->registerTool(tools::ToolBuilder("write")
                           .parameter("path", "string", "Path", true)
                           .handler([&calls](const json::JsonValue&) {
                             ++calls;
                             return ToolResult::text("written");
                           })
                           .build());

  auto response = server->processRequest(request(
      "1", "tools/call", callParams("write", json::JsonValue::object())));
  EXPECT_TRUE((*response.result)["isError"].getBool());
  EXPECT_EQ(calls.load(), 0);
}

TEST_F(ToolServerTest, HandlerExceptionIsInternalError) {
  auto server = makeServer();
  server->registerHandler("explode", [](const json::JsonValue&)
                                         -> json::JsonValue {
    throw std::runtime_error("handler blew up");
  });

  auto response = server->processRequest(request("1", "explode"));
  ASSERT_TRUE(response.isError());
  EXPECT_EQ(response.error->code, jsonrpc::INTERNAL_ERROR);
  EXPECT_EQ(response.error->message, "handler blew up");
}

TEST_F(ToolServerTest, NonStandardThrowIsInternalError) {
  auto server = makeServer();
  server->registerHandler("odd", [](const json::JsonValue&)
                                     -> json::JsonValue { throw 42; });

  auto response = server->processRequest(request("1", "odd"));
  ASSERT_TRUE(response.isError());
  EXPECT_EQ(response.error->code, jsonrpc::INTERNAL_ERROR);
  EXPECT_EQ(response.error->message, "Unknown error");

  // The worker survived
  EXPECT_FALSE(server->processRequest(request("2", "ping")).isError());
}

TEST_F(ToolServerTest, ToolThrowingNonStandardTypeIsErrorResult) {
  auto server = makeServer();
  server->registerTool(tools::ToolBuilder("odd")
                           .handler([](const json::JsonValue&) -> ToolResult {
                             throw std::string("x");
                           })
                           .build());

  auto response = server->processRequest(request(
      "1", "tools/call", callParams("odd", json::JsonValue::object())));
  ASSERT_FALSE(response.isError());
  EXPECT_TRUE((*response.result)["isError"].getBool());
  EXPECT_EQ(firstText(*response.result),
            "Error: Tool execution failed: unknown error");
}

TEST_F(ToolServerTest, CustomHandlerOverridesBuiltin) {
  auto server = makeServer();
  EXPECT_TRUE(server->hasHandler("ping"));
  EXPECT_FALSE(server->hasHandler("custom"));

  server->registerHandler("ping", [](const json::JsonValue&) {
    return json::JsonObjectBuilder().add("pong", "custom").build();
  });
  auto response = server->processRequest(request("1", "ping"));
  EXPECT_EQ((*response.result)["pong"].getString(), "custom");
}

TEST_F(ToolServerTest, HandlerReceivesNullWithoutParams) {
  auto server = makeServer();
  std::promise<bool> saw_null;
  server->registerHandler("inspect",
                          [&saw_null](const json::JsonValue& params) {
    saw_null.set_value(params.isNull());
    return json::JsonValue::object();
  });

  server->processRequest(request("1", "inspect"));
  EXPECT_TRUE(saw_null.get_future().get());
}

TEST_F(ToolServerTest, TimeoutReportsAndKeepsSlot) {
  config_.request_timeout = 0.1;
  config_.max_concurrent_requests = 1;
  auto server = makeServer();

  std::promise<void> release;
  auto release_future = release.get_future().share();
  std::promise<void> finished;
  server->registerHandler("hang", [release_future,
                                   &finished](const json::JsonValue&) {
    release_future.wait();
    finished.set_value();
    return json::JsonValue::object();
  });

  auto started = std::chrono::steady_clock::now();
  auto response = server->processRequest(request("9", "hang"));
  auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_TRUE(response.isError());
  EXPECT_EQ(response.error->code, jsonrpc::TIMEOUT);
  EXPECT_EQ(response.error->message, "Request timed out after 0.1s");
  EXPECT_EQ(get<std::string>(*response.id), "9");
  EXPECT_LT(elapsed, 2s);

  // The handler still holds the only slot, so the next request waits
  auto next = std::async(std::launch::async, [&server]() {
    return server->processRequest(request("10", "ping"));
  });
  EXPECT_EQ(next.wait_for(200ms), std::future_status::timeout);

  release.set_value();
  finished.get_future().wait();
  ASSERT_EQ(next.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(next.get().isError());
}

TEST_F(ToolServerTest, WholeSecondTimeoutKeepsOneDecimal) {
  config_.request_timeout = 1.0;
  auto server = makeServer();

  std::promise<void> release;
  auto release_future = release.get_future().share();
  server->registerHandler("hang", [release_future](const json::JsonValue&) {
    release_future.wait();
    return json::JsonValue::object();
  });

  auto response = server->processRequest(request("1", "hang"));
  release.set_value();
  ASSERT_TRUE(response.isError());
  EXPECT_EQ(response.error->code, jsonrpc::TIMEOUT);
  EXPECT_EQ(response.error->message, "Request timed out after 1.0s");
}

TEST_F(ToolServerTest, ConcurrencyIsBounded) {
  config_.max_concurrent_requests = 2;
  auto server = makeServer();

  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  std::atomic<int> started{0};
  std::promise<void> release;
  auto release_future = release.get_future().share();
  server->registerHandler("work", [&, release_future](const json::JsonValue&) {
    int now = ++active;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
    ++started;
    release_future.wait();
    --active;
    return json::JsonValue::object();
  });

  std::atomic<int> responses{0};
  std::promise<void> all_done;
  auto dispatcher = std::async(std::launch::async, [&]() {
    for (int i = 0; i < 3; ++i) {
      server->dispatchAsync(request(std::to_string(i), "work"),
                            [&](const jsonrpc::Response&) {
                              if (++responses == 3) {
                                all_done.set_value();
                              }
                            });
    }
  });

  // Two run, the third is held at admission
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (started < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(started.load(), 2);
  EXPECT_EQ(dispatcher.wait_for(0ms), std::future_status::timeout);

  release.set_value();
  ASSERT_EQ(all_done.get_future().wait_for(2s), std::future_status::ready);
  dispatcher.get();
  EXPECT_EQ(started.load(), 3);
  EXPECT_LE(peak.load(), 2);
}

TEST_F(ToolServerTest, HandleMessageShapes) {
  auto server = makeServer();

  auto response = server->handleMessage(std::string(
      R"({"jsonrpc":"2.0","id":"5","method":"ping"})"));
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ((*response)["id"].getString(), "5");
  EXPECT_TRUE((*response)["result"]["pong"].getBool());

  // Notifications are processed but never answered
  EXPECT_FALSE(server->handleMessage(std::string(
      R"({"jsonrpc":"2.0","method":"initialized"})")).has_value());

  // Responses from the peer are not answered either, well-formed or not
  EXPECT_FALSE(server->handleMessage(std::string(
      R"({"jsonrpc":"2.0","id":"1","result":{}})")).has_value());
  EXPECT_FALSE(server->handleMessage(std::string(
      R"({"jsonrpc":"2.0","id":"r1","error":"oops"})")).has_value());
  EXPECT_FALSE(server->handleMessage(std::string(
      R"({"jsonrpc":"2.0","id":"r2","error":{"message":"x"}})")).has_value());

  auto parse_error = server->handleMessage(std::string("{oops"));
  ASSERT_TRUE(parse_error.has_value());
  EXPECT_TRUE((*parse_error)["id"].isNull());
  EXPECT_EQ((*parse_error)["error"]["code"].getInt(), jsonrpc::PARSE_ERROR);

  auto invalid = server->handleMessage(
      json::JsonValue::parse(R"({"jsonrpc":"2.0","id":"8","method":""})"));
  ASSERT_TRUE(invalid.has_value());
  EXPECT_EQ((*invalid)["id"].getString(), "8");
  EXPECT_EQ((*invalid)["error"]["code"].getInt(), jsonrpc::INVALID_REQUEST);
}

TEST_F(ToolServerTest, CreateServerRegistersTools) {
  auto tool = tools::ToolBuilder("noop")
                  .handler([](const json::JsonValue&) {
                    return ToolResult::text("");
                  })
                  .build();
  auto server = createServer(config_, {tool});

  EXPECT_EQ(server->registry().size(), 1u);
  EXPECT_EQ(server->state(), ServerState::Created);
  EXPECT_EQ(server->config().name, "test-server");
}

TEST_F(ToolServerTest, InvalidConfigIsRejected) {
  config_.max_concurrent_requests = 0;
  EXPECT_THROW(ToolServer server(config_), config::ConfigError);
}

TEST_F(ToolServerTest, RunCleansUpWhenLoopThrows) {
  auto server = makeServer();
  ::testing::NiceMock<test::MockTransport> transport;
  EXPECT_CALL(transport, receive())
      .WillOnce(::testing::Throw(std::logic_error("reader broke")));
  EXPECT_CALL(transport, close()).Times(::testing::AtLeast(1));

  EXPECT_THROW(server->run(transport), std::logic_error);
  EXPECT_EQ(server->state(), ServerState::Stopped);
  EXPECT_FALSE(server->isRunning());
}

TEST_F(ToolServerTest, RunCleansUpWhenLoopThrowsNonStandardType) {
  auto server = makeServer();
  ::testing::NiceMock<test::MockTransport> transport;
  EXPECT_CALL(transport, receive()).WillOnce(::testing::Throw(7));
  EXPECT_CALL(transport, close()).Times(::testing::AtLeast(1));

  EXPECT_THROW(server->run(transport), int);
  EXPECT_EQ(server->state(), ServerState::Stopped);
}

/**
 * Serve loop over a pair of pipes. The client side is a StreamTransport too,
 * plus the raw descriptor for writing malformed frames.
 */
class ToolServerRunTest : public ToolServerTest {
 protected:
  void SetUp() override {
    ToolServerTest::SetUp();
    int to_server[2];
    int to_client[2];
    ASSERT_EQ(pipe(to_server), 0);
    ASSERT_EQ(pipe(to_client), 0);
    raw_to_server_ = to_server[1];
    server_transport_ = std::make_unique<transport::StreamTransport>(
        to_server[0], to_client[1], true);
    client_ = std::make_unique<transport::StreamTransport>(
        to_client[0], to_server[1], true);
  }

  void TearDown() override {
    client_.reset();
    if (serve_thread_.joinable()) {
      serve_thread_.join();
    }
  }

  void startServing(ToolServer& server) {
    serve_thread_ = std::thread(
        [this, &server]() { server.run(*server_transport_); });
  }

  void sendRequest(const std::string& id, const std::string& method) {
    client_->send(json::to_json(request(id, method)));
  }

  bool waitForState(ToolServer& server, ServerState state) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (server.state() != state) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      std::this_thread::sleep_for(5ms);
    }
    return true;
  }

  std::map<std::string, json::JsonValue> readResponses(size_t count) {
    std::map<std::string, json::JsonValue> responses;
    for (size_t i = 0; i < count; ++i) {
      auto message = client_->receive();
      if (!message) {
        break;
      }
      const auto& id = (*message)["id"];
      responses[id.isNull() ? "null" : id.getString()] = *message;
    }
    return responses;
  }

  int raw_to_server_{-1};
  std::unique_ptr<transport::StreamTransport> server_transport_;
  std::unique_ptr<transport::StreamTransport> client_;
  std::thread serve_thread_;
};

TEST_F(ToolServerRunTest, ServesUntilShutdown) {
  auto server = makeServer();
  startServing(*server);

  sendRequest("1", "initialize");
  const std::string garbage = "Content-Length: 5\r\n\r\n{bad}";
  ASSERT_EQ(::write(raw_to_server_, garbage.data(), garbage.size()),
            static_cast<ssize_t>(garbage.size()));
  client_->send(json::to_json(jsonrpc::make_request(nullopt, "initialized")));
  sendRequest("2", "ping");
  sendRequest("3", "shutdown");

  auto responses = readResponses(4);
  ASSERT_EQ(responses.size(), 4u);
  EXPECT_EQ(responses["1"]["result"]["serverInfo"]["name"].getString(),
            "test-server");
  EXPECT_EQ(responses["null"]["error"]["code"].getInt(), jsonrpc::PARSE_ERROR);
  EXPECT_TRUE(responses["2"]["result"]["pong"].getBool());
  EXPECT_TRUE(responses["3"]["result"].isObject());

  serve_thread_.join();
  EXPECT_EQ(server->state(), ServerState::Stopped);
  EXPECT_FALSE(server->isRunning());
  EXPECT_TRUE(server_transport_->isClosed());

  // Nothing was sent for the notification
  EXPECT_FALSE(client_->receive().has_value());
}

TEST_F(ToolServerRunTest, EndOfInputStops) {
  auto server = makeServer();
  startServing(*server);

  sendRequest("1", "ping");
  auto responses = readResponses(1);
  EXPECT_EQ(responses.size(), 1u);

  client_->close();
  serve_thread_.join();
  EXPECT_EQ(server->state(), ServerState::Stopped);
}

TEST_F(ToolServerRunTest, InFlightRequestsFinishBeforeStop) {
  auto server = makeServer();
  server->registerHandler("slow", [](const json::JsonValue&) {
    std::this_thread::sleep_for(100ms);
    return json::JsonObjectBuilder().add("done", true).build();
  });
  startServing(*server);

  sendRequest("1", "slow");
  sendRequest("2", "shutdown");

  auto responses = readResponses(2);
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_TRUE(responses["1"]["result"]["done"].getBool());
  serve_thread_.join();
}

TEST_F(ToolServerRunTest, StopWakesBlockedRun) {
  auto server = makeServer();
  startServing(*server);
  ASSERT_TRUE(waitForState(*server, ServerState::Running));
  std::this_thread::sleep_for(50ms);

  // No input is pending, so run() is blocked reading
  server->stop();
  bool stopped = waitForState(*server, ServerState::Stopped);
  if (!stopped) {
    client_->close();
  }
  EXPECT_TRUE(stopped);
  serve_thread_.join();
  EXPECT_TRUE(server_transport_->isClosed());
}

ToolServer* g_signalled_server = nullptr;

void stopOnSignal(int) {
  if (g_signalled_server) {
    g_signalled_server->stop();
  }
}

TEST_F(ToolServerRunTest, StopFromSignalHandler) {
  auto server = makeServer();
  g_signalled_server = server.get();

  // SA_RESTART as signal() installs it: the read is resumed, not failed
  struct sigaction action {};
  struct sigaction previous {};
  action.sa_handler = stopOnSignal;
  action.sa_flags = SA_RESTART;
  sigemptyset(&action.sa_mask);
  ASSERT_EQ(sigaction(SIGUSR1, &action, &previous), 0);

  startServing(*server);
  ASSERT_TRUE(waitForState(*server, ServerState::Running));
  std::this_thread::sleep_for(50ms);

  ASSERT_EQ(pthread_kill(serve_thread_.native_handle(), SIGUSR1), 0);
  bool stopped = waitForState(*server, ServerState::Stopped);
  if (!stopped) {
    client_->close();
  }
  EXPECT_TRUE(stopped);
  serve_thread_.join();

  g_signalled_server = nullptr;
  sigaction(SIGUSR1, &previous, nullptr);
}

TEST_F(ToolServerRunTest, RunOnlyOnce) {
  auto server = makeServer();
  server->stop();
  EXPECT_EQ(server->state(), ServerState::Stopped);

  server->run(*server_transport_);
  EXPECT_TRUE(server_transport_->isClosed());
  EXPECT_EQ(server->state(), ServerState::Stopped);
}

class AdmissionGateTest : public ::testing::Test {};

TEST_F(AdmissionGateTest, CountsSlots) {
  AdmissionGate gate(2);
  EXPECT_EQ(gate.capacity(), 2u);
  EXPECT_TRUE(gate.tryAcquire());
  gate.acquire();
  EXPECT_EQ(gate.inUse(), 2u);
  EXPECT_FALSE(gate.tryAcquire());

  gate.release();
  EXPECT_EQ(gate.inUse(), 1u);
  EXPECT_TRUE(gate.tryAcquire());
}

TEST_F(AdmissionGateTest, AcquireWaitsForRelease) {
  AdmissionGate gate(1);
  gate.acquire();

  auto waiter = std::async(std::launch::async, [&gate]() { gate.acquire(); });
  EXPECT_EQ(waiter.wait_for(50ms), std::future_status::timeout);

  gate.release();
  EXPECT_EQ(waiter.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(gate.inUse(), 1u);
}

TEST_F(AdmissionGateTest, Misuse) {
  EXPECT_THROW(AdmissionGate(0), std::invalid_argument);
  AdmissionGate gate(1);
  EXPECT_THROW(gate.release(), std::logic_error);
}

}  // namespace
}  // namespace server
}  // namespace toolwire
