/**
 * @file tool.h
 * @brief Capability interface for tools served over tools/call
 */

#ifndef TOOLWIRE_TOOLS_TOOL_H
#define TOOLWIRE_TOOLS_TOOL_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "toolwire/types.h"

namespace toolwire {
namespace tools {

/**
 * A named capability with declared parameters.
 *
 * execute() receives the call arguments as an object, passed through
 * verbatim. Implementations report failure through ToolResult::failure();
 * an exception escaping execute() is converted to a failure by
 * ToolRegistry.
 */
class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  virtual std::vector<ToolParameter> parameters() const = 0;

  virtual ToolResult execute(const json::JsonValue& arguments) = 0;
};

using ToolPtr = std::shared_ptr<Tool>;

ToolDefinition getDefinition(const Tool& tool);

/**
 * Check that every required parameter is present in arguments.
 *
 * @return "Missing required parameter: <name>" for the first one absent,
 *         nullopt when all are present
 */
optional<std::string> validateParams(const Tool& tool,
                                     const json::JsonValue& arguments);

// Tool backed by a function
class LambdaTool : public Tool {
 public:
  using Handler = std::function<ToolResult(const json::JsonValue& arguments)>;

  LambdaTool(const std::string& name,
             const std::string& description,
             std::vector<ToolParameter> parameters,
             Handler handler)
      : name_(name),
        description_(description),
        parameters_(std::move(parameters)),
        handler_(std::move(handler)) {}

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }
  std::vector<ToolParameter> parameters() const override {
    return parameters_;
  }

  ToolResult execute(const json::JsonValue& arguments) override {
    return handler_(arguments);
  }

 private:
  std::string name_;
  std::string description_;
  std::vector<ToolParameter> parameters_;
  Handler handler_;
};

/**
 * Fluent construction of a LambdaTool:
 *
 *   auto echo = ToolBuilder("echo")
 *                   .description("Echo text back")
 *                   .parameter("text", "string", "Text to echo", true)
 *                   .handler([](const json::JsonValue& args) {
 *                     return ToolResult::text(args["text"].getString());
 *                   })
 *                   .build();
 */
class ToolBuilder {
 public:
  explicit ToolBuilder(const std::string& name) : name_(name) {}

  ToolBuilder& description(const std::string& desc) {
    description_ = desc;
    return *this;
  }

  ToolBuilder& parameter(const std::string& name,
                         const std::string& type,
                         const std::string& desc,
                         bool required = false) {
    parameters_.emplace_back(name, type, desc, required);
    return *this;
  }

  ToolBuilder& parameter(const ToolParameter& param) {
    parameters_.push_back(param);
    return *this;
  }

  ToolBuilder& handler(LambdaTool::Handler handler) {
    handler_ = std::move(handler);
    return *this;
  }

  // Throws std::logic_error if no handler was set
  ToolPtr build() const;

 private:
  std::string name_;
  std::string description_;
  std::vector<ToolParameter> parameters_;
  LambdaTool::Handler handler_;
};

}  // namespace tools
}  // namespace toolwire

#endif  // TOOLWIRE_TOOLS_TOOL_H
