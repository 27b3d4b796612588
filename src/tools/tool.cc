#include "toolwire/tools/tool.h"

#include <stdexcept>

namespace toolwire {
namespace tools {

ToolDefinition getDefinition(const Tool& tool) {
  return ToolDefinition(tool.name(), tool.description(), tool.parameters());
}

optional<std::string> validateParams(const Tool& tool,
                                     const json::JsonValue& arguments) {
  for (const auto& param : tool.parameters()) {
    if (param.required && !arguments.contains(param.name)) {
      return "Missing required parameter: " + param.name;
    }
  }
  return nullopt;
}

ToolPtr ToolBuilder::build() const {
  if (!handler_) {
    throw std::logic_error("Tool '" + name_ + "' has no handler");
  }
  return std::make_shared<LambdaTool>(name_, description_, parameters_,
                                      handler_);
}

}  // namespace tools
}  // namespace toolwire
