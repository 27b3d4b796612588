#define TOOLWIRE_LOG_COMPONENT "tools"

#include "toolwire/tools/tool_registry.h"

#include <algorithm>
#include <stdexcept>

#include "toolwire/logging/log_macros.h"

namespace toolwire {
namespace tools {

void ToolRegistry::registerTool(ToolPtr tool) {
  if (!tool) {
    throw std::invalid_argument("Cannot register a null tool");
  }
  std::string name = tool->name();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tools_.find(name);
  if (it != tools_.end()) {
    TOOLWIRE_LOG(Info, "Replacing tool {}", name);
    it->second = std::move(tool);
    return;
  }
  tools_.emplace(name, std::move(tool));
  order_.push_back(name);
  TOOLWIRE_LOG(Debug, "Registered tool {}", name);
}

bool ToolRegistry::unregisterTool(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (tools_.erase(name) == 0) {
    return false;
  }
  order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
  TOOLWIRE_LOG(Debug, "Unregistered tool {}", name);
  return true;
}

ToolPtr ToolRegistry::get(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tools_.find(name);
  return it != tools_.end() ? it->second : nullptr;
}

std::vector<ToolDefinition> ToolRegistry::listTools() const {
  std::vector<ToolPtr> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(order_.size());
    for (const auto& name : order_) {
      snapshot.push_back(tools_.at(name));
    }
  }

  std::vector<ToolDefinition> definitions;
  definitions.reserve(snapshot.size());
  for (const auto& tool : snapshot) {
    definitions.push_back(getDefinition(*tool));
  }
  return definitions;
}

ToolResult ToolRegistry::execute(const std::string& name,
                                 const json::JsonValue& arguments) const {
  ToolPtr tool = get(name);
  if (!tool) {
    return ToolResult::failure("Tool not found: " + name);
  }

  const json::JsonValue args =
      arguments.isNull() ? json::JsonValue::object() : arguments;

  try {
    if (auto error = validateParams(*tool, args)) {
      return ToolResult::failure(*error);
    }
    return tool->execute(args);
  } catch (const std::exception& e) {
    TOOLWIRE_LOG(Warning, "Tool {} failed: {}", name, e.what());
    return ToolResult::failure("Tool execution failed: " +
                               std::string(e.what()));
  } catch (...) {
    TOOLWIRE_LOG(Warning, "Tool {} failed with a non-standard exception",
                 name);
    return ToolResult::failure("Tool execution failed: unknown error");
  }
}

size_t ToolRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tools_.size();
}

}  // namespace tools
}  // namespace toolwire
