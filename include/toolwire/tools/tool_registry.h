#ifndef TOOLWIRE_TOOLS_TOOL_REGISTRY_H
#define TOOLWIRE_TOOLS_TOOL_REGISTRY_H

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolwire/tools/tool.h"

namespace toolwire {
namespace tools {

/**
 * Tool registry
 * Maps tool names to tools and mediates their execution. Every operation is
 * safe to call concurrently with the others.
 */
class ToolRegistry {
 public:
  ToolRegistry() = default;

  // Inserts or replaces by name. A replaced tool keeps its catalog position.
  void registerTool(ToolPtr tool);

  // Returns whether a tool was removed
  bool unregisterTool(const std::string& name);

  // nullptr if absent
  ToolPtr get(const std::string& name) const;

  // Definitions in registration order
  std::vector<ToolDefinition> listTools() const;

  /**
   * Look up, validate and run a tool. Never throws: unknown tools, missing
   * required parameters and exceptions from the tool all come back as
   * failed results. The tool runs outside the registry lock.
   */
  ToolResult execute(const std::string& name,
                     const json::JsonValue& arguments) const;

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ToolPtr> tools_;
  std::vector<std::string> order_;
};

}  // namespace tools
}  // namespace toolwire

#endif  // TOOLWIRE_TOOLS_TOOL_REGISTRY_H
