#include "mcp/tools.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace flight_search::mcp {

Json to_json(const ToolDescriptor& descriptor) {
  return Json{{"name", descriptor.name},
              {"description", descriptor.description},
              {"inputSchema", descriptor.input_schema}};
}

ToolResult ToolResult::success(std::string text) {
  return ToolResult{.text = std::move(text), .error = std::nullopt};
}

ToolResult ToolResult::failure(JsonRpcError error) {
  return ToolResult{.text = std::nullopt, .error = std::move(error)};
}

void ToolRegistry::register_tool(Tool tool) {
  if (!tool.handler) {
    throw std::invalid_argument("tool has no handler: " + tool.descriptor.name);
  }
  if (index_.contains(tool.descriptor.name)) {
    throw std::invalid_argument("duplicate tool name: " + tool.descriptor.name);
  }
  index_.emplace(tool.descriptor.name, tools_.size());
  tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &tools_[it->second];
}

std::vector<ToolDescriptor> ToolRegistry::list_tools() const {
  std::vector<ToolDescriptor> descriptors;
  descriptors.reserve(tools_.size());
  for (const auto& tool : tools_) {
    descriptors.push_back(tool.descriptor);
  }
  return descriptors;
}

ToolInvoker::ToolInvoker(const ToolRegistry& registry, const core::Logger& logger)
    : registry_(registry), logger_(logger) {}

ToolResult ToolInvoker::invoke(const std::string& name, const Json& arguments) const {
  const Tool* tool = registry_.find(name);
  if (tool == nullptr) {
    logger_.warning("unknown tool requested: " + name);
    return ToolResult::failure(unknown_tool(name));
  }

  logger_.debug("invoking tool " + name + " with arguments " + arguments.dump());
  warn_missing_required(tool->descriptor, arguments);

  try {
    return ToolResult::success(tool->handler(arguments));
  } catch (const std::exception& ex) {
    logger_.error("tool " + name + " failed: " + ex.what());
    return ToolResult::failure(internal_error(ex.what()));
  } catch (...) {
    logger_.error("tool " + name + " failed with a non-standard exception");
    return ToolResult::failure(internal_error("unknown exception"));
  }
}

// Required arguments are advisory: missing ones reach the handler as empty
// strings, so this only reports them.
void ToolInvoker::warn_missing_required(const ToolDescriptor& descriptor, const Json& arguments) const {
  const auto required_it = descriptor.input_schema.find("required");
  if (required_it == descriptor.input_schema.end() || !required_it->is_array()) {
    return;
  }
  for (const auto& key : *required_it) {
    if (!key.is_string()) {
      continue;
    }
    const auto& name = key.get_ref<const std::string&>();
    if (!arguments.is_object() || !arguments.contains(name)) {
      logger_.warning("tool " + descriptor.name + " called without required argument " + name);
    }
  }
}

}  // namespace flight_search::mcp
