#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/log.hpp"
#include "flights/flight_lookup.hpp"
#include "mcp/jsonrpc.hpp"

namespace flight_search::mcp {

constexpr const char* kSearchFlightsTool = "search_flights";
constexpr const char* kServerStatusTool = "server_status";
constexpr const char* kServerStatusText = "Flight search server is running";

struct ToolDescriptor {
  std::string name;
  std::string description;
  Json input_schema;
};

Json to_json(const ToolDescriptor& descriptor);

// Outcome of one tools/call: text content on success, a JSON-RPC error otherwise.
struct ToolResult {
  std::optional<std::string> text;
  std::optional<JsonRpcError> error;

  static ToolResult success(std::string text);
  static ToolResult failure(JsonRpcError error);

  bool ok() const { return text.has_value(); }
};

using ToolHandler = std::function<std::string(const Json&)>;

struct Tool {
  ToolDescriptor descriptor;
  ToolHandler handler;
};

// Tools in declaration order; tools/list reports them in that order.
class ToolRegistry {
 public:
  // Throws std::invalid_argument on a duplicate name or a missing handler.
  void register_tool(Tool tool);

  const Tool* find(const std::string& name) const;
  std::vector<ToolDescriptor> list_tools() const;
  std::size_t size() const { return tools_.size(); }

 private:
  std::vector<Tool> tools_;
  std::unordered_map<std::string, std::size_t> index_;
};

// search_flights then server_status. The lookup must outlive the registry.
ToolRegistry build_tool_registry(flights::FlightLookup& lookup);

class ToolInvoker {
 public:
  ToolInvoker(const ToolRegistry& registry, const core::Logger& logger);

  // Never throws: handler exceptions become InternalError results.
  ToolResult invoke(const std::string& name, const Json& arguments) const;

 private:
  void warn_missing_required(const ToolDescriptor& descriptor, const Json& arguments) const;

  const ToolRegistry& registry_;
  const core::Logger& logger_;
};

}  // namespace flight_search::mcp
