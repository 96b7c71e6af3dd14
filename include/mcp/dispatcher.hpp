#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/log.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace flight_search::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "flight-search-server";
constexpr const char* kServerVersion = "1.0.2";

enum class MethodKind {
  kRequest,
  // Acknowledged silently even when the envelope carries an id.
  kNotification,
};

struct Method {
  MethodKind kind;
  // Receives params (always an object). Throws JsonRpcException for protocol errors.
  std::function<Json(const Json&)> handler;
};

using MethodTable = std::unordered_map<std::string, Method>;

// Methods every dispatcher must route: initialize, tools/list, tools/call,
// ping, notifications/initialized.
const std::vector<std::string>& required_methods();

MethodTable make_protocol_methods(const ToolRegistry& registry, const ToolInvoker& invoker);

class Dispatcher {
 public:
  // Throws std::invalid_argument if a required method is missing from the table.
  Dispatcher(MethodTable methods, const core::Logger& logger);

  // Returns the response frame, or nullopt for notifications. Exceptions other
  // than JsonRpcException escape to the caller.
  std::optional<Json> dispatch(const JsonRpcRequest& request) const;

 private:
  MethodTable methods_;
  const core::Logger& logger_;
};

}  // namespace flight_search::mcp
