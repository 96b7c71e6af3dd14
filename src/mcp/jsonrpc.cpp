#include "mcp/jsonrpc.hpp"

#include <stdexcept>

namespace flight_search::mcp {

JsonRpcError parse_error(const std::string& detail) {
  return JsonRpcError{.code = ErrorCode::kParseError, .message = "Parse error: " + detail};
}

JsonRpcError method_not_found(const std::string& method) {
  return JsonRpcError{.code = ErrorCode::kMethodNotFound, .message = "Method not found: " + method};
}

JsonRpcError unknown_tool(const std::string& name) {
  return JsonRpcError{.code = ErrorCode::kMethodNotFound, .message = "Unknown tool: " + name};
}

JsonRpcError internal_error(const std::string& detail) {
  return JsonRpcError{.code = ErrorCode::kInternalError, .message = "Internal error: " + detail};
}

JsonRpcRequest parse_request(const Json& message) {
  if (!message.is_object()) {
    throw std::invalid_argument("message must be a JSON object");
  }

  JsonRpcRequest parsed{.method = std::nullopt, .params = Json::object(), .id = std::nullopt};

  const auto method_it = message.find("method");
  if (method_it != message.end() && method_it->is_string()) {
    parsed.method = method_it->get<std::string>();
  }

  const auto params_it = message.find("params");
  if (params_it != message.end() && params_it->is_object()) {
    parsed.params = *params_it;
  }

  const auto id_it = message.find("id");
  if (id_it != message.end()) {
    parsed.id = *id_it;
  }

  return parsed;
}

Json recover_id(const Json& message) {
  if (!message.is_object()) {
    return nullptr;
  }
  const auto id_it = message.find("id");
  if (id_it == message.end()) {
    return nullptr;
  }
  return *id_it;
}

Json make_result_response(const Json& id, const Json& result) {
  return Json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

Json make_error_response(const Json& id, const JsonRpcError& error) {
  return Json{{"jsonrpc", kJsonRpcVersion},
              {"id", id},
              {"error", {{"code", static_cast<int>(error.code)}, {"message", error.message}}}};
}

}  // namespace flight_search::mcp
