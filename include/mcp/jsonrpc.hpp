#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace flight_search::mcp {

// Insertion-ordered so frames go out as {"jsonrpc","id","result"|"error"}.
using Json = nlohmann::ordered_json;

constexpr const char* kJsonRpcVersion = "2.0";

// Echoed in place of a request id that was sent as null.
constexpr const char* kUnknownId = "unknown";

enum class ErrorCode : int {
  kParseError = -32700,
  kMethodNotFound = -32601,
  kInternalError = -32603,
};

struct JsonRpcError {
  ErrorCode code;
  std::string message;
};

// Thrown by method handlers for failures that map onto a protocol error.
class JsonRpcException : public std::runtime_error {
 public:
  explicit JsonRpcException(JsonRpcError error) : std::runtime_error(error.message), error_(std::move(error)) {}

  const JsonRpcError& error() const { return error_; }

 private:
  JsonRpcError error_;
};

JsonRpcError parse_error(const std::string& detail);
JsonRpcError method_not_found(const std::string& method);
JsonRpcError unknown_tool(const std::string& name);
JsonRpcError internal_error(const std::string& detail);

struct JsonRpcRequest {
  std::optional<std::string> method;
  Json params;
  std::optional<Json> id;

  bool is_notification() const { return !id.has_value(); }
};

// Throws std::invalid_argument if the message is not a JSON object. A missing
// or non-string method is left empty for the dispatcher to reject.
JsonRpcRequest parse_request(const Json& message);

// Best-effort id recovery for error frames: the message id, or null.
Json recover_id(const Json& message);

Json make_result_response(const Json& id, const Json& result);
Json make_error_response(const Json& id, const JsonRpcError& error);

}  // namespace flight_search::mcp
