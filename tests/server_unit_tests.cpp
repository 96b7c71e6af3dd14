#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/log.hpp"
#include "flights/flight_lookup.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "mcp/transport.hpp"

using flight_search::core::LogLevel;
using flight_search::core::Logger;
using flight_search::core::TransportConfig;
using flight_search::core::TransportKind;
using flight_search::flights::FlightLookup;
using flight_search::flights::FlightQuery;
using flight_search::flights::FlightResult;
using flight_search::flights::FlightSummary;
using flight_search::mcp::Dispatcher;
using flight_search::mcp::HttpTransport;
using flight_search::mcp::Json;
using flight_search::mcp::Method;
using flight_search::mcp::MethodKind;
using flight_search::mcp::MethodTable;
using flight_search::mcp::Server;
using flight_search::mcp::Tool;
using flight_search::mcp::ToolDescriptor;
using flight_search::mcp::ToolInvoker;
using flight_search::mcp::ToolRegistry;
using flight_search::mcp::build_tool_registry;
using flight_search::mcp::make_protocol_methods;
using flight_search::mcp::make_transport;

namespace {

class FakeFlightLookup final : public FlightLookup {
 public:
  FlightResult lookup(const FlightQuery& query) override {
    calls.push_back(query);
    if (throw_message.has_value()) {
      throw std::runtime_error(*throw_message);
    }
    if (failure_message.has_value()) {
      return FlightResult::failure(*failure_message);
    }
    return FlightResult::success(query, flights);
  }

  std::vector<FlightQuery> calls{};
  std::vector<FlightSummary> flights{};
  std::optional<std::string> failure_message{};
  std::optional<std::string> throw_message{};
};

// Full stack wired the way main() wires it, minus the network.
struct Harness {
  std::ostringstream log_stream{};
  Logger logger{log_stream, LogLevel::kDebug};
  FakeFlightLookup lookup{};
  ToolRegistry registry = build_tool_registry(lookup);
  ToolInvoker invoker{registry, logger};
  Dispatcher dispatcher{make_protocol_methods(registry, invoker), logger};
  Server server{dispatcher, logger};

  std::string run_raw(const std::string& input, int* exit_code = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    const int rc = server.run(in, out);
    if (exit_code != nullptr) {
      *exit_code = rc;
    }
    return out.str();
  }

  std::vector<Json> run(const std::string& input) {
    std::vector<Json> frames;
    std::istringstream lines(run_raw(input));
    std::string line;
    while (std::getline(lines, line)) {
      frames.push_back(Json::parse(line));
    }
    return frames;
  }
};

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::string call_line(int id, const std::string& tool, const std::string& arguments) {
  return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/call","params":{"name":")" + tool +
         R"(","arguments":)" + arguments + "}}\n";
}

int test_ping_frame_is_exact() {
  Harness harness;
  const auto output = harness.run_raw("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
  if (output != "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n") {
    return fail("test_ping_frame_is_exact", "unexpected ping response");
  }
  return 0;
}

int test_initialize_reports_identity() {
  Harness harness;
  const auto frames = harness.run("{\"jsonrpc\":\"2.0\",\"id\":0,\"method\":\"initialize\",\"params\":{}}\n");
  if (frames.size() != 1) {
    return fail("test_initialize_reports_identity", "expected exactly one response");
  }
  const auto& result = frames[0]["result"];
  if (result["protocolVersion"] != "2024-11-05" || result["serverInfo"]["name"] != "flight-search-server" ||
      result["serverInfo"]["version"] != "1.0.2" || !result["capabilities"]["tools"].is_object()) {
    return fail("test_initialize_reports_identity", "initialize payload mismatch");
  }
  return 0;
}

int test_tools_list_order() {
  Harness harness;
  const auto frames = harness.run("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
  if (frames.size() != 1 || frames[0]["id"] != 2) {
    return fail("test_tools_list_order", "expected one response echoing id 2");
  }
  const auto& tools = frames[0]["result"]["tools"];
  if (!tools.is_array() || tools.size() != 2) {
    return fail("test_tools_list_order", "expected exactly two tools");
  }
  if (tools[0]["name"] != "search_flights" || tools[1]["name"] != "server_status") {
    return fail("test_tools_list_order", "tools must be listed in declaration order");
  }
  const auto& required = tools[0]["inputSchema"]["required"];
  if (required != Json::array({"origin", "destination", "outbound_date"})) {
    return fail("test_tools_list_order", "search_flights required arguments mismatch");
  }
  if (!tools[1]["inputSchema"]["properties"].empty()) {
    return fail("test_tools_list_order", "server_status takes no arguments");
  }
  return 0;
}

int test_malformed_line_recovers() {
  Harness harness;
  const auto frames = harness.run("{not json\n{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"ping\"}\n");
  if (frames.size() != 2) {
    return fail("test_malformed_line_recovers", "expected one error and one ping response");
  }
  if (frames[0]["error"]["code"] != -32700 || !frames[0]["id"].is_null() || frames[0].contains("result")) {
    return fail("test_malformed_line_recovers", "malformed line should yield -32700 with null id");
  }
  if (frames[1]["id"] != 3 || !frames[1]["result"].empty()) {
    return fail("test_malformed_line_recovers", "loop should keep serving after a parse error");
  }
  return 0;
}

int test_non_object_line_is_parse_error() {
  Harness harness;
  const auto frames = harness.run("[1,2,3]\n\"text\"\n");
  if (frames.size() != 2) {
    return fail("test_non_object_line_is_parse_error", "expected two parse errors");
  }
  for (const auto& frame : frames) {
    if (frame["error"]["code"] != -32700 || !frame["id"].is_null()) {
      return fail("test_non_object_line_is_parse_error", "non-object JSON should be a parse error");
    }
  }
  return 0;
}

int test_notifications_never_answered() {
  Harness harness;
  const std::string input =
      "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"does/not/exist\"}\n"
      "{\"jsonrpc\":\"2.0\"}\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"tools/call\",\"params\":{\"name\":\"search_flights\",\"arguments\":{}}}\n";
  const auto output = harness.run_raw(input);
  if (!output.empty()) {
    return fail("test_notifications_never_answered", "notifications must not produce output");
  }
  if (!harness.lookup.calls.empty()) {
    return fail("test_notifications_never_answered", "notification must not reach the lookup");
  }
  return 0;
}

int test_initialized_with_id_is_silent() {
  Harness harness;
  const auto output = harness.run_raw("{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"notifications/initialized\"}\n");
  if (!output.empty()) {
    return fail("test_initialized_with_id_is_silent", "notifications/initialized is acknowledged without a response");
  }
  return 0;
}

int test_unknown_method_echoes_id() {
  Harness harness;
  const auto frames = harness.run("{\"jsonrpc\":\"2.0\",\"id\":\"req-5\",\"method\":\"resources/list\"}\n");
  if (frames.size() != 1) {
    return fail("test_unknown_method_echoes_id", "expected exactly one response");
  }
  if (frames[0]["id"] != "req-5" || frames[0]["error"]["code"] != -32601 ||
      frames[0]["error"]["message"] != "Method not found: resources/list") {
    return fail("test_unknown_method_echoes_id", "unknown method should yield -32601 echoing the id");
  }
  return 0;
}

int test_missing_method_with_id_is_rejected() {
  Harness harness;
  const auto frames = harness.run("{\"jsonrpc\":\"2.0\",\"id\":6}\n");
  if (frames.size() != 1 || frames[0]["id"] != 6 || frames[0]["error"]["code"] != -32601) {
    return fail("test_missing_method_with_id_is_rejected", "request without method should be rejected");
  }
  return 0;
}

int test_null_id_uses_sentinel() {
  Harness harness;
  const auto frames = harness.run("{\"jsonrpc\":\"2.0\",\"id\":null,\"method\":\"ping\"}\n");
  if (frames.size() != 1 || frames[0]["id"] != "unknown") {
    return fail("test_null_id_uses_sentinel", "null id should be replaced by the sentinel");
  }

  const auto unrouted = harness.run("{\"jsonrpc\":\"2.0\",\"id\":null,\"method\":\"no/such/method\"}\n"
                                    "{\"jsonrpc\":\"2.0\",\"id\":null}\n");
  if (unrouted.size() != 2) {
    return fail("test_null_id_uses_sentinel", "unrouted requests with null id still get a response");
  }
  for (const auto& frame : unrouted) {
    if (!frame["id"].is_null() || frame["error"]["code"] != -32601) {
      return fail("test_null_id_uses_sentinel", "method-not-found should echo a null id unchanged");
    }
  }
  return 0;
}

int test_server_status_is_fixed() {
  Harness harness;
  const auto frames = harness.run(call_line(7, "server_status", "{}") +
                                  call_line(8, "server_status", R"({"verbose":true,"origin":"JFK"})"));
  if (frames.size() != 2) {
    return fail("test_server_status_is_fixed", "expected two responses");
  }
  for (const auto& frame : frames) {
    const auto& content = frame["result"]["content"];
    if (content.size() != 1 || content[0]["type"] != "text" ||
        content[0]["text"] != "Flight search server is running") {
      return fail("test_server_status_is_fixed", "server_status text mismatch");
    }
  }
  if (!harness.lookup.calls.empty()) {
    return fail("test_server_status_is_fixed", "server_status must not call the lookup");
  }
  return 0;
}

int test_search_trip_type() {
  Harness harness;
  const auto frames =
      harness.run(call_line(9, "search_flights", R"({"origin":"JFK","destination":"LAX","outbound_date":"2026-12-01"})") +
                  call_line(10, "search_flights",
                            R"({"origin":"JFK","destination":"LAX","outbound_date":"2026-12-01","return_date":"2026-12-08"})"));
  if (frames.size() != 2) {
    return fail("test_search_trip_type", "expected two responses");
  }

  const auto one_way = Json::parse(frames[0]["result"]["content"][0]["text"].get<std::string>());
  if (one_way["trip_type"] != "one_way" || !one_way["return_date"].is_null() || one_way["status"] != "success") {
    return fail("test_search_trip_type", "missing return_date should be one_way");
  }

  const auto round_trip = Json::parse(frames[1]["result"]["content"][0]["text"].get<std::string>());
  if (round_trip["trip_type"] != "round_trip" || round_trip["return_date"] != "2026-12-08") {
    return fail("test_search_trip_type", "return_date should make the trip round_trip");
  }

  if (harness.lookup.calls.size() != 2 || harness.lookup.calls[0].origin != "JFK" ||
      harness.lookup.calls[0].destination != "LAX" || harness.lookup.calls[1].return_date != "2026-12-08") {
    return fail("test_search_trip_type", "lookup received wrong query");
  }
  return 0;
}

int test_search_missing_arguments_are_empty() {
  Harness harness;
  const auto frames = harness.run(call_line(11, "search_flights", R"({"destination":"SFO"})"));
  if (frames.size() != 1 || !frames[0].contains("result")) {
    return fail("test_search_missing_arguments_are_empty", "missing arguments must not be a protocol error");
  }
  if (harness.lookup.calls.size() != 1 || !harness.lookup.calls[0].origin.empty() ||
      !harness.lookup.calls[0].outbound_date.empty() || harness.lookup.calls[0].destination != "SFO") {
    return fail("test_search_missing_arguments_are_empty", "missing arguments should reach the lookup as empty strings");
  }
  if (harness.log_stream.str().find("without required argument origin") == std::string::npos) {
    return fail("test_search_missing_arguments_are_empty", "missing required argument should be logged");
  }
  return 0;
}

int test_unknown_tool_names_tool() {
  Harness harness;
  const auto frames = harness.run(call_line(12, "book_hotel", "{}"));
  if (frames.size() != 1 || frames[0]["id"] != 12 || frames[0]["error"]["code"] != -32601) {
    return fail("test_unknown_tool_names_tool", "unknown tool should yield -32601");
  }
  if (frames[0]["error"]["message"].get<std::string>().find("book_hotel") == std::string::npos) {
    return fail("test_unknown_tool_names_tool", "error message should name the tool");
  }
  return 0;
}

int test_missing_tool_name_is_unknown_tool() {
  Harness harness;
  const auto frames = harness.run("{\"jsonrpc\":\"2.0\",\"id\":13,\"method\":\"tools/call\",\"params\":{}}\n"
                                  "{\"jsonrpc\":\"2.0\",\"id\":14,\"method\":\"tools/call\"}\n");
  if (frames.size() != 2) {
    return fail("test_missing_tool_name_is_unknown_tool", "expected two responses");
  }
  for (const auto& frame : frames) {
    if (frame["error"]["code"] != -32601 || frame["error"]["message"] != "Unknown tool: ") {
      return fail("test_missing_tool_name_is_unknown_tool", "missing name should surface as an unknown tool");
    }
  }
  return 0;
}

int test_provider_error_is_tool_content() {
  Harness harness;
  harness.lookup.failure_message = "SerpAPI error: Invalid API key";
  const auto frames = harness.run(call_line(15, "search_flights", R"({"origin":"JFK","destination":"LAX","outbound_date":"2026-12-01"})"));
  if (frames.size() != 1 || frames[0].contains("error")) {
    return fail("test_provider_error_is_tool_content", "provider failure must not be a JSON-RPC error");
  }
  const auto payload = Json::parse(frames[0]["result"]["content"][0]["text"].get<std::string>());
  if (payload["status"] != "error" || payload["message"] != "SerpAPI error: Invalid API key") {
    return fail("test_provider_error_is_tool_content", "provider failure should be reported in the text payload");
  }
  return 0;
}

int test_handler_exception_is_internal_error() {
  Harness harness;
  harness.lookup.throw_message = "socket exploded";
  const auto frames = harness.run(call_line(16, "search_flights", "{}") + "{\"jsonrpc\":\"2.0\",\"id\":17,\"method\":\"ping\"}\n");
  if (frames.size() != 2) {
    return fail("test_handler_exception_is_internal_error", "expected error then ping response");
  }
  if (frames[0]["id"] != 16 || frames[0]["error"]["code"] != -32603 ||
      frames[0]["error"]["message"] != "Internal error: socket exploded") {
    return fail("test_handler_exception_is_internal_error", "handler exception should become -32603");
  }
  if (frames[1]["id"] != 17) {
    return fail("test_handler_exception_is_internal_error", "session should continue after handler failure");
  }
  return 0;
}

int test_dispatch_exception_recovers_id() {
  std::ostringstream log_stream;
  Logger logger{log_stream, LogLevel::kOff};
  FakeFlightLookup lookup;
  const ToolRegistry registry = build_tool_registry(lookup);
  const ToolInvoker invoker{registry, logger};

  MethodTable methods = make_protocol_methods(registry, invoker);
  methods["tools/list"] = Method{.kind = MethodKind::kRequest, .handler = [](const Json&) -> Json {
                                   throw std::runtime_error("catalog unavailable");
                                 }};
  const Dispatcher dispatcher{std::move(methods), logger};
  const Server server{dispatcher, logger};

  const auto frame = server.handle_line("{\"jsonrpc\":\"2.0\",\"id\":\"x-1\",\"method\":\"tools/list\"}");
  if (!frame.has_value() || (*frame)["id"] != "x-1" || (*frame)["error"]["code"] != -32603 ||
      (*frame)["error"]["message"] != "Internal error: catalog unavailable") {
    return fail("test_dispatch_exception_recovers_id", "escaped exception should become -32603 with the request id");
  }
  return 0;
}

int test_dispatcher_requires_protocol_methods() {
  std::ostringstream log_stream;
  Logger logger{log_stream, LogLevel::kOff};
  FakeFlightLookup lookup;
  const ToolRegistry registry = build_tool_registry(lookup);
  const ToolInvoker invoker{registry, logger};

  MethodTable methods = make_protocol_methods(registry, invoker);
  methods.erase("ping");

  bool threw = false;
  try {
    const Dispatcher dispatcher{std::move(methods), logger};
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_dispatcher_requires_protocol_methods", "dispatcher must reject a table without ping");
  }
  return 0;
}

int test_registry_rejects_duplicates() {
  ToolRegistry registry;
  const auto handler = [](const Json&) { return std::string("ok"); };
  registry.register_tool(Tool{.descriptor = ToolDescriptor{.name = "a", .description = "", .input_schema = Json::object()},
                              .handler = handler});

  bool threw = false;
  try {
    registry.register_tool(Tool{.descriptor = ToolDescriptor{.name = "a", .description = "", .input_schema = Json::object()},
                                .handler = handler});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw || registry.size() != 1) {
    return fail("test_registry_rejects_duplicates", "duplicate tool names must be rejected");
  }
  if (registry.find("a") == nullptr || registry.find("b") != nullptr) {
    return fail("test_registry_rejects_duplicates", "find returned the wrong tool");
  }
  return 0;
}

int test_invalid_utf8_line_recovers() {
  Harness harness;
  int rc = -1;
  const auto output = harness.run_raw("{\"a\":\"\xff\"}\n{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n", &rc);
  if (rc != 0) {
    return fail("test_invalid_utf8_line_recovers", "loop should exit cleanly at end of input");
  }

  std::vector<Json> frames;
  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    frames.push_back(Json::parse(line));
  }
  if (frames.size() != 2) {
    return fail("test_invalid_utf8_line_recovers", "expected a parse error and a ping response");
  }
  if (frames[0]["error"]["code"] != -32700 || !frames[0]["id"].is_null()) {
    return fail("test_invalid_utf8_line_recovers", "invalid UTF-8 should yield -32700 with null id");
  }
  if (frames[1]["id"] != 1 || !frames[1]["result"].empty()) {
    return fail("test_invalid_utf8_line_recovers", "session should continue after invalid UTF-8");
  }
  return 0;
}

int test_end_of_input_exits_cleanly() {
  Harness harness;
  int rc = -1;
  const auto output = harness.run_raw("", &rc);
  if (rc != 0 || !output.empty()) {
    return fail("test_end_of_input_exits_cleanly", "empty input should exit 0 without output");
  }

  const auto blank = harness.run_raw("\n   \n\t\n", &rc);
  if (rc != 0 || !blank.empty()) {
    return fail("test_end_of_input_exits_cleanly", "blank lines should be skipped");
  }
  return 0;
}

int test_responses_follow_request_order() {
  Harness harness;
  const auto frames = harness.run(
      "{\"jsonrpc\":\"2.0\",\"id\":\"a\",\"method\":\"ping\"}\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":\"b\",\"method\":\"tools/list\"}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":\"c\",\"method\":\"nope\"}\n");
  if (frames.size() != 3 || frames[0]["id"] != "a" || frames[1]["id"] != "b" || frames[2]["id"] != "c") {
    return fail("test_responses_follow_request_order", "responses must match request order");
  }
  return 0;
}

int test_transport_selection() {
  Harness harness;
  std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
  std::ostringstream out;

  auto stdio = make_transport(TransportConfig{.type = TransportKind::kStdio, .port = 3001}, in, out);
  if (stdio->serve(harness.server) != 0 || out.str() != "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n") {
    return fail("test_transport_selection", "stdio transport should run the loop");
  }

  auto http = make_transport(TransportConfig{.type = TransportKind::kHttp, .port = 3001}, in, out);
  bool threw = false;
  try {
    (void)http->serve(harness.server);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw || dynamic_cast<HttpTransport*>(http.get()) == nullptr) {
    return fail("test_transport_selection", "http transport should report that it is not implemented");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_ping_frame_is_exact(); rc != 0) {
    return rc;
  }
  if (int rc = test_initialize_reports_identity(); rc != 0) {
    return rc;
  }
  if (int rc = test_tools_list_order(); rc != 0) {
    return rc;
  }
  if (int rc = test_malformed_line_recovers(); rc != 0) {
    return rc;
  }
  if (int rc = test_non_object_line_is_parse_error(); rc != 0) {
    return rc;
  }
  if (int rc = test_notifications_never_answered(); rc != 0) {
    return rc;
  }
  if (int rc = test_initialized_with_id_is_silent(); rc != 0) {
    return rc;
  }
  if (int rc = test_unknown_method_echoes_id(); rc != 0) {
    return rc;
  }
  if (int rc = test_missing_method_with_id_is_rejected(); rc != 0) {
    return rc;
  }
  if (int rc = test_null_id_uses_sentinel(); rc != 0) {
    return rc;
  }
  if (int rc = test_server_status_is_fixed(); rc != 0) {
    return rc;
  }
  if (int rc = test_search_trip_type(); rc != 0) {
    return rc;
  }
  if (int rc = test_search_missing_arguments_are_empty(); rc != 0) {
    return rc;
  }
  if (int rc = test_unknown_tool_names_tool(); rc != 0) {
    return rc;
  }
  if (int rc = test_missing_tool_name_is_unknown_tool(); rc != 0) {
    return rc;
  }
  if (int rc = test_provider_error_is_tool_content(); rc != 0) {
    return rc;
  }
  if (int rc = test_handler_exception_is_internal_error(); rc != 0) {
    return rc;
  }
  if (int rc = test_dispatch_exception_recovers_id(); rc != 0) {
    return rc;
  }
  if (int rc = test_dispatcher_requires_protocol_methods(); rc != 0) {
    return rc;
  }
  if (int rc = test_registry_rejects_duplicates(); rc != 0) {
    return rc;
  }
  if (int rc = test_invalid_utf8_line_recovers(); rc != 0) {
    return rc;
  }
  if (int rc = test_end_of_input_exits_cleanly(); rc != 0) {
    return rc;
  }
  if (int rc = test_responses_follow_request_order(); rc != 0) {
    return rc;
  }
  if (int rc = test_transport_selection(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] server unit tests\n";
  return 0;
}
