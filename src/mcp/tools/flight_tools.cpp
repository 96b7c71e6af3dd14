#include "mcp/tools.hpp"

#include <optional>
#include <string>
#include <utility>

namespace flight_search::mcp {
namespace {

Json string_property(const char* description) {
  return Json{{"type", "string"}, {"description", description}};
}

// Missing or null arguments read as empty strings.
std::string string_argument(const Json& arguments, const char* key) {
  if (!arguments.is_object()) {
    return {};
  }
  const auto it = arguments.find(key);
  if (it == arguments.end() || it->is_null()) {
    return {};
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

std::optional<std::string> optional_string_argument(const Json& arguments, const char* key) {
  auto value = string_argument(arguments, key);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

Tool make_search_flights_tool(flights::FlightLookup& lookup) {
  ToolDescriptor descriptor{
      .name = kSearchFlightsTool,
      .description = "Search for flights between airports",
      .input_schema = Json{{"type", "object"},
                           {"properties",
                            {{"origin", string_property("Origin airport code (e.g., JFK, LAX)")},
                             {"destination", string_property("Destination airport code (e.g., JFK, LAX)")},
                             {"outbound_date", string_property("Departure date (YYYY-MM-DD)")},
                             {"return_date", string_property("Return date for round trip (YYYY-MM-DD)")}}},
                           {"required", Json::array({"origin", "destination", "outbound_date"})}}};

  auto handler = [&lookup](const Json& arguments) {
    flights::FlightQuery query{.origin = string_argument(arguments, "origin"),
                               .destination = string_argument(arguments, "destination"),
                               .outbound_date = string_argument(arguments, "outbound_date"),
                               .return_date = optional_string_argument(arguments, "return_date")};
    return flights::to_json(lookup.lookup(query)).dump(2, ' ', false, Json::error_handler_t::replace);
  };

  return Tool{.descriptor = std::move(descriptor), .handler = std::move(handler)};
}

Tool make_server_status_tool() {
  ToolDescriptor descriptor{.name = kServerStatusTool,
                            .description = "Check if the flight search server is running",
                            .input_schema = Json{{"type", "object"}, {"properties", Json::object()}}};

  return Tool{.descriptor = std::move(descriptor), .handler = [](const Json&) { return std::string(kServerStatusText); }};
}

}  // namespace

ToolRegistry build_tool_registry(flights::FlightLookup& lookup) {
  ToolRegistry registry;
  registry.register_tool(make_search_flights_tool(lookup));
  registry.register_tool(make_server_status_tool());
  return registry;
}

}  // namespace flight_search::mcp
