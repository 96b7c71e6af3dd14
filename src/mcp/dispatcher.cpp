#include "mcp/dispatcher.hpp"

#include <stdexcept>
#include <utility>

namespace flight_search::mcp {
namespace {

Json handle_initialize() {
  return Json{{"protocolVersion", kProtocolVersion},
              {"capabilities", {{"tools", Json::object()}}},
              {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}};
}

Json handle_tools_list(const ToolRegistry& registry) {
  Json tools = Json::array();
  for (const auto& descriptor : registry.list_tools()) {
    tools.push_back(to_json(descriptor));
  }
  return Json{{"tools", tools}};
}

Json handle_tools_call(const ToolInvoker& invoker, const Json& params) {
  std::string name;
  const auto name_it = params.find("name");
  if (name_it != params.end() && name_it->is_string()) {
    name = name_it->get<std::string>();
  }

  Json arguments = Json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end() && args_it->is_object()) {
    arguments = *args_it;
  }

  auto result = invoker.invoke(name, arguments);
  if (!result.ok()) {
    throw JsonRpcException(std::move(*result.error));
  }

  return Json{{"content", Json::array({Json{{"type", "text"}, {"text", std::move(*result.text)}}})}};
}

}  // namespace

const std::vector<std::string>& required_methods() {
  static const std::vector<std::string> kRequiredMethods = {
      "initialize", "tools/list", "tools/call", "ping", "notifications/initialized",
  };
  return kRequiredMethods;
}

MethodTable make_protocol_methods(const ToolRegistry& registry, const ToolInvoker& invoker) {
  MethodTable methods;
  methods.emplace("initialize", Method{.kind = MethodKind::kRequest, .handler = [](const Json&) {
                                         return handle_initialize();
                                       }});
  methods.emplace("tools/list", Method{.kind = MethodKind::kRequest, .handler = [&registry](const Json&) {
                                         return handle_tools_list(registry);
                                       }});
  methods.emplace("tools/call", Method{.kind = MethodKind::kRequest, .handler = [&invoker](const Json& params) {
                                         return handle_tools_call(invoker, params);
                                       }});
  methods.emplace("ping", Method{.kind = MethodKind::kRequest, .handler = [](const Json&) {
                                   return Json::object();
                                 }});
  methods.emplace("notifications/initialized", Method{.kind = MethodKind::kNotification, .handler = [](const Json&) {
                                                        return Json::object();
                                                      }});
  return methods;
}

Dispatcher::Dispatcher(MethodTable methods, const core::Logger& logger)
    : methods_(std::move(methods)), logger_(logger) {
  for (const auto& name : required_methods()) {
    const auto it = methods_.find(name);
    if (it == methods_.end() || !it->second.handler) {
      throw std::invalid_argument("dispatcher is missing a handler for " + name);
    }
  }
}

std::optional<Json> Dispatcher::dispatch(const JsonRpcRequest& request) const {
  const std::string method_label = request.method.value_or("<missing>");

  if (request.is_notification()) {
    logger_.debug("notification " + method_label + " acknowledged");
    return std::nullopt;
  }

  // Unrouted requests echo the id as sent; routed methods answer a null id
  // with the sentinel.
  const Json& raw_id = *request.id;

  if (!request.method.has_value()) {
    logger_.warning("request " + raw_id.dump() + " has no method");
    return make_error_response(raw_id, method_not_found(method_label));
  }

  const auto it = methods_.find(*request.method);
  if (it == methods_.end()) {
    logger_.warning("method not found: " + method_label);
    return make_error_response(raw_id, method_not_found(method_label));
  }

  const Json id = raw_id.is_null() ? Json(kUnknownId) : raw_id;

  if (it->second.kind == MethodKind::kNotification) {
    logger_.debug(method_label + " received");
    return std::nullopt;
  }

  logger_.debug("processing method " + method_label + ", id " + id.dump());
  try {
    return make_result_response(id, it->second.handler(request.params));
  } catch (const JsonRpcException& ex) {
    return make_error_response(id, ex.error());
  }
}

}  // namespace flight_search::mcp
