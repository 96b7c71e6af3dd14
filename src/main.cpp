#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include <signal.h>

#include "core/config.hpp"
#include "core/log.hpp"
#include "flights/serpapi.hpp"
#include "http/http_client.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "mcp/transport.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

// No SA_RESTART: a pending read on stdin fails with EINTR and the loop ends.
void install_shutdown_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

}  // namespace

int main(int argc, char** argv) {
  using namespace flight_search;

  core::Logger logger{std::cerr, core::LogLevel::kDebug};

  core::CommandLineOptions options{};
  core::ServerConfig config{};
  try {
    options = core::parse_command_line(argc, argv);
    if (options.show_help) {
      std::cerr << core::usage(argv[0]);
      return 0;
    }
    if (options.config_path.has_value()) {
      config = core::load_server_config(*options.config_path);
    }
    core::apply_environment(config);
    core::apply_command_line(config, options);
  } catch (const std::exception& ex) {
    logger.error(std::string("config error: ") + ex.what());
    std::cerr << core::usage(argv[0]);
    return 1;
  }

  logger.set_threshold(config.log_level);
  logger.info(core::format_config_settings(config));

  if (config.serpapi.api_key.empty()) {
    logger.error(std::string(core::kApiKeyEnvVar) + " environment variable not set");
    return 1;
  }

  install_shutdown_handlers();

  try {
    http::CurlHttpClient http_client{http::CurlOptions{.timeout = std::chrono::seconds(config.serpapi.timeout_seconds)}};
    flights::SerpApiFlightLookup lookup{config.serpapi, http_client, logger};

    const mcp::ToolRegistry registry = mcp::build_tool_registry(lookup);
    const mcp::ToolInvoker invoker{registry, logger};
    const mcp::Dispatcher dispatcher{mcp::make_protocol_methods(registry, invoker), logger};
    const mcp::Server server{dispatcher, logger};

    auto transport = mcp::make_transport(config.transport, std::cin, std::cout);
    const int rc = transport->serve(server);
    if (g_shutdown_requested != 0) {
      logger.info("server interrupted");
    }
    return rc;
  } catch (const std::exception& ex) {
    logger.error(std::string("server error: ") + ex.what());
    return 1;
  }
}
