#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/log.hpp"

namespace flight_search::core {

struct SerpApiConfig {
  std::string api_key{};
  std::string endpoint{"https://serpapi.com/search"};
  std::string currency{"USD"};
  std::uint32_t max_results{5};
  // 0 leaves the lookup unbounded.
  std::uint32_t timeout_seconds{0};
};

enum class TransportKind {
  kStdio,
  kHttp,
};

struct TransportConfig {
  TransportKind type{TransportKind::kStdio};
  std::uint16_t port{3001};
};

struct ServerConfig {
  SerpApiConfig serpapi{};
  LogLevel log_level{LogLevel::kDebug};
  TransportConfig transport{};
};

struct CommandLineOptions {
  std::optional<std::string> config_path{};
  std::optional<TransportKind> transport{};
  std::optional<std::uint16_t> port{};
  std::optional<LogLevel> log_level{};
  bool show_help{false};
};

constexpr const char* kApiKeyEnvVar = "SERP_API_KEY";

TransportKind parse_transport_kind(const std::string& value);
const char* transport_kind_name(TransportKind kind);

ServerConfig load_server_config(const std::string& path);

// Overrides serpapi.api_key from SERP_API_KEY when the variable is set and non-empty.
void apply_environment(ServerConfig& config);

CommandLineOptions parse_command_line(int argc, const char* const* argv);
void apply_command_line(ServerConfig& config, const CommandLineOptions& options);

std::string usage(const std::string& program);
std::string format_config_settings(const ServerConfig& config);

}  // namespace flight_search::core
