#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace flight_search::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// Position of a '#' that starts a comment, ignoring any inside quotes.
std::size_t comment_start(const std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return i;
    }
  }
  return line.size();
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto parsed = parse_integer(key, value);
  if (parsed <= 0 || parsed > 65535) {
    throw std::runtime_error(key + " must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed);
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == "serpapi.api_key") {
    config.serpapi.api_key = value;
    return;
  }

  if (key == "serpapi.endpoint") {
    if (value.empty()) {
      throw std::runtime_error("serpapi.endpoint must not be empty");
    }
    config.serpapi.endpoint = value;
    return;
  }

  if (key == "serpapi.currency") {
    config.serpapi.currency = value;
    return;
  }

  if (key == "serpapi.max_results") {
    const auto parsed = parse_integer(key, value);
    if (parsed <= 0 || parsed > 100) {
      throw std::runtime_error("serpapi.max_results must be in range 1..100");
    }
    config.serpapi.max_results = static_cast<std::uint32_t>(parsed);
    return;
  }

  if (key == "serpapi.timeout_seconds") {
    const auto parsed = parse_integer(key, value);
    if (parsed < 0) {
      throw std::runtime_error("serpapi.timeout_seconds must be greater than or equal to 0");
    }
    config.serpapi.timeout_seconds = static_cast<std::uint32_t>(parsed);
    return;
  }

  if (key == "log.level") {
    config.log_level = parse_log_level(value);
    return;
  }

  if (key == "transport.type") {
    config.transport.type = parse_transport_kind(value);
    return;
  }

  if (key == "transport.port") {
    config.transport.port = parse_port(key, value);
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

TransportKind parse_transport_kind(const std::string& value) {
  if (value == "stdio") {
    return TransportKind::kStdio;
  }
  if (value == "http") {
    return TransportKind::kHttp;
  }
  throw std::runtime_error("transport must be 'stdio' or 'http', got '" + value + "'");
}

const char* transport_kind_name(const TransportKind kind) {
  switch (kind) {
    case TransportKind::kStdio:
      return "stdio";
    case TransportKind::kHttp:
      return "http";
  }
  return "unknown";
}

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    line.erase(comment_start(line));

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("malformed config line: " + stripped);
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty() && colon_pos + 1 == stripped.size()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_environment(ServerConfig& config) {
  const char* api_key = std::getenv(kApiKeyEnvVar);
  if (api_key != nullptr && api_key[0] != '\0') {
    config.serpapi.api_key = api_key;
  }
}

CommandLineOptions parse_command_line(const int argc, const char* const* argv) {
  CommandLineOptions options{};

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      continue;
    }

    if (arg.rfind("--", 0) != 0) {
      throw std::runtime_error("unexpected argument: " + arg);
    }

    std::string value;
    bool has_value = false;
    const auto eq_pos = arg.find('=');
    if (eq_pos != std::string::npos) {
      value = arg.substr(eq_pos + 1);
      arg.erase(eq_pos);
      has_value = true;
    }

    if (arg != "--connection_type" && arg != "--port" && arg != "--config" && arg != "--log-level") {
      throw std::runtime_error("unknown option: " + arg);
    }

    if (!has_value) {
      if (i + 1 >= argc) {
        throw std::runtime_error(arg + " requires a value");
      }
      value = argv[++i];
    }

    if (arg == "--connection_type") {
      options.transport = parse_transport_kind(value);
    } else if (arg == "--port") {
      options.port = parse_port("--port", value);
    } else if (arg == "--config") {
      options.config_path = value;
    } else {
      options.log_level = parse_log_level(value);
    }
  }

  return options;
}

void apply_command_line(ServerConfig& config, const CommandLineOptions& options) {
  if (options.transport.has_value()) {
    config.transport.type = *options.transport;
  }
  if (options.port.has_value()) {
    config.transport.port = *options.port;
  }
  if (options.log_level.has_value()) {
    config.log_level = *options.log_level;
  }
}

std::string usage(const std::string& program) {
  std::ostringstream output;
  output << "usage: " << program << " [--connection_type stdio|http] [--port N] [--config PATH] [--log-level LEVEL]\n"
         << "  the SerpAPI key is read from " << kApiKeyEnvVar << " or serpapi.api_key in the config file\n";
  return output.str();
}

std::string format_config_settings(const ServerConfig& config) {
  std::ostringstream output;
  output << "config"
         << " | transport=" << transport_kind_name(config.transport.type)
         << " | port=" << config.transport.port
         << " | log_level=" << log_level_name(config.log_level)
         << " | serpapi_endpoint=" << config.serpapi.endpoint
         << " | currency=" << config.serpapi.currency
         << " | max_results=" << config.serpapi.max_results
         << " | timeout_seconds=" << config.serpapi.timeout_seconds
         << " | api_key=" << (config.serpapi.api_key.empty() ? "<unset>" : "<redacted>");
  return output.str();
}

}  // namespace flight_search::core
