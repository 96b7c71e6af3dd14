#include "mcp/server.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <istream>
#include <ostream>
#include <string>

#include "mcp/jsonrpc.hpp"

namespace flight_search::mcp {
namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

Server::Server(const Dispatcher& dispatcher, const core::Logger& logger) : dispatcher_(dispatcher), logger_(logger) {}

int Server::run(std::istream& in, std::ostream& out) const {
  logger_.info("starting flight search MCP server on stdio");

  std::string line;
  while (std::getline(in, line)) {
    if (is_blank(line)) {
      continue;
    }

    const auto response = handle_line(line);
    if (!response.has_value()) {
      continue;
    }

    // Parse error text can quote the offending bytes; replace invalid UTF-8
    // rather than fail the frame.
    const std::string frame = response->dump(-1, ' ', false, Json::error_handler_t::replace);
    out << frame << '\n';
    out.flush();
    logger_.debug("sent: " + frame);
  }

  if (in.bad()) {
    logger_.warning("input stream failed, shutting down");
  } else {
    logger_.info("EOF received, shutting down");
  }
  return 0;
}

std::optional<Json> Server::handle_line(const std::string& line) const {
  logger_.debug("received: " + line);

  Json message;
  try {
    message = Json::parse(line);
  } catch (const Json::parse_error& ex) {
    logger_.error(std::string("JSON decode error: ") + ex.what());
    return make_error_response(nullptr, parse_error(ex.what()));
  }

  if (!message.is_object()) {
    logger_.error("JSON decode error: message is not an object");
    return make_error_response(nullptr, parse_error("message must be a JSON object"));
  }

  try {
    return dispatcher_.dispatch(parse_request(message));
  } catch (const std::exception& ex) {
    logger_.error(std::string("unexpected error: ") + ex.what());
    return make_error_response(recover_id(message), internal_error(ex.what()));
  }
}

}  // namespace flight_search::mcp
