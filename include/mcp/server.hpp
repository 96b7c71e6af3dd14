#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "core/log.hpp"
#include "mcp/dispatcher.hpp"

namespace flight_search::mcp {

// Line-oriented JSON-RPC loop: one frame in, at most one frame out, strictly
// in arrival order.
class Server {
 public:
  Server(const Dispatcher& dispatcher, const core::Logger& logger);

  // Serves until end of input. Returns the process exit status.
  int run(std::istream& in, std::ostream& out) const;

  // Response frame for a single input line, or nullopt when none is owed.
  std::optional<Json> handle_line(const std::string& line) const;

 private:
  const Dispatcher& dispatcher_;
  const core::Logger& logger_;
};

}  // namespace flight_search::mcp
