#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>

#include "core/config.hpp"
#include "mcp/server.hpp"

namespace flight_search::mcp {

// How the server is reached. The dispatcher and invoker are unaware of it.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual int serve(const Server& server) = 0;
};

class StdioTransport final : public Transport {
 public:
  StdioTransport(std::istream& in, std::ostream& out);

  int serve(const Server& server) override;

 private:
  std::istream& in_;
  std::ostream& out_;
};

// Network listener placeholder; serve() throws std::runtime_error.
class HttpTransport final : public Transport {
 public:
  explicit HttpTransport(std::uint16_t port);

  int serve(const Server& server) override;

  std::uint16_t port() const { return port_; }

 private:
  std::uint16_t port_;
};

std::unique_ptr<Transport> make_transport(const core::TransportConfig& config, std::istream& in, std::ostream& out);

}  // namespace flight_search::mcp
