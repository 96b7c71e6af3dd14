#include "mcp/transport.hpp"

#include <stdexcept>
#include <string>

namespace flight_search::mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

int StdioTransport::serve(const Server& server) { return server.run(in_, out_); }

HttpTransport::HttpTransport(const std::uint16_t port) : port_(port) {}

int HttpTransport::serve(const Server& /*server*/) {
  throw std::runtime_error("HTTP transport on port " + std::to_string(port_) + " not implemented yet; use stdio");
}

std::unique_ptr<Transport> make_transport(const core::TransportConfig& config, std::istream& in, std::ostream& out) {
  switch (config.type) {
    case core::TransportKind::kStdio:
      return std::make_unique<StdioTransport>(in, out);
    case core::TransportKind::kHttp:
      return std::make_unique<HttpTransport>(config.port);
  }
  throw std::invalid_argument("unsupported transport");
}

}  // namespace flight_search::mcp
