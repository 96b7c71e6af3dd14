#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flight_search::http {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  long status{0};
  std::string body{};
};

// Transport-level failure: DNS, TLS, connect, timeout. HTTP error statuses are
// returned as responses, not thrown.
class HttpError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string& url, const QueryParams& query) = 0;
};

struct CurlOptions {
  // Zero means no limit.
  std::chrono::seconds timeout{0};
  std::chrono::seconds connect_timeout{10};
  std::string user_agent{"flight-search-mcp/1.0.2"};
};

class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(CurlOptions options = {});
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse get(const std::string& url, const QueryParams& query) override;

 private:
  CurlOptions options_;
};

}  // namespace flight_search::http
