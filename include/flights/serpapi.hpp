#pragma once

#include <cstddef>
#include <string>

#include "core/config.hpp"
#include "core/log.hpp"
#include "flights/flight_lookup.hpp"
#include "http/http_client.hpp"

namespace flight_search::flights {

constexpr const char* kSerpApiEngine = "google_flights";
constexpr const char* kSerpApiRoundTrip = "1";
constexpr const char* kSerpApiOneWay = "2";

http::QueryParams build_search_params(const FlightQuery& query, const core::SerpApiConfig& config);

// Turns a SerpAPI Google Flights body into a result. Provider errors come back
// as failures; malformed bodies throw nlohmann::json exceptions.
FlightResult parse_search_response(const FlightQuery& query, const std::string& body, std::size_t max_results);

class SerpApiFlightLookup final : public FlightLookup {
 public:
  SerpApiFlightLookup(const core::SerpApiConfig& config, http::HttpClient& client, const core::Logger& logger);

  FlightResult lookup(const FlightQuery& query) override;

 private:
  const core::SerpApiConfig& config_;
  http::HttpClient& client_;
  const core::Logger& logger_;
};

}  // namespace flight_search::flights
