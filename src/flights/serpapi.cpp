#include "flights/serpapi.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flight_search::flights {
namespace {

using Json = nlohmann::ordered_json;

Json member_or_null(const Json& object, const char* key) {
  if (!object.is_object()) {
    return nullptr;
  }
  const auto it = object.find(key);
  if (it == object.end()) {
    return nullptr;
  }
  return *it;
}

std::string describe_provider_error(const Json& error) {
  return error.is_string() ? error.get<std::string>() : error.dump();
}

FlightSummary parse_flight(const Json& flight) {
  FlightSummary summary{};

  const auto price_it = flight.find("price");
  if (price_it != flight.end()) {
    summary.price = *price_it;
  }

  summary.duration = member_or_null(flight, "total_duration");

  const auto legs_it = flight.find("flights");
  if (legs_it == flight.end() || !legs_it->is_array() || legs_it->empty()) {
    return summary;
  }

  const auto& first_leg = legs_it->front();
  summary.departure_time = member_or_null(member_or_null(first_leg, "departure_airport"), "time");
  summary.arrival_time = member_or_null(member_or_null(first_leg, "arrival_airport"), "time");
  summary.airline = member_or_null(first_leg, "airline");
  summary.stops = static_cast<int>(legs_it->size()) - 1;
  return summary;
}

}  // namespace

http::QueryParams build_search_params(const FlightQuery& query, const core::SerpApiConfig& config) {
  http::QueryParams params{{"engine", kSerpApiEngine},
                           {"departure_id", query.origin},
                           {"arrival_id", query.destination},
                           {"outbound_date", query.outbound_date},
                           {"currency", config.currency},
                           {"api_key", config.api_key}};

  if (query.return_date.has_value()) {
    params.emplace_back("return_date", *query.return_date);
    params.emplace_back("type", kSerpApiRoundTrip);
  } else {
    params.emplace_back("type", kSerpApiOneWay);
  }
  return params;
}

FlightResult parse_search_response(const FlightQuery& query, const std::string& body, const std::size_t max_results) {
  const auto data = Json::parse(body);
  if (!data.is_object()) {
    throw std::runtime_error("response body is not a JSON object");
  }

  if (const auto error_it = data.find("error"); error_it != data.end()) {
    return FlightResult::failure("SerpAPI error: " + describe_provider_error(*error_it));
  }

  std::vector<FlightSummary> flights;
  const auto best_it = data.find("best_flights");
  if (best_it != data.end() && !best_it->is_null()) {
    if (!best_it->is_array()) {
      throw std::runtime_error("best_flights is not an array");
    }
    for (const auto& flight : *best_it) {
      if (flights.size() >= max_results) {
        break;
      }
      if (!flight.is_object()) {
        throw std::runtime_error("best_flights entry is not an object");
      }
      flights.push_back(parse_flight(flight));
    }
  }

  return FlightResult::success(query, std::move(flights));
}

SerpApiFlightLookup::SerpApiFlightLookup(const core::SerpApiConfig& config, http::HttpClient& client,
                                         const core::Logger& logger)
    : config_(config), client_(client), logger_(logger) {}

FlightResult SerpApiFlightLookup::lookup(const FlightQuery& query) {
  logger_.info("searching flights " + query.origin + " -> " + query.destination + " on " + query.outbound_date +
               (query.return_date.has_value() ? " returning " + *query.return_date : std::string(" (one way)")));

  http::HttpResponse response{};
  try {
    response = client_.get(config_.endpoint, build_search_params(query, config_));
  } catch (const http::HttpError& ex) {
    logger_.error(std::string("flight search request failed: ") + ex.what());
    return FlightResult::failure(std::string("API request failed: ") + ex.what());
  }

  if (response.status >= 400) {
    std::string detail = "HTTP " + std::to_string(response.status);
    try {
      const auto data = Json::parse(response.body);
      if (data.is_object() && data.contains("error")) {
        detail += " (" + describe_provider_error(data.at("error")) + ")";
      }
    } catch (const nlohmann::json::exception&) {
      // body is not JSON; the status alone describes the failure
    }
    logger_.error("flight search rejected: " + detail);
    return FlightResult::failure("API request failed: " + detail);
  }

  try {
    auto result = parse_search_response(query, response.body, config_.max_results);
    if (result.ok()) {
      logger_.debug("flight search returned " + std::to_string(result.flights.size()) + " flights");
    } else {
      logger_.warning(result.message);
    }
    return result;
  } catch (const std::exception& ex) {
    logger_.error(std::string("unable to process flight data: ") + ex.what());
    return FlightResult::failure(std::string("Error processing flight data: ") + ex.what());
  }
}

}  // namespace flight_search::flights
