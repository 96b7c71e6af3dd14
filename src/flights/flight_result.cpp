#include "flights/flight_lookup.hpp"

#include <utility>

namespace flight_search::flights {
namespace {

template <typename T>
nlohmann::ordered_json optional_to_json(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

}  // namespace

FlightResult FlightResult::success(FlightQuery query, std::vector<FlightSummary> flights) {
  FlightResult result{};
  result.status = Status::kSuccess;
  result.query = std::move(query);
  result.flights = std::move(flights);
  return result;
}

FlightResult FlightResult::failure(std::string message) {
  FlightResult result{};
  result.status = Status::kError;
  result.message = std::move(message);
  return result;
}

const char* trip_type_name(const TripType type) {
  return type == TripType::kRoundTrip ? "round_trip" : "one_way";
}

nlohmann::ordered_json to_json(const FlightResult& result) {
  if (!result.ok()) {
    return nlohmann::ordered_json{{"status", "error"}, {"message", result.message}};
  }

  nlohmann::ordered_json flights = nlohmann::ordered_json::array();
  for (const auto& flight : result.flights) {
    flights.push_back(nlohmann::ordered_json{{"price", flight.price},
                                             {"departure_time", flight.departure_time},
                                             {"arrival_time", flight.arrival_time},
                                             {"airline", flight.airline},
                                             {"duration", flight.duration},
                                             {"stops", flight.stops}});
  }

  const auto& query = result.query;
  return nlohmann::ordered_json{{"status", "success"},
                                {"origin", query.origin},
                                {"destination", query.destination},
                                {"outbound_date", query.outbound_date},
                                {"return_date", optional_to_json(query.return_date)},
                                {"trip_type", trip_type_name(query.trip_type())},
                                {"flights", flights}};
}

}  // namespace flight_search::flights
