#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace flight_search::flights {

enum class TripType {
  kOneWay,
  kRoundTrip,
};

struct FlightQuery {
  std::string origin;
  std::string destination;
  std::string outbound_date;
  std::optional<std::string> return_date;

  TripType trip_type() const { return return_date.has_value() ? TripType::kRoundTrip : TripType::kOneWay; }
};

// Provider values pass through as sent; absent ones are null, except price
// which falls back to "N/A".
struct FlightSummary {
  nlohmann::ordered_json price = "N/A";
  nlohmann::ordered_json departure_time{};
  nlohmann::ordered_json arrival_time{};
  nlohmann::ordered_json airline{};
  nlohmann::ordered_json duration{};
  int stops{0};
};

struct FlightResult {
  enum class Status {
    kSuccess,
    kError,
  };

  Status status{Status::kSuccess};
  FlightQuery query{};
  std::vector<FlightSummary> flights{};
  std::string message{};

  static FlightResult success(FlightQuery query, std::vector<FlightSummary> flights);
  static FlightResult failure(std::string message);

  bool ok() const { return status == Status::kSuccess; }
};

const char* trip_type_name(TripType type);

// Wire shape of the search_flights tool payload.
nlohmann::ordered_json to_json(const FlightResult& result);

// Synchronous flight price lookup. Implementations report provider and network
// failures as FlightResult::failure rather than throwing.
class FlightLookup {
 public:
  virtual ~FlightLookup() = default;

  virtual FlightResult lookup(const FlightQuery& query) = 0;
};

}  // namespace flight_search::flights
