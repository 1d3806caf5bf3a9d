#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "domain/StrategyTypes.h"
#include "domain/Types.h"

namespace adapters::stream {

struct SnapshotEvent {
    std::vector<domain::Candle> candles;
};

struct UpsertEvent {
    domain::Candle candle;
};

struct HeartbeatEvent {};

using StreamEvent = std::variant<SnapshotEvent, UpsertEvent, HeartbeatEvent, domain::TickerTick, domain::BarUpdate>;

const char* event_name(const StreamEvent& event);

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class DecodeFailure { None, Malformed, UnknownEvent };

// Turns wire JSON into typed events. Every time field is read in the unit
// declared for its source and converted to epoch milliseconds here; nothing
// downstream guesses units from magnitudes.
class StreamMessageDecoder {
public:
    explicit StreamMessageDecoder(domain::TimeUnit streamUnit = domain::TimeUnit::Milliseconds,
                                  domain::TimeUnit strategyUnit = domain::TimeUnit::Seconds);

    // nullopt for malformed or unknown messages; neither reaches the series.
    // Malformed ones count under stream_malformed, unknown event names under
    // stream_unknown_event. `failure` reports which one happened.
    std::optional<StreamEvent> decode(std::string_view payload, DecodeFailure* failure = nullptr) const;

    std::optional<domain::StrategyPayload> decodeStrategyPayload(std::string_view payload) const;

    domain::TimeUnit streamUnit() const { return streamUnit_; }
    domain::TimeUnit strategyUnit() const { return strategyUnit_; }

private:
    StreamEvent decodeObject_(const boost::json::object& obj) const;
    domain::Candle parseCandle_(const boost::json::value& value) const;
    domain::BarUpdate parseBarUpdate_(const boost::json::object& obj) const;
    domain::TickerTick parseTick_(const boost::json::object& obj) const;
    domain::StrategyPayload parseStrategy_(const boost::json::object& obj) const;

    static double parse_json_number_(const boost::json::value& value);
    static std::int64_t parse_json_int_(const boost::json::value& value);
    static domain::TimestampMs parse_json_time_(const boost::json::value& value, domain::TimeUnit unit);
    static const boost::json::value& require_(const boost::json::object& obj, const char* key);

    domain::TimeUnit streamUnit_;
    domain::TimeUnit strategyUnit_;
};

}  // namespace adapters::stream
