#include "adapters/stream/StreamMessageDecoder.hpp"

#include <cmath>
#include <exception>
#include <limits>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace adapters::stream {

namespace {

namespace metrics = tcc::common::metrics;

// 2^63; every double in [-kInt64Bound, kInt64Bound) converts to int64 exactly.
constexpr double kInt64Bound = 9223372036854775808.0;

bool fits_int64(double value) {
    return value >= -kInt64Bound && value < kInt64Bound;
}

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string to_std_string(const boost::json::string& value) {
    return std::string(value.data(), value.size());
}

void count_malformed(const char* source, const std::string& reason) {
    metrics::Registry::instance().incrementCounter("stream_malformed");
    LOG_WARN(logging::LogCategory::STREAM, "%s message discarded: %s", source, reason.c_str());
}

}  // namespace

const char* event_name(const StreamEvent& event) {
    return std::visit(Overloaded{
                          [](const SnapshotEvent&) { return "snapshot"; },
                          [](const UpsertEvent&) { return "upsert"; },
                          [](const HeartbeatEvent&) { return "heartbeat"; },
                          [](const domain::TickerTick&) { return "tick"; },
                          [](const domain::BarUpdate&) { return "bar_update"; },
                      },
                      event);
}

StreamMessageDecoder::StreamMessageDecoder(domain::TimeUnit streamUnit, domain::TimeUnit strategyUnit)
    : streamUnit_(streamUnit),
      strategyUnit_(strategyUnit) {}

std::optional<StreamEvent> StreamMessageDecoder::decode(std::string_view payload, DecodeFailure* failure) const {
    DecodeFailure unused = DecodeFailure::None;
    DecodeFailure& outcome = failure != nullptr ? *failure : unused;
    outcome = DecodeFailure::Malformed;

    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view(payload.data(), payload.size()), ec);
    if (ec || !json.is_object()) {
        count_malformed("stream", ec ? ec.message() : "payload is not a JSON object");
        return std::nullopt;
    }

    const auto& obj = json.as_object();
    if (const auto* eventIt = obj.if_contains("event"); eventIt != nullptr) {
        if (!eventIt->is_string()) {
            count_malformed("stream", "event tag is not a string");
            return std::nullopt;
        }
        const auto& name = eventIt->as_string();
        if (name != "snapshot" && name != "upsert" && name != "heartbeat" && name != "bar_update") {
            metrics::Registry::instance().incrementCounter("stream_unknown_event");
            LOG_DEBUG(logging::LogCategory::STREAM, "unknown event '%s' dropped", to_std_string(name).c_str());
            outcome = DecodeFailure::UnknownEvent;
            return std::nullopt;
        }
    }

    try {
        auto event = decodeObject_(obj);
        outcome = DecodeFailure::None;
        return event;
    }
    catch (const std::exception& ex) {
        count_malformed("stream", ex.what());
        return std::nullopt;
    }
}

std::optional<domain::StrategyPayload> StreamMessageDecoder::decodeStrategyPayload(std::string_view payload) const {
    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view(payload.data(), payload.size()), ec);
    if (ec || !json.is_object()) {
        count_malformed("strategy", ec ? ec.message() : "payload is not a JSON object");
        return std::nullopt;
    }

    try {
        return parseStrategy_(json.as_object());
    }
    catch (const std::exception& ex) {
        count_malformed("strategy", ex.what());
        return std::nullopt;
    }
}

StreamEvent StreamMessageDecoder::decodeObject_(const boost::json::object& obj) const {
    if (const auto* eventIt = obj.if_contains("event"); eventIt != nullptr) {
        const auto& name = eventIt->as_string();
        if (name == "heartbeat") {
            return HeartbeatEvent{};
        }
        if (name == "snapshot") {
            const auto& candlesValue = require_(obj, "candles");
            if (!candlesValue.is_array()) {
                throw DecodeError("snapshot candles is not an array");
            }
            SnapshotEvent snapshot;
            snapshot.candles.reserve(candlesValue.as_array().size());
            for (const auto& item : candlesValue.as_array()) {
                snapshot.candles.push_back(parseCandle_(item));
            }
            return snapshot;
        }
        if (name == "upsert") {
            return UpsertEvent{parseCandle_(require_(obj, "candle"))};
        }
        return parseBarUpdate_(obj);
    }

    if (obj.if_contains("start") != nullptr) {
        return parseBarUpdate_(obj);
    }
    if (obj.if_contains("symbol") != nullptr && obj.if_contains("price") != nullptr) {
        return parseTick_(obj);
    }
    throw DecodeError("unrecognized message shape");
}

domain::Candle StreamMessageDecoder::parseCandle_(const boost::json::value& value) const {
    if (!value.is_object()) {
        throw DecodeError("candle is not an object");
    }
    const auto& obj = value.as_object();

    domain::Candle candle{};
    candle.openTime = parse_json_time_(require_(obj, "time"), streamUnit_);
    candle.open = parse_json_number_(require_(obj, "open"));
    candle.high = parse_json_number_(require_(obj, "high"));
    candle.low = parse_json_number_(require_(obj, "low"));
    candle.close = parse_json_number_(require_(obj, "close"));
    candle.volume = parse_json_number_(require_(obj, "volume"));
    return candle;
}

domain::BarUpdate StreamMessageDecoder::parseBarUpdate_(const boost::json::object& obj) const {
    domain::BarUpdate update{};
    update.start = parse_json_time_(require_(obj, "start"), streamUnit_);
    if (const auto* endIt = obj.if_contains("end"); endIt != nullptr) {
        update.end = parse_json_time_(*endIt, streamUnit_);
    }
    update.open = parse_json_number_(require_(obj, "open"));
    update.high = parse_json_number_(require_(obj, "high"));
    update.low = parse_json_number_(require_(obj, "low"));
    update.close = parse_json_number_(require_(obj, "close"));
    update.volume = parse_json_number_(require_(obj, "volume"));
    if (const auto* confirmIt = obj.if_contains("confirm"); confirmIt != nullptr) {
        if (!confirmIt->is_bool()) {
            throw DecodeError("bar update confirm is not a bool");
        }
        update.confirm = confirmIt->as_bool();
    }
    if (const auto* tsIt = obj.if_contains("timestamp"); tsIt != nullptr) {
        update.timestamp = parse_json_time_(*tsIt, streamUnit_);
    }
    return update;
}

domain::TickerTick StreamMessageDecoder::parseTick_(const boost::json::object& obj) const {
    const auto& symbolValue = require_(obj, "symbol");
    if (!symbolValue.is_string()) {
        throw DecodeError("tick symbol is not a string");
    }

    domain::TickerTick tick;
    tick.symbol = to_std_string(symbolValue.as_string());
    tick.price = parse_json_number_(require_(obj, "price"));
    if (const auto* changeIt = obj.if_contains("change_24h_percent"); changeIt != nullptr) {
        tick.change24hPercent = parse_json_number_(*changeIt);
    }
    if (const auto* volumeIt = obj.if_contains("volume_24h"); volumeIt != nullptr) {
        tick.volume24h = parse_json_number_(*volumeIt);
    }
    tick.ts = parse_json_time_(require_(obj, "ts"), streamUnit_);
    return tick;
}

domain::StrategyPayload StreamMessageDecoder::parseStrategy_(const boost::json::object& obj) const {
    domain::StrategyPayload payload;

    if (const auto* eventsIt = obj.if_contains("events"); eventsIt != nullptr && !eventsIt->is_null()) {
        if (!eventsIt->is_array()) {
            throw DecodeError("events is not an array");
        }
        for (const auto& item : eventsIt->as_array()) {
            if (!item.is_object()) {
                throw DecodeError("strategy event is not an object");
            }
            const auto& ev = item.as_object();

            domain::TradeEvent event;
            event.time = parse_json_time_(require_(ev, "time"), strategyUnit_);
            event.barIndex = parse_json_int_(require_(ev, "barIndex"));
            if (const auto* typeIt = ev.if_contains("type"); typeIt != nullptr && typeIt->is_string()) {
                event.type = to_std_string(typeIt->as_string());
            }
            if (const auto* sideIt = ev.if_contains("side"); sideIt != nullptr && sideIt->is_string()) {
                event.side = domain::side_from_label(to_std_string(sideIt->as_string()));
            }
            if (const auto* priceIt = ev.if_contains("price"); priceIt != nullptr && !priceIt->is_null()) {
                event.price = parse_json_number_(*priceIt);
            }
            if (const auto* targetIt = ev.if_contains("targetPrice"); targetIt != nullptr && !targetIt->is_null()) {
                event.targetPrice = parse_json_number_(*targetIt);
            }
            event.initialStopPrice = parse_json_number_(require_(ev, "initialStopPrice"));
            if (const auto* contextIt = ev.if_contains("context"); contextIt != nullptr && !contextIt->is_null()) {
                event.context = boost::json::serialize(*contextIt);
            }
            else {
                event.context = "{}";
            }
            payload.events.push_back(std::move(event));
        }
    }

    if (const auto* segmentsIt = obj.if_contains("stopSegments"); segmentsIt != nullptr && !segmentsIt->is_null()) {
        if (!segmentsIt->is_array()) {
            throw DecodeError("stopSegments is not an array");
        }
        for (const auto& item : segmentsIt->as_array()) {
            if (!item.is_object()) {
                throw DecodeError("stop segment is not an object");
            }
            const auto& seg = item.as_object();

            domain::StopSegment segment;
            segment.startTime = parse_json_time_(require_(seg, "startTime"), strategyUnit_);
            segment.endTime = parse_json_time_(require_(seg, "endTime"), strategyUnit_);
            segment.price = parse_json_number_(require_(seg, "price"));

            const auto* sideIt = seg.if_contains("side");
            std::optional<domain::Side> side;
            if (sideIt != nullptr && sideIt->is_string()) {
                side = domain::side_from_label(to_std_string(sideIt->as_string()));
            }
            if (!side) {
                LOG_DEBUG(logging::LogCategory::STRATEGY, "stop segment [%lld, %lld] dropped: unknown side",
                          static_cast<long long>(segment.startTime), static_cast<long long>(segment.endTime));
                continue;
            }
            segment.side = *side;
            payload.stopSegments.push_back(segment);
        }
    }

    LOG_DEBUG(logging::LogCategory::STRATEGY, "strategy payload decoded: %zu events, %zu stop segments",
              payload.events.size(), payload.stopSegments.size());
    return payload;
}

const boost::json::value& StreamMessageDecoder::require_(const boost::json::object& obj, const char* key) {
    const auto* value = obj.if_contains(key);
    if (value == nullptr || value->is_null()) {
        throw DecodeError(std::string("missing field '") + key + "'");
    }
    return *value;
}

double StreamMessageDecoder::parse_json_number_(const boost::json::value& value) {
    double result = 0.0;
    if (value.is_double()) {
        result = value.as_double();
    }
    else if (value.is_int64()) {
        result = static_cast<double>(value.as_int64());
    }
    else if (value.is_uint64()) {
        result = static_cast<double>(value.as_uint64());
    }
    else if (value.is_string()) {
        const std::string str = to_std_string(value.as_string());
        std::size_t consumed = 0;
        try {
            result = std::stod(str, &consumed);
        }
        catch (const std::exception& ex) {
            throw DecodeError("failed to parse numeric string '" + str + "': " + ex.what());
        }
        if (consumed != str.size()) {
            throw DecodeError("trailing characters in numeric string '" + str + "'");
        }
    }
    else {
        throw DecodeError("unsupported JSON type for number");
    }

    if (!std::isfinite(result)) {
        throw DecodeError("non-finite number");
    }
    return result;
}

std::int64_t StreamMessageDecoder::parse_json_int_(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        const auto raw = value.as_uint64();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw DecodeError("integer out of range");
        }
        return static_cast<std::int64_t>(raw);
    }
    const double number = parse_json_number_(value);
    if (std::floor(number) != number) {
        throw DecodeError("expected an integer value");
    }
    if (!fits_int64(number)) {
        throw DecodeError("integer out of range");
    }
    return static_cast<std::int64_t>(number);
}

domain::TimestampMs StreamMessageDecoder::parse_json_time_(const boost::json::value& value, domain::TimeUnit unit) {
    const double number = parse_json_number_(value);
    const double millis = unit == domain::TimeUnit::Seconds ? number * 1000.0 : number;
    if (!fits_int64(millis)) {
        throw DecodeError("time out of range");
    }
    return domain::to_millis(number, unit);
}

}  // namespace adapters::stream
