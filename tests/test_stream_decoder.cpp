#include <iostream>
#include <string>
#include <variant>

#include "adapters/stream/StreamMessageDecoder.hpp"
#include "common/Metrics.hpp"

using adapters::stream::HeartbeatEvent;
using adapters::stream::SnapshotEvent;
using adapters::stream::StreamMessageDecoder;
using adapters::stream::UpsertEvent;

namespace {

std::uint64_t malformedCount() {
    return tcc::common::metrics::Registry::instance().counter("stream_malformed");
}

}  // namespace

int main() {
    tcc::common::metrics::Registry::instance().reset();
    const StreamMessageDecoder decoder;

    // Snapshot with numeric strings.
    {
        auto event = decoder.decode(
            R"({"event":"snapshot","candles":[)"
            R"({"time":1700000000000,"open":"10.5","high":12,"low":9,"close":11,"volume":"3"},)"
            R"({"time":1700000060000,"open":11,"high":11,"low":8,"close":9,"volume":4}]})");
        if (!event || !std::holds_alternative<SnapshotEvent>(*event)) {
            std::cerr << "Expected a snapshot event\n";
            return 1;
        }
        const auto& candles = std::get<SnapshotEvent>(*event).candles;
        if (candles.size() != 2 || candles[0].open != 10.5 || candles[0].volume != 3
            || candles[1].openTime != 1'700'000'060'000) {
            std::cerr << "Snapshot candles decoded incorrectly\n";
            return 1;
        }
    }

    // One bad element rejects the whole snapshot.
    {
        const auto before = malformedCount();
        auto event = decoder.decode(
            R"({"event":"snapshot","candles":[{"time":1,"open":1,"high":1,"low":1,"close":1,"volume":1},)"
            R"({"time":2,"open":"abc","high":1,"low":1,"close":1,"volume":1}]})");
        if (event || malformedCount() != before + 1) {
            std::cerr << "Expected snapshot with a bad element to be rejected and counted\n";
            return 1;
        }
    }

    // Upsert, heartbeat and unknown events.
    {
        auto upsert = decoder.decode(R"({"event":"upsert","candle":{"time":60000,"open":1,"high":2,"low":0.5,"close":1.5,"volume":9}})");
        if (!upsert || !std::holds_alternative<UpsertEvent>(*upsert)
            || std::get<UpsertEvent>(*upsert).candle.high != 2) {
            std::cerr << "Expected an upsert event\n";
            return 1;
        }
        auto heartbeat = decoder.decode(R"({"event":"heartbeat"})");
        if (!heartbeat || !std::holds_alternative<HeartbeatEvent>(*heartbeat)) {
            std::cerr << "Expected a heartbeat event\n";
            return 1;
        }
        const auto before = malformedCount();
        auto failure = adapters::stream::DecodeFailure::None;
        if (decoder.decode(R"({"event":"orderbook","bids":[]})", &failure)) {
            std::cerr << "Unknown events must be dropped\n";
            return 1;
        }
        if (malformedCount() != before || failure != adapters::stream::DecodeFailure::UnknownEvent) {
            std::cerr << "Unknown events are not malformed\n";
            return 1;
        }
    }

    // Malformed payloads.
    {
        const auto before = malformedCount();
        const char* bad[] = {
            "not json",
            "[1,2,3]",
            R"({"event":"upsert"})",
            R"({"event":"upsert","candle":{"time":1,"open":1,"high":1,"low":1,"close":1}})",
            R"({"event":"upsert","candle":{"time":1,"open":"1x","high":1,"low":1,"close":1,"volume":1}})",
            R"({"hello":"world"})",
        };
        for (const char* payload : bad) {
            if (decoder.decode(payload)) {
                std::cerr << "Expected malformed payload to be rejected: " << payload << "\n";
                return 1;
            }
        }
        if (malformedCount() != before + (sizeof(bad) / sizeof(bad[0]))) {
            std::cerr << "Expected every malformed payload to be counted\n";
            return 1;
        }
    }

    // Finite numbers that do not fit epoch milliseconds never reach the series.
    {
        const auto before = malformedCount();
        const StreamMessageDecoder secondsDecoder(domain::TimeUnit::Seconds, domain::TimeUnit::Seconds);
        auto failure = adapters::stream::DecodeFailure::None;
        if (decoder.decode(R"({"event":"upsert","candle":{"time":1e300,"open":1,"high":1,"low":1,"close":1,"volume":1}})", &failure)
            || failure != adapters::stream::DecodeFailure::Malformed) {
            std::cerr << "Expected an upsert with an out-of-range time to be rejected as malformed\n";
            return 1;
        }
        if (decoder.decode(R"({"event":"snapshot","candles":[{"time":1,"open":1,"high":1,"low":1,"close":1,"volume":1},)"
                           R"({"time":"-1e19","open":1,"high":1,"low":1,"close":1,"volume":1}]})")) {
            std::cerr << "Expected a snapshot with an out-of-range time to be rejected\n";
            return 1;
        }
        // Fits in milliseconds, overflows once seconds are scaled.
        if (secondsDecoder.decode(R"({"event":"upsert","candle":{"time":1e16,"open":1,"high":1,"low":1,"close":1,"volume":1}})")) {
            std::cerr << "Expected seconds scaling past int64 to be rejected\n";
            return 1;
        }
        if (malformedCount() != before + 3) {
            std::cerr << "Expected out-of-range times to count as malformed\n";
            return 1;
        }

        const char* badIndexes[] = {
            R"({"events":[{"time":1,"barIndex":1e300,"side":"long","initialStopPrice":1}]})",
            R"({"events":[{"time":1,"barIndex":"1e19","side":"long","initialStopPrice":1}]})",
            R"({"events":[{"time":1,"barIndex":18446744073709551615,"side":"long","initialStopPrice":1}]})",
        };
        for (const char* payload : badIndexes) {
            if (decoder.decodeStrategyPayload(payload)) {
                std::cerr << "Expected out-of-range barIndex to reject the payload: " << payload << "\n";
                return 1;
            }
        }
        if (malformedCount() != before + 6) {
            std::cerr << "Expected out-of-range barIndex to count as malformed\n";
            return 1;
        }

        auto edge = decoder.decodeStrategyPayload(
            R"({"events":[{"time":1,"barIndex":9223372036854775807,"side":"long","initialStopPrice":1}]})");
        if (!edge || edge->events.front().barIndex != 9'223'372'036'854'775'807LL) {
            std::cerr << "Expected INT64_MAX barIndex to decode\n";
            return 1;
        }
    }

    // Tick and bar update, untagged.
    {
        auto tick = decoder.decode(R"({"symbol":"BTCUSDT","price":"43000.5","change_24h_percent":1.2,"volume_24h":1000,"ts":1700000000123})");
        if (!tick || !std::holds_alternative<domain::TickerTick>(*tick)) {
            std::cerr << "Expected a tick\n";
            return 1;
        }
        const auto& t = std::get<domain::TickerTick>(*tick);
        if (t.symbol != "BTCUSDT" || t.price != 43000.5 || t.ts != 1'700'000'000'123) {
            std::cerr << "Tick decoded incorrectly\n";
            return 1;
        }

        auto bar = decoder.decode(R"({"start":1700000000000,"end":1700000059999,"open":1,"high":3,"low":0.5,"close":2,"volume":10,"confirm":false,"timestamp":1700000030000})");
        if (!bar || !std::holds_alternative<domain::BarUpdate>(*bar)) {
            std::cerr << "Expected a bar update\n";
            return 1;
        }
        const auto& b = std::get<domain::BarUpdate>(*bar);
        if (b.start != 1'700'000'000'000 || b.close != 2 || b.confirm) {
            std::cerr << "Bar update decoded incorrectly\n";
            return 1;
        }
    }

    // Declared units convert to milliseconds, no magnitude guessing.
    {
        const StreamMessageDecoder secondsDecoder(domain::TimeUnit::Seconds, domain::TimeUnit::Seconds);
        auto event = secondsDecoder.decode(R"({"event":"upsert","candle":{"time":5,"open":1,"high":1,"low":1,"close":1,"volume":1}})");
        if (!event || std::get<UpsertEvent>(*event).candle.openTime != 5000) {
            std::cerr << "Expected seconds to be converted to milliseconds\n";
            return 1;
        }
        auto msEvent = decoder.decode(R"({"event":"upsert","candle":{"time":5,"open":1,"high":1,"low":1,"close":1,"volume":1}})");
        if (!msEvent || std::get<UpsertEvent>(*msEvent).candle.openTime != 5) {
            std::cerr << "Small millisecond times must stay as they are\n";
            return 1;
        }
    }

    // Strategy payload in seconds.
    {
        auto payload = decoder.decodeStrategyPayload(
            R"({"events":[)"
            R"({"time":1700000000,"barIndex":3,"type":"ob_entry","side":"long","price":10,"targetPrice":null,"initialStopPrice":"9.5","context":{"ob_top":11}},)"
            R"({"time":1700000060,"barIndex":4,"type":"ob_entry","side":"flat","price":10,"targetPrice":12,"initialStopPrice":9}],)"
            R"("stopSegments":[{"startTime":1700000000,"endTime":1700000120,"price":9.8,"side":"long"},)"
            R"({"startTime":1,"endTime":2,"price":1,"side":"sideways"}]})");
        if (!payload || payload->events.size() != 2 || payload->stopSegments.size() != 1) {
            std::cerr << "Strategy payload decoded incorrectly\n";
            return 1;
        }
        const auto& first = payload->events[0];
        if (first.time != 1'700'000'000'000 || first.barIndex != 3 || first.side != domain::Side::Long
            || first.targetPrice.has_value() || first.initialStopPrice != 9.5 || first.context != R"({"ob_top":11})") {
            std::cerr << "First strategy event decoded incorrectly\n";
            return 1;
        }
        if (payload->events[1].side.has_value() || payload->events[1].targetPrice != 12.0) {
            std::cerr << "Unknown side should decode without a side\n";
            return 1;
        }
        if (payload->stopSegments[0].endTime != 1'700'000'120'000) {
            std::cerr << "Stop segment times not converted\n";
            return 1;
        }
        if (decoder.decodeStrategyPayload(R"({"events":[{"time":1,"side":"long","initialStopPrice":1}]})")) {
            std::cerr << "Event without barIndex must reject the payload\n";
            return 1;
        }
    }

    std::cout << "test_stream_decoder passed\n";
    return 0;
}
