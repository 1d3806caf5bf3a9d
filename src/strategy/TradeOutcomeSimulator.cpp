#include "strategy/TradeOutcomeSimulator.h"

#include <cstddef>
#include <cstdint>

#include "common/Metrics.hpp"
#include "logging/Log.h"
#include "strategy/StopSegmentResolver.h"

namespace strategy {

namespace {

domain::TradeResult replay(const domain::TradeEvent& event,
                           domain::Side side,
                           std::size_t entryIndex,
                           const std::vector<domain::Candle>& candles,
                           const std::vector<domain::StopSegment>& stopSegments) {
    const domain::Candle& entry = candles[entryIndex];

    domain::TradeResult result;
    result.entryBarIndex = entryIndex;
    result.entryTime = entry.openTime;
    result.side = side;
    result.entryPrice = entry.close;
    result.closePrice = entry.close;
    result.closeBarIndex = entryIndex;
    result.closeReason = domain::CloseReason::EndOfData;

    bool closed = false;
    for (std::size_t i = entryIndex + 1; i < candles.size() && !closed; ++i) {
        const domain::Candle& bar = candles[i];
        const double stop = resolveStopPrice(bar.openTime, side, event.initialStopPrice, stopSegments);

        bool stopHit = false;
        bool targetHit = false;
        if (side == domain::Side::Long) {
            stopHit = bar.low <= stop;
            targetHit = event.targetPrice.has_value() && bar.high >= *event.targetPrice;
        }
        else {
            stopHit = bar.high >= stop;
            targetHit = event.targetPrice.has_value() && bar.low <= *event.targetPrice;
        }

        // stop wins when both levels are crossed inside the same bar
        if (stopHit || targetHit) {
            result.closePrice = bar.close;
            result.closeBarIndex = i;
            result.closeReason = stopHit ? domain::CloseReason::Stop : domain::CloseReason::TakeProfit;
            closed = true;
        }
    }

    if (!closed && entryIndex + 1 < candles.size()) {
        result.closePrice = candles.back().close;
        result.closeBarIndex = candles.size() - 1;
    }

    result.closeTime = candles[result.closeBarIndex].openTime;
    result.points = side == domain::Side::Long ? result.closePrice - result.entryPrice
                                               : result.entryPrice - result.closePrice;
    return result;
}

}  // namespace

domain::StrategySummary TradeOutcomeSimulator::simulate(const std::vector<domain::TradeEvent>& events,
                                                        const std::vector<domain::Candle>& candles,
                                                        const std::vector<domain::StopSegment>& stopSegments) {
    domain::StrategySummary summary;
    summary.trades.reserve(events.size());

    for (const auto& event : events) {
        if (!event.side) {
            ++summary.skippedEvents;
            LOG_DEBUG(logging::LogCategory::STRATEGY, "event at %lld skipped: no side",
                      static_cast<long long>(event.time));
            continue;
        }
        if (event.barIndex < 0 || static_cast<std::uint64_t>(event.barIndex) >= candles.size()) {
            ++summary.skippedEvents;
            LOG_DEBUG(logging::LogCategory::STRATEGY, "event at %lld skipped: barIndex %lld outside [0, %zu)",
                      static_cast<long long>(event.time), static_cast<long long>(event.barIndex), candles.size());
            continue;
        }

        auto result = replay(event, *event.side, static_cast<std::size_t>(event.barIndex), candles, stopSegments);
        summary.totalPoints += result.points;
        summary.trades.push_back(result);
    }

    summary.avgPointsPerTrade = summary.trades.empty() ? 0.0
                                                       : summary.totalPoints / static_cast<double>(summary.trades.size());

    if (summary.skippedEvents > 0) {
        tcc::common::metrics::Registry::instance().incrementCounter("strategy_events_skipped", summary.skippedEvents);
    }
    return summary;
}

}  // namespace strategy
