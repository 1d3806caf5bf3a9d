#include <cmath>
#include <iostream>
#include <optional>
#include <vector>

#include "common/Metrics.hpp"
#include "strategy/TradeOutcomeSimulator.h"

using domain::CloseReason;
using domain::Side;
using strategy::TradeOutcomeSimulator;

namespace {

domain::Candle makeCandle(domain::TimestampMs t, double o, double h, double l, double c) {
    domain::Candle candle;
    candle.openTime = t;
    candle.open = o;
    candle.high = h;
    candle.low = l;
    candle.close = c;
    candle.volume = 1.0;
    return candle;
}

domain::TradeEvent entry(std::int64_t barIndex, std::optional<Side> side, double initialStop,
                         std::optional<double> target = std::nullopt) {
    domain::TradeEvent event;
    event.time = barIndex;
    event.barIndex = barIndex;
    event.type = "entry";
    event.side = side;
    event.initialStopPrice = initialStop;
    event.targetPrice = target;
    return event;
}

const std::vector<domain::Candle> kCandles{
    makeCandle(0, 10, 12, 9, 11),
    makeCandle(1, 11, 11, 8, 9),
    makeCandle(2, 9, 15, 9, 14),
};

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

}  // namespace

int main() {
    tcc::common::metrics::Registry::instance().reset();

    // Long stopped out on bar 1.
    {
        auto summary = TradeOutcomeSimulator::simulate({entry(0, Side::Long, 8.5)}, kCandles, {});
        if (summary.trades.size() != 1) {
            std::cerr << "Expected one trade\n";
            return 1;
        }
        const auto& t = summary.trades.front();
        if (t.closeReason != CloseReason::Stop || t.closeBarIndex != 1 || !near(t.closePrice, 9)
            || !near(t.points, -2) || !near(t.entryPrice, 11)) {
            std::cerr << "Stop scenario mismatch: reason=" << domain::close_reason_label(t.closeReason)
                      << " bar=" << t.closeBarIndex << " points=" << t.points << "\n";
            return 1;
        }
    }

    // End of data closes at the last candle.
    {
        auto summary = TradeOutcomeSimulator::simulate({entry(1, Side::Long, 5)}, kCandles, {});
        const auto& t = summary.trades.front();
        if (t.closeReason != CloseReason::EndOfData || t.closeBarIndex != 2 || !near(t.closePrice, 14)
            || !near(t.points, 5) || t.closeTime != 2) {
            std::cerr << "End-of-data scenario mismatch: points=" << t.points << "\n";
            return 1;
        }
    }

    // Entry on the last bar closes at its own close.
    {
        auto summary = TradeOutcomeSimulator::simulate({entry(2, Side::Short, 100)}, kCandles, {});
        const auto& t = summary.trades.front();
        if (t.closeReason != CloseReason::EndOfData || t.closeBarIndex != 2 || !near(t.points, 0)) {
            std::cerr << "Entry on last bar should close flat\n";
            return 1;
        }
    }

    // Stop wins over target inside the same bar.
    {
        auto summary = TradeOutcomeSimulator::simulate({entry(1, Side::Long, 9, 13)}, kCandles, {});
        const auto& t = summary.trades.front();
        if (t.closeReason != CloseReason::Stop) {
            std::cerr << "Expected stop to take precedence, got " << domain::close_reason_label(t.closeReason) << "\n";
            return 1;
        }
    }

    // Take profit for long and short.
    {
        auto longSummary = TradeOutcomeSimulator::simulate({entry(1, Side::Long, 1, 15)}, kCandles, {});
        if (longSummary.trades.front().closeReason != CloseReason::TakeProfit
            || !near(longSummary.trades.front().points, 5)) {
            std::cerr << "Expected long take profit on bar 2\n";
            return 1;
        }
        auto shortSummary = TradeOutcomeSimulator::simulate({entry(0, Side::Short, 20, 8)}, kCandles, {});
        const auto& t = shortSummary.trades.front();
        if (t.closeReason != CloseReason::TakeProfit || t.closeBarIndex != 1 || !near(t.points, 2)) {
            std::cerr << "Expected short take profit on bar 1 with 2 points, got " << t.points << "\n";
            return 1;
        }
    }

    // Trailing stop segment tightens the stop for later bars.
    {
        domain::StopSegment trail;
        trail.startTime = 2;
        trail.endTime = 2;
        trail.price = 10;
        trail.side = Side::Long;
        auto summary = TradeOutcomeSimulator::simulate({entry(0, Side::Long, 7)}, kCandles, {trail});
        const auto& t = summary.trades.front();
        if (t.closeReason != CloseReason::Stop || t.closeBarIndex != 2 || !near(t.points, 3)) {
            std::cerr << "Expected trailing stop hit on bar 2\n";
            return 1;
        }
    }

    // Invalid events are skipped, results keep input order, totals aggregate.
    {
        std::vector<domain::TradeEvent> events{
            entry(1, Side::Long, 5),
            entry(0, std::nullopt, 5),
            entry(7, Side::Long, 5),
            entry(-1, Side::Short, 5),
            entry(0, Side::Long, 8.5),
        };
        auto summary = TradeOutcomeSimulator::simulate(events, kCandles, {});
        if (summary.trades.size() != 2 || summary.skippedEvents != 3) {
            std::cerr << "Expected 2 trades and 3 skipped events, got " << summary.trades.size() << " / "
                      << summary.skippedEvents << "\n";
            return 1;
        }
        if (summary.trades[0].entryBarIndex != 1 || summary.trades[1].entryBarIndex != 0) {
            std::cerr << "Results must keep input order\n";
            return 1;
        }
        if (!near(summary.totalPoints, 3) || !near(summary.avgPointsPerTrade, 1.5)) {
            std::cerr << "Unexpected totals " << summary.totalPoints << " / " << summary.avgPointsPerTrade << "\n";
            return 1;
        }
        if (tcc::common::metrics::Registry::instance().counter("strategy_events_skipped") != 3U) {
            std::cerr << "Expected skipped events to be counted\n";
            return 1;
        }
    }

    // No trades: zero average.
    {
        auto summary = TradeOutcomeSimulator::simulate({}, kCandles, {});
        if (!summary.trades.empty() || summary.totalPoints != 0 || summary.avgPointsPerTrade != 0) {
            std::cerr << "Expected empty summary\n";
            return 1;
        }
    }

    std::cout << "test_trade_outcome_simulator passed\n";
    return 0;
}
