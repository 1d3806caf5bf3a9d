#include "adapters/report/StrategyReportWriter.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

#include "core/TimeUtils.h"

namespace adapters::report {

namespace {

std::string num(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.10g", value);
    return buffer;
}

// Free text inside a table cell: pipes are escaped, line breaks flattened.
std::string cell(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        if (ch == '|') {
            result += "\\|";
        }
        else if (ch == '\n' || ch == '\r') {
            result += ' ';
        }
        else {
            result += ch;
        }
    }
    return result;
}

void rule(std::ostringstream& out) {
    out << "\n---\n\n";
}

void writeBars(std::ostringstream& out, const std::vector<domain::Candle>& candles) {
    out << "## 1. Bar Data (OHLCV)\n\n";
    out << "Candle data with open, high, low, close and volume per bar.\n\n";
    if (candles.empty()) {
        out << "*No candle data.*\n";
        return;
    }
    out << "| time (unix_ms) | open | high | low | close | volume |\n";
    out << "|----------------|------|------|-----|-------|--------|\n";
    for (const auto& c : candles) {
        out << "| " << c.openTime << " | " << num(c.open) << " | " << num(c.high) << " | " << num(c.low)
            << " | " << num(c.close) << " | " << num(c.volume) << " |\n";
    }
}

void writeProfile(std::ostringstream& out, const std::optional<domain::VolumeProfile>& profile) {
    out << "## 2. Volume Profile\n\n";
    if (!profile) {
        out << "*Volume profile not available.*\n";
        return;
    }
    out << "Time: " << profile->time << " | Width: " << profile->width << "\n\n";
    out << "| price | volume |\n";
    out << "|-------|--------|\n";
    const std::size_t shown = std::min(profile->levels.size(), StrategyReportWriter::kProfileRowLimit);
    for (std::size_t i = 0; i < shown; ++i) {
        out << "| " << num(profile->levels[i].price) << " | " << num(profile->levels[i].volume) << " |\n";
    }
    if (profile->levels.size() > shown) {
        out << "| ... (" << (profile->levels.size() - shown) << " more rows) |\n";
    }
}

void writeOrders(std::ostringstream& out, const std::optional<domain::StrategyPayload>& strategy) {
    out << "## 3. Trade Orders (Entry Signals)\n\n";
    out << "Strategy-generated buy/sell signals with entry price, target and stop.\n\n";
    if (!strategy || strategy->events.empty()) {
        out << "*No trade orders in this run.*\n";
        return;
    }
    out << "| time | barIndex | type | side | price | targetPrice | initialStopPrice | context |\n";
    out << "|------|----------|------|------|-------|-------------|------------------|---------|\n";
    for (const auto& e : strategy->events) {
        out << "| " << e.time << " | " << e.barIndex << " | " << cell(e.type) << " | "
            << (e.side ? domain::side_label(*e.side) : "-") << " | " << num(e.price) << " | "
            << (e.targetPrice ? num(*e.targetPrice) : std::string("-")) << " | " << num(e.initialStopPrice)
            << " | " << cell(e.context) << " |\n";
    }
}

void writeStops(std::ostringstream& out, const std::optional<domain::StrategyPayload>& strategy) {
    out << "## 4. Trailing Stop Events\n\n";
    out << "Stop level over time. Each segment shows the active stop from startTime to endTime at the given price.\n\n";
    if (!strategy || strategy->stopSegments.empty()) {
        out << "*No trailing stop segments.*\n";
        return;
    }
    out << "| startTime | endTime | price | side |\n";
    out << "|-----------|---------|-------|------|\n";
    for (const auto& s : strategy->stopSegments) {
        out << "| " << s.startTime << " | " << s.endTime << " | " << num(s.price) << " | "
            << domain::side_label(s.side) << " |\n";
    }
}

void writeResults(std::ostringstream& out, const std::optional<domain::StrategySummary>& results) {
    out << "## 5. Strategy Results\n\n";
    if (!results || results->trades.empty()) {
        out << "*No simulated trades.*\n";
        return;
    }
    out << "| # | side | entry bar | entry time | entry price | close bar | close time | close price | reason | points |\n";
    out << "|---|------|-----------|------------|-------------|-----------|------------|-------------|--------|--------|\n";
    std::size_t row = 1;
    for (const auto& t : results->trades) {
        out << "| " << row++ << " | " << domain::side_label(t.side) << " | " << t.entryBarIndex << " | "
            << core::TimeUtils::toIsoUtc(t.entryTime) << " | " << num(t.entryPrice) << " | " << t.closeBarIndex
            << " | " << core::TimeUtils::toIsoUtc(t.closeTime) << " | " << num(t.closePrice) << " | "
            << domain::close_reason_label(t.closeReason) << " | " << num(t.points) << " |\n";
    }
    out << "\n**Trades:** " << results->trades.size() << " | **Total points:** " << num(results->totalPoints)
        << " | **Avg points per trade:** " << num(results->avgPointsPerTrade) << "\n";
}

}  // namespace

std::string StrategyReportWriter::render(const StrategyReportInput& input) {
    std::ostringstream out;
    out << "# Strategy Data Export\n\n";
    out << "**Symbol:** " << input.key.symbol << " | **Interval:** " << domain::interval_label(input.key.interval)
        << " | **Exported:** " << core::TimeUtils::toIsoUtc(input.exportedAt) << "\n";
    rule(out);

    writeBars(out, input.candles);
    rule(out);
    writeProfile(out, input.volumeProfile);
    rule(out);
    writeOrders(out, input.strategy);
    rule(out);
    writeStops(out, input.strategy);
    rule(out);
    writeResults(out, input.results);
    rule(out);

    out << "*End of export.*\n";
    return out.str();
}

}  // namespace adapters::report
