#pragma once

#include "domain/Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {

enum class Side { Long, Short };

inline const char* side_label(Side side) {
    return side == Side::Long ? "long" : "short";
}

inline std::optional<Side> side_from_label(const std::string& label) {
    if (label == "long") {
        return Side::Long;
    }
    if (label == "short") {
        return Side::Short;
    }
    return std::nullopt;
}

struct TradeEvent {
    TimestampMs time{0};
    std::int64_t barIndex{0};
    std::string type;
    std::optional<Side> side{};  // unset when the payload carried an unknown side
    double price{0};
    std::optional<double> targetPrice{};
    double initialStopPrice{0};
    std::string context;
};

// Trailing stop active over [startTime, endTime], both ends inclusive.
struct StopSegment {
    TimestampMs startTime{0};
    TimestampMs endTime{0};
    double price{0};
    Side side{Side::Long};
};

struct StrategyPayload {
    std::vector<TradeEvent> events;
    std::vector<StopSegment> stopSegments;
};

enum class CloseReason { Stop, TakeProfit, EndOfData };

inline const char* close_reason_label(CloseReason reason) {
    switch (reason) {
    case CloseReason::Stop:
        return "stop";
    case CloseReason::TakeProfit:
        return "take_profit";
    case CloseReason::EndOfData:
        return "end_of_data";
    }
    return "end_of_data";
}

struct TradeResult {
    std::size_t entryBarIndex{0};
    TimestampMs entryTime{0};
    Side side{Side::Long};
    double entryPrice{0};
    double closePrice{0};
    std::size_t closeBarIndex{0};
    TimestampMs closeTime{0};
    CloseReason closeReason{CloseReason::EndOfData};
    double points{0};
};

struct StrategySummary {
    std::vector<TradeResult> trades;
    double totalPoints{0};
    double avgPointsPerTrade{0};
    std::size_t skippedEvents{0};
};

}  // namespace domain
