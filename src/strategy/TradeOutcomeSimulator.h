#pragma once

#include <vector>

#include "domain/StrategyTypes.h"
#include "domain/Types.h"

namespace strategy {

class TradeOutcomeSimulator {
public:
    // Replays every entry signal against the candles that follow it. Trades are
    // independent; results keep the input order of the events. Events with no
    // side or a bar index outside the series are skipped and counted.
    static domain::StrategySummary simulate(const std::vector<domain::TradeEvent>& events,
                                            const std::vector<domain::Candle>& candles,
                                            const std::vector<domain::StopSegment>& stopSegments);

    static domain::StrategySummary simulate(const domain::StrategyPayload& payload,
                                            const std::vector<domain::Candle>& candles) {
        return simulate(payload.events, candles, payload.stopSegments);
    }
};

}  // namespace strategy
