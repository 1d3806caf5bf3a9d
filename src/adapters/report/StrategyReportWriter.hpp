#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/StrategyTypes.h"
#include "domain/Types.h"

namespace adapters::report {

struct StrategyReportInput {
    domain::SessionKey key;
    domain::TimestampMs exportedAt = 0;
    std::vector<domain::Candle> candles;
    std::optional<domain::VolumeProfile> volumeProfile;
    std::optional<domain::StrategyPayload> strategy;
    std::optional<domain::StrategySummary> results;
};

// Markdown report with one captioned section per data set, meant to be read
// back by a reviewer (human or tool) proposing strategy changes.
class StrategyReportWriter {
public:
    static constexpr std::size_t kProfileRowLimit = 50;

    static std::string render(const StrategyReportInput& input);
};

}  // namespace adapters::report
