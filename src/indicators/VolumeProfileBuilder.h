#pragma once

#include <optional>
#include <vector>

#include "domain/Types.h"

namespace indicators {

struct VolumeProfileParams {
    int barWidth = 6;
    int bucketCount = 500;
    int windowSize = 2000;
    bool recencyWeighting = true;
};

class VolumeProfileBuilder {
public:
    // Distributes each candle's volume evenly over the price buckets its
    // [low, high] touches, within the trailing window of candles.
    // Empty window, flat price range or fewer than two levels yield nullopt.
    static std::optional<domain::VolumeProfile> build(const std::vector<domain::Candle>& candles,
                                                      domain::TimestampMs referenceTime,
                                                      const VolumeProfileParams& params = {});
};

}  // namespace indicators
