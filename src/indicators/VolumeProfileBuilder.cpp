#include "indicators/VolumeProfileBuilder.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "logging/Log.h"

namespace indicators {

std::optional<domain::VolumeProfile> VolumeProfileBuilder::build(const std::vector<domain::Candle>& candles,
                                                                 domain::TimestampMs referenceTime,
                                                                 const VolumeProfileParams& params) {
    LOG_GUARD_RET(params.bucketCount > 0 && params.windowSize > 0, logging::LogCategory::PROFILE, std::nullopt,
                  "invalid profile params buckets=%d window=%d", params.bucketCount, params.windowSize);

    const std::size_t window = std::min(candles.size(), static_cast<std::size_t>(params.windowSize));
    if (window == 0) {
        return std::nullopt;
    }
    const auto first = candles.end() - static_cast<std::ptrdiff_t>(window);

    double low = first->low;
    double high = first->high;
    for (auto it = first; it != candles.end(); ++it) {
        low = std::min(low, it->low);
        high = std::max(high, it->high);
    }
    const double range = high - low;
    if (!(range > 0.0) || !std::isfinite(range)) {
        return std::nullopt;
    }

    const int bucketCount = params.bucketCount;
    const double bucketSize = range / bucketCount;
    std::vector<double> buckets(static_cast<std::size_t>(bucketCount), 0.0);

    const auto bucketOf = [&](double price) {
        const auto idx = static_cast<int>(std::floor((price - low) / bucketSize));
        return std::clamp(idx, 0, bucketCount - 1);
    };

    for (std::size_t i = 0; i < window; ++i) {
        const domain::Candle& c = *(first + static_cast<std::ptrdiff_t>(i));

        double weight = 1.0;
        if (params.recencyWeighting) {
            const auto positionFromNewest = static_cast<double>(window - 1 - i);
            weight = (params.windowSize - positionFromNewest) / params.windowSize;
        }

        const double cLow = std::max(c.low, low);
        const double cHigh = std::min(c.high, high);
        if (cHigh < cLow) {
            continue;
        }

        // a flat candle (high == low) lands entirely in the one bucket it touches
        const int startIdx = bucketOf(cLow);
        const int endIdx = bucketOf(cHigh);
        const int levelsTouched = endIdx - startIdx + 1;
        const double volPerLevel = (c.volume / levelsTouched) * weight;

        for (int idx = startIdx; idx <= endIdx; ++idx) {
            buckets[static_cast<std::size_t>(idx)] += volPerLevel;
        }
    }

    domain::VolumeProfile profile;
    profile.time = referenceTime;
    profile.width = params.barWidth;
    profile.levels.reserve(buckets.size());
    for (int idx = bucketCount - 1; idx >= 0; --idx) {
        profile.levels.push_back({low + (idx + 0.5) * bucketSize, buckets[static_cast<std::size_t>(idx)]});
    }

    if (profile.levels.size() < 2) {
        return std::nullopt;
    }

    LOG_TRACE(logging::LogCategory::PROFILE, "profile built: window=%zu buckets=%d range=[%.8g, %.8g]",
              window, bucketCount, low, high);
    return profile;
}

}  // namespace indicators
