#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "adapters/stream/StreamMessageDecoder.hpp"
#include "core/CandleReconciler.h"
#include "domain/StrategyTypes.h"
#include "domain/Types.h"
#include "indicators/VolumeProfileBuilder.h"

namespace app {

// Everything a consumer needs to draw one frame, computed in one pass.
struct DerivedViews {
    domain::SessionKey key;
    std::uint64_t seriesVersion = 0;
    std::vector<domain::Candle> candles;
    std::optional<domain::CurrentBar> currentBar;
    std::optional<domain::VolumeProfile> volumeProfile;
    std::optional<domain::StrategyPayload> strategyPayload;
    std::optional<domain::StrategySummary> strategy;
};

// State of the active symbol/interval. Selecting another key drops the series,
// the latest tick, the latest bar update and the strategy payload.
class MarketSession {
public:
    struct Settings {
        std::size_t maxCandles = 0;
        indicators::VolumeProfileParams profile{};
    };

    explicit MarketSession(Settings settings = {});

    void select(domain::SessionKey key);
    const std::optional<domain::SessionKey>& key() const { return key_; }

    void apply(const adapters::stream::StreamEvent& event);
    void setStrategy(domain::StrategyPayload payload);

    std::optional<domain::CurrentBar> currentBar(std::optional<domain::TimestampMs> hoveredTime = std::nullopt) const;
    std::optional<domain::VolumeProfile> volumeProfile() const;
    domain::StrategySummary evaluate(const domain::StrategyPayload& payload) const;

    DerivedViews views(std::optional<domain::TimestampMs> hoveredTime = std::nullopt) const;

    const core::CandleReconciler& series() const { return series_; }
    const std::optional<domain::TickerTick>& latestTick() const { return latestTick_; }
    const std::optional<domain::BarUpdate>& latestBarUpdate() const { return latestBarUpdate_; }
    const std::optional<domain::StrategyPayload>& strategy() const { return strategy_; }

private:
    void onSnapshot_(const adapters::stream::SnapshotEvent& snapshot);
    void onUpsert_(const adapters::stream::UpsertEvent& upsert);
    void onTick_(const domain::TickerTick& tick);
    void onBarUpdate_(const domain::BarUpdate& update);

    Settings settings_;
    std::optional<domain::SessionKey> key_;
    core::CandleReconciler series_;
    std::optional<domain::TickerTick> latestTick_;
    std::optional<domain::BarUpdate> latestBarUpdate_;
    std::optional<domain::StrategyPayload> strategy_;
};

}  // namespace app
