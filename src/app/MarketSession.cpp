#include "app/MarketSession.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "common/Metrics.hpp"
#include "logging/Log.h"
#include "strategy/TradeOutcomeSimulator.h"

namespace app {

namespace {

namespace metrics = tcc::common::metrics;

std::string normalize_symbol(const std::string& symbol) {
    std::string result;
    result.reserve(symbol.size());
    for (unsigned char ch : symbol) {
        if (!std::isspace(ch)) {
            result.push_back(static_cast<char>(std::toupper(ch)));
        }
    }
    return result;
}

}  // namespace

MarketSession::MarketSession(Settings settings)
    : settings_(settings),
      series_(settings.maxCandles) {}

void MarketSession::select(domain::SessionKey key) {
    key.symbol = normalize_symbol(key.symbol);
    LOG_INFO(logging::LogCategory::SERIES, "session selected: %s %s",
             key.symbol.c_str(), domain::interval_label(key.interval).c_str());

    key_ = std::move(key);
    series_ = core::CandleReconciler(settings_.maxCandles);
    latestTick_.reset();
    latestBarUpdate_.reset();
    strategy_.reset();
    metrics::Registry::instance().setGauge("series_size", 0.0);
}

void MarketSession::apply(const adapters::stream::StreamEvent& event) {
    LOG_GUARD(key_.has_value(), logging::LogCategory::STREAM,
              "%s event ignored: no session selected", adapters::stream::event_name(event));

    std::visit(
        [this](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, adapters::stream::SnapshotEvent>) {
                onSnapshot_(ev);
            }
            else if constexpr (std::is_same_v<T, adapters::stream::UpsertEvent>) {
                onUpsert_(ev);
            }
            else if constexpr (std::is_same_v<T, domain::TickerTick>) {
                onTick_(ev);
            }
            else if constexpr (std::is_same_v<T, domain::BarUpdate>) {
                onBarUpdate_(ev);
            }
            else {
                LOG_TRACE(logging::LogCategory::STREAM, "heartbeat");
            }
        },
        event);
}

void MarketSession::setStrategy(domain::StrategyPayload payload) {
    strategy_ = std::move(payload);
}

std::optional<domain::CurrentBar> MarketSession::currentBar(std::optional<domain::TimestampMs> hoveredTime) const {
    return series_.currentBar(hoveredTime, latestTick_, latestBarUpdate_);
}

std::optional<domain::VolumeProfile> MarketSession::volumeProfile() const {
    if (series_.empty()) {
        return std::nullopt;
    }
    metrics::Registry::ScopedTimer timer("recompute_profile");
    return indicators::VolumeProfileBuilder::build(series_.candles(), series_.candles().back().openTime,
                                                   settings_.profile);
}

domain::StrategySummary MarketSession::evaluate(const domain::StrategyPayload& payload) const {
    metrics::Registry::ScopedTimer timer("recompute_strategy");
    return strategy::TradeOutcomeSimulator::simulate(payload, series_.candles());
}

DerivedViews MarketSession::views(std::optional<domain::TimestampMs> hoveredTime) const {
    DerivedViews views;
    if (key_) {
        views.key = *key_;
    }
    views.seriesVersion = series_.version();
    views.candles = series_.candles();
    views.currentBar = currentBar(hoveredTime);
    views.volumeProfile = volumeProfile();
    if (strategy_) {
        views.strategyPayload = strategy_;
        views.strategy = evaluate(*strategy_);
    }
    return views;
}

void MarketSession::onSnapshot_(const adapters::stream::SnapshotEvent& snapshot) {
    series_.applySnapshot(snapshot.candles);
    LOG_INFO(logging::LogCategory::SERIES, "snapshot: %zu candles (kept %zu)", snapshot.candles.size(), series_.size());
}

void MarketSession::onUpsert_(const adapters::stream::UpsertEvent& upsert) {
    const auto outcome = series_.applyUpsert(upsert.candle);
    LOG_TRACE(logging::LogCategory::SERIES, "upsert %lld: %s",
              static_cast<long long>(upsert.candle.openTime), core::upsert_outcome_label(outcome));
}

void MarketSession::onTick_(const domain::TickerTick& tick) {
    if (normalize_symbol(tick.symbol) != key_->symbol) {
        LOG_TRACE(logging::LogCategory::STREAM, "tick for %s ignored (active %s)",
                  tick.symbol.c_str(), key_->symbol.c_str());
        return;
    }
    latestTick_ = tick;
}

void MarketSession::onBarUpdate_(const domain::BarUpdate& update) {
    latestBarUpdate_ = update;
}

}  // namespace app
