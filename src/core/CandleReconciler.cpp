#include "core/CandleReconciler.h"

#include <algorithm>
#include <iterator>
#include <utility>

#include "common/Metrics.hpp"
#include "core/TimeUtils.h"
#include "logging/Log.h"

namespace {

domain::CurrentBar fromCandle(const domain::Candle& candle, domain::CurrentBar::Source source) {
    domain::CurrentBar bar;
    bar.time = candle.openTime;
    bar.open = candle.open;
    bar.high = candle.high;
    bar.low = candle.low;
    bar.close = candle.close;
    bar.volume = candle.volume;
    bar.source = source;
    return bar;
}

}  // namespace

namespace core {

namespace metrics = tcc::common::metrics;

const char* upsert_outcome_label(UpsertOutcome outcome) {
    switch (outcome) {
    case UpsertOutcome::Appended:
        return "appended";
    case UpsertOutcome::ReplacedLast:
        return "replaced_last";
    case UpsertOutcome::Patched:
        return "patched";
    case UpsertOutcome::Dropped:
        return "dropped";
    }
    return "dropped";
}

CandleReconciler::CandleReconciler(std::size_t maxCandles)
    : maxCandles_(maxCandles) {}

void CandleReconciler::applySnapshot(std::vector<domain::Candle> candles) {
    candles_ = std::move(candles);
    trimToLimit_();
    ++version_;
    LOG_DEBUG(logging::LogCategory::SERIES, "snapshot applied: %zu candles", candles_.size());
    publishSize_();
}

UpsertOutcome CandleReconciler::applyUpsert(const domain::Candle& candle) {
    if (candles_.empty() || candle.openTime > candles_.back().openTime) {
        candles_.push_back(candle);
        trimToLimit_();
        ++version_;
        publishSize_();
        return UpsertOutcome::Appended;
    }

    if (candle.openTime == candles_.back().openTime) {
        candles_.back() = candle;
        ++version_;
        return UpsertOutcome::ReplacedLast;
    }

    auto it = std::lower_bound(candles_.begin(), candles_.end(), candle.openTime,
                               [](const domain::Candle& lhs, domain::TimestampMs value) {
                                   return lhs.openTime < value;
                               });
    if (it != candles_.end() && it->openTime == candle.openTime) {
        *it = candle;
        ++version_;
        return UpsertOutcome::Patched;
    }

    metrics::Registry::instance().incrementCounter("series_upsert_dropped");
    LOG_DEBUG(logging::LogCategory::SERIES,
              "stale upsert dropped: openTime=%lld last=%lld",
              static_cast<long long>(candle.openTime),
              static_cast<long long>(candles_.back().openTime));
    return UpsertOutcome::Dropped;
}

std::optional<domain::CurrentBar> CandleReconciler::currentBar(std::optional<domain::TimestampMs> hoveredTime,
                                                               const std::optional<domain::TickerTick>& latestTick,
                                                               const std::optional<domain::BarUpdate>& barUpdate) const {
    if (candles_.empty()) {
        return std::nullopt;
    }

    if (hoveredTime) {
        const auto secondStart = domain::floor_div(*hoveredTime, TimeUtils::kMillisPerSecond) * TimeUtils::kMillisPerSecond;
        auto it = std::lower_bound(candles_.begin(), candles_.end(), secondStart,
                                   [](const domain::Candle& lhs, domain::TimestampMs value) {
                                       return lhs.openTime < value;
                                   });
        if (it != candles_.end() && domain::same_second(it->openTime, *hoveredTime)) {
            return fromCandle(*it, domain::CurrentBar::Source::Frozen);
        }
    }

    const domain::Candle& last = candles_.back();

    if (barUpdate && barUpdate->start == last.openTime) {
        domain::CurrentBar bar;
        bar.time = last.openTime;
        bar.open = barUpdate->open;
        bar.high = barUpdate->high;
        bar.low = barUpdate->low;
        bar.close = barUpdate->close;
        bar.volume = barUpdate->volume;
        bar.source = domain::CurrentBar::Source::BarUpdate;
        return bar;
    }

    if (latestTick) {
        domain::CurrentBar bar = fromCandle(last, domain::CurrentBar::Source::Tick);
        bar.close = latestTick->price;
        bar.high = std::max(last.high, latestTick->price);
        bar.low = std::min(last.low, latestTick->price);
        return bar;
    }

    return fromCandle(last, domain::CurrentBar::Source::Candle);
}

void CandleReconciler::clear() {
    candles_.clear();
    ++version_;
    publishSize_();
}

void CandleReconciler::trimToLimit_() {
    if (maxCandles_ == 0 || candles_.size() <= maxCandles_) {
        return;
    }
    const auto excess = candles_.size() - maxCandles_;
    candles_.erase(candles_.begin(), std::next(candles_.begin(), static_cast<std::ptrdiff_t>(excess)));
}

void CandleReconciler::publishSize_() const {
    metrics::Registry::instance().setGauge("series_size", static_cast<double>(candles_.size()));
}

}  // namespace core
