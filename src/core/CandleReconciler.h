#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "domain/Types.h"

namespace core {

enum class UpsertOutcome { Appended, ReplacedLast, Patched, Dropped };

const char* upsert_outcome_label(UpsertOutcome outcome);

// Owns the candle series of one symbol/interval. Snapshots replace the series,
// upserts merge by open time. Candles are expected in strictly increasing
// openTime order, which is how the stream delivers them.
class CandleReconciler {
public:
    // maxCandles == 0 keeps every candle.
    explicit CandleReconciler(std::size_t maxCandles = 0);

    void applySnapshot(std::vector<domain::Candle> candles);
    UpsertOutcome applyUpsert(const domain::Candle& candle);

    // Frozen hover candle > matching bar update > last candle with tick overlay > last candle.
    std::optional<domain::CurrentBar> currentBar(std::optional<domain::TimestampMs> hoveredTime = std::nullopt,
                                                 const std::optional<domain::TickerTick>& latestTick = std::nullopt,
                                                 const std::optional<domain::BarUpdate>& barUpdate = std::nullopt) const;

    const std::vector<domain::Candle>& candles() const { return candles_; }
    std::size_t size() const { return candles_.size(); }
    bool empty() const { return candles_.empty(); }
    std::uint64_t version() const { return version_; }

    void clear();

private:
    void trimToLimit_();
    void publishSize_() const;

    std::vector<domain::Candle> candles_;
    std::size_t maxCandles_{0};
    std::uint64_t version_{0};
};

}  // namespace core
