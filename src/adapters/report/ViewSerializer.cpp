#include "adapters/report/ViewSerializer.hpp"

#include <array>
#include <cstdint>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serializer.hpp>

#include "core/TimeUtils.h"

namespace adapters::report {

boost::json::value to_json(const domain::Candle& candle) {
    boost::json::object obj;
    obj["time"] = candle.openTime;
    obj["open"] = candle.open;
    obj["high"] = candle.high;
    obj["low"] = candle.low;
    obj["close"] = candle.close;
    obj["volume"] = candle.volume;
    return obj;
}

boost::json::value to_json(const domain::CurrentBar& bar) {
    boost::json::object obj;
    obj["time"] = bar.time;
    obj["open"] = bar.open;
    obj["high"] = bar.high;
    obj["low"] = bar.low;
    obj["close"] = bar.close;
    obj["volume"] = bar.volume;
    obj["source"] = domain::current_bar_source_label(bar.source);
    return obj;
}

boost::json::value to_json(const domain::VolumeProfile& profile) {
    boost::json::array levels;
    levels.reserve(profile.levels.size());
    for (const auto& level : profile.levels) {
        boost::json::object item;
        item["price"] = level.price;
        item["vol"] = level.volume;
        levels.push_back(std::move(item));
    }

    boost::json::object obj;
    obj["time"] = profile.time;
    obj["width"] = profile.width;
    obj["profile"] = std::move(levels);
    return obj;
}

boost::json::value to_json(const domain::TradeResult& trade) {
    boost::json::object obj;
    obj["barIndex"] = static_cast<std::uint64_t>(trade.entryBarIndex);
    obj["entryTime"] = trade.entryTime;
    obj["entryDateTime"] = core::TimeUtils::toIsoUtc(trade.entryTime);
    obj["side"] = domain::side_label(trade.side);
    obj["entryPrice"] = trade.entryPrice;
    obj["closePrice"] = trade.closePrice;
    obj["closeBarIndex"] = static_cast<std::uint64_t>(trade.closeBarIndex);
    obj["closeTime"] = trade.closeTime;
    obj["closeDateTime"] = core::TimeUtils::toIsoUtc(trade.closeTime);
    obj["closeReason"] = domain::close_reason_label(trade.closeReason);
    obj["points"] = trade.points;
    return obj;
}

boost::json::value to_json(const domain::StrategySummary& summary) {
    boost::json::array trades;
    trades.reserve(summary.trades.size());
    for (const auto& trade : summary.trades) {
        trades.push_back(to_json(trade));
    }

    boost::json::object obj;
    obj["trades"] = std::move(trades);
    obj["totalPoints"] = summary.totalPoints;
    obj["avgPointsPerTrade"] = summary.avgPointsPerTrade;
    obj["skippedEvents"] = static_cast<std::uint64_t>(summary.skippedEvents);
    return obj;
}

boost::json::value to_json(const app::DerivedViews& views) {
    boost::json::array candles;
    candles.reserve(views.candles.size());
    for (const auto& candle : views.candles) {
        candles.push_back(to_json(candle));
    }

    boost::json::object obj;
    obj["symbol"] = views.key.symbol;
    obj["interval"] = domain::interval_label(views.key.interval);
    obj["seriesVersion"] = views.seriesVersion;
    obj["candles"] = std::move(candles);
    obj["currentBar"] = views.currentBar ? to_json(*views.currentBar) : boost::json::value(nullptr);
    obj["volumeProfile"] = views.volumeProfile ? to_json(*views.volumeProfile) : boost::json::value(nullptr);
    obj["strategyResults"] = views.strategy ? to_json(*views.strategy) : boost::json::value(nullptr);
    return obj;
}

std::string serialize_json(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};

    while (!sr.done()) {
        boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }

    return result;
}

}  // namespace adapters::report
