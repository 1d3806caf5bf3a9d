#pragma once

#include <string>

#include <boost/json/value.hpp>

#include "app/MarketSession.hpp"

namespace adapters::report {

// Plain JSON rendition of the derived views. Candle and profile times stay in
// epoch milliseconds; trade entry/close times also carry an ISO-8601 UTC string.
boost::json::value to_json(const domain::Candle& candle);
boost::json::value to_json(const domain::CurrentBar& bar);
boost::json::value to_json(const domain::VolumeProfile& profile);
boost::json::value to_json(const domain::TradeResult& trade);
boost::json::value to_json(const domain::StrategySummary& summary);
boost::json::value to_json(const app::DerivedViews& views);

std::string serialize_json(const boost::json::value& value);

}  // namespace adapters::report
