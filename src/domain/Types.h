#pragma once

#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampMs = std::int64_t;
using Symbol = std::string;

enum class TimeUnit { Milliseconds, Seconds };

inline TimestampMs to_millis(double value, TimeUnit unit) {
    return static_cast<TimestampMs>(std::llround(unit == TimeUnit::Seconds ? value * 1000.0 : value));
}

inline TimestampMs floor_div(TimestampMs value, TimestampMs step) {
    TimestampMs q = value / step;
    if ((value % step != 0) && ((value < 0) != (step < 0))) {
        --q;
    }
    return q;
}

// Two times designate the same candle when they agree to the whole second.
inline bool same_second(TimestampMs a, TimestampMs b) {
    return floor_div(a, 1000) == floor_div(b, 1000);
}

struct Interval {
    TimestampMs ms{0};
    constexpr bool valid() const noexcept { return ms > 0; }
};

inline bool operator==(const Interval& a, const Interval& b) { return a.ms == b.ms; }
inline bool operator!=(const Interval& a, const Interval& b) { return !(a == b); }

struct Candle {
    TimestampMs openTime{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
};

inline bool operator==(const Candle& a, const Candle& b) {
    return a.openTime == b.openTime && a.open == b.open && a.high == b.high && a.low == b.low
        && a.close == b.close && a.volume == b.volume;
}
inline bool operator!=(const Candle& a, const Candle& b) { return !(a == b); }

// Latest in-progress kline as pushed by the exchange. Only the newest one matters.
struct BarUpdate {
    TimestampMs start{0};
    TimestampMs end{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
    bool confirm{false};
    TimestampMs timestamp{0};
};

struct TickerTick {
    Symbol symbol;
    double price{0};
    double change24hPercent{0};
    double volume24h{0};
    TimestampMs ts{0};
};

struct CurrentBar {
    enum class Source { Frozen, BarUpdate, Tick, Candle };

    TimestampMs time{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
    Source source{Source::Candle};
};

inline const char* current_bar_source_label(CurrentBar::Source source) {
    switch (source) {
    case CurrentBar::Source::Frozen:
        return "frozen";
    case CurrentBar::Source::BarUpdate:
        return "bar_update";
    case CurrentBar::Source::Tick:
        return "tick";
    case CurrentBar::Source::Candle:
        return "candle";
    }
    return "candle";
}

struct VolumeLevel {
    double price{0};
    double volume{0};
};

struct VolumeProfile {
    TimestampMs time{0};
    int width{0};
    std::vector<VolumeLevel> levels;  // price descending
};

struct SessionKey {
    Symbol symbol;
    Interval interval{};
};

inline bool operator==(const SessionKey& a, const SessionKey& b) {
    return a.symbol == b.symbol && a.interval == b.interval;
}
inline bool operator!=(const SessionKey& a, const SessionKey& b) { return !(a == b); }

inline std::string interval_label(const Interval& interval) {
    if (!interval.valid()) {
        return "";
    }

    const auto ms = interval.ms;
    if (ms % 604'800'000 == 0) {
        return std::to_string(ms / 604'800'000) + "w";
    }
    if (ms % 86'400'000 == 0) {
        return std::to_string(ms / 86'400'000) + "d";
    }
    if (ms % 3'600'000 == 0) {
        return std::to_string(ms / 3'600'000) + "h";
    }
    if (ms % 60'000 == 0) {
        return std::to_string(ms / 60'000) + "m";
    }
    if (ms % 1'000 == 0) {
        return std::to_string(ms / 1'000) + "s";
    }
    return std::to_string(ms) + "ms";
}

// Accepts "<n><unit>" with unit in s/m/h/d/w (case-insensitive). Returns an
// invalid interval for anything else.
inline Interval interval_from_label(std::string_view label) {
    Interval interval{};

    std::size_t idx = 0;
    while (idx < label.size() && std::isspace(static_cast<unsigned char>(label[idx])) != 0) {
        ++idx;
    }

    long long value = 0;
    const std::size_t startDigits = idx;
    while (idx < label.size() && std::isdigit(static_cast<unsigned char>(label[idx])) != 0) {
        if (value > 1'000'000) {
            return interval;
        }
        value = value * 10 + (label[idx] - '0');
        ++idx;
    }
    if (startDigits == idx || value <= 0) {
        return interval;
    }

    if (idx >= label.size()) {
        return interval;
    }

    long long multiplier = 0;
    switch (static_cast<char>(std::tolower(static_cast<unsigned char>(label[idx])))) {
    case 's':
        multiplier = 1'000;
        break;
    case 'm':
        multiplier = 60'000;
        break;
    case 'h':
        multiplier = 3'600'000;
        break;
    case 'd':
        multiplier = 86'400'000;
        break;
    case 'w':
        multiplier = 604'800'000;
        break;
    default:
        return interval;
    }
    ++idx;

    while (idx < label.size() && std::isspace(static_cast<unsigned char>(label[idx])) != 0) {
        ++idx;
    }
    if (idx != label.size()) {
        return interval;
    }

    interval.ms = value * multiplier;
    return interval;
}

}  // namespace domain
