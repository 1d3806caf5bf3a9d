#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tcc::common::metrics {

// Process-wide counters, gauges and timing samples. Keys are free-form
// snake_case names (stream_malformed, series_size, recompute_profile, ...).
class Registry {
public:
    struct TimerSnapshot {
        std::uint64_t samples{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
        std::optional<double> maxMs{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, std::uint64_t> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
        std::unordered_map<std::string, TimerSnapshot> timers;
    };

    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string timerKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string key_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    void recordDuration(const std::string& timerKey, double elapsedMs);

    std::uint64_t counter(const std::string& counterKey) const;
    std::optional<double> gauge(const std::string& gaugeKey) const;
    Snapshot snapshot() const;

    // Clears every series; tests use it to start from a known state.
    void reset();

private:
    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
    std::unordered_map<std::string, std::vector<double>> durations_;
};

}  // namespace tcc::common::metrics
