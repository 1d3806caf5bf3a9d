#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tcc::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string timerKey)
    : key_(std::move(timerKey)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    Registry::instance().recordDuration(key_, duration.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

void Registry::recordDuration(const std::string& timerKey, double elapsedMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    durations_[timerKey].push_back(elapsedMs);
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

std::optional<double> Registry::gauge(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = gauges_.find(gaugeKey);
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters = counters_;

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{gauge.value, gauge.updatedAt});
    }

    snapshot.timers.reserve(durations_.size());
    for (const auto& [key, samples] : durations_) {
        TimerSnapshot timer;
        timer.samples = samples.size();
        if (!samples.empty()) {
            auto sorted = samples;
            std::sort(sorted.begin(), sorted.end());
            timer.p50Ms = computeQuantile(sorted, 0.50);
            timer.p95Ms = computeQuantile(sorted, 0.95);
            timer.maxMs = sorted.back();
        }
        snapshot.timers.emplace(key, std::move(timer));
    }

    return snapshot;
}

void Registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    durations_.clear();
}

}  // namespace tcc::common::metrics
