#pragma once

#include <cstdint>
#include <string>

namespace core {

namespace TimeUtils {
constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kSecondsPerMinute = 60;
constexpr std::int64_t kMillisPerMinute = kMillisPerSecond * kSecondsPerMinute;

// 2024-01-02T03:04:05.000Z
std::string toIsoUtc(std::int64_t timestampMs);
std::int64_t nowMs();
}  // namespace TimeUtils

}  // namespace core
