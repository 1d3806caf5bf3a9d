#include "core/TimeUtils.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>

namespace {
struct UtcParts {
    std::tm tm{};
    int millis{0};
};

std::optional<UtcParts> toUtc(std::int64_t timestampMs) {
    std::int64_t seconds = timestampMs / core::TimeUtils::kMillisPerSecond;
    std::int64_t millis = timestampMs % core::TimeUtils::kMillisPerSecond;
    if (millis < 0) {
        millis += core::TimeUtils::kMillisPerSecond;
        --seconds;
    }

    UtcParts parts;
    const std::time_t t = static_cast<std::time_t>(seconds);
#if defined(_WIN32)
    if (gmtime_s(&parts.tm, &t) != 0) {
        return std::nullopt;
    }
#else
    if (gmtime_r(&t, &parts.tm) == nullptr) {
        return std::nullopt;
    }
#endif
    parts.millis = static_cast<int>(millis);
    return parts;
}
}  // namespace

namespace core {
namespace TimeUtils {

std::string toIsoUtc(std::int64_t timestampMs) {
    const auto parts = toUtc(timestampMs);
    if (!parts) {
        // outside what the platform calendar can represent
        return std::to_string(timestampMs);
    }
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(parts->tm.tm_year) + 1900, parts->tm.tm_mon + 1, parts->tm.tm_mday,
                  parts->tm.tm_hour, parts->tm.tm_min, parts->tm.tm_sec, parts->millis);
    return buffer;
}

std::int64_t nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace TimeUtils
}  // namespace core
