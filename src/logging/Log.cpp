#include "logging/Log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <string>

namespace {
constexpr std::size_t kMessageBufferSize = 1024;
}

namespace logging {

std::atomic<config::LogLevel> Log::currentLevel{ config::LogLevel::Info };

std::atomic<std::uint32_t> Log::categoryMask{ 0xFFFFFFFFu };

std::mutex Log::outputMutex;

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
}

config::LogLevel Log::get_log_level() {
    return currentLevel.load(std::memory_order_relaxed);
}

void Log::set_category_mask(std::uint32_t mask) {
    categoryMask.store(mask, std::memory_order_relaxed);
}

std::uint32_t Log::get_category_mask() {
    return categoryMask.load(std::memory_order_relaxed);
}

bool Log::enabled(config::LogLevel level, LogCategory category) {
    if (config::logLevelSeverity(level) < config::logLevelSeverity(get_log_level())) {
        return false;
    }
    return level == config::LogLevel::Error || (get_category_mask() & category_bit(category)) != 0;
}

bool Log::try_parse_log_level(std::string_view value, config::LogLevel& levelOut) {
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (normalized == "trace") {
        levelOut = config::LogLevel::Trace;
        return true;
    }
    if (normalized == "debug") {
        levelOut = config::LogLevel::Debug;
        return true;
    }
    if (normalized == "info") {
        levelOut = config::LogLevel::Info;
        return true;
    }
    if (normalized == "warn" || normalized == "warning") {
        levelOut = config::LogLevel::Warn;
        return true;
    }
    if (normalized == "error") {
        levelOut = config::LogLevel::Error;
        return true;
    }
    return false;
}

bool Log::try_parse_category_mask(std::string_view value, std::uint32_t& maskOut) {
    constexpr LogCategory kCategories[] = {LogCategory::STREAM,   LogCategory::SERIES, LogCategory::PROFILE,
                                           LogCategory::STRATEGY, LogCategory::CONFIG, LogCategory::IO};

    std::uint32_t mask = 0;
    std::size_t pos = 0;
    while (pos <= value.size()) {
        const std::size_t comma = std::min(value.find(',', pos), value.size());
        std::string token(value.substr(pos, comma - pos));
        token.erase(std::remove_if(token.begin(), token.end(), [](unsigned char c) { return std::isspace(c) != 0; }),
                    token.end());
        std::transform(token.begin(), token.end(), token.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });

        if (token == "ALL") {
            mask = 0xFFFFFFFFu;
        }
        else {
            bool matched = false;
            for (const auto category : kCategories) {
                if (token == category_to_string(category)) {
                    mask |= category_bit(category);
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                return false;
            }
        }
        pos = comma + 1;
    }

    maskOut = mask;
    return true;
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::STREAM:
        return "STREAM";
    case LogCategory::SERIES:
        return "SERIES";
    case LogCategory::PROFILE:
        return "PROFILE";
    case LogCategory::STRATEGY:
        return "STRATEGY";
    case LogCategory::CONFIG:
        return "CONFIG";
    case LogCategory::IO:
        return "IO";
    }
    return "UNKNOWN";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (!enabled(level, category)) {
        return;
    }

    std::array<char, kMessageBufferSize> buffer{};
    std::va_list argsCopy;
    va_copy(argsCopy, args);
    int written = std::vsnprintf(buffer.data(), buffer.size(), fmt, argsCopy);
    va_end(argsCopy);

    if (written < 0) {
        std::snprintf(buffer.data(), buffer.size(), "<format-error>");
    }
    else if (static_cast<std::size_t>(written) >= buffer.size()) {
        if (buffer.size() >= 5) {
            buffer[buffer.size() - 4] = '.';
            buffer[buffer.size() - 3] = '.';
            buffer[buffer.size() - 2] = '.';
        }
        buffer[buffer.size() - 1] = '\0';
    }

    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto msSinceEpoch = duration_cast<milliseconds>(now.time_since_epoch());
    const std::time_t seconds = static_cast<std::time_t>(msSinceEpoch.count() / 1000);
    const int millis = static_cast<int>(msSinceEpoch.count() % 1000);

    std::tm utcTime{};
#if defined(_WIN32)
    gmtime_s(&utcTime, &seconds);
#else
    gmtime_r(&seconds, &utcTime);
#endif

    char timestamp[16];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d", utcTime.tm_hour, utcTime.tm_min, utcTime.tm_sec, millis);

    const char* levelStr = level_to_string(level);
    const char* categoryStr = category_to_string(category);

    // stdout carries the export, so log lines always go to stderr
    std::lock_guard<std::mutex> lock(outputMutex);
    std::fprintf(stderr, "%s %s %s %s\n", timestamp, levelStr, categoryStr, buffer.data());
    std::fflush(stderr);
}

}  // namespace logging
