#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

enum class OutputFormat { Json, Markdown };

struct Config {
    // market
    std::string symbol           = "BTCUSDT";
    std::string interval         = "1m";

    // IO / paths
    std::string streamFile       = "";
    std::string strategyFile     = "";
    std::string outputFile       = "";
    std::string configFile       = "";
    OutputFormat outputFormat    = OutputFormat::Json;

    // wire time units (true = milliseconds, false = seconds)
    bool streamTimesInMs         = true;
    bool strategyTimesInMs       = false;

    // series
    std::size_t maxCandles       = 0;  // 0 keeps everything the stream delivers
    std::optional<std::int64_t> hoverTime{};  // stream time unit

    // volume profile
    int profileBuckets           = 500;
    int profileWindow            = 2000;
    int profileWidth             = 6;
    bool profileRecencyWeighting = true;

    // logs
    LogLevel logLevel            = LogLevel::Info;
    std::uint32_t logCategoryMask = 0xFFFFFFFFu;  // bit per logging::LogCategory

    // util
    bool showHelp                = false;
    bool showVersion             = false;
};

}  // namespace config
