#include "config/ConfigProvider.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "domain/Types.h"
#include "logging/Log.h"

namespace config {

namespace {

struct FlagKey {
    const char* flag;
    const char* key;
};

// CLI flag -> config file key. Environment variables use TCC_<UPPER_SNAKE> of the flag.
constexpr FlagKey kFlags[] = {
    {"--symbol", "symbol"},
    {"--interval", "interval"},
    {"--stream-file", "streamFile"},
    {"--strategy-file", "strategyFile"},
    {"--output", "outputFile"},
    {"--format", "outputFormat"},
    {"--stream-time-unit", "streamTimeUnit"},
    {"--strategy-time-unit", "strategyTimeUnit"},
    {"--max-candles", "maxCandles"},
    {"--hover-time", "hoverTime"},
    {"--profile-buckets", "profileBuckets"},
    {"--profile-window", "profileWindow"},
    {"--profile-width", "profileWidth"},
    {"--profile-weighting", "profileWeighting"},
    {"--log-level", "logLevel"},
    {"--log-categories", "logCategories"},
};

struct EnvKey {
    const char* env;
    const char* key;
};

constexpr EnvKey kEnv[] = {
    {"TCC_SYMBOL", "symbol"},
    {"TCC_INTERVAL", "interval"},
    {"TCC_STREAM_FILE", "streamFile"},
    {"TCC_STRATEGY_FILE", "strategyFile"},
    {"TCC_OUTPUT", "outputFile"},
    {"TCC_FORMAT", "outputFormat"},
    {"TCC_STREAM_TIME_UNIT", "streamTimeUnit"},
    {"TCC_STRATEGY_TIME_UNIT", "strategyTimeUnit"},
    {"TCC_MAX_CANDLES", "maxCandles"},
    {"TCC_PROFILE_BUCKETS", "profileBuckets"},
    {"TCC_PROFILE_WINDOW", "profileWindow"},
    {"TCC_PROFILE_WIDTH", "profileWidth"},
    {"TCC_PROFILE_WEIGHTING", "profileWeighting"},
    {"TCC_LOG_LEVEL", "logLevel"},
    {"TCC_LOG_CATEGORIES", "logCategories"},
};

std::optional<std::string> keyForFlag(const std::string& flag) {
    for (const auto& entry : kFlags) {
        if (flag == entry.flag) {
            return std::string(entry.key);
        }
    }
    return std::nullopt;
}

}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    std::string cliConfigPath;
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);
        if (arg == "--config") {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for --config\n");
            }
            else {
                cliConfigPath = argv[++i];
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cliConfigPath = arg.substr(9);
        }
    }

    if (!cliConfigPath.empty()) {
        if (!fileExists_(cliConfigPath)) {
            throw std::runtime_error("Config file not found: " + cliConfigPath);
        }
        parseFile_(cliConfigPath);
        cfg_.configFile = cliConfigPath;
    }
    else if (const char* envCfg = std::getenv("TCC_CONFIG")) {
        std::string path(envCfg);
        if (fileExists_(path)) {
            parseFile_(path);
            cfg_.configFile = path;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", path.c_str());
        }
    }

    parseEnv_();
    parseCli_(argc, argv);
    validate_();
}

OutputFormat ConfigProvider::parseOutputFormat(const std::string& s) {
    const std::string lower = lowercase_(trim_(s));
    if (lower == "json") {
        return OutputFormat::Json;
    }
    if (lower == "markdown" || lower == "md") {
        return OutputFormat::Markdown;
    }
    throw std::invalid_argument("Invalid output format: " + s);
}

std::string ConfigProvider::usage() {
    std::ostringstream oss;
    oss << "Usage: chart_core_replay --stream-file <path> [options]\n"
        << "  --config <path>              key=value config file (or TCC_CONFIG)\n"
        << "  --symbol <SYMBOL>            active symbol (default BTCUSDT)\n"
        << "  --interval <label>           active interval, e.g. 1m, 15m, 1h (default 1m)\n"
        << "  --stream-file <path>         recorded stream, one JSON message per line\n"
        << "  --strategy-file <path>       strategy payload {events, stopSegments}\n"
        << "  --output <path>              write the export there instead of stdout\n"
        << "  --format json|markdown       export format (default json)\n"
        << "  --stream-time-unit ms|s      unit of candle/tick times on the wire (default ms)\n"
        << "  --strategy-time-unit ms|s    unit of strategy payload times (default s)\n"
        << "  --max-candles <n>            retained candles, 0 = unlimited\n"
        << "  --hover-time <t>             frozen current-bar lookup time (stream unit)\n"
        << "  --profile-buckets <n>        volume profile buckets (default 500)\n"
        << "  --profile-window <n>         volume profile window in candles (default 2000)\n"
        << "  --profile-width <n>          volume profile width in bars (default 6)\n"
        << "  --profile-weighting <bool>   recency weighting (default true)\n"
        << "  --log-level <level>          trace|debug|info|warn|error\n"
        << "  --log-categories <list>      all, or e.g. stream,strategy (errors always shown)\n"
        << "  --help, --version\n";
    return oss.str();
}

void ConfigProvider::parseCli_(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);

        auto takeNext = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for %s\n", name);
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help" || arg == "-h") {
            cfg_.showHelp = true;
        }
        else if (arg == "--version") {
            cfg_.showVersion = true;
        }
        else if (arg == "--config") {
            ++i;  // consumed by the constructor
        }
        else if (arg.rfind("--config=", 0) == 0) {
            continue;
        }
        else if (arg == "-l") {
            if (auto next = takeNext(arg.c_str())) {
                applyKey_("logLevel", *next, arg);
            }
        }
        else if (arg == "-s") {
            if (auto next = takeNext(arg.c_str())) {
                applyKey_("symbol", *next, arg);
            }
        }
        else if (arg == "-i") {
            if (auto next = takeNext(arg.c_str())) {
                applyKey_("interval", *next, arg);
            }
        }
        else if (const auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            const auto key = keyForFlag(arg.substr(0, eq));
            if (!key) {
                std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
                continue;
            }
            applyKey_(*key, arg.substr(eq + 1), arg.substr(0, eq));
        }
        else if (const auto key = keyForFlag(arg)) {
            if (auto next = takeNext(arg.c_str())) {
                applyKey_(*key, *next, arg);
            }
        }
        else {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
        }
    }
}

void ConfigProvider::parseEnv_() {
    for (const auto& entry : kEnv) {
        if (const char* value = std::getenv(entry.env)) {
            applyKey_(entry.key, value, entry.env);
        }
    }
}

void ConfigProvider::parseFile_(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Unable to open config file: " + path);
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        line = trim_(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            std::fprintf(stderr, "%s:%d: ignoring line without '='\n", path.c_str(), lineNumber);
            continue;
        }
        std::string key = trim_(line.substr(0, pos));
        std::string value = trim_(line.substr(pos + 1));
        applyKey_(key, value, path + ":" + std::to_string(lineNumber));
    }
}

void ConfigProvider::applyKey_(const std::string& key, const std::string& rawValue, const std::string& origin) {
    const std::string value = trim_(rawValue);
    auto invalid = [&]() {
        return std::runtime_error("Invalid value for " + origin + ": " + rawValue);
    };

    if (key == "symbol") {
        std::string upper = value;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        cfg_.symbol = upper;
    }
    else if (key == "interval") {
        cfg_.interval = lowercase_(value);
    }
    else if (key == "streamFile") {
        cfg_.streamFile = value;
    }
    else if (key == "strategyFile") {
        cfg_.strategyFile = value;
    }
    else if (key == "outputFile") {
        cfg_.outputFile = value;
    }
    else if (key == "outputFormat") {
        try {
            cfg_.outputFormat = parseOutputFormat(value);
        }
        catch (const std::invalid_argument&) {
            throw invalid();
        }
    }
    else if (key == "streamTimeUnit") {
        if (!parseTimeUnitIsMs_(value, cfg_.streamTimesInMs)) {
            throw invalid();
        }
    }
    else if (key == "strategyTimeUnit") {
        if (!parseTimeUnitIsMs_(value, cfg_.strategyTimesInMs)) {
            throw invalid();
        }
    }
    else if (key == "maxCandles") {
        long long parsed{};
        if (!parseInt64_(value, parsed) || parsed < 0) {
            throw invalid();
        }
        cfg_.maxCandles = static_cast<std::size_t>(parsed);
    }
    else if (key == "hoverTime") {
        long long parsed{};
        if (!parseInt64_(value, parsed)) {
            throw invalid();
        }
        cfg_.hoverTime = static_cast<std::int64_t>(parsed);
    }
    else if (key == "profileBuckets") {
        if (!parseInt_(value, cfg_.profileBuckets)) {
            throw invalid();
        }
    }
    else if (key == "profileWindow") {
        if (!parseInt_(value, cfg_.profileWindow)) {
            throw invalid();
        }
    }
    else if (key == "profileWidth") {
        if (!parseInt_(value, cfg_.profileWidth)) {
            throw invalid();
        }
    }
    else if (key == "profileWeighting") {
        if (!parseBool_(value, cfg_.profileRecencyWeighting)) {
            throw invalid();
        }
    }
    else if (key == "logLevel") {
        if (!logging::Log::try_parse_log_level(value, cfg_.logLevel)) {
            throw invalid();
        }
    }
    else if (key == "logCategories") {
        if (!logging::Log::try_parse_category_mask(value, cfg_.logCategoryMask)) {
            throw invalid();
        }
    }
    else {
        std::fprintf(stderr, "Unknown config key '%s' (%s)\n", key.c_str(), origin.c_str());
    }
}

void ConfigProvider::validate_() const {
    if (cfg_.profileBuckets <= 0) {
        throw std::runtime_error("profileBuckets must be >= 1");
    }
    if (cfg_.profileWindow <= 0) {
        throw std::runtime_error("profileWindow must be >= 1");
    }
    if (cfg_.profileWidth <= 0) {
        throw std::runtime_error("profileWidth must be >= 1");
    }
    if (cfg_.symbol.empty()) {
        throw std::runtime_error("symbol cannot be empty");
    }
    if (!domain::interval_from_label(cfg_.interval).valid()) {
        throw std::runtime_error("unsupported interval: " + cfg_.interval);
    }
}

bool ConfigProvider::fileExists_(const std::string& path) {
    std::ifstream input(path);
    return input.good();
}

std::string ConfigProvider::trim_(const std::string& s) {
    std::string::size_type start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::string::size_type end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

bool ConfigProvider::parseBool_(const std::string& value, bool& out) {
    std::string lower = lowercase_(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

bool ConfigProvider::parseInt_(const std::string& value, int& out) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool ConfigProvider::parseInt64_(const std::string& value, long long& out) {
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed, 10);
        if (consumed != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool ConfigProvider::parseTimeUnitIsMs_(const std::string& value, bool& out) {
    const std::string lower = lowercase_(value);
    if (lower == "ms" || lower == "millis" || lower == "milliseconds") {
        out = true;
        return true;
    }
    if (lower == "s" || lower == "sec" || lower == "seconds") {
        out = false;
        return true;
    }
    return false;
}

std::string ConfigProvider::lowercase_(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace config
