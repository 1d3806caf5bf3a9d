#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config/ConfigProvider.h"
#include "logging/Log.h"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::string name)
        : name(std::move(name)) {
        const char* current = std::getenv(this->name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        }
        else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

config::Config runConfig(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return config::ConfigProvider(static_cast<int>(argv.size()), argv.data()).get();
}

}  // namespace

int main() {
    EnvGuard configEnv("TCC_CONFIG");
    EnvGuard symbolEnv("TCC_SYMBOL");
    EnvGuard bucketsEnv("TCC_PROFILE_BUCKETS");
    configEnv.clear();
    symbolEnv.clear();
    bucketsEnv.clear();

    // Defaults.
    {
        auto cfg = runConfig({"chart_core_replay"});
        if (cfg.symbol != "BTCUSDT" || cfg.interval != "1m" || cfg.profileBuckets != 500 || cfg.profileWindow != 2000
            || cfg.profileWidth != 6 || !cfg.profileRecencyWeighting || !cfg.streamTimesInMs || cfg.strategyTimesInMs
            || cfg.maxCandles != 0 || cfg.hoverTime || cfg.outputFormat != config::OutputFormat::Json) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
    }

    // File < environment < CLI.
    const std::string path = "/tmp/tcc_test_config_provider.conf";
    {
        std::ofstream file(path);
        file << "# replay settings\n"
             << "symbol = solusdt\n"
             << "profileBuckets = 120\n"
             << "profileWindow = 300\n"
             << "interval = 5M\n"
             << "outputFormat = markdown\n";
    }
    {
        configEnv.set(path);
        auto fromFile = runConfig({"chart_core_replay"});
        if (fromFile.symbol != "SOLUSDT" || fromFile.profileBuckets != 120 || fromFile.interval != "5m"
            || fromFile.outputFormat != config::OutputFormat::Markdown || fromFile.configFile != path) {
            std::cerr << "Config file values not applied (symbol=" << fromFile.symbol << ")\n";
            return 1;
        }

        bucketsEnv.set("240");
        auto fromEnv = runConfig({"chart_core_replay"});
        if (fromEnv.profileBuckets != 240 || fromEnv.profileWindow != 300) {
            std::cerr << "Environment should override the file, got buckets=" << fromEnv.profileBuckets << "\n";
            return 1;
        }

        auto fromCli = runConfig({"chart_core_replay", "--profile-buckets", "60", "--symbol=ethusdt",
                                  "--stream-time-unit", "s", "--hover-time", "1700000000", "--max-candles=300",
                                  "--profile-weighting", "off", "-l", "debug"});
        if (fromCli.profileBuckets != 60 || fromCli.symbol != "ETHUSDT" || fromCli.streamTimesInMs
            || !fromCli.hoverTime || *fromCli.hoverTime != 1'700'000'000 || fromCli.maxCandles != 300
            || fromCli.profileRecencyWeighting || fromCli.logLevel != config::LogLevel::Debug) {
            std::cerr << "CLI flags should override environment and file\n";
            return 1;
        }
        configEnv.clear();
        bucketsEnv.clear();
    }

    // Category filter for log lines.
    {
        const auto cfg = runConfig({"chart_core_replay", "--log-categories", "Stream, strategy"});
        const auto expected = logging::category_bit(logging::LogCategory::STREAM)
            | logging::category_bit(logging::LogCategory::STRATEGY);
        if (cfg.logCategoryMask != expected) {
            std::cerr << "Unexpected log category mask " << cfg.logCategoryMask << "\n";
            return 1;
        }
        if (runConfig({"chart_core_replay"}).logCategoryMask != 0xFFFFFFFFu) {
            std::cerr << "All log categories should be enabled by default\n";
            return 1;
        }
    }

    // Invalid values are reported, not ignored.
    {
        const std::vector<std::vector<std::string>> invalid{
            {"chart_core_replay", "--profile-buckets", "0"},
            {"chart_core_replay", "--profile-window", "many"},
            {"chart_core_replay", "--format", "xml"},
            {"chart_core_replay", "--stream-time-unit", "minutes"},
            {"chart_core_replay", "--interval", "7x"},
            {"chart_core_replay", "--log-categories", "stream,network"},
            {"chart_core_replay", "--config", "/tmp/tcc_missing_config_file.conf"},
        };
        for (const auto& args : invalid) {
            try {
                runConfig(args);
                std::cerr << "Expected configuration error for " << args[1] << " " << args[2] << "\n";
                return 1;
            }
            catch (const std::runtime_error&) {
            }
        }
    }

    std::remove(path.c_str());
    std::cout << "test_config_provider passed\n";
    return 0;
}
