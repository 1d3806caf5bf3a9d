#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "adapters/report/StrategyReportWriter.hpp"
#include "adapters/report/ViewSerializer.hpp"
#include "adapters/stream/StreamMessageDecoder.hpp"
#include "app/StreamDispatcher.hpp"
#include "common/Metrics.hpp"
#include "config/ConfigProvider.h"
#include "core/TimeUtils.h"
#include "logging/Log.h"

#ifndef TCC_VERSION
#define TCC_VERSION "dev"
#endif

namespace {

std::string readFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Unable to open " + path);
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

void writeOutput(const std::string& path, const std::string& content) {
    if (path.empty() || path == "-") {
        std::fwrite(content.data(), 1, content.size(), stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);
        return;
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Unable to write " + path);
    }
    output << content << '\n';
    if (!output) {
        throw std::runtime_error("Write failed for " + path);
    }
    LOG_INFO(logging::LogCategory::IO, "export written to %s (%zu bytes)", path.c_str(), content.size());
}

app::MarketSession::Settings sessionSettings(const config::Config& cfg) {
    app::MarketSession::Settings settings;
    settings.maxCandles = cfg.maxCandles;
    settings.profile.barWidth = cfg.profileWidth;
    settings.profile.bucketCount = cfg.profileBuckets;
    settings.profile.windowSize = cfg.profileWindow;
    settings.profile.recencyWeighting = cfg.profileRecencyWeighting;
    return settings;
}

domain::TimeUnit unitOf(bool inMs) {
    return inMs ? domain::TimeUnit::Milliseconds : domain::TimeUnit::Seconds;
}

int run(const config::Config& cfg) {
    if (cfg.streamFile.empty()) {
        throw std::runtime_error("a stream file is required (--stream-file or TCC_STREAM_FILE)");
    }

    LOG_INFO(logging::LogCategory::CONFIG, "symbol=%s interval=%s stream=%s strategy=%s format=%s",
             cfg.symbol.c_str(), cfg.interval.c_str(), cfg.streamFile.c_str(),
             cfg.strategyFile.empty() ? "-" : cfg.strategyFile.c_str(),
             cfg.outputFormat == config::OutputFormat::Json ? "json" : "markdown");
    LOG_DEBUG(logging::LogCategory::CONFIG, "log level %s", logging::Log::level_to_string(cfg.logLevel));
    LOG_DEBUG(logging::LogCategory::CONFIG, "profile buckets=%d window=%d width=%d weighting=%s max_candles=%zu",
              cfg.profileBuckets, cfg.profileWindow, cfg.profileWidth,
              cfg.profileRecencyWeighting ? "on" : "off", cfg.maxCandles);

    std::ifstream stream(cfg.streamFile);
    if (!stream) {
        throw std::runtime_error("Unable to open stream file " + cfg.streamFile);
    }
    std::optional<std::string> strategyText;
    if (!cfg.strategyFile.empty()) {
        strategyText = readFile(cfg.strategyFile);
    }

    const domain::TimeUnit streamUnit = unitOf(cfg.streamTimesInMs);
    adapters::stream::StreamMessageDecoder decoder(streamUnit, unitOf(cfg.strategyTimesInMs));
    app::StreamDispatcher dispatcher(sessionSettings(cfg), decoder);
    dispatcher.start();

    const auto generation = dispatcher.select({cfg.symbol, domain::interval_from_label(cfg.interval)});

    std::size_t lines = 0;
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        ++lines;
        dispatcher.deliver(generation, std::move(line));
        line.clear();
    }
    if (strategyText) {
        dispatcher.deliverStrategy(generation, std::move(*strategyText));
    }

    std::optional<domain::TimestampMs> hover;
    if (cfg.hoverTime) {
        hover = domain::to_millis(static_cast<double>(*cfg.hoverTime), streamUnit);
    }

    std::optional<app::DerivedViews> views;
    dispatcher.recompute(hover, [&views](const app::DerivedViews& computed) { views = computed; });
    dispatcher.flush();
    dispatcher.stop();

    const auto counters = dispatcher.counters();
    LOG_INFO(logging::LogCategory::STREAM, "replayed %zu messages: applied=%llu malformed=%llu stale=%llu",
             lines, static_cast<unsigned long long>(counters.applied),
             static_cast<unsigned long long>(counters.malformed),
             static_cast<unsigned long long>(counters.staleDropped));

    if (!views) {
        throw std::runtime_error("derived views were not produced");
    }

    std::string content;
    if (cfg.outputFormat == config::OutputFormat::Json) {
        content = adapters::report::serialize_json(adapters::report::to_json(*views));
    }
    else {
        adapters::report::StrategyReportInput report;
        report.key = views->key;
        report.exportedAt = core::TimeUtils::nowMs();
        report.candles = views->candles;
        report.volumeProfile = views->volumeProfile;
        report.strategy = views->strategyPayload;
        report.results = views->strategy;
        content = adapters::report::StrategyReportWriter::render(report);
    }
    writeOutput(cfg.outputFile, content);

    const auto snapshot = tcc::common::metrics::Registry::instance().snapshot();
    for (const auto& [key, timer] : snapshot.timers) {
        LOG_DEBUG(logging::LogCategory::IO, "timer %s: samples=%llu p95=%.3fms", key.c_str(),
                  static_cast<unsigned long long>(timer.samples), timer.p95Ms.value_or(0.0));
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            }
            catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            }
            catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        }
        else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        config::ConfigProvider provider(argc, argv);
        const auto& cfg = provider.get();

        if (cfg.showHelp) {
            std::fputs(config::ConfigProvider::usage().c_str(), stdout);
            return EXIT_SUCCESS;
        }
        if (cfg.showVersion) {
            std::printf("chart_core_replay %s\n", TCC_VERSION);
            return EXIT_SUCCESS;
        }

        logging::Log::set_log_level(cfg.logLevel);
        logging::Log::set_category_mask(cfg.logCategoryMask);
        return run(cfg);
    }
    catch (const std::exception& ex) {
        std::fprintf(stderr, "chart_core_replay: %s\n", ex.what());
        return EXIT_FAILURE;
    }
}
