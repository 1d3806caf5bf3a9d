#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "adapters/stream/StreamMessageDecoder.hpp"
#include "app/MarketSession.hpp"

namespace app {

// Single inbound channel for one MarketSession. Every mutation and every
// derived-view computation runs on one strand, one message at a time.
// Work is tagged with the selection generation it was issued under; work from
// an older selection is discarded when it reaches the loop.
class StreamDispatcher {
public:
    using Generation = std::uint64_t;
    using ViewsCallback = std::function<void(const DerivedViews&)>;

    struct Counters {
        std::uint64_t applied = 0;
        std::uint64_t malformed = 0;
        std::uint64_t unknown = 0;
        std::uint64_t staleDropped = 0;
        std::uint64_t viewsDelivered = 0;
        std::uint64_t viewsDiscarded = 0;
    };

    StreamDispatcher(MarketSession::Settings settings, adapters::stream::StreamMessageDecoder decoder);
    ~StreamDispatcher();

    StreamDispatcher(const StreamDispatcher&) = delete;
    StreamDispatcher& operator=(const StreamDispatcher&) = delete;

    void start();
    void stop();

    // Bumps the generation and resets the session on the loop. Returns the new generation.
    Generation select(domain::SessionKey key);
    Generation generation() const { return generation_.load(std::memory_order_acquire); }

    void deliver(Generation generation, std::string payload);
    void deliverStrategy(Generation generation, std::string payload);

    // Computes the derived views on the loop and hands them to `callback` on the
    // loop thread, unless a newer selection happened in the meantime.
    void recompute(std::optional<domain::TimestampMs> hoveredTime, ViewsCallback callback);

    // Blocks until everything posted so far has been handled. Must not be
    // called from the loop thread.
    void flush();

    Counters counters() const;

private:
    bool isCurrent_(Generation generation) const { return generation == this->generation(); }
    void dropStale_(const char* what, Generation generation);

    MarketSession session_;
    adapters::stream::StreamMessageDecoder decoder_;

    boost::asio::io_context ioc_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::thread loopThread_;

    std::atomic<Generation> generation_{0};
    std::atomic<std::uint64_t> applied_{0};
    std::atomic<std::uint64_t> malformed_{0};
    std::atomic<std::uint64_t> unknown_{0};
    std::atomic<std::uint64_t> staleDropped_{0};
    std::atomic<std::uint64_t> viewsDelivered_{0};
    std::atomic<std::uint64_t> viewsDiscarded_{0};
};

}  // namespace app
