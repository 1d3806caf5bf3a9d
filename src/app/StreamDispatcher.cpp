#include "app/StreamDispatcher.hpp"

#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace app {

namespace net = boost::asio;
namespace metrics = tcc::common::metrics;

StreamDispatcher::StreamDispatcher(MarketSession::Settings settings, adapters::stream::StreamMessageDecoder decoder)
    : session_(settings),
      decoder_(decoder),
      strand_(net::make_strand(ioc_)) {}

StreamDispatcher::~StreamDispatcher() {
    stop();
}

void StreamDispatcher::start() {
    if (loopThread_.joinable()) {
        return;
    }
    workGuard_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(ioc_.get_executor());
    if (ioc_.stopped()) {
        ioc_.restart();
    }
    loopThread_ = std::thread([this]() {
        LOG_DEBUG(logging::LogCategory::STREAM, "dispatcher loop started");
        ioc_.run();
        LOG_DEBUG(logging::LogCategory::STREAM, "dispatcher loop finished");
    });
}

void StreamDispatcher::stop() {
    if (!loopThread_.joinable()) {
        return;
    }
    // pending work drains before run() returns
    workGuard_.reset();
    loopThread_.join();
}

StreamDispatcher::Generation StreamDispatcher::select(domain::SessionKey key) {
    const Generation next = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    net::post(strand_, [this, next, key = std::move(key)]() mutable {
        if (!isCurrent_(next)) {
            dropStale_("select", next);
            return;
        }
        session_.select(std::move(key));
    });
    return next;
}

void StreamDispatcher::deliver(Generation generation, std::string payload) {
    net::post(strand_, [this, generation, payload = std::move(payload)]() {
        if (!isCurrent_(generation)) {
            dropStale_("stream message", generation);
            return;
        }
        auto failure = adapters::stream::DecodeFailure::None;
        auto event = decoder_.decode(payload, &failure);
        if (!event) {
            auto& counter = failure == adapters::stream::DecodeFailure::UnknownEvent ? unknown_ : malformed_;
            counter.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        session_.apply(*event);
        applied_.fetch_add(1, std::memory_order_relaxed);
    });
}

void StreamDispatcher::deliverStrategy(Generation generation, std::string payload) {
    net::post(strand_, [this, generation, payload = std::move(payload)]() {
        if (!isCurrent_(generation)) {
            dropStale_("strategy payload", generation);
            return;
        }
        auto decoded = decoder_.decodeStrategyPayload(payload);
        if (!decoded) {
            malformed_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        session_.setStrategy(std::move(*decoded));
        applied_.fetch_add(1, std::memory_order_relaxed);
    });
}

void StreamDispatcher::recompute(std::optional<domain::TimestampMs> hoveredTime, ViewsCallback callback) {
    const Generation requested = generation();
    net::post(strand_, [this, requested, hoveredTime, callback = std::move(callback)]() {
        if (!isCurrent_(requested)) {
            viewsDiscarded_.fetch_add(1, std::memory_order_relaxed);
            dropStale_("recompute", requested);
            return;
        }

        DerivedViews views;
        {
            metrics::Registry::ScopedTimer timer("recompute_views");
            views = session_.views(hoveredTime);
        }

        // a selection issued while computing makes these views obsolete
        if (!isCurrent_(requested)) {
            viewsDiscarded_.fetch_add(1, std::memory_order_relaxed);
            dropStale_("recompute result", requested);
            return;
        }
        if (callback) {
            try {
                callback(views);
            }
            catch (const std::exception& ex) {
                LOG_ERROR(logging::LogCategory::STREAM, "views callback failed: %s", ex.what());
            }
        }
        viewsDelivered_.fetch_add(1, std::memory_order_relaxed);
    });
}

void StreamDispatcher::flush() {
    if (!loopThread_.joinable()) {
        throw std::logic_error("dispatcher flushed before start()");
    }
    std::promise<void> done;
    auto future = done.get_future();
    net::post(strand_, [&done]() { done.set_value(); });
    future.wait();
}

StreamDispatcher::Counters StreamDispatcher::counters() const {
    Counters counters;
    counters.applied = applied_.load(std::memory_order_relaxed);
    counters.malformed = malformed_.load(std::memory_order_relaxed);
    counters.unknown = unknown_.load(std::memory_order_relaxed);
    counters.staleDropped = staleDropped_.load(std::memory_order_relaxed);
    counters.viewsDelivered = viewsDelivered_.load(std::memory_order_relaxed);
    counters.viewsDiscarded = viewsDiscarded_.load(std::memory_order_relaxed);
    return counters;
}

void StreamDispatcher::dropStale_(const char* what, Generation generation) {
    staleDropped_.fetch_add(1, std::memory_order_relaxed);
    metrics::Registry::instance().incrementCounter("dispatcher_stale_dropped");
    LOG_DEBUG(logging::LogCategory::STREAM, "%s from generation %llu dropped (current %llu)", what,
              static_cast<unsigned long long>(generation), static_cast<unsigned long long>(this->generation()));
}

}  // namespace app
