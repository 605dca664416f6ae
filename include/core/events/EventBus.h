#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "backtest/BenchmarkResult.h"
#include "common/Types.h"
#include "core/events/HarnessEvents.h"

namespace sentinel {
namespace core {

using SubscriptionId = std::uint64_t;

void reportHandlerFailure(SubscriptionId id, const char* what);

// One event name, one payload shape. Handlers run on the publishing thread,
// outside the channel lock, so they may publish or unsubscribe themselves.
template <typename... Args>
class EventChannel {
public:
    using Handler = std::function<void(const Args&...)>;

    void add(SubscriptionId id, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.emplace_back(id, std::move(handler));
    }

    bool remove(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == id) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    // Returns the number of handlers that threw
    int publish(const Args&... args) const {
        std::vector<std::pair<SubscriptionId, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = handlers_;
        }

        int failures = 0;
        for (const auto& entry : snapshot) {
            try {
                entry.second(args...);
            } catch (const std::exception& e) {
                failures++;
                reportHandlerFailure(entry.first, e.what());
            }
        }
        return failures;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
};

// Public event boundary of the harness
class EventBus {
public:
    SubscriptionId onSystemInitialized(std::function<void()> handler);
    SubscriptionId onPerformanceEvaluated(std::function<void(const PerformanceMetrics&)> handler);
    SubscriptionId onBenchmarkCompleted(std::function<void(const backtest::BenchmarkResult&)> handler);
    SubscriptionId onError(std::function<void(const ErrorEvent&)> handler);
    SubscriptionId onWarning(std::function<void(const WarningEvent&)> handler);

    bool unsubscribe(SubscriptionId id);

    void publishSystemInitialized() const;
    void publishPerformanceEvaluated(const PerformanceMetrics& metrics) const;
    void publishBenchmarkCompleted(const backtest::BenchmarkResult& result) const;
    void publishError(const ErrorEvent& event) const;
    void publishWarning(const WarningEvent& event) const;

    size_t subscriberCount(HarnessEventType type) const;

private:
    SubscriptionId nextId() { return ++last_id_; }

    std::atomic<SubscriptionId> last_id_{0};
    EventChannel<> system_initialized_;
    EventChannel<PerformanceMetrics> performance_evaluated_;
    EventChannel<backtest::BenchmarkResult> benchmark_completed_;
    EventChannel<ErrorEvent> error_;
    EventChannel<WarningEvent> warning_;
};

} // namespace core
} // namespace sentinel
