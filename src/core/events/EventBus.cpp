#include "core/events/EventBus.h"
#include "common/Logger.h"

namespace sentinel {
namespace core {

void reportHandlerFailure(SubscriptionId id, const char* what) {
    LOG_ERROR("Event handler #{} threw: {}", id, what);
}

SubscriptionId EventBus::onSystemInitialized(std::function<void()> handler) {
    const auto id = nextId();
    system_initialized_.add(id, std::move(handler));
    return id;
}

SubscriptionId EventBus::onPerformanceEvaluated(std::function<void(const PerformanceMetrics&)> handler) {
    const auto id = nextId();
    performance_evaluated_.add(id, std::move(handler));
    return id;
}

SubscriptionId EventBus::onBenchmarkCompleted(std::function<void(const backtest::BenchmarkResult&)> handler) {
    const auto id = nextId();
    benchmark_completed_.add(id, std::move(handler));
    return id;
}

SubscriptionId EventBus::onError(std::function<void(const ErrorEvent&)> handler) {
    const auto id = nextId();
    error_.add(id, std::move(handler));
    return id;
}

SubscriptionId EventBus::onWarning(std::function<void(const WarningEvent&)> handler) {
    const auto id = nextId();
    warning_.add(id, std::move(handler));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    return system_initialized_.remove(id)
        || performance_evaluated_.remove(id)
        || benchmark_completed_.remove(id)
        || error_.remove(id)
        || warning_.remove(id);
}

void EventBus::publishSystemInitialized() const {
    system_initialized_.publish();
}

void EventBus::publishPerformanceEvaluated(const PerformanceMetrics& metrics) const {
    performance_evaluated_.publish(metrics);
}

void EventBus::publishBenchmarkCompleted(const backtest::BenchmarkResult& result) const {
    benchmark_completed_.publish(result);
}

void EventBus::publishError(const ErrorEvent& event) const {
    error_.publish(event);
}

void EventBus::publishWarning(const WarningEvent& event) const {
    warning_.publish(event);
}

size_t EventBus::subscriberCount(HarnessEventType type) const {
    switch (type) {
        case HarnessEventType::SYSTEM_INITIALIZED: return system_initialized_.size();
        case HarnessEventType::PERFORMANCE_EVALUATED: return performance_evaluated_.size();
        case HarnessEventType::BENCHMARK_COMPLETED: return benchmark_completed_.size();
        case HarnessEventType::ERROR_EVENT: return error_.size();
        case HarnessEventType::WARNING: return warning_.size();
    }
    return 0;
}

} // namespace core
} // namespace sentinel
