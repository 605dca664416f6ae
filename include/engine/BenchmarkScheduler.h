#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "backtest/BenchmarkResult.h"
#include "core/events/EventBus.h"
#include "engine/PeriodicTask.h"

namespace sentinel {
namespace engine {

// Runs benchmarks on a timer and on demand, keeping the last MAX_HISTORY results.
class BenchmarkScheduler {
public:
    static constexpr size_t MAX_HISTORY = 100;

    using Runner = std::function<backtest::BenchmarkResult()>;

    BenchmarkScheduler(Runner runner, core::EventBus& events, std::chrono::milliseconds interval);
    ~BenchmarkScheduler();

    // Throws BenchmarkInFlightError if a run is active, BenchmarkRunError if the run fails
    backtest::BenchmarkResult runOnce();

    // Arms the recurring timer; false if already armed or stopped
    bool start();

    // Idempotent. Cancels the timer; a run still in flight is discarded on completion
    void stop();

    std::vector<backtest::BenchmarkResult> getHistory(size_t limit) const;
    std::optional<backtest::BenchmarkResult> getLatest() const;
    size_t historySize() const;

    bool isRunInFlight() const { return in_flight_; }
    bool isTimerArmed() const { return timer_ && timer_->isArmed(); }
    bool isStopped() const { return stopped_; }

private:
    void onTimer();
    bool appendIfRunning(const backtest::BenchmarkResult& result);

    Runner runner_;
    core::EventBus& events_;
    std::chrono::milliseconds interval_;
    std::unique_ptr<PeriodicTask> timer_;

    std::atomic<bool> in_flight_{false};
    std::atomic<bool> stopped_{false};

    mutable std::mutex history_mutex_;
    std::deque<backtest::BenchmarkResult> history_;
};

} // namespace engine
} // namespace sentinel
