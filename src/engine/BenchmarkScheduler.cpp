#include "engine/BenchmarkScheduler.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cstddef>

namespace sentinel {
namespace engine {

namespace {
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_ = false; }
private:
    std::atomic<bool>& flag_;
};
}

BenchmarkScheduler::BenchmarkScheduler(Runner runner, core::EventBus& events, std::chrono::milliseconds interval)
    : runner_(std::move(runner))
    , events_(events)
    , interval_(interval)
{}

BenchmarkScheduler::~BenchmarkScheduler() {
    stop();
    // join the worker before the history it writes to goes away
    timer_.reset();
}

backtest::BenchmarkResult BenchmarkScheduler::runOnce() {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        throw BenchmarkInFlightError();
    }
    InFlightGuard guard(in_flight_);

    LOG_INFO("Benchmark run started");

    backtest::BenchmarkResult result;
    try {
        result = runner_();
    } catch (const std::exception& e) {
        LOG_ERROR("Benchmark run failed: {}", e.what());
        core::ErrorEvent event;
        event.error = e.what();
        event.context = "benchmark";
        events_.publishError(event);
        throw BenchmarkRunError(e.what());
    }

    if (!appendIfRunning(result)) {
        LOG_WARN("Benchmark {} finished after stop; result discarded", result.test_name);
        return result;
    }

    events_.publishBenchmarkCompleted(result);
    Logger::getInstance().logBenchmark(result.test_name, result.sharpe_ratio, result.win_rate,
                                       result.total_trades, result.max_drawdown, result.profit_factor);
    LOG_INFO("Benchmark done: Sharpe={:.2f}, WinRate={:.1f}%, Trades={}, MaxDD={:.2f}%",
             result.sharpe_ratio, result.win_rate * 100.0, result.total_trades, result.max_drawdown * 100.0);
    return result;
}

bool BenchmarkScheduler::appendIfRunning(const backtest::BenchmarkResult& result) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    if (stopped_) {
        return false;
    }
    history_.push_back(result);
    while (history_.size() > MAX_HISTORY) {
        history_.pop_front();
    }
    return true;
}

bool BenchmarkScheduler::start() {
    if (stopped_ || timer_) {
        return false;
    }
    timer_ = std::make_unique<PeriodicTask>("benchmark", interval_, [this] { onTimer(); });
    return timer_->start();
}

void BenchmarkScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    if (timer_) {
        timer_->cancel();
    }
}

void BenchmarkScheduler::onTimer() {
    try {
        runOnce();
    } catch (const BenchmarkInFlightError&) {
        LOG_WARN("Previous benchmark still running; scheduled cycle skipped");
    } catch (const BenchmarkRunError& e) {
        LOG_ERROR("Scheduled benchmark cycle skipped: {}", e.what());
    }
}

std::vector<backtest::BenchmarkResult> BenchmarkScheduler::getHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    const size_t count = std::min(limit, history_.size());
    return std::vector<backtest::BenchmarkResult>(history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
}

std::optional<backtest::BenchmarkResult> BenchmarkScheduler::getLatest() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    if (history_.empty()) {
        return std::nullopt;
    }
    return history_.back();
}

size_t BenchmarkScheduler::historySize() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_.size();
}

} // namespace engine
} // namespace sentinel
