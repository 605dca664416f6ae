#include "engine/BenchmarkScheduler.h"
#include "common/Errors.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace sentinel;
using namespace std::chrono_literals;

namespace {

backtest::BenchmarkResult makeResult(int n) {
    backtest::BenchmarkResult r;
    r.test_name = "benchmark_" + std::to_string(n);
    r.sharpe_ratio = static_cast<double>(n);
    r.timestamp = n;
    return r;
}

// Holds the runner until release() so a run can be observed in flight
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }
    void waitEntered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }
private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool open_ = false;
};

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

}

int main() {
    // History keeps the newest 100 results, oldest evicted first
    {
        core::EventBus events;
        std::atomic<int> completed{0};
        events.onBenchmarkCompleted([&completed](const backtest::BenchmarkResult&) { completed++; });

        int n = 0;
        engine::BenchmarkScheduler scheduler([&n] { return makeResult(++n); }, events, 1h);
        assert(!scheduler.getLatest());

        for (int i = 0; i < 101; ++i) {
            scheduler.runOnce();
        }

        assert(completed == 101);
        assert(scheduler.historySize() == engine::BenchmarkScheduler::MAX_HISTORY);

        auto all = scheduler.getHistory(1000);
        assert(all.size() == 100);
        assert(all.front().sharpe_ratio == 2.0);
        assert(all.back().sharpe_ratio == 101.0);

        auto recent = scheduler.getHistory(5);
        assert(recent.size() == 5);
        assert(recent.front().sharpe_ratio == 97.0);
        assert(recent.back().sharpe_ratio == 101.0);

        assert(scheduler.getHistory(0).empty());
        assert(scheduler.getLatest()->sharpe_ratio == 101.0);
    }

    // Failed run: ERROR published, typed error thrown, history untouched
    {
        core::EventBus events;
        std::vector<core::ErrorEvent> errors;
        events.onError([&errors](const core::ErrorEvent& e) { errors.push_back(e); });

        bool fail = false;
        int n = 0;
        engine::BenchmarkScheduler scheduler([&] {
            if (fail) throw std::runtime_error("no market data");
            return makeResult(++n);
        }, events, 1h);

        scheduler.runOnce();
        fail = true;

        bool threw = false;
        try {
            scheduler.runOnce();
        } catch (const BenchmarkRunError& e) {
            threw = true;
            assert(std::string(e.what()).find("no market data") != std::string::npos);
        }
        assert(threw);
        assert(!scheduler.isRunInFlight());
        assert(scheduler.historySize() == 1);
        assert(errors.size() == 1);
        assert(errors[0].context && *errors[0].context == "benchmark");
        assert(!errors[0].component);

        fail = false;
        scheduler.runOnce();
        assert(scheduler.historySize() == 2);
    }

    // Second run while one is in flight is rejected
    {
        core::EventBus events;
        Gate gate;
        engine::BenchmarkScheduler scheduler([&gate] {
            gate.wait();
            return makeResult(1);
        }, events, 1h);

        std::thread runner([&scheduler] { scheduler.runOnce(); });
        gate.waitEntered();
        assert(scheduler.isRunInFlight());

        bool rejected = false;
        try {
            scheduler.runOnce();
        } catch (const BenchmarkInFlightError&) {
            rejected = true;
        }
        assert(rejected);

        gate.release();
        runner.join();
        assert(!scheduler.isRunInFlight());
        assert(scheduler.historySize() == 1);
    }

    // A run finishing after stop() is discarded
    {
        core::EventBus events;
        std::atomic<int> completed{0};
        events.onBenchmarkCompleted([&completed](const backtest::BenchmarkResult&) { completed++; });

        Gate gate;
        engine::BenchmarkScheduler scheduler([&gate] {
            gate.wait();
            return makeResult(7);
        }, events, 1h);

        backtest::BenchmarkResult returned;
        std::thread runner([&] { returned = scheduler.runOnce(); });
        gate.waitEntered();

        scheduler.stop();
        scheduler.stop();
        assert(scheduler.isStopped());

        gate.release();
        runner.join();

        assert(returned.sharpe_ratio == 7.0);
        assert(scheduler.historySize() == 0);
        assert(completed == 0);
    }

    // Timer-driven runs, then stop disarms the timer for good
    {
        core::EventBus events;
        std::atomic<int> n{0};
        engine::BenchmarkScheduler scheduler([&n] { return makeResult(++n); }, events, 20ms);

        assert(!scheduler.isTimerArmed());
        assert(scheduler.start());
        assert(scheduler.isTimerArmed());
        assert(!scheduler.start());

        assert(waitFor([&scheduler] { return scheduler.historySize() >= 2; }));
        scheduler.stop();
        assert(!scheduler.isTimerArmed());
        assert(!scheduler.start());

        const size_t at_stop = scheduler.historySize();
        std::this_thread::sleep_for(100ms);
        assert(scheduler.historySize() == at_stop);
    }

    std::cout << "[TEST] BenchmarkScheduler PASSED\n";
    return 0;
}
