#include "engine/AdaptiveSystemHarness.h"
#include "common/Errors.h"
#include "TestStubs.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace sentinel;
using engine::ComponentStatus;
using namespace std::chrono_literals;

namespace {

engine::HarnessConfig quietConfig() {
    engine::HarnessConfig config;
    config.enable_real_time_test = false;
    config.health_check_interval_ms = 60LL * 60 * 1000;
    config.synthetic_bar_count = 200;
    config.random_seed = 11;
    return config;
}

template <typename Fn>
bool throwsNotInitialized(Fn fn) {
    try {
        fn();
    } catch (const NotInitializedError&) {
        return true;
    }
    return false;
}

}

int main() {
    // Queries before initialize() are rejected; recording requests is not
    {
        testing::StubSet stubs;
        engine::AdaptiveSystemHarness harness(quietConfig(), stubs.collaborators());
        assert(!harness.isInitialized());
        assert(throwsNotInitialized([&] { harness.getSystemHealth(); }));
        assert(throwsNotInitialized([&] { harness.getBenchmarkHistory(); }));
        assert(throwsNotInitialized([&] { harness.getLatestBenchmark(); }));
        assert(throwsNotInitialized([&] { harness.getSystemStats(); }));
        assert(throwsNotInitialized([&] { harness.runManualBenchmark(); }));
        assert(throwsNotInitialized([&] { harness.checkHealthNow(); }));
        harness.recordRequest(5.0);
    }

    // Successful start: one SYSTEM_INITIALIZED, health readable as a copy
    {
        testing::StubSet stubs;
        engine::AdaptiveSystemHarness harness(quietConfig(), stubs.collaborators());
        int initialized = 0;
        harness.events().onSystemInitialized([&initialized] { initialized++; });

        harness.initialize();
        harness.initialize();
        assert(harness.isInitialized());
        assert(initialized == 1);

        auto health = harness.getSystemHealth();
        assert(health.overall == ComponentStatus::HEALTHY);
        assert(health.components.size() == 5);
        health.components[engine::component::PARAMETER_MANAGER] = ComponentStatus::CRITICAL;
        assert(harness.getSystemHealth().components[engine::component::PARAMETER_MANAGER] == ComponentStatus::HEALTHY);

        assert(harness.getBenchmarkHistory().empty());
        assert(!harness.getLatestBenchmark());
    }

    // Missing collaborator: ERROR published, InitializationError thrown, harness unusable
    {
        testing::StubSet stubs;
        auto collaborators = stubs.collaborators();
        collaborators.strategy_service.reset();

        engine::AdaptiveSystemHarness harness(quietConfig(), collaborators);
        std::vector<core::ErrorEvent> errors;
        int initialized = 0;
        harness.events().onError([&errors](const core::ErrorEvent& e) { errors.push_back(e); });
        harness.events().onSystemInitialized([&initialized] { initialized++; });

        bool threw = false;
        try {
            harness.initialize();
        } catch (const InitializationError&) {
            threw = true;
        }
        assert(threw);
        assert(!harness.isInitialized());
        assert(initialized == 0);
        assert(errors.size() == 1);
        assert(errors[0].context && *errors[0].context == "initialization");
        assert(throwsNotInitialized([&] { harness.getSystemHealth(); }));
    }

    // Failure after listeners are wired: listeners are detached again
    {
        testing::StubSet stubs;
        stubs.hot_update->fail_attach = true;
        {
            engine::AdaptiveSystemHarness harness(quietConfig(), stubs.collaborators());
            bool threw = false;
            try {
                harness.initialize();
            } catch (const InitializationError&) {
                threw = true;
            }
            assert(threw);
            assert(!harness.isInitialized());
        }
        const auto listener = stubs.strategy->currentListener();
        assert(!listener.on_error);
        assert(!listener.on_performance_updated);
        assert(!listener.on_parameters_adjusted);
        assert(!stubs.hot_update->raise("late error"));
    }

    // Collaborator-reported errors mark the component CRITICAL and count as errors
    {
        testing::StubSet stubs;
        engine::AdaptiveSystemHarness harness(quietConfig(), stubs.collaborators());
        std::vector<core::ErrorEvent> errors;
        harness.events().onError([&errors](const core::ErrorEvent& e) { errors.push_back(e); });
        harness.initialize();

        harness.recordRequest(10.0);
        harness.recordRequest(30.0);

        auto listener = stubs.strategy->currentListener();
        assert(listener.on_error);
        listener.on_error("model diverged");

        auto health = harness.getSystemHealth();
        assert(health.components[engine::component::ADAPTIVE_STRATEGY] == ComponentStatus::CRITICAL);
        assert(health.overall == ComponentStatus::CRITICAL);
        assert(errors.size() == 1);
        assert(*errors[0].component == engine::component::ADAPTIVE_STRATEGY);
        assert(errors[0].error == "model diverged");

        auto stats = harness.getSystemStats();
        assert(stats.total_requests == 2);
        assert(stats.error_rate == 0.5);
        assert(stats.avg_response_time_ms == 20.0);
        assert(stats.components[engine::component::ADAPTIVE_STRATEGY] == ComponentStatus::CRITICAL);

        assert(stubs.hot_update->raise("bad patch"));
        health = harness.getSystemHealth();
        assert(health.components[engine::component::HOT_UPDATE_SERVICE] == ComponentStatus::CRITICAL);
        assert(errors.size() == 2);

        // next health tick re-probes and clears both
        harness.checkHealthNow();
        assert(harness.getSystemHealth().overall == ComponentStatus::HEALTHY);

        auto j = engine::toJson(harness.getSystemStats());
        assert(j["total_requests"] == 2);
        assert(j["components"][engine::component::ADAPTIVE_STRATEGY] == "HEALTHY");
    }

    // Pushed performance is re-published, then checked against thresholds
    {
        testing::StubSet stubs;
        engine::AdaptiveSystemHarness harness(quietConfig(), stubs.collaborators());
        int evaluated = 0;
        std::vector<core::WarningEvent> warnings;
        harness.events().onPerformanceEvaluated([&evaluated](const PerformanceMetrics&) { evaluated++; });
        harness.events().onWarning([&warnings](const core::WarningEvent& w) { warnings.push_back(w); });
        harness.initialize();

        PerformanceMetrics metrics;
        metrics.sharpe_ratio = 0.5;
        metrics.max_drawdown = 0.05;
        metrics.win_rate = 0.6;
        stubs.strategy->currentListener().on_performance_updated(metrics);

        assert(evaluated == 1);
        assert(warnings.size() == 1);
        assert(warnings[0].warnings.size() == 1);
        assert(warnings[0].warnings[0].find("Sharpe ratio too low") == 0);
    }

    // Manual benchmark on synthetic bars (history file missing)
    {
        testing::StubSet stubs;
        auto config = quietConfig();
        config.history_csv_path = "does/not/exist.csv";
        engine::AdaptiveSystemHarness harness(config, stubs.collaborators());
        int completed = 0;
        harness.events().onBenchmarkCompleted([&completed](const backtest::BenchmarkResult&) { completed++; });
        harness.initialize();

        auto result = harness.runManualBenchmark();
        assert(result.total_trades == 0);
        assert(stubs.strategy->signal_calls == 200 - 49);
        assert(completed == 1);

        auto history = harness.getBenchmarkHistory(20);
        assert(history.size() == 1);
        assert(history.back().test_name == result.test_name);
        assert(harness.getLatestBenchmark()->test_name == result.test_name);
        assert(harness.getSystemStats().benchmark_count == 1);
    }

    // Backtest disabled: manual runs refused
    {
        testing::StubSet stubs;
        auto config = quietConfig();
        config.enable_backtest = false;
        engine::AdaptiveSystemHarness harness(config, stubs.collaborators());
        harness.initialize();

        bool threw = false;
        try {
            harness.runManualBenchmark();
        } catch (const BenchmarkRunError&) {
            threw = true;
        }
        assert(threw);
        assert(stubs.strategy->signal_calls == 0);
    }

    // Recurring benchmark runs on its timer until stop()
    {
        testing::StubSet stubs;
        auto config = quietConfig();
        config.enable_real_time_test = true;
        config.benchmark_interval_ms = 30;
        engine::AdaptiveSystemHarness harness(config, stubs.collaborators());
        std::atomic<int> completed{0};
        harness.events().onBenchmarkCompleted([&completed](const backtest::BenchmarkResult&) { completed++; });
        harness.initialize();

        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (completed < 1 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(10ms);
        }
        assert(completed >= 1);
        harness.stop();
    }

    // stop() is idempotent and detaches from the collaborators
    {
        testing::StubSet stubs;
        engine::AdaptiveSystemHarness harness(quietConfig(), stubs.collaborators());
        harness.initialize();

        harness.stop();
        harness.stop();
        assert(harness.isStopped());
        assert(stubs.strategy->stops == 1);
        assert(stubs.hot_update->stops == 1);
        assert(stubs.calibration->stops == 1);
        assert(!stubs.strategy->currentListener().on_error);
        assert(!stubs.hot_update->raise("late error"));
    }

    std::cout << "[TEST] Harness PASSED\n";
    return 0;
}
