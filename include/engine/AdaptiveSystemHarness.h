#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backtest/BacktestEngine.h"
#include "backtest/BenchmarkResult.h"
#include "backtest/SyntheticMarketGenerator.h"
#include "core/contracts/Collaborators.h"
#include "core/events/EventBus.h"
#include "engine/BenchmarkScheduler.h"
#include "engine/HarnessConfig.h"
#include "engine/HealthChecker.h"
#include "engine/PeriodicTask.h"
#include "engine/RequestMetrics.h"
#include "engine/SystemHealth.h"
#include "engine/ThresholdAlerter.h"

namespace sentinel {
namespace engine {

struct SystemStats {
    long long uptime_ms = 0;
    std::uint64_t total_requests = 0;
    double error_rate = 0.0;
    double avg_response_time_ms = 0.0;
    std::map<std::string, ComponentStatus> components;
    size_t benchmark_count = 0;
    double last_benchmark_score = 0.0;  // Sharpe of the latest benchmark
};

nlohmann::json toJson(const SystemStats& stats);

// Integration facade: watches the collaborators' health, benchmarks the strategy
// service and re-publishes its performance updates after threshold checks.
class AdaptiveSystemHarness {
public:
    AdaptiveSystemHarness(HarnessConfig config, core::Collaborators collaborators);
    ~AdaptiveSystemHarness();

    AdaptiveSystemHarness(const AdaptiveSystemHarness&) = delete;
    AdaptiveSystemHarness& operator=(const AdaptiveSystemHarness&) = delete;

    // Subscribe before initialize() to observe SYSTEM_INITIALIZED / init errors
    core::EventBus& events() { return events_; }

    // Wires listeners and arms timers. Publishes ERROR and throws InitializationError on failure
    void initialize();
    bool isInitialized() const { return initialized_; }

    // Queries throw NotInitializedError before initialize()
    SystemHealth getSystemHealth() const;
    std::vector<backtest::BenchmarkResult> getBenchmarkHistory(size_t limit = 20) const;
    std::optional<backtest::BenchmarkResult> getLatestBenchmark() const;
    SystemStats getSystemStats() const;

    // Runs one out-of-band benchmark on the calling thread
    backtest::BenchmarkResult runManualBenchmark();

    // Runs one health tick on the calling thread
    void checkHealthNow();

    void recordRequest(double response_time_ms, bool has_error = false);

    // Idempotent
    void stop();
    bool isStopped() const { return stopped_; }

    const HarnessConfig& config() const { return config_; }

private:
    void validateCollaborators() const;
    void setupEventListeners();
    void startTimers();
    void requireInitialized(const char* what) const;

    void handleComponentError(const std::string& component, const std::string& error);
    void handlePerformanceUpdate(const PerformanceMetrics& metrics);
    void handleParametersAdjusted(const core::ParameterAdjustment& adjustment);

    backtest::BenchmarkResult executeBenchmark();
    std::vector<Candle> loadBenchmarkBars();

    const HarnessConfig config_;
    core::Collaborators collaborators_;
    core::EventBus events_;
    RequestMetricsRecorder request_metrics_;

    std::unique_ptr<HealthChecker> health_checker_;
    std::unique_ptr<ThresholdAlerter> alerter_;
    std::unique_ptr<backtest::BacktestEngine> backtest_engine_;
    std::unique_ptr<backtest::SyntheticMarketGenerator> market_generator_;
    std::unique_ptr<BenchmarkScheduler> scheduler_;
    std::unique_ptr<PeriodicTask> health_timer_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> listeners_attached_{false};
};

} // namespace engine
} // namespace sentinel
