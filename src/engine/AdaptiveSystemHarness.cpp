#include "engine/AdaptiveSystemHarness.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace sentinel {
namespace engine {

nlohmann::json toJson(const SystemStats& stats) {
    nlohmann::json j;
    j["uptime_ms"] = stats.uptime_ms;
    j["total_requests"] = stats.total_requests;
    j["error_rate"] = stats.error_rate;
    j["avg_response_time_ms"] = stats.avg_response_time_ms;
    j["components"] = nlohmann::json::object();
    for (const auto& entry : stats.components) {
        j["components"][entry.first] = toString(entry.second);
    }
    j["benchmark_count"] = stats.benchmark_count;
    j["last_benchmark_score"] = stats.last_benchmark_score;
    return j;
}

AdaptiveSystemHarness::AdaptiveSystemHarness(HarnessConfig config, core::Collaborators collaborators)
    : config_(std::move(config))
    , collaborators_(std::move(collaborators))
{}

AdaptiveSystemHarness::~AdaptiveSystemHarness() {
    stop();
    // join timer workers while the components they call are still alive
    health_timer_.reset();
    scheduler_.reset();
}

void AdaptiveSystemHarness::initialize() {
    if (initialized_) {
        return;
    }

    try {
        if (stopped_) {
            throw InitializationError("harness already stopped");
        }
        LOG_INFO("Initializing adaptive system harness");

        validateCollaborators();

        health_checker_ = std::make_unique<HealthChecker>(
            collaborators_, events_, request_metrics_, config_.random_seed);
        alerter_ = std::make_unique<ThresholdAlerter>(config_.thresholds, events_);
        backtest_engine_ = std::make_unique<backtest::BacktestEngine>(
            collaborators_.calibration_service, collaborators_.parameter_manager, config_.fee_rate);
        market_generator_ = std::make_unique<backtest::SyntheticMarketGenerator>(config_.random_seed);
        scheduler_ = std::make_unique<BenchmarkScheduler>(
            [this] { return executeBenchmark(); },
            events_,
            std::chrono::milliseconds(config_.benchmark_interval_ms));

        setupEventListeners();
        startTimers();

        initialized_ = true;
        events_.publishSystemInitialized();
        LOG_INFO("Adaptive system harness initialized");

    } catch (const InitializationError& e) {
        LOG_ERROR("{}", e.what());
        events_.publishError(core::ErrorEvent{std::nullopt, e.what(), std::string("initialization")});
        stop();
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Harness initialization failed: {}", e.what());
        events_.publishError(core::ErrorEvent{std::nullopt, e.what(), std::string("initialization")});
        stop();
        throw InitializationError(e.what());
    }
}

void AdaptiveSystemHarness::validateCollaborators() const {
    if (!collaborators_.market_state_analyzer) throw InitializationError("market state analyzer missing");
    if (!collaborators_.parameter_manager) throw InitializationError("parameter manager missing");
    if (!collaborators_.calibration_service) throw InitializationError("calibration service missing");
    if (!collaborators_.hot_update_service) throw InitializationError("hot update service missing");
    if (!collaborators_.strategy_service) throw InitializationError("strategy service missing");
}

void AdaptiveSystemHarness::setupEventListeners() {
    // Set first so a partial install is still detached by stop()
    listeners_attached_ = true;

    core::StrategyServiceListener listener;
    listener.on_error = [this](const std::string& error) {
        handleComponentError(component::ADAPTIVE_STRATEGY, error);
    };
    listener.on_performance_updated = [this](const PerformanceMetrics& metrics) {
        handlePerformanceUpdate(metrics);
    };
    listener.on_parameters_adjusted = [this](const core::ParameterAdjustment& adjustment) {
        handleParametersAdjusted(adjustment);
    };
    collaborators_.strategy_service->setListener(std::move(listener));

    collaborators_.hot_update_service->setErrorHandler([this](const std::string& error) {
        handleComponentError(component::HOT_UPDATE_SERVICE, error);
    });
}

void AdaptiveSystemHarness::startTimers() {
    health_timer_ = std::make_unique<PeriodicTask>(
        "health-check",
        std::chrono::milliseconds(config_.health_check_interval_ms),
        [this] { health_checker_->checkHealth(); });
    health_timer_->start();

    if (config_.enable_real_time_test && config_.enable_backtest) {
        scheduler_->start();
    } else {
        LOG_INFO("Recurring benchmark disabled (real_time_test={}, backtest={})",
                 config_.enable_real_time_test, config_.enable_backtest);
    }
}

void AdaptiveSystemHarness::requireInitialized(const char* what) const {
    if (!initialized_) {
        throw NotInitializedError(what);
    }
}

void AdaptiveSystemHarness::handleComponentError(const std::string& component, const std::string& error) {
    request_metrics_.recordError();
    health_checker_->markComponent(component, ComponentStatus::CRITICAL);

    LOG_ERROR("Component error [{}]: {}", component, error);
    core::ErrorEvent event;
    event.component = component;
    event.error = error;
    events_.publishError(event);
}

void AdaptiveSystemHarness::handlePerformanceUpdate(const PerformanceMetrics& metrics) {
    events_.publishPerformanceEvaluated(metrics);
    alerter_->evaluate(metrics);
}

void AdaptiveSystemHarness::handleParametersAdjusted(const core::ParameterAdjustment& adjustment) {
    LOG_INFO("Parameters adjusted [{}]: {} (confidence {:.2f})",
             adjustment.market_state, adjustment.reason, adjustment.confidence);
}

backtest::BenchmarkResult AdaptiveSystemHarness::executeBenchmark() {
    const auto bars = loadBenchmarkBars();
    return backtest_engine_->run(bars, *collaborators_.strategy_service, config_.notional_capital);
}

std::vector<Candle> AdaptiveSystemHarness::loadBenchmarkBars() {
    if (!config_.history_csv_path.empty()) {
        std::string ext = std::filesystem::path(config_.history_csv_path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto bars = (ext == ".json")
            ? backtest::DataHistory::loadJSON(config_.history_csv_path)
            : backtest::DataHistory::loadCSV(config_.history_csv_path);
        bars = backtest::DataHistory::filterByPeriod(bars, config_.backtest_period_days);

        if (bars.size() >= backtest::BacktestEngine::MIN_WINDOW_BARS) {
            return bars;
        }
        LOG_WARN("History {} has {} bars in the last {} days; using synthetic bars",
                 config_.history_csv_path, bars.size(), config_.backtest_period_days);
    }
    return market_generator_->generate(config_.synthetic_bar_count);
}

SystemHealth AdaptiveSystemHarness::getSystemHealth() const {
    requireInitialized("getSystemHealth");
    return health_checker_->snapshot();
}

std::vector<backtest::BenchmarkResult> AdaptiveSystemHarness::getBenchmarkHistory(size_t limit) const {
    requireInitialized("getBenchmarkHistory");
    return scheduler_->getHistory(limit);
}

std::optional<backtest::BenchmarkResult> AdaptiveSystemHarness::getLatestBenchmark() const {
    requireInitialized("getLatestBenchmark");
    return scheduler_->getLatest();
}

SystemStats AdaptiveSystemHarness::getSystemStats() const {
    requireInitialized("getSystemStats");

    const auto health = health_checker_->snapshot();
    const auto counters = request_metrics_.snapshot();
    const auto latest = scheduler_->getLatest();

    SystemStats stats;
    stats.uptime_ms = health_checker_->uptimeMs();
    stats.total_requests = counters.total_requests;
    stats.error_rate = counters.errorRate();
    stats.avg_response_time_ms = counters.avgResponseTimeMs();
    stats.components = health.components;
    stats.benchmark_count = scheduler_->historySize();
    stats.last_benchmark_score = latest ? latest->sharpe_ratio : 0.0;
    return stats;
}

backtest::BenchmarkResult AdaptiveSystemHarness::runManualBenchmark() {
    requireInitialized("runManualBenchmark");
    if (!config_.enable_backtest) {
        throw BenchmarkRunError("backtest disabled by configuration");
    }
    return scheduler_->runOnce();
}

void AdaptiveSystemHarness::checkHealthNow() {
    requireInitialized("checkHealthNow");
    health_checker_->checkHealth();
}

void AdaptiveSystemHarness::recordRequest(double response_time_ms, bool has_error) {
    request_metrics_.recordRequest(response_time_ms, has_error);
}

void AdaptiveSystemHarness::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    if (health_timer_) {
        health_timer_->cancel();
    }
    if (scheduler_) {
        scheduler_->stop();
    }

    if (listeners_attached_.exchange(false)) {
        try {
            collaborators_.strategy_service->setListener(core::StrategyServiceListener{});
            collaborators_.hot_update_service->setErrorHandler(nullptr);
        } catch (const std::exception& e) {
            LOG_ERROR("Detaching collaborator listeners failed: {}", e.what());
        }
    }

    if (initialized_) {
        try {
            collaborators_.strategy_service->stop();
            collaborators_.hot_update_service->stop();
            collaborators_.calibration_service->stop();
        } catch (const std::exception& e) {
            LOG_ERROR("Collaborator shutdown failed: {}", e.what());
        }
    }

    LOG_INFO("Adaptive system harness stopped");
}

} // namespace engine
} // namespace sentinel
