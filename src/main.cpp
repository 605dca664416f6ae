#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "analytics/MarketStateAnalyzer.h"
#include "core/adapters/InProcessServices.h"
#include "engine/AdaptiveSystemHarness.h"
#include "strategy/MomentumSignalService.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>

using namespace sentinel;

// Set from the signal handler; the main loop performs the shutdown
std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

static core::Collaborators makeReferenceCollaborators() {
    core::Collaborators collaborators;
    collaborators.market_state_analyzer = std::make_shared<analytics::MarketStateAnalyzer>();
    collaborators.parameter_manager = std::make_shared<core::StaticParameterManager>(
        std::map<std::string, double>{
            {"ema_fast", 12.0},
            {"ema_slow", 26.0},
            {"min_spread", 0.001},
            {"holding_hours", 6.0}
        });
    collaborators.calibration_service = std::make_shared<core::FixedCalibrationService>(
        core::CalibrationPerformanceMap{
            {"momentum_ema_crossover", core::CalibrationPerformance{0.21, 0.06}}
        });
    collaborators.hot_update_service = std::make_shared<core::PassiveHotUpdateService>();
    collaborators.strategy_service = std::make_shared<strategy::MomentumSignalService>();
    return collaborators;
}

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "config/config.json";

        Config::getInstance().load(config_path);
        auto& config = Config::getInstance();

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       Sentinel Adaptive System Harness\n";
        std::cout << "=============================================\n\n";

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        engine::AdaptiveSystemHarness harness(config.getHarnessConfig(), makeReferenceCollaborators());

        auto& events = harness.events();
        events.onSystemInitialized([] {
            LOG_INFO("[event] {}", core::toString(core::HarnessEventType::SYSTEM_INITIALIZED));
        });
        events.onPerformanceEvaluated([](const PerformanceMetrics& metrics) {
            LOG_INFO("[event] {} {}", core::toString(core::HarnessEventType::PERFORMANCE_EVALUATED), core::toJson(metrics).dump());
        });
        events.onBenchmarkCompleted([](const backtest::BenchmarkResult& result) {
            LOG_INFO("[event] {} {}", core::toString(core::HarnessEventType::BENCHMARK_COMPLETED), backtest::toJson(result).dump());
        });
        events.onError([](const core::ErrorEvent& error) {
            LOG_ERROR("[event] {} {}", core::toString(core::HarnessEventType::ERROR_EVENT), core::toJson(error).dump());
        });
        events.onWarning([](const core::WarningEvent& warning) {
            LOG_WARN("[event] {} {}", core::toString(core::HarnessEventType::WARNING), core::toJson(warning).dump());
        });

        harness.initialize();

        if (harness.config().enable_backtest) {
            try {
                const auto result = harness.runManualBenchmark();
                std::cout << "Initial benchmark: sharpe=" << result.sharpe_ratio
                          << " win_rate=" << result.win_rate
                          << " trades=" << result.total_trades << "\n";
            } catch (const BenchmarkRunError& e) {
                LOG_ERROR("Initial benchmark failed: {}", e.what());
            }
        }

        harness.checkHealthNow();
        std::cout << engine::toJson(harness.getSystemHealth()).dump(2) << "\n";
        std::cout << "\nRunning. Press Ctrl+C to stop.\n";

        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Shutdown requested");
        std::cout << engine::toJson(harness.getSystemStats()).dump(2) << "\n";
        harness.stop();

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
