#include "analytics/MarketStateAnalyzer.h"
#include "core/adapters/InProcessServices.h"
#include "strategy/MomentumSignalService.h"
#include "TestStubs.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace sentinel;

namespace {

// Repeating per-bar moves, e.g. {+1%, -0.6%}
std::vector<Candle> makeCycleBars(int count, const std::vector<double>& moves) {
    std::vector<Candle> bars;
    double price = 100.0;
    for (int i = 0; i < count; ++i) {
        const double next = price * (1.0 + moves[static_cast<size_t>(i) % moves.size()]);
        bars.emplace_back(price, std::max(price, next), std::min(price, next), next, 1000.0,
                          static_cast<long long>(i) * ONE_HOUR_MS);
        price = next;
    }
    return bars;
}

std::vector<Candle> windowAt(const std::vector<Candle>& bars, size_t i, size_t length) {
    const size_t begin = i + 1 >= length ? i + 1 - length : 0;
    return std::vector<Candle>(bars.begin() + begin, bars.begin() + i + 1);
}

}

int main() {
    // Market state classification
    {
        analytics::MarketStateAnalyzer analyzer;
        CandlesByTimeframe data;

        data[Timeframe::H1] = testing::makeTrendBars(120, 0.005);
        auto up = analyzer.analyzeState(data, data[Timeframe::H1].back().close, 1e6);
        assert(up.state == "TRENDING_UP");
        assert(up.trend_score > 0.0);
        assert(up.confidence > 0.0 && up.confidence <= 1.0);
        assert(analyzer.lastResult().state == "TRENDING_UP");

        data[Timeframe::H1] = testing::makeTrendBars(120, -0.005);
        auto down = analyzer.analyzeState(data, data[Timeframe::H1].back().close, 1e6);
        assert(down.state == "TRENDING_DOWN");
        assert(down.trend_score < 0.0);

        data[Timeframe::H1] = testing::makeTrendBars(120, 0.03);
        auto wild = analyzer.analyzeState(data, data[Timeframe::H1].back().close, 1e6);
        assert(wild.state == "HIGH_VOLATILITY");

        data[Timeframe::H1] = testing::makeTrendBars(30, 0.005);
        auto sparse = analyzer.analyzeState(data, 100.0, 1e6);
        assert(sparse.state == "SIDEWAYS");
        assert(sparse.confidence == 0.0);

        bool threw = false;
        try {
            analyzer.analyzeState(data, 0.0, 1e6);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Momentum service buys a rising zig-zag and reports rolling performance
    {
        strategy::MomentumConfig cfg;
        cfg.holding_duration_ms = ONE_HOUR_MS;
        cfg.report_every_trades = 5;
        strategy::MomentumSignalService service(cfg);

        std::vector<PerformanceMetrics> reports;
        core::StrategyServiceListener listener;
        listener.on_performance_updated = [&reports](const PerformanceMetrics& m) { reports.push_back(m); };
        service.setListener(listener);

        const auto bars = makeCycleBars(200, {0.01, -0.006});
        int buys = 0;
        int sells = 0;
        for (size_t i = 60; i < bars.size(); ++i) {
            auto signal = service.generateSignal(windowAt(bars, i, 60), bars[i].close, 1e6);
            if (signal.action == SignalAction::BUY) {
                buys++;
                assert(signal.stop_loss < bars[i].close);
                assert(signal.take_profit > bars[i].close);
                assert(signal.holding_duration_ms == ONE_HOUR_MS);
                assert(signal.strategy_id == strategy::MomentumSignalService::STRATEGY_ID);
            }
            if (signal.action == SignalAction::SELL) sells++;
        }
        assert(buys > 0);
        assert(sells == 0);
        assert(!reports.empty());
        assert(reports.back().total_trades > 0);
        assert(reports.back().win_rate > 0.0 && reports.back().win_rate < 1.0);

        auto status = service.getServiceStatus();
        assert(status.active);
        assert(status.total_updates == buys);

        service.stop();
        assert(!service.getServiceStatus().active);
        auto after = service.generateSignal(windowAt(bars, 150, 60), bars[150].close, 1e6);
        assert(after.action == SignalAction::HOLD);
    }

    // Mostly losing entries widen the entry spread
    {
        strategy::MomentumConfig cfg;
        cfg.holding_duration_ms = ONE_HOUR_MS;
        cfg.report_every_trades = 6;
        strategy::MomentumSignalService service(cfg);

        int adjustments = 0;
        core::StrategyServiceListener listener;
        listener.on_parameters_adjusted = [&adjustments](const core::ParameterAdjustment& a) {
            adjustments++;
            assert(!a.reason.empty());
        };
        service.setListener(listener);

        const auto bars = makeCycleBars(200, {0.016, -0.006, -0.006});
        for (size_t i = 60; i < bars.size(); ++i) {
            service.generateSignal(windowAt(bars, i, 60), bars[i].close, 1e6);
        }
        assert(adjustments >= 1);
        assert(service.currentMinSpread() > cfg.min_spread);
    }

    // Bad prices are reported through on_error and thrown
    {
        strategy::MomentumSignalService service;
        std::string reported;
        core::StrategyServiceListener listener;
        listener.on_error = [&reported](const std::string& e) { reported = e; };
        service.setListener(listener);

        bool threw = false;
        try {
            service.generateSignal(testing::makeTrendBars(60), 0.0, 1e6);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(!reported.empty());
    }

    // In-process parameter, calibration and hot-update services
    {
        core::StaticParameterManager params({{"ema_fast", 12.0}});
        assert(params.getParameterStats().parameter_stability == 1.0);
        assert(params.getParameterStats().avg_confidence == 0.5);
        params.update("ema_fast", 18.0, 0.7);
        auto stats = params.getParameterStats();
        assert(stats.total_adjustments == 1);
        assert(stats.parameter_stability < 1.0 && stats.parameter_stability > 0.0);
        assert(testing::near(stats.avg_confidence, 0.7));
        assert(params.getCurrentParameters().values.at("ema_fast") == 18.0);

        core::FixedCalibrationService calibration({{"m1", {0.2, 0.05}}, {"m2", {0.3, 0.07}}});
        assert(calibration.getStatus().total_strategies == 2);
        assert(calibration.getStatus().active_strategies == 2);
        calibration.stop();
        assert(calibration.getStatus().active_strategies == 0);
        assert(calibration.getCalibrationPerformance().size() == 2);

        core::PassiveHotUpdateService hot;
        std::string seen;
        hot.setErrorHandler([&seen](const std::string& e) { seen = e; });
        hot.recordUpdate("patched thresholds");
        assert(hot.getServiceStatus().total_updates == 1);
        hot.reportError("rollback failed");
        assert(seen == "rollback failed");
        hot.stop();
        assert(!hot.getServiceStatus().active);
    }

    std::cout << "[TEST] ReferenceCollaborators PASSED\n";
    return 0;
}
