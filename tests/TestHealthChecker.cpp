#include "engine/HealthChecker.h"
#include "TestStubs.h"

#include <cassert>
#include <functional>
#include <iostream>

using namespace sentinel;
using engine::ComponentStatus;

int main() {
    // Aggregation rule: any CRITICAL wins, then any WARNING, else HEALTHY
    {
        std::map<std::string, ComponentStatus> c = {
            {"a", ComponentStatus::HEALTHY}, {"b", ComponentStatus::HEALTHY}
        };
        assert(engine::aggregateStatus(c) == ComponentStatus::HEALTHY);
        c["b"] = ComponentStatus::WARNING;
        assert(engine::aggregateStatus(c) == ComponentStatus::WARNING);
        c["a"] = ComponentStatus::CRITICAL;
        assert(engine::aggregateStatus(c) == ComponentStatus::CRITICAL);
    }

    // Initial record lists all five components as HEALTHY
    {
        const auto initial = engine::makeInitialHealth();
        assert(initial.components.size() == 5);
        assert(initial.overall == ComponentStatus::HEALTHY);
        assert(initial.components.count(engine::component::ADAPTIVE_STRATEGY) == 1);
    }

    // One failing probe: that component CRITICAL, the others still probed and HEALTHY
    {
        testing::StubSet stubs;
        core::EventBus events;
        engine::RequestMetricsRecorder metrics;
        std::vector<core::ErrorEvent> errors;
        events.onError([&errors](const core::ErrorEvent& e) { errors.push_back(e); });

        engine::HealthChecker checker(stubs.collaborators(), events, metrics, 7);
        stubs.analyzer->fail = true;

        metrics.recordRequest(10.0);
        metrics.recordRequest(30.0, true);
        checker.checkHealth();

        auto health = checker.snapshot();
        assert(health.overall == ComponentStatus::CRITICAL);
        assert(health.components[engine::component::MARKET_STATE_ANALYZER] == ComponentStatus::CRITICAL);
        assert(health.components[engine::component::PARAMETER_MANAGER] == ComponentStatus::HEALTHY);
        assert(health.components[engine::component::CALIBRATION_SERVICE] == ComponentStatus::HEALTHY);
        assert(health.components[engine::component::HOT_UPDATE_SERVICE] == ComponentStatus::HEALTHY);
        assert(health.components[engine::component::ADAPTIVE_STRATEGY] == ComponentStatus::HEALTHY);

        assert(stubs.analyzer->calls == 1);
        assert(stubs.parameters->calls == 1);
        assert(stubs.calibration->calls == 1);
        assert(stubs.hot_update->calls == 1);
        assert(stubs.strategy->calls == 1);

        assert(health.metrics.error_rate == 0.5);
        assert(health.metrics.avg_response_time_ms == 20.0);
        assert(health.metrics.memory_usage >= 0.0 && health.metrics.memory_usage <= 1.0);
        assert(health.metrics.uptime_ms >= 0);
        assert(health.last_check > 0);
        assert(health.probe_duration_ms.size() == 5);

        assert(errors.size() == 1);
        assert(*errors[0].component == engine::component::MARKET_STATE_ANALYZER);
        assert(errors[0].error == "analyzer offline");
        assert(*errors[0].context == "health_check");

        // Health-probe failures are not counted as request errors
        assert(metrics.snapshot().error_count == 1);

        // Recovery on the next tick
        stubs.analyzer->fail = false;
        checker.checkHealth();
        health = checker.snapshot();
        assert(health.overall == ComponentStatus::HEALTHY);
        assert(errors.size() == 1);
    }

    // Each component failing on its own: only it goes CRITICAL, one ERROR event
    {
        testing::StubSet stubs;
        const std::vector<std::pair<std::string, std::function<void(bool)>>> probes = {
            {engine::component::MARKET_STATE_ANALYZER, [&stubs](bool f) { stubs.analyzer->fail = f; }},
            {engine::component::PARAMETER_MANAGER, [&stubs](bool f) { stubs.parameters->fail = f; }},
            {engine::component::CALIBRATION_SERVICE, [&stubs](bool f) { stubs.calibration->fail = f; }},
            {engine::component::HOT_UPDATE_SERVICE, [&stubs](bool f) { stubs.hot_update->fail = f; }},
            {engine::component::ADAPTIVE_STRATEGY, [&stubs](bool f) { stubs.strategy->fail = f; }},
        };

        for (const auto& failing : probes) {
            core::EventBus events;
            engine::RequestMetricsRecorder metrics;
            std::vector<core::ErrorEvent> errors;
            events.onError([&errors](const core::ErrorEvent& e) { errors.push_back(e); });
            engine::HealthChecker checker(stubs.collaborators(), events, metrics, 11);

            failing.second(true);
            checker.checkHealth();
            failing.second(false);

            auto health = checker.snapshot();
            assert(health.overall == ComponentStatus::CRITICAL);
            for (const auto& other : probes) {
                const auto expected = other.first == failing.first
                    ? ComponentStatus::CRITICAL : ComponentStatus::HEALTHY;
                assert(health.components[other.first] == expected);
            }
            assert(errors.size() == 1);
            assert(*errors[0].component == failing.first);
        }

        // All five down in the same tick
        core::EventBus events;
        engine::RequestMetricsRecorder metrics;
        std::vector<core::ErrorEvent> errors;
        events.onError([&errors](const core::ErrorEvent& e) { errors.push_back(e); });
        engine::HealthChecker checker(stubs.collaborators(), events, metrics, 11);
        for (const auto& p : probes) p.second(true);
        checker.checkHealth();
        for (const auto& p : probes) p.second(false);

        auto health = checker.snapshot();
        assert(health.overall == ComponentStatus::CRITICAL);
        for (const auto& p : probes) {
            assert(health.components[p.first] == ComponentStatus::CRITICAL);
        }
        assert(errors.size() == 5);
    }

    // A component throwing a non-standard type is contained like any other failure
    {
        testing::StubSet stubs;
        core::EventBus events;
        engine::RequestMetricsRecorder metrics;
        std::vector<core::ErrorEvent> errors;
        events.onError([&errors](const core::ErrorEvent& e) { errors.push_back(e); });
        engine::HealthChecker checker(stubs.collaborators(), events, metrics, 7);
        stubs.analyzer->fail_unknown = true;

        checker.checkHealth();

        assert(stubs.parameters->calls == 1);
        assert(stubs.calibration->calls == 1);
        assert(stubs.hot_update->calls == 1);
        assert(stubs.strategy->calls == 1);
        const auto health = checker.snapshot();
        assert(health.overall == ComponentStatus::CRITICAL);
        assert(health.components.at(engine::component::MARKET_STATE_ANALYZER) == ComponentStatus::CRITICAL);
        assert(errors.size() == 1);
        assert(errors[0].error == "unknown error");
    }

    // Market-state probe is fed 100 synthetic hourly bars
    {
        testing::StubSet stubs;
        core::EventBus events;
        engine::RequestMetricsRecorder metrics;
        engine::HealthChecker checker(stubs.collaborators(), events, metrics, 7);
        checker.checkHealth();
        assert(stubs.analyzer->last_bar_count == static_cast<size_t>(engine::HealthChecker::PROBE_BAR_COUNT));
    }

    // Snapshots are copies
    {
        testing::StubSet stubs;
        core::EventBus events;
        engine::RequestMetricsRecorder metrics;
        engine::HealthChecker checker(stubs.collaborators(), events, metrics, 7);

        auto copy = checker.snapshot();
        copy.components[engine::component::PARAMETER_MANAGER] = ComponentStatus::CRITICAL;
        copy.overall = ComponentStatus::CRITICAL;
        assert(checker.snapshot().overall == ComponentStatus::HEALTHY);

        checker.markComponent(engine::component::HOT_UPDATE_SERVICE, ComponentStatus::WARNING);
        assert(checker.snapshot().overall == ComponentStatus::WARNING);
    }

    std::cout << "[TEST] HealthChecker PASSED\n";
    return 0;
}
