#pragma once

#include <stdexcept>
#include <string>

namespace sentinel {

class SentinelError : public std::runtime_error {
public:
    explicit SentinelError(const std::string& msg) : std::runtime_error(msg) {}
};

// Startup wiring failed; the harness is unusable
class InitializationError : public SentinelError {
public:
    explicit InitializationError(const std::string& msg)
        : SentinelError("Initialization failed: " + msg) {}
};

// Query issued before initialize() completed
class NotInitializedError : public SentinelError {
public:
    explicit NotInitializedError(const std::string& what)
        : SentinelError("Harness not initialized: " + what) {}
};

class BenchmarkRunError : public SentinelError {
public:
    explicit BenchmarkRunError(const std::string& msg)
        : SentinelError("Benchmark run failed: " + msg) {}
};

// A previous run of the same scheduler has not finished yet
class BenchmarkInFlightError : public SentinelError {
public:
    BenchmarkInFlightError()
        : SentinelError("Benchmark run already in flight") {}
};

class ConfigError : public SentinelError {
public:
    explicit ConfigError(const std::string& msg)
        : SentinelError("Config error: " + msg) {}
};

} // namespace sentinel
