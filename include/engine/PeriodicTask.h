#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sentinel {
namespace engine {

// Fires `callback` every `interval` on a dedicated worker thread until cancelled.
// The first tick happens one interval after start().
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // false if already started or cancelled
    bool start();

    // Idempotent and non-blocking; a tick already executing runs to completion
    void cancel();

    bool isArmed() const { return state_->started && !state_->cancelled; }
    bool isCancelled() const { return state_->cancelled; }
    std::uint64_t tickCount() const { return state_->tick_count; }
    const std::string& name() const { return state_->name; }

private:
    // Shared with the worker so a detached worker never touches a destroyed task
    struct State {
        std::string name;
        std::chrono::milliseconds interval;
        Callback callback;

        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> started{false};
        std::atomic<bool> cancelled{false};
        std::atomic<std::uint64_t> tick_count{0};
    };

    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace engine
} // namespace sentinel
