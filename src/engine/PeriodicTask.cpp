#include "engine/PeriodicTask.h"
#include "common/Logger.h"

#include <exception>

namespace sentinel {
namespace engine {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : state_(std::make_shared<State>())
{
    state_->name = std::move(name);
    state_->interval = interval;
    state_->callback = std::move(callback);
}

PeriodicTask::~PeriodicTask() {
    cancel();
    if (worker_thread_ && worker_thread_->joinable()) {
        if (worker_thread_->get_id() == std::this_thread::get_id()) {
            // destroyed from inside its own tick; the worker exits after the tick
            worker_thread_->detach();
        } else {
            worker_thread_->join();
        }
    }
}

bool PeriodicTask::start() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->started || state_->cancelled) {
        return false;
    }
    state_->started = true;
    worker_thread_ = std::make_unique<std::thread>(&PeriodicTask::run, state_);
    LOG_INFO("Timer '{}' armed (interval {}ms)", state_->name, state_->interval.count());
    return true;
}

void PeriodicTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
    }
    state_->cv.notify_all();
    if (state_->started) {
        LOG_INFO("Timer '{}' cancelled", state_->name);
    }
}

void PeriodicTask::run(std::shared_ptr<State> state) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (state->cv.wait_for(lock, state->interval, [&state] { return state->cancelled.load(); })) {
                break;
            }
        }

        state->tick_count++;
        try {
            state->callback();
        } catch (const std::exception& e) {
            LOG_ERROR("Timer '{}' tick failed: {}", state->name, e.what());
        } catch (...) {
            LOG_ERROR("Timer '{}' tick failed: unknown error", state->name);
        }
    }
}

} // namespace engine
} // namespace sentinel
