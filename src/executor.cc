#include "executor.hh"

#include "fmt/format.h"

#include "error.hh"
#include "log.hh"

namespace herald {

SerialExecutor::SerialExecutor(std::string name)
    : state_(std::make_shared<State>(std::move(name))) {
    worker_ = std::thread([state = state_]() { run(state); });
}

SerialExecutor::~SerialExecutor() {
    if (worker_.joinable()) finish(std::chrono::milliseconds(0));
}

bool SerialExecutor::dispatch(std::function<void()> task) {
    {
        std::lock_guard guard(state_->mutex);
        if (state_->stopped) return false;
        state_->tasks.emplace_back(std::move(task));
        state_->pending++;
    }
    state_->task_cond.notify_one();
    return true;
}

bool SerialExecutor::flush(std::chrono::milliseconds timeout) {
    if (on_worker_thread()) {
        throw InvalidOperationError(fmt::format(
            "{0}: cannot wait for pending tasks from the worker thread", state_->name));
    }
    std::unique_lock lock(state_->mutex);
    return state_->idle_cond.wait_for(lock, timeout, [this]() { return state_->pending == 0; });
}

size_t SerialExecutor::finish(std::chrono::milliseconds timeout) {
    auto self = on_worker_thread();
    size_t discarded = 0;
    {
        std::unique_lock lock(state_->mutex);
        if (state_->finished) return 0;
        state_->stopped = true;
        // the running task counts as pending, so the worker cannot wait for itself
        auto idle = !self && state_->idle_cond.wait_for(lock, timeout, [this]() {
            return state_->pending == 0;
        });
        if (!idle) {
            discarded = state_->tasks.size();
            state_->pending -= discarded;
            state_->tasks.clear();
        }
        state_->finished = true;
    }
    state_->task_cond.notify_all();
    if (self) {
        worker_.detach();
    } else {
        worker_.join();
    }
    if (discarded > 0) {
        log::warn(state_->name,
                  fmt::format("Shutdown {0}, discarded {1} pending task(s)",
                              self ? "from the worker thread" : "timed out", discarded));
    }
    return discarded;
}

size_t SerialExecutor::pending() const {
    std::lock_guard guard(state_->mutex);
    return state_->pending;
}

bool SerialExecutor::on_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialExecutor::run(const std::shared_ptr<State> &state) {
    log::debug(state->name, "Worker thread started");
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(state->mutex);
            state->task_cond.wait(lock, [&]() { return !state->tasks.empty() || state->finished; });
            if (state->tasks.empty()) break;
            task = std::move(state->tasks.front());
            state->tasks.pop_front();
        }
        try {
            task();
        } catch (const std::exception &ex) {
            log::error(state->name, fmt::format("Task failed: {0}", ex.what()));
        } catch (...) {
            log::error(state->name, "Task failed with an unknown exception");
        }
        // captures may own the executor, release them before touching the state
        task = nullptr;
        {
            std::lock_guard guard(state->mutex);
            state->pending--;
        }
        state->idle_cond.notify_all();
    }
    log::debug(state->name, "Worker thread stopped");
}

}  // namespace herald
