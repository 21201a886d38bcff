#include "cancellation.hh"

#include <limits>

namespace herald {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    std::unique_lock lock(state_->mutex);
    if (state_->cancelled) return;
    state_->cancelled = true;
    state_->runner = std::this_thread::get_id();
    // one at a time, outside the lock so a callback may touch the token again
    while (!state_->callbacks.empty()) {
        auto it = state_->callbacks.begin();
        auto callback = std::move(it->second);
        state_->running = it->first;
        state_->callbacks.erase(it);
        lock.unlock();
        callback();
        lock.lock();
        state_->running.reset();
        state_->cond.notify_all();
    }
}

bool CancellationToken::cancelled() const {
    std::lock_guard guard(state_->mutex);
    return state_->cancelled;
}

uint64_t CancellationToken::on_cancel(std::function<void()> callback) {
    {
        std::lock_guard guard(state_->mutex);
        auto id = state_->next_id++;
        if (!state_->cancelled) {
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    // nothing to deregister
    return std::numeric_limits<uint64_t>::max();
}

void CancellationToken::remove_callback(uint64_t id) {
    std::unique_lock lock(state_->mutex);
    state_->callbacks.erase(id);
    // a callback removing itself cannot wait for itself
    state_->cond.wait(lock, [&]() {
        return state_->running != id || state_->runner == std::this_thread::get_id();
    });
}

}  // namespace herald
