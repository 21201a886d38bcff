#ifndef HERALD_CANCELLATION_HH
#define HERALD_CANCELLATION_HH

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace herald {

// copies share one state; cancelling any copy cancels all of them
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    [[nodiscard]] bool cancelled() const;

    // runs the callback on cancellation, or right away if already cancelled.
    // the returned id is used to deregister it
    uint64_t on_cancel(std::function<void()> callback);
    // once this returns the callback is not running and never will. waits for
    // it when another thread is running it
    void remove_callback(uint64_t id);

    // a token that is never cancelled
    static CancellationToken none() { return CancellationToken(); }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cond;
        bool cancelled = false;
        uint64_t next_id = 0;
        std::map<uint64_t, std::function<void()>> callbacks;
        // the callback cancel() is running, and on which thread
        std::optional<uint64_t> running;
        std::thread::id runner;
    };
    std::shared_ptr<State> state_;
};

// keeps a cancellation callback registered for the lifetime of a scope
class CancellationRegistration {
public:
    CancellationRegistration(CancellationToken token, std::function<void()> callback)
        : token_(std::move(token)), id_(token_.on_cancel(std::move(callback))) {}
    ~CancellationRegistration() { token_.remove_callback(id_); }

    CancellationRegistration(const CancellationRegistration &) = delete;
    CancellationRegistration &operator=(const CancellationRegistration &) = delete;

private:
    CancellationToken token_;
    uint64_t id_;
};

}  // namespace herald

#endif  // HERALD_CANCELLATION_HH
