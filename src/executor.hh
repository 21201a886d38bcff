#ifndef HERALD_EXECUTOR_HH
#define HERALD_EXECUTOR_HH

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace herald {

// runs tasks one at a time, in submission order, on a single worker thread.
// the executor may be destroyed by the task it is running; the worker then
// finishes that task and exits on its own
class SerialExecutor {
public:
    explicit SerialExecutor(std::string name);
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor &) = delete;
    SerialExecutor &operator=(const SerialExecutor &) = delete;

    // returns false once the executor is finished
    bool dispatch(std::function<void()> task);

    // waits until every task dispatched so far has run. false on timeout
    bool flush(std::chrono::milliseconds timeout);

    // stops accepting tasks, runs what is queued within the timeout and
    // discards the rest. returns the number of discarded tasks. on the worker
    // thread nothing can be waited for, so every queued task is discarded
    size_t finish(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t pending() const;
    [[nodiscard]] bool on_worker_thread() const;

private:
    struct State {
        explicit State(std::string name) : name(std::move(name)) {}

        std::string name;
        std::mutex mutex;
        std::condition_variable task_cond;
        std::condition_variable idle_cond;
        std::deque<std::function<void()>> tasks;
        // queued plus running
        size_t pending = 0;
        bool stopped = false;
        bool finished = false;
    };

    std::shared_ptr<State> state_;
    std::thread worker_;

    static void run(const std::shared_ptr<State> &state);
};

}  // namespace herald

#endif  // HERALD_EXECUTOR_HH
