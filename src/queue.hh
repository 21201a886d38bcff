#ifndef HERALD_QUEUE_HH
#define HERALD_QUEUE_HH

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

#include "cancellation.hh"
#include "message.hh"

namespace herald {

// per client FIFO of messages for queue mode consumers. any number of threads
// may retrieve concurrently, each message goes to exactly one of them.
// get_async keeps the queue alive until its waiter returns, so the queue has to
// be owned by a shared_ptr
class MessageQueue : public std::enable_shared_from_this<MessageQueue> {
public:
    // 0 means unbounded
    explicit MessageQueue(size_t max_size = 0) : max_size_(max_size) {}

    std::optional<Message> try_get();
    Message get(const CancellationToken &token = CancellationToken::none());
    std::future<Message> get_async(const CancellationToken &token = CancellationToken::none());
    // hands every message to the callback as it arrives, until the token is
    // cancelled or the queue is closed and empty. returns how many were handed
    // over
    uint64_t get_messages(const CancellationToken &token,
                          const std::function<void(const Message &)> &callback);

    // never blocks. a bounded queue drops its oldest message when full
    void enqueue(Message message);

    // wakes every blocked retriever. once the remaining messages are taken,
    // get() throws InvalidOperationError
    void close();
    [[nodiscard]] bool closed() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t max_size() const { return max_size_; }
    [[nodiscard]] uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Message> messages_;
    size_t max_size_;
    uint64_t dropped_ = 0;
    bool closed_ = false;

    // nullopt once cancelled, or closed with nothing left
    std::optional<Message> wait_next(const CancellationToken &token);
};

}  // namespace herald

#endif  // HERALD_QUEUE_HH
