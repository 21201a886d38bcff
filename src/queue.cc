#include "queue.hh"

#include "fmt/format.h"

#include "error.hh"
#include "log.hh"

namespace herald {

std::optional<Message> MessageQueue::try_get() {
    std::lock_guard guard(mutex_);
    if (messages_.empty()) return std::nullopt;
    auto message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

Message MessageQueue::get(const CancellationToken &token) {
    auto message = wait_next(token);
    if (message) return std::move(*message);
    if (token.cancelled()) throw CancelledError("Message retrieval cancelled");
    throw InvalidOperationError("Message queue is closed");
}

std::future<Message> MessageQueue::get_async(const CancellationToken &token) {
    return std::async(std::launch::async,
                      [self = shared_from_this(), token]() { return self->get(token); });
}

uint64_t MessageQueue::get_messages(const CancellationToken &token,
                                    const std::function<void(const Message &)> &callback) {
    uint64_t count = 0;
    while (auto message = wait_next(token)) {
        callback(*message);
        count++;
    }
    return count;
}

std::optional<Message> MessageQueue::wait_next(const CancellationToken &token) {
    if (token.cancelled()) return std::nullopt;
    // the callback takes the queue lock so the wakeup cannot slip in between the
    // predicate check and the wait. the registration outlives the lock
    CancellationRegistration registration(token, [this]() {
        std::lock_guard guard(mutex_);
        cond_.notify_all();
    });
    std::unique_lock lock(mutex_);
    cond_.wait(lock, [&]() { return !messages_.empty() || closed_ || token.cancelled(); });
    if (token.cancelled() || messages_.empty()) return std::nullopt;
    auto message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

void MessageQueue::enqueue(Message message) {
    bool dropped = false;
    {
        std::lock_guard guard(mutex_);
        if (max_size_ > 0 && messages_.size() >= max_size_) {
            messages_.pop_front();
            dropped_++;
            dropped = true;
        }
        messages_.emplace_back(std::move(message));
    }
    cond_.notify_one();
    if (dropped) {
        log::warn("queue", fmt::format("Queue is full ({0} messages), dropped the oldest message",
                                       max_size_));
    }
}

void MessageQueue::close() {
    {
        std::lock_guard guard(mutex_);
        closed_ = true;
    }
    cond_.notify_all();
}

bool MessageQueue::closed() const {
    std::lock_guard guard(mutex_);
    return closed_;
}

size_t MessageQueue::size() const {
    std::lock_guard guard(mutex_);
    return messages_.size();
}

uint64_t MessageQueue::dropped() const {
    std::lock_guard guard(mutex_);
    return dropped_;
}

}  // namespace herald
