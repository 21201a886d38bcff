#ifndef HERALD_DISPATCHER_HH
#define HERALD_DISPATCHER_HH

#include <functional>
#include <memory>
#include <mutex>

#include "error.hh"
#include "executor.hh"
#include "message.hh"
#include "queue.hh"
#include "registry.hh"

namespace herald {

using ConsumerErrorHook = std::function<void(const ConsumerError &)>;

// routes inbound messages to the consumers the registry resolves for them.
// the transport side only enqueues, delivery happens on the executor. a queued
// delivery keeps the dispatcher alive, so a handler may release the client that
// owns it
class Dispatcher : public std::enable_shared_from_this<Dispatcher> {
public:
    Dispatcher(std::shared_ptr<SubscriptionRegistry> registry, SerialExecutor &executor,
               size_t max_queue_size = 0);

    void on_message(InboundMessage message);
    // delivers on the calling thread
    void deliver(const InboundMessage &message);

    // created on first use
    std::shared_ptr<MessageQueue> queue();
    [[nodiscard]] bool has_queue() const;

    void set_error_hook(ConsumerErrorHook hook);

private:
    std::shared_ptr<SubscriptionRegistry> registry_;
    SerialExecutor &executor_;
    size_t max_queue_size_;

    mutable std::mutex mutex_;
    std::shared_ptr<MessageQueue> queue_;
    ConsumerErrorHook error_hook_;

    void report(const Message &message, const std::string &reason);
};

}  // namespace herald

#endif  // HERALD_DISPATCHER_HH
