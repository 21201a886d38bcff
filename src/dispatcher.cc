#include "dispatcher.hh"

#include "fmt/format.h"

#include "log.hh"

namespace herald {

Dispatcher::Dispatcher(std::shared_ptr<SubscriptionRegistry> registry, SerialExecutor &executor,
                       size_t max_queue_size)
    : registry_(std::move(registry)), executor_(executor), max_queue_size_(max_queue_size) {}

void Dispatcher::on_message(InboundMessage message) {
    auto accepted = executor_.dispatch(
        [self = shared_from_this(), message = std::move(message)]() { self->deliver(message); });
    if (!accepted) {
        log::debug("dispatcher", "Client is closed, inbound message ignored");
    }
}

void Dispatcher::deliver(const InboundMessage &message) {
    auto matches = registry_->match(message.channel, message.kind, message.pattern);
    if (matches.empty()) {
        log::trace("dispatcher",
                   fmt::format("No registration for {0} message on {1}",
                               to_string(message.kind), message.channel));
        return;
    }
    for (auto const &match : matches) {
        std::optional<std::string> pattern;
        if (match.address.mode() == ChannelMode::Pattern) pattern = match.address.value();
        Message envelope(message.channel, message.payload, pattern);

        for (auto const &handler : match.handlers) {
            try {
                handler->on_message(envelope);
            } catch (const std::exception &ex) {
                report(envelope, ex.what());
            } catch (...) {
                report(envelope, "unknown exception");
            }
        }
        if (match.has_queue_consumer) {
            queue()->enqueue(envelope);
        }
    }
}

std::shared_ptr<MessageQueue> Dispatcher::queue() {
    std::lock_guard guard(mutex_);
    if (!queue_) queue_ = std::make_shared<MessageQueue>(max_queue_size_);
    return queue_;
}

bool Dispatcher::has_queue() const {
    std::lock_guard guard(mutex_);
    return queue_ != nullptr;
}

void Dispatcher::set_error_hook(ConsumerErrorHook hook) {
    std::lock_guard guard(mutex_);
    error_hook_ = std::move(hook);
}

void Dispatcher::report(const Message &message, const std::string &reason) {
    log::error("dispatcher", fmt::format("Handler failed on channel {0}: {1}", message.channel(),
                                         reason));
    ConsumerErrorHook hook;
    {
        std::lock_guard guard(mutex_);
        hook = error_hook_;
    }
    if (!hook) return;
    ConsumerError error{message.channel(), message.pattern().value_or(""), reason};
    try {
        hook(error);
    } catch (const std::exception &ex) {
        log::error("dispatcher", fmt::format("Consumer error hook failed: {0}", ex.what()));
    } catch (...) {
        log::error("dispatcher", "Consumer error hook failed with an unknown exception");
    }
}

}  // namespace herald
