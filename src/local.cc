#include "local.hh"

#include <thread>

#include "fmt/format.h"

#include "error.hh"
#include "log.hh"

namespace herald {

std::shared_ptr<LocalTransport> LocalBroker::connect() {
    return std::make_shared<LocalTransport>(shared_from_this());
}

uint64_t LocalBroker::publish(const std::string &channel, const std::string &payload) {
    check_reachable();
    std::lock_guard guard(mutex_);
    uint64_t receivers = 0;
    for (auto const &[transport, session] : sessions_) {
        auto const &exact = session.subscriptions.at(ChannelMode::Exact);
        if (exact.find(channel) != exact.end()) {
            session.listener->on_inbound_message({ChannelMode::Exact, channel, payload, {}});
            receivers++;
        }
        // one delivery per matching pattern, the same as the server
        for (auto const &pattern : session.subscriptions.at(ChannelMode::Pattern)) {
            if (glob_match(pattern, channel)) {
                session.listener->on_inbound_message(
                    {ChannelMode::Pattern, channel, payload, pattern});
                receivers++;
            }
        }
    }
    return receivers;
}

uint64_t LocalBroker::spublish(const std::string &channel, const std::string &payload) {
    if (!cluster_) {
        throw InvalidOperationError("Sharded publish requires a cluster server");
    }
    check_reachable();
    std::lock_guard guard(mutex_);
    uint64_t receivers = 0;
    for (auto const &[transport, session] : sessions_) {
        auto const &sharded = session.subscriptions.at(ChannelMode::Sharded);
        if (sharded.find(channel) != sharded.end()) {
            session.listener->on_inbound_message({ChannelMode::Sharded, channel, payload, {}});
            receivers++;
        }
    }
    return receivers;
}

void LocalBroker::kill_connections() {
    log::info("broker", fmt::format("Killing {0} connection(s)", sessions()));
    reconnect_all();
}

void LocalBroker::set_reachable(bool reachable) {
    auto was_reachable = reachable_.exchange(reachable);
    if (was_reachable == reachable) return;
    if (!reachable) {
        std::lock_guard guard(mutex_);
        for (auto &[transport, session] : sessions_) {
            session.subscriptions = empty_subscription_map();
        }
    } else {
        reconnect_all();
    }
}

std::vector<std::string> LocalBroker::pubsub_channels(const std::optional<std::string> &pattern) {
    check_reachable();
    std::lock_guard guard(mutex_);
    std::set<std::string> channels;
    for (auto const &[transport, session] : sessions_) {
        for (auto const &channel : session.subscriptions.at(ChannelMode::Exact)) {
            if (!pattern || glob_match(*pattern, channel)) channels.emplace(channel);
        }
    }
    return {channels.begin(), channels.end()};
}

std::map<std::string, uint64_t> LocalBroker::pubsub_numsub(
    const std::vector<std::string> &channels) {
    check_reachable();
    std::lock_guard guard(mutex_);
    std::map<std::string, uint64_t> result;
    for (auto const &channel : channels) {
        uint64_t count = 0;
        for (auto const &[transport, session] : sessions_) {
            auto const &exact = session.subscriptions.at(ChannelMode::Exact);
            if (exact.find(channel) != exact.end()) count++;
        }
        result[channel] = count;
    }
    return result;
}

uint64_t LocalBroker::pubsub_numpat() {
    check_reachable();
    std::lock_guard guard(mutex_);
    std::set<std::string> patterns;
    for (auto const &[transport, session] : sessions_) {
        auto const &values = session.subscriptions.at(ChannelMode::Pattern);
        patterns.insert(values.begin(), values.end());
    }
    return patterns.size();
}

size_t LocalBroker::sessions() const {
    std::lock_guard guard(mutex_);
    return sessions_.size();
}

void LocalBroker::attach(const LocalTransport *transport, TransportListener *listener) {
    check_reachable();
    std::lock_guard guard(mutex_);
    auto &session = sessions_[transport];
    session.listener = listener;
}

void LocalBroker::detach(const LocalTransport *transport) {
    std::lock_guard guard(mutex_);
    sessions_.erase(transport);
}

void LocalBroker::update(const LocalTransport *transport, ChannelMode mode,
                         const std::vector<std::string> &values, bool subscribe,
                         Transport::Wait wait) {
    if (mode == ChannelMode::Sharded && !cluster_) {
        throw InvalidOperationError("Sharded subscriptions require a cluster server");
    }
    check_reachable();
    {
        std::lock_guard guard(mutex_);
        auto it = sessions_.find(transport);
        if (it == sessions_.end()) {
            throw TransportUnavailableError("Transport is not connected");
        }
        auto &current = it->second.subscriptions[mode];
        if (subscribe) {
            current.insert(values.begin(), values.end());
        } else if (values.empty()) {
            current.clear();
        } else {
            for (auto const &value : values) current.erase(value);
        }
    }
    // the request has been sent, only the acknowledgment is late
    if (!wait) return;
    auto delay = ack_delay_.load();
    if (delay > *wait) {
        std::this_thread::sleep_for(*wait);
        throw TimeoutError(fmt::format("{0} {1} not acknowledged within {2}ms",
                                       subscribe ? "Subscribe" : "Unsubscribe", to_string(mode),
                                       wait->count()));
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
}

SubscriptionMap LocalBroker::subscriptions(const LocalTransport *transport) {
    check_reachable();
    std::lock_guard guard(mutex_);
    auto it = sessions_.find(transport);
    if (it == sessions_.end()) return empty_subscription_map();
    return it->second.subscriptions;
}

void LocalBroker::check_reachable() const {
    if (!reachable_) throw TransportUnavailableError("Server is not reachable");
}

void LocalBroker::reconnect_all() {
    std::lock_guard guard(mutex_);
    for (auto &[transport, session] : sessions_) {
        session.subscriptions = empty_subscription_map();
        session.listener->on_reconnected();
    }
}

LocalTransport::~LocalTransport() { broker_->detach(this); }

void LocalTransport::connect(TransportListener *listener) { broker_->attach(this, listener); }

void LocalTransport::disconnect() { broker_->detach(this); }

void LocalTransport::subscribe(ChannelMode mode, const std::vector<std::string> &values,
                               Wait wait) {
    broker_->update(this, mode, values, true, wait);
}

void LocalTransport::unsubscribe(ChannelMode mode, const std::vector<std::string> &values,
                                 Wait wait) {
    broker_->update(this, mode, values, false, wait);
}

uint64_t LocalTransport::publish(const std::string &channel, const std::string &payload) {
    return broker_->publish(channel, payload);
}

uint64_t LocalTransport::spublish(const std::string &channel, const std::string &payload) {
    return broker_->spublish(channel, payload);
}

SubscriptionMap LocalTransport::server_subscriptions() { return broker_->subscriptions(this); }

std::vector<std::string> LocalTransport::pubsub_channels(
    const std::optional<std::string> &pattern) {
    return broker_->pubsub_channels(pattern);
}

std::map<std::string, uint64_t> LocalTransport::pubsub_numsub(
    const std::vector<std::string> &channels) {
    return broker_->pubsub_numsub(channels);
}

uint64_t LocalTransport::pubsub_numpat() { return broker_->pubsub_numpat(); }

}  // namespace herald
