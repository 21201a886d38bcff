#include "registry.hh"

#include <algorithm>

#include "fmt/format.h"

#include "error.hh"

namespace herald {

const char *to_string(DeliveryMode mode) {
    switch (mode) {
        case DeliveryMode::Unresolved:
            return "Unresolved";
        case DeliveryMode::Handler:
            return "Handler";
        case DeliveryMode::Queue:
            return "Queue";
    }
    return "Unknown";
}

SubscriptionRegistry::SubscriptionRegistry(DeliveryMode mode)
    : delivery_mode_(mode), pattern_matches_(pattern_cache_size) {
    for (auto channel_mode : all_channel_modes) entries_[channel_mode];
}

void SubscriptionRegistry::add(const ChannelAddress &address, const HandlerPtr &handler) {
    std::lock_guard guard(mutex_);
    auto wanted = handler ? DeliveryMode::Handler : DeliveryMode::Queue;
    if (delivery_mode_ != DeliveryMode::Unresolved && delivery_mode_ != wanted) {
        throw InvalidModeError(fmt::format(
            "Cannot subscribe {0} with {1} delivery: the client already uses {2} delivery",
            address.str(), to_string(wanted), to_string(delivery_mode_)));
    }
    delivery_mode_ = wanted;

    auto &entries = entries_[address.mode()];
    auto inserted = entries.find(address.value()) == entries.end();
    auto &entry = entries[address.value()];
    if (handler) {
        auto it = std::find(entry.handlers.begin(), entry.handlers.end(), handler);
        if (it == entry.handlers.end()) entry.handlers.emplace_back(handler);
    } else {
        entry.has_queue_consumer = true;
    }
    if (inserted && address.mode() == ChannelMode::Pattern) pattern_matches_.clear();
}

bool SubscriptionRegistry::remove(const ChannelAddress &address, const HandlerPtr &handler) {
    std::lock_guard guard(mutex_);
    auto &entries = entries_[address.mode()];
    auto it = entries.find(address.value());
    if (it == entries.end()) return false;
    auto &entry = it->second;
    if (handler) {
        auto pos = std::find(entry.handlers.begin(), entry.handlers.end(), handler);
        if (pos == entry.handlers.end()) return false;
        entry.handlers.erase(pos);
    } else {
        entry.handlers.clear();
        entry.has_queue_consumer = false;
    }
    if (!entry.empty()) return false;
    entries.erase(it);
    if (address.mode() == ChannelMode::Pattern) pattern_matches_.clear();
    return true;
}

std::vector<ChannelAddress> SubscriptionRegistry::clear() {
    std::vector<ChannelAddress> result;
    for (auto mode : all_channel_modes) {
        auto removed = clear(mode);
        result.insert(result.end(), removed.begin(), removed.end());
    }
    return result;
}

std::vector<ChannelAddress> SubscriptionRegistry::clear(ChannelMode mode) {
    std::lock_guard guard(mutex_);
    std::vector<ChannelAddress> result;
    auto &entries = entries_[mode];
    result.reserve(entries.size());
    for (auto const &[value, entry] : entries) result.emplace_back(mode, value);
    entries.clear();
    if (mode == ChannelMode::Pattern) pattern_matches_.clear();
    return result;
}

SubscriptionMap SubscriptionRegistry::snapshot() const {
    std::lock_guard guard(mutex_);
    auto result = empty_subscription_map();
    for (auto const &[mode, entries] : entries_) {
        for (auto const &[value, entry] : entries) result[mode].emplace(value);
    }
    return result;
}

bool SubscriptionRegistry::contains(const ChannelAddress &address) const {
    std::lock_guard guard(mutex_);
    auto const &entries = entries_.at(address.mode());
    return entries.find(address.value()) != entries.end();
}

std::optional<SubscriptionEntry> SubscriptionRegistry::entry(const ChannelAddress &address) const {
    std::lock_guard guard(mutex_);
    auto const &entries = entries_.at(address.mode());
    auto it = entries.find(address.value());
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

size_t SubscriptionRegistry::size() const {
    std::lock_guard guard(mutex_);
    size_t result = 0;
    for (auto const &[mode, entries] : entries_) result += entries.size();
    return result;
}

std::vector<MatchedConsumers> SubscriptionRegistry::match(
    const std::string &channel, ChannelMode kind, const std::optional<std::string> &pattern) {
    std::lock_guard guard(mutex_);
    if (kind != ChannelMode::Pattern) return lookup(kind, channel);
    if (pattern) return lookup(ChannelMode::Pattern, *pattern);

    std::vector<MatchedConsumers> result;
    for (auto const &value : matching_patterns(channel)) {
        auto matched = lookup(ChannelMode::Pattern, value);
        result.insert(result.end(), matched.begin(), matched.end());
    }
    return result;
}

DeliveryMode SubscriptionRegistry::delivery_mode() const {
    std::lock_guard guard(mutex_);
    return delivery_mode_;
}

void SubscriptionRegistry::require_queue_mode() {
    std::lock_guard guard(mutex_);
    if (delivery_mode_ == DeliveryMode::Handler) {
        throw InvalidOperationError(
            "The message queue is not available: messages are delivered to handlers");
    }
    delivery_mode_ = DeliveryMode::Queue;
}

std::vector<MatchedConsumers> SubscriptionRegistry::lookup(ChannelMode mode,
                                                           const std::string &value) const {
    auto const &entries = entries_.at(mode);
    auto it = entries.find(value);
    if (it == entries.end()) return {};
    auto const &entry = it->second;
    return {MatchedConsumers{ChannelAddress(mode, value), entry.handlers,
                             entry.has_queue_consumer}};
}

std::vector<std::string> SubscriptionRegistry::matching_patterns(const std::string &channel) {
    if (auto const *cached = pattern_matches_.find(channel)) return *cached;
    std::vector<std::string> result;
    for (auto const &[value, entry] : entries_.at(ChannelMode::Pattern)) {
        if (glob_match(value, channel)) result.emplace_back(value);
    }
    pattern_matches_.put(channel, result);
    return result;
}

}  // namespace herald
