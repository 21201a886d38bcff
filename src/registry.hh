#ifndef HERALD_REGISTRY_HH
#define HERALD_REGISTRY_HH

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "channel.hh"
#include "handler.hh"
#include "match_cache.hh"

namespace herald {

// a client consumes either through handlers or through its queue. the first
// registration decides and the choice is kept for the lifetime of the client
enum class DeliveryMode { Unresolved, Handler, Queue };

const char *to_string(DeliveryMode mode);

struct SubscriptionEntry {
    // insertion ordered, compared by identity
    std::vector<HandlerPtr> handlers;
    bool has_queue_consumer = false;

    [[nodiscard]] bool empty() const { return handlers.empty() && !has_queue_consumer; }
};

// consumers of one registration that matched an inbound message
struct MatchedConsumers {
    ChannelAddress address;
    std::vector<HandlerPtr> handlers;
    bool has_queue_consumer = false;
};

class SubscriptionRegistry {
public:
    explicit SubscriptionRegistry(DeliveryMode mode = DeliveryMode::Unresolved);

    // a null handler registers the queue consumer. throws InvalidModeError when
    // the delivery mode is already fixed to the other kind
    void add(const ChannelAddress &address, const HandlerPtr &handler = nullptr);
    // a null handler removes every consumer of the address. returns true when
    // the entry disappeared with this call
    bool remove(const ChannelAddress &address, const HandlerPtr &handler = nullptr);
    // returns the addresses that were removed
    std::vector<ChannelAddress> clear();
    std::vector<ChannelAddress> clear(ChannelMode mode);

    [[nodiscard]] SubscriptionMap snapshot() const;
    [[nodiscard]] bool contains(const ChannelAddress &address) const;
    [[nodiscard]] std::optional<SubscriptionEntry> entry(const ChannelAddress &address) const;
    [[nodiscard]] size_t size() const;

    // consumers for a message of the given kind. pattern messages that name
    // their pattern go to that registration only, otherwise every registered
    // pattern is tried against the channel
    std::vector<MatchedConsumers> match(const std::string &channel, ChannelMode kind,
                                        const std::optional<std::string> &pattern = std::nullopt);

    [[nodiscard]] DeliveryMode delivery_mode() const;
    // fixes queue mode on an unresolved registry. throws InvalidOperationError
    // when handler mode is already fixed
    void require_queue_mode();

private:
    mutable std::mutex mutex_;
    std::map<ChannelMode, std::map<std::string, SubscriptionEntry>> entries_;
    DeliveryMode delivery_mode_;
    lru_cache<std::string, std::vector<std::string>> pattern_matches_;

    static constexpr size_t pattern_cache_size = 1024;

    std::vector<MatchedConsumers> lookup(ChannelMode mode, const std::string &value) const;
    std::vector<std::string> matching_patterns(const std::string &channel);
};

}  // namespace herald

#endif  // HERALD_REGISTRY_HH
