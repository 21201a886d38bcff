#ifndef HERALD_CONFIG_HH
#define HERALD_CONFIG_HH

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "channel.hh"
#include "handler.hh"

namespace herald {

struct NodeAddress {
    static constexpr uint16_t default_port = 6379;

    std::string host;
    uint16_t port = default_port;

    [[nodiscard]] std::string str() const;
    // "host", "host:port" or "[v6 address]:port". throws ConfigError
    static NodeAddress parse(const std::string &value);

    bool operator==(const NodeAddress &other) const {
        return host == other.host && port == other.port;
    }
};

struct SubscriptionDeclaration {
    ChannelAddress address;
    // null means the default callback, or the queue when there is none
    HandlerPtr handler;
};

// subscriptions established while the client is constructed
class SubscriptionConfig {
public:
    SubscriptionConfig &with_channel(const std::string &channel, HandlerPtr handler = nullptr);
    SubscriptionConfig &with_pattern(const std::string &pattern, HandlerPtr handler = nullptr);
    SubscriptionConfig &with_sharded_channel(const std::string &channel,
                                             HandlerPtr handler = nullptr);
    SubscriptionConfig &with_subscription(ChannelMode mode, const std::string &value,
                                          HandlerPtr handler = nullptr);
    // receives every message of entries declared without a handler
    SubscriptionConfig &with_callback(HandlerPtr handler);

    [[nodiscard]] const std::vector<SubscriptionDeclaration> &entries() const { return entries_; }
    [[nodiscard]] const HandlerPtr &callback() const { return callback_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    // throws ConfigError for invalid values and InvalidModeError when entries
    // with and without handlers are mixed without a default callback
    void validate(bool cluster_mode) const;
    // entries with the default callback filled in
    [[nodiscard]] std::vector<SubscriptionDeclaration> resolve() const;

private:
    std::vector<SubscriptionDeclaration> entries_;
    HandlerPtr callback_;
};

struct ClientConfig {
    std::vector<NodeAddress> addresses;
    bool cluster_mode = false;
    // for blocking calls that do not pass a timeout
    std::chrono::milliseconds request_timeout = std::chrono::milliseconds(5000);
    // bound on draining pending deliveries when the client closes
    std::chrono::milliseconds shutdown_timeout = std::chrono::milliseconds(5000);
    // 0 means unbounded
    uint64_t max_queue_size = 0;
    SubscriptionConfig subscriptions;

    // throws ConfigError
    void validate() const;
};

// throws ConfigError
ClientConfig parse_config(const std::string &json_text);
ClientConfig load_config(const std::string &path);

}  // namespace herald

#endif  // HERALD_CONFIG_HH
