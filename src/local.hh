#ifndef HERALD_LOCAL_HH
#define HERALD_LOCAL_HH

#include <atomic>
#include <map>
#include <memory>
#include <mutex>

#include "transport.hh"

namespace herald {

class LocalTransport;

// an in-process stand-in for the server: keeps the subscriptions of every
// connected session and routes published messages the way the server does
class LocalBroker : public std::enable_shared_from_this<LocalBroker> {
public:
    explicit LocalBroker(bool cluster = false) : cluster_(cluster) {}

    static std::shared_ptr<LocalBroker> create(bool cluster = false) {
        return std::make_shared<LocalBroker>(cluster);
    }

    std::shared_ptr<LocalTransport> connect();

    uint64_t publish(const std::string &channel, const std::string &payload);
    uint64_t spublish(const std::string &channel, const std::string &payload);

    [[nodiscard]] bool is_cluster() const { return cluster_; }

    // delay before a subscribe or unsubscribe is acknowledged
    void set_ack_delay(std::chrono::milliseconds delay) { ack_delay_ = delay; }

    // drops every connection. the server forgets their subscriptions and the
    // sessions reconnect right away
    void kill_connections();
    // while unreachable every wire call fails and the server state of all
    // sessions is lost. becoming reachable again reconnects them
    void set_reachable(bool reachable);
    [[nodiscard]] bool reachable() const { return reachable_; }

    std::vector<std::string> pubsub_channels(const std::optional<std::string> &pattern);
    std::map<std::string, uint64_t> pubsub_numsub(const std::vector<std::string> &channels);
    uint64_t pubsub_numpat();
    [[nodiscard]] size_t sessions() const;

private:
    struct Session {
        TransportListener *listener = nullptr;
        SubscriptionMap subscriptions = empty_subscription_map();
    };

    bool cluster_;
    std::atomic<std::chrono::milliseconds> ack_delay_{std::chrono::milliseconds(0)};
    std::atomic<bool> reachable_{true};

    mutable std::mutex mutex_;
    std::map<const LocalTransport *, Session> sessions_;

    friend class LocalTransport;
    void attach(const LocalTransport *transport, TransportListener *listener);
    void detach(const LocalTransport *transport);
    void update(const LocalTransport *transport, ChannelMode mode,
                const std::vector<std::string> &values, bool subscribe, Transport::Wait wait);
    SubscriptionMap subscriptions(const LocalTransport *transport);
    void check_reachable() const;
    void reconnect_all();
};

class LocalTransport : public Transport {
public:
    explicit LocalTransport(std::shared_ptr<LocalBroker> broker) : broker_(std::move(broker)) {}
    ~LocalTransport() override;

    void connect(TransportListener *listener) override;
    void disconnect() override;

    void subscribe(ChannelMode mode, const std::vector<std::string> &values, Wait wait) override;
    void unsubscribe(ChannelMode mode, const std::vector<std::string> &values, Wait wait) override;

    uint64_t publish(const std::string &channel, const std::string &payload) override;
    uint64_t spublish(const std::string &channel, const std::string &payload) override;

    [[nodiscard]] bool is_cluster() const override { return broker_->is_cluster(); }

    SubscriptionMap server_subscriptions() override;
    std::vector<std::string> pubsub_channels(const std::optional<std::string> &pattern) override;
    std::map<std::string, uint64_t> pubsub_numsub(
        const std::vector<std::string> &channels) override;
    uint64_t pubsub_numpat() override;

    [[nodiscard]] const std::shared_ptr<LocalBroker> &broker() const { return broker_; }

private:
    std::shared_ptr<LocalBroker> broker_;
};

}  // namespace herald

#endif  // HERALD_LOCAL_HH
