#ifndef HERALD_CLIENT_HH
#define HERALD_CLIENT_HH

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include "config.hh"
#include "dispatcher.hh"
#include "executor.hh"
#include "queue.hh"
#include "registry.hh"
#include "resubscribe.hh"
#include "transport.hh"

namespace herald {

struct SubscriptionState {
    // what the client asked for
    SubscriptionMap desired;
    // what the server currently has
    SubscriptionMap actual;
};

class Client : public TransportListener {
public:
    using Timeout = std::optional<std::chrono::milliseconds>;

    // returns once every subscription of the config is acknowledged
    Client(ClientConfig config, std::shared_ptr<Transport> transport);
    ~Client() override;

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    // without a handler the messages go to the queue, or to the default
    // callback when the config has one. blocking calls wait for the server up
    // to the timeout, request_timeout when none is given
    void subscribe(const ChannelAddress &address, HandlerPtr handler = nullptr,
                   Timeout timeout = std::nullopt);
    void subscribe(const std::vector<ChannelAddress> &addresses, HandlerPtr handler = nullptr,
                   Timeout timeout = std::nullopt);
    void subscribe_lazy(const ChannelAddress &address, HandlerPtr handler = nullptr);
    void subscribe_lazy(const std::vector<ChannelAddress> &addresses,
                        HandlerPtr handler = nullptr);

    // without a handler every consumer of the address is removed
    void unsubscribe(const ChannelAddress &address, const HandlerPtr &handler = nullptr,
                     Timeout timeout = std::nullopt);
    void unsubscribe(const std::vector<ChannelAddress> &addresses,
                     const HandlerPtr &handler = nullptr, Timeout timeout = std::nullopt);
    void unsubscribe_lazy(const ChannelAddress &address, const HandlerPtr &handler = nullptr);
    void unsubscribe_lazy(const std::vector<ChannelAddress> &addresses,
                          const HandlerPtr &handler = nullptr);
    void unsubscribe_all(Timeout timeout = std::nullopt);
    void unsubscribe_all(ChannelMode mode, Timeout timeout = std::nullopt);

    // throws InvalidOperationError when messages go to handlers
    std::shared_ptr<MessageQueue> queue();

    uint64_t publish(const std::string &channel, const std::string &payload);
    uint64_t spublish(const std::string &channel, const std::string &payload);

    SubscriptionState get_subscriptions();
    std::vector<std::string> pubsub_channels(const std::optional<std::string> &pattern = {});
    std::map<std::string, uint64_t> pubsub_numsub(const std::vector<std::string> &channels);
    uint64_t pubsub_numpat();

    [[nodiscard]] ResyncState resync_state() const { return coordinator_->state(); }
    [[nodiscard]] uint64_t resync_count() const { return coordinator_->count(); }
    [[nodiscard]] DeliveryMode delivery_mode() const { return registry_->delivery_mode(); }
    [[nodiscard]] const ClientConfig &config() const { return config_; }

    // waits until every message received so far has been delivered
    bool flush(std::chrono::milliseconds timeout);
    // from a handler the delivery thread cannot be waited for, so the messages
    // still queued behind the current one are discarded
    void close();
    [[nodiscard]] bool closed() const { return closed_; }

    void set_consumer_error_hook(ConsumerErrorHook hook);

    void on_inbound_message(InboundMessage message) override;
    void on_reconnected() override;

private:
    ClientConfig config_;
    std::shared_ptr<Transport> transport_;
    // shared with the tasks on the delivery thread, which may outlive the client
    std::shared_ptr<SubscriptionRegistry> registry_;
    SerialExecutor executor_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<ResubscriptionCoordinator> coordinator_;

    std::mutex close_mutex_;
    std::atomic<bool> closed_{false};

    void check_open() const;
    void check_address(const ChannelAddress &address) const;
    void add(const std::vector<ChannelAddress> &addresses, HandlerPtr handler,
             Transport::Wait wait);
    void remove(const std::vector<ChannelAddress> &addresses, const HandlerPtr &handler,
                Transport::Wait wait);
    [[nodiscard]] std::chrono::milliseconds wait_for(Timeout timeout) const {
        return timeout ? *timeout : config_.request_timeout;
    }
};

}  // namespace herald

#endif  // HERALD_CLIENT_HH
