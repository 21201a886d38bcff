#ifndef HERALD_TRANSPORT_HH
#define HERALD_TRANSPORT_HH

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "channel.hh"
#include "message.hh"

namespace herald {

// receives what the connection layer produces. called on the transport's own
// threads, implementations must not block
class TransportListener {
public:
    virtual void on_inbound_message(InboundMessage message) = 0;
    virtual void on_reconnected() = 0;
    virtual ~TransportListener() = default;
};

// the wire side of pub/sub. wire calls throw TransportUnavailableError while
// disconnected; a call given a wait duration throws TimeoutError when the
// server does not acknowledge in time
class Transport {
public:
    using Wait = std::optional<std::chrono::milliseconds>;

    virtual void connect(TransportListener *listener) = 0;
    virtual void disconnect() = 0;

    // empty values on unsubscribe means every subscription of the mode
    virtual void subscribe(ChannelMode mode, const std::vector<std::string> &values,
                           Wait wait) = 0;
    virtual void unsubscribe(ChannelMode mode, const std::vector<std::string> &values,
                             Wait wait) = 0;

    // both return the number of receivers
    virtual uint64_t publish(const std::string &channel, const std::string &payload) = 0;
    virtual uint64_t spublish(const std::string &channel, const std::string &payload) = 0;

    [[nodiscard]] virtual bool is_cluster() const = 0;

    // what the server currently has for this connection
    virtual SubscriptionMap server_subscriptions() = 0;
    virtual std::vector<std::string> pubsub_channels(
        const std::optional<std::string> &pattern) = 0;
    virtual std::map<std::string, uint64_t> pubsub_numsub(
        const std::vector<std::string> &channels) = 0;
    virtual uint64_t pubsub_numpat() = 0;

    virtual ~Transport() = default;
};

}  // namespace herald

#endif  // HERALD_TRANSPORT_HH
