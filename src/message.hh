#ifndef HERALD_MESSAGE_HH
#define HERALD_MESSAGE_HH

#include <optional>
#include <string>

#include "channel.hh"

namespace herald {

class Message {
public:
    Message(std::string channel, std::string payload)
        : channel_(std::move(channel)), payload_(std::move(payload)) {}
    Message(std::string channel, std::string payload, std::optional<std::string> pattern)
        : channel_(std::move(channel)),
          payload_(std::move(payload)),
          pattern_(std::move(pattern)) {}

    [[nodiscard]] const std::string &channel() const { return channel_; }
    // binary safe
    [[nodiscard]] const std::string &payload() const { return payload_; }
    [[nodiscard]] const std::optional<std::string> &pattern() const { return pattern_; }

    [[nodiscard]] std::string json() const;

    bool operator==(const Message &other) const {
        return channel_ == other.channel_ && payload_ == other.payload_ &&
               pattern_ == other.pattern_;
    }
    bool operator!=(const Message &other) const { return !(*this == other); }

private:
    std::string channel_;
    std::string payload_;
    std::optional<std::string> pattern_;
};

// what the transport hands over for every push message it receives
struct InboundMessage {
    ChannelMode kind = ChannelMode::Exact;
    std::string channel;
    std::string payload;
    std::optional<std::string> pattern;
};

}  // namespace herald

#endif  // HERALD_MESSAGE_HH
