#ifndef HERALD_CHANNEL_HH
#define HERALD_CHANNEL_HH

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace herald {

enum class ChannelMode : uint32_t { Exact = 0, Pattern = 1, Sharded = 2 };

constexpr std::array<ChannelMode, 3> all_channel_modes = {ChannelMode::Exact, ChannelMode::Pattern,
                                                          ChannelMode::Sharded};

const char *to_string(ChannelMode mode);
std::optional<ChannelMode> parse_channel_mode(const std::string &value);

class ChannelAddress {
public:
    ChannelAddress(ChannelMode mode, std::string value) : mode_(mode), value_(std::move(value)) {}

    static ChannelAddress exact(std::string channel) {
        return {ChannelMode::Exact, std::move(channel)};
    }
    static ChannelAddress pattern(std::string pattern) {
        return {ChannelMode::Pattern, std::move(pattern)};
    }
    static ChannelAddress sharded(std::string channel) {
        return {ChannelMode::Sharded, std::move(channel)};
    }

    [[nodiscard]] ChannelMode mode() const { return mode_; }
    [[nodiscard]] const std::string &value() const { return value_; }

    // whether a concrete channel name is routed to this address.
    // exact and sharded need literal equality, patterns use glob matching
    [[nodiscard]] bool matches(const std::string &channel) const;

    [[nodiscard]] std::string str() const;

    bool operator==(const ChannelAddress &other) const {
        return mode_ == other.mode_ && value_ == other.value_;
    }
    bool operator!=(const ChannelAddress &other) const { return !(*this == other); }
    bool operator<(const ChannelAddress &other) const {
        if (mode_ != other.mode_) return mode_ < other.mode_;
        return value_ < other.value_;
    }

private:
    ChannelMode mode_;
    std::string value_;
};

// glob matching with the server's rules: *, ?, [...], [^...] and \ escapes
bool glob_match(const std::string &pattern, const std::string &channel);

// channel or pattern values per mode. every mode is always present
using SubscriptionMap = std::map<ChannelMode, std::set<std::string>>;
SubscriptionMap empty_subscription_map();

}  // namespace herald

#endif  // HERALD_CHANNEL_HH
