#include "channel.hh"

#include <fnmatch.h>

#include "fmt/format.h"

namespace herald {

const char *to_string(ChannelMode mode) {
    switch (mode) {
        case ChannelMode::Exact:
            return "Exact";
        case ChannelMode::Pattern:
            return "Pattern";
        case ChannelMode::Sharded:
            return "Sharded";
    }
    return "Unknown";
}

std::optional<ChannelMode> parse_channel_mode(const std::string &value) {
    for (auto mode : all_channel_modes) {
        if (value == to_string(mode)) return mode;
    }
    if (value == "exact" || value == "channel") return ChannelMode::Exact;
    if (value == "pattern") return ChannelMode::Pattern;
    if (value == "sharded") return ChannelMode::Sharded;
    return std::nullopt;
}

bool ChannelAddress::matches(const std::string &channel) const {
    if (mode_ == ChannelMode::Pattern) {
        return glob_match(value_, channel);
    }
    return value_ == channel;
}

std::string ChannelAddress::str() const { return fmt::format("{0}:{1}", to_string(mode_), value_); }

bool glob_match(const std::string &pattern, const std::string &channel) {
    // fnmatch already understands [!...] and [^...], and treats \ as an escape
    return fnmatch(pattern.c_str(), channel.c_str(), 0) == 0;
}

SubscriptionMap empty_subscription_map() {
    SubscriptionMap result;
    for (auto mode : all_channel_modes) result.emplace(mode, std::set<std::string>());
    return result;
}

}  // namespace herald
