#include "config.hh"

#include "fmt/format.h"

#include "error.hh"
#include "json.hh"
#include "rapidjson/error/en.h"
#include "util.hh"

namespace herald {

std::string NodeAddress::str() const {
    if (host.find(':') != std::string::npos) return fmt::format("[{0}]:{1}", host, port);
    return fmt::format("{0}:{1}", host, port);
}

NodeAddress NodeAddress::parse(const std::string &value) {
    auto text = string::trim(value);
    NodeAddress result;
    std::string port;
    if (!text.empty() && text.front() == '[') {
        auto end = text.find(']');
        if (end == std::string::npos) {
            throw ConfigError(fmt::format("Invalid address \"{0}\"", value));
        }
        result.host = text.substr(1, end - 1);
        if (end + 1 < text.size()) {
            if (text[end + 1] != ':') {
                throw ConfigError(fmt::format("Invalid address \"{0}\"", value));
            }
            port = text.substr(end + 2);
        }
    } else {
        auto pos = text.rfind(':');
        result.host = text.substr(0, pos);
        if (pos != std::string::npos) port = text.substr(pos + 1);
    }
    if (string::is_blank(result.host)) {
        throw ConfigError(fmt::format("Address \"{0}\" has no host", value));
    }
    if (!port.empty()) {
        auto number = parse::parse_uint64(port);
        if (!number || *number == 0 || *number > UINT16_MAX) {
            throw ConfigError(fmt::format("Invalid port in address \"{0}\"", value));
        }
        result.port = static_cast<uint16_t>(*number);
    }
    return result;
}

SubscriptionConfig &SubscriptionConfig::with_channel(const std::string &channel,
                                                     HandlerPtr handler) {
    return with_subscription(ChannelMode::Exact, channel, std::move(handler));
}

SubscriptionConfig &SubscriptionConfig::with_pattern(const std::string &pattern,
                                                     HandlerPtr handler) {
    return with_subscription(ChannelMode::Pattern, pattern, std::move(handler));
}

SubscriptionConfig &SubscriptionConfig::with_sharded_channel(const std::string &channel,
                                                             HandlerPtr handler) {
    return with_subscription(ChannelMode::Sharded, channel, std::move(handler));
}

SubscriptionConfig &SubscriptionConfig::with_subscription(ChannelMode mode,
                                                          const std::string &value,
                                                          HandlerPtr handler) {
    ChannelAddress address(mode, value);
    for (auto const &entry : entries_) {
        if (entry.address == address && entry.handler == handler) return *this;
    }
    entries_.emplace_back(SubscriptionDeclaration{std::move(address), std::move(handler)});
    return *this;
}

SubscriptionConfig &SubscriptionConfig::with_callback(HandlerPtr handler) {
    callback_ = std::move(handler);
    return *this;
}

void SubscriptionConfig::validate(bool cluster_mode) const {
    bool with_handler = false, without_handler = false;
    for (auto const &[address, handler] : entries_) {
        if (string::is_blank(address.value())) {
            throw ConfigError(
                fmt::format("{0} subscription value cannot be empty", to_string(address.mode())));
        }
        if (address.mode() == ChannelMode::Sharded && !cluster_mode) {
            throw ConfigError(fmt::format(
                "Sharded channel \"{0}\" requires a cluster client", address.value()));
        }
        if (handler) {
            with_handler = true;
        } else {
            without_handler = true;
        }
    }
    if (with_handler && without_handler && !callback_) {
        throw InvalidModeError(
            "Subscriptions with and without handlers cannot be mixed without a default callback");
    }
}

std::vector<SubscriptionDeclaration> SubscriptionConfig::resolve() const {
    auto result = entries_;
    for (auto &entry : result) {
        if (!entry.handler) entry.handler = callback_;
    }
    return result;
}

void ClientConfig::validate() const {
    if (addresses.empty()) throw ConfigError("At least one address is required");
    for (auto const &address : addresses) {
        if (string::is_blank(address.host)) throw ConfigError("Address host cannot be empty");
        if (address.port == 0) {
            throw ConfigError(fmt::format("Invalid port for {0}", address.host));
        }
    }
    if (request_timeout.count() <= 0) throw ConfigError("request_timeout must be positive");
    if (shutdown_timeout.count() <= 0) throw ConfigError("shutdown_timeout must be positive");
    subscriptions.validate(cluster_mode);
}

namespace {

// a present member of the wrong type is an error, a missing one is not
template <typename T>
std::optional<T> read_member(const rapidjson::Value &value, const char *name) {
    if (!json::check_member(value, name)) return std::nullopt;
    auto result = json::get_member<T>(value, name);
    if (!result) throw ConfigError(fmt::format("Member \"{0}\" has an invalid type", name));
    return result;
}

std::vector<NodeAddress> read_addresses(const rapidjson::Value &document) {
    std::vector<std::string> values;
    if (json::check_member(document, "addresses") && document["addresses"].IsString()) {
        values = string::split(*json::get_member<std::string>(document, "addresses"), ", ");
    } else if (auto list = read_member<std::vector<std::string>>(document, "addresses")) {
        values = *list;
    }
    std::vector<NodeAddress> result;
    result.reserve(values.size());
    for (auto const &value : values) result.emplace_back(NodeAddress::parse(value));
    return result;
}

void read_subscriptions(const rapidjson::Value &document, SubscriptionConfig &config) {
    if (!json::check_member(document, "subscriptions")) return;
    auto const &subscriptions = document["subscriptions"];
    if (!subscriptions.IsObject()) {
        throw ConfigError("Member \"subscriptions\" has an invalid type");
    }
    for (auto const &member : subscriptions.GetObject()) {
        std::string name(member.name.GetString(), member.name.GetStringLength());
        auto mode = parse_channel_mode(name);
        if (!mode) throw ConfigError(fmt::format("Unknown subscription kind \"{0}\"", name));
        auto values = read_member<std::vector<std::string>>(subscriptions, name.c_str());
        for (auto const &value : *values) config.with_subscription(*mode, value);
    }
}

}  // namespace

ClientConfig parse_config(const std::string &json_text) {
    rapidjson::Document document;
    document.Parse(json_text.c_str(), json_text.size());
    if (document.HasParseError()) {
        throw ConfigError(fmt::format("Invalid configuration at offset {0}: {1}",
                                      document.GetErrorOffset(),
                                      rapidjson::GetParseError_En(document.GetParseError())));
    }
    if (!document.IsObject()) throw ConfigError("Configuration must be a JSON object");

    ClientConfig config;
    config.addresses = read_addresses(document);
    if (auto cluster = read_member<bool>(document, "cluster_mode")) config.cluster_mode = *cluster;
    if (auto timeout = read_member<uint64_t>(document, "request_timeout_ms")) {
        config.request_timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto timeout = read_member<uint64_t>(document, "shutdown_timeout_ms")) {
        config.shutdown_timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto size = read_member<uint64_t>(document, "max_queue_size")) {
        config.max_queue_size = *size;
    }
    read_subscriptions(document, config.subscriptions);
    config.validate();
    return config;
}

ClientConfig load_config(const std::string &path) {
    auto content = fs::read_file(path);
    if (!content) throw ConfigError(fmt::format("Unable to read configuration file {0}", path));
    return parse_config(*content);
}

}  // namespace herald
