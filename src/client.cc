#include "client.hh"

#include "fmt/format.h"

#include "error.hh"
#include "log.hh"
#include "util.hh"

namespace herald {

namespace {
using WireRequest = std::map<ChannelMode, std::vector<std::string>>;

void send_request(Transport &transport, const WireRequest &request, bool subscribe,
          Transport::Wait wait) {
    for (auto const &[mode, values] : request) {
        if (values.empty()) continue;
        if (subscribe) {
            transport.subscribe(mode, values, wait);
        } else {
            transport.unsubscribe(mode, values, wait);
        }
    }
}
}  // namespace

Client::Client(ClientConfig config, std::shared_ptr<Transport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      registry_(std::make_shared<SubscriptionRegistry>()),
      executor_("herald"),
      dispatcher_(std::make_shared<Dispatcher>(registry_, executor_, config_.max_queue_size)),
      coordinator_(std::make_shared<ResubscriptionCoordinator>(registry_, transport_)) {
    if (!transport_) throw ConfigError("A transport is required");
    config_.validate();
    if (config_.cluster_mode != transport_->is_cluster()) {
        throw ConfigError(fmt::format("cluster_mode is {0} but the server is {1}",
                                      config_.cluster_mode,
                                      transport_->is_cluster() ? "a cluster" : "standalone"));
    }
    transport_->connect(this);

    auto declarations = config_.subscriptions.resolve();
    if (declarations.empty()) return;
    try {
        std::lock_guard guard(coordinator_->subscription_mutex());
        WireRequest request;
        for (auto const &[address, handler] : declarations) {
            registry_->add(address, handler);
            request[address.mode()].emplace_back(address.value());
        }
        send_request(*transport_, request, true, config_.request_timeout);
    } catch (const std::exception &ex) {
        log::error("client", fmt::format("Failed to establish configured subscriptions: {0}",
                                         ex.what()));
        closed_ = true;
        transport_->disconnect();
        throw;
    }
    log::debug("client", fmt::format("Established {0} configured subscription(s)",
                                     declarations.size()));
}

Client::~Client() {
    try {
        close();
    } catch (const std::exception &ex) {
        log::error("client", fmt::format("Failed to close client: {0}", ex.what()));
    }
}

void Client::subscribe(const ChannelAddress &address, HandlerPtr handler, Timeout timeout) {
    add({address}, std::move(handler), wait_for(timeout));
}

void Client::subscribe(const std::vector<ChannelAddress> &addresses, HandlerPtr handler,
                       Timeout timeout) {
    add(addresses, std::move(handler), wait_for(timeout));
}

void Client::subscribe_lazy(const ChannelAddress &address, HandlerPtr handler) {
    add({address}, std::move(handler), std::nullopt);
}

void Client::subscribe_lazy(const std::vector<ChannelAddress> &addresses, HandlerPtr handler) {
    add(addresses, std::move(handler), std::nullopt);
}

void Client::unsubscribe(const ChannelAddress &address, const HandlerPtr &handler,
                         Timeout timeout) {
    remove({address}, handler, wait_for(timeout));
}

void Client::unsubscribe(const std::vector<ChannelAddress> &addresses, const HandlerPtr &handler,
                         Timeout timeout) {
    remove(addresses, handler, wait_for(timeout));
}

void Client::unsubscribe_lazy(const ChannelAddress &address, const HandlerPtr &handler) {
    remove({address}, handler, std::nullopt);
}

void Client::unsubscribe_lazy(const std::vector<ChannelAddress> &addresses,
                              const HandlerPtr &handler) {
    remove(addresses, handler, std::nullopt);
}

void Client::unsubscribe_all(Timeout timeout) {
    check_open();
    std::lock_guard guard(coordinator_->subscription_mutex());
    registry_->clear();
    for (auto mode : all_channel_modes) {
        if (mode == ChannelMode::Sharded && !transport_->is_cluster()) continue;
        transport_->unsubscribe(mode, {}, wait_for(timeout));
    }
}

void Client::unsubscribe_all(ChannelMode mode, Timeout timeout) {
    check_open();
    if (mode == ChannelMode::Sharded && !transport_->is_cluster()) {
        throw InvalidOperationError("Sharded subscriptions require a cluster client");
    }
    std::lock_guard guard(coordinator_->subscription_mutex());
    registry_->clear(mode);
    transport_->unsubscribe(mode, {}, wait_for(timeout));
}

std::shared_ptr<MessageQueue> Client::queue() {
    check_open();
    registry_->require_queue_mode();
    return dispatcher_->queue();
}

uint64_t Client::publish(const std::string &channel, const std::string &payload) {
    check_open();
    return transport_->publish(channel, payload);
}

uint64_t Client::spublish(const std::string &channel, const std::string &payload) {
    check_open();
    if (!transport_->is_cluster()) {
        throw InvalidOperationError("Sharded publish requires a cluster client");
    }
    return transport_->spublish(channel, payload);
}

SubscriptionState Client::get_subscriptions() {
    check_open();
    // both sides from the same moment
    std::lock_guard guard(coordinator_->subscription_mutex());
    return {registry_->snapshot(), transport_->server_subscriptions()};
}

std::vector<std::string> Client::pubsub_channels(const std::optional<std::string> &pattern) {
    check_open();
    return transport_->pubsub_channels(pattern);
}

std::map<std::string, uint64_t> Client::pubsub_numsub(const std::vector<std::string> &channels) {
    check_open();
    return transport_->pubsub_numsub(channels);
}

uint64_t Client::pubsub_numpat() {
    check_open();
    return transport_->pubsub_numpat();
}

bool Client::flush(std::chrono::milliseconds timeout) {
    check_open();
    return executor_.flush(timeout);
}

void Client::close() {
    std::lock_guard guard(close_mutex_);
    if (closed_.exchange(true)) return;
    try {
        transport_->disconnect();
    } catch (const std::exception &ex) {
        log::warn("client", fmt::format("Failed to disconnect: {0}", ex.what()));
    }
    executor_.finish(config_.shutdown_timeout);
    if (dispatcher_->has_queue()) dispatcher_->queue()->close();
    log::debug("client", "Client closed");
}

void Client::set_consumer_error_hook(ConsumerErrorHook hook) {
    dispatcher_->set_error_hook(std::move(hook));
}

void Client::on_inbound_message(InboundMessage message) {
    if (closed_) return;
    dispatcher_->on_message(std::move(message));
}

void Client::on_reconnected() {
    if (closed_) return;
    // replayed on the delivery thread, behind the messages received so far
    executor_.dispatch([coordinator = coordinator_]() { coordinator->on_reconnected(); });
}

void Client::check_open() const {
    if (closed_) throw InvalidOperationError("Client is closed");
}

void Client::check_address(const ChannelAddress &address) const {
    if (string::is_blank(address.value())) {
        throw InvalidOperationError(
            fmt::format("{0} subscription value cannot be empty", to_string(address.mode())));
    }
    if (address.mode() == ChannelMode::Sharded && !transport_->is_cluster()) {
        throw InvalidOperationError(fmt::format(
            "Sharded channel \"{0}\" requires a cluster client", address.value()));
    }
}

void Client::add(const std::vector<ChannelAddress> &addresses, HandlerPtr handler,
                 Transport::Wait wait) {
    check_open();
    for (auto const &address : addresses) check_address(address);
    if (!handler) handler = config_.subscriptions.callback();

    // the registry holds the intent even if the server never acknowledges
    std::lock_guard guard(coordinator_->subscription_mutex());
    WireRequest request;
    for (auto const &address : addresses) {
        registry_->add(address, handler);
        request[address.mode()].emplace_back(address.value());
    }
    send_request(*transport_, request, true, wait);
}

void Client::remove(const std::vector<ChannelAddress> &addresses, const HandlerPtr &handler,
                    Transport::Wait wait) {
    check_open();
    std::lock_guard guard(coordinator_->subscription_mutex());
    WireRequest request;
    for (auto const &address : addresses) {
        if (registry_->remove(address, handler)) {
            request[address.mode()].emplace_back(address.value());
        }
    }
    send_request(*transport_, request, false, wait);
}

}  // namespace herald
