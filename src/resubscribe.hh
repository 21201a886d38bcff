#ifndef HERALD_RESUBSCRIBE_HH
#define HERALD_RESUBSCRIBE_HH

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "registry.hh"
#include "transport.hh"

namespace herald {

enum class ResyncState { Synced, Resyncing };

const char *to_string(ResyncState state);

// brings the server back in line with the registry after the connection was
// re-established. replays are idempotent, a failed one is retried on the next
// reconnect
class ResubscriptionCoordinator {
public:
    ResubscriptionCoordinator(std::shared_ptr<SubscriptionRegistry> registry,
                              std::shared_ptr<Transport> transport)
        : registry_(std::move(registry)), transport_(std::move(transport)) {}

    // returns true when every subscribe request was issued
    bool on_reconnected();

    // held across every registry change and its wire request, and across a
    // replay, so the server sees them in the order the registry does
    std::mutex &subscription_mutex() { return subscription_mutex_; }

    [[nodiscard]] ResyncState state() const { return state_; }
    // completed replays
    [[nodiscard]] uint64_t count() const { return count_; }

private:
    std::shared_ptr<SubscriptionRegistry> registry_;
    std::shared_ptr<Transport> transport_;
    std::mutex subscription_mutex_;
    std::atomic<ResyncState> state_{ResyncState::Synced};
    std::atomic<uint64_t> count_{0};
};

}  // namespace herald

#endif  // HERALD_RESUBSCRIBE_HH
