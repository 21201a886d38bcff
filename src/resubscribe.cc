#include "resubscribe.hh"

#include "fmt/format.h"

#include "log.hh"

namespace herald {

const char *to_string(ResyncState state) {
    switch (state) {
        case ResyncState::Synced:
            return "Synced";
        case ResyncState::Resyncing:
            return "Resyncing";
    }
    return "Unknown";
}

bool ResubscriptionCoordinator::on_reconnected() {
    std::lock_guard guard(subscription_mutex_);
    state_ = ResyncState::Resyncing;
    auto snapshot = registry_->snapshot();
    log::info("resubscribe", fmt::format("Connection re-established, replaying {0} exact, {1} "
                                         "pattern and {2} sharded subscription(s)",
                                         snapshot[ChannelMode::Exact].size(),
                                         snapshot[ChannelMode::Pattern].size(),
                                         snapshot[ChannelMode::Sharded].size()));
    bool success = true;
    for (auto const &[mode, values] : snapshot) {
        if (values.empty()) continue;
        std::vector<std::string> request(values.begin(), values.end());
        try {
            transport_->subscribe(mode, request, std::nullopt);
        } catch (const std::exception &ex) {
            log::warn("resubscribe", fmt::format("Failed to resubscribe {0} {1}: {2}",
                                                 request.size(), to_string(mode), ex.what()));
            success = false;
        }
    }
    if (!success) return false;
    count_++;
    state_ = ResyncState::Synced;
    log::info("resubscribe", "Subscriptions restored");
    return true;
}

}  // namespace herald
