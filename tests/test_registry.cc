#include <thread>

#include "error.hh"
#include "gtest/gtest.h"
#include "registry.hh"

namespace {
herald::HandlerPtr noop() {
    return herald::make_handler([](const herald::Message &) {});
}

std::string fmt_channel(int thread, int index) {
    return std::to_string(thread) + "." + std::to_string(index);
}
}  // namespace

TEST(registry, add_handler) {  // NOLINT
    herald::SubscriptionRegistry registry;
    auto h1 = noop(), h2 = noop();
    auto address = herald::ChannelAddress::exact("news");
    registry.add(address, h1);
    registry.add(address, h1);
    registry.add(address, h2);
    auto entry = registry.entry(address);
    ASSERT_TRUE(entry);
    // same handler twice is a no-op
    EXPECT_EQ(entry->handlers.size(), 2);
    EXPECT_EQ(entry->handlers[0], h1);
    EXPECT_EQ(entry->handlers[1], h2);
    EXPECT_FALSE(entry->has_queue_consumer);
    EXPECT_EQ(registry.delivery_mode(), herald::DeliveryMode::Handler);
}

TEST(registry, mode_gate) {  // NOLINT
    herald::SubscriptionRegistry handlers;
    handlers.add(herald::ChannelAddress::exact("a"), noop());
    EXPECT_THROW(handlers.add(herald::ChannelAddress::exact("b")), herald::InvalidModeError);
    EXPECT_THROW(handlers.require_queue_mode(), herald::InvalidOperationError);
    EXPECT_FALSE(handlers.contains(herald::ChannelAddress::exact("b")));

    herald::SubscriptionRegistry queue;
    queue.add(herald::ChannelAddress::exact("a"));
    EXPECT_THROW(queue.add(herald::ChannelAddress::exact("b"), noop()), herald::InvalidModeError);
    EXPECT_NO_THROW(queue.require_queue_mode());

    // asking for the queue first fixes queue mode
    herald::SubscriptionRegistry unresolved;
    unresolved.require_queue_mode();
    EXPECT_EQ(unresolved.delivery_mode(), herald::DeliveryMode::Queue);
    EXPECT_THROW(unresolved.add(herald::ChannelAddress::exact("a"), noop()),
                 herald::InvalidModeError);
}

TEST(registry, mode_survives_empty_registry) {  // NOLINT
    herald::SubscriptionRegistry registry;
    auto address = herald::ChannelAddress::exact("a");
    registry.add(address);
    EXPECT_TRUE(registry.remove(address));
    EXPECT_EQ(registry.size(), 0);
    EXPECT_THROW(registry.add(address, noop()), herald::InvalidModeError);
}

TEST(registry, remove) {  // NOLINT
    herald::SubscriptionRegistry registry;
    auto h1 = noop(), h2 = noop(), other = noop();
    auto address = herald::ChannelAddress::pattern("news.*");
    registry.add(address, h1);
    registry.add(address, h2);

    // missing consumers are a no-op
    EXPECT_FALSE(registry.remove(address, other));
    EXPECT_FALSE(registry.remove(herald::ChannelAddress::exact("news.*")));

    EXPECT_FALSE(registry.remove(address, h1));
    EXPECT_TRUE(registry.contains(address));
    EXPECT_TRUE(registry.remove(address, h2));
    EXPECT_FALSE(registry.contains(address));

    registry.add(address, h1);
    registry.add(address, h2);
    // without a handler everything goes
    EXPECT_TRUE(registry.remove(address));
    EXPECT_EQ(registry.size(), 0);
}

TEST(registry, clear) {  // NOLINT
    herald::SubscriptionRegistry registry;
    registry.add(herald::ChannelAddress::exact("a"));
    registry.add(herald::ChannelAddress::pattern("b*"));
    registry.add(herald::ChannelAddress::sharded("c"));

    auto removed = registry.clear(herald::ChannelMode::Pattern);
    ASSERT_EQ(removed.size(), 1);
    EXPECT_EQ(removed[0], herald::ChannelAddress::pattern("b*"));
    EXPECT_EQ(registry.size(), 2);

    removed = registry.clear();
    EXPECT_EQ(removed.size(), 2);
    EXPECT_EQ(registry.size(), 0);
    EXPECT_TRUE(registry.match("b1", herald::ChannelMode::Pattern).empty());
}

TEST(registry, snapshot) {  // NOLINT
    herald::SubscriptionRegistry registry;
    registry.add(herald::ChannelAddress::exact("a"));
    registry.add(herald::ChannelAddress::exact("b"));
    registry.add(herald::ChannelAddress::pattern("c.*"));
    auto snapshot = registry.snapshot();
    EXPECT_EQ(snapshot.size(), 3);
    EXPECT_EQ(snapshot[herald::ChannelMode::Exact], (std::set<std::string>{"a", "b"}));
    EXPECT_EQ(snapshot[herald::ChannelMode::Pattern], (std::set<std::string>{"c.*"}));
    EXPECT_TRUE(snapshot[herald::ChannelMode::Sharded].empty());

    // the snapshot does not follow later changes
    registry.add(herald::ChannelAddress::sharded("d"));
    EXPECT_TRUE(snapshot[herald::ChannelMode::Sharded].empty());
}

TEST(registry, match_by_kind) {  // NOLINT
    herald::SubscriptionRegistry registry;
    auto exact = noop(), sharded = noop(), pattern = noop();
    registry.add(herald::ChannelAddress::exact("orders"), exact);
    registry.add(herald::ChannelAddress::sharded("orders"), sharded);
    registry.add(herald::ChannelAddress::pattern("ord*"), pattern);

    auto matches = registry.match("orders", herald::ChannelMode::Exact);
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].handlers, std::vector<herald::HandlerPtr>{exact});

    matches = registry.match("orders", herald::ChannelMode::Sharded);
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].handlers, std::vector<herald::HandlerPtr>{sharded});

    matches = registry.match("orders", herald::ChannelMode::Pattern, std::string("ord*"));
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].address, herald::ChannelAddress::pattern("ord*"));
    EXPECT_EQ(matches[0].handlers, std::vector<herald::HandlerPtr>{pattern});

    EXPECT_TRUE(registry.match("other", herald::ChannelMode::Exact).empty());
    EXPECT_TRUE(registry.match("orders", herald::ChannelMode::Pattern, std::string("x*")).empty());
}

TEST(registry, pattern_scan) {  // NOLINT
    herald::SubscriptionRegistry registry;
    registry.add(herald::ChannelAddress::pattern("news.*"));
    registry.add(herald::ChannelAddress::pattern("*.sports"));
    registry.add(herald::ChannelAddress::pattern("weather.*"));

    auto matches = registry.match("news.sports", herald::ChannelMode::Pattern);
    ASSERT_EQ(matches.size(), 2);
    EXPECT_TRUE(matches[0].has_queue_consumer);
    std::set<std::string> patterns;
    for (auto const &match : matches) patterns.emplace(match.address.value());
    EXPECT_EQ(patterns, (std::set<std::string>{"news.*", "*.sports"}));

    // cached result must follow pattern changes
    registry.remove(herald::ChannelAddress::pattern("*.sports"));
    EXPECT_EQ(registry.match("news.sports", herald::ChannelMode::Pattern).size(), 1);
    registry.add(herald::ChannelAddress::pattern("news.sp*"));
    EXPECT_EQ(registry.match("news.sports", herald::ChannelMode::Pattern).size(), 2);
}

TEST(registry, concurrent_mutation) {  // NOLINT
    herald::SubscriptionRegistry registry;
    constexpr auto num_threads = 4;
    constexpr auto num_channels = 200;
    std::vector<std::thread> threads;
    for (auto t = 0; t < num_threads; t++) {
        threads.emplace_back([&registry, t]() {
            for (auto i = 0; i < num_channels; i++) {
                auto address = herald::ChannelAddress::exact(fmt_channel(t, i));
                registry.add(address);
                registry.match(address.value(), herald::ChannelMode::Exact);
                if (i % 2) registry.remove(address);
            }
        });
    }
    for (auto &t : threads) t.join();
    EXPECT_EQ(registry.size(), num_threads * num_channels / 2);
}
