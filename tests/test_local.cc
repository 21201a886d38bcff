#include "error.hh"
#include "gtest/gtest.h"
#include "local.hh"
#include "test_util.hh"

namespace {
class RecordingListener : public herald::TransportListener {
public:
    void on_inbound_message(herald::InboundMessage message) override {
        std::lock_guard guard(mutex);
        messages.emplace_back(std::move(message));
    }
    void on_reconnected() override { reconnects++; }

    std::mutex mutex;
    std::vector<herald::InboundMessage> messages;
    std::atomic<int> reconnects = 0;
};
}  // namespace

TEST(local, routing) {  // NOLINT
    auto broker = herald::LocalBroker::create(true);
    auto transport = broker->connect();
    RecordingListener listener;
    transport->connect(&listener);

    transport->subscribe(herald::ChannelMode::Exact, {"orders"}, std::nullopt);
    transport->subscribe(herald::ChannelMode::Pattern, {"ord*", "o*"}, std::nullopt);
    transport->subscribe(herald::ChannelMode::Sharded, {"orders"}, std::nullopt);

    // one exact delivery and one per matching pattern
    EXPECT_EQ(broker->publish("orders", "1"), 3);
    EXPECT_EQ(broker->spublish("orders", "2"), 1);
    EXPECT_EQ(broker->publish("unknown", "3"), 0);

    ASSERT_EQ(listener.messages.size(), 4);
    EXPECT_EQ(listener.messages[0].kind, herald::ChannelMode::Exact);
    EXPECT_EQ(listener.messages[1].kind, herald::ChannelMode::Pattern);
    EXPECT_EQ(listener.messages[1].pattern, "o*");
    EXPECT_EQ(listener.messages[2].pattern, "ord*");
    EXPECT_EQ(listener.messages[3].kind, herald::ChannelMode::Sharded);
    EXPECT_EQ(listener.messages[3].payload, "2");
}

TEST(local, unsubscribe) {  // NOLINT
    auto broker = herald::LocalBroker::create();
    auto transport = broker->connect();
    RecordingListener listener;
    transport->connect(&listener);

    transport->subscribe(herald::ChannelMode::Exact, {"a", "b", "c"}, std::nullopt);
    transport->unsubscribe(herald::ChannelMode::Exact, {"a"}, std::nullopt);
    EXPECT_EQ(transport->server_subscriptions()[herald::ChannelMode::Exact],
              (std::set<std::string>{"b", "c"}));
    // empty means all
    transport->unsubscribe(herald::ChannelMode::Exact, {}, std::nullopt);
    EXPECT_TRUE(transport->server_subscriptions()[herald::ChannelMode::Exact].empty());
}

TEST(local, standalone_rejects_sharded) {  // NOLINT
    auto broker = herald::LocalBroker::create(false);
    auto transport = broker->connect();
    RecordingListener listener;
    transport->connect(&listener);
    EXPECT_FALSE(transport->is_cluster());
    EXPECT_THROW(transport->subscribe(herald::ChannelMode::Sharded, {"a"}, std::nullopt),
                 herald::InvalidOperationError);
    EXPECT_THROW(broker->spublish("a", "b"), herald::InvalidOperationError);
}

TEST(local, ack_delay) {  // NOLINT
    auto broker = herald::LocalBroker::create();
    auto transport = broker->connect();
    RecordingListener listener;
    transport->connect(&listener);

    broker->set_ack_delay(100ms);
    EXPECT_THROW(transport->subscribe(herald::ChannelMode::Exact, {"slow"}, 10ms),
                 herald::TimeoutError);
    // the request still reached the server
    EXPECT_EQ(broker->publish("slow", "x"), 1);
    EXPECT_NO_THROW(transport->subscribe(herald::ChannelMode::Exact, {"ok"}, 500ms));
    // fire and forget never waits
    EXPECT_NO_THROW(transport->subscribe(herald::ChannelMode::Exact, {"lazy"}, std::nullopt));
}

TEST(local, kill_and_reachability) {  // NOLINT
    auto broker = herald::LocalBroker::create();
    auto transport = broker->connect();
    RecordingListener listener;
    transport->connect(&listener);
    transport->subscribe(herald::ChannelMode::Exact, {"a"}, std::nullopt);

    broker->kill_connections();
    EXPECT_EQ(listener.reconnects, 1);
    EXPECT_EQ(broker->publish("a", "lost"), 0);

    broker->set_reachable(false);
    EXPECT_FALSE(broker->reachable());
    EXPECT_THROW(transport->subscribe(herald::ChannelMode::Exact, {"a"}, std::nullopt),
                 herald::TransportUnavailableError);
    EXPECT_THROW(transport->publish("a", "x"), herald::TransportUnavailableError);
    broker->set_reachable(true);
    EXPECT_EQ(listener.reconnects, 2);
    EXPECT_NO_THROW(transport->subscribe(herald::ChannelMode::Exact, {"a"}, std::nullopt));
}

TEST(local, introspection) {  // NOLINT
    auto broker = herald::LocalBroker::create();
    auto t1 = broker->connect(), t2 = broker->connect();
    RecordingListener l1, l2;
    t1->connect(&l1);
    t2->connect(&l2);
    EXPECT_EQ(broker->sessions(), 2);

    t1->subscribe(herald::ChannelMode::Exact, {"news", "weather"}, std::nullopt);
    t2->subscribe(herald::ChannelMode::Exact, {"news"}, std::nullopt);
    t1->subscribe(herald::ChannelMode::Pattern, {"n*"}, std::nullopt);
    t2->subscribe(herald::ChannelMode::Pattern, {"n*", "w*"}, std::nullopt);

    EXPECT_EQ(t1->pubsub_channels(std::nullopt), (std::vector<std::string>{"news", "weather"}));
    EXPECT_EQ(t1->pubsub_channels(std::string("w*")), (std::vector<std::string>{"weather"}));
    auto numsub = t1->pubsub_numsub({"news", "weather", "none"});
    EXPECT_EQ(numsub["news"], 2);
    EXPECT_EQ(numsub["weather"], 1);
    EXPECT_EQ(numsub["none"], 0);
    // unique patterns
    EXPECT_EQ(t1->pubsub_numpat(), 2);

    t2->disconnect();
    EXPECT_EQ(broker->sessions(), 1);
    EXPECT_EQ(t1->pubsub_numsub({"news"})["news"], 1);
}
