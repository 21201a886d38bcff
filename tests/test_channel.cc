#include "channel.hh"
#include "gtest/gtest.h"
#include "json.hh"
#include "message.hh"
#include "util.hh"

TEST(channel, address_equality) {  // NOLINT
    auto a = herald::ChannelAddress::exact("news");
    auto b = herald::ChannelAddress(herald::ChannelMode::Exact, "news");
    EXPECT_EQ(a, b);
    // same value, different mode
    EXPECT_NE(a, herald::ChannelAddress::sharded("news"));
    EXPECT_NE(a, herald::ChannelAddress::pattern("news"));
    // patterns compare literally
    EXPECT_NE(herald::ChannelAddress::pattern("news.*"), herald::ChannelAddress::pattern("news.?*"));
    EXPECT_TRUE(herald::ChannelAddress::exact("a") < herald::ChannelAddress::pattern("a"));
    EXPECT_EQ(a.str(), "Exact:news");
}

TEST(channel, exact_matching) {  // NOLINT
    auto exact = herald::ChannelAddress::exact("news.*");
    EXPECT_TRUE(exact.matches("news.*"));
    EXPECT_FALSE(exact.matches("news.sports"));
    auto sharded = herald::ChannelAddress::sharded("orders");
    EXPECT_TRUE(sharded.matches("orders"));
    EXPECT_FALSE(sharded.matches("orders2"));
}

TEST(channel, glob_matching) {  // NOLINT
    EXPECT_TRUE(herald::glob_match("news.*", "news.sports"));
    EXPECT_TRUE(herald::glob_match("news.*", "news."));
    EXPECT_FALSE(herald::glob_match("news.*", "news"));
    EXPECT_TRUE(herald::glob_match("h?llo", "hello"));
    EXPECT_FALSE(herald::glob_match("h?llo", "hllo"));
    EXPECT_TRUE(herald::glob_match("h[ae]llo", "hallo"));
    EXPECT_FALSE(herald::glob_match("h[ae]llo", "hillo"));
    EXPECT_TRUE(herald::glob_match("h[^e]llo", "hallo"));
    EXPECT_FALSE(herald::glob_match("h[^e]llo", "hello"));
    EXPECT_TRUE(herald::glob_match("h\\*llo", "h*llo"));
    EXPECT_FALSE(herald::glob_match("h\\*llo", "hello"));
    EXPECT_TRUE(herald::glob_match("*", "anything"));

    auto pattern = herald::ChannelAddress::pattern("user.*.created");
    EXPECT_TRUE(pattern.matches("user.42.created"));
    EXPECT_FALSE(pattern.matches("user.42.deleted"));
}

TEST(channel, mode_names) {  // NOLINT
    for (auto mode : herald::all_channel_modes) {
        auto parsed = herald::parse_channel_mode(herald::to_string(mode));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, mode);
    }
    EXPECT_EQ(herald::parse_channel_mode("channel"), herald::ChannelMode::Exact);
    EXPECT_EQ(herald::parse_channel_mode("sharded"), herald::ChannelMode::Sharded);
    EXPECT_FALSE(herald::parse_channel_mode("broadcast"));
}

TEST(channel, empty_subscription_map) {  // NOLINT
    auto map = herald::empty_subscription_map();
    EXPECT_EQ(map.size(), 3);
    for (auto const &[mode, values] : map) EXPECT_TRUE(values.empty());
}

TEST(message, value_semantics) {  // NOLINT
    herald::Message a("news.sports", "goal", std::string("news.*"));
    auto b = a;
    EXPECT_EQ(a, b);
    EXPECT_EQ(b.pattern(), "news.*");
    herald::Message c("news.sports", "goal");
    EXPECT_NE(a, c);
    EXPECT_FALSE(c.pattern());
}

TEST(message, binary_payload) {  // NOLINT
    std::string payload("a\0b\xff", 4);
    herald::Message message("bin", payload);
    EXPECT_EQ(message.payload().size(), 4);
    EXPECT_EQ(message.payload(), payload);
}

TEST(message, json) {  // NOLINT
    herald::Message message("news.sports", "goal", std::string("news.*"));
    EXPECT_EQ(message.json(), R"({"message":"goal","channel":"news.sports","pattern":"news.*"})");
    herald::Message exact("news", "hi");
    EXPECT_EQ(exact.json(), R"({"message":"hi","channel":"news","pattern":null})");
}

TEST(message, subscription_map_json) {  // NOLINT
    auto map = herald::empty_subscription_map();
    map[herald::ChannelMode::Exact].emplace("a");
    map[herald::ChannelMode::Pattern].emplace("b.*");
    rapidjson::Document doc(rapidjson::kObjectType);
    auto value = herald::json::serialize(doc.GetAllocator(), map);
    EXPECT_EQ(herald::json::serialize(value, false),
              R"({"Exact":["a"],"Pattern":["b.*"],"Sharded":[]})");
}

TEST(util, split) {  // NOLINT
    auto tokens = herald::string::split("a:1, b:2,,c:3", ", ");
    EXPECT_EQ(tokens, (std::vector<std::string>{"a:1", "b:2", "c:3"}));
    EXPECT_TRUE(herald::string::split("", ",").empty());
}

TEST(util, trim) {  // NOLINT
    EXPECT_EQ(herald::string::trim("  news \t"), "news");
    EXPECT_TRUE(herald::string::is_blank(" \t\n"));
    EXPECT_FALSE(herald::string::is_blank(" x "));
}

TEST(util, parse_uint64) {  // NOLINT
    EXPECT_EQ(herald::parse::parse_uint64("6379"), 6379u);
    EXPECT_FALSE(herald::parse::parse_uint64("-1"));
    EXPECT_FALSE(herald::parse::parse_uint64("12a"));
    EXPECT_FALSE(herald::parse::parse_uint64(""));
    EXPECT_FALSE(herald::parse::parse_uint64("99999999999999999999999"));
}
