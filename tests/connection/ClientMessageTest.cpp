#include "wsb/ClientMessage.hpp"
#include <gtest/gtest.h>

using namespace wsb;

TEST(ClientMessageTest, Subscribe) {
    auto m = parseClientMessage(R"({"type":"subscribe","event":"score"})");
    EXPECT_EQ(m.kind, ClientMessage::Kind::Subscribe);
    EXPECT_EQ(m.type, "subscribe");
    EXPECT_EQ(m.event, "score");
}

TEST(ClientMessageTest, SubscribeWithoutStringEvent) {
    auto m = parseClientMessage(R"({"type":"subscribe","event":["a"]})");
    EXPECT_EQ(m.kind, ClientMessage::Kind::Subscribe);
    EXPECT_TRUE(m.event.empty());
}

TEST(ClientMessageTest, MalformedInput) {
    EXPECT_EQ(parseClientMessage("").kind, ClientMessage::Kind::Malformed);
    EXPECT_EQ(parseClientMessage("{\"type\":").kind, ClientMessage::Kind::Malformed);
    auto arr = parseClientMessage("[1]");
    EXPECT_EQ(arr.kind, ClientMessage::Kind::Malformed);
    EXPECT_FALSE(arr.error.empty());
}

TEST(ClientMessageTest, UnknownType) {
    auto m = parseClientMessage(R"({"type":"unsubscribe","event":"score"})");
    EXPECT_EQ(m.kind, ClientMessage::Kind::Unknown);
    EXPECT_EQ(m.type, "unsubscribe");
    EXPECT_EQ(parseClientMessage(R"({"event":"score"})").kind, ClientMessage::Kind::Unknown);
    EXPECT_EQ(parseClientMessage(R"({"type":1})").kind, ClientMessage::Kind::Unknown);
}
