#include "wsb/ConnectionManager.hpp"
#include "wsb/Projector.hpp"
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wsb;

// Capture all messages sent to a connection
struct Capture {
    std::mutex mu;
    std::vector<std::string> msgs;
    bool closed = false;

    ConnectionManager::SendFn makeSend() {
        return [this](const std::string& msg) {
            std::lock_guard<std::mutex> lk(mu);
            if (closed) throw std::runtime_error("session is closed");
            msgs.push_back(msg);
        };
    }

    size_t size() {
        std::lock_guard<std::mutex> lk(mu);
        return msgs.size();
    }

    std::string at(size_t i) {
        std::lock_guard<std::mutex> lk(mu);
        return msgs.at(i);
    }

    std::string last() {
        std::lock_guard<std::mutex> lk(mu);
        return msgs.back();
    }
};

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.add("teamNamesChange", "teamNamesChange", {"p1name", "p2name"});
        registry.add("score", "scoreChange", {"p1score", "p2score"});
        registry.add("clock", "clockTick", {"clock.s"});
        snapshots.replace(parseDocument(R"({"p1name":"A","p2name":"B","p1score":0})"));
        manager = std::make_unique<ConnectionManager>(registry, snapshots, bus);
    }

    std::size_t fire(const std::string& name, const char* json) {
        const TopicSpec* t = registry.find(name);
        auto doc = parseDocument(json);
        auto p = std::make_shared<rapidjson::Document>(project(*t, *doc));
        return bus.publish(*t, p);
    }

    TopicRegistry registry;
    SnapshotStore snapshots;
    EventBus bus;
    std::unique_ptr<ConnectionManager> manager;
};

TEST_F(ConnectionManagerTest, OpenPushesExactlyOneSnapshot) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    ASSERT_EQ(cap.size(), 1u);
    EXPECT_EQ(cap.at(0), R"({"type":"dataUpdate","data":{"p1name":"A","p2name":"B","p1score":0}})");
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Connected);
}

TEST_F(ConnectionManagerTest, OpenBeforeAnyPollSendsEmptyData) {
    SnapshotStore empty;
    ConnectionManager m(registry, empty, bus);
    Capture cap;
    m.onOpen(1, cap.makeSend());
    ASSERT_EQ(cap.size(), 1u);
    EXPECT_EQ(cap.at(0), R"({"type":"dataUpdate","data":{}})");
}

TEST_F(ConnectionManagerTest, SubscribeKnownTopic) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"teamNamesChange"})");
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Subscribed);
    EXPECT_EQ(manager->topics(1), (std::set<std::string>{"teamNamesChange"}));
    EXPECT_EQ(cap.size(), 1u);  // no reply to a subscribe

    EXPECT_EQ(fire("teamNamesChange", R"({"p1name":"A","p2name":"C"})"), 1u);
    ASSERT_EQ(cap.size(), 2u);
    EXPECT_EQ(cap.last(), R"({"type":"teamNamesChange","p1name":"A","p2name":"C"})");

    // other topics don't reach it
    fire("score", R"({"p1score":1})");
    EXPECT_EQ(cap.size(), 2u);
}

TEST_F(ConnectionManagerTest, EventUsesEmitName) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    fire("score", R"({"p1score":3,"p2score":1})");
    EXPECT_EQ(cap.last(), R"({"type":"scoreChange","p1score":3,"p2score":1})");
}

TEST_F(ConnectionManagerTest, SubscribeAllReachesEachTopicOnce) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    manager->onMessage(1, R"({"type":"subscribe","event":"all"})");
    manager->onMessage(1, R"({"type":"subscribe","event":"all"})");
    EXPECT_EQ(manager->topics(1).size(), 3u);

    for (const auto& t : registry.topics()) {
        EXPECT_EQ(bus.listenerCount(t.name), 1u) << t.name;
    }

    fire("teamNamesChange", R"({})");
    fire("score", R"({})");
    fire("clock", R"({})");
    EXPECT_EQ(cap.size(), 4u);
}

TEST_F(ConnectionManagerTest, DuplicateSubscribeIsNoOp) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    EXPECT_EQ(bus.listenerCount("score"), 1u);
    fire("score", R"({})");
    EXPECT_EQ(cap.size(), 2u);
}

TEST_F(ConnectionManagerTest, UnknownTopicIgnored) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"nope"})");
    manager->onMessage(1, R"({"type":"subscribe","event":"scoreChange"})");  // emit name, not topic name
    manager->onMessage(1, R"({"type":"subscribe"})");
    manager->onMessage(1, R"({"type":"subscribe","event":42})");
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Connected);
    EXPECT_EQ(bus.size(), 0u);
    EXPECT_EQ(cap.size(), 1u);
}

TEST_F(ConnectionManagerTest, MalformedAndUnknownMessagesIgnored) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, "not valid json {{{");
    manager->onMessage(1, "[1,2,3]");
    manager->onMessage(1, R"({"foo":"bar"})");
    manager->onMessage(1, R"({"type":"unsubscribe","event":"score"})");
    manager->onMessage(1, R"({"type":7})");
    EXPECT_EQ(cap.size(), 1u);
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Connected);

    // still usable afterwards
    manager->onMessage(1, R"({"type":"subscribe","event":"clock"})");
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Subscribed);
}

TEST_F(ConnectionManagerTest, CloseStopsDelivery) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"all"})");
    manager->onClose(1);

    EXPECT_EQ(manager->state(1), ConnectionManager::State::Closed);
    EXPECT_EQ(bus.size(), 0u);
    EXPECT_EQ(fire("score", R"({})"), 0u);
    EXPECT_EQ(cap.size(), 1u);

    EXPECT_NO_THROW(manager->onClose(1));
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    EXPECT_EQ(bus.size(), 0u);
}

TEST_F(ConnectionManagerTest, ConnectionsIndependent) {
    Capture c1, c2;
    manager->onOpen(1, c1.makeSend());
    manager->onOpen(2, c2.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    manager->onMessage(2, R"({"type":"subscribe","event":"clock"})");

    fire("score", R"({})");
    EXPECT_EQ(c1.size(), 2u);
    EXPECT_EQ(c2.size(), 1u);

    manager->onClose(1);
    fire("clock", R"({})");
    EXPECT_EQ(c2.size(), 2u);
    EXPECT_EQ(manager->connectionCount(), 1u);
}

TEST_F(ConnectionManagerTest, FailingSendDropsOnlyThatConnection) {
    Capture broken, healthy;
    manager->onOpen(1, broken.makeSend());
    manager->onOpen(2, healthy.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"all"})");
    manager->onMessage(2, R"({"type":"subscribe","event":"all"})");

    broken.closed = true;
    EXPECT_EQ(fire("score", R"({})"), 1u);
    EXPECT_EQ(healthy.size(), 2u);

    // the broken connection is closed and its bindings are gone
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Closed);
    EXPECT_EQ(manager->connectionCount(), 1u);
    EXPECT_TRUE(manager->topics(1).empty());
    EXPECT_EQ(bus.listenerCount("clock"), 1u);
    fire("clock", R"({})");
    EXPECT_EQ(healthy.size(), 3u);

    // a late subscribe for the dropped id doesn't resurrect it
    broken.closed = false;
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    EXPECT_EQ(bus.listenerCount("score"), 1u);
}

TEST_F(ConnectionManagerTest, CloseDuringFanOutSkipsClosedConnection) {
    Capture second;
    std::size_t firstSends = 0;
    manager->onOpen(1, [&](const std::string&) {
        ++firstSends;
        // closes connection 2 while the bus is already iterating its bindings
        manager->onClose(2);
    });
    manager->onOpen(2, second.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"score"})");
    manager->onMessage(2, R"({"type":"subscribe","event":"score"})");

    fire("score", R"({"p1score":1})");
    EXPECT_EQ(firstSends, 2u);       // snapshot + event
    EXPECT_EQ(second.size(), 1u);    // snapshot only
    EXPECT_EQ(manager->state(2), ConnectionManager::State::Closed);
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Subscribed);
}

TEST_F(ConnectionManagerTest, MessageForUnknownConnectionIgnored) {
    EXPECT_NO_THROW(manager->onMessage(99, R"({"type":"subscribe","event":"all"})"));
    EXPECT_EQ(bus.size(), 0u);
}

TEST_F(ConnectionManagerTest, FailedSnapshotPushClosesConnection) {
    Capture cap;
    cap.closed = true;
    manager->onOpen(1, cap.makeSend());
    EXPECT_EQ(manager->state(1), ConnectionManager::State::Closed);
    EXPECT_EQ(manager->connectionCount(), 0u);
}

TEST_F(ConnectionManagerTest, NextIdIsUnique) {
    auto a = manager->nextId();
    auto b = manager->nextId();
    EXPECT_NE(a, b);
    EXPECT_NE(a, 0u);
}

TEST_F(ConnectionManagerTest, DestructorReleasesBindings) {
    Capture cap;
    manager->onOpen(1, cap.makeSend());
    manager->onMessage(1, R"({"type":"subscribe","event":"all"})");
    manager.reset();
    EXPECT_EQ(bus.size(), 0u);
}
