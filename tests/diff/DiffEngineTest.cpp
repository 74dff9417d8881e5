#include "wsb/DiffEngine.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace wsb;

namespace {

DocumentPtr doc(const char* json) {
    auto d = parseDocument(json);
    EXPECT_TRUE(d) << json;
    return d;
}

std::vector<std::string> names(const std::vector<const TopicSpec*>& v) {
    std::vector<std::string> out;
    for (auto* t : v) out.push_back(t->name);
    return out;
}

TopicRegistry scoreboard() {
    TopicRegistry reg;
    reg.add("teamNamesChange", "teamNamesChange", {"p1name", "p2name"});
    reg.add("scoreChange", "scoreChange", {"p1score", "p2score"});
    reg.add("clock", "clockTick", {"match.clock.minutes", "match.clock.seconds"});
    return reg;
}

} // namespace

TEST(DiffEngineTest, IdenticalDocumentsYieldNothing) {
    auto reg = scoreboard();
    auto a = doc(R"({"p1name":"A","p2name":"B","p1score":1,"match":{"clock":{"minutes":3}}})");
    EXPECT_TRUE(changedTopics(*a, *a, reg).empty());

    auto copy = doc(R"({"p1name":"A","p2name":"B","p1score":1,"match":{"clock":{"minutes":3}}})");
    EXPECT_TRUE(changedTopics(*a, *copy, reg).empty());
}

TEST(DiffEngineTest, TeamNamesScenario) {
    auto reg = scoreboard();
    auto prev = doc(R"({"p1name":"A","p2name":"B","p1score":0,"p2score":0})");
    auto next = doc(R"({"p1name":"A","p2name":"C","p1score":0,"p2score":0})");
    EXPECT_EQ(names(changedTopics(*prev, *next, reg)),
              std::vector<std::string>{"teamNamesChange"});
}

TEST(DiffEngineTest, UntrackedFieldsIgnored) {
    auto reg = scoreboard();
    auto prev = doc(R"({"p1name":"A","unrelated":1})");
    auto next = doc(R"({"p1name":"A","unrelated":2})");
    EXPECT_TRUE(changedTopics(*prev, *next, reg).empty());
}

TEST(DiffEngineTest, AbsentVersusPresentIsAChange) {
    auto reg = scoreboard();
    auto prev = doc(R"({"p1name":"A"})");
    auto next = doc(R"({"p1name":"A","p2name":"B"})");
    EXPECT_EQ(names(changedTopics(*prev, *next, reg)),
              std::vector<std::string>{"teamNamesChange"});
    EXPECT_EQ(names(changedTopics(*next, *prev, reg)),
              std::vector<std::string>{"teamNamesChange"});
}

TEST(DiffEngineTest, AbsentVersusNullIsAChange) {
    auto reg = scoreboard();
    auto prev = doc(R"({})");
    auto next = doc(R"({"p1score":null})");
    EXPECT_EQ(names(changedTopics(*prev, *next, reg)),
              std::vector<std::string>{"scoreChange"});
}

TEST(DiffEngineTest, NestedPathChange) {
    auto reg = scoreboard();
    auto prev = doc(R"({"match":{"clock":{"minutes":3,"seconds":10}}})");
    auto next = doc(R"({"match":{"clock":{"minutes":3,"seconds":11}}})");
    EXPECT_EQ(names(changedTopics(*prev, *next, reg)),
              std::vector<std::string>{"clock"});
}

TEST(DiffEngineTest, MissingIntermediateBothSidesIsNoChange) {
    auto reg = scoreboard();
    auto prev = doc(R"({"match":5})");
    auto next = doc(R"({"match":"x"})");
    // match.clock.* is absent in both
    EXPECT_TRUE(changedTopics(*prev, *next, reg).empty());
}

TEST(DiffEngineTest, ResultFollowsRegistryOrder) {
    auto reg = scoreboard();
    auto prev = doc(R"({"p1name":"A","p1score":0,"match":{"clock":{"minutes":1}}})");
    auto next = doc(R"({"p1name":"B","p1score":1,"match":{"clock":{"minutes":2}}})");
    EXPECT_EQ(names(changedTopics(*prev, *next, reg)),
              (std::vector<std::string>{"teamNamesChange", "scoreChange", "clock"}));
}

TEST(DiffEngineTest, SharedFieldFiresEveryTopic) {
    TopicRegistry reg;
    reg.add("a", "a", {"x"});
    reg.add("b", "b", {"y", "x"});
    reg.add("c", "c", {"y"});
    auto prev = doc(R"({"x":1,"y":1})");
    auto next = doc(R"({"x":2,"y":1})");
    EXPECT_EQ(names(changedTopics(*prev, *next, reg)),
              (std::vector<std::string>{"a", "b"}));
}

TEST(DiffEngineTest, TopicChangedShortCircuits) {
    TopicRegistry reg;
    reg.add("t", "t", {"a", "b"});
    auto prev = doc(R"({"a":1,"b":1})");
    auto next = doc(R"({"a":2,"b":1})");
    EXPECT_TRUE(topicChanged(reg.topics()[0], *prev, *next));
    EXPECT_FALSE(topicChanged(reg.topics()[0], *prev, *prev));
}

TEST(DiffEngineTest, ObjectValuedFieldComparedDeeply) {
    TopicRegistry reg;
    reg.add("players", "players", {"players"});
    auto prev = doc(R"({"players":[{"n":"A"},{"n":"B"}]})");
    auto same = doc(R"({"players":[{"n":"A"},{"n":"B"}]})");
    auto diff = doc(R"({"players":[{"n":"B"},{"n":"A"}]})");
    EXPECT_TRUE(changedTopics(*prev, *same, reg).empty());
    EXPECT_EQ(changedTopics(*prev, *diff, reg).size(), 1u);
}
