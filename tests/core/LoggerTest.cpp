#include "wsb/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <string>

using namespace wsb::util;

// Routes the logger into a tmpfile for the duration of a test
class CaptureLog {
public:
    CaptureLog() : file_(std::tmpfile()) {
        logger().setStream(file_);
        logger().setLevel(LogLevel::Trace);
        logger().setFormatJson(false);
    }
    ~CaptureLog() {
        logger().setStream(nullptr);
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
        std::fclose(file_);
    }

    std::string text() {
        std::fflush(file_);
        std::rewind(file_);
        std::string out;
        char buf[512];
        std::size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) out.append(buf, n);
        return out;
    }

private:
    std::FILE* file_;
};

TEST(LoggerTest, ParseLevelIsCaseInsensitive) {
    EXPECT_EQ(parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("WARN"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Error), "ERROR");
}

TEST(LoggerTest, TextLineCarriesLevelMessageAndFields) {
    Logger l;
    std::string line = l.format(LogLevel::Warn, "unknown event type", {{"event", "nope"}});
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(line.find("] WARN  unknown event type event=nope"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
}

TEST(LoggerTest, JsonLineEscapesValues) {
    Logger l;
    l.setFormatJson(true);
    std::string line = l.format(LogLevel::Info, "say \"hi\"", {{"path", "a\\b\n"}});
    EXPECT_EQ(line.rfind("{\"ts\":\"", 0), 0u);
    EXPECT_NE(line.find("\"lvl\":\"INFO\""), std::string::npos);
    EXPECT_NE(line.find("\"msg\":\"say \\\"hi\\\"\""), std::string::npos);
    EXPECT_NE(line.find("\"path\":\"a\\\\b\\n\""), std::string::npos);
    EXPECT_EQ(line.substr(line.size() - 2), "}\n");
}

TEST(LoggerTest, BelowThresholdIsDropped) {
    CaptureLog cap;
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Info, "quiet");
    logger().log(LogLevel::Error, "loud");
    std::string out = cap.text();
    EXPECT_EQ(out.find("quiet"), std::string::npos);
    EXPECT_NE(out.find("loud"), std::string::npos);
    EXPECT_FALSE(logger().enabled(LogLevel::Debug));
    EXPECT_TRUE(logger().enabled(LogLevel::Error));
}

TEST(LoggerTest, ScopedContextAppliesUntilDestroyed) {
    CaptureLog cap;
    {
        Logger::Scoped outer(std::vector<Field>{{"conn", "7"}});
        logger().log(LogLevel::Info, "first");
        {
            Logger::Scoped inner(std::vector<Field>{{"event", "score"}});
            logger().log(LogLevel::Info, "second");
        }
        logger().log(LogLevel::Info, "third");
    }
    logger().log(LogLevel::Info, "fourth");

    std::string out = cap.text();
    EXPECT_NE(out.find("first conn=7\n"), std::string::npos);
    EXPECT_NE(out.find("second conn=7 event=score\n"), std::string::npos);
    EXPECT_NE(out.find("third conn=7\n"), std::string::npos);
    EXPECT_NE(out.find("fourth\n"), std::string::npos);
}

TEST(LoggerTest, SetFileFailsOnBadPath) {
    Logger l;
    EXPECT_FALSE(l.setFile("/nonexistent-dir/sub/log.txt"));
    EXPECT_TRUE(l.setFile(""));
}
