#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "monitor/Logger.h"

namespace {
std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        out.push_back(line);
    return out;
}
}

TEST(LoggerTest, WritesThroughWithTimestampAndLevelWhenNotStarted) {
    std::ostringstream os;
    Logger logger(os);

    logger.warn("disk full");

    const auto out = lines(os.str());
    ASSERT_EQ(out.size(), 1u);
    const std::string& line = out[0];
    ASSERT_GE(line.size(), 12u);
    EXPECT_EQ(line[2], ':');
    EXPECT_EQ(line[5], ':');
    EXPECT_EQ(line[8], '.');
    EXPECT_EQ(line.substr(12), " [WARN ] disk full");
}

TEST(LoggerTest, BackgroundThreadDrainsEverythingInOrderOnStop) {
    std::ostringstream os;
    Logger logger(os);
    logger.start();
    logger.start();

    logger.log("one");
    logger.error("two");
    logger.log(LogLevel::Info, "three");
    logger.stop();

    const auto out = lines(os.str());
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].substr(12), " [INFO ] one");
    EXPECT_EQ(out[1].substr(12), " [ERROR] two");
    EXPECT_EQ(out[2].substr(12), " [INFO ] three");
}
