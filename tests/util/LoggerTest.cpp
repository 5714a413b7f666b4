#include "mvr/util/Logger.hpp"
#include "support/TempTree.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace mvr::util;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("Error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
}

TEST(LoggerTest, LevelFiltering) {
    Logger log;
    log.setLevel(LogLevel::Warn);
    EXPECT_FALSE(log.enabled(LogLevel::Info));
    EXPECT_TRUE(log.enabled(LogLevel::Warn));
    EXPECT_TRUE(log.enabled(LogLevel::Error));
}

TEST(LoggerTest, TextLineToFile) {
    mvr::test::TempTree tree;
    const std::string path = tree.path("text.log");

    Logger log;
    ASSERT_TRUE(log.setFile(path));
    log.log(LogLevel::Info, "store.load.done", {{"symbols", "3"}});
    log.log(LogLevel::Debug, "dropped");   // below the default level
    ASSERT_TRUE(log.setFile(""));

    const std::string out = slurp(path);
    EXPECT_NE(out.find("INFO"), std::string::npos);
    EXPECT_NE(out.find("store.load.done symbols=3"), std::string::npos);
    EXPECT_EQ(out.find("dropped"), std::string::npos);
}

TEST(LoggerTest, JsonLineEscapes) {
    mvr::test::TempTree tree;
    const std::string path = tree.path("json.log");

    Logger log;
    log.setFormatJson(true);
    ASSERT_TRUE(log.setFile(path));
    log.log(LogLevel::Error, "ingest.file.rejected", {{"path", "a\"b"}});
    ASSERT_TRUE(log.setFile(""));

    const std::string out = slurp(path);
    EXPECT_NE(out.find("\"lvl\":\"ERROR\""), std::string::npos);
    EXPECT_NE(out.find("\"msg\":\"ingest.file.rejected\""), std::string::npos);
    EXPECT_NE(out.find("\"path\":\"a\\\"b\""), std::string::npos);
}

TEST(LoggerTest, UnopenableFileFails) {
    Logger log;
    EXPECT_FALSE(log.setFile("/nonexistent-dir/x/y.log"));
}
