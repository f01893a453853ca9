/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger, JSON escaping and the rotating file sink.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace thermal_guard;
using thermal_guard::testing::MemorySink;

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<MemorySink>(lines), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown too");

    ASSERT_EQ(lines->size(), 2u);
    EXPECT_NE((*lines)[0].find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE((*lines)[1].find(R"("level":"error")"), std::string::npos);
}

TEST(LoggerTest, LevelCanBeLoweredAtRuntime) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<MemorySink>(lines), LogLevel::Error);

    logger.info("hidden");
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("shown");

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_NE((*lines)[0].find("shown"), std::string::npos);
}

TEST(LoggerTest, MessagesAreEscaped) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<MemorySink>(lines), LogLevel::Debug);

    logger.info("CPU model 'Intel(R) \"Core\"'\n");
    ASSERT_EQ(lines->size(), 1u);
    EXPECT_NE(lines->front().find(R"(\"Core\")"), std::string::npos);
    EXPECT_NE(lines->front().find(R"(\n)"), std::string::npos);
    EXPECT_EQ(lines->front().find('\n'), std::string::npos);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::Info);
}

TEST(LoggerTest, JsonEscapeControlCharacters) {
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
    EXPECT_EQ(json_escape("tab\there"), "tab\\there");
}

TEST(LoggerTest, Iso8601Format) {
    const auto epoch = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500);
    EXPECT_EQ(format_iso8601(epoch), "1970-01-01T00:00:01.500Z");
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "tg_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static size_t line_count(const std::filesystem::path& path) {
        std::ifstream ifs(path);
        size_t n = 0;
        std::string line;
        while (std::getline(ifs, line)) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, AppendsLines) {
    {
        JsonFileSink sink(dir_, "events");
        ASSERT_TRUE(sink.is_open());
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
    }
    {
        JsonFileSink sink(dir_, "events");
        sink.write(R"({"a":3})");
    }
    EXPECT_EQ(line_count(dir_ / "events.ndjson"), 3u);
}

TEST_F(JsonFileSinkTest, ReopensInAppendModeAfterRotation) {
    JsonFileSink sink(dir_, "events", 50, 2);
    sink.set_max_file_size_bytes(20);

    sink.write(R"({"value":11111})");
    sink.write(R"({"value":22222})");
    sink.write(R"({"value":33333})");   // rotates first
    sink.flush();

    {
        std::ofstream other(dir_ / "events.ndjson", std::ios::app);
        other << R"({"other":1})" << '\n';
    }
    sink.write(R"({"value":44444})");
    sink.flush();

    std::ifstream ifs(dir_ / "events.ndjson");
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) lines.push_back(line);
    EXPECT_EQ(lines, (std::vector<std::string>{
        R"({"value":33333})", R"({"other":1})", R"({"value":44444})"}));
    EXPECT_EQ(line_count(dir_ / "events.1.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAtSizeLimit) {
    JsonFileSink sink(dir_, "events", 50, 3);
    sink.set_max_file_size_bytes(20);

    for (int i = 0; i < 10; ++i) {
        sink.write(R"({"value":12345})");   // 15 bytes + newline
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(dir_ / "events.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "events.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "events.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "events.3.ndjson"));
    EXPECT_LE(line_count(dir_ / "events.ndjson"), 2u);
}
