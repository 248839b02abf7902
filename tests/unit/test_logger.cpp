/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger formatting and the log sinks.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace cluster_scaler;

TEST(LoggerTest, WritesNdjsonRecord) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.info("rancher_manager", "installed generation 3");

    auto lines = buffer->snapshot();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].front(), '{');
    EXPECT_EQ(lines[0].back(), '}');
    EXPECT_NE(lines[0].find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("component":"rancher_manager")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("msg":"installed generation 3")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("c", "dropped");
    logger.info("c", "dropped");
    logger.warn("c", "kept");
    logger.error("c", "kept");

    EXPECT_EQ(buffer->snapshot().size(), 2u);
    EXPECT_EQ(buffer->count_containing("dropped"), 0u);

    logger.set_level(LogLevel::Debug);
    logger.debug("c", "now kept");
    EXPECT_EQ(buffer->count_containing("now kept"), 1u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, EscapesMessage) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    Logger logger(std::move(sink));

    logger.error("c", "bad \"quote\"\nnext line");
    auto lines = buffer->snapshot();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"(bad \"quote\"\nnext line)"), std::string::npos);
}

TEST(LoggerTest, JsonEscapeControlCharacters) {
    EXPECT_EQ(json_escape("a\tb"), "a\\tb");
    EXPECT_EQ(json_escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(json_escape(std::string_view{"\x01", 1}), "\\u0001");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("error"), LogLevel::Error);

    auto bad = parse_log_level("verbose");
    ASSERT_FALSE(bad.has_value());
    EXPECT_TRUE(bad.error().is(ErrorKind::Config));
}

// ─── JsonFileSink ────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "cs_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, AppendsLines) {
    {
        JsonFileSink sink(dir_, "scaler");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
    }
    std::ifstream in(dir_ / "scaler.ndjson");
    std::string line;
    int count = 0;
    while (std::getline(in, line)) ++count;
    EXPECT_EQ(count, 2);
}

TEST_F(JsonFileSinkTest, RotatesWhenFull) {
    JsonFileSink sink(dir_, "scaler", 1, 2);
    sink.set_max_file_size_bytes(16);

    sink.write("0123456789abcdef");  // fills the active file
    sink.write("second");            // rotates first
    sink.write("0123456789abcdef-third");
    sink.write("fourth");            // rotates again
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(dir_ / "scaler.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "scaler.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "scaler.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "scaler.3.ndjson"));

    std::ifstream active(dir_ / "scaler.ndjson");
    std::string line;
    std::getline(active, line);
    EXPECT_EQ(line, "fourth");
}
