#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "utils/cpp_logger.h"

using namespace audyn::discovery::logging;

namespace {

std::vector<LogEntry> DrainAll() {
    std::vector<LogEntry> all;
    for (;;) {
        auto batch = retrieve_log_entries(0);
        if (batch.empty()) {
            return all;
        }
        all.insert(all.end(), batch.begin(), batch.end());
    }
}

class CppLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_cpp_log_level(LogLevel::DEBUG);
        DrainAll();
    }

    void TearDown() override {
        set_cpp_log_level(LogLevel::INFO);
        DrainAll();
    }
};

} // namespace

TEST_F(CppLoggerTest, CapturesFormattedMessageWithLocation) {
    LOG_CPP_INFO("stream %s on port %d", "Studio A", 5004);

    auto entries = DrainAll();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::INFO);
    EXPECT_EQ(entries[0].message, "stream Studio A on port 5004");
    EXPECT_EQ(entries[0].filename, "test_cpp_logger.cpp");
    EXPECT_GT(entries[0].line_number, 0);
}

TEST_F(CppLoggerTest, LevelFilterDropsLowerSeverity) {
    set_cpp_log_level(LogLevel::WARNING);
    LOG_CPP_DEBUG("debug");
    LOG_CPP_INFO("info");
    LOG_CPP_WARNING("warning");
    LOG_CPP_ERROR("error");

    auto entries = DrainAll();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::WARNING);
    EXPECT_EQ(entries[1].level, LogLevel::ERR);
}

TEST_F(CppLoggerTest, LongMessagesAreNotTruncated) {
    const std::string long_text(3000, 'x');
    LOG_CPP_INFO("%s", long_text.c_str());

    auto entries = DrainAll();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.size(), 3000u);
}

TEST_F(CppLoggerTest, RetrieveReturnsBoundedBatches) {
    for (int i = 0; i < 250; ++i) {
        LOG_CPP_DEBUG("message %d", i);
    }
    auto first = retrieve_log_entries(0);
    EXPECT_EQ(first.size(), 100u);
    EXPECT_EQ(first.front().message, "message 0");
    EXPECT_EQ(DrainAll().size(), 150u);
}

TEST_F(CppLoggerTest, OverflowDropsOldestAndWarnsOnce) {
    for (int i = 0; i < 2100; ++i) {
        LOG_CPP_DEBUG("flood %d", i);
    }
    auto entries = DrainAll();
    ASSERT_EQ(entries.size(), 2048u);

    int overflow_warnings = 0;
    for (const auto& entry : entries) {
        if (entry.message.find("overflow") != std::string::npos) {
            ++overflow_warnings;
        }
    }
    EXPECT_EQ(overflow_warnings, 1);
    EXPECT_EQ(entries.back().message, "flood 2099");
}

TEST_F(CppLoggerTest, RetrieveTimesOutWhenEmpty) {
    const auto start = std::chrono::steady_clock::now();
    auto entries = retrieve_log_entries(50);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(entries.empty());
    EXPECT_GE(elapsed, std::chrono::milliseconds(40));
}

TEST_F(CppLoggerTest, RetrieveWakesWhenMessageArrives) {
    std::thread producer([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        LOG_CPP_WARNING("late message");
    });
    auto entries = retrieve_log_entries(2000);
    producer.join();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "late message");
}

TEST(CppLoggerHelpersTest, BaseFilename) {
    EXPECT_STREQ(get_base_filename("/a/b/c/sap_listener.cpp"), "sap_listener.cpp");
    EXPECT_STREQ(get_base_filename("C:\\src\\file.cpp"), "file.cpp");
    EXPECT_STREQ(get_base_filename("plain.cpp"), "plain.cpp");
    EXPECT_STREQ(get_base_filename(nullptr), "");
}

TEST(CppLoggerHelpersTest, LevelNames) {
    EXPECT_STREQ(log_level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_name(LogLevel::ERR), "ERROR");
}

// Shutdown is permanent for the process, so this runs last.
TEST(CppLoggerShutdownTest, ShutdownUnblocksWaiters) {
    std::atomic<bool> returned{false};
    std::thread consumer([&returned]() {
        retrieve_log_entries(10000);
        returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    shutdown_cpp_logger();
    consumer.join();
    EXPECT_TRUE(returned);
}
