#include <gtest/gtest.h>
#include "Logger.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace omega;

TEST(LoggerTest, SingleThreadedPushPop) {
    Logger logger;

    logger.info("TEST", "Hello World");
    logger.error("ALSA", "Device busy");

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->level, LogEntry::Level::Info);
    EXPECT_STREQ(entry1->tag, "TEST");
    EXPECT_STREQ(entry1->message, "Hello World");

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->level, LogEntry::Level::Error);
    EXPECT_STREQ(entry2->tag, "ALSA");

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, BelowMinLevelIsDiscarded) {
    Logger logger(Logger::Level::Warning);

    logger.debug("DSP", "noise");
    logger.info("DSP", "noise");
    logger.warn("DSP", "kept");

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_STREQ(entry->message, "kept");
    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, LongMessagesAreTruncated) {
    Logger logger;
    const std::string long_tag(100, 't');
    const std::string long_message(500, 'm');

    logger.info(long_tag.c_str(), long_message);

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::string(entry->tag).size(), sizeof(entry->tag) - 1);
    EXPECT_EQ(std::string(entry->message).size(), sizeof(entry->message) - 1);
}

TEST(LoggerTest, FlushWritesEveryPendingEntry) {
    Logger logger;
    logger.info("AudioManager", "Capture started");
    logger.warn("AudioManager", "No input device available");

    std::ostringstream out;
    EXPECT_EQ(logger.flush(out), 2u);
    EXPECT_EQ(out.str(),
              "[INFO] AudioManager: Capture started\n"
              "[WARN] AudioManager: No input device available\n");
    EXPECT_EQ(logger.flush(out), 0u);
}

TEST(LoggerTest, OverflowCountsDroppedEntries) {
    Logger logger;
    // Capacity is one less than the ring size
    for (int i = 0; i < 1100; ++i) {
        logger.info("FILL", "entry");
    }
    EXPECT_GT(logger.dropped(), 0u);

    size_t drained = 0;
    while (logger.pop_entry()) ++drained;
    EXPECT_EQ(drained + logger.dropped(), 1100u);
}

TEST(LoggerTest, MultiThreadedCapture) {
    Logger logger;

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;

    // Reader thread
    std::thread reader([&]() {
        while (running) {
            if (auto entry = logger.pop_entry()) {
                captured.push_back(*entry);
            } else {
                std::this_thread::yield();
            }
        }
        while (auto entry = logger.pop_entry()) {
            captured.push_back(*entry);
        }
    });

    // Two writers
    auto write = [&](const char* tag) {
        for (int i = 0; i < 100; ++i) {
            logger.info(tag, std::to_string(i));
        }
    };
    std::thread control(write, "CONTROL");
    std::thread processing(write, "PROC");

    control.join();
    processing.join();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    running = false;
    reader.join();

    EXPECT_EQ(captured.size() + logger.dropped(), 200u);
    EXPECT_EQ(logger.dropped(), 0u);
}
