/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <TestSupport.hpp>
#include <Logger.hpp>

#include <gtest/gtest.h>
#include <sstream>
#include <vector>

namespace {
std::vector<std::string> lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}
} // namespace

TEST(LoggerTest, WritesStructuredEntries) {
  Logger logger(tempPath("events.jsonl"), LogLevel::Debug);
  ASSERT_TRUE(logger.Begin());

  logger.logInfo("poll", "payload received", "rk-1");
  logger.logError("command", "refused");

  std::vector<std::string> entries = lines(logger.readLogFile());
  ASSERT_EQ(entries.size(), 2u);

  StaticJsonDocument<LOG_ENTRY_CAPACITY> doc;
  ASSERT_TRUE(deserializeJson(doc, entries[0]) == DeserializationError::Ok);
  EXPECT_STREQ(doc["level"].as<const char*>(), "info");
  EXPECT_STREQ(doc["event_type"].as<const char*>(), "poll");
  EXPECT_STREQ(doc["message"].as<const char*>(), "payload received");
  EXPECT_STREQ(doc["device_id"].as<const char*>(), "rk-1");
  EXPECT_TRUE(doc.containsKey("timestamp"));

  ASSERT_TRUE(deserializeJson(doc, entries[1]) == DeserializationError::Ok);
  EXPECT_STREQ(doc["level"].as<const char*>(), "error");
  EXPECT_FALSE(doc.containsKey("device_id"));
}

TEST(LoggerTest, DropsEntriesBelowMinimumLevel) {
  Logger logger(tempPath("filtered.jsonl"), LogLevel::Warn);
  ASSERT_TRUE(logger.Begin());

  logger.logDebug("status", "noise");
  logger.logInfo("status", "noise");
  logger.logWarn("status", "kept");
  EXPECT_EQ(lines(logger.readLogFile()).size(), 1u);

  logger.setMinLevel(LogLevel::Debug);
  EXPECT_TRUE(logger.enabled(LogLevel::Debug));
  logger.logDebug("status", "now kept");
  EXPECT_EQ(lines(logger.readLogFile()).size(), 2u);
}

TEST(LoggerTest, ClearAndDeleteLogFile) {
  Logger logger(tempPath("clear.jsonl"));
  ASSERT_TRUE(logger.Begin());
  logger.logInfo("setup", "hello");
  ASSERT_TRUE(logger.clearLogFile());
  EXPECT_TRUE(logger.readLogFile().empty());
  EXPECT_TRUE(logger.deleteLogFile());
  EXPECT_FALSE(logger.deleteLogFile());
}

TEST(LoggerTest, ConsoleOnlyLoggerAcceptsEntries) {
  Logger logger("", LogLevel::Info);
  ASSERT_TRUE(logger.Begin());

  StaticJsonDocument<128> entry;
  entry["event_type"] = "setup";
  EXPECT_TRUE(logger.addLogEntry(entry.as<JsonObjectConst>()));
  EXPECT_TRUE(logger.readLogFile().empty());
}

TEST(LoggerTest, RefusesEntriesBeforeBegin) {
  Logger logger(tempPath("early.jsonl"));
  StaticJsonDocument<128> entry;
  entry["event_type"] = "setup";
  EXPECT_FALSE(logger.addLogEntry(entry.as<JsonObjectConst>()));
}

TEST(LoggerTest, LevelNames) {
  EXPECT_STREQ(Logger::levelName(LogLevel::Warn), "warn");
  EXPECT_EQ(Logger::levelFromInt(0), LogLevel::Debug);
  EXPECT_EQ(Logger::levelFromInt(2), LogLevel::Warn);
  EXPECT_EQ(Logger::levelFromInt(9), LogLevel::Error);
}

TEST(LoggerTest, ClipKeepsUtf8CharactersWhole) {
  const std::string head(255, 'a');
  EXPECT_EQ(Logger::clip(head + "\xC3\xA9" + "bbb", 256), head + "...");
  EXPECT_EQ(Logger::clip(head + "bbbb", 256), head + "b...");
  EXPECT_EQ(Logger::clip("short", 256), "short");
}

TEST(LoggerTest, LongMessagesAreClippedInTheLog) {
  Logger logger(tempPath("clipped.jsonl"), LogLevel::Info);
  ASSERT_TRUE(logger.Begin());

  const std::string head(LOG_MESSAGE_MAX - 1, 'a');
  logger.logInfo("poll", head + "\xC3\xA9 tail");

  std::vector<std::string> entries = lines(logger.readLogFile());
  ASSERT_EQ(entries.size(), 1u);
  StaticJsonDocument<LOG_ENTRY_CAPACITY> doc;
  ASSERT_TRUE(deserializeJson(doc, entries[0]) == DeserializationError::Ok);
  EXPECT_EQ(doc["message"].as<std::string>(), head + "...");
}
