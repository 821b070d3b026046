/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <TestSupport.hpp>
#include <ReplayTransport.hpp>
#include <DeviceErrors.hpp>

#include <gtest/gtest.h>
#include <fstream>

TEST(ReplayTransportTest, ServesPayloadsInOrderWithEmptyPolls) {
  ReplayTransport transport;
  ASSERT_TRUE(transport.loadJson(R"([{"State":"A"}, null, {"State":"B"}])"));
  EXPECT_EQ(transport.remaining(), 3u);

  PollRequest req;
  req.category = "robotKing";

  PayloadPtr first = transport.requestPayload(req).get();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ((*first)["State"].as<std::string>(), "A");

  EXPECT_EQ(transport.requestPayload(req).get(), nullptr);

  PayloadPtr third = transport.requestPayload(req).get();
  ASSERT_NE(third, nullptr);
  EXPECT_EQ((*third)["State"].as<std::string>(), "B");

  EXPECT_TRUE(transport.exhausted());
  EXPECT_EQ(transport.requestPayload(req).get(), nullptr);
  EXPECT_EQ(transport.pollCount(), 4u);
  EXPECT_EQ(transport.lastRequest().category, "robotKing");
}

TEST(ReplayTransportTest, AcceptsEveryCommandWithoutList) {
  ReplayTransport transport;
  CommandKeys cmd;
  cmd.group = "Config";
  cmd.command = "Wakeup";

  transport.sendCommand(cmd).get();
  ASSERT_EQ(transport.sentCommands().size(), 1u);
  EXPECT_EQ(transport.sentCommands()[0].group, "Config");
}

TEST(ReplayTransportTest, RejectsCommandsOutsideAcceptedList) {
  ReplayTransport transport;
  ASSERT_TRUE(transport.loadJson(R"({
    "payloads": [ {"State":"STATE_POWER_OFF"} ],
    "accepted_commands": [ {"group":"WakeUp"} ]
  })"));

  CommandKeys refused;
  refused.group = "Set";
  refused.command = "Wakeup";
  std::future<void> pending = transport.sendCommand(refused);
  EXPECT_THROW(pending.get(), CommandRejected);
  EXPECT_TRUE(transport.sentCommands().empty());

  CommandKeys wake;
  wake.group = "WakeUp";
  transport.sendCommand(wake).get();
  EXPECT_EQ(transport.sentCommands().size(), 1u);
}

TEST(ReplayTransportTest, PushPayloadQueuesAfterLoaded) {
  ReplayTransport transport;
  ASSERT_TRUE(transport.loadJson(R"([{"State":"A"}])"));
  transport.pushPayload(nullptr);
  transport.pushPayload(payload(R"({"State":"C"})"));
  EXPECT_EQ(transport.remaining(), 3u);
}

TEST(ReplayTransportTest, RejectsMalformedReplay) {
  ReplayTransport transport;
  EXPECT_FALSE(transport.loadJson("not json"));
  EXPECT_FALSE(transport.loadJson(R"({"payload":[]})"));
  EXPECT_FALSE(transport.loadFile(tempPath("missing_replay.json")));
  EXPECT_TRUE(transport.exhausted());
}

TEST(ReplayTransportTest, LoadsFromFile) {
  const std::string path = tempPath("replay.json");
  {
    std::ofstream out(path);
    out << R"([{"state":"STATE_CLEANING"}, {}])";
  }
  ReplayTransport transport;
  ASSERT_TRUE(transport.loadFile(path));
  EXPECT_EQ(transport.remaining(), 2u);
}

TEST(ReplayTransportTest, ParsePayloadGrowsForLargeInput) {
  std::string json = "{";
  for (int i = 0; i < 400; ++i) {
    if (i) json += ",";
    json += "\"k" + std::to_string(i) + "\":" + std::to_string(i);
  }
  json += "}";

  std::string error;
  PayloadPtr doc = parsePayload(json, &error);
  ASSERT_NE(doc, nullptr) << error;
  EXPECT_EQ((*doc)["k399"].as<int>(), 399);
  EXPECT_GE(doc->capacity(), json.size() * 4 + STATUS_DOC_HEADROOM);

  PayloadPtr small = parsePayload("{}");
  ASSERT_NE(small, nullptr);
  EXPECT_GE(small->capacity(), static_cast<size_t>(STATUS_DOC_MIN_CAPACITY));

  EXPECT_EQ(parsePayload("{\"a\":", &error), nullptr);
  EXPECT_FALSE(error.empty());
}

TEST(ReplayTransportTest, AcceptCommandRestrictsDispatch) {
  ReplayTransport transport;
  transport.acceptCommand("Config", "Wakeup");

  CommandKeys set;
  set.group = "Set";
  set.command = "Wakeup";
  EXPECT_THROW(transport.sendCommand(set).get(), CommandRejected);

  CommandKeys config;
  config.group = "Config";
  config.command = "Wakeup";
  transport.sendCommand(config).get();
  ASSERT_EQ(transport.sentCommands().size(), 1u);
  EXPECT_EQ(transport.sentCommands()[0].group, "Config");
}

TEST(ReplayTransportTest, OversizedPayloadRejectsWholeReplay) {
  Logger logger(tempPath("replay_events.jsonl"), LogLevel::Debug);
  ASSERT_TRUE(logger.Begin());

  ReplayTransport transport(&logger);
  const std::string blob(17000, 'x');
  EXPECT_FALSE(transport.loadJson("[{\"State\":\"A\"},{\"blob\":\"" + blob + "\"}]"));
  EXPECT_TRUE(transport.exhausted());

  const std::string log = logger.readLogFile();
  EXPECT_NE(log.find("replay rejected"), std::string::npos);
  EXPECT_EQ(log.find("Skipping"), std::string::npos);
}
