/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <TestSupport.hpp>
#include <ModelInfo.hpp>
#include <RobotKingDevice.hpp>
#include <ReplayTransport.hpp>

#include <gtest/gtest.h>
#include <fstream>

namespace {
const char* kModel = R"({
  "deviceId": "rk-livingroom",
  "modelName": "RK_V2_2021",
  "protocol": 2,
  "enums": {
    "State": { "0": "STATE_POWER_OFF", "1": "STATE_INITIAL", "5": "STATE_CLEANING", "7": "STATE_END" },
    "CleanMode": { "2": "@RK_TERM_CLEANMODE_MACRO_W" }
  },
  "references": {
    "Error": { "E3": { "title": "ERROR_WHEEL", "label": "Wheel blocked" } }
  },
  "commands": [
    { "group": "Set", "command": "Wakeup" },
    { "group": "WakeUp" }
  ]
})";
} // namespace

TEST(ModelInfoTest, LoadsIdentity) {
  ModelInfo model;
  ASSERT_TRUE(model.loadJson(kModel));
  EXPECT_TRUE(model.loaded());
  EXPECT_EQ(model.deviceId(), "rk-livingroom");
  EXPECT_EQ(model.modelName(), "RK_V2_2021");
  EXPECT_EQ(model.protocol(), ProtocolVersion::V2);

  model.setDeviceId("override");
  EXPECT_EQ(model.deviceId(), "override");
}

TEST(ModelInfoTest, EnumTablesIgnoreKeyCase) {
  ModelInfo model;
  ASSERT_TRUE(model.loadJson(kModel));

  std::string out;
  ASSERT_TRUE(model.enumName("state", "7", out));
  EXPECT_EQ(out, "STATE_END");
  ASSERT_TRUE(model.enumName("STATE", "5", out));
  EXPECT_EQ(out, "STATE_CLEANING");
  EXPECT_FALSE(model.enumName("State", "99", out));
  EXPECT_FALSE(model.enumName("Battery", "1", out));

  ASSERT_TRUE(model.enumValue("state", "STATE_INITIAL", out));
  EXPECT_EQ(out, "1");
  EXPECT_FALSE(model.enumValue("state", "STATE_UNKNOWN", out));
}

TEST(ModelInfoTest, ReferenceAttributes) {
  ModelInfo model;
  ASSERT_TRUE(model.loadJson(kModel));

  std::string out;
  ASSERT_TRUE(model.referenceName("error", "E3", "title", out));
  EXPECT_EQ(out, "ERROR_WHEEL");
  ASSERT_TRUE(model.referenceName("Error", "E3", "label", out));
  EXPECT_EQ(out, "Wheel blocked");
  EXPECT_FALSE(model.referenceName("Error", "E3", "code", out));
  EXPECT_FALSE(model.referenceName("Error", "E4", "title", out));
}

TEST(ModelInfoTest, SupportedCommands) {
  ModelInfo model;
  ASSERT_TRUE(model.loadJson(kModel));
  EXPECT_TRUE(model.isCommandSupported("Set", "Wakeup"));
  EXPECT_TRUE(model.isCommandSupported("WakeUp", ""));
  EXPECT_FALSE(model.isCommandSupported("Config", "Wakeup"));
  EXPECT_FALSE(model.isCommandSupported("set", "Wakeup"));
}

TEST(ModelInfoTest, RejectsBadInput) {
  ModelInfo model;
  EXPECT_FALSE(model.loadJson("{ not json"));
  EXPECT_FALSE(model.loadJson("[1,2,3]"));
  EXPECT_FALSE(model.loadFile(tempPath("missing_model.json")));
  EXPECT_FALSE(model.loaded());
  EXPECT_EQ(model.protocol(), ProtocolVersion::V1);
}

TEST(ModelInfoTest, LoadsFromFile) {
  const std::string path = tempPath("model.json");
  {
    std::ofstream out(path);
    out << kModel;
  }
  ModelInfo model;
  ASSERT_TRUE(model.loadFile(path));
  EXPECT_EQ(model.modelName(), "RK_V2_2021");
}

// Model + replay + device wired the way the bridge runs them.
TEST(ModelInfoTest, DrivesRobotKingEndToEnd) {
  ModelInfo model;
  ASSERT_TRUE(model.loadJson(kModel));

  ReplayTransport transport;
  ASSERT_TRUE(transport.loadJson(R"([
    {"state":"0"},
    {"State":"5","Error":"E3","CleanMode":"2"},
    {"State":{"state":"7"},"Error":{"error":"ERROR_NOERROR"}}
  ])"));

  RobotKingDevice robot(&transport, &model);

  std::shared_ptr<RobotKingStatus> off = robot.poll();
  ASSERT_NE(off, nullptr);
  EXPECT_FALSE(off->isOn());

  robot.wakeUp();
  ASSERT_EQ(transport.sentCommands().size(), 1u);
  EXPECT_EQ(transport.sentCommands()[0].group, "Set");
  EXPECT_EQ(off->data()["state"].as<std::string>(), "1");
  EXPECT_EQ(off->runState(), "STATE_INITIAL");

  std::shared_ptr<RobotKingStatus> cleaning = robot.poll();
  ASSERT_NE(cleaning, nullptr);
  EXPECT_EQ(cleaning->runState(), "STATE_CLEANING");
  EXPECT_TRUE(cleaning->isError());
  EXPECT_EQ(cleaning->errorMsg(), "ERROR_WHEEL");
  EXPECT_EQ(cleaning->cleanMode(), "MACRO");

  std::shared_ptr<RobotKingStatus> done = robot.poll();
  ASSERT_NE(done, nullptr);
  EXPECT_TRUE(done->isRunCompleted());
  EXPECT_EQ(done->runState(), "STATE_END");
  EXPECT_EQ(done->errorMsg(), "-");

  EXPECT_TRUE(transport.exhausted());
  EXPECT_EQ(robot.poll(), nullptr);
  EXPECT_EQ(robot.status(), done);
}
