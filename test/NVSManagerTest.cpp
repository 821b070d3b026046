/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <TestSupport.hpp>
#include <NVSManager.hpp>

#include <gtest/gtest.h>
#include <fstream>

// The store is a process-wide singleton; each test points it at its own file.
class NVSManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    NVS::Init();
    path_ = tempPath("config.json");
    CONF->setStoragePath(path_);
  }

  void TearDown() override {
    CONF->end();
  }

  void reopen() {
    CONF->end();
    CONF->setStoragePath(tempPath("other.json"));
    CONF->setStoragePath(path_);
    CONF->begin();
  }

  std::string path_;
};

TEST_F(NVSManagerTest, FirstStartWritesDefaults) {
  CONF->begin();
  EXPECT_FALSE(CONF->getResetFlag());
  EXPECT_EQ(CONF->GetString(DEV_ID_KEY, ""), DEFAULT_DEV_ID);
  EXPECT_EQ(CONF->GetInt(LOG_LEVEL_KEY, -1), DEFAULT_LOG_LEVEL);
  EXPECT_EQ(CONF->GetInt(AUX_POLL_V1_KEY, -1), DEFAULT_AUX_POLL_S);
  EXPECT_EQ(CONF->GetInt(AUX_POLL_V2_KEY, -1), DEFAULT_AUX_POLL_S);
  EXPECT_TRUE(CONF->GetBool(QUERY_DEVICE_KEY, false));
  EXPECT_FALSE(CONF->GetBool(WAKE_ON_START_KEY, true));
  EXPECT_EQ(CONF->GetString(REPLAY_PATH_KEY, ""), REPLAY_FILE_PATH);

  std::ifstream in(path_);
  EXPECT_TRUE(in.is_open());
}

TEST_F(NVSManagerTest, ValuesPersistAcrossReopen) {
  CONF->begin();
  ASSERT_TRUE(CONF->PutInt(AUX_POLL_V1_KEY, 60));
  ASSERT_TRUE(CONF->PutString(DEV_ID_KEY, "rk-kitchen"));
  ASSERT_TRUE(CONF->PutFloat("RATIO", 0.5f));

  reopen();
  EXPECT_EQ(CONF->GetInt(AUX_POLL_V1_KEY, -1), 60);
  EXPECT_EQ(CONF->GetString(DEV_ID_KEY, ""), "rk-kitchen");
  EXPECT_FLOAT_EQ(CONF->GetFloat("RATIO", 0.0f), 0.5f);
}

TEST_F(NVSManagerTest, MissingKeysRestoredOnBegin) {
  CONF->begin();
  ASSERT_TRUE(CONF->RemoveKey(POLL_COUNT_KEY));
  EXPECT_FALSE(CONF->isKey(POLL_COUNT_KEY));
  EXPECT_FALSE(CONF->RemoveKey(POLL_COUNT_KEY));

  reopen();
  EXPECT_TRUE(CONF->isKey(POLL_COUNT_KEY));
  EXPECT_EQ(CONF->GetInt(POLL_COUNT_KEY, -1), DEFAULT_POLL_COUNT);
}

TEST_F(NVSManagerTest, ResetFlagRestoresDefaults) {
  CONF->begin();
  ASSERT_TRUE(CONF->PutString(DEV_ID_KEY, "rk-kitchen"));
  ASSERT_TRUE(CONF->PutBool(RESET_FLAG, true));

  reopen();
  EXPECT_EQ(CONF->GetString(DEV_ID_KEY, ""), DEFAULT_DEV_ID);
  EXPECT_FALSE(CONF->getResetFlag());
}

TEST_F(NVSManagerTest, WrongTypeReturnsDefault) {
  CONF->begin();
  EXPECT_EQ(CONF->GetInt(DEV_ID_KEY, 42), 42);
  EXPECT_EQ(CONF->GetString(LOG_LEVEL_KEY, "none"), "none");
  EXPECT_TRUE(CONF->GetBool("NOPE", true));
}

TEST_F(NVSManagerTest, CorruptFileStartsFromDefaults) {
  {
    std::ofstream out(path_);
    out << "{ broken";
  }
  CONF->begin();
  EXPECT_EQ(CONF->GetString(DEV_ID_KEY, ""), DEFAULT_DEV_ID);
}

TEST_F(NVSManagerTest, ClearAllEmptiesStore) {
  CONF->begin();
  ASSERT_TRUE(CONF->ClearAll());
  EXPECT_FALSE(CONF->isKey(DEV_ID_KEY));
  EXPECT_TRUE(CONF->getResetFlag());
}

TEST_F(NVSManagerTest, UnsignedGetterRejectsNegativeValues) {
  CONF->begin();
  EXPECT_EQ(CONF->GetUInt(AUX_POLL_V1_KEY, 1), static_cast<uint32_t>(DEFAULT_AUX_POLL_S));

  ASSERT_TRUE(CONF->PutInt(AUX_POLL_V1_KEY, -5));
  EXPECT_EQ(CONF->GetUInt(AUX_POLL_V1_KEY, DEFAULT_AUX_POLL_S), static_cast<uint32_t>(DEFAULT_AUX_POLL_S));

  ASSERT_TRUE(CONF->PutInt(AUX_POLL_V1_KEY, 60));
  EXPECT_EQ(CONF->GetUInt(AUX_POLL_V1_KEY, DEFAULT_AUX_POLL_S), 60u);

  EXPECT_EQ(CONF->GetUInt(DEV_ID_KEY, 7), 7u);
}
