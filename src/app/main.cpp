/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <Config.hpp>

// **************************************************************
//                       Module Includes
// **************************************************************
#include <Utils.hpp>
#include <NVSManager.hpp>
#include <Logger.hpp>
#include <ModelInfo.hpp>
#include <ReplayTransport.hpp>
#include <RobotKingDevice.hpp>

#include <exception>
#include <string>

// **************************************************************
//                     Feature dump helper
// **************************************************************
static void printStatus(RobotKingStatus& st, size_t cycle) {
  DEBUGGSTART();
  DEBUG_PRINTF("[Poll %u] on=%s completed=%s error=%s\n",
               static_cast<unsigned>(cycle),
               st.isOn() ? "yes" : "no",
               st.isRunCompleted() ? "yes" : "no",
               st.isError() ? "yes" : "no");
  const FeatureMap& features = st.deviceFeatures();
  for (FeatureMap::const_iterator it = features.begin(); it != features.end(); ++it) {
    DEBUG_PRINTF("    %-10s : %s\n", it->first.c_str(), it->second.c_str());
  }
  DEBUG_PRINTF("    %-10s : %s\n", "CLEAN_MODE", st.cleanMode().c_str());
  DEBUGGSTOP();
}

// **************************************************************
//                           main()
// **************************************************************
int main(int argc, char** argv) {
  // --------------------------------------------------
  // 1) Debug console first
  // --------------------------------------------------
  Debug::begin(stdout);
  DEBUG_PRINTLN();
  DEBUG_PRINTLN("==================================================");
  DEBUG_PRINTF("[Setup] %s %s boot\n", BRIDGE_NAME, BRIDGE_SW_VERSION);
  DEBUG_PRINTLN("==================================================");

  // --------------------------------------------------
  // 2) Persistent configuration
  //    Usage: rkbridge [config.json]
  // --------------------------------------------------
  NVS::Init();
  if (argc > 1) CONF->setStoragePath(argv[1]);
  CONF->begin();
  if (!CONF->PutString(DEV_SW_KEY, BRIDGE_SW_VERSION)) {
    DEBUG_PRINTLN("[Setup] Could not record software version");
  }
  DEBUG_PRINTLN("[Setup] Config initialized.");

  // --------------------------------------------------
  // 3) Event logger
  // --------------------------------------------------
  Logger logger(CONF->GetString(LOG_PATH_KEY, LOGFILE_PATH),
                Logger::levelFromInt(CONF->GetInt(LOG_LEVEL_KEY, DEFAULT_LOG_LEVEL)));
  if (!logger.Begin()) {
    DEBUG_PRINTLN("[FATAL] Logger initialization failed!");
    return 1;
  }

  // --------------------------------------------------
  // 4) Capability metadata
  //    Without it codes pass through unresolved.
  // --------------------------------------------------
  ModelInfo model;
  const std::string modelPath = CONF->GetString(MODEL_PATH_KEY, MODEL_FILE_PATH);
  if (!model.loadFile(modelPath)) {
    logger.logWarn("setup", "model file unavailable, codes pass through: " + modelPath);
  }
  model.setDeviceId(CONF->GetString(DEV_ID_KEY, DEFAULT_DEV_ID));

  // --------------------------------------------------
  // 5) Transport
  // --------------------------------------------------
  ReplayTransport transport(&logger);
  const std::string replayPath = CONF->GetString(REPLAY_PATH_KEY, REPLAY_FILE_PATH);
  if (!transport.loadFile(replayPath)) {
    logger.logError("setup", "cannot load payload replay: " + replayPath);
    CONF->end();
    return 1;
  }

  // --------------------------------------------------
  // 6) Device
  // --------------------------------------------------
  RobotKingDevice robot(&transport, &model, &logger);
  robot.setAuxPollInterval(CONF->GetUInt(AUX_POLL_V1_KEY, DEFAULT_AUX_POLL_S),
                           CONF->GetUInt(AUX_POLL_V2_KEY, DEFAULT_AUX_POLL_S));
  robot.setQueryDevice(CONF->GetBool(QUERY_DEVICE_KEY, DEFAULT_QUERY_DEVICE));
  logger.logInfo("setup", "device ready, model " + model.modelName(), robot.deviceId());

  if (CONF->GetBool(WAKE_ON_START_KEY, DEFAULT_WAKE_ON_START)) {
    try {
      robot.wakeUp();
    } catch (const DeviceError& e) {
      logger.logError("wakeup", e.what(), robot.deviceId());
    }
  }

  // --------------------------------------------------
  // 7) Poll loop
  // --------------------------------------------------
  const int pollCount = CONF->GetInt(POLL_COUNT_KEY, DEFAULT_POLL_COUNT);
  size_t cycle = 0;
  int rc = 0;

  while ((pollCount > 0) ? (cycle < static_cast<size_t>(pollCount)) : !transport.exhausted()) {
    ++cycle;
    try {
      std::shared_ptr<RobotKingStatus> st = robot.poll();
      if (!st) {
        DEBUG_PRINTF("[Poll %u] no payload, keeping previous status\n",
                     static_cast<unsigned>(cycle));
        continue;
      }
      printStatus(*st, cycle);
    } catch (const std::exception& e) {
      logger.logError("poll", e.what(), robot.deviceId());
      rc = 1;
      break;
    }
  }

  logger.logInfo("shutdown", "polled " + std::to_string(cycle) + " time(s)", robot.deviceId());
  CONF->end();
  return rc;
}
