/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <RobotKingStatus.hpp>
#include <RobotKingDevice.hpp>
#include <Utils.hpp>

RobotKingStatus::RobotKingStatus(RobotKingDevice* device, PayloadPtr data)
: DeviceStatus(device, std::move(data)) {
  Logger* log = logger();
  if (log && log->enabled(LogLevel::Debug)) {
    log->logDebug("status", "data " + dump(), deviceId());
  }
}

// ======================================================
// Memoized derivations
// ======================================================
const std::string& RobotKingStatus::getRunState_() {
  if (!cache_.runStateValid) {
    std::string state;
    if (!lookupEnum(POWER_STATUS_KEY, state)) {
      state = STATE_ROBOT_KING_POWER_OFF;
    }
    cache_.runState = state;
    cache_.runStateValid = true;

    if (Logger* log = logger()) log->logDebug("status", "state " + state, deviceId());
  }
  return cache_.runState;
}

const std::string& RobotKingStatus::getError_() {
  if (!cache_.errorValid) {
    std::string error;
    if (!lookupReference(ERROR_STATUS_KEY, ERROR_REF_KEY, error)) {
      error = STATE_ROBOT_KING_ERROR_OFF;
    }
    cache_.error = error;
    cache_.errorValid = true;
  }
  return cache_.error;
}

bool RobotKingStatus::updateStatus(const KeyList& keys, const std::string& value) {
  if (!DeviceStatus::updateStatus(keys, value)) return false;
  cache_.runStateValid = false;
  cache_.runState.clear();
  return true;
}

// ======================================================
// Derived state
// ======================================================
bool RobotKingStatus::isOn() {
  static const std::vector<std::string> kPowerOff = { STATE_ROBOT_KING_POWER_OFF };
  return !containsAny(getRunState_(), kPowerOff);
}

bool RobotKingStatus::isRunCompleted() {
  const std::string& state = getRunState_();
  if (containsAny(state, STATE_ROBOT_KING_END)) return true;
  return !isOn();
}

bool RobotKingStatus::isError() {
  if (!isOn()) return false;
  const std::string& error = getError_();
  if (equalsAny(error, STATE_ROBOT_KING_ERROR_NO_ERROR)) return false;
  if (error == STATE_ROBOT_KING_ERROR_OFF) return false;
  return true;
}

// ======================================================
// Features
// ======================================================
std::string RobotKingStatus::runState() {
  std::string state = isOn() ? getRunState_() : std::string(STATE_OPTION_NONE);
  return updateFeature(FEAT_RUN_STATE, state);
}

std::string RobotKingStatus::errorMsg() {
  std::string error = isError() ? getError_() : std::string(STATE_OPTION_NONE);
  return updateFeature(FEAT_ERROR_MSG, error);
}

std::string RobotKingStatus::cleanMode() {
  if (!isOn()) return STATE_OPTION_NONE;

  std::string label;
  RKCleanMode mode;
  if (!lookupEnum(CLEAN_MODE_KEY, label) || !cleanModeFromLabel(label, mode)) {
    return STATE_OPTION_NONE;
  }
  return cleanModeName(mode);
}

void RobotKingStatus::updateFeatures() {
  runState();
  errorMsg();
}
