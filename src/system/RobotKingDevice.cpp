/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <RobotKingDevice.hpp>
#include <RobotKingVocab.hpp>
#include <Utils.hpp>

RobotKingDevice::RobotKingDevice(DeviceTransport* transport, const DeviceInfo* info, Logger* logger)
: Device(transport, info, logger) {
  pollRequest_.category          = ROBOT_KING_CATEGORY;
  pollRequest_.auxPollIntervalV1 = ADD_FEAT_POLL_INTERVAL_S;
  pollRequest_.auxPollIntervalV2 = ADD_FEAT_POLL_INTERVAL_S;
  pollRequest_.queryDevice       = THINQ2_QUERY_DEVICE;

  status_ = std::make_shared<RobotKingStatus>(this);
}

std::shared_ptr<RobotKingStatus> RobotKingDevice::status() const {
  return std::static_pointer_cast<RobotKingStatus>(status_);
}

void RobotKingDevice::setAuxPollInterval(uint32_t v1Seconds, uint32_t v2Seconds) {
  pollRequest_.auxPollIntervalV1 = v1Seconds;
  pollRequest_.auxPollIntervalV2 = v2Seconds;
}

std::shared_ptr<RobotKingStatus> RobotKingDevice::poll() {
  PayloadPtr payload = devicePoll(pollRequest_);
  if (!payload) return nullptr;

  std::shared_ptr<RobotKingStatus> fresh = std::make_shared<RobotKingStatus>(this, std::move(payload));
  status_ = fresh;
  return fresh;
}

std::shared_ptr<RobotKingStatus> RobotKingDevice::resetStatus() {
  std::shared_ptr<RobotKingStatus> empty = std::make_shared<RobotKingStatus>(this);
  status_ = empty;
  return empty;
}

void RobotKingDevice::wakeUp() {
  if (!standby_) {
    if (Logger* log = logger()) log->logWarn("wakeup", "rejected, device not in standby", deviceId());
    throw InvalidDeviceStatus("wake-up requires standby (device " + deviceId() + ")");
  }

  CommandKeys keys;
  if (!getCmdKeys(CMD_WAKE_UP, keys)) {
    throw DeviceError("no wake-up command for device " + deviceId());
  }
  set(keys);
  standby_ = false;

  // Report "starting" right away; the next poll confirms or overrides it.
  const bool changed =
      updateStatus(POWER_STATUS_KEY, getRunstateKey(POWER_STATUS_KEY, STATE_ROBOT_KING_INITIAL));
  DEBUG_PRINTF("[RobotKing] Wake-up sent, leaving standby (status %s)\n",
               changed ? "updated" : "unchanged");
}
