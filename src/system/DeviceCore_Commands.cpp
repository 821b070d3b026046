/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <Device.hpp>
#include <Utils.hpp>

void Device::set(const CommandKeys& cmd) {
  if (!transport_) {
    throw DeviceError("device " + deviceId() + " has no transport");
  }

  DEBUG_PRINTF("[Device] Command %s/%s%s%s\n",
               cmd.group.c_str(),
               cmd.command.empty() ? "-" : cmd.command.c_str(),
               cmd.hasValue ? " = " : "",
               cmd.hasValue ? cmd.value.c_str() : "");

  std::future<void> ack = transport_->sendCommand(cmd);
  try {
    ack.get();
  } catch (const std::exception& e) {
    if (logger_) {
      logger_->logError("command", cmd.group + "/" + cmd.command + " failed: " + e.what(),
                        deviceId());
    }
    throw;
  }

  if (logger_) logger_->logInfo("command", cmd.group + "/" + cmd.command + " sent", deviceId());
}

/**
 * @brief Pick the command variant this appliance understands.
 *
 * First candidate the DeviceInfo reports as supported wins. When none is
 * reported (or there is no DeviceInfo), falls back to the protocol slot:
 * candidates[0] for v1, candidates[1] for v2.
 */
bool Device::getCmdKeys(const std::vector<CommandKeys>& candidates, CommandKeys& out) const {
  if (candidates.empty()) return false;

  if (info_) {
    for (const CommandKeys& c : candidates) {
      if (info_->isCommandSupported(c.group, c.command)) {
        out = c;
        return true;
      }
    }
  }

  const size_t slot = (isInfoV2() && candidates.size() > 1) ? 1 : 0;
  out = candidates[slot];
  if (logger_) {
    logger_->logWarn("command", "no supported variant, using " + out.group + "/" + out.command,
                     deviceId());
  }
  return true;
}

// Device code for a run-state label; the label itself when unknown.
std::string Device::getRunstateKey(const KeyList& stateKeys, const std::string& name) const {
  if (info_ && !stateKeys.empty()) {
    const size_t preferred = (isInfoV2() && stateKeys.size() > 1) ? 1 : 0;
    std::string code;
    if (info_->enumValue(stateKeys[preferred], name, code)) return code;
    for (const std::string& key : stateKeys) {
      if (info_->enumValue(key, name, code)) return code;
    }
  }
  return name;
}
