/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DEVICE_H
#define DEVICE_H

/**
 * @brief Generic cloud appliance: identity, poll, command dispatch.
 *
 * A Device does not own its collaborators:
 *  - DeviceTransport: fetches payloads and carries commands.
 *  - DeviceInfo:      capability metadata (enum/reference tables, commands).
 *  - Logger:          optional, nullptr disables logging.
 *
 * It owns the current status (shared so readers may keep an old snapshot
 * alive after the next poll replaces it).
 *
 * Calls block on the transport's future. One poll or command at a time per
 * device; the caller serializes.
 */

#include <DeviceTypes.hpp>
#include <DeviceInfo.hpp>
#include <DeviceStatus.hpp>
#include <DeviceErrors.hpp>
#include <DeviceTransport.hpp>
#include <Logger.hpp>
#include <memory>
#include <string>
#include <vector>

class Device {
public:
  Device(DeviceTransport* transport, const DeviceInfo* info, Logger* logger = nullptr);
  virtual ~Device() = default;

  DeviceTransport*  transport() const  { return transport_; }
  const DeviceInfo* deviceInfo() const { return info_; }
  Logger*           logger() const     { return logger_; }
  const std::string& deviceId() const;
  bool isInfoV2() const;

  // True until a wake-up is sent; never derived from the payload.
  bool isStandby() const { return standby_; }

  std::shared_ptr<DeviceStatus> currentStatus() const { return status_; }

  /**
   * @brief Patch the stored status ahead of the next poll.
   * @return true if the stored value changed (false without a status).
   */
  bool updateStatus(const KeyList& keys, const std::string& value);

protected:
  // ===== Poll =====
  PayloadPtr devicePoll(const PollRequest& req);

  // ===== Commands =====
  void set(const CommandKeys& cmd);
  bool getCmdKeys(const std::vector<CommandKeys>& candidates, CommandKeys& out) const;
  std::string getRunstateKey(const KeyList& stateKeys, const std::string& name) const;

  std::shared_ptr<DeviceStatus> status_;
  bool                          standby_ = true;

private:
  DeviceTransport*  transport_;
  const DeviceInfo* info_;
  Logger*           logger_;
};

#endif // DEVICE_H
