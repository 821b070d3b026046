/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ROBOT_KING_DEVICE_H
#define ROBOT_KING_DEVICE_H

#include <Device.hpp>
#include <RobotKingStatus.hpp>
#include <memory>

/**
 * @brief RobotKing cleaning robot.
 *
 * Usage:
 *     RobotKingDevice dev(&transport, &model, &logger);
 *     dev.wakeUp();                       // only while in standby
 *     std::shared_ptr<RobotKingStatus> s = dev.poll();
 *     if (s && s->isOn()) { ... s->runState() ... }
 */
class RobotKingDevice : public Device {
public:
  RobotKingDevice(DeviceTransport* transport, const DeviceInfo* info, Logger* logger = nullptr);

  /**
   * @brief Fetch a payload and make it the current status.
   * @return The new status, or nullptr when the transport had nothing
   *         (the previous status is kept).
   */
  std::shared_ptr<RobotKingStatus> poll();

  // Replace the current status with an empty (off) one.
  std::shared_ptr<RobotKingStatus> resetStatus();

  /**
   * @brief Send the wake-up command and mark the robot as starting.
   * @throws InvalidDeviceStatus when not in standby (nothing is sent).
   */
  void wakeUp();

  std::shared_ptr<RobotKingStatus> status() const;

  // Poll hints
  void setAuxPollInterval(uint32_t v1Seconds, uint32_t v2Seconds);
  void setQueryDevice(bool on) { pollRequest_.queryDevice = on; }
  const PollRequest& pollRequest() const { return pollRequest_; }

private:
  PollRequest pollRequest_;
};

#endif // ROBOT_KING_DEVICE_H
