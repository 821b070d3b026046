/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ROBOT_KING_STATUS_H
#define ROBOT_KING_STATUS_H

#include <DeviceStatus.hpp>
#include <RobotKingVocab.hpp>
#include <string>

class RobotKingDevice;

/**
 * @brief Normalized view of one RobotKing payload.
 *
 * Run state and error are resolved lazily and memoized for the life of the
 * snapshot. updateStatus() drops the run-state memo only; the error memo
 * stays until the next poll replaces the snapshot.
 */
class RobotKingStatus : public DeviceStatus {
public:
  explicit RobotKingStatus(RobotKingDevice* device, PayloadPtr data = nullptr);

  bool updateStatus(const KeyList& keys, const std::string& value) override;

  bool isOn();
  bool isRunCompleted();
  bool isError();

  // Feature readers (also recorded under RUN_STATE / ERROR_MSG)
  std::string runState();
  std::string errorMsg();

  // Short mode name ("ZZ", "SB", "SPOT", "MACRO"), "-" when off or unknown.
  std::string cleanMode();

protected:
  void updateFeatures() override;

private:
  const std::string& getRunState_();
  const std::string& getError_();

  struct DerivedCache {
    bool        runStateValid = false;
    std::string runState;
    bool        errorValid = false;
    std::string error;
  } cache_;
};

#endif // ROBOT_KING_STATUS_H
