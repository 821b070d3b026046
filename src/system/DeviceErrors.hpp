/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DEVICE_ERRORS_H
#define DEVICE_ERRORS_H

#include <stdexcept>
#include <string>

// Base for failures raised by devices and their transports.
class DeviceError : public std::runtime_error {
public:
  explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

// Operation not allowed in the device's current state (e.g. wake-up while awake).
class InvalidDeviceStatus : public DeviceError {
public:
  explicit InvalidDeviceStatus(const std::string& what) : DeviceError(what) {}
};

// Command refused by the transport / appliance.
class CommandRejected : public DeviceError {
public:
  explicit CommandRejected(const std::string& what) : DeviceError(what) {}
};

#endif // DEVICE_ERRORS_H
