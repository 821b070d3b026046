/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DEVICE_INFO_H
#define DEVICE_INFO_H

#include <Config.hpp>
#include <string>

/**
 * @brief Read-only capability metadata for one appliance.
 *
 * Lookups return false when the table or entry is unknown; callers decide
 * whether to fall back to the raw code.
 */
class DeviceInfo {
public:
    virtual ~DeviceInfo() = default;

    virtual const std::string& deviceId() const = 0;
    virtual const std::string& modelName() const = 0;
    virtual ProtocolVersion protocol() const = 0;

    // Enum code -> label (e.g. "7" -> "STATE_END")
    virtual bool enumName(const std::string& key, const std::string& code,
                          std::string& out) const = 0;

    // Label -> enum code (reverse of enumName)
    virtual bool enumValue(const std::string& key, const std::string& name,
                           std::string& out) const = 0;

    // Reference code -> record[refKey] (e.g. "E3" -> "ERROR_WHEEL")
    virtual bool referenceName(const std::string& key, const std::string& code,
                               const std::string& refKey, std::string& out) const = 0;

    // Empty command = the group alone is the action.
    virtual bool isCommandSupported(const std::string& group,
                                    const std::string& command) const = 0;
};

#endif // DEVICE_INFO_H
