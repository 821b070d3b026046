/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DEVICE_TYPES_H
#define DEVICE_TYPES_H

#include <Config.hpp>
#include <ArduinoJson.h>
#include <stdint.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Raw payload as delivered by the transport. Null means "nothing this cycle".
using PayloadPtr = std::unique_ptr<DynamicJsonDocument>;

// Case/firmware variants of one payload field, in lookup order.
using KeyList = std::vector<std::string>;

// Named feature values exposed to external readers.
using FeatureMap = std::map<std::string, std::string>;

/**
 * @brief One control command: group + command, optional literal value.
 *
 * An empty command means the group alone addresses the action
 * (e.g. "WakeUp" with no sub-command).
 */
struct CommandKeys {
    std::string group;
    std::string command;
    bool        hasValue = false;
    std::string value;
};

/**
 * @brief Hints passed to the transport with each poll.
 */
struct PollRequest {
    std::string category;
    uint32_t    auxPollIntervalV1 = ADD_FEAT_POLL_INTERVAL_S;   // seconds
    uint32_t    auxPollIntervalV2 = ADD_FEAT_POLL_INTERVAL_S;   // seconds
    bool        queryDevice       = THINQ2_QUERY_DEVICE;
};

#endif // DEVICE_TYPES_H
