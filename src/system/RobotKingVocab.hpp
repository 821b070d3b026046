/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ROBOT_KING_VOCAB_H
#define ROBOT_KING_VOCAB_H

#include <DeviceTypes.hpp>
#include <string>
#include <vector>

// ==================================================
// Sentinels (matched by containment unless noted)
// ==================================================

#define STATE_ROBOT_KING_POWER_OFF     "STATE_POWER_OFF"
#define STATE_ROBOT_KING_INITIAL       "STATE_INITIAL"   // Eager value after wake-up
#define STATE_ROBOT_KING_ERROR_OFF     "OFF"             // Compared by equality

// Canonical "nothing to report" feature value.
#define STATE_OPTION_NONE              "-"

// Feature side-channel keys.
#define FEAT_RUN_STATE                 "RUN_STATE"
#define FEAT_ERROR_MSG                 "ERROR_MSG"

// Reference attribute holding the human-readable error title.
#define ERROR_REF_KEY                  "title"

extern const std::vector<std::string> STATE_ROBOT_KING_END;            // Terminal run states
extern const std::vector<std::string> STATE_ROBOT_KING_ERROR_NO_ERROR; // Equality matches

// ==================================================
// Payload field aliases
// ==================================================

extern const KeyList POWER_STATUS_KEY;   // "State", "state"
extern const KeyList ERROR_STATUS_KEY;   // "Error", "error"
extern const KeyList CLEAN_MODE_KEY;     // "CleanMode", "cleanMode"

// ==================================================
// Command templates (ordered, earlier = preferred)
// ==================================================

extern const std::vector<CommandKeys> CMD_WAKE_UP;

// ==================================================
// Cleaning modes
// ==================================================
enum class RKCleanMode : uint8_t {
    ZZ,      // zig-zag
    SB,      // sector
    SPOT,    // focus
    MACRO
};

const char* cleanModeLabel(RKCleanMode mode);
bool cleanModeFromLabel(const std::string& label, RKCleanMode& out);
const char* cleanModeName(RKCleanMode mode);

// ==================================================
// Classification helpers
// ==================================================

bool containsAny(const std::string& value, const std::vector<std::string>& needles);
bool equalsAny(const std::string& value, const std::vector<std::string>& candidates);

#endif // ROBOT_KING_VOCAB_H
