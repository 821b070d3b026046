/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <RobotKingVocab.hpp>

const std::vector<std::string> STATE_ROBOT_KING_END = {
    "STATE_END",
    "STATE_COMPLETE"
};

const std::vector<std::string> STATE_ROBOT_KING_ERROR_NO_ERROR = {
    "ERROR_NOERROR",
    "ERROR_NOERROR_TITLE",
    "No Error",
    "No_Error"
};

const KeyList POWER_STATUS_KEY = { "State", "state" };
const KeyList ERROR_STATUS_KEY = { "Error", "error" };
const KeyList CLEAN_MODE_KEY   = { "CleanMode", "cleanMode" };

// group, command ("" = none), no value
const std::vector<CommandKeys> CMD_WAKE_UP = {
    { "Config", "Wakeup", false, "" },
    { "Set",    "Wakeup", false, "" },
    { "WakeUp", "",       false, "" }
};

namespace {
struct CleanModeEntry {
    RKCleanMode mode;
    const char* name;
    const char* label;
};

const CleanModeEntry kCleanModes[] = {
    { RKCleanMode::ZZ,    "ZZ",    "@RK_TERM_CLEANMODE_ZIGZAG_W" },
    { RKCleanMode::SB,    "SB",    "@RK_TERM_CLEANMODE_SECTOR_W" },
    { RKCleanMode::SPOT,  "SPOT",  "@RK_TERM_CLEANMODE_FOCUS_W"  },
    { RKCleanMode::MACRO, "MACRO", "@RK_TERM_CLEANMODE_MACRO_W"  },
};
} // namespace

const char* cleanModeLabel(RKCleanMode mode) {
    for (const CleanModeEntry& e : kCleanModes) {
        if (e.mode == mode) return e.label;
    }
    return "";
}

const char* cleanModeName(RKCleanMode mode) {
    for (const CleanModeEntry& e : kCleanModes) {
        if (e.mode == mode) return e.name;
    }
    return "";
}

bool cleanModeFromLabel(const std::string& label, RKCleanMode& out) {
    for (const CleanModeEntry& e : kCleanModes) {
        if (label == e.label) {
            out = e.mode;
            return true;
        }
    }
    return false;
}

bool containsAny(const std::string& value, const std::vector<std::string>& needles) {
    for (const std::string& n : needles) {
        if (value.find(n) != std::string::npos) return true;
    }
    return false;
}

bool equalsAny(const std::string& value, const std::vector<std::string>& candidates) {
    for (const std::string& c : candidates) {
        if (value == c) return true;
    }
    return false;
}
