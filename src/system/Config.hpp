/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>
#include <ConfigNVS.hpp>

// ==================================================
// Bridge identity
// ==================================================

#define BRIDGE_SW_VERSION              "1.2.0"
#define BRIDGE_NAME                    "rkbridge"

// ==================================================
// Device category / poll hints
// ==================================================

#define ROBOT_KING_CATEGORY            "robotKing"     // Category sent with each poll
#define ADD_FEAT_POLL_INTERVAL_S       300             // 5 minutes (aux features, v1 and v2)
#define THINQ2_QUERY_DEVICE            true            // Ask for the rich device-query payload

// ==================================================
// JSON document sizing (ArduinoJson, bytes)
// ==================================================

#define STATUS_DOC_MIN_CAPACITY        1024            // Payload-less snapshot
#define STATUS_DOC_HEADROOM            512             // Spare room for update_status patches
#define STATUS_DOC_MAX_CAPACITY        65536           // Hard cap when growing a snapshot
#define MODEL_DOC_CAPACITY             16384           // Model / capability file
#define REPLAY_DOC_CAPACITY            65536           // Recorded payload list
#define CONFIG_DOC_CAPACITY            4096            // Config store file
#define LOG_ENTRY_CAPACITY             512             // One log line
#define LOG_MESSAGE_MAX                256             // Longer messages are truncated

// ==================================================
// Default file locations (host)
// ==================================================

#define CONFIG_FILE_PATH               "rkbridge_config.json"
#define LOGFILE_PATH                   "rkbridge_log.jsonl"
#define MODEL_FILE_PATH                "robotking_model.json"
#define REPLAY_FILE_PATH               "robotking_payloads.json"

// ***********************************************
// Log levels
// ***********************************************
enum class LogLevel : uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

// ***********************************************
// Capability metadata protocol generation
// ***********************************************
enum class ProtocolVersion : uint8_t {
    V1 = 1,
    V2 = 2
};

#endif // CONFIG_H
