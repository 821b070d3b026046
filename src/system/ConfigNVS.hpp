/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_NVS_HPP
#define CONFIG_NVS_HPP

#define CONFIG_PARTITION               "config"    // Root object name inside the config file

// ==================================================
// Bridge Configuration Keys & Defaults
// ==================================================

// ---------- Storage ----------
#define RESET_FLAG                     "RTFLG"     // Config reset flag (true = write defaults)

// ---------- Identity ----------
#define DEV_ID_KEY                     "DEVID"     // Appliance id reported to the cloud
#define DEV_SW_KEY                     "DEVSW"     // Bridge software version

// ---------- Files ----------
#define MODEL_PATH_KEY                 "MDLPTH"    // Capability/model metadata file
#define REPLAY_PATH_KEY                "RPLPTH"    // Recorded payload list file
#define LOG_PATH_KEY                   "LOGPTH"    // JSON-lines log file ("" = console only)

// ---------- Logging ----------
#define LOG_LEVEL_KEY                  "LOGLVL"    // int: 0=debug 1=info 2=warn 3=error

// ---------- Polling ----------
#define AUX_POLL_V1_KEY                "APIV1"     // int: aux feature poll interval (v1) [s]
#define AUX_POLL_V2_KEY                "APIV2"     // int: aux feature poll interval (v2) [s]
#define QUERY_DEVICE_KEY               "QRYDEV"    // bool: request rich device-query payload
#define POLL_COUNT_KEY                 "POLLCT"    // int: polls per run (0 = until replay ends)

// ---------- Commands ----------
#define WAKE_ON_START_KEY              "WAKEST"    // bool: send wake-up before first poll

// ---------- Defaults ----------
#define DEFAULT_DEV_ID                 "robotking-0"
#define DEFAULT_LOG_LEVEL              1
#define DEFAULT_AUX_POLL_S             300
#define DEFAULT_QUERY_DEVICE           true
#define DEFAULT_POLL_COUNT             0
#define DEFAULT_WAKE_ON_START          false

#endif // CONFIG_NVS_HPP
