/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef LOGGER_H
#define LOGGER_H

#include <Config.hpp>
#include <Utils.hpp>
#include <ArduinoJson.h>
#include <mutex>
#include <string>

/**
 * @brief Leveled, structured event log.
 *
 * Each entry is one JSON object per line:
 *   {"timestamp":"2026-10-19 12:00:00","level":"info","event_type":"poll",
 *    "message":"...","device_id":"..."}
 *
 * Entries below the minimum level are dropped. When a file path is set the
 * entry is appended to it; with DEBUGMODE the line is also echoed to the
 * debug console. Not a singleton: owners pass a Logger* to whoever logs.
 */
class Logger {
public:
    explicit Logger(const std::string& path = LOGFILE_PATH,
                    LogLevel minLevel = LogLevel::Info);

    bool Begin();                                   // Prepare the log file (creates it if missing)
    bool addLogEntry(const JsonObjectConst& entry); // Append one entry (timestamp/level added here)
    std::string readLogFile();                      // Entire log content
    bool clearLogFile();
    bool deleteLogFile();
    bool createLogFile();

    void setMinLevel(LogLevel level) { minLevel_ = level; }
    LogLevel minLevel() const { return minLevel_; }
    bool enabled(LogLevel level) const { return level >= minLevel_; }

    // Leveled helpers; deviceId may be empty.
    void log(LogLevel level, const char* eventType, const std::string& message,
             const std::string& deviceId = std::string());
    void logDebug(const char* eventType, const std::string& message,
                  const std::string& deviceId = std::string());
    void logInfo(const char* eventType, const std::string& message,
                 const std::string& deviceId = std::string());
    void logWarn(const char* eventType, const std::string& message,
                 const std::string& deviceId = std::string());
    void logError(const char* eventType, const std::string& message,
                  const std::string& deviceId = std::string());

    static const char* levelName(LogLevel level);
    static std::string clip(const std::string& message, size_t maxBytes);
    static LogLevel levelFromInt(int v);

private:
    std::string timestamp_() const;

    std::string path_;           // "" = console only
    LogLevel    minLevel_;
    bool        initialized_ = false;
    std::mutex  mutex_;
};

#endif // LOGGER_H
