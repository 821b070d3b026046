/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <Logger.hpp>

#include <stdio.h>
#include <time.h>
#include <fstream>
#include <sstream>

Logger::Logger(const std::string& path, LogLevel minLevel)
: path_(path),
  minLevel_(minLevel) {
}

bool Logger::Begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting Event Logger                   #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    if (path_.empty()) {
        DEBUG_PRINTLN("[Logger] Console only (no log file)");
        initialized_ = true;
        return true;
    }

    std::ifstream probe(path_);
    if (!probe.is_open()) {
        DEBUG_PRINTLN("[Logger] Log file not found. Creating a new one.");
        if (!createLogFile()) return false;
    } else {
        DEBUG_PRINTLN("[Logger] Log file already exists.");
    }

    initialized_ = true;
    return true;
}

std::string Logger::timestamp_() const {
    time_t now = time(nullptr);
    struct tm tmv;
    localtime_r(&now, &tmv);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return buf;
}

bool Logger::addLogEntry(const JsonObjectConst& entry) {
    if (!initialized_) return false;

    StaticJsonDocument<LOG_ENTRY_CAPACITY> line;
    line["timestamp"] = timestamp_();
    for (JsonPairConst kv : entry) {
        line[kv.key().c_str()] = kv.value();
    }

    std::string text;
    serializeJson(line, text);

    std::lock_guard<std::mutex> lk(mutex_);
    if (DEBUGMODE) {
        DEBUG_PRINTLN(text);
    }
    if (path_.empty()) return true;

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        DEBUG_PRINTLN("[Logger] Failed to open log file for appending");
        return false;
    }
    out << text << '\n';
    return out.good();
}

std::string Logger::readLogFile() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!initialized_ || path_.empty()) return std::string();

    std::ifstream in(path_);
    if (!in.is_open()) {
        DEBUG_PRINTLN("[Logger] Failed to open log file for reading");
        return std::string();
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool Logger::clearLogFile() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!initialized_ || path_.empty()) return false;

    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) {
        DEBUG_PRINTLN("[Logger] Failed to clear log file");
        return false;
    }
    DEBUG_PRINTLN("[Logger] Log file cleared");
    return true;
}

bool Logger::deleteLogFile() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!initialized_ || path_.empty()) return false;
    return remove(path_.c_str()) == 0;
}

bool Logger::createLogFile() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (path_.empty()) return false;

    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) {
        DEBUG_PRINTLN("[Logger] Failed to create log file");
        return false;
    }
    DEBUG_PRINTLN("[Logger] Log file created");
    return true;
}

// Leveled helpers

void Logger::log(LogLevel level, const char* eventType, const std::string& message,
                 const std::string& deviceId) {
    if (!enabled(level)) return;

    StaticJsonDocument<LOG_ENTRY_CAPACITY> doc;
    doc["level"]      = levelName(level);
    doc["event_type"] = eventType;
    doc["message"] = clip(message, LOG_MESSAGE_MAX);
    if (!deviceId.empty()) {
        doc["device_id"] = deviceId;
    }
    if (!addLogEntry(doc.as<JsonObjectConst>())) {
        DEBUG_PRINTF("[Logger] Dropped %s entry: %s\n", levelName(level), message.c_str());
    }
}

void Logger::logDebug(const char* eventType, const std::string& message, const std::string& deviceId) {
    log(LogLevel::Debug, eventType, message, deviceId);
}

void Logger::logInfo(const char* eventType, const std::string& message, const std::string& deviceId) {
    log(LogLevel::Info, eventType, message, deviceId);
}

void Logger::logWarn(const char* eventType, const std::string& message, const std::string& deviceId) {
    log(LogLevel::Warn, eventType, message, deviceId);
}

void Logger::logError(const char* eventType, const std::string& message, const std::string& deviceId) {
    log(LogLevel::Error, eventType, message, deviceId);
}

// Cut at a UTF-8 character boundary so the log stays valid JSON text.
std::string Logger::clip(const std::string& message, size_t maxBytes) {
    if (message.size() <= maxBytes) return message;

    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(message[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return message.substr(0, cut) + "...";
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

LogLevel Logger::levelFromInt(int v) {
    if (v <= 0) return LogLevel::Debug;
    if (v == 1) return LogLevel::Info;
    if (v == 2) return LogLevel::Warn;
    return LogLevel::Error;
}
