/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef NVS_MANAGER_H
#define NVS_MANAGER_H

#include <Config.hpp>
#include <Utils.hpp>
#include <ArduinoJson.h>
#include <mutex>
#include <string>

/**
 * @brief Persistent key/value configuration store (Singleton).
 *
 * Keys live in one JSON object (CONFIG_PARTITION) inside a file on disk.
 * Every Put* is written through immediately.
 *
 * Usage at startup:
 *     NVS::Init();
 *     CONF->setStoragePath("/etc/rkbridge.json");   // optional
 *     CONF->begin();
 */
class NVS {
public:
    static void Init();
    static NVS* Get();

    void setStoragePath(const std::string& path);
    const std::string& storagePath() const { return path_; }

    void begin();
    void end();

    bool getResetFlag();
    void initializeDefaults();
    void ensureMissingDefaults();

    // Getters (return def when missing or of another type)
    std::string GetString(const char* key, const std::string& def);
    int         GetInt(const char* key, int def);
    uint32_t    GetUInt(const char* key, uint32_t def);     // def when negative
    bool        GetBool(const char* key, bool def);
    float       GetFloat(const char* key, float def);

    // Setters (write-through)
    bool PutString(const char* key, const std::string& value);
    bool PutInt(const char* key, int value);
    bool PutBool(const char* key, bool value);
    bool PutFloat(const char* key, float value);

    bool isKey(const char* key);
    bool RemoveKey(const char* key);
    bool ClearAll();

private:
    NVS();
    NVS(const NVS&) = delete;
    NVS& operator=(const NVS&) = delete;
    static NVS* s_instance;

    void initializeVariables();
    bool load_();
    bool commit_();
    JsonObject root_();
    JsonVariantConst get_(const char* key) const;

    template<typename T>
    bool put_(const char* key, const T& value);

    std::string          path_;
    DynamicJsonDocument  doc_;
    bool                 is_open_ = false;
    std::recursive_mutex mutex_;
};

// ------------- Ergonomic global accessor -------------
#ifndef CONF
#define CONF (NVS::Get())
#endif

#endif // NVS_MANAGER_H
