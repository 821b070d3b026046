/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <NVSManager.hpp>

#include <fstream>

// ======================================================
// Static singleton pointer
// ======================================================
NVS* NVS::s_instance = nullptr;


// ======================================================
// Singleton Init() and Get()
// ======================================================
void NVS::Init() {
    // Just force construction so caller doesn't have to think about it.
    (void)NVS::Get();
}

NVS* NVS::Get() {
    if (!s_instance) {
        s_instance = new NVS();
    }
    return s_instance;
}


// ======================================================
// ctor
// ======================================================
NVS::NVS()
: path_(CONFIG_FILE_PATH),
  doc_(CONFIG_DOC_CAPACITY) {
}


void NVS::setStoragePath(const std::string& path) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (path == path_) return;
    path_ = path;
    doc_.clear();
    is_open_ = false;
}


// ======================================================
// file helpers
// - load_() reads the whole file into doc_
// - commit_() rewrites it (write-through on every Put)
// ======================================================
bool NVS::load_() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        DEBUG_PRINTF("[NVS] No config file at %s\n", path_.c_str());
        doc_.clear();
        return false;
    }

    DeserializationError err = deserializeJson(doc_, in);
    if (err) {
        DEBUG_PRINTF("[NVS] Config parse failed (%s), starting empty\n", err.c_str());
        doc_.clear();
        return false;
    }
    return true;
}

bool NVS::commit_() {
    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) {
        DEBUG_PRINTF("[NVS] Cannot write %s\n", path_.c_str());
        return false;
    }
    serializeJsonPretty(doc_, out);
    out << '\n';
    return out.good();
}

JsonObject NVS::root_() {
    JsonObject root = doc_[CONFIG_PARTITION].as<JsonObject>();
    if (root.isNull()) {
        root = doc_.createNestedObject(CONFIG_PARTITION);
    }
    return root;
}


// ======================================================
// begin() / end()
// - decides first start vs existing config
// - on first start we write defaults
// ======================================================
void NVS::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting NVS Manager                    #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    bool resetFlag = true;
    {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        if (!load_()) {
            DEBUG_PRINTLN("[NVS] Starting from an empty store");
        }
        is_open_ = true;
        resetFlag = getResetFlag();
    }

    if (resetFlag) {
        DEBUG_PRINTLN("[NVS] Initializing the bridge configuration...");
        initializeDefaults();
    } else {
        DEBUG_PRINTLN("[NVS] Using existing configuration...");
        ensureMissingDefaults();
    }
}

void NVS::end() {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (is_open_) {
        if (!commit_()) {
            DEBUG_PRINTLN("[NVS] Final commit failed");
        }
        is_open_ = false;
    }
}


// ======================================================
// Core utils
// ======================================================
bool NVS::getResetFlag() {
    return GetBool(RESET_FLAG, true);
}

void NVS::initializeDefaults() {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    doc_.clear();
    initializeVariables();
}

// All default keys at first start.
void NVS::initializeVariables() {
    PutBool(RESET_FLAG, false);

    PutString(DEV_ID_KEY, DEFAULT_DEV_ID);
    PutString(DEV_SW_KEY, BRIDGE_SW_VERSION);

    PutString(MODEL_PATH_KEY, MODEL_FILE_PATH);
    PutString(REPLAY_PATH_KEY, REPLAY_FILE_PATH);
    PutString(LOG_PATH_KEY, LOGFILE_PATH);
    PutInt(LOG_LEVEL_KEY, DEFAULT_LOG_LEVEL);

    PutInt(AUX_POLL_V1_KEY, DEFAULT_AUX_POLL_S);
    PutInt(AUX_POLL_V2_KEY, DEFAULT_AUX_POLL_S);
    PutBool(QUERY_DEVICE_KEY, DEFAULT_QUERY_DEVICE);
    PutInt(POLL_COUNT_KEY, DEFAULT_POLL_COUNT);

    PutBool(WAKE_ON_START_KEY, DEFAULT_WAKE_ON_START);
}

void NVS::ensureMissingDefaults() {
    std::lock_guard<std::recursive_mutex> lk(mutex_);

    auto ensureBool = [&](const char* key, bool value) {
        if (!isKey(key)) PutBool(key, value);
    };
    auto ensureInt = [&](const char* key, int value) {
        if (!isKey(key)) PutInt(key, value);
    };
    auto ensureString = [&](const char* key, const char* value) {
        if (!isKey(key)) PutString(key, value);
    };

    ensureBool(RESET_FLAG, false);

    ensureString(DEV_ID_KEY, DEFAULT_DEV_ID);
    ensureString(DEV_SW_KEY, BRIDGE_SW_VERSION);

    ensureString(MODEL_PATH_KEY, MODEL_FILE_PATH);
    ensureString(REPLAY_PATH_KEY, REPLAY_FILE_PATH);
    ensureString(LOG_PATH_KEY, LOGFILE_PATH);
    ensureInt(LOG_LEVEL_KEY, DEFAULT_LOG_LEVEL);

    ensureInt(AUX_POLL_V1_KEY, DEFAULT_AUX_POLL_S);
    ensureInt(AUX_POLL_V2_KEY, DEFAULT_AUX_POLL_S);
    ensureBool(QUERY_DEVICE_KEY, DEFAULT_QUERY_DEVICE);
    ensureInt(POLL_COUNT_KEY, DEFAULT_POLL_COUNT);

    ensureBool(WAKE_ON_START_KEY, DEFAULT_WAKE_ON_START);
}


// ======================================================
// Getters
// ======================================================
JsonVariantConst NVS::get_(const char* key) const {
    const JsonDocument& cdoc = doc_;
    return cdoc[CONFIG_PARTITION][key];
}

std::string NVS::GetString(const char* key, const std::string& def) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    JsonVariantConst v = get_(key);
    if (!v.is<const char*>()) return def;
    return v.as<const char*>();
}

int NVS::GetInt(const char* key, int def) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    JsonVariantConst v = get_(key);
    if (!v.is<int>()) return def;
    return v.as<int>();
}

uint32_t NVS::GetUInt(const char* key, uint32_t def) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    JsonVariantConst v = get_(key);
    if (!v.is<long long>() || v.as<long long>() < 0) return def;
    if (v.as<long long>() > static_cast<long long>(UINT32_MAX)) return def;
    return static_cast<uint32_t>(v.as<long long>());
}

bool NVS::GetBool(const char* key, bool def) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    JsonVariantConst v = get_(key);
    if (!v.is<bool>()) return def;
    return v.as<bool>();
}

float NVS::GetFloat(const char* key, float def) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    JsonVariantConst v = get_(key);
    if (!v.is<float>()) return def;
    return v.as<float>();
}


// ======================================================
// Setters
// ======================================================
template<typename T>
bool NVS::put_(const char* key, const T& value) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (!root_()[key].set(value)) {
        // Pool exhausted by overwritten strings: compact and retry once.
        doc_.garbageCollect();
        if (!root_()[key].set(value)) {
            DEBUG_PRINTF("[NVS] Store full, cannot write %s\n", key);
            return false;
        }
    }
    return commit_();
}

bool NVS::PutString(const char* key, const std::string& value) { return put_(key, value); }
bool NVS::PutInt(const char* key, int value)                   { return put_(key, value); }
bool NVS::PutBool(const char* key, bool value)                 { return put_(key, value); }
bool NVS::PutFloat(const char* key, float value)               { return put_(key, value); }

bool NVS::isKey(const char* key) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    const JsonDocument& cdoc = doc_;
    JsonObjectConst root = cdoc[CONFIG_PARTITION].as<JsonObjectConst>();
    return !root.isNull() && root.containsKey(key);
}

bool NVS::RemoveKey(const char* key) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (!isKey(key)) return false;
    root_().remove(key);
    return commit_();
}

bool NVS::ClearAll() {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    doc_.clear();
    return commit_();
}
