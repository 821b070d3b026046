/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <DeviceStatus.hpp>
#include <Device.hpp>
#include <Utils.hpp>

namespace {
const std::string kEmpty;

std::string variantText(JsonVariantConst v) {
  if (v.isNull()) return std::string();
  if (v.is<const char*>()) return v.as<const char*>();
  std::string out;
  serializeJson(v, out);
  return out;
}
} // namespace

DeviceStatus::DeviceStatus(Device* device, PayloadPtr data)
: info_(device ? device->deviceInfo() : nullptr),
  logger_(device ? device->logger() : nullptr),
  data_(std::move(data)),
  hasData_(false) {
  if (data_) {
    hasData_ = true;
  } else {
    data_.reset(new DynamicJsonDocument(STATUS_DOC_MIN_CAPACITY));
  }
}

bool DeviceStatus::isInfoV2() const {
  const DeviceInfo* di = info();
  return di && di->protocol() == ProtocolVersion::V2;
}

const std::string& DeviceStatus::deviceId() const {
  const DeviceInfo* di = info();
  return di ? di->deviceId() : kEmpty;
}

// ======================================================
// Field lookup
// ======================================================
JsonVariantConst DeviceStatus::find_(const KeyList& keys, std::string* matchedKey) const {
  JsonObjectConst root = data_->as<JsonObjectConst>();
  if (root.isNull()) return JsonVariantConst();

  for (const std::string& k : keys) {
    JsonVariantConst v = root[k];
    if (v.isNull()) continue;

    if (v.is<JsonObjectConst>()) {
      JsonObjectConst inner = v.as<JsonObjectConst>();
      for (const std::string& ik : keys) {
        JsonVariantConst iv = inner[ik];
        if (iv.isNull()) continue;
        if (matchedKey) *matchedKey = ik;
        return iv;
      }
      continue; // wrapper without a known leaf
    }

    if (matchedKey) *matchedKey = k;
    return v;
  }
  return JsonVariantConst();
}

bool DeviceStatus::lookupRaw(const KeyList& keys, std::string& out, std::string* matchedKey) const {
  out = variantText(find_(keys, matchedKey));
  return !out.empty();
}

bool DeviceStatus::lookupEnum(const KeyList& keys, std::string& out) const {
  std::string key;
  std::string code;
  out.clear();
  if (!lookupRaw(keys, code, &key)) return false;

  const DeviceInfo* di = info();
  if (!di || !di->enumName(key, code, out) || out.empty()) {
    out = code;
  }
  return true;
}

bool DeviceStatus::lookupReference(const KeyList& keys, const std::string& refKey, std::string& out) const {
  std::string key;
  std::string code;
  out.clear();
  if (!lookupRaw(keys, code, &key)) return false;

  const DeviceInfo* di = info();
  if (!di || !di->referenceName(key, code, refKey, out) || out.empty()) {
    out = code;
  }
  return true;
}

// ======================================================
// Payload store
// ======================================================
bool DeviceStatus::write_(const KeyList& keys, const std::string& value, bool& changed) {
  JsonObject root = data_->as<JsonObject>();
  if (root.isNull()) root = data_->to<JsonObject>();

  JsonObject  slot = root;
  std::string slotKey = keys.front();

  for (const std::string& k : keys) {
    if (!root.containsKey(k)) continue;
    JsonVariant v = root[k];
    if (v.is<JsonObject>()) {
      JsonObject inner = v.as<JsonObject>();
      slot = inner;
      slotKey = keys.front();
      for (const std::string& ik : keys) {
        if (inner.containsKey(ik)) {
          slotKey = ik;
          break;
        }
      }
    } else {
      slotKey = k;
    }
    break;
  }

  JsonVariant cur = slot[slotKey];
  if (!cur.isNull() && cur.is<const char*>() && value == cur.as<const char*>()) {
    changed = false;
    return true;
  }
  if (!slot[slotKey].set(value)) return false;
  changed = true;
  return true;
}

bool DeviceStatus::grow_() {
  const size_t next = data_->capacity() * 2;
  if (next > STATUS_DOC_MAX_CAPACITY) return false;

  PayloadPtr bigger(new DynamicJsonDocument(next));
  if (!bigger->set(*data_)) return false;
  data_ = std::move(bigger);
  return true;
}

bool DeviceStatus::set(const KeyList& keys, const std::string& value) {
  if (keys.empty()) return false;

  bool changed = false;
  while (!write_(keys, value, changed)) {
    data_->garbageCollect();
    if (write_(keys, value, changed)) break;
    if (!grow_()) {
      DEBUG_PRINTLN("[Status] Payload document full, update dropped");
      if (Logger* log = logger()) {
        log->logWarn("status", "payload document full, update dropped", deviceId());
      }
      return false;
    }
  }
  return changed;
}

bool DeviceStatus::updateStatus(const KeyList& keys, const std::string& value) {
  const bool changed = set(keys, value);
  if (changed) featuresUpdated_ = false;
  return changed;
}

// ======================================================
// Features
// ======================================================
const std::string& DeviceStatus::updateFeature(const std::string& key, const std::string& value) {
  std::string& slot = features_[key];
  slot = value;
  return slot;
}

const FeatureMap& DeviceStatus::deviceFeatures() {
  if (!featuresUpdated_) {
    updateFeatures();
    featuresUpdated_ = true;
  }
  return features_;
}

std::string DeviceStatus::dump() const {
  std::string out;
  serializeJson(*data_, out);
  return out;
}
