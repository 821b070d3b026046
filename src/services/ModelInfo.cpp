/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <ModelInfo.hpp>
#include <Utils.hpp>

#include <ctype.h>
#include <fstream>

ModelInfo::ModelInfo() {
}

// ======================================================
// Loading
// ======================================================
bool ModelInfo::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    DEBUG_PRINTF("[Model] Cannot open %s\n", path.c_str());
    return false;
  }

  DynamicJsonDocument doc(MODEL_DOC_CAPACITY);
  DeserializationError err = deserializeJson(doc, in);
  if (err) {
    DEBUG_PRINTF("[Model] Parse failed for %s (%s)\n", path.c_str(), err.c_str());
    return false;
  }
  return parse_(doc);
}

bool ModelInfo::loadJson(const std::string& json) {
  DynamicJsonDocument doc(MODEL_DOC_CAPACITY);
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    DEBUG_PRINTF("[Model] Parse failed (%s)\n", err.c_str());
    return false;
  }
  return parse_(doc);
}

bool ModelInfo::parse_(const JsonDocument& doc) {
  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    DEBUG_PRINTLN("[Model] Model document is not an object");
    return false;
  }

  const char* id = root["deviceId"] | "";
  if (id[0] != '\0') deviceId_ = id;
  modelName_ = root["modelName"] | "";

  const int proto = root["protocol"] | 1;
  protocol_ = (proto >= 2) ? ProtocolVersion::V2 : ProtocolVersion::V1;

  enums_.clear();
  for (JsonPairConst table : root["enums"].as<JsonObjectConst>()) {
    Table& t = enums_[lower_(table.key().c_str())];
    for (JsonPairConst entry : table.value().as<JsonObjectConst>()) {
      t[entry.key().c_str()] = text_(entry.value());
    }
  }

  references_.clear();
  for (JsonPairConst table : root["references"].as<JsonObjectConst>()) {
    Record& r = references_[lower_(table.key().c_str())];
    for (JsonPairConst rec : table.value().as<JsonObjectConst>()) {
      Table& attrs = r[rec.key().c_str()];
      for (JsonPairConst attr : rec.value().as<JsonObjectConst>()) {
        attrs[attr.key().c_str()] = text_(attr.value());
      }
    }
  }

  commands_.clear();
  for (JsonVariantConst c : root["commands"].as<JsonArrayConst>()) {
    const char* group   = c["group"] | "";
    const char* command = c["command"] | "";
    if (group[0] == '\0') continue;
    commands_.push_back(std::make_pair(std::string(group), std::string(command)));
  }

  loaded_ = true;
  DEBUG_PRINTF("[Model] %s: %u enum table(s), %u reference table(s), %u command(s)\n",
               modelName_.c_str(),
               static_cast<unsigned>(enums_.size()),
               static_cast<unsigned>(references_.size()),
               static_cast<unsigned>(commands_.size()));
  return true;
}

// ======================================================
// DeviceInfo
// ======================================================
bool ModelInfo::enumName(const std::string& key, const std::string& code,
                         std::string& out) const {
  std::map<std::string, Table>::const_iterator t = enums_.find(lower_(key));
  if (t == enums_.end()) return false;
  Table::const_iterator e = t->second.find(code);
  if (e == t->second.end()) return false;
  out = e->second;
  return true;
}

bool ModelInfo::enumValue(const std::string& key, const std::string& name,
                          std::string& out) const {
  std::map<std::string, Table>::const_iterator t = enums_.find(lower_(key));
  if (t == enums_.end()) return false;
  for (Table::const_iterator e = t->second.begin(); e != t->second.end(); ++e) {
    if (e->second == name) {
      out = e->first;
      return true;
    }
  }
  return false;
}

bool ModelInfo::referenceName(const std::string& key, const std::string& code,
                              const std::string& refKey, std::string& out) const {
  std::map<std::string, Record>::const_iterator t = references_.find(lower_(key));
  if (t == references_.end()) return false;
  Record::const_iterator rec = t->second.find(code);
  if (rec == t->second.end()) return false;
  Table::const_iterator attr = rec->second.find(refKey);
  if (attr == rec->second.end()) return false;
  out = attr->second;
  return true;
}

bool ModelInfo::isCommandSupported(const std::string& group,
                                   const std::string& command) const {
  for (size_t i = 0; i < commands_.size(); ++i) {
    if (commands_[i].first == group && commands_[i].second == command) return true;
  }
  return false;
}

// ======================================================
// helpers
// ======================================================
std::string ModelInfo::lower_(const std::string& s) {
  std::string out(s);
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<char>(tolower(static_cast<unsigned char>(out[i])));
  }
  return out;
}

std::string ModelInfo::text_(JsonVariantConst v) {
  if (v.is<const char*>()) return v.as<const char*>();
  std::string out;
  serializeJson(v, out);
  return out;
}
