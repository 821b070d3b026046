/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MODEL_INFO_H
#define MODEL_INFO_H

#include <DeviceInfo.hpp>
#include <ArduinoJson.h>
#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief DeviceInfo backed by a JSON model file.
 *
 * File layout:
 * {
 *   "deviceId":  "robotking-0",
 *   "modelName": "RK_V2",
 *   "protocol":  2,
 *   "enums":      { "State": { "7": "STATE_END", ... }, ... },
 *   "references": { "Error": { "E3": { "title": "ERROR_WHEEL" } }, ... },
 *   "commands":   [ { "group": "Set", "command": "Wakeup" }, { "group": "WakeUp" } ]
 * }
 *
 * Table keys (e.g. "State" vs "state") are matched case-insensitively.
 * Codes and command names are matched exactly.
 */
class ModelInfo : public DeviceInfo {
public:
  ModelInfo();

  bool loadFile(const std::string& path);
  bool loadJson(const std::string& json);
  bool loaded() const { return loaded_; }

  void setDeviceId(const std::string& id) { deviceId_ = id; }

  const std::string& deviceId() const override { return deviceId_; }
  const std::string& modelName() const override { return modelName_; }
  ProtocolVersion protocol() const override { return protocol_; }

  bool enumName(const std::string& key, const std::string& code,
                std::string& out) const override;
  bool enumValue(const std::string& key, const std::string& name,
                 std::string& out) const override;
  bool referenceName(const std::string& key, const std::string& code,
                     const std::string& refKey, std::string& out) const override;
  bool isCommandSupported(const std::string& group,
                          const std::string& command) const override;

private:
  typedef std::map<std::string, std::string>  Table;      // code -> label
  typedef std::map<std::string, Table>        Record;     // code -> {attr -> value}

  bool parse_(const JsonDocument& doc);
  static std::string lower_(const std::string& s);
  static std::string text_(JsonVariantConst v);

  bool                                 loaded_ = false;
  std::string                          deviceId_;
  std::string                          modelName_;
  ProtocolVersion                      protocol_ = ProtocolVersion::V1;
  std::map<std::string, Table>         enums_;      // lower(key) -> table
  std::map<std::string, Record>        references_; // lower(key) -> records
  std::vector<std::pair<std::string, std::string>> commands_;
};

#endif // MODEL_INFO_H
