/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DEVICE_STATUS_H
#define DEVICE_STATUS_H

#include <DeviceTypes.hpp>
#include <DeviceInfo.hpp>
#include <Logger.hpp>
#include <string>

class Device;

/**
 * @brief One received payload plus the lookups every appliance needs.
 *
 * The status owns its payload document. Field lookups take a KeyList of
 * aliases; the first alias present at the top level wins, and if its value
 * is an object the aliases are tried again inside it
 * (e.g. {"State":{"state":"STATE_END"}}).
 *
 * Missing fields never throw: lookups return false and leave @p out empty.
 *
 * The device's DeviceInfo and Logger are captured at construction, so a
 * status may outlive the device that produced it (not the info or logger).
 */
class DeviceStatus {
public:
  explicit DeviceStatus(Device* device, PayloadPtr data = nullptr);
  virtual ~DeviceStatus() = default;

  bool hasData() const { return hasData_; }
  const JsonDocument& data() const { return *data_; }
  bool isInfoV2() const;

  /**
   * @brief Write @p value into the field named by @p keys.
   *
   * Writes where the field already lives (nested or not), otherwise adds it
   * under the first alias. Grows the document when full.
   * @return true if the stored value changed.
   */
  bool set(const KeyList& keys, const std::string& value);

  // Subclasses hook here to drop derived caches.
  virtual bool updateStatus(const KeyList& keys, const std::string& value);

  // Raw field text (non-strings serialized). False when absent or empty.
  bool lookupRaw(const KeyList& keys, std::string& out, std::string* matchedKey = nullptr) const;

  // Field resolved through the enum table; unknown codes pass through unchanged.
  bool lookupEnum(const KeyList& keys, std::string& out) const;

  // Field resolved through the reference table's @p refKey attribute.
  bool lookupReference(const KeyList& keys, const std::string& refKey, std::string& out) const;

  /**
   * @brief Record a feature value and return the stored copy.
   */
  const std::string& updateFeature(const std::string& key, const std::string& value);

  // Complete map; recomputed on first read and after a changing updateStatus().
  const FeatureMap& deviceFeatures();

  std::string dump() const;

protected:
  virtual void updateFeatures() {}

  const DeviceInfo* info() const { return info_; }
  Logger* logger() const { return logger_; }
  const std::string& deviceId() const;

private:
  JsonVariantConst find_(const KeyList& keys, std::string* matchedKey) const;
  bool write_(const KeyList& keys, const std::string& value, bool& changed);
  bool grow_();

  const DeviceInfo* info_;
  Logger*           logger_;
  PayloadPtr        data_;
  bool              hasData_;
  FeatureMap        features_;
  bool              featuresUpdated_ = false;
};

#endif // DEVICE_STATUS_H
