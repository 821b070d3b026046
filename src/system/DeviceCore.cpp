/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <Device.hpp>
#include <Utils.hpp>

namespace {
const std::string kNoDeviceId;
} // namespace

Device::Device(DeviceTransport* transport, const DeviceInfo* info, Logger* logger)
: transport_(transport),
  info_(info),
  logger_(logger) {
}

const std::string& Device::deviceId() const {
  return info_ ? info_->deviceId() : kNoDeviceId;
}

bool Device::isInfoV2() const {
  return info_ && info_->protocol() == ProtocolVersion::V2;
}

bool Device::updateStatus(const KeyList& keys, const std::string& value) {
  if (!status_) return false;
  return status_->updateStatus(keys, value);
}

// ======================================================
// Poll
// - blocks on the transport future
// - transport exceptions propagate unchanged
// ======================================================
PayloadPtr Device::devicePoll(const PollRequest& req) {
  if (!transport_) {
    throw DeviceError("device " + deviceId() + " has no transport");
  }

  std::future<PayloadPtr> pending = transport_->requestPayload(req);
  PayloadPtr payload = pending.get();

  if (!payload) {
    if (logger_) logger_->logDebug("poll", "no payload this cycle", deviceId());
    return nullptr;
  }

  if (logger_ && logger_->enabled(LogLevel::Debug)) {
    std::string text;
    serializeJson(*payload, text);
    logger_->logDebug("poll", "payload " + text, deviceId());
  }
  return payload;
}
