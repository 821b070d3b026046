/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <DeviceTransport.hpp>
#include <Utils.hpp>

PayloadPtr parsePayload(const std::string& json, std::string* error) {
  // Pool for the parsed tree plus room for later updateStatus() patches.
  size_t capacity = json.size() * 4 + STATUS_DOC_HEADROOM;
  if (capacity < STATUS_DOC_MIN_CAPACITY) capacity = STATUS_DOC_MIN_CAPACITY;

  while (capacity <= STATUS_DOC_MAX_CAPACITY) {
    PayloadPtr doc(new DynamicJsonDocument(capacity));
    DeserializationError err = deserializeJson(*doc, json);
    if (!err) {
      return doc;
    }
    if (err != DeserializationError::NoMemory) {
      if (error) *error = err.c_str();
      return nullptr;
    }
    capacity *= 2;
  }

  DEBUG_PRINTF("[Transport] Payload of %u bytes exceeds document cap\n",
               static_cast<unsigned>(json.size()));
  if (error) *error = "NoMemory";
  return nullptr;
}
