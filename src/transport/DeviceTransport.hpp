/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DEVICE_TRANSPORT_H
#define DEVICE_TRANSPORT_H

#include <DeviceTypes.hpp>
#include <future>
#include <string>

/**
 * @brief Boundary to the cloud session (auth, HTTP/MQTT, retries live behind it).
 *
 * Both calls return immediately; the device blocks on the future.
 * Failures are delivered as exceptions through future::get().
 */
class DeviceTransport {
public:
  virtual ~DeviceTransport() = default;

  /**
   * @brief Fetch the next raw status payload.
   * @return Future resolving to the payload, or nullptr when nothing arrived.
   */
  virtual std::future<PayloadPtr> requestPayload(const PollRequest& req) = 0;

  /**
   * @brief Dispatch one control command.
   * @throws CommandRejected (via the future) when the appliance refuses it.
   */
  virtual std::future<void> sendCommand(const CommandKeys& cmd) = 0;
};

/**
 * @brief Parse one JSON payload into a document sized for it.
 *
 * Grows the document until the text fits (up to STATUS_DOC_MAX_CAPACITY).
 * Returns nullptr on malformed input or when the text is too large; the
 * reason goes to @p error when provided.
 */
PayloadPtr parsePayload(const std::string& json, std::string* error = nullptr);

#endif // DEVICE_TRANSPORT_H
