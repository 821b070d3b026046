/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef REPLAY_TRANSPORT_H
#define REPLAY_TRANSPORT_H

#include <DeviceTransport.hpp>
#include <Logger.hpp>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief File-backed transport serving recorded payloads in order.
 *
 * Replay file, either form:
 *   [ {...}, null, {...} ]                         (null = empty poll)
 *   { "payloads": [ ... ],
 *     "accepted_commands": [ {"group":"Set","command":"Wakeup"} ] }
 *
 * Without an accepted list every command is accepted. Sent commands are
 * recorded so callers can inspect what was dispatched.
 */
class ReplayTransport : public DeviceTransport {
public:
  explicit ReplayTransport(Logger* logger = nullptr);

  bool loadFile(const std::string& path);
  bool loadJson(const std::string& json);

  void pushPayload(PayloadPtr payload);       // nullptr queues an empty poll
  void acceptCommand(const std::string& group, const std::string& command);

  std::future<PayloadPtr> requestPayload(const PollRequest& req) override;
  std::future<void> sendCommand(const CommandKeys& cmd) override;

  size_t remaining() const;
  bool exhausted() const { return remaining() == 0; }
  size_t pollCount() const;
  PollRequest lastRequest() const;
  std::vector<CommandKeys> sentCommands() const;

private:
  bool loadDocument_(const JsonDocument& doc);
  bool isAccepted_(const CommandKeys& cmd) const;

  Logger*                  logger_;
  std::deque<PayloadPtr>   queue_;
  std::vector<CommandKeys> accepted_;
  std::vector<CommandKeys> sent_;
  PollRequest              lastRequest_;
  size_t                   polls_ = 0;
  mutable std::mutex       mutex_;
};

#endif // REPLAY_TRANSPORT_H
