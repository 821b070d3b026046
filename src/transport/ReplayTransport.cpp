/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <ReplayTransport.hpp>
#include <DeviceErrors.hpp>
#include <Utils.hpp>

#include <fstream>

ReplayTransport::ReplayTransport(Logger* logger)
: logger_(logger) {
}

// ======================================================
// Loading
// ======================================================
bool ReplayTransport::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    DEBUG_PRINTF("[Replay] Cannot open %s\n", path.c_str());
    if (logger_) logger_->logError("replay", "cannot open " + path);
    return false;
  }

  DynamicJsonDocument doc(REPLAY_DOC_CAPACITY);
  DeserializationError err = deserializeJson(doc, in);
  if (err) {
    DEBUG_PRINTF("[Replay] Parse failed for %s (%s)\n", path.c_str(), err.c_str());
    if (logger_) logger_->logError("replay", std::string("parse failed: ") + err.c_str());
    return false;
  }
  return loadDocument_(doc);
}

bool ReplayTransport::loadJson(const std::string& json) {
  DynamicJsonDocument doc(REPLAY_DOC_CAPACITY);
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    DEBUG_PRINTF("[Replay] Parse failed (%s)\n", err.c_str());
    return false;
  }
  return loadDocument_(doc);
}

bool ReplayTransport::loadDocument_(const JsonDocument& doc) {
  JsonArrayConst payloads;
  JsonArrayConst accepted;

  if (doc.is<JsonArrayConst>()) {
    payloads = doc.as<JsonArrayConst>();
  } else if (doc.is<JsonObjectConst>()) {
    payloads = doc["payloads"].as<JsonArrayConst>();
    accepted = doc["accepted_commands"].as<JsonArrayConst>();
  }
  if (payloads.isNull()) {
    DEBUG_PRINTLN("[Replay] No payload list in replay document");
    return false;
  }

  // Re-parse each entry so every payload owns a right-sized document.
  std::deque<PayloadPtr> parsed;
  for (JsonVariantConst entry : payloads) {
    if (entry.isNull()) {
      parsed.push_back(nullptr);
      continue;
    }
    std::string text;
    serializeJson(entry, text);
    std::string error;
    PayloadPtr p = parsePayload(text, &error);
    if (!p) {
      DEBUG_PRINTF("[Replay] Replay rejected, bad payload: %s\n", error.c_str());
      if (logger_) logger_->logError("replay", "replay rejected, bad payload: " + error);
      return false;
    }
    parsed.push_back(std::move(p));
  }

  std::vector<CommandKeys> acc;
  for (JsonVariantConst v : accepted) {
    JsonObjectConst c = v.as<JsonObjectConst>();
    CommandKeys k;
    k.group   = c["group"]   | "";
    k.command = c["command"] | "";
    acc.push_back(k);
  }

  std::lock_guard<std::mutex> lk(mutex_);
  for (PayloadPtr& p : parsed) queue_.push_back(std::move(p));
  for (const CommandKeys& k : acc) accepted_.push_back(k);

  DEBUG_PRINTF("[Replay] %u payload(s) queued, %u accepted command(s)\n",
               static_cast<unsigned>(queue_.size()),
               static_cast<unsigned>(accepted_.size()));
  return true;
}

void ReplayTransport::pushPayload(PayloadPtr payload) {
  std::lock_guard<std::mutex> lk(mutex_);
  queue_.push_back(std::move(payload));
}

void ReplayTransport::acceptCommand(const std::string& group, const std::string& command) {
  std::lock_guard<std::mutex> lk(mutex_);
  CommandKeys k;
  k.group   = group;
  k.command = command;
  accepted_.push_back(k);
}

// ======================================================
// DeviceTransport
// ======================================================
std::future<PayloadPtr> ReplayTransport::requestPayload(const PollRequest& req) {
  std::promise<PayloadPtr> done;
  std::lock_guard<std::mutex> lk(mutex_);

  lastRequest_ = req;
  polls_++;
  if (queue_.empty()) {
    done.set_value(nullptr);
  } else {
    PayloadPtr next = std::move(queue_.front());
    queue_.pop_front();
    done.set_value(std::move(next));
  }
  return done.get_future();
}

std::future<void> ReplayTransport::sendCommand(const CommandKeys& cmd) {
  std::promise<void> done;
  std::lock_guard<std::mutex> lk(mutex_);

  if (!isAccepted_(cmd)) {
    DEBUG_PRINTF("[Replay] Rejected %s/%s\n", cmd.group.c_str(), cmd.command.c_str());
    done.set_exception(std::make_exception_ptr(
        CommandRejected("command not accepted: " + cmd.group + "/" + cmd.command)));
    return done.get_future();
  }

  sent_.push_back(cmd);
  DEBUG_PRINTF("[Replay] Sent %s/%s\n", cmd.group.c_str(), cmd.command.c_str());
  done.set_value();
  return done.get_future();
}

bool ReplayTransport::isAccepted_(const CommandKeys& cmd) const {
  if (accepted_.empty()) return true;
  for (const CommandKeys& k : accepted_) {
    if (k.group == cmd.group && k.command == cmd.command) return true;
  }
  return false;
}

// ======================================================
// Inspection
// ======================================================
size_t ReplayTransport::remaining() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return queue_.size();
}

size_t ReplayTransport::pollCount() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return polls_;
}

PollRequest ReplayTransport::lastRequest() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return lastRequest_;
}

std::vector<CommandKeys> ReplayTransport::sentCommands() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return sent_;
}
