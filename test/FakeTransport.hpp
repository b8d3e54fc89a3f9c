#ifndef __WT_FAKE_TRANSPORT__
#define __WT_FAKE_TRANSPORT__

#include "JsonLib.hpp"
#include "TestHeaders.hpp"
#include "Transport.hpp"

namespace wt {
/**
 * Records everything a session sends and lets a test play the backend by
 * injecting transport events.
 */
class FakeTransport : public Transport {
 public:
  FakeTransport() : opened(false), closed(false), backlog(0) {}

  virtual void open(const string& _url) {
    url = _url;
    opened = true;
  }

  virtual void sendText(const string& text) {
    if (!isOpen()) {
      droppedFrames++;
      return;
    }
    texts.push_back(text);
  }

  virtual void sendBinary(const string& data) {
    if (!isOpen()) {
      droppedFrames++;
      return;
    }
    binaries.push_back(data);
  }

  virtual void close() { closed = true; }

  virtual bool isOpen() { return opened && !closed; }

  virtual size_t pendingBytes() { return backlog; }

  void setPendingBytes(size_t bytes) { backlog = bytes; }

  bool hasListener() const { return listener != NULL; }

  void simulateOpen() {
    if (listener) listener->onOpen();
  }
  void simulateText(const string& text) {
    if (listener) listener->onText(text);
  }
  void simulateJson(const json& message) { simulateText(message.dump()); }
  void simulateBinary(const string& data) {
    if (listener) listener->onBinary(data);
  }
  void simulateClose() {
    closed = true;
    if (listener) listener->onClose();
  }
  void simulateError(const string& message) {
    closed = true;
    if (listener) listener->onError(message);
  }

  json lastJson() const {
    REQUIRE(!texts.empty());
    return json::parse(texts.back());
  }

  /** Messages sent with the given type, in order. */
  vector<json> jsonOfType(const string& type) const {
    vector<json> matches;
    for (const auto& text : texts) {
      json message = json::parse(text, nullptr, false);
      if (!message.is_discarded() && jsonString(message, "type") == type) {
        matches.push_back(message);
      }
    }
    return matches;
  }

  string allBinary() const {
    string all;
    for (const auto& b : binaries) {
      all += b;
    }
    return all;
  }

  string url;
  bool opened;
  bool closed;
  size_t backlog;
  int droppedFrames = 0;
  vector<string> texts;
  vector<string> binaries;
};

class FakeTransportFactory : public TransportFactory {
 public:
  FakeTransportFactory() : pollCount(0), lastPollTimeoutMs(-1) {}

  virtual shared_ptr<Transport> create() {
    shared_ptr<FakeTransport> transport(new FakeTransport());
    created.push_back(transport);
    return transport;
  }

  virtual void poll(int timeoutMs) {
    pollCount++;
    lastPollTimeoutMs = timeoutMs;
  }

  shared_ptr<FakeTransport> last() { return created.back(); }

  vector<shared_ptr<FakeTransport>> created;
  int pollCount;
  int lastPollTimeoutMs;
};
}  // namespace wt

#endif  // __WT_FAKE_TRANSPORT__
