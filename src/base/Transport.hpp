#ifndef __WT_TRANSPORT__
#define __WT_TRANSPORT__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Receives the events of one transport.  Implemented by sessions.
 */
class TransportListener {
 public:
  virtual ~TransportListener() {}

  /** @brief The connection to the backend proxy is established. */
  virtual void onOpen() = 0;
  /** @brief A complete inbound text frame. */
  virtual void onText(const string& text) = 0;
  /** @brief A complete inbound binary frame. */
  virtual void onBinary(const string& data) = 0;
  /** @brief The connection closed (either side). */
  virtual void onClose() = 0;
  /**
   * @brief The connection failed.  May fire before onOpen (refused) or after
   * (mid-session failure).
   */
  virtual void onError(const string& message) = 0;
};

/**
 * @brief One bidirectional, message-oriented connection to the backend proxy
 * for exactly one session.
 *
 * Implementations hold no protocol logic, no retries and no buffering beyond
 * what the underlying library needs to write a frame.
 */
class Transport {
 public:
  Transport() : listener(NULL) {}

  virtual ~Transport() {}

  /** @brief Starts connecting to `url`.  Events arrive on the listener. */
  virtual void open(const string& url) = 0;
  /** @brief Queues a text frame.  Dropped if the transport is not open. */
  virtual void sendText(const string& text) = 0;
  /** @brief Queues a binary frame.  Dropped if the transport is not open. */
  virtual void sendBinary(const string& data) = 0;
  /** @brief Closes the connection and releases its resources. */
  virtual void close() = 0;
  virtual bool isOpen() = 0;
  /** @brief Bytes queued for sending but not yet handed to the network. */
  virtual size_t pendingBytes() = 0;

  /**
   * @brief Sets the listener.  The transport does not own it; the owner must
   * clear it (or close the transport) before the listener is destroyed.
   */
  inline void setListener(TransportListener* _listener) {
    listener = _listener;
  }

 protected:
  TransportListener* listener;
};

/**
 * @brief Creates transports and services their I/O on the caller's thread.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() {}

  virtual shared_ptr<Transport> create() = 0;
  /**
   * @brief Processes pending network events, waiting at most `timeoutMs`.
   * Implementations may return without waiting at all, so a caller that
   * loops must block on its own input to avoid spinning.  Listener callbacks
   * fire from inside this call.
   */
  virtual void poll(int timeoutMs) = 0;
};

/**
 * @brief Derives a WebSocket URL from the REST API base URL: http becomes ws,
 * https becomes wss, and the path is replaced by `path`.
 */
string getWebSocketUrl(const string& apiUrl, const string& path);
}  // namespace wt

#endif  // __WT_TRANSPORT__
