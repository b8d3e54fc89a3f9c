#ifndef __WT_SESSION__
#define __WT_SESSION__

#include "Clock.hpp"
#include "EngineConfig.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PendingRequestCorrelator.hpp"
#include "SessionError.hpp"
#include "Transport.hpp"

namespace wt {
enum class SessionStatus { DISCONNECTED, CONNECTING, CONNECTED };

enum class SessionKind { TERMINAL, FILE_BROWSER };

const char* sessionStatusName(SessionStatus status);

typedef std::function<void(SessionStatus)> StatusHandler;

/**
 * @brief State shared by both session kinds: identity, the exclusively owned
 * transport and the Connecting -> Connected -> Disconnected lifecycle.
 *
 * DISCONNECTED is terminal.  A session never reconnects; callers create a new
 * session (with a new id) instead.
 */
class Session : public TransportListener {
 public:
  Session(const string& _id, const ServerRef& _serverRef,
          shared_ptr<Transport> _transport,
          shared_ptr<PendingRequestCorrelator> _correlator,
          shared_ptr<Clock> _clock, const EngineConfig& _config);

  virtual ~Session();

  virtual SessionKind getKind() const = 0;

  /** @brief Opens the transport.  Only valid once, right after creation. */
  void connect(const string& url);

  /**
   * @brief Releases everything the session owns: aborts transfers, rejects
   * pending requests with SESSION_CLOSED and closes the transport.  Safe to
   * call any number of times.
   */
  virtual void disconnect();

  /** @brief One event-loop turn for time-driven work (send loops, polls). */
  virtual void update() {}

  const string& getId() const { return id; }
  const ServerRef& getServerRef() const { return serverRef; }
  SessionStatus getStatus() const { return status; }
  bool isConnected() const { return status == SessionStatus::CONNECTED; }

  void setStatusHandler(StatusHandler handler) { statusHandler = handler; }
  void setErrorHandler(ErrorHandler handler) { errorHandler = handler; }

  virtual void onOpen();
  virtual void onClose();
  virtual void onError(const string& message);

 protected:
  /** @brief Sends the first frame after the transport opened. */
  virtual void handleOpen() = 0;

  /** @brief Aborts any transfer the session owns. */
  virtual void releaseResources(const SessionError& reason) = 0;

  /**
   * @brief Moves to DISCONNECTED, releases resources, rejects pending
   * requests with `reason` and closes the transport.
   */
  void teardown(const SessionError& reason);

  void setStatus(SessionStatus newStatus);
  void reportError(const SessionError& error);
  void sendJson(const json& message);

  /** @brief Throws SESSION_CLOSED unless connected. */
  void requireConnected(const string& operation) const;

  string id;
  ServerRef serverRef;
  shared_ptr<Transport> transport;
  shared_ptr<PendingRequestCorrelator> correlator;
  shared_ptr<Clock> clock;
  EngineConfig config;
  SessionStatus status;
  bool tornDown;
  StatusHandler statusHandler;
  ErrorHandler errorHandler;
};
}  // namespace wt

#endif  // __WT_SESSION__
