#ifndef __WT_ZMODEM_SENTRY__
#define __WT_ZMODEM_SENTRY__

#include "Headers.hpp"
#include "ZmodemCodec.hpp"
#include "ZmodemSession.hpp"

namespace wt {
/**
 * @brief A Zmodem handshake found in the terminal stream.  RECEIVE means
 * the remote offered to send (ZRQINIT), SEND that it is waiting to receive
 * (ZRINIT).
 */
class ZmodemDetection {
 public:
  ZmodemDetection(ZmodemRole _role, const ZmodemHeader& _header)
      : role(_role), header(_header) {}

  ZmodemRole getRole() const { return role; }
  const ZmodemHeader& getHeader() const { return header; }

 protected:
  ZmodemRole role;
  ZmodemHeader header;
};

typedef std::function<void(const string&)> TerminalWriter;

/**
 * @brief Routes every inbound binary frame of a terminal session to exactly
 * one consumer: the handshake detector while IDLE, the Zmodem session while
 * ACTIVE.  Frames nobody claims are terminal output.
 *
 * On detection the detection handler must call confirm() with a session for
 * the detected role, or deny().  A detection left unanswered is denied.
 */
class ZmodemSentry {
 public:
  enum State { IDLE, ACTIVE };

  typedef std::function<void(const ZmodemDetection&)> DetectionHandler;
  typedef std::function<void(shared_ptr<ZmodemSession>)> SessionEndHandler;

  ZmodemSentry(TerminalWriter _toTerminal, ZmodemSender _sender);

  void setDetectionHandler(DetectionHandler handler) {
    detectionHandler = handler;
  }
  void setSessionEndHandler(SessionEndHandler handler) {
    sessionEndHandler = handler;
  }

  /** @brief Handles one inbound binary frame.  Never throws. */
  void consume(const string& frame);

  /** @brief Accepts the pending detection and starts `session`. */
  void confirm(shared_ptr<ZmodemSession> _session);

  /** @brief Rejects the pending detection with the abort sequence. */
  void deny();

  /** @brief Pumps the active session's outbound work. */
  void update();

  /** @brief Aborts the active session, if any. */
  void abort(const string& reason);

  State getState() const { return state; }
  bool isActive() const { return state == ACTIVE; }
  shared_ptr<ZmodemSession> getSession() { return session; }

 protected:
  void detect(const string& frame);
  void feed(const string& bytes);
  void checkFinished();
  void endSession();

  TerminalWriter toTerminal;
  ZmodemSender sender;
  DetectionHandler detectionHandler;
  SessionEndHandler sessionEndHandler;
  State state;
  shared_ptr<ZmodemSession> session;
  bool detectionPending;
  string pendingBytes;
};
}  // namespace wt

#endif  // __WT_ZMODEM_SENTRY__
