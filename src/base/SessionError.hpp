#ifndef __WT_SESSION_ERROR__
#define __WT_SESSION_ERROR__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Failure categories surfaced by sessions and their operations.
 */
enum class SessionErrorKind {
  /** Connection refused or dropped. Always terminates the session. */
  TRANSPORT,
  /** Malformed or unexpected message. */
  PROTOCOL,
  /** A pending request or transfer exceeded its deadline. */
  TIMEOUT,
  /** A request for a key that is already pending, or a second transfer. */
  DUPLICATE_REQUEST,
  /** A transfer was cancelled or failed mid-chunk. */
  TRANSFER_ABORTED,
  /** The session is disconnected or does not exist. */
  SESSION_CLOSED,
  /** The backend proxy reported a structured error. */
  BACKEND,
};

inline const char* sessionErrorKindName(SessionErrorKind kind) {
  switch (kind) {
    case SessionErrorKind::TRANSPORT:
      return "TransportError";
    case SessionErrorKind::PROTOCOL:
      return "ProtocolError";
    case SessionErrorKind::TIMEOUT:
      return "Timeout";
    case SessionErrorKind::DUPLICATE_REQUEST:
      return "DuplicateRequest";
    case SessionErrorKind::TRANSFER_ABORTED:
      return "TransferAborted";
    case SessionErrorKind::SESSION_CLOSED:
      return "SessionClosed";
    case SessionErrorKind::BACKEND:
      return "BackendError";
  }
  return "Unknown";
}

class SessionError : public std::runtime_error {
 public:
  SessionError(SessionErrorKind _kind, const string& message)
      : std::runtime_error(message), kind(_kind) {}

  SessionErrorKind getKind() const { return kind; }

 protected:
  SessionErrorKind kind;
};

inline std::ostream& operator<<(std::ostream& os, const SessionError& err) {
  os << sessionErrorKindName(err.getKind()) << ": " << err.what();
  return os;
}

typedef std::function<void(const SessionError&)> ErrorHandler;
}  // namespace wt

#endif  // __WT_SESSION_ERROR__
