#include "Session.hpp"

namespace wt {
const char* sessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::DISCONNECTED:
      return "disconnected";
    case SessionStatus::CONNECTING:
      return "connecting";
    case SessionStatus::CONNECTED:
      return "connected";
  }
  return "unknown";
}

Session::Session(const string& _id, const ServerRef& _serverRef,
                 shared_ptr<Transport> _transport,
                 shared_ptr<PendingRequestCorrelator> _correlator,
                 shared_ptr<Clock> _clock, const EngineConfig& _config)
    : id(_id),
      serverRef(_serverRef),
      transport(_transport),
      correlator(_correlator),
      clock(_clock),
      config(_config),
      status(SessionStatus::CONNECTING),
      tornDown(false) {
  transport->setListener(this);
}

Session::~Session() {
  transport->setListener(NULL);
  transport->close();
}

void Session::connect(const string& url) {
  if (status != SessionStatus::CONNECTING) {
    throw SessionError(SessionErrorKind::SESSION_CLOSED,
                       "Session " + id + " cannot be reconnected");
  }
  LOG(INFO) << "Session " << id << " connecting to " << url << " for "
            << serverRef;
  transport->open(url);
}

void Session::disconnect() {
  if (tornDown) {
    return;
  }
  LOG(INFO) << "Disconnecting session " << id;
  teardown(SessionError(SessionErrorKind::SESSION_CLOSED,
                        "Session " + id + " was disconnected"));
}

void Session::teardown(const SessionError& reason) {
  tornDown = true;
  setStatus(SessionStatus::DISCONNECTED);
  releaseResources(reason);
  correlator->rejectAll(id, reason);
  transport->setListener(NULL);
  transport->close();
}

void Session::onOpen() {
  if (status != SessionStatus::CONNECTING) {
    LOG(WARNING) << "Ignoring open event on " << id << " in state "
                 << sessionStatusName(status);
    return;
  }
  LOG(INFO) << "Transport open for session " << id;
  handleOpen();
}

void Session::onClose() {
  if (status == SessionStatus::DISCONNECTED) {
    return;
  }
  LOG(INFO) << "Transport closed for session " << id;
  SessionError error(SessionErrorKind::TRANSPORT, "Connection closed");
  teardown(error);
  reportError(error);
}

void Session::onError(const string& message) {
  if (status == SessionStatus::DISCONNECTED) {
    return;
  }
  LOG(WARNING) << "Transport error for session " << id << ": " << message;
  SessionError error(SessionErrorKind::TRANSPORT,
                     "Connection failed: " + message);
  teardown(error);
  reportError(error);
}

void Session::setStatus(SessionStatus newStatus) {
  if (status == newStatus) {
    return;
  }
  VLOG(1) << "Session " << id << ": " << sessionStatusName(status) << " -> "
          << sessionStatusName(newStatus);
  status = newStatus;
  if (statusHandler) {
    statusHandler(status);
  }
}

void Session::reportError(const SessionError& error) {
  LOG(INFO) << "Session " << id << " error: " << error;
  if (errorHandler) {
    errorHandler(error);
  }
}

void Session::sendJson(const json& message) {
  // Invalid UTF-8 from the console is replaced rather than thrown on
  string text = message.dump(-1, ' ', false, json::error_handler_t::replace);
  VLOG(3) << "Session " << id << " sending " << text.substr(0, 256);
  transport->sendText(text);
}

void Session::requireConnected(const string& operation) const {
  if (status != SessionStatus::CONNECTED) {
    throw SessionError(SessionErrorKind::SESSION_CLOSED,
                       "Cannot " + operation + ": session " + id + " is " +
                           sessionStatusName(status));
  }
}
}  // namespace wt
