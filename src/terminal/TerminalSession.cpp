#include "TerminalSession.hpp"

namespace wt {
TerminalSession::TerminalSession(
    const string& _id, const ServerRef& _serverRef,
    shared_ptr<Transport> _transport,
    shared_ptr<PendingRequestCorrelator> _correlator, shared_ptr<Clock> _clock,
    const EngineConfig& _config, shared_ptr<TerminalEmulator> _emulator,
    shared_ptr<FileSinkProvider> _sinkProvider)
    : Session(_id, _serverRef, _transport, _correlator, _clock, _config),
      emulator(_emulator),
      sinkProvider(_sinkProvider),
      sentry([this](const string& s) { emulator->write(s); },
             [this](const string& s) { transport->sendBinary(s); }),
      emulatorDisposed(false) {
  sentry.setDetectionHandler(
      [this](const ZmodemDetection& detection) { handleDetection(detection); });
  sentry.setSessionEndHandler(
      [this](shared_ptr<ZmodemSession> ended) { handleZmodemEnd(ended); });
  emulator->setDataHandler([this](const string& data) { handleInput(data); });
  emulator->setResizeHandler(
      [this](int cols, int rows) { handleResize(cols, rows); });
}

TerminalSession::~TerminalSession() {
  if (!emulatorDisposed) {
    emulator->setDataHandler(TerminalDataHandler());
    emulator->setResizeHandler(TerminalResizeHandler());
  }
}

void TerminalSession::handleOpen() {
  setStatus(SessionStatus::CONNECTED);
  std::ostringstream banner;
  banner << "\x1b[1;34m  \xe2\x9e\x9c  \x1b[0mConnecting to " << serverRef.name()
         << " (" << serverRef.host() << ")...\r\n";
  emulator->write(banner.str());

  TerminalInfo ti = emulator->getTerminalInfo();
  json params = {
      {"server_id", serverRef.id()},
      {"mode", "shell"},
      {"term", config.terminalType},
      {"cols", ti.column() ? ti.column() : 80},
      {"rows", ti.row() ? ti.row() : 24},
      {"env", {{"LANG", config.terminalLang}, {"LC_ALL", config.terminalLcAll}}},
  };
  sendJson(params);
  emulator->write(
      "\x1b[1;32m  \xe2\x9e\x9c  Connected successfully.\x1b[0m\r\n\r\n");
  emulator->focus();
}

void TerminalSession::onText(const string& text) {
  if (status == SessionStatus::DISCONNECTED) {
    return;
  }
  json message = json::parse(text, nullptr, false);
  if (!message.is_discarded() && message.is_object()) {
    string type = jsonString(message, "type");
    if (type == "Error") {
      string errorMessage = jsonString(message, "message", "unknown error");
      emulator->write("\r\n\x1b[31mError: " + errorMessage + "\x1b[0m\r\n");
      SessionError error(SessionErrorKind::BACKEND, errorMessage);
      teardown(error);
      reportError(error);
      return;
    }
    if (type == "Closed") {
      emulator->write(
          "\r\n\x1b[1;31m  \xe2\x9e\x9c  Connection closed by "
          "server.\x1b[0m\r\n");
      teardown(SessionError(SessionErrorKind::SESSION_CLOSED,
                            "Connection closed by server"));
      return;
    }
  }
  emulator->write(text);
}

void TerminalSession::onBinary(const string& data) {
  if (status == SessionStatus::DISCONNECTED) {
    return;
  }
  sentry.consume(data);
}

void TerminalSession::handleInput(const string& data) {
  if (status != SessionStatus::CONNECTED) {
    return;
  }
  if (sentry.isActive()) {
    VLOG(2) << "Dropping " << data.size() << " input bytes during transfer";
    return;
  }
  sendJson({{"type", "Input"}, {"data", data}});
}

void TerminalSession::handleResize(int cols, int rows) {
  if (status != SessionStatus::CONNECTED || sentry.isActive()) {
    return;
  }
  sendJson({{"type", "Resize"}, {"cols", cols}, {"rows", rows}});
}

void TerminalSession::handleDetection(const ZmodemDetection& detection) {
  auto sender = [this](const string& s) { transport->sendBinary(s); };
  shared_ptr<ZmodemSession> zmodemSession;
  if (detection.getRole() == ZmodemRole::RECEIVE) {
    emulator->write(
        "\r\n\x1b[1;33m[Zmodem] sz detected, receiving files...\x1b[0m\r\n");
    shared_ptr<ZmodemReceiveSession> receiveSession(
        new ZmodemReceiveSession(sender, clock, config, sinkProvider));
    receiveSession->setBlobConsumerSource(
        [this]() { return claimBlobConsumer(); });
    zmodemSession = receiveSession;
  } else {
    vector<shared_ptr<FileSource>> files;
    if (sendFileProvider) {
      try {
        files = sendFileProvider();
      } catch (const std::runtime_error& e) {
        LOG(WARNING) << "Cannot open files to send: " << e.what();
        emulator->write("\r\n\x1b[31m[Zmodem] " + string(e.what()) +
                        "\x1b[0m\r\n");
      }
    }
    if (files.empty()) {
      LOG(INFO) << "No files to send, refusing rz";
      sentry.deny();
      return;
    }
    emulator->write("\r\n\x1b[1;33m[Zmodem] rz detected, sending " +
                    to_string(files.size()) + " files...\x1b[0m\r\n");
    zmodemSession.reset(new ZmodemSendSession(sender, clock, config, files));
  }
  zmodemSession->setProgressHandler(transferProgressHandler);
  sentry.confirm(zmodemSession);
}

void TerminalSession::handleZmodemEnd(shared_ptr<ZmodemSession> ended) {
  LOG(INFO) << "Zmodem exchange ended on " << id << " after "
            << ended->getCompletedCount() << " files";
  if (status == SessionStatus::CONNECTED) {
    emulator->write("\r\n\x1b[1;33m[Zmodem] Transfer finished (" +
                    to_string(ended->getCompletedCount()) +
                    " files)\x1b[0m\r\n");
  }
}

BlobHandler TerminalSession::claimBlobConsumer() {
  BlobHandler consumer = pendingBlobConsumer;
  pendingBlobConsumer = BlobHandler();
  return consumer;
}

void TerminalSession::fetchNextReceiveAsBlob(BlobHandler handler) {
  requireConnected("fetch a file");
  pendingBlobConsumer = handler;
}

shared_ptr<Transfer> TerminalSession::getActiveTransfer() {
  shared_ptr<ZmodemSession> zmodemSession = sentry.getSession();
  if (!zmodemSession.get()) {
    return shared_ptr<Transfer>();
  }
  return zmodemSession->getTransfer();
}

void TerminalSession::update() {
  if (status != SessionStatus::CONNECTED || !sentry.isActive()) {
    return;
  }
  if ((int64_t)transport->pendingBytes() >= config.maxOutboundBacklog) {
    VLOG(3) << "Holding zmodem data, " << transport->pendingBytes()
            << " bytes queued";
    return;
  }
  sentry.update();
}

void TerminalSession::releaseResources(const SessionError& reason) {
  sentry.abort(reason.what());
  pendingBlobConsumer = BlobHandler();
}

void TerminalSession::disconnect() {
  Session::disconnect();
  if (!emulatorDisposed) {
    emulatorDisposed = true;
    emulator->dispose();
  }
}
}  // namespace wt
