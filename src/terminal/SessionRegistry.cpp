#include "SessionRegistry.hpp"

namespace wt {
SessionRegistry::SessionRegistry(shared_ptr<TransportFactory> _factory,
                                 shared_ptr<Clock> _clock,
                                 const EngineConfig& _config)
    : factory(_factory),
      clock(_clock),
      config(_config),
      correlator(new PendingRequestCorrelator(_clock)) {}

SessionRegistry::~SessionRegistry() { disconnectAll(); }

string SessionRegistry::newSessionId(const string& prefix,
                                     const ServerRef& serverRef) {
  while (true) {
    string id = prefix + "-" + to_string(serverRef.id()) + "-" +
                genRandomAlphaNum(8);
    if (sessions.find(id) == sessions.end()) {
      return id;
    }
  }
}

string SessionRegistry::connectTerminal(
    const ServerRef& serverRef, shared_ptr<TerminalEmulator> emulator,
    shared_ptr<FileSinkProvider> sinkProvider) {
  string id = newSessionId("ssh", serverRef);
  shared_ptr<TerminalSession> session(
      new TerminalSession(id, serverRef, factory->create(), correlator, clock,
                          config, emulator, sinkProvider));
  sessions[id] = session;
  activeSessionId = id;
  LOG(INFO) << "Connecting terminal session " << id << " to " << serverRef;
  session->connect(getWebSocketUrl(config.apiUrl, TERMINAL_ENDPOINT_PATH));
  return id;
}

string SessionRegistry::connectFileBrowser(
    const ServerRef& serverRef, shared_ptr<FileSinkProvider> sinkProvider) {
  string id = newSessionId("sftp", serverRef);
  shared_ptr<FileBrowserSession> session(
      new FileBrowserSession(id, serverRef, factory->create(), correlator,
                             clock, config, sinkProvider));
  sessions[id] = session;
  activeSessionId = id;
  LOG(INFO) << "Connecting file browser session " << id << " to "
            << serverRef;
  session->connect(
      getWebSocketUrl(config.apiUrl, FILE_BROWSER_ENDPOINT_PATH));
  return id;
}

void SessionRegistry::disconnect(const string& id) {
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    VLOG(1) << "Ignoring disconnect of unknown session " << id;
    return;
  }
  shared_ptr<Session> session = it->second;
  sessions.erase(it);
  if (activeSessionId == id) {
    activeSessionId.clear();
  }
  LOG(INFO) << "Disconnecting session " << id;
  session->disconnect();
}

void SessionRegistry::disconnectAll() {
  vector<string> ids = sessionIds();
  for (const auto& id : ids) {
    disconnect(id);
  }
}

shared_ptr<Session> SessionRegistry::findLive(const string& id) {
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    throw SessionError(SessionErrorKind::SESSION_CLOSED,
                       "No session with id " + id);
  }
  if (it->second->getStatus() == SessionStatus::DISCONNECTED) {
    throw SessionError(SessionErrorKind::SESSION_CLOSED,
                       "Session " + id + " is disconnected");
  }
  return it->second;
}

shared_ptr<Session> SessionRegistry::getSession(const string& id) {
  return findLive(id);
}

shared_ptr<TerminalSession> SessionRegistry::getTerminal(const string& id) {
  shared_ptr<TerminalSession> terminal =
      std::dynamic_pointer_cast<TerminalSession>(findLive(id));
  if (!terminal.get()) {
    throw SessionError(SessionErrorKind::SESSION_CLOSED,
                       "Session " + id + " is not a terminal session");
  }
  return terminal;
}

shared_ptr<FileBrowserSession> SessionRegistry::getFileBrowser(
    const string& id) {
  shared_ptr<FileBrowserSession> browser =
      std::dynamic_pointer_cast<FileBrowserSession>(findLive(id));
  if (!browser.get()) {
    throw SessionError(SessionErrorKind::SESSION_CLOSED,
                       "Session " + id + " is not a file browser session");
  }
  return browser;
}

vector<string> SessionRegistry::sessionIds() const {
  vector<string> ids;
  for (const auto& it : sessions) {
    ids.push_back(it.first);
  }
  return ids;
}

void SessionRegistry::setActiveSessionId(const string& id) {
  if (!id.empty() && !hasSession(id)) {
    throw SessionError(SessionErrorKind::SESSION_CLOSED,
                       "No session with id " + id);
  }
  activeSessionId = id;
}

void SessionRegistry::update(int timeoutMs) {
  factory->poll(timeoutMs);
  correlator->expire();

  // Sessions may disconnect each other from their callbacks
  vector<shared_ptr<Session>> snapshot;
  for (const auto& it : sessions) {
    snapshot.push_back(it.second);
  }
  for (auto& session : snapshot) {
    if (hasSession(session->getId())) {
      session->update();
    }
  }
}
}  // namespace wt
