#ifndef __WT_SESSION_REGISTRY__
#define __WT_SESSION_REGISTRY__

#include "Clock.hpp"
#include "EngineConfig.hpp"
#include "FileBrowserSession.hpp"
#include "Headers.hpp"
#include "PendingRequestCorrelator.hpp"
#include "TerminalSession.hpp"
#include "Transport.hpp"

namespace wt {
/**
 * @brief Owns every live session and drives them from one event loop.
 *
 * Sessions are keyed by an opaque id that is fresh for every connection
 * attempt, so reconnecting to the same server never reuses state.
 */
class SessionRegistry {
 public:
  SessionRegistry(shared_ptr<TransportFactory> _factory,
                  shared_ptr<Clock> _clock, const EngineConfig& _config);

  ~SessionRegistry();

  /**
   * @brief Creates a terminal session bound to `emulator` and starts
   * connecting it.  The new session becomes the active one.
   * @return The new session id.
   */
  string connectTerminal(const ServerRef& serverRef,
                         shared_ptr<TerminalEmulator> emulator,
                         shared_ptr<FileSinkProvider> sinkProvider);

  /**
   * @brief Creates a file browser session and starts connecting it.  The new
   * session becomes the active one.
   * @return The new session id.
   */
  string connectFileBrowser(const ServerRef& serverRef,
                            shared_ptr<FileSinkProvider> sinkProvider);

  /**
   * @brief Releases everything the session holds and forgets it.  Unknown
   * ids are ignored.
   */
  void disconnect(const string& id);

  void disconnectAll();

  /**
   * @brief Looks up a connected or connecting terminal session.
   * @throws SessionError SESSION_CLOSED for unknown, disconnected or
   * file browser ids.
   */
  shared_ptr<TerminalSession> getTerminal(const string& id);

  /** @brief Same as getTerminal for file browser sessions. */
  shared_ptr<FileBrowserSession> getFileBrowser(const string& id);

  shared_ptr<Session> getSession(const string& id);

  bool hasSession(const string& id) const {
    return sessions.find(id) != sessions.end();
  }

  vector<string> sessionIds() const;

  const string& getActiveSessionId() const { return activeSessionId; }
  void setActiveSessionId(const string& id);

  shared_ptr<PendingRequestCorrelator> getCorrelator() { return correlator; }

  /**
   * @brief One turn of the event loop: services transport I/O for up to
   * `timeoutMs`, expires overdue requests and lets each session run.
   */
  void update(int timeoutMs);

 protected:
  string newSessionId(const string& prefix, const ServerRef& serverRef);
  shared_ptr<Session> findLive(const string& id);

  shared_ptr<TransportFactory> factory;
  shared_ptr<Clock> clock;
  EngineConfig config;
  shared_ptr<PendingRequestCorrelator> correlator;
  map<string, shared_ptr<Session>> sessions;
  string activeSessionId;
};
}  // namespace wt

#endif  // __WT_SESSION_REGISTRY__
