#ifndef __WT_TERMINAL_SESSION__
#define __WT_TERMINAL_SESSION__

#include "FileSink.hpp"
#include "FileSource.hpp"
#include "Headers.hpp"
#include "Session.hpp"
#include "TerminalEmulator.hpp"
#include "ZmodemReceiveSession.hpp"
#include "ZmodemSendSession.hpp"
#include "ZmodemSentry.hpp"

namespace wt {
/** @brief Supplies the files to offer when the remote runs rz. */
typedef std::function<vector<shared_ptr<FileSource>>()> SendFileProvider;

/**
 * @brief An interactive shell on a remote server.
 *
 * Keystrokes and resizes go out as JSON `Input`/`Resize` messages.  Inbound
 * text is either an `Error`/`Closed` control message or output to render.
 * Inbound binary frames pass through the Zmodem sentry; while a Zmodem
 * exchange runs, keyboard input and resizes are suppressed.
 */
class TerminalSession : public Session {
 public:
  TerminalSession(const string& _id, const ServerRef& _serverRef,
                  shared_ptr<Transport> _transport,
                  shared_ptr<PendingRequestCorrelator> _correlator,
                  shared_ptr<Clock> _clock, const EngineConfig& _config,
                  shared_ptr<TerminalEmulator> _emulator,
                  shared_ptr<FileSinkProvider> _sinkProvider);

  virtual ~TerminalSession();

  virtual SessionKind getKind() const { return SessionKind::TERMINAL; }

  virtual void disconnect();
  virtual void update();

  virtual void onText(const string& text);
  virtual void onBinary(const string& data);

  void setSendFileProvider(SendFileProvider provider) {
    sendFileProvider = provider;
  }
  void setTransferProgressHandler(ProgressHandler handler) {
    transferProgressHandler = handler;
  }

  /**
   * @brief The next file received over Zmodem is handed to `handler` in
   * memory instead of being written to a sink.  One-shot.
   */
  void fetchNextReceiveAsBlob(BlobHandler handler);

  bool isTransferActive() const { return sentry.isActive(); }
  shared_ptr<Transfer> getActiveTransfer();

  shared_ptr<TerminalEmulator> getEmulator() { return emulator; }

 protected:
  virtual void handleOpen();
  virtual void releaseResources(const SessionError& reason);

  void handleInput(const string& data);
  void handleResize(int cols, int rows);
  void handleDetection(const ZmodemDetection& detection);
  void handleZmodemEnd(shared_ptr<ZmodemSession> ended);
  BlobHandler claimBlobConsumer();

  shared_ptr<TerminalEmulator> emulator;
  shared_ptr<FileSinkProvider> sinkProvider;
  ZmodemSentry sentry;
  SendFileProvider sendFileProvider;
  ProgressHandler transferProgressHandler;
  BlobHandler pendingBlobConsumer;
  bool emulatorDisposed;
};
}  // namespace wt

#endif  // __WT_TERMINAL_SESSION__
