#ifndef __WT_ZMODEM_SESSION__
#define __WT_ZMODEM_SESSION__

#include "Clock.hpp"
#include "EngineConfig.hpp"
#include "Headers.hpp"
#include "SessionError.hpp"
#include "Transfer.hpp"
#include "ZmodemReader.hpp"

namespace wt {
enum class ZmodemRole {
  /** Remote sends, we receive (remote ran sz) */
  RECEIVE,
  /** We send, remote receives (remote ran rz) */
  SEND,
};

typedef std::function<void(const string&)> ZmodemSender;

/**
 * @brief One Zmodem exchange embedded in a terminal stream.  Subclasses
 * implement the receiving and sending sides.
 *
 * The session ends after the ZFIN exchange or an abort.  Bytes received after
 * the end belong to the terminal and are kept for the caller.
 */
class ZmodemSession {
 public:
  /** Consecutive recoverable errors tolerated before giving up */
  static const int MAX_ERRORS = 10;

  ZmodemSession(ZmodemSender _sender, shared_ptr<Clock> _clock,
                const EngineConfig& _config);

  virtual ~ZmodemSession() {}

  virtual ZmodemRole getRole() const = 0;

  /**
   * @brief Feeds received bytes.  Throws on unrecoverable input, in which
   * case the caller aborts the session.
   */
  void consume(const string& bytes);

  /** @brief One event-loop turn of outbound work. */
  virtual void update() {}

  /**
   * @brief Ends the exchange locally: sends the abort sequence and cancels
   * the current transfer.
   */
  void abort(const string& reason);

  bool isFinished() const { return finished; }

  /** @brief Bytes that followed the end of the exchange. */
  string takeTrailingBytes();

  shared_ptr<Transfer> getTransfer() { return transfer; }
  int getCompletedCount() const { return completedCount; }

  void setProgressHandler(ProgressHandler handler) {
    progressHandler = handler;
  }

 protected:
  virtual void handleHeader(const ZmodemHeader& header) = 0;
  virtual void handleSubpacket(const string& data, uint8_t frameEnd) = 0;
  virtual void handleProtocolError(const SessionError& error);

  void sendHexHeader(const ZmodemHeader& header);
  void sendBinaryHeader(const ZmodemHeader& header, bool useCrc32);
  void send(const string& bytes) { sender(bytes); }

  shared_ptr<Transfer> startTransfer(TransferDirection direction,
                                     const string& name, int64_t size,
                                     int64_t progressIntervalMs);

  /** @brief The remote aborted: fail the current transfer and stop. */
  void remoteAbort(const string& reason);

  void finish();

  ZmodemSender sender;
  shared_ptr<Clock> clock;
  EngineConfig config;
  ZmodemReader reader;
  shared_ptr<Transfer> transfer;
  ProgressHandler progressHandler;
  bool finished;
  string trailing;
  int errorCount;
  int completedCount;
};
}  // namespace wt

#endif  // __WT_ZMODEM_SESSION__
