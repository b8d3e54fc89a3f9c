#ifndef __WT_ZMODEM_SEND_SESSION__
#define __WT_ZMODEM_SEND_SESSION__

#include "FileSource.hpp"
#include "ZmodemSession.hpp"

namespace wt {
/**
 * @brief Sending side: offers each file to the remote rz and streams the
 * accepted ones.
 *
 * Data goes out one chunk per update() so a large file never holds the event
 * loop for more than one chunk.  A declined file (ZSKIP) is skipped and the
 * batch continues with the next one.
 */
class ZmodemSendSession : public ZmodemSession {
 public:
  ZmodemSendSession(ZmodemSender _sender, shared_ptr<Clock> _clock,
                    const EngineConfig& _config,
                    const vector<shared_ptr<FileSource>>& _files);

  virtual ZmodemRole getRole() const { return ZmodemRole::SEND; }

  virtual void update();

  int getSkippedCount() const { return skippedCount; }

  /** @brief The ZFILE subpacket describing `file`. */
  static string buildFileOffer(FileSource* file, int filesRemaining,
                               int64_t bytesRemaining);

 protected:
  enum State {
    AWAIT_RECEIVER_INIT,
    AWAIT_FILE_RESPONSE,
    SENDING,
    AWAIT_EOF_ACK,
    AWAIT_FIN,
  };

  virtual void handleHeader(const ZmodemHeader& header);
  virtual void handleSubpacket(const string& data, uint8_t frameEnd);

  void offerNextFile();
  void sendOffer();
  void startData(int64_t position);
  void completeFile();

  vector<shared_ptr<FileSource>> files;
  size_t nextFileIndex;
  shared_ptr<FileSource> currentFile;
  State state;
  bool useCrc32;
  int64_t offset;
  int skippedCount;
};
}  // namespace wt

#endif  // __WT_ZMODEM_SEND_SESSION__
