#ifndef __WT_ZMODEM_RECEIVE_SESSION__
#define __WT_ZMODEM_RECEIVE_SESSION__

#include "FileSink.hpp"
#include "ZmodemSession.hpp"

namespace wt {
/**
 * @brief Receiving side: answers the remote sz, accepts each offered file
 * and streams it into a sink.
 *
 * For every offered file the session first asks the blob consumer source for
 * a one-shot consumer.  With a consumer the file is kept in memory and handed
 * over whole; without one it is written to a sink from the provider.
 */
class ZmodemReceiveSession : public ZmodemSession {
 public:
  ZmodemReceiveSession(ZmodemSender _sender, shared_ptr<Clock> _clock,
                       const EngineConfig& _config,
                       shared_ptr<FileSinkProvider> _sinkProvider);

  virtual ZmodemRole getRole() const { return ZmodemRole::RECEIVE; }

  void setBlobConsumerSource(std::function<BlobHandler()> source) {
    blobConsumerSource = source;
  }

  struct FileOffer {
    string name;
    int64_t size;
    int64_t modifiedTime;
    int mode;
  };

  /** @brief Parses a ZFILE subpacket: "name\0size mtime mode ...\0". */
  static FileOffer parseFileOffer(const string& data);

 protected:
  enum State {
    AWAIT_FILE,
    AWAIT_FILE_INFO,
    AWAIT_DATA,
    RECEIVING,
    AWAIT_OVER_AND_OUT,
  };

  virtual void handleHeader(const ZmodemHeader& header);
  virtual void handleSubpacket(const string& data, uint8_t frameEnd);
  virtual void handleProtocolError(const SessionError& error);

  void sendReceiverInit();
  void acceptFile(const FileOffer& offer);
  void completeFile();
  void requestPosition();

  shared_ptr<FileSinkProvider> sinkProvider;
  std::function<BlobHandler()> blobConsumerSource;
  BlobHandler blobConsumer;
  State state;
  bool awaitingSinitData;
  bool discardingData;
};
}  // namespace wt

#endif  // __WT_ZMODEM_RECEIVE_SESSION__
