#ifndef __WT_FILE_BROWSER_SESSION__
#define __WT_FILE_BROWSER_SESSION__

#include "FileBrowserProtocol.hpp"
#include "FileSink.hpp"
#include "FileSource.hpp"
#include "Headers.hpp"
#include "Session.hpp"
#include "Transfer.hpp"

namespace wt {
typedef std::function<void(const string& path, const vector<FileEntry>&)>
    ListingHandler;
typedef std::function<void(const string&)> MessageHandler;
typedef std::function<void(shared_ptr<Transfer>)> TransferHandler;

/**
 * @brief Browses and transfers files on a remote server over the JSON
 * control protocol of the SFTP endpoint.
 *
 * Control operations are fire-and-forget; their results show up as the next
 * `dir_list`, `success` or `error`.  Reading and saving file contents are
 * correlated by path.  Uploads and downloads are chunked binary frames and
 * at most one of them runs at a time.
 */
class FileBrowserSession : public Session {
 public:
  FileBrowserSession(const string& _id, const ServerRef& _serverRef,
                     shared_ptr<Transport> _transport,
                     shared_ptr<PendingRequestCorrelator> _correlator,
                     shared_ptr<Clock> _clock, const EngineConfig& _config,
                     shared_ptr<FileSinkProvider> _sinkProvider);

  virtual ~FileBrowserSession();

  virtual SessionKind getKind() const { return SessionKind::FILE_BROWSER; }

  virtual void update();

  virtual void onText(const string& text);
  virtual void onBinary(const string& data);

  void listDir(const string& path);
  void deleteFile(const string& path);
  void deleteDir(const string& path);
  void createDir(const string& path);
  void rename(const string& oldPath, const string& newPath);
  void setPermissions(const string& path, int mode);

  /**
   * @brief Fetches the text content of `path`.  A second read of the same
   * path while the first is pending fails with DUPLICATE_REQUEST.
   */
  void readFileContent(const string& path,
                       std::function<void(const string&)> onContent,
                       ErrorHandler onError);

  void saveFileContent(const string& path, const string& content,
                       std::function<void()> onSaved, ErrorHandler onError);

  /**
   * @brief Uploads `source` to `remotePath`.  Rejected with
   * DUPLICATE_REQUEST, before anything is sent, while another upload or a
   * download is in progress.
   */
  void upload(const string& remotePath, shared_ptr<FileSource> source,
              TransferHandler onComplete, ErrorHandler onError);

  /**
   * @brief Stops the running upload.  Takes effect on the next update(),
   * before any further chunk.
   */
  void cancelUpload();

  /** @brief Streams `remotePath` into a sink from the sink provider. */
  void downloadFile(const string& remotePath, TransferHandler onComplete,
                    ErrorHandler onError);

  /** @brief Downloads `remotePath` into memory and hands over the bytes. */
  void fetchFile(const string& remotePath, BlobHandler onBlob,
                 ErrorHandler onError);

  const string& getCurrentPath() const { return currentPath; }
  const vector<FileEntry>& getEntries() const { return entries; }
  bool isUploading() const { return uploadState.get() != NULL; }
  bool isDownloading() const { return downloadState.get() != NULL; }
  shared_ptr<Transfer> getUploadTransfer();
  shared_ptr<Transfer> getDownloadTransfer();
  /** @brief Bytes of the running upload the backend acknowledged. */
  int64_t getUploadAcknowledgedBytes() const { return uploadAcknowledged; }

  void setListingHandler(ListingHandler handler) { listingHandler = handler; }
  /** @brief Receives every `success` message text. */
  void setMessageHandler(MessageHandler handler) { messageHandler = handler; }
  void setTransferProgressHandler(ProgressHandler handler) {
    transferProgressHandler = handler;
  }

 protected:
  struct UploadState {
    string remotePath;
    shared_ptr<FileSource> source;
    shared_ptr<Transfer> transfer;
    int64_t offset;
    int64_t nextChunkTime;
    bool endSent;
    int64_t completionDeadline;
    bool cancelRequested;
    TransferHandler onComplete;
    ErrorHandler onError;
  };

  struct DownloadState {
    string remotePath;
    string fileName;
    shared_ptr<Transfer> transfer;
    BlobHandler onBlob;
    TransferHandler onComplete;
    ErrorHandler onError;
    bool ended;
    int64_t settleDeadline;
    int64_t nextPollTime;
  };

  virtual void handleOpen();
  virtual void releaseResources(const SessionError& reason);

  void handleMessage(const json& message);
  void handleDirList(const json& message);
  void handleSuccess(const string& message);
  void handleBackendError(const string& message);
  void handleDownloadStart(const json& message);

  void startDownload(const string& remotePath, BlobHandler onBlob,
                     TransferHandler onComplete, ErrorHandler onError);
  void pumpUpload();
  void finishUpload(bool cancelled);
  void failUpload(const SessionError& error, bool cancelled);
  void sendUploadCancel();
  void checkDownload();
  void failDownload(const SessionError& error);
  void sendPathCommand(const string& type, const string& path);

  shared_ptr<FileSinkProvider> sinkProvider;
  string currentPath;
  vector<FileEntry> entries;
  shared_ptr<UploadState> uploadState;
  shared_ptr<DownloadState> downloadState;
  int64_t uploadAcknowledged;
  // upload_file_cancel messages whose acknowledgement has not arrived yet
  int pendingCancelAcks;
  ListingHandler listingHandler;
  MessageHandler messageHandler;
  ProgressHandler transferProgressHandler;
};
}  // namespace wt

#endif  // __WT_FILE_BROWSER_SESSION__
