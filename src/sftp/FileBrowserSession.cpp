#include "FileBrowserSession.hpp"

namespace wt {
namespace {
const string READ_KEY_PREFIX = "read:";
const string SAVE_KEY_PREFIX = "save:";

string baseName(const string& path) {
  auto slash = path.find_last_of('/');
  string name = (slash == string::npos) ? path : path.substr(slash + 1);
  return name.empty() ? "download" : name;
}
}  // namespace

FileBrowserSession::FileBrowserSession(
    const string& _id, const ServerRef& _serverRef,
    shared_ptr<Transport> _transport,
    shared_ptr<PendingRequestCorrelator> _correlator, shared_ptr<Clock> _clock,
    const EngineConfig& _config, shared_ptr<FileSinkProvider> _sinkProvider)
    : Session(_id, _serverRef, _transport, _correlator, _clock, _config),
      sinkProvider(_sinkProvider),
      currentPath("."),
      uploadAcknowledged(0),
      pendingCancelAcks(0) {}

FileBrowserSession::~FileBrowserSession() {}

void FileBrowserSession::handleOpen() {
  setStatus(SessionStatus::CONNECTED);
  sendJson({{"server_id", serverRef.id()}});
}

void FileBrowserSession::onText(const string& text) {
  if (status == SessionStatus::DISCONNECTED) {
    return;
  }
  json message = json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    LOG(WARNING) << "Dropping malformed message on " << id << ": "
                 << text.substr(0, 128);
    return;
  }
  try {
    handleMessage(message);
  } catch (const json::exception& e) {
    LOG(WARNING) << "Dropping message with unexpected fields on " << id
                 << ": " << e.what();
  }
}

void FileBrowserSession::handleMessage(const json& message) {
  string type = jsonString(message, "type");
  VLOG(2) << "Session " << id << " received " << type;
  if (type == "connected") {
    sendPathCommand("list_dir", ".");
  } else if (type == "dir_list") {
    handleDirList(message);
  } else if (type == "success") {
    handleSuccess(jsonString(message, "message"));
  } else if (type == "error") {
    handleBackendError(jsonString(message, "message", "unknown error"));
  } else if (type == "closed") {
    LOG(INFO) << "Backend closed session " << id;
    teardown(SessionError(SessionErrorKind::SESSION_CLOSED,
                          "Connection closed by server"));
  } else if (type == "file_content") {
    string path = jsonString(message, "path");
    json content = message.value("content", json(""));
    correlator->resolve(id, READ_KEY_PREFIX + path, content);
  } else if (type == "upload_progress") {
    uploadAcknowledged = jsonInt64(message, "received", 0);
    VLOG(1) << "Backend acknowledged " << uploadAcknowledged << "/"
            << jsonInt64(message, "total", -1) << " upload bytes";
  } else if (type == "download_start") {
    handleDownloadStart(message);
  } else if (type == "download_chunk") {
    if (downloadState.get() && downloadState->transfer.get()) {
      downloadState->transfer->expectChunk();
    } else {
      VLOG(1) << "download_chunk without a download";
    }
  } else if (type == "download_end") {
    if (downloadState.get() && downloadState->transfer.get()) {
      downloadState->ended = true;
      downloadState->settleDeadline =
          clock->now() + config.downloadSettleTimeoutMs;
      downloadState->nextPollTime = clock->now();
      checkDownload();
    } else {
      VLOG(1) << "download_end without a download";
    }
  } else {
    LOG(WARNING) << "Unknown message type on " << id << ": " << type;
  }
}

void FileBrowserSession::handleDirList(const json& message) {
  auto rawEntries = message.find("entries");
  if (rawEntries == message.end() || !rawEntries->is_array()) {
    LOG(WARNING) << "dir_list without entries on " << id;
    return;
  }
  vector<FileEntry> newEntries;
  for (const auto& rawEntry : *rawEntries) {
    try {
      newEntries.push_back(fileEntryFromJson(rawEntry));
    } catch (const SessionError& e) {
      LOG(WARNING) << "Skipping directory entry: " << e.what();
    }
  }
  currentPath = jsonString(message, "path", currentPath);
  entries.swap(newEntries);
  if (listingHandler) {
    listingHandler(currentPath, entries);
  }
}

void FileBrowserSession::handleSuccess(const string& message) {
  if (message == config.fileSavedMessage) {
    correlator->resolveFirst(id, SAVE_KEY_PREFIX, json(message));
  }
  if (message == config.uploadCancelledMessage && pendingCancelAcks > 0) {
    // Acknowledges an upload this side already abandoned
    pendingCancelAcks--;
    VLOG(1) << "Backend acknowledged an upload cancel on " << id;
  } else if (uploadState.get()) {
    if (message == config.uploadSuccessMessage) {
      finishUpload(false);
    } else if (message == config.uploadCancelledMessage) {
      finishUpload(true);
    }
  }
  if (messageHandler) {
    messageHandler(message);
  }
  // Mutations are only visible through a fresh listing
  if (status == SessionStatus::CONNECTED) {
    sendPathCommand("list_dir", currentPath);
  }
}

void FileBrowserSession::handleBackendError(const string& message) {
  SessionError error(SessionErrorKind::BACKEND, message);
  if (uploadState.get()) {
    failUpload(error, false);
  }
  if (downloadState.get()) {
    failDownload(error);
  }
  correlator->rejectMatching(id, SAVE_KEY_PREFIX, error);
  reportError(error);
}

void FileBrowserSession::sendPathCommand(const string& type,
                                         const string& path) {
  sendJson({{"type", type}, {"path", path}});
}

void FileBrowserSession::listDir(const string& path) {
  requireConnected("list " + path);
  sendPathCommand("list_dir", path);
}

void FileBrowserSession::deleteFile(const string& path) {
  requireConnected("delete " + path);
  sendPathCommand("delete_file", path);
}

void FileBrowserSession::deleteDir(const string& path) {
  requireConnected("delete " + path);
  sendPathCommand("delete_dir", path);
}

void FileBrowserSession::createDir(const string& path) {
  requireConnected("create " + path);
  sendPathCommand("create_dir", path);
}

void FileBrowserSession::rename(const string& oldPath,
                                const string& newPath) {
  requireConnected("rename " + oldPath);
  sendJson({{"type", "rename"}, {"old_path", oldPath}, {"new_path", newPath}});
}

void FileBrowserSession::setPermissions(const string& path, int mode) {
  requireConnected("chmod " + path);
  sendJson({{"type", "set_permissions"}, {"path", path}, {"mode", mode}});
}

void FileBrowserSession::readFileContent(
    const string& path, std::function<void(const string&)> onContent,
    ErrorHandler onError) {
  requireConnected("read " + path);
  auto onResolve = [onContent](const json& value) {
    if (onContent) {
      onContent(value.is_string() ? value.get<string>() : value.dump());
    }
  };
  if (!correlator->waitFor(id, READ_KEY_PREFIX + path,
                           config.requestTimeoutMs, onResolve, onError)) {
    return;
  }
  sendPathCommand("read_file_content", path);
}

void FileBrowserSession::saveFileContent(const string& path,
                                         const string& content,
                                         std::function<void()> onSaved,
                                         ErrorHandler onError) {
  requireConnected("save " + path);
  auto onResolve = [onSaved](const json&) {
    if (onSaved) {
      onSaved();
    }
  };
  if (!correlator->waitFor(id, SAVE_KEY_PREFIX + path,
                           config.requestTimeoutMs, onResolve, onError)) {
    return;
  }
  sendJson(
      {{"type", "save_file_content"}, {"path", path}, {"content", content}});
}

void FileBrowserSession::upload(const string& remotePath,
                                shared_ptr<FileSource> source,
                                TransferHandler onComplete,
                                ErrorHandler onError) {
  requireConnected("upload " + remotePath);
  if (uploadState.get() || downloadState.get()) {
    LOG(INFO) << "Rejecting upload of " << remotePath << ": transfer running";
    if (onError) {
      onError(SessionError(SessionErrorKind::DUPLICATE_REQUEST,
                           "Another transfer is in progress"));
    }
    return;
  }
  shared_ptr<UploadState> state(new UploadState());
  state->remotePath = remotePath;
  state->source = source;
  state->transfer.reset(new Transfer(TransferDirection::SEND,
                                     source->getName(), source->getSize(),
                                     clock, config.sendProgressIntervalMs));
  state->transfer->setProgressHandler(transferProgressHandler);
  state->offset = 0;
  state->nextChunkTime = clock->now() + config.uploadStartDelayMs;
  state->endSent = false;
  state->completionDeadline = 0;
  state->cancelRequested = false;
  state->onComplete = onComplete;
  state->onError = onError;
  uploadState = state;
  uploadAcknowledged = 0;

  LOG(INFO) << "Uploading " << source->getName() << " ("
            << source->getSize() << " bytes) to " << remotePath;
  sendJson({{"type", "upload_file_start"},
            {"path", remotePath},
            {"total_size", source->getSize()}});
}

void FileBrowserSession::cancelUpload() {
  if (!uploadState.get()) {
    VLOG(1) << "No upload to cancel on " << id;
    return;
  }
  LOG(INFO) << "Cancelling upload of " << uploadState->remotePath;
  uploadState->cancelRequested = true;
}

void FileBrowserSession::update() {
  if (status != SessionStatus::CONNECTED) {
    return;
  }
  if (uploadState.get()) {
    pumpUpload();
  }
  if (downloadState.get() && downloadState->ended &&
      clock->now() >= downloadState->nextPollTime) {
    checkDownload();
  }
}

void FileBrowserSession::pumpUpload() {
  shared_ptr<UploadState> state = uploadState;
  int64_t now = clock->now();
  if (state->cancelRequested) {
    sendUploadCancel();
    failUpload(SessionError(SessionErrorKind::TRANSFER_ABORTED,
                            config.uploadCancelledMessage),
               true);
    return;
  }
  if (state->endSent) {
    if (now >= state->completionDeadline) {
      failUpload(SessionError(SessionErrorKind::TIMEOUT,
                              "Timed out waiting for the upload of " +
                                  state->remotePath + " to complete"),
                 false);
    }
    return;
  }
  if (now < state->nextChunkTime) {
    return;
  }
  if ((int64_t)transport->pendingBytes() >= config.maxOutboundBacklog) {
    VLOG(3) << "Holding upload chunk, " << transport->pendingBytes()
            << " bytes queued";
    return;
  }

  int64_t size = state->source->getSize();
  if (state->offset < size) {
    string chunk;
    try {
      chunk = state->source->read(state->offset, config.uploadChunkSize);
    } catch (const std::runtime_error& e) {
      sendUploadCancel();
      failUpload(SessionError(SessionErrorKind::TRANSFER_ABORTED, e.what()),
                 false);
      return;
    }
    if (chunk.empty()) {
      sendUploadCancel();
      failUpload(SessionError(SessionErrorKind::TRANSFER_ABORTED,
                              "Source ended before its announced size"),
                 false);
      return;
    }
    transport->sendBinary(chunk);
    state->offset += chunk.size();
    state->transfer->advance(chunk.size());
    VLOG(2) << "Sent upload chunk, " << state->offset << "/" << size;
  }
  if (state->offset >= size) {
    sendJson({{"type", "upload_file_end"}});
    state->endSent = true;
    state->completionDeadline = now + config.uploadCompletionTimeoutMs;
  } else {
    state->nextChunkTime = now + config.uploadChunkDelayMs;
  }
}

void FileBrowserSession::sendUploadCancel() {
  sendJson({{"type", "upload_file_cancel"}});
  pendingCancelAcks++;
}

void FileBrowserSession::finishUpload(bool cancelled) {
  shared_ptr<UploadState> state = uploadState;
  uploadState.reset();
  if (cancelled) {
    state->transfer->abort("Cancelled by backend", true);
    if (state->onError) {
      state->onError(SessionError(SessionErrorKind::TRANSFER_ABORTED,
                                  config.uploadCancelledMessage));
    }
    return;
  }
  state->transfer->finish();
  if (state->onComplete) {
    state->onComplete(state->transfer);
  }
}

void FileBrowserSession::failUpload(const SessionError& error,
                                    bool cancelled) {
  shared_ptr<UploadState> state = uploadState;
  uploadState.reset();
  state->transfer->abort(error.what(), cancelled);
  if (state->onError) {
    state->onError(error);
  }
}

void FileBrowserSession::downloadFile(const string& remotePath,
                                      TransferHandler onComplete,
                                      ErrorHandler onError) {
  requireConnected("download " + remotePath);
  startDownload(remotePath, BlobHandler(), onComplete, onError);
}

void FileBrowserSession::fetchFile(const string& remotePath,
                                   BlobHandler onBlob, ErrorHandler onError) {
  requireConnected("fetch " + remotePath);
  startDownload(remotePath, onBlob, TransferHandler(), onError);
}

void FileBrowserSession::startDownload(const string& remotePath,
                                       BlobHandler onBlob,
                                       TransferHandler onComplete,
                                       ErrorHandler onError) {
  if (uploadState.get() || downloadState.get()) {
    LOG(INFO) << "Rejecting download of " << remotePath
              << ": transfer running";
    if (onError) {
      onError(SessionError(SessionErrorKind::DUPLICATE_REQUEST,
                           "Another transfer is in progress"));
    }
    return;
  }
  shared_ptr<DownloadState> state(new DownloadState());
  state->remotePath = remotePath;
  state->fileName = baseName(remotePath);
  state->onBlob = onBlob;
  state->onComplete = onComplete;
  state->onError = onError;
  state->ended = false;
  state->settleDeadline = 0;
  state->nextPollTime = 0;
  downloadState = state;
  LOG(INFO) << "Downloading " << remotePath;
  sendPathCommand("download_file", remotePath);
}

void FileBrowserSession::handleDownloadStart(const json& message) {
  if (!downloadState.get()) {
    LOG(WARNING) << "download_start without a requested download on " << id;
    return;
  }
  shared_ptr<DownloadState> state = downloadState;
  int64_t totalSize = jsonInt64(message, "total_size", -1);
  shared_ptr<FileSink> sink;
  if (!state->onBlob) {
    if (!sinkProvider.get()) {
      failDownload(SessionError(SessionErrorKind::TRANSFER_ABORTED,
                                "No destination for downloads"));
      return;
    }
    try {
      sink = sinkProvider->createSink(state->fileName, totalSize);
    } catch (const std::runtime_error& e) {
      failDownload(SessionError(SessionErrorKind::TRANSFER_ABORTED, e.what()));
      return;
    }
  }
  state->transfer.reset(new Transfer(TransferDirection::RECEIVE,
                                     state->fileName, totalSize, clock,
                                     config.receiveProgressIntervalMs));
  state->transfer->setSink(sink);
  state->transfer->setRetainInMemory(bool(state->onBlob));
  state->transfer->setProgressHandler(transferProgressHandler);
}

void FileBrowserSession::onBinary(const string& data) {
  if (status == SessionStatus::DISCONNECTED) {
    return;
  }
  if (!downloadState.get() || !downloadState->transfer.get()) {
    VLOG(1) << "Dropping " << data.size() << " byte frame without a download";
    return;
  }
  try {
    downloadState->transfer->push(data);
  } catch (const SessionError& e) {
    failDownload(e);
  } catch (const std::runtime_error& e) {
    failDownload(SessionError(SessionErrorKind::TRANSFER_ABORTED, e.what()));
  }
}

void FileBrowserSession::checkDownload() {
  shared_ptr<DownloadState> state = downloadState;
  shared_ptr<Transfer> transfer = state->transfer;
  // An empty file is announced with a zero size and no chunks
  bool emptyFile = transfer->getTotalSize() == 0 &&
                   transfer->getExpectedChunkCount() == 0 &&
                   transfer->getReceivedChunkCount() == 0;
  if (!emptyFile && transfer->getExpectedChunkCount() == 0) {
    failDownload(SessionError(SessionErrorKind::PROTOCOL,
                              "Download of " + state->remotePath +
                                  " ended without any data"));
    return;
  }
  if (!emptyFile && !transfer->hasConverged()) {
    int64_t now = clock->now();
    if (now >= state->settleDeadline) {
      failDownload(SessionError(
          SessionErrorKind::TIMEOUT,
          "Download of " + state->remotePath + " received " +
              to_string(transfer->getReceivedChunkCount()) + " of " +
              to_string(transfer->getExpectedChunkCount()) + " chunks"));
    } else {
      state->nextPollTime = now + config.downloadPollIntervalMs;
    }
    return;
  }

  downloadState.reset();
  transfer->finish();
  if (state->onBlob) {
    state->onBlob(state->fileName, transfer->getRetained());
  } else if (state->onComplete) {
    state->onComplete(transfer);
  }
}

void FileBrowserSession::failDownload(const SessionError& error) {
  shared_ptr<DownloadState> state = downloadState;
  downloadState.reset();
  if (state->transfer.get()) {
    state->transfer->abort(error.what(), false);
  }
  if (state->onError) {
    state->onError(error);
  }
}

shared_ptr<Transfer> FileBrowserSession::getUploadTransfer() {
  return uploadState.get() ? uploadState->transfer : shared_ptr<Transfer>();
}

shared_ptr<Transfer> FileBrowserSession::getDownloadTransfer() {
  return downloadState.get() ? downloadState->transfer
                             : shared_ptr<Transfer>();
}

void FileBrowserSession::releaseResources(const SessionError& reason) {
  bool cancelled = reason.getKind() == SessionErrorKind::SESSION_CLOSED;
  if (uploadState.get()) {
    failUpload(reason, cancelled);
  }
  if (downloadState.get()) {
    shared_ptr<DownloadState> state = downloadState;
    downloadState.reset();
    if (state->transfer.get()) {
      state->transfer->abort(reason.what(), cancelled);
    }
    if (state->onError) {
      state->onError(reason);
    }
  }
}
}  // namespace wt
