#include "ZmodemSendSession.hpp"

namespace wt {
ZmodemSendSession::ZmodemSendSession(
    ZmodemSender _sender, shared_ptr<Clock> _clock,
    const EngineConfig& _config, const vector<shared_ptr<FileSource>>& _files)
    : ZmodemSession(_sender, _clock, _config),
      files(_files),
      nextFileIndex(0),
      state(AWAIT_RECEIVER_INIT),
      useCrc32(false),
      offset(0),
      skippedCount(0) {}

string ZmodemSendSession::buildFileOffer(FileSource* file, int filesRemaining,
                                         int64_t bytesRemaining) {
  std::ostringstream oss;
  oss << file->getName() << '\0' << file->getSize() << " " << std::oct
      << file->getModifiedTime() << " " << file->getMode() << " 0"
      << std::dec << " " << filesRemaining << " " << bytesRemaining << '\0';
  return oss.str();
}

void ZmodemSendSession::handleHeader(const ZmodemHeader& header) {
  switch (header.type) {
    case ZRINIT:
      useCrc32 = (header.flags() & CANFC32) != 0;
      if (state == AWAIT_RECEIVER_INIT) {
        offerNextFile();
      } else if (state == AWAIT_EOF_ACK) {
        completeFile();
        offerNextFile();
      } else if (state == AWAIT_FILE_RESPONSE) {
        sendOffer();
      } else if (state == AWAIT_FIN) {
        sendHexHeader(ZmodemHeader::withPosition(ZFIN, 0));
      }
      break;
    case ZRPOS:
      if (state == AWAIT_FILE_RESPONSE || state == SENDING ||
          state == AWAIT_EOF_ACK) {
        startData(header.position());
      }
      break;
    case ZSKIP:
      if (currentFile.get()) {
        LOG(INFO) << "Remote skipped " << currentFile->getName();
        skippedCount++;
        if (transfer.get()) {
          transfer->abort("Skipped by remote", true);
          transfer.reset();
        }
        currentFile.reset();
      }
      offerNextFile();
      break;
    case ZNAK:
      if (state == AWAIT_FILE_RESPONSE) {
        sendOffer();
      }
      break;
    case ZFIN:
      if (state == AWAIT_FIN) {
        send("OO");
        finish();
      }
      break;
    case ZFERR:
      remoteAbort("Remote reported a file error");
      break;
    case ZACK:
      VLOG(2) << "ZACK at " << header.position();
      break;
    default:
      VLOG(1) << "Ignoring " << zmodemFrameTypeName(header.type);
      break;
  }
}

void ZmodemSendSession::handleSubpacket(const string& data, uint8_t frameEnd) {
  VLOG(1) << "Dropping unexpected subpacket of " << data.size() << " bytes";
}

void ZmodemSendSession::offerNextFile() {
  if (nextFileIndex >= files.size()) {
    currentFile.reset();
    state = AWAIT_FIN;
    sendHexHeader(ZmodemHeader::withPosition(ZFIN, 0));
    return;
  }
  currentFile = files[nextFileIndex++];
  sendOffer();
}

void ZmodemSendSession::sendOffer() {
  int filesRemaining = int(files.size() - nextFileIndex) + 1;
  int64_t bytesRemaining = currentFile->getSize();
  for (size_t i = nextFileIndex; i < files.size(); i++) {
    bytesRemaining += files[i]->getSize();
  }
  LOG(INFO) << "Offering " << currentFile->getName() << " ("
            << currentFile->getSize() << " bytes)";
  string out = encodeBinaryHeader(ZmodemHeader::withFlags(ZFILE, ZCBIN),
                                  useCrc32);
  out.append(encodeSubpacket(
      buildFileOffer(currentFile.get(), filesRemaining, bytesRemaining),
      ZCRCW, useCrc32));
  send(out);
  state = AWAIT_FILE_RESPONSE;
}

void ZmodemSendSession::startData(int64_t position) {
  if (!currentFile.get()) {
    return;
  }
  if (position > currentFile->getSize()) {
    LOG(WARNING) << "ZRPOS " << position << " past the end of "
                 << currentFile->getName();
    position = currentFile->getSize();
  }
  if (!transfer.get()) {
    startTransfer(TransferDirection::SEND, currentFile->getName(),
                  currentFile->getSize(), config.sendProgressIntervalMs);
  }
  transfer->rewind(position);
  offset = position;
  state = SENDING;
  sendBinaryHeader(ZmodemHeader::withPosition(ZDATA, offset), useCrc32);
}

void ZmodemSendSession::update() {
  if (finished || state != SENDING) {
    return;
  }
  int64_t size = currentFile->getSize();
  string chunk = currentFile->read(offset, config.zmodemChunkSize);
  bool atEnd = (offset + (int64_t)chunk.size() >= size);
  if (chunk.empty() && !atEnd) {
    abort(currentFile->getName() + " ended before its announced size");
    return;
  }

  string out;
  size_t subpacketSize = config.zmodemSubpacketSize;
  size_t start = 0;
  do {
    size_t length = std::min(subpacketSize, chunk.size() - start);
    bool last = (start + length >= chunk.size());
    uint8_t frameEnd = (last && atEnd) ? ZCRCE : ZCRCG;
    out.append(encodeSubpacket(chunk.substr(start, length), frameEnd,
                               useCrc32));
    start += length;
  } while (start < chunk.size());

  offset += chunk.size();
  if (atEnd) {
    out.append(
        encodeBinaryHeader(ZmodemHeader::withPosition(ZEOF, offset), useCrc32));
    state = AWAIT_EOF_ACK;
  }
  send(out);
  transfer->advance(chunk.size());
}

void ZmodemSendSession::completeFile() {
  if (transfer.get()) {
    transfer->finish();
    transfer.reset();
    completedCount++;
  }
  currentFile.reset();
}
}  // namespace wt
