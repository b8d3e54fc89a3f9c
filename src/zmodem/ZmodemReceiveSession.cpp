#include "ZmodemReceiveSession.hpp"

namespace wt {
ZmodemReceiveSession::ZmodemReceiveSession(
    ZmodemSender _sender, shared_ptr<Clock> _clock,
    const EngineConfig& _config, shared_ptr<FileSinkProvider> _sinkProvider)
    : ZmodemSession(_sender, _clock, _config),
      sinkProvider(_sinkProvider),
      state(AWAIT_FILE),
      awaitingSinitData(false),
      discardingData(false) {}

ZmodemReceiveSession::FileOffer ZmodemReceiveSession::parseFileOffer(
    const string& data) {
  FileOffer offer;
  auto nameEnd = data.find('\0');
  if (nameEnd == string::npos || nameEnd == 0) {
    throw SessionError(SessionErrorKind::PROTOCOL,
                       "ZFILE offer without a file name");
  }
  offer.name = data.substr(0, nameEnd);
  offer.size = -1;
  offer.modifiedTime = 0;
  offer.mode = 0;

  string info = data.substr(nameEnd + 1);
  auto infoEnd = info.find('\0');
  if (infoEnd != string::npos) {
    info = info.substr(0, infoEnd);
  }
  std::istringstream iss(info);
  int64_t size;
  if (iss >> size) {
    offer.size = size;
    int64_t mtime;
    if (iss >> std::oct >> mtime) {
      offer.modifiedTime = mtime;
      int mode;
      if (iss >> std::oct >> mode) {
        offer.mode = mode;
      }
    }
  }
  return offer;
}

void ZmodemReceiveSession::sendReceiverInit() {
  sendHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFDX | CANOVIO | CANFC32));
}

void ZmodemReceiveSession::handleHeader(const ZmodemHeader& header) {
  switch (header.type) {
    case ZRQINIT:
      if (state == AWAIT_FILE) {
        sendReceiverInit();
      }
      break;
    case ZSINIT:
      awaitingSinitData = true;
      break;
    case ZFILE:
      state = AWAIT_FILE_INFO;
      break;
    case ZDATA:
      if (!transfer.get()) {
        LOG(WARNING) << "ZDATA without an accepted file";
        sendReceiverInit();
        break;
      }
      state = RECEIVING;
      if (header.position() != transfer->getTransferredBytes()) {
        VLOG(1) << "ZDATA at " << header.position() << ", expected "
                << transfer->getTransferredBytes();
        requestPosition();
      } else {
        discardingData = false;
      }
      break;
    case ZEOF:
      if (!transfer.get()) {
        sendReceiverInit();
      } else if (header.position() == transfer->getTransferredBytes()) {
        completeFile();
        sendReceiverInit();
      } else {
        // Data still in flight; the sender repeats ZEOF
        VLOG(1) << "Ignoring ZEOF at " << header.position();
      }
      break;
    case ZFIN:
      sendHexHeader(ZmodemHeader::withPosition(ZFIN, 0));
      reader.expectOverAndOut();
      state = AWAIT_OVER_AND_OUT;
      break;
    case ZFREECNT:
      sendHexHeader(ZmodemHeader::withPosition(ZACK, 0));
      break;
    case ZCOMMAND:
      LOG(WARNING) << "Refusing remote ZCOMMAND";
      break;
    default:
      VLOG(1) << "Ignoring " << zmodemFrameTypeName(header.type);
      break;
  }
}

void ZmodemReceiveSession::handleSubpacket(const string& data,
                                           uint8_t frameEnd) {
  if (awaitingSinitData) {
    awaitingSinitData = false;
    sendHexHeader(ZmodemHeader::withPosition(ZACK, 0));
    return;
  }
  switch (state) {
    case AWAIT_FILE_INFO: {
      FileOffer offer;
      try {
        offer = parseFileOffer(data);
      } catch (const SessionError& error) {
        handleProtocolError(error);
        break;
      }
      acceptFile(offer);
      break;
    }
    case RECEIVING:
      if (discardingData) {
        break;
      }
      transfer->push(data);
      if (frameEnd == ZCRCW || frameEnd == ZCRCQ) {
        sendHexHeader(
            ZmodemHeader::withPosition(ZACK, transfer->getTransferredBytes()));
      }
      break;
    default:
      VLOG(1) << "Dropping unexpected subpacket of " << data.size()
              << " bytes";
      break;
  }
}

void ZmodemReceiveSession::handleProtocolError(const SessionError& error) {
  ZmodemSession::handleProtocolError(error);
  if (finished) {
    return;
  }
  if (state == RECEIVING && transfer.get()) {
    requestPosition();
  } else if (state == AWAIT_FILE_INFO) {
    state = AWAIT_FILE;
    sendReceiverInit();
  }
}

void ZmodemReceiveSession::requestPosition() {
  discardingData = true;
  reader.expectHeader();
  sendHexHeader(
      ZmodemHeader::withPosition(ZRPOS, transfer->getTransferredBytes()));
}

void ZmodemReceiveSession::acceptFile(const FileOffer& offer) {
  LOG(INFO) << "Zmodem offer: " << offer.name << " (" << offer.size
            << " bytes)";
  blobConsumer = blobConsumerSource ? blobConsumerSource() : BlobHandler();
  shared_ptr<FileSink> sink;
  if (!blobConsumer) {
    if (!sinkProvider.get()) {
      LOG(INFO) << "No destination for " << offer.name << ", skipping";
      state = AWAIT_FILE;
      sendHexHeader(ZmodemHeader::withPosition(ZSKIP, 0));
      return;
    }
    try {
      sink = sinkProvider->createSink(offer.name, offer.size);
    } catch (const std::runtime_error& e) {
      LOG(WARNING) << "Cannot save " << offer.name << ": " << e.what();
      state = AWAIT_FILE;
      sendHexHeader(ZmodemHeader::withPosition(ZSKIP, 0));
      return;
    }
  }
  startTransfer(TransferDirection::RECEIVE, offer.name, offer.size,
                config.receiveProgressIntervalMs);
  transfer->setSink(sink);
  transfer->setRetainInMemory(bool(blobConsumer));
  state = AWAIT_DATA;
  discardingData = false;
  sendHexHeader(ZmodemHeader::withPosition(ZRPOS, 0));
}

void ZmodemReceiveSession::completeFile() {
  shared_ptr<Transfer> done = transfer;
  transfer.reset();
  if (done->getTotalSize() < 0) {
    done->setTotalSize(done->getTransferredBytes());
  }
  done->finish();
  completedCount++;
  state = AWAIT_FILE;
  if (blobConsumer) {
    BlobHandler consumer = blobConsumer;
    blobConsumer = BlobHandler();
    consumer(done->getFileName(), done->getRetained());
  }
}
}  // namespace wt
