#include "ZmodemSession.hpp"

namespace wt {
ZmodemSession::ZmodemSession(ZmodemSender _sender, shared_ptr<Clock> _clock,
                             const EngineConfig& _config)
    : sender(_sender),
      clock(_clock),
      config(_config),
      finished(false),
      errorCount(0),
      completedCount(0) {}

void ZmodemSession::consume(const string& bytes) {
  if (finished) {
    trailing.append(bytes);
    return;
  }
  reader.push(bytes);
  ZmodemEvent event;
  while (!finished) {
    try {
      if (!reader.next(&event)) {
        break;
      }
    } catch (const SessionError& error) {
      handleProtocolError(error);
      continue;
    }
    switch (event.type) {
      case ZmodemEvent::HEADER:
        if (event.header.type == ZCAN || event.header.type == ZABORT) {
          remoteAbort(string("Remote sent ") +
                      zmodemFrameTypeName(event.header.type));
        } else {
          handleHeader(event.header);
        }
        break;
      case ZmodemEvent::SUBPACKET:
        handleSubpacket(event.data, event.frameEnd);
        break;
      case ZmodemEvent::ABORT:
        remoteAbort("Remote cancelled the transfer");
        break;
      case ZmodemEvent::OVER_AND_OUT:
        finish();
        break;
    }
  }
  if (finished) {
    trailing.append(reader.takeRemaining());
  }
}

void ZmodemSession::handleProtocolError(const SessionError& error) {
  errorCount++;
  LOG(WARNING) << "Zmodem protocol error (" << errorCount << "): " << error;
  if (errorCount > MAX_ERRORS) {
    abort("Too many protocol errors");
  }
}

void ZmodemSession::abort(const string& reason) {
  if (finished) {
    return;
  }
  LOG(INFO) << "Aborting zmodem session: " << reason;
  send(zmodemAbortSequence());
  if (transfer.get()) {
    transfer->abort(reason, true);
    transfer.reset();
  }
  finished = true;
}

void ZmodemSession::remoteAbort(const string& reason) {
  LOG(INFO) << "Zmodem session aborted by remote: " << reason;
  if (transfer.get()) {
    transfer->abort(reason, false);
    transfer.reset();
  }
  finish();
}

void ZmodemSession::finish() {
  if (finished) {
    return;
  }
  VLOG(1) << "Zmodem session finished after " << completedCount << " files";
  finished = true;
}

string ZmodemSession::takeTrailingBytes() {
  string rest;
  rest.swap(trailing);
  return rest;
}

void ZmodemSession::sendHexHeader(const ZmodemHeader& header) {
  VLOG(3) << "Sending hex " << zmodemFrameTypeName(header.type);
  send(encodeHexHeader(header));
}

void ZmodemSession::sendBinaryHeader(const ZmodemHeader& header,
                                     bool useCrc32) {
  VLOG(3) << "Sending binary " << zmodemFrameTypeName(header.type);
  send(encodeBinaryHeader(header, useCrc32));
}

shared_ptr<Transfer> ZmodemSession::startTransfer(TransferDirection direction,
                                                  const string& name,
                                                  int64_t size,
                                                  int64_t progressIntervalMs) {
  transfer.reset(
      new Transfer(direction, name, size, clock, progressIntervalMs));
  transfer->setProgressHandler(progressHandler);
  errorCount = 0;
  return transfer;
}
}  // namespace wt
