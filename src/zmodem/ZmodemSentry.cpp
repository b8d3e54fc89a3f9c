#include "ZmodemSentry.hpp"

namespace wt {
ZmodemSentry::ZmodemSentry(TerminalWriter _toTerminal, ZmodemSender _sender)
    : toTerminal(_toTerminal),
      sender(_sender),
      state(IDLE),
      detectionPending(false) {}

void ZmodemSentry::consume(const string& frame) {
  if (state == ACTIVE) {
    feed(frame);
  } else {
    detect(frame);
  }
}

void ZmodemSentry::detect(const string& frame) {
  ZmodemHeader header;
  size_t start = 0;
  size_t end = 0;
  bool found = false;
  try {
    size_t searchFrom = 0;
    while (searchFrom < frame.size()) {
      string rest = frame.substr(searchFrom);
      if (!findHexHeader(rest, &header, &start, &end)) {
        break;
      }
      if (header.type == ZRQINIT || header.type == ZRINIT) {
        start += searchFrom;
        found = true;
        break;
      }
      searchFrom += end;
    }
  } catch (const std::exception& e) {
    LOG(WARNING) << "Zmodem detection failed: " << e.what();
    toTerminal(frame);
    return;
  }
  if (!found) {
    toTerminal(frame);
    return;
  }

  if (start > 0) {
    toTerminal(frame.substr(0, start));
  }
  ZmodemRole role =
      header.type == ZRQINIT ? ZmodemRole::RECEIVE : ZmodemRole::SEND;
  LOG(INFO) << "Detected zmodem "
            << (role == ZmodemRole::RECEIVE ? "download" : "upload")
            << " request";
  detectionPending = true;
  pendingBytes = frame.substr(start);
  if (detectionHandler) {
    detectionHandler(ZmodemDetection(role, header));
  }
  if (detectionPending) {
    deny();
  }
}

void ZmodemSentry::confirm(shared_ptr<ZmodemSession> _session) {
  if (!detectionPending) {
    STERROR << "Confirmed a zmodem detection that is not pending";
    return;
  }
  detectionPending = false;
  session = _session;
  state = ACTIVE;
  string bytes;
  bytes.swap(pendingBytes);
  feed(bytes);
}

void ZmodemSentry::deny() {
  if (!detectionPending) {
    return;
  }
  LOG(INFO) << "Denying zmodem request";
  detectionPending = false;
  pendingBytes.clear();
  sender(zmodemAbortSequence());
}

void ZmodemSentry::feed(const string& bytes) {
  try {
    session->consume(bytes);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Zmodem session failed, passing frame to terminal: "
                 << e.what();
    session->abort(e.what());
    endSession();
    toTerminal(bytes);
    return;
  }
  checkFinished();
}

void ZmodemSentry::update() {
  if (state != ACTIVE) {
    return;
  }
  try {
    session->update();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Zmodem send failed: " << e.what();
    session->abort(e.what());
    endSession();
    return;
  }
  checkFinished();
}

void ZmodemSentry::abort(const string& reason) {
  if (state != ACTIVE) {
    return;
  }
  session->abort(reason);
  endSession();
}

void ZmodemSentry::checkFinished() {
  if (state != ACTIVE || !session->isFinished()) {
    return;
  }
  string trailing = session->takeTrailingBytes();
  endSession();
  if (!trailing.empty()) {
    toTerminal(trailing);
  }
}

void ZmodemSentry::endSession() {
  shared_ptr<ZmodemSession> ended = session;
  session.reset();
  state = IDLE;
  VLOG(1) << "Zmodem session ended";
  if (sessionEndHandler) {
    sessionEndHandler(ended);
  }
}
}  // namespace wt
