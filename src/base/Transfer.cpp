#include "Transfer.hpp"

namespace wt {
const char* transferStateName(TransferState state) {
  switch (state) {
    case TransferState::ACTIVE:
      return "active";
    case TransferState::CANCELLED:
      return "cancelled";
    case TransferState::COMPLETED:
      return "completed";
    case TransferState::FAILED:
      return "failed";
  }
  return "unknown";
}

Transfer::Transfer(TransferDirection _direction, const string& _fileName,
                   int64_t _totalSize, shared_ptr<Clock> _clock,
                   int64_t _progressIntervalMs)
    : direction(_direction),
      fileName(_fileName),
      totalSize(_totalSize),
      clock(_clock),
      progressIntervalMs(_progressIntervalMs),
      transferredBytes(0),
      expectedChunkCount(0),
      receivedChunkCount(0),
      state(TransferState::ACTIVE),
      retainInMemory(false),
      lastRate(0) {
  startTime = lastReportTime = clock->now();
  lastReportBytes = 0;
}

void Transfer::push(const string& chunk) {
  if (state != TransferState::ACTIVE) {
    throw SessionError(SessionErrorKind::PROTOCOL,
                       "Chunk for " + fileName + " after transfer " +
                           transferStateName(state));
  }
  if (totalSize >= 0 &&
      transferredBytes + (int64_t)chunk.size() > totalSize) {
    throw SessionError(SessionErrorKind::PROTOCOL,
                       "Chunk for " + fileName + " runs past " +
                           to_string(totalSize) + " bytes");
  }
  if (sink.get()) {
    sink->write(chunk);
  }
  if (retainInMemory) {
    retained.append(chunk);
  }
  transferredBytes += chunk.size();
  receivedChunkCount++;
  reportProgress(false);
}

void Transfer::advance(int64_t bytes) {
  if (state != TransferState::ACTIVE) {
    STERROR << "Advancing " << fileName << " after it ended";
    return;
  }
  transferredBytes += bytes;
  reportProgress(false);
}

void Transfer::rewind(int64_t position) {
  VLOG(1) << "Rewinding " << fileName << " from " << transferredBytes
          << " to " << position;
  transferredBytes = position;
  lastReportBytes = std::min(lastReportBytes, position);
}

void Transfer::finish() {
  if (state != TransferState::ACTIVE) {
    return;
  }
  closeSink();
  state = TransferState::COMPLETED;
  LOG(INFO) << "Transfer of " << fileName << " completed ("
            << transferredBytes << " bytes in "
            << (clock->now() - startTime) << "ms)";
  reportProgress(true);
}

void Transfer::abort(const string& reason, bool cancelled) {
  if (state != TransferState::ACTIVE) {
    return;
  }
  closeSink();
  state = cancelled ? TransferState::CANCELLED : TransferState::FAILED;
  failureReason = reason;
  LOG(INFO) << "Transfer of " << fileName << " " << transferStateName(state)
            << ": " << reason;
  reportProgress(true);
}

void Transfer::closeSink() {
  if (!sink.get()) {
    return;
  }
  try {
    sink->close();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Error closing sink for " << fileName << ": " << e.what();
  }
  sink.reset();
}

TransferProgress Transfer::getProgress() const {
  TransferProgress progress;
  progress.direction = direction;
  progress.fileName = fileName;
  progress.transferredBytes = transferredBytes;
  progress.totalSize = totalSize;
  if (state == TransferState::COMPLETED) {
    progress.percent = 100;
  } else if (totalSize > 0) {
    progress.percent = (int)((transferredBytes * 100) / totalSize);
  } else {
    progress.percent = 0;
  }
  progress.bytesPerSecond = lastRate;
  progress.state = state;
  return progress;
}

void Transfer::reportProgress(bool force) {
  int64_t now = clock->now();
  int64_t elapsed = now - lastReportTime;
  if (!force && elapsed < progressIntervalMs) {
    return;
  }
  if (elapsed > 0) {
    lastRate = double(transferredBytes - lastReportBytes) * 1000.0 / elapsed;
  }
  lastReportTime = now;
  lastReportBytes = transferredBytes;
  if (progressHandler) {
    progressHandler(getProgress());
  }
}
}  // namespace wt
