#ifndef __WT_TRANSFER__
#define __WT_TRANSFER__

#include "Clock.hpp"
#include "FileSink.hpp"
#include "Headers.hpp"
#include "SessionError.hpp"

namespace wt {
enum class TransferDirection { SEND, RECEIVE };

enum class TransferState { ACTIVE, CANCELLED, COMPLETED, FAILED };

const char* transferStateName(TransferState state);

struct TransferProgress {
  TransferDirection direction;
  string fileName;
  int64_t transferredBytes;
  /** -1 while unknown */
  int64_t totalSize;
  int percent;
  /** Bytes per second since the previous report */
  double bytesPerSecond;
  TransferState state;
};

typedef std::function<void(const TransferProgress&)> ProgressHandler;

/** @brief Receives the complete contents of one file. */
typedef std::function<void(const string& name, const string& data)>
    BlobHandler;

/**
 * @brief One file send or receive, owned by the session driving it.
 *
 * Received chunks go to the sink as they arrive and are kept in memory only
 * when a blob consumer asked for the bytes.  Once the transfer leaves ACTIVE
 * it never changes state again.
 */
class Transfer {
 public:
  Transfer(TransferDirection _direction, const string& _fileName,
           int64_t _totalSize, shared_ptr<Clock> _clock,
           int64_t _progressIntervalMs);

  void setSink(shared_ptr<FileSink> _sink) { sink = _sink; }
  void setRetainInMemory(bool retain) { retainInMemory = retain; }
  void setProgressHandler(ProgressHandler handler) {
    progressHandler = handler;
  }
  void setTotalSize(int64_t _totalSize) { totalSize = _totalSize; }

  /**
   * @brief Accepts one received chunk.  Throws SessionError(PROTOCOL) if the
   * transfer is no longer active or the chunk runs past the announced size;
   * the transfer is left untouched in that case.
   */
  void push(const string& chunk);

  /** @brief Records `bytes` more sent bytes. */
  void advance(int64_t bytes);

  /** @brief Moves the send position, used when the peer asks to resume. */
  void rewind(int64_t position);

  /** @brief Notes that one more binary frame is announced for this file. */
  void expectChunk() { expectedChunkCount++; }

  bool hasConverged() const {
    return expectedChunkCount > 0 && receivedChunkCount >= expectedChunkCount;
  }

  /** @brief Closes the sink and reports 100%. */
  void finish();

  /** @brief Closes the sink and moves to CANCELLED or FAILED. */
  void abort(const string& reason, bool cancelled);

  bool isActive() const { return state == TransferState::ACTIVE; }
  TransferDirection getDirection() const { return direction; }
  const string& getFileName() const { return fileName; }
  int64_t getTotalSize() const { return totalSize; }
  int64_t getTransferredBytes() const { return transferredBytes; }
  int64_t getExpectedChunkCount() const { return expectedChunkCount; }
  int64_t getReceivedChunkCount() const { return receivedChunkCount; }
  TransferState getState() const { return state; }
  const string& getFailureReason() const { return failureReason; }
  const string& getRetained() const { return retained; }
  int64_t getStartTime() const { return startTime; }

  TransferProgress getProgress() const;

 protected:
  void reportProgress(bool force);
  void closeSink();

  TransferDirection direction;
  string fileName;
  int64_t totalSize;
  shared_ptr<Clock> clock;
  int64_t progressIntervalMs;

  int64_t transferredBytes;
  int64_t expectedChunkCount;
  int64_t receivedChunkCount;
  TransferState state;
  string failureReason;

  shared_ptr<FileSink> sink;
  bool retainInMemory;
  string retained;

  ProgressHandler progressHandler;
  int64_t startTime;
  int64_t lastReportTime;
  int64_t lastReportBytes;
  double lastRate;
};
}  // namespace wt

#endif  // __WT_TRANSFER__
