#ifndef __WT_WRITE_BUFFER__
#define __WT_WRITE_BUFFER__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Outbound frame queue for a message-oriented transport.
 *
 * Frames are written whole and in order.  The byte count lets the upload loop
 * hold back further chunks while the network has not caught up.
 */
class WriteBuffer {
 public:
  /** @brief Default backlog above which uploads hold further chunks. */
  static constexpr size_t MAX_BUFFER_SIZE = 16 * 1024 * 1024;  // 16MB

  struct Frame {
    string data;
    bool binary;
  };

  WriteBuffer() : totalBytes(0) {}

  bool hasPendingData() const { return !pending.empty(); }

  /** @brief Bytes across all queued frames. */
  size_t size() const { return totalBytes; }

  size_t frameCount() const { return pending.size(); }

  /**
   * @brief Adds a frame to the end of the queue.  Empty text frames are kept,
   * empty binary frames are not.
   */
  void enqueue(const string &data, bool binary) {
    if (binary && data.empty()) return;
    Frame frame;
    frame.data = data;
    frame.binary = binary;
    pending.push_back(std::move(frame));
    totalBytes += data.size();
  }

  /** @brief Returns the next frame to write, or nullptr if empty. */
  const Frame *peek() const {
    if (pending.empty()) {
      return nullptr;
    }
    return &pending.front();
  }

  /** @brief Drops the front frame once it has been written. */
  void pop() {
    if (pending.empty()) return;
    totalBytes -= pending.front().data.size();
    pending.pop_front();
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
  }

 private:
  std::deque<Frame> pending;
  size_t totalBytes;
};
}  // namespace wt

#endif  // __WT_WRITE_BUFFER__
