#ifndef __VT_WRITE_BUFFER__
#define __VT_WRITE_BUFFER__

#include "Headers.hpp"

namespace vt {
/**
 * @brief Bounded queue of outbound bytes the kernel has not accepted yet.
 *
 * Frames are appended whole and drained from the front as the socket becomes
 * writable.  A connection whose backlog grows past maxBacklog is considered
 * dead by its owner.
 */
class WriteBuffer {
 public:
  /** @brief Default backlog ceiling. */
  static constexpr size_t DEFAULT_MAX_BACKLOG = 16 * 1024 * 1024;

  explicit WriteBuffer(size_t _maxBacklog = DEFAULT_MAX_BACKLOG)
      : maxBacklog(_maxBacklog), totalBytes(0), writeOffset(0) {}

  /**
   * @brief Returns true while the backlog is within its ceiling.
   */
  bool withinLimit() const { return totalBytes <= maxBacklog; }

  bool hasPendingData() const { return !pending.empty(); }

  size_t size() const { return totalBytes; }

  size_t getMaxBacklog() const { return maxBacklog; }

  void enqueue(const string &data) {
    if (data.empty()) return;
    pending.push_back(data);
    totalBytes += data.size();
  }

  /**
   * @brief Returns a pointer to the next bytes to write and the count.
   * @return Pointer to the data, or nullptr if the buffer is empty.
   */
  const char *peekData(size_t *count) const {
    if (pending.empty()) {
      *count = 0;
      return nullptr;
    }
    const string &front = pending.front();
    *count = front.size() - writeOffset;
    return front.data() + writeOffset;
  }

  /**
   * @brief Removes bytesWritten from the front of the buffer.
   */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      size_t available = pending.front().size() - writeOffset;

      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  size_t maxBacklog;
  std::deque<string> pending;
  size_t totalBytes;
  size_t writeOffset;  // Offset into the front chunk for partial writes
};
}  // namespace vt

#endif  // __VT_WRITE_BUFFER__
