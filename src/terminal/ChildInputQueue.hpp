#ifndef __PTYHOST_CHILD_INPUT_QUEUE_HPP__
#define __PTYHOST_CHILD_INPUT_QUEUE_HPP__

#include "Headers.hpp"
#include "ResizeSequenceDecoder.hpp"

namespace ptyhost {
/**
 * @brief Decoded input waiting for the terminal to accept it.
 *
 * Data and resizes stay in arrival order, so a resize is applied only once
 * the bytes before it have been written.  The byte count is bounded: while
 * the queue is full the session stops reading input, and the embedder sees
 * backpressure instead of ptyhost growing without limit.
 */
class ChildInputQueue {
 public:
  static constexpr size_t MAX_QUEUED_BYTES = 256 * 1024;

  ChildInputQueue() : queuedBytes(0), writeOffset(0) {}

  /** @brief False once MAX_QUEUED_BYTES are waiting. */
  bool canAcceptMore() const { return queuedBytes < MAX_QUEUED_BYTES; }

  bool empty() const { return events.empty(); }

  /** @brief Bytes of data still to be written. */
  size_t size() const { return queuedBytes; }

  /** @brief Queues DATA and RESIZE events; anything else is ignored. */
  void push(const InputEvent& event) {
    if (event.type == InputEvent::DATA) {
      if (event.data.empty()) return;
      queuedBytes += event.data.size();
    } else if (event.type != InputEvent::RESIZE) {
      return;
    }
    events.push_back(event);
  }

  const InputEvent& front() const { return events.front(); }

  /**
   * @brief The unwritten part of the DATA event at the front.
   * @param count Output: number of bytes at the returned pointer.
   */
  const char* peekData(size_t* count) const {
    if (events.empty() || events.front().type != InputEvent::DATA) {
      *count = 0;
      return nullptr;
    }
    const string& data = events.front().data;
    *count = data.size() - writeOffset;
    return data.data() + writeOffset;
  }

  /** @brief Marks `bytesWritten` bytes of the front DATA event as done. */
  void consume(size_t bytesWritten) {
    if (bytesWritten == 0 || events.empty()) return;
    size_t available = events.front().data.size() - writeOffset;
    bytesWritten = min(bytesWritten, available);
    writeOffset += bytesWritten;
    queuedBytes -= bytesWritten;
    if (bytesWritten == available) {
      events.pop_front();
      writeOffset = 0;
    }
  }

  /** @brief Drops the front event, used once a resize is applied. */
  void pop() {
    if (events.empty()) return;
    if (events.front().type == InputEvent::DATA) {
      queuedBytes -= events.front().data.size() - writeOffset;
    }
    events.pop_front();
    writeOffset = 0;
  }

  void clear() {
    events.clear();
    queuedBytes = 0;
    writeOffset = 0;
  }

 private:
  std::deque<InputEvent> events;
  size_t queuedBytes;
  // Offset into the front event's data after a partial write
  size_t writeOffset;
};
}  // namespace ptyhost

#endif  // __PTYHOST_CHILD_INPUT_QUEUE_HPP__
