#ifndef __PT_RING_BUFFER__
#define __PT_RING_BUFFER__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Fixed-capacity byte buffer that evicts the oldest bytes on overflow.
 *
 * Holds the most recent output of a terminal so that a consumer attaching
 * late can replay what it missed. Memory stays bounded no matter how slowly
 * (or whether) anything reads it. All methods are thread-safe.
 */
class RingBuffer {
 public:
  explicit RingBuffer(size_t _capacity)
      : storage(_capacity), capacity(_capacity), head(0), length(0) {}

  /** @brief Maximum number of bytes retained. */
  size_t getCapacity() const { return capacity; }

  /** @brief Current number of buffered bytes, never above the capacity. */
  size_t size() const {
    lock_guard<mutex> guard(bufferMutex);
    return length;
  }

  bool empty() const { return size() == 0; }

  /**
   * @brief Appends bytes, dropping the oldest ones beyond the capacity.
   */
  void append(const string &data) { append(data.data(), data.size()); }

  void append(const char *data, size_t count) {
    if (count == 0 || capacity == 0) return;
    lock_guard<mutex> guard(bufferMutex);
    if (count >= capacity) {
      // Only the tail of this chunk survives
      memcpy(&storage[0], data + (count - capacity), capacity);
      head = 0;
      length = capacity;
      return;
    }
    size_t tail = (head + length) % capacity;
    size_t firstPart = min(count, capacity - tail);
    memcpy(&storage[tail], data, firstPart);
    memcpy(&storage[0], data + firstPart, count - firstPart);
    if (length + count > capacity) {
      size_t evicted = length + count - capacity;
      head = (head + evicted) % capacity;
      length = capacity;
    } else {
      length += count;
    }
  }

  /**
   * @brief Returns a copy of the buffered bytes, oldest first.
   */
  string snapshot() const {
    lock_guard<mutex> guard(bufferMutex);
    string s(length, '\0');
    if (length == 0) return s;
    size_t firstPart = min(length, capacity - head);
    memcpy(&s[0], &storage[head], firstPart);
    memcpy(&s[firstPart], &storage[0], length - firstPart);
    return s;
  }

  void clear() {
    lock_guard<mutex> guard(bufferMutex);
    head = 0;
    length = 0;
  }

 private:
  vector<char> storage;
  const size_t capacity;
  size_t head;  // Index of the oldest byte
  size_t length;
  mutable mutex bufferMutex;
};
}  // namespace pt

#endif  // __PT_RING_BUFFER__
