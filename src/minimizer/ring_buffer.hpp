#pragma once

#include "../common.hpp"
#include <vector>

namespace fomin {

/**
 * @brief A fixed-capacity ring buffer (circular buffer).
 * @details Stores a sliding window of elements.
 *          Pushing back when full overwrites the oldest element (logical index 0).
 *          Accessing index i corresponds to the (i)-th oldest element.
 *          Copies are deep, so a buffer can be held by value inside immutable snapshots.
 */
template <typename T> class RingBuffer {
public:
  /**
   * @brief Constructs a RingBuffer with a given capacity.
   * @param capacity Maximum number of elements to store.
   */
  explicit RingBuffer(size_t capacity = 0) : _capacity(capacity), _head(0), _count(0) {
    if (_capacity > 0) {
      _data.resize(_capacity);
    }
  }

  /**
   * @brief Pushes a new element into the buffer.
   * @details If the buffer is full, the oldest element is overwritten.
   *          A zero-capacity buffer stays empty.
   * @param val The value to push.
   */
  void push_back(const T &val) {
    if (_capacity == 0) return;

    if (_count < _capacity) {
      _data[(_head + _count) % _capacity] = val;
      _count++;
    } else {
      // Full: overwrite head, and move head forward
      _data[_head] = val;
      _head = (_head + 1) % _capacity;
    }
  }

  /**
   * @brief Access element by logical index (0 is oldest).
   * @param i Index.
   * @return Const reference to the element.
   */
  const T &operator[](size_t i) const {
    FOMIN_CHECK(i < _count, "RingBuffer index out of range");
    return _data[(_head + i) % _capacity];
  }

  /// @brief Oldest element.
  const T &front() const {
    FOMIN_CHECK(_count > 0, "front() on empty RingBuffer");
    return (*this)[0];
  }

  /// @brief Newest element.
  const T &back() const {
    FOMIN_CHECK(_count > 0, "back() on empty RingBuffer");
    return (*this)[_count - 1];
  }

  /// @brief Returns the number of elements currently stored.
  size_t size() const { return _count; }

  size_t capacity() const { return _capacity; }

  /// @brief Checks if the buffer is empty.
  bool empty() const { return _count == 0; }

  /// @brief Checks if the buffer is full.
  bool full() const { return _count == _capacity; }

  /// @brief Clears the buffer content, keeping its capacity.
  void clear() {
    _count = 0;
    _head = 0;
  }

private:
  std::vector<T> _data;
  size_t _capacity;
  size_t _head;  // Index of the oldest element
  size_t _count; // Current number of elements
};

} // namespace fomin
