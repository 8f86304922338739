/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_COMMON_BLOCKING_QUEUE_H
#define BYTECMP_COMMON_BLOCKING_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace bytecmp {
namespace common {

// capacity 0 means unbounded
template <typename T>
class BlockingQueue {
 public:
  BlockingQueue() = default;
  explicit BlockingQueue(size_t capacity) : capacity_(capacity) {}

  size_t Size() {
    std::unique_lock<std::mutex> lock(mu_);
    return queue_.size();
  }

  size_t Capacity() const { return capacity_; }

  // blocks while full, returns false once the queue is closed
  bool PushBack(const T& t) {
    std::unique_lock<std::mutex> lock(mu_);
    not_full_.wait(lock, [this] {
      return closed_ || capacity_ == 0 || queue_.size() < capacity_;
    });
    if (closed_) {
      return false;
    }
    queue_.emplace_back(t);
    not_empty_.notify_one();
    return true;
  }

  bool PopFront(T* t) {
    std::unique_lock<std::mutex> lock(mu_);
    if (queue_.empty()) {
      return false;
    }

    *t = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return true;
  }

  // blocks until an element arrives, returns false if closed and drained
  bool WaitPopFront(T* t) {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return false;
    }

    *t = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return true;
  }

  void Close() {
    std::unique_lock<std::mutex> lock(mu_);
    closed_ = true;
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  bool Closed() {
    std::unique_lock<std::mutex> lock(mu_);
    return closed_;
  }

 private:
  const size_t capacity_ = 0;
  bool closed_ = false;
  std::deque<T> queue_;
  std::mutex mu_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
};

}  // namespace common
}  // namespace bytecmp

#endif  // BYTECMP_COMMON_BLOCKING_QUEUE_H
