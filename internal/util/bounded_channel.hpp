#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "cancellation.hpp"
#include "errors.hpp"

namespace pgcdc::util {

/*
  Ordered, bounded, blocking channel.

  Send() blocks while the channel is full and Receive() blocks while it
  is empty. Both observe a CancellationToken; a cancel observed before
  the item is accepted throws Cancelled and leaves the channel untouched.
*/
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  BoundedChannel(const BoundedChannel&)            = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  void Send(T item, CancellationToken& token) {
    token.ThrowIfCancelled();

    CancellationRegistration wake(token, [this] {
      std::lock_guard lock(mutex_);
      not_full_.notify_all();
    });

    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return token.IsCancelled() || closed_ || queue_.size() < capacity_; });

    // cancellation wins over free capacity
    if (token.IsCancelled()) throw Cancelled(token.Cause());
    if (closed_) throw InvalidState("send on closed channel");

    queue_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
  }

  // nullopt once the channel is closed and drained
  std::optional<T> Receive(CancellationToken& token) {
    token.ThrowIfCancelled();

    CancellationRegistration wake(token, [this] {
      std::lock_guard lock(mutex_);
      not_empty_.notify_all();
    });

    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return token.IsCancelled() || closed_ || !queue_.empty(); });

    if (token.IsCancelled()) throw Cancelled(token.Cause());
    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  std::optional<T> TryReceive() {
    std::unique_lock lock(mutex_);
    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T>           queue_;
  bool                    closed_ = false;
};

} // namespace pgcdc::util
