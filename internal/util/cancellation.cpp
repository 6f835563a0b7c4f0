#include "cancellation.hpp"

#include "errors.hpp"

namespace pgcdc::util {

void CancellationToken::Cancel(const std::string& cause) {
  std::unique_lock lock(mutex_);
  if (cancelled_.load(std::memory_order_relaxed)) return;

  cause_ = cause;
  cancelled_.store(true, std::memory_order_release);

  // No registration can be added from here on. Callbacks run one at a
  // time outside the lock because they take their own locks.
  while (!callbacks_.empty()) {
    auto node = callbacks_.extract(callbacks_.begin());

    running_id_     = node.key();
    running_thread_ = std::this_thread::get_id();
    lock.unlock();

    node.mapped()();

    lock.lock();
    running_id_ = 0;
    callback_done_.notify_all();
  }
  running_thread_ = std::thread::id();
}

std::string CancellationToken::Cause() const {
  std::lock_guard lock(mutex_);
  return cause_;
}

CancellationToken::CallbackId CancellationToken::OnCancel(std::function<void()> callback) {
  {
    std::lock_guard lock(mutex_);
    if (!cancelled_.load(std::memory_order_relaxed)) {
      const auto id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }

  callback();
  return 0;
}

void CancellationToken::RemoveCallback(CallbackId id) {
  if (id == 0) return;

  std::unique_lock lock(mutex_);
  callbacks_.erase(id);

  // a callback removing itself must not wait on its own completion
  if (running_thread_ == std::this_thread::get_id()) return;

  callback_done_.wait(lock, [&] { return running_id_ != id; });
}

void CancellationToken::ThrowIfCancelled() const {
  if (IsCancelled()) {
    throw Cancelled(Cause());
  }
}

} // namespace pgcdc::util
