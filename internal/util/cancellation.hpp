#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace pgcdc::util {

/*
  Cancellation signal shared between a session owner and the code that
  blocks on its behalf.

  Cancel() records the first cause and runs every registered callback.
  Blocking primitives register a callback for the duration of a wait so a
  cancel wakes them up.
*/
class CancellationToken {
 public:
  using CallbackId = std::uint64_t;

  CancellationToken() = default;

  CancellationToken(const CancellationToken&)            = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel(const std::string& cause = "context canceled");

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  std::string Cause() const;

  // Runs immediately (on the calling thread) if already cancelled.
  CallbackId OnCancel(std::function<void()> callback);

  // Once this returns the callback is not running and never will. Blocks
  // while Cancel() is running it on another thread.
  void RemoveCallback(CallbackId id);

  // throws Cancelled with the recorded cause
  void ThrowIfCancelled() const;

 private:
  mutable std::mutex                          mutex_;
  std::condition_variable                     callback_done_;
  std::atomic<bool>                           cancelled_{false};
  std::string                                 cause_;
  std::map<CallbackId, std::function<void()>> callbacks_;
  CallbackId                                  next_id_ = 1;

  // callback Cancel() is executing right now, 0 if none
  CallbackId      running_id_ = 0;
  std::thread::id running_thread_;
};

/*
  RAII registration of a cancellation callback.
*/
class CancellationRegistration {
 public:
  CancellationRegistration(CancellationToken& token, std::function<void()> callback)
      : token_(token), id_(token.OnCancel(std::move(callback))) {
  }

  ~CancellationRegistration() {
    token_.RemoveCallback(id_);
  }

  CancellationRegistration(const CancellationRegistration&)            = delete;
  CancellationRegistration& operator=(const CancellationRegistration&) = delete;

 private:
  CancellationToken&            token_;
  CancellationToken::CallbackId id_;
};

} // namespace pgcdc::util
