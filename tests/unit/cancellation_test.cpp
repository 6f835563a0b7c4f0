#include "internal/util/cancellation.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/util/bounded_channel.hpp"
#include "internal/util/errors.hpp"

namespace {

using pgcdc::util::BoundedChannel;
using pgcdc::util::CancellationRegistration;
using pgcdc::util::CancellationToken;
using pgcdc::util::Cancelled;

void TestFirstCauseWins() {
  CancellationToken token;
  token.Cancel("first");
  token.Cancel("second");

  assert(token.IsCancelled());
  assert(token.Cause() == "first");
}

void TestOnCancelAfterCancelRunsImmediately() {
  CancellationToken token;
  token.Cancel();

  bool ran = false;
  const auto id = token.OnCancel([&] { ran = true; });
  assert(ran);
  assert(id == 0);
  token.RemoveCallback(id);
}

void TestRemovedCallbackDoesNotRun() {
  CancellationToken token;
  bool              ran = false;
  {
    CancellationRegistration reg(token, [&] { ran = true; });
  }
  token.Cancel();
  assert(!ran);
}

void TestRegistrationWaitsForRunningCallback() {
  CancellationToken token;
  std::atomic<bool> started{false};
  std::atomic<bool> finished{false};

  auto reg = std::make_unique<CancellationRegistration>(token, [&] {
    started = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    finished = true;
  });

  std::thread canceller([&] { token.Cancel("stop"); });
  while (!started) std::this_thread::yield();

  // must block until the callback on the cancelling thread has returned
  reg.reset();
  assert(finished);

  canceller.join();
}

void TestCallbackMayRemoveItself() {
  CancellationToken             token;
  CancellationToken::CallbackId id  = 0;
  bool                          ran = false;

  id = token.OnCancel([&] {
    token.RemoveCallback(id);
    ran = true;
  });

  token.Cancel();
  assert(ran);
}

// A cancel racing a send that completes anyway must not touch the channel
// after Send() has returned and the channel is gone.
void TestChannelDestroyedWhileCancelling() {
  for (int round = 0; round < 200; ++round) {
    auto              ch = std::make_unique<BoundedChannel<int>>(1);
    CancellationToken token;
    ch->Send(0, token);

    std::thread sender([&] {
      try {
        ch->Send(1, token);
      } catch (const Cancelled&) {
      }
    });
    std::thread canceller([&] { token.Cancel("shutdown"); });

    (void)ch->TryReceive();
    sender.join();
    ch.reset();
    canceller.join();
  }
}

} // namespace

int main() {
  TestFirstCauseWins();
  TestOnCancelAfterCancelRunsImmediately();
  TestRemovedCallbackDoesNotRun();
  TestRegistrationWaitsForRunningCallback();
  TestCallbackMayRemoveItself();
  TestChannelDestroyedWhileCancelling();

  std::cout << "pgcdc_unit_cancellation: pass\n";
  return 0;
}
