#include "internal/providers/call_group.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using reel::providers::CallGroup;

// Blocks until released; stands in for a remote call in flight.
struct Gate {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    open = false;

  void Open() {
    {
      std::lock_guard lock(mutex);
      open = true;
    }
    cv.notify_all();
  }

  bool WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return open; });
  }
};

void TestResultsAndErrorsReachTheFuture() {
  CallGroup calls;
  auto      ok     = calls.Launch([](CallGroup::Call&) { return std::string("asset-1"); });
  auto      failed = calls.Launch([](CallGroup::Call&) -> int { throw reel::util::ProviderTransient("unavailable"); });

  assert(ok.get() == "asset-1");
  bool threw = false;
  try {
    failed.get();
  } catch (const reel::util::ProviderTransient&) {
    threw = true;
  }
  assert(threw);
}

void TestFinishedCallsAreReaped() {
  CallGroup calls;
  for (int i = 0; i < 5; ++i) {
    calls.Launch([](CallGroup::Call&) { return 1; }).get();
  }
  // Each launch joins whatever finished before it.
  std::this_thread::sleep_for(20ms);
  calls.Launch([](CallGroup::Call&) { return 1; }).get();
  assert(calls.Size() <= 2);
}

void TestShutdownCancelsAndJoinsInFlightCalls() {
  CallGroup         calls;
  Gate              gate;
  std::atomic<bool> returned{false};

  auto future = calls.Launch([&](CallGroup::Call& call) {
    const auto cancel = call.OnCancel([&] { gate.Open(); });
    const bool opened = gate.WaitFor(10s);
    returned          = true;
    if (!opened) {
      throw std::runtime_error("never cancelled");
    }
    return std::string("cancelled");
  });

  std::this_thread::sleep_for(50ms);
  const auto started = std::chrono::steady_clock::now();
  calls.Shutdown();

  // Shutdown returns only after the call finished, and did not wait out its timeout.
  assert(returned);
  assert(std::chrono::steady_clock::now() - started < 5s);
  assert(future.get() == "cancelled");
  assert(calls.Size() == 0);
}

void TestLaunchAfterShutdownFails() {
  CallGroup calls;
  calls.Shutdown();

  auto future = calls.Launch([](CallGroup::Call&) { return 1; });
  bool threw  = false;
  try {
    future.get();
  } catch (const reel::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

void TestAbandonedFutureDoesNotBlock() {
  Gate gate;
  {
    CallGroup calls;
    const auto started = std::chrono::steady_clock::now();
    {
      auto future = calls.Launch([&](CallGroup::Call& call) {
        const auto cancel = call.OnCancel([&] { gate.Open(); });
        gate.WaitFor(10s);
        return 0;
      });
    }
    assert(std::chrono::steady_clock::now() - started < 1s);
  }
  // Destroying the group cancelled and joined the call.
  assert(gate.WaitFor(0ms));
}

} // namespace

int main() {
  TestResultsAndErrorsReachTheFuture();
  TestFinishedCallsAreReaped();
  TestShutdownCancelsAndJoinsInFlightCalls();
  TestLaunchAfterShutdownFails();
  TestAbandonedFutureDoesNotBlock();

  std::cout << "reel_unit_call_group: pass\n";
  return 0;
}
