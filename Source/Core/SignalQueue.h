/*
  ==============================================================================
    Source/Core/SignalQueue.h
    Role: Cross-task channel from the polling / FFB workers to the
    coordinator (disconnects, host release, operator-facing failures).
  ==============================================================================
*/
#pragma once

#include "BridgeResult.h"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <juce_core/juce_core.h>

struct SessionSignal {
  enum class Type { None, PhysicalDisconnected, HostReleased, OperatorError, BackendFailure };

  Type type = Type::None;
  ErrorKind error = ErrorKind::None;
  int effectId = -1; // OperatorError from an effect upload
};

// Multi-producer (workers), single consumer (coordinator). Lifecycle signals
// (disconnect, host release, backend failure) are latched per kind and never
// share FIFO space with per-effect errors, so a full FIFO cannot lose them.
class SignalQueue {
public:
  static constexpr int capacity = 64;

  static bool isLifecycle(SessionSignal::Type t) {
    return t == SessionSignal::Type::PhysicalDisconnected ||
           t == SessionSignal::Type::HostReleased || t == SessionSignal::Type::BackendFailure;
  }

  /**
    Any thread. Wakes the consumer. Lifecycle signals always succeed (repeats
    of the same kind before a drain collapse into one); other signals return
    false and are dropped when the FIFO is full.
  */
  bool push(const SessionSignal &s) {
    if (isLifecycle(s.type)) {
      latched[latchIndex(s.type)].store(static_cast<int>(s.error) + 1);
    } else {
      const juce::SpinLock::ScopedLockType sl(writeLock);
      int s1, n1, s2, n2;
      fifo.prepareToWrite(1, s1, n1, s2, n2);
      if (n1 == 0)
        return false;
      buffer[(size_t)s1] = s;
      fifo.finishedWrite(1);
    }
    {
      std::lock_guard<std::mutex> lock(notifyMutex);
      pending = true;
    }
    notifyCond.notify_one();
    return true;
  }

  /** Consumer: wait up to timeout for data. Returns true if anything is ready. */
  bool waitForData(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(notifyMutex);
    notifyCond.wait_for(lock, timeout, [this] { return pending || woken; });
    pending = false;
    woken = false;
    return getNumReady() > 0;
  }

  /** Wake the consumer (e.g. for shutdown). Safe from any thread. */
  void wake() {
    {
      std::lock_guard<std::mutex> lock(notifyMutex);
      woken = true;
    }
    notifyCond.notify_one();
  }

  /**
    Consumer only: invoke for each FIFO signal in arrival order, then for each
    latched lifecycle signal (backend failure, disconnect, host release).
  */
  template <typename ProcessFunction> int process(ProcessFunction &&processFn) {
    int s1, n1, s2, n2;
    fifo.prepareToRead(fifo.getNumReady(), s1, n1, s2, n2);
    for (int i = 0; i < n1; ++i)
      processFn(buffer[(size_t)(s1 + i)]);
    for (int i = 0; i < n2; ++i)
      processFn(buffer[(size_t)(s2 + i)]);
    fifo.finishedRead(n1 + n2);

    int handled = n1 + n2;
    for (auto type : lifecycleOrder) {
      const int stored = latched[latchIndex(type)].exchange(0);
      if (stored == 0)
        continue;
      SessionSignal s;
      s.type = type;
      s.error = static_cast<ErrorKind>(stored - 1);
      processFn(s);
      ++handled;
    }
    return handled;
  }

  int getNumReady() const {
    int n = fifo.getNumReady();
    for (auto &l : latched)
      if (l.load() != 0)
        ++n;
    return n;
  }

private:
  static constexpr SessionSignal::Type lifecycleOrder[] = {
      SessionSignal::Type::BackendFailure, SessionSignal::Type::PhysicalDisconnected,
      SessionSignal::Type::HostReleased};

  static size_t latchIndex(SessionSignal::Type t) {
    switch (t) {
    case SessionSignal::Type::BackendFailure:
      return 0;
    case SessionSignal::Type::PhysicalDisconnected:
      return 1;
    default:
      return 2;
    }
  }

  juce::AbstractFifo fifo{capacity};
  std::array<SessionSignal, capacity> buffer;
  std::array<std::atomic<int>, 3> latched{}; // ErrorKind + 1, 0 = clear
  juce::SpinLock writeLock;
  std::mutex notifyMutex;
  std::condition_variable notifyCond;
  bool pending = false;
  bool woken = false;
};
