/*
  ==============================================================================
    Source/Tests/SignalQueueTest.h
    Role: SignalQueue under load (two producers, one consumer, no loss,
    per-producer order kept) and lifecycle signals surviving a full FIFO.
  ==============================================================================
*/
#pragma once
#include "../Core/SignalQueue.h"
#include <atomic>
#include <thread>

struct SignalQueueTest {
  static bool runStressTest() {
    SignalQueue queue;
    const int perProducer = 20000;
    std::atomic<int> received{0};
    std::atomic<bool> outOfOrder{false};
    int lastSeen[2] = {-1, -1};

    auto producer = [&](int which) {
      for (int i = 0; i < perProducer; ++i) {
        SessionSignal s;
        s.type = SessionSignal::Type::OperatorError;
        s.effectId = which * perProducer + i;
        while (!queue.push(s))
          std::this_thread::yield();
      }
    };

    std::thread a(producer, 0);
    std::thread b(producer, 1);

    const auto end = juce::Time::getMillisecondCounterHiRes() + 10000.0;
    while (received.load() < perProducer * 2 && juce::Time::getMillisecondCounterHiRes() < end) {
      queue.waitForData(std::chrono::milliseconds(5));
      queue.process([&](const SessionSignal &s) {
        const int which = s.effectId / perProducer;
        const int index = s.effectId % perProducer;
        if (index != lastSeen[which] + 1)
          outOfOrder.store(true);
        lastSeen[which] = index;
        received.fetch_add(1);
      });
    }

    a.join();
    b.join();
    return received.load() == perProducer * 2 && !outOfOrder.load();
  }

  /** A full FIFO of effect errors still lets a disconnect through. */
  static bool runLifecycleWhenFull() {
    SignalQueue queue;
    SessionSignal effectError;
    effectError.type = SessionSignal::Type::OperatorError;
    effectError.error = ErrorKind::ResourceExhausted;
    int accepted = 0;
    for (effectError.effectId = 0; effectError.effectId < SignalQueue::capacity * 2;
         ++effectError.effectId)
      if (queue.push(effectError))
        ++accepted;
    if (accepted >= SignalQueue::capacity * 2)
      return false;

    SessionSignal gone;
    gone.type = SessionSignal::Type::PhysicalDisconnected;
    gone.error = ErrorKind::Disconnected;
    if (!queue.push(gone) || !queue.push(gone))
      return false;

    int errors = 0, disconnects = 0;
    bool lastWasDisconnect = false;
    queue.process([&](const SessionSignal &s) {
      lastWasDisconnect = s.type == SessionSignal::Type::PhysicalDisconnected;
      if (lastWasDisconnect) {
        ++disconnects;
        if (s.error != ErrorKind::Disconnected)
          errors = -1000;
      } else {
        ++errors;
      }
    });
    return errors == accepted && disconnects == 1 && lastWasDisconnect &&
           queue.getNumReady() == 0;
  }

  /** wake() releases a waiting consumer with nothing queued. */
  static bool runWake() {
    SignalQueue queue;
    std::thread waker([&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      queue.wake();
    });
    const auto start = juce::Time::getMillisecondCounterHiRes();
    const bool hadData = queue.waitForData(std::chrono::milliseconds(5000));
    const auto waited = juce::Time::getMillisecondCounterHiRes() - start;
    waker.join();
    return !hadData && waited < 4000.0;
  }
};
