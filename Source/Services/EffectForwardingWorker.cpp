#include "EffectForwardingWorker.h"
#include "../Core/LogService.h"
#include "../Devices/VirtualGamepad.h"
#include "ForceFeedbackTranslator.h"

EffectForwardingWorker::EffectForwardingWorker(VirtualController &p, ForceFeedbackTranslator &t,
                                               SignalQueue &sig, SessionStatus &st, int wait)
    : juce::Thread("FFB_Forwarder"), pad(p), translator(t), signals(sig), status(st),
      waitMs(juce::jmax(1, wait)) {}

void EffectForwardingWorker::run() {
  writeDebugLog("Effect forwarding started");
  try {
    while (!threadShouldExit() && !hostGone) {
      pad.pollEffectEvents(waitMs, [this](const EffectEvent &e) { handle(e); });
      runPendingCall();
      status.activeEffects.store(translator.getActiveCount(), std::memory_order_relaxed);
      status.forwarderHeartbeat.fetch_add(1, std::memory_order_relaxed);
    }
  } catch (const std::exception &e) {
    LogService::instance().error(juce::String("Effect forwarding crashed: ") + e.what());
    translator.releaseAll();
    SessionSignal s;
    s.type = SessionSignal::Type::BackendFailure;
    s.error = ErrorKind::IOError;
    signals.push(s);
  }
  runPendingCall();
  writeDebugLog("Effect forwarding stopped");
}

void EffectForwardingWorker::handle(const EffectEvent &event) {
  if (hostGone)
    return;

  auto r = translator.handleEvent(event);
  if (event.type == EffectEvent::Type::Disconnected) {
    hostGone = true;
    SessionSignal s;
    s.type = SessionSignal::Type::HostReleased;
    signals.push(s);
    return;
  }

  if (r.wasOk()) {
    status.forwardedEffects.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  if (requiresOperator(r.kind())) {
    LogService::instance().error("Effect " + juce::String(event.effectId) + ": " + r.describe());
    SessionSignal s;
    s.type = SessionSignal::Type::OperatorError;
    s.error = r.kind();
    s.effectId = event.effectId;
    if (!signals.push(s))
      LogService::instance().warning("Signal queue full, effect " + juce::String(event.effectId) +
                                     " error not reported");
  } else if (r.is(ErrorKind::Disconnected)) {
    // The polling thread reports the lost wheel
    writeDebugLog("Effect " + juce::String(event.effectId) + " dropped: wheel gone");
  } else {
    LogService::instance().warning("Effect " + juce::String(event.effectId) + ": " + r.describe());
  }
}

void EffectForwardingWorker::runPendingCall() {
  Task task;
  {
    const juce::ScopedLock sl(callLock);
    task = std::move(pendingCall);
    pendingCall = nullptr;
  }
  if (task) {
    task();
    callDone.signal();
  }
}

void EffectForwardingWorker::callAndWait(Task task) {
  if (!isThreadRunning()) {
    task();
    return;
  }
  {
    const juce::ScopedLock sl(callLock);
    pendingCall = std::move(task);
    callDone.reset();
  }
  pad.cancelPendingWait();

  while (!callDone.wait(50)) {
    if (!isThreadRunning()) {
      // The loop exited before picking it up
      runPendingCall();
      return;
    }
  }
}

void EffectForwardingWorker::stop() {
  signalThreadShouldExit();
  pad.cancelPendingWait();
  stopThread(2000);
}
