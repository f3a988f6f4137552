/*
  ==============================================================================
    Source/Services/EffectForwardingWorker.h
    Role: Virtual pad -> wheel effect loop. Sole owner of the
    ForceFeedbackTranslator; other threads reach it through callAndWait().
  ==============================================================================
*/
#pragma once
#include "../Core/BridgeSettings.h"
#include "../Core/SignalQueue.h"
#include <functional>
#include <juce_core/juce_core.h>

class ForceFeedbackTranslator;
class VirtualController;
struct EffectEvent;

class EffectForwardingWorker : public juce::Thread {
public:
  using Task = std::function<void()>;

  EffectForwardingWorker(VirtualController &pad, ForceFeedbackTranslator &translator,
                         SignalQueue &signals, SessionStatus &status, int waitMs);

  ~EffectForwardingWorker() override { stop(); }

  void run() override;

  /**
    Runs task on the forwarding thread and returns after it has run. When the
    thread is not running the task runs on the caller's thread.
  */
  void callAndWait(Task task);

  /** Idempotent. Returns once the loop has exited. */
  void stop();

private:
  void handle(const EffectEvent &event);
  void runPendingCall();

  VirtualController &pad;
  ForceFeedbackTranslator &translator;
  SignalQueue &signals;
  SessionStatus &status;
  const int waitMs;

  juce::CriticalSection callLock;
  Task pendingCall;
  juce::WaitableEvent callDone;
  bool hostGone = false;
};
