/*
  ==============================================================================
    Source/Services/InputPollingWorker.h
    Role: Wheel -> virtual pad loop at a fixed tick. Reads are bounded by the
    time left in the tick; a disconnect is signalled to the coordinator
    instead of publishing stale or zeroed state.
  ==============================================================================
*/
#pragma once
#include "../Core/BridgeSettings.h"
#include "../Core/SignalQueue.h"
#include "CalibrationProfile.h"
#include <juce_core/juce_core.h>

class ScopedDevice;
class VirtualController;

class InputPollingWorker : public juce::Thread {
public:
  InputPollingWorker(ScopedDevice &device, VirtualController &pad, const ProfileSlot &profile,
                     SignalQueue &signals, SessionStatus &status, const BridgeConfig &config);

  ~InputPollingWorker() override {
    signalThreadShouldExit();
    stopThread(2000);
  }

  void run() override;

private:
  // Returns false when the loop must end
  bool tickOnce(RawSample &sample, double &nextTickMs);

  ScopedDevice &device;
  VirtualController &pad;
  const ProfileSlot &profile;
  SignalQueue &signals;
  SessionStatus &status;
  const double periodMs;
  const bool dedicatedSteering;
};
