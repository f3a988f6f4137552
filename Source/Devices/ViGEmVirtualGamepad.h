/*
  ==============================================================================
    Source/Devices/ViGEmVirtualGamepad.h
    Role: Windows virtual Xbox 360 pad through the ViGEmBus client. Rumble
    notifications arrive on a ViGEm thread and are queued for the FFB worker.
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>

#if JUCE_WINDOWS
#include "VirtualGamepad.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

class ViGEmVirtualController : public VirtualController {
public:
  ~ViGEmVirtualController() override;

  static BridgeResult create(const VirtualPadOptions &options,
                             std::unique_ptr<VirtualController> &controller);

  BridgeResult publish(const GamepadState &state) override;
  int pollEffectEvents(int timeoutMs, const EffectEventCallback &onEvent) override;
  void cancelPendingWait() override;
  bool hasDedicatedSteeringAxis() const override { return false; }
  void destroy() override;

  /** Called on the ViGEm notification thread. */
  void onRumble(uint8_t largeMotor, uint8_t smallMotor);

private:
  ViGEmVirtualController(void *clientHandle, void *targetHandle)
      : client(clientHandle), target(targetHandle) {}

  struct Rumble {
    uint8_t large;
    uint8_t small;
  };

  void *client;
  void *target;
  std::atomic<bool> destroyed{false};

  std::mutex queueMutex;
  std::condition_variable queueCond;
  std::deque<Rumble> pending;
  bool wakeRequested = false;

  // Effect-forwarding thread only: rumble is a single effect with id 0
  bool rumbleActive = false;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ViGEmVirtualController)
};

class ViGEmVirtualGamepadBackend : public VirtualGamepadBackend {
public:
  juce::String getName() const override { return "ViGEmBus"; }
  BridgeResult create(const VirtualPadOptions &options,
                      std::unique_ptr<VirtualController> &controller) override {
    return ViGEmVirtualController::create(options, controller);
  }
};
#endif
