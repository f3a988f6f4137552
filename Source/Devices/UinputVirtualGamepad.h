/*
  ==============================================================================
    Source/Devices/UinputVirtualGamepad.h
    Role: Linux virtual Xbox 360 pad over /dev/uinput with FF upload/erase
    handshakes. Effect waits are cancellable through an eventfd.
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>

#if JUCE_LINUX
#include "VirtualGamepad.h"
#include <atomic>
#include <map>
#include <vector>

struct input_event;

class UinputVirtualController : public VirtualController {
public:
  ~UinputVirtualController() override;

  static BridgeResult create(const VirtualPadOptions &options,
                             std::unique_ptr<VirtualController> &controller);

  BridgeResult publish(const GamepadState &state) override;
  int pollEffectEvents(int timeoutMs, const EffectEventCallback &onEvent) override;
  void cancelPendingWait() override;
  bool hasDedicatedSteeringAxis() const override { return wheelAxis; }
  void destroy() override;

private:
  UinputVirtualController(int uinputFd, int eventFd, bool exposeWheelAxis)
      : fd(uinputFd), wakeFd(eventFd), wheelAxis(exposeWheelAxis) {}

  void handleUpload(uint32_t requestId, std::vector<EffectEvent> &out);
  void handleErase(uint32_t requestId, std::vector<EffectEvent> &out);
  void handlePlayback(const input_event &ev, std::vector<EffectEvent> &out);
  void reportDisconnected(std::vector<EffectEvent> &out, const juce::String &why);

  struct KnownEffect {
    NativeEffect params;
    bool playing = false;
  };

  int fd;
  int wakeFd;
  const bool wheelAxis;
  std::atomic<bool> destroyed{false};
  bool disconnectReported = false;

  // Effect-forwarding thread only
  std::map<int, KnownEffect> effects;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(UinputVirtualController)
};

class UinputVirtualGamepadBackend : public VirtualGamepadBackend {
public:
  juce::String getName() const override { return "uinput"; }
  BridgeResult create(const VirtualPadOptions &options,
                      std::unique_ptr<VirtualController> &controller) override {
    return UinputVirtualController::create(options, controller);
  }
};
#endif
