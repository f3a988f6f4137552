/*
  ==============================================================================
    Source/Devices/VirtualGamepad.h
    Role: Virtual controller seen by the host (Roblox). Publishes GamepadState
    frames and surfaces the host's force-feedback requests as EffectEvents.
  ==============================================================================
*/
#pragma once

#include "../Core/BridgeResult.h"
#include "DeviceTypes.h"
#include "GamepadState.h"
#include <functional>
#include <memory>

/** Effect parameters exactly as the host handed them to the virtual pad. */
struct BackendEffectParams {
  enum class Format {
    Native16,    // Linux FF upload (16-bit signed levels, 0..0xffff direction)
    XInputRumble // two 8-bit motor speeds
  };

  Format format = Format::Native16;
  NativeEffect native;
  uint8_t largeMotor = 0;
  uint8_t smallMotor = 0;
};

struct EffectEvent {
  enum class Type { Upload, Update, Stop, Disconnected };

  Type type = Type::Upload;
  int effectId = -1;
  BackendEffectParams params;
};

struct VirtualPadOptions {
  juce::String name = "WheelBridge Virtual Xbox Controller";
  uint16_t vendorId = 0x045e; // Microsoft
  uint16_t productId = 0x028e; // Xbox 360 wired
  uint16_t version = 0x0110;
  int effectSlots = 16;
  bool dedicatedSteeringAxis = false;
};

class VirtualController {
public:
  using EffectEventCallback = std::function<void(const EffectEvent &)>;

  virtual ~VirtualController() = default;

  /** Never blocks longer than one tick. */
  virtual BridgeResult publish(const GamepadState &state) = 0;

  /**
    Waits at most timeoutMs, then delivers every pending event in arrival
    order. Returns the number delivered. A lost host/driver is delivered as a
    Disconnected event, once.
  */
  virtual int pollEffectEvents(int timeoutMs, const EffectEventCallback &onEvent) = 0;

  /** Makes a blocked pollEffectEvents return now. Any thread. */
  virtual void cancelPendingWait() = 0;

  virtual bool hasDedicatedSteeringAxis() const = 0;

  /** Idempotent. Destructors call it too. */
  virtual void destroy() = 0;
};

class VirtualGamepadBackend {
public:
  virtual ~VirtualGamepadBackend() = default;
  virtual juce::String getName() const = 0;
  /** DriverUnavailable / PermissionDenied / VirtualControllerCreationFailed. */
  virtual BridgeResult create(const VirtualPadOptions &options,
                              std::unique_ptr<VirtualController> &controller) = 0;
};
