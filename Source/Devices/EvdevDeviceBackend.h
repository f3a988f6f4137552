/*
  ==============================================================================
    Source/Devices/EvdevDeviceBackend.h
    Role: Linux wheel backend over evdev (/dev/input/event*), including the
    kernel force-feedback API (EVIOCSFF / EV_FF / EVIOCRMFF).
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>

#if JUCE_LINUX
#include "DeviceBackend.h"
#include <map>

class EvdevDeviceBackend : public InputDeviceBackend {
public:
  EvdevDeviceBackend() = default;
  ~EvdevDeviceBackend() override;

  juce::String getName() const override { return "evdev"; }

  std::vector<PhysicalDevice> enumerate() override;
  BridgeResult open(const DeviceIdentity &id, DeviceHandle &handle,
                    PhysicalDevice &description) override;
  BridgeResult pollInput(DeviceHandle handle, int timeoutMs, RawSample &sample) override;
  BridgeResult uploadEffect(DeviceHandle handle, const NativeEffect &effect,
                            NativeEffectHandle &effectHandle) override;
  BridgeResult playEffect(DeviceHandle handle, NativeEffectHandle effectHandle) override;
  BridgeResult stopEffect(DeviceHandle handle, NativeEffectHandle effectHandle) override;
  BridgeResult updateEffect(DeviceHandle handle, NativeEffectHandle effectHandle,
                            const NativeEffect &effect) override;
  BridgeResult releaseEffect(DeviceHandle handle, NativeEffectHandle effectHandle) override;
  void close(DeviceHandle handle) override;

private:
  struct OpenDevice {
    int fd = -1;
    PhysicalDevice description;
    std::map<int, int> absIndex; // ABS_* code -> axis index
    std::map<int, int> keyIndex; // BTN_* code -> button index
    RawSample state;
  };

  OpenDevice *find(DeviceHandle handle);
  BridgeResult writeFfEvent(OpenDevice &dev, int code, int value, const char *what);

  juce::CriticalSection lock;
  std::map<DeviceHandle, std::unique_ptr<OpenDevice>> devices;
  DeviceHandle nextHandle = 1;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(EvdevDeviceBackend)
};
#endif
