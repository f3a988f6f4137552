/*
  ==============================================================================
    Source/Devices/DirectInputDeviceBackend.h
    Role: Windows wheel backend over DirectInput 8 (exclusive background
    access, DIJOYSTATE2 reads, IDirectInputEffect per uploaded effect).
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>

#if JUCE_WINDOWS
#include "DeviceBackend.h"
#include <map>

struct IDirectInput8W;
struct HWND__;

class DirectInputDeviceBackend : public InputDeviceBackend {
public:
  DirectInputDeviceBackend();
  ~DirectInputDeviceBackend() override;

  juce::String getName() const override { return "DirectInput"; }

  std::vector<PhysicalDevice> enumerate() override;
  BridgeResult open(const DeviceIdentity &id, DeviceHandle &handle,
                    PhysicalDevice &description) override;
  /** DirectInput wheels are polled: waits out timeoutMs, then reads. */
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
  struct OpenDevice;

  BridgeResult ensureInitialised();
  OpenDevice *find(DeviceHandle handle);

  IDirectInput8W *dinput = nullptr;
  HWND__ *window = nullptr;

  juce::CriticalSection lock;
  std::map<DeviceHandle, std::unique_ptr<OpenDevice>> devices;
  DeviceHandle nextHandle = 1;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(DirectInputDeviceBackend)
};
#endif
