/*
  ==============================================================================
    Source/Devices/DeviceBackend.h
    Role: Capability interface for one OS input/FFB stack, and ScopedDevice,
    the owning guard that always closes (and ungrabs) what it opened.
  ==============================================================================
*/
#pragma once

#include "../Core/BridgeResult.h"
#include "DeviceTypes.h"
#include <memory>
#include <vector>

class InputDeviceBackend {
public:
  virtual ~InputDeviceBackend() = default;

  virtual juce::String getName() const = 0;

  virtual std::vector<PhysicalDevice> enumerate() = 0;

  /** Claims exclusive access where the OS supports it. NotFound / PermissionDenied / AlreadyOpen. */
  virtual BridgeResult open(const DeviceIdentity &id, DeviceHandle &handle,
                            PhysicalDevice &description) = 0;

  /** Blocks at most timeoutMs. On timeout the last known state is returned. Disconnected / IOError. */
  virtual BridgeResult pollInput(DeviceHandle handle, int timeoutMs, RawSample &sample) = 0;

  /** Unsupported / ResourceExhausted. */
  virtual BridgeResult uploadEffect(DeviceHandle handle, const NativeEffect &effect,
                                    NativeEffectHandle &effectHandle) = 0;
  virtual BridgeResult playEffect(DeviceHandle handle, NativeEffectHandle effectHandle) = 0;
  virtual BridgeResult stopEffect(DeviceHandle handle, NativeEffectHandle effectHandle) = 0;
  virtual BridgeResult updateEffect(DeviceHandle handle, NativeEffectHandle effectHandle,
                                    const NativeEffect &effect) = 0;
  /** Frees the driver slot. */
  virtual BridgeResult releaseEffect(DeviceHandle handle, NativeEffectHandle effectHandle) = 0;

  /** Never fails; releases the grab and every driver-side effect. */
  virtual void close(DeviceHandle handle) = 0;
};

/**
  Retries transient IOError up to maxRetries times; an IOError that persists
  is reported as Disconnected.
*/
template <typename Operation>
BridgeResult retryTransient(int maxRetries, Operation &&op) {
  BridgeResult r = op();
  for (int attempt = 0; attempt < maxRetries && r.is(ErrorKind::IOError); ++attempt)
    r = op();
  if (r.is(ErrorKind::IOError))
    return BridgeResult::fail(ErrorKind::Disconnected,
                              "I/O kept failing: " + r.getErrorMessage());
  return r;
}

class ScopedDevice {
public:
  ~ScopedDevice();

  static BridgeResult open(InputDeviceBackend &backend, const DeviceIdentity &id,
                           int ioRetryCount, std::unique_ptr<ScopedDevice> &out);

  BridgeResult poll(int timeoutMs, RawSample &sample);

  BridgeResult uploadEffect(const NativeEffect &effect, NativeEffectHandle &effectHandle);
  BridgeResult playEffect(NativeEffectHandle effectHandle);
  BridgeResult stopEffect(NativeEffectHandle effectHandle);
  BridgeResult updateEffect(NativeEffectHandle effectHandle, const NativeEffect &effect);
  BridgeResult releaseEffect(NativeEffectHandle effectHandle);

  const PhysicalDevice &getDescription() const { return description; }
  const DeviceIdentity &getIdentity() const { return description.identity; }
  DeviceHandle getHandle() const { return handle; }

private:
  ScopedDevice(InputDeviceBackend &b, DeviceHandle h, PhysicalDevice d, int retries)
      : backend(b), handle(h), description(std::move(d)), ioRetryCount(retries) {}

  InputDeviceBackend &backend;
  DeviceHandle handle;
  PhysicalDevice description;
  int ioRetryCount;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ScopedDevice)
};
