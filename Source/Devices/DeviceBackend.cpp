/*
  ==============================================================================
    Source/Devices/DeviceBackend.cpp
    Role: ScopedDevice (open/close pairing, IOError retry on every call).
  ==============================================================================
*/
#include "DeviceBackend.h"
#include "../Core/LogService.h"

ScopedDevice::~ScopedDevice() {
  backend.close(handle);
  LogService::instance().info("Closed " + description.name + " (" +
                              description.identity.path + ")");
}

BridgeResult ScopedDevice::open(InputDeviceBackend &backend, const DeviceIdentity &id,
                                int ioRetryCount, std::unique_ptr<ScopedDevice> &out) {
  DeviceHandle h = kInvalidHandle;
  PhysicalDevice desc;
  auto r = backend.open(id, h, desc);
  if (r.failed())
    return r;
  out.reset(new ScopedDevice(backend, h, std::move(desc), ioRetryCount));
  LogService::instance().info("Opened " + out->description.name + " [" +
                              out->description.identity.getModelKey() + "] via " +
                              backend.getName());
  return BridgeResult::ok();
}

BridgeResult ScopedDevice::poll(int timeoutMs, RawSample &sample) {
  return retryTransient(ioRetryCount,
                        [&] { return backend.pollInput(handle, timeoutMs, sample); });
}

BridgeResult ScopedDevice::uploadEffect(const NativeEffect &effect,
                                        NativeEffectHandle &effectHandle) {
  return retryTransient(ioRetryCount,
                        [&] { return backend.uploadEffect(handle, effect, effectHandle); });
}

BridgeResult ScopedDevice::playEffect(NativeEffectHandle effectHandle) {
  return retryTransient(ioRetryCount, [&] { return backend.playEffect(handle, effectHandle); });
}

BridgeResult ScopedDevice::stopEffect(NativeEffectHandle effectHandle) {
  return retryTransient(ioRetryCount, [&] { return backend.stopEffect(handle, effectHandle); });
}

BridgeResult ScopedDevice::updateEffect(NativeEffectHandle effectHandle,
                                        const NativeEffect &effect) {
  return retryTransient(ioRetryCount,
                        [&] { return backend.updateEffect(handle, effectHandle, effect); });
}

BridgeResult ScopedDevice::releaseEffect(NativeEffectHandle effectHandle) {
  return retryTransient(ioRetryCount,
                        [&] { return backend.releaseEffect(handle, effectHandle); });
}
