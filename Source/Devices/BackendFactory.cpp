#include "BackendFactory.h"
#include "DirectInputDeviceBackend.h"
#include "EvdevDeviceBackend.h"
#include "UinputVirtualGamepad.h"
#include "ViGEmVirtualGamepad.h"

std::unique_ptr<InputDeviceBackend> BackendFactory::createInputBackend() {
#if JUCE_LINUX
  return std::make_unique<EvdevDeviceBackend>();
#elif JUCE_WINDOWS
  return std::make_unique<DirectInputDeviceBackend>();
#else
  return nullptr;
#endif
}

std::unique_ptr<VirtualGamepadBackend> BackendFactory::createVirtualGamepadBackend() {
#if JUCE_LINUX
  return std::make_unique<UinputVirtualGamepadBackend>();
#elif JUCE_WINDOWS
  return std::make_unique<ViGEmVirtualGamepadBackend>();
#else
  return nullptr;
#endif
}
