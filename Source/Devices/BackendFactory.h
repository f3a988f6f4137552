/*
  ==============================================================================
    Source/Devices/BackendFactory.h
    Role: Picks the input/FFB backend and virtual pad backend for this OS.
  ==============================================================================
*/
#pragma once

#include "DeviceBackend.h"
#include "VirtualGamepad.h"

struct BackendFactory {
  /** nullptr on platforms without a wheel backend. */
  static std::unique_ptr<InputDeviceBackend> createInputBackend();
  static std::unique_ptr<VirtualGamepadBackend> createVirtualGamepadBackend();
};
