/*
  ==============================================================================
    Source/Services/GamepadLayout.h
    Fixed control layout of the virtual Xbox 360 pad: which gamepad axis each
    wheel role drives, and where the shifters land.
  ==============================================================================
*/
#pragma once
#include "../Devices/DeviceTypes.h"
#include "../Devices/GamepadState.h"

struct GamepadLayout {
  static constexpr int shiftUpTarget = GamepadState::Y;
  static constexpr int shiftDownTarget = GamepadState::X;

  // Steering goes to LeftStickX unless the pad has a dedicated wheel axis
  static int axisForRole(AxisRole role, bool dedicatedSteering) {
    switch (role) {
    case AxisRole::Steering:
      return dedicatedSteering ? GamepadState::Wheel : GamepadState::LeftStickX;
    case AxisRole::Throttle:
      return GamepadState::RightTrigger;
    case AxisRole::Brake:
      return GamepadState::LeftTrigger;
    case AxisRole::Clutch:
      return GamepadState::LeftStickY;
    default:
      return -1;
    }
  }

  /** Physical button index -> gamepad button, -1 when out of range. */
  static int passThroughButton(int physicalIndex) {
    return (physicalIndex >= 0 && physicalIndex < GamepadState::NumButtons) ? physicalIndex : -1;
  }
};
