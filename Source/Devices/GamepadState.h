/*
  ==============================================================================
    Source/Devices/GamepadState.h
    Role: One whole frame of virtual Xbox 360 controller state.
    Sticks in [-1, 1] (Y positive = down, evdev convention), triggers in [0, 1].
  ==============================================================================
*/
#pragma once

#include <array>
#include <cstdint>
#include <juce_core/juce_core.h>

struct GamepadState {
  enum Axis {
    LeftStickX = 0,
    LeftStickY,
    RightStickX,
    RightStickY,
    LeftTrigger,
    RightTrigger,
    Wheel, // dedicated steering axis, only on backends that expose one
    NumAxes
  };

  // Bit index == pass-through index of the physical button
  enum Button {
    A = 0, B, X, Y, LB, RB, Back, Start, Guide, LeftThumb, RightThumb,
    DpadUp, DpadDown, DpadLeft, DpadRight,
    NumButtons
  };

  std::array<float, NumAxes> axes{};
  uint32_t buttons = 0;
  uint32_t frame = 0;

  bool isPressed(int button) const {
    return button >= 0 && button < NumButtons && (buttons & (1u << button)) != 0;
  }

  void setButton(int button, bool pressed) {
    if (button < 0 || button >= NumButtons)
      return;
    if (pressed)
      buttons |= (1u << button);
    else
      buttons &= ~(1u << button);
  }

  static int16_t toStick(float v) {
    return (int16_t)juce::jlimit(-32768, 32767, juce::roundToInt(v * 32767.0f));
  }

  static uint8_t toTrigger(float v) {
    return (uint8_t)juce::jlimit(0, 255, juce::roundToInt(v * 255.0f));
  }
};
