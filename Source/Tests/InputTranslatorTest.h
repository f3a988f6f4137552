/*
  ==============================================================================
    Source/Tests/InputTranslatorTest.h
    Role: Wheel roles land on the fixed Xbox layout.
  ==============================================================================
*/
#pragma once
#include "../Services/GamepadLayout.h"
#include "../Services/InputTranslator.h"

struct InputTranslatorTest {
  static CalibrationProfile makeProfile() {
    CalibrationProfile p;
    auto axis = [](AxisRole role, int32_t center, int32_t lo, int32_t hi) {
      AxisCalibration a;
      a.role = role;
      a.center = center;
      a.effectiveMin = lo;
      a.effectiveMax = hi;
      a.deadzone = 0.03 * (hi - lo) / 2.0;
      return a;
    };
    p.axes.push_back(axis(AxisRole::Steering, 512, 0, 1023));
    p.axes.push_back(axis(AxisRole::Throttle, 0, 0, 255));
    p.axes.push_back(axis(AxisRole::Brake, 255, 0, 255)); // rests high
    p.axes.push_back(axis(AxisRole::Clutch, 0, 0, 255));
    p.shiftUpButton = 4;
    p.shiftDownButton = 5;
    return p;
  }

  static bool run() {
    auto profile = makeProfile();
    RawSample s;
    s.numAxes = 4;
    s.axes = {1023, 255, 255, 128};
    s.sequence = 77;

    auto gs = InputTranslator::translate(s, profile, false);
    if (gs.axes[GamepadState::LeftStickX] != 1.0f || gs.axes[GamepadState::RightTrigger] != 1.0f)
      return false;
    if (gs.axes[GamepadState::LeftTrigger] != 0.0f)
      return false;
    const float clutch = gs.axes[GamepadState::LeftStickY];
    if (clutch < 0.45f || clutch > 0.55f || gs.frame != 77)
      return false;

    s.axes = {0, 0, 0, 0};
    gs = InputTranslator::translate(s, profile, false);
    return gs.axes[GamepadState::LeftStickX] == -1.0f &&
           gs.axes[GamepadState::LeftTrigger] == 1.0f &&
           gs.axes[GamepadState::RightTrigger] == 0.0f;
  }

  /** Shifters go to Y / X; everything else passes through by index. */
  static bool runButtons() {
    auto profile = makeProfile();
    RawSample s;
    s.numAxes = 4;
    s.axes = {512, 0, 255, 0};
    s.buttons.set(0);
    s.buttons.set(4);  // shift up
    s.buttons.set(14);
    s.buttons.set(40); // beyond the pad's 15 buttons

    auto gs = InputTranslator::translate(s, profile, false);
    if (!gs.isPressed(GamepadState::A) || !gs.isPressed(GamepadLayout::shiftUpTarget))
      return false;
    if (gs.isPressed(GamepadState::LB) || gs.isPressed(GamepadLayout::shiftDownTarget))
      return false;
    if (!gs.isPressed(GamepadState::DpadRight))
      return false;
    if (gs.axes[GamepadState::LeftStickX] != 0.0f)
      return false;

    s.buttons.reset();
    s.buttons.set(5);
    gs = InputTranslator::translate(s, profile, false);
    return gs.isPressed(GamepadState::X) && !gs.isPressed(GamepadState::RB) && gs.buttons == (1u << GamepadState::X);
  }

  /** With a dedicated wheel axis the left stick stays centred. */
  static bool runDedicatedSteering() {
    auto profile = makeProfile();
    RawSample s;
    s.numAxes = 4;
    s.axes = {0, 0, 255, 0};
    auto gs = InputTranslator::translate(s, profile, true);
    return gs.axes[GamepadState::Wheel] == -1.0f && gs.axes[GamepadState::LeftStickX] == 0.0f;
  }
};
