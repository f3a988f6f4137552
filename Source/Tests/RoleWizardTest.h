/*
  ==============================================================================
    Source/Tests/RoleWizardTest.h
    Role: Guided role assignment over scripted samples.
  ==============================================================================
*/
#pragma once
#include "../Services/RoleWizard.h"
#include "MockBackends.h"

struct RoleWizardTest {
  static RawSample withButton(RawSample s, int button) {
    s.buttons.set((size_t)button);
    return s;
  }

  static bool run() {
    RoleWizard wizard(TestData::makeWheel());
    using Step = RoleWizard::Step;
    auto rest = TestData::makeSample(512, 0, 0);

    if (wizard.advance(rest).failed() || wizard.getStep() != Step::SteeringLeft)
      return false;

    // Too little movement is refused and the step stays put
    auto r = wizard.advance(TestData::makeSample(515, 0, 0));
    if (!r.is(ErrorKind::InsufficientMovement) || wizard.getStep() != Step::SteeringLeft)
      return false;

    auto left = TestData::makeSample(0, 0, 0);
    auto right = TestData::makeSample(1023, 0, 0);
    if (wizard.advance(left).failed() || wizard.advance(right).failed())
      return false;

    if (wizard.advance(TestData::makeSample(1023, 250, 0)).failed() ||
        wizard.getStep() != Step::ThrottleReleased)
      return false;
    if (wizard.advance(TestData::makeSample(1023, 0, 0)).failed())
      return false;

    // Throttle again is not the brake
    if (!wizard.advance(TestData::makeSample(1023, 250, 0)).failed())
      return false;
    if (wizard.advance(TestData::makeSample(1023, 0, 240)).failed() ||
        wizard.advance(TestData::makeSample(1023, 0, 0)).failed())
      return false;

    if (wizard.getStep() != Step::ClutchPressed || !RoleWizard::canSkip(wizard.getStep()))
      return false;
    wizard.skip(TestData::makeSample(1023, 0, 0));

    auto idle = TestData::makeSample(1023, 0, 0);
    if (!wizard.advance(idle).failed())
      return false; // no button held
    if (wizard.advance(withButton(idle, 5)).failed())
      return false;
    if (wizard.getStep() != Step::ShiftDown)
      return false;
    if (wizard.advance(withButton(idle, 4)).failed() || !wizard.isComplete())
      return false;

    const auto &a = wizard.getAssignment();
    return a.isComplete() && a.steering == 0 && a.throttle == 1 && a.brake == 2 &&
           a.clutch == -1 && !a.steeringInverted && a.shiftUpButton == 5 &&
           a.shiftDownButton == 4;
  }

  /** Left reading higher than right marks steering inverted; roles map per axis. */
  static bool runInvertedSteering() {
    RoleWizard wizard(TestData::makeWheel());
    wizard.advance(TestData::makeSample(512, 0, 0));
    wizard.advance(TestData::makeSample(1023, 0, 0));
    wizard.advance(TestData::makeSample(0, 0, 0));
    const auto &a = wizard.getAssignment();
    if (!a.steeringInverted || a.steering != 0)
      return false;

    RoleAssignment full;
    full.steering = 2;
    full.throttle = 0;
    full.brake = 1;
    auto roles = full.rolesFor(4);
    return roles.size() == 4 && roles[2] == AxisRole::Steering && roles[0] == AxisRole::Throttle &&
           roles[1] == AxisRole::Brake && roles[3] == AxisRole::Unmapped;
  }

  /** Pressed below released marks a pedal inverted; an unreleased pedal is refused. */
  static bool runPedalDirection() {
    RoleWizard wizard(TestData::makeWheel());
    using Step = RoleWizard::Step;
    wizard.advance(TestData::makeSample(512, 255, 0));
    wizard.advance(TestData::makeSample(0, 255, 0));
    wizard.advance(TestData::makeSample(1023, 255, 0));

    // Throttle rests at 255 and reads 0 when floored
    if (wizard.advance(TestData::makeSample(1023, 0, 0)).failed() ||
        wizard.getStep() != Step::ThrottleReleased)
      return false;
    if (!wizard.advance(TestData::makeSample(1023, 2, 0)).is(ErrorKind::InsufficientMovement) ||
        wizard.getStep() != Step::ThrottleReleased)
      return false;
    if (wizard.advance(TestData::makeSample(1023, 255, 0)).failed())
      return false;

    if (wizard.advance(TestData::makeSample(1023, 255, 200)).failed() ||
        wizard.advance(TestData::makeSample(1023, 255, 0)).failed() ||
        wizard.getStep() != Step::ClutchPressed)
      return false;

    const auto &a = wizard.getAssignment();
    return a.throttle == 1 && a.throttleInverted && a.brake == 2 && !a.brakeInverted &&
           !a.clutchInverted;
  }

  /** Shift down must be a different button from shift up. */
  static bool runDistinctShifters() {
    RoleWizard wizard(TestData::makeWheel());
    auto s = TestData::makeSample(512, 0, 0);
    wizard.advance(s);
    wizard.advance(TestData::makeSample(0, 0, 0));
    wizard.advance(TestData::makeSample(1023, 0, 0));
    wizard.advance(TestData::makeSample(1023, 255, 0));
    wizard.advance(TestData::makeSample(1023, 0, 0));
    wizard.advance(TestData::makeSample(1023, 0, 255));
    wizard.advance(TestData::makeSample(1023, 0, 0));
    wizard.skip(TestData::makeSample(1023, 0, 0));
    auto idle = TestData::makeSample(1023, 0, 0);
    wizard.advance(withButton(idle, 7));
    if (wizard.getStep() != RoleWizard::Step::ShiftDown)
      return false;
    // Released then pressed again: a new press, but of the shift-up button
    wizard.advance(idle);
    auto r = wizard.advance(withButton(idle, 7));
    return r.is(ErrorKind::InsufficientMovement) && !wizard.isComplete();
  }
};
