#include "RoleWizard.h"
#include "../Core/LogService.h"
#include <cmath>

std::vector<AxisRole> RoleAssignment::rolesFor(size_t numAxes) const {
  std::vector<AxisRole> roles(numAxes, AxisRole::Unmapped);
  auto put = [&roles](int index, AxisRole role) {
    if (index >= 0 && (size_t)index < roles.size())
      roles[(size_t)index] = role;
  };
  put(steering, AxisRole::Steering);
  put(throttle, AxisRole::Throttle);
  put(brake, AxisRole::Brake);
  put(clutch, AxisRole::Clutch);
  return roles;
}

const char *RoleWizard::getInstructions(Step s) {
  switch (s) {
  case Step::Welcome:          return "Make sure your wheel and pedals are connected, hands off";
  case Step::SteeringLeft:     return "Turn the steering wheel all the way to the LEFT, then continue";
  case Step::SteeringRight:    return "Turn the steering wheel all the way to the RIGHT, then continue";
  case Step::ThrottlePressed:  return "Press the THROTTLE pedal all the way down, then continue";
  case Step::ThrottleReleased: return "Release the THROTTLE pedal completely, then continue";
  case Step::BrakePressed:     return "Press the BRAKE pedal all the way down, then continue";
  case Step::BrakeReleased:    return "Release the BRAKE pedal completely, then continue";
  case Step::ClutchPressed:    return "Press the CLUTCH pedal all the way down, then continue (or skip)";
  case Step::ClutchReleased:   return "Release the CLUTCH pedal completely, then continue";
  case Step::ShiftUp:          return "Hold the SHIFT UP button or paddle, then continue";
  case Step::ShiftDown:        return "Hold the SHIFT DOWN button or paddle, then continue";
  case Step::Complete:         return "Roles assigned";
  }
  return "";
}

int RoleWizard::mostMovedAxis(const RawSample &current) const {
  int best = -1;
  double bestMovement = movementThreshold;
  const int n = juce::jmin((int)device.axes.size(), current.numAxes, stepStart.numAxes);
  for (int i = 0; i < n; ++i) {
    const double span = (double)device.axes[(size_t)i].getSpan();
    if (span <= 0.0)
      continue;
    const double moved =
        std::abs((double)current.axes[(size_t)i] - (double)stepStart.axes[(size_t)i]) / span;
    if (moved > bestMovement) {
      bestMovement = moved;
      best = i;
    }
  }
  return best;
}

int RoleWizard::newlyPressedButton(const RawSample &current) const {
  for (size_t i = 0; i < device.buttons.size() && i < (size_t)kMaxButtons; ++i)
    if (current.buttons[i] && !stepStart.buttons[i])
      return (int)i;
  return -1;
}

void RoleWizard::moveTo(Step next, const RawSample &current) {
  step = next;
  stepStart = current;
}

void RoleWizard::skip(const RawSample &current) {
  if (!canSkip(step))
    return;
  assignment.clutch = -1;
  assignment.clutchInverted = false;
  moveTo(Step::ShiftUp, current);
}

BridgeResult RoleWizard::advance(const RawSample &current) {
  auto nothingMoved = [](const char *what) {
    return BridgeResult::fail(ErrorKind::InsufficientMovement,
                              juce::String("No ") + what + " movement detected, try again");
  };

  switch (step) {
  case Step::Welcome:
    moveTo(Step::SteeringLeft, current);
    break;

  case Step::SteeringLeft: {
    const int axis = mostMovedAxis(current);
    if (axis < 0)
      return nothingMoved("steering");
    assignment.steering = axis;
    steeringLeftValue = current.axes[(size_t)axis];
    moveTo(Step::SteeringRight, current);
    break;
  }

  case Step::SteeringRight: {
    const int axis = mostMovedAxis(current);
    if (axis < 0)
      return nothingMoved("steering");
    if (axis != assignment.steering)
      return BridgeResult::fail(ErrorKind::InsufficientMovement,
                                "A different axis moved; turn only the wheel");
    assignment.steeringInverted = steeringLeftValue > current.axes[(size_t)axis];
    moveTo(Step::ThrottlePressed, current);
    break;
  }

  case Step::ThrottlePressed:
  case Step::BrakePressed:
  case Step::ClutchPressed: {
    const int axis = mostMovedAxis(current);
    if (axis < 0)
      return nothingMoved("pedal");
    if (axis == assignment.steering || axis == assignment.throttle || axis == assignment.brake)
      return BridgeResult::fail(ErrorKind::InsufficientMovement,
                                "That axis is already assigned; press only the requested pedal");
    if (step == Step::ThrottlePressed)
      assignment.throttle = axis;
    else if (step == Step::BrakePressed)
      assignment.brake = axis;
    else
      assignment.clutch = axis;
    pedalPressedValue = current.axes[(size_t)axis];
    moveTo(step == Step::ThrottlePressed ? Step::ThrottleReleased
           : step == Step::BrakePressed  ? Step::BrakeReleased
                                         : Step::ClutchReleased,
           current);
    break;
  }

  case Step::ThrottleReleased:
  case Step::BrakeReleased:
  case Step::ClutchReleased: {
    const int axis = step == Step::ThrottleReleased ? assignment.throttle
                     : step == Step::BrakeReleased  ? assignment.brake
                                                    : assignment.clutch;
    if (mostMovedAxis(current) != axis)
      return nothingMoved("pedal release");
    // Pressed reading below the released one: the pedal counts down
    const bool inverted = pedalPressedValue < current.axes[(size_t)axis];
    if (step == Step::ThrottleReleased) {
      assignment.throttleInverted = inverted;
      moveTo(Step::BrakePressed, current);
    } else if (step == Step::BrakeReleased) {
      assignment.brakeInverted = inverted;
      moveTo(Step::ClutchPressed, current);
    } else {
      assignment.clutchInverted = inverted;
      moveTo(Step::ShiftUp, current);
    }
    break;
  }

  case Step::ShiftUp:
  case Step::ShiftDown: {
    // Held buttons from the previous step do not count
    int button = newlyPressedButton(current);
    if (button < 0 && step == Step::ShiftUp) {
      for (size_t i = 0; i < device.buttons.size() && button < 0; ++i)
        if (current.buttons[i])
          button = (int)i;
    }
    if (button < 0) {
      // Track releases so the next press counts as new
      stepStart = current;
      return nothingMoved("button");
    }
    if (step == Step::ShiftUp) {
      assignment.shiftUpButton = button;
      moveTo(Step::ShiftDown, current);
    } else {
      if (button == assignment.shiftUpButton)
        return BridgeResult::fail(ErrorKind::InsufficientMovement,
                                  "Shift down must be a different button");
      assignment.shiftDownButton = button;
      moveTo(Step::Complete, current);
      LogService::instance().info("Roles assigned: steering axis " + juce::String(assignment.steering) +
                                  ", throttle " + juce::String(assignment.throttle) + ", brake " +
                                  juce::String(assignment.brake) + ", clutch " +
                                  juce::String(assignment.clutch));
    }
    break;
  }

  case Step::Complete:
    break;
  }
  return BridgeResult::ok();
}
