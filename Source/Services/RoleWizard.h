/*
  ==============================================================================
    Source/Services/RoleWizard.h
    Role: Guided discovery of which axis is steering / throttle / brake /
    clutch and which buttons shift up / down. Each step compares the sample
    at confirmation against the sample at the start of the step.
  ==============================================================================
*/
#pragma once

#include "../Core/BridgeResult.h"
#include "../Devices/DeviceTypes.h"

struct RoleAssignment {
  int steering = -1;
  int throttle = -1;
  int brake = -1;
  int clutch = -1;
  bool steeringInverted = false;
  // Pedals whose raw value falls when pressed
  bool throttleInverted = false;
  bool brakeInverted = false;
  bool clutchInverted = false;
  int shiftUpButton = -1;
  int shiftDownButton = -1;

  bool isComplete() const {
    return steering >= 0 && throttle >= 0 && brake >= 0 && shiftUpButton >= 0 &&
           shiftDownButton >= 0;
  }

  std::vector<AxisRole> rolesFor(size_t numAxes) const;
};

class RoleWizard {
public:
  enum class Step {
    Welcome,
    SteeringLeft,
    SteeringRight,
    ThrottlePressed,
    ThrottleReleased,
    BrakePressed,
    BrakeReleased,
    ClutchPressed,
    ClutchReleased,
    ShiftUp,
    ShiftDown,
    Complete
  };

  // Fraction of an axis' raw span that counts as deliberate movement
  static constexpr double movementThreshold = 0.025;

  explicit RoleWizard(const PhysicalDevice &device) : device(device) {}

  Step getStep() const { return step; }
  bool isComplete() const { return step == Step::Complete; }
  static const char *getInstructions(Step s);
  static bool canSkip(Step s) { return s == Step::ClutchPressed || s == Step::ClutchReleased; }

  /**
    Confirms the current step with the device state right now. On failure
    (nothing moved, wrong axis) the step is not advanced.
  */
  BridgeResult advance(const RawSample &current);

  /** Clutch steps only. */
  void skip(const RawSample &current);

  const RoleAssignment &getAssignment() const { return assignment; }

private:
  int mostMovedAxis(const RawSample &current) const;
  int newlyPressedButton(const RawSample &current) const;
  void moveTo(Step next, const RawSample &current);

  PhysicalDevice device;
  Step step = Step::Welcome;
  RawSample stepStart;
  RoleAssignment assignment;
  int32_t steeringLeftValue = 0;
  int32_t pedalPressedValue = 0;
};
