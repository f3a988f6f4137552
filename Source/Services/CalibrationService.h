/*
  ==============================================================================
    Source/Services/CalibrationService.h
    Role: Learns per-axis center/deadzone/effective range from a resting phase
    and a full-motion phase, producing an immutable CalibrationProfile.
  ==============================================================================
*/
#pragma once

#include "../Core/BridgeResult.h"
#include "../Core/BridgeSettings.h"
#include "CalibrationProfile.h"
#include <functional>

class ScopedDevice;

struct CalibrationWindow {
  int restMs = 500;    // hands off: center is the mean of these samples
  int motionMs = 5000; // lock to lock, every pedal fully
  int pollTimeoutMs = 4;

  static CalibrationWindow fromConfig(const BridgeConfig &c) {
    CalibrationWindow w;
    w.restMs = c.restCaptureMs;
    w.motionMs = c.motionCaptureMs;
    return w;
  }
};

/** Sample accumulator. Feed resting samples first, then motion samples. */
class AxisRangeCalibrator {
public:
  AxisRangeCalibrator(const PhysicalDevice &device, std::vector<AxisRole> roles,
                      const BridgeConfig &config);

  void addRestingSample(const RawSample &s);
  void addMotionSample(const RawSample &s);

  /** InsufficientMovement when a mapped axis barely moved. */
  BridgeResult finish(CalibrationProfile &out) const;

private:
  struct Observed {
    int32_t min = 0;
    int32_t max = 0;
    bool seen = false;
    int64_t restSum = 0;
    int restCount = 0;
  };

  void track(const RawSample &s);

  PhysicalDevice device;
  std::vector<AxisRole> roles;
  float deadzoneFraction;
  float marginFraction;
  float minMovementFraction;
  std::vector<Observed> observed;
};

class CalibrationService {
public:
  enum class Phase { Resting, Motion };

  /**
    Drives the two capture phases against an open device. Blocks for
    window.restMs + window.motionMs. Disconnected aborts.
  */
  static BridgeResult calibrate(ScopedDevice &device, const std::vector<AxisRole> &roles,
                                const CalibrationWindow &window, const BridgeConfig &config,
                                CalibrationProfile &out,
                                const std::function<void(Phase)> &onPhase = nullptr);

  /** Roles from the device's own guesses. */
  static std::vector<AxisRole> defaultRoles(const PhysicalDevice &device);
};
