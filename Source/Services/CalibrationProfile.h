/*
  ==============================================================================
    Source/Services/CalibrationProfile.h
    Role: Per-axis calibration (center, deadzone, effective range), the
    normalization applied every tick, and ProfileSlot for whole-profile swaps.
  ==============================================================================
*/
#pragma once

#include "../Devices/DeviceTypes.h"
#include <atomic>
#include <memory>
#include <vector>

struct AxisCalibration {
  AxisRole role = AxisRole::Unmapped;
  int32_t center = 0;
  double deadzone = 0.0; // raw units, radius around center
  int32_t effectiveMin = 0;
  int32_t effectiveMax = 0;
  bool inverted = false; // steering: negated; pedals: pressing lowers raw

  bool isValid() const {
    return effectiveMin <= center && center <= effectiveMax && deadzone >= 0.0 &&
           deadzone < ((double)effectiveMax - (double)effectiveMin) / 2.0;
  }
};

/**
  Two-sided normalization to [-1, 1]. Within the deadzone radius of center the
  result is exactly 0; from the deadzone edge to effectiveMin/Max it is linear;
  beyond the effective range it clamps to -1/+1. Monotonic non-decreasing in
  raw (non-increasing when inverted).
*/
float normalizeAxis(const AxisCalibration &axis, int32_t raw);

/**
  One-sided normalization to [0, 1] for pedals, measured from the resting end
  (center) towards effectiveMin when inverted, else towards whichever extreme
  is farther away.
*/
float normalizePedal(const AxisCalibration &axis, int32_t raw);

struct CalibrationProfile {
  DeviceIdentity device;
  std::vector<AxisCalibration> axes; // indexed like PhysicalDevice::axes
  int shiftUpButton = -1;
  int shiftDownButton = -1;

  int findAxis(AxisRole role) const {
    for (size_t i = 0; i < axes.size(); ++i)
      if (axes[i].role == role)
        return (int)i;
    return -1;
  }

  bool isValid() const;

  /** Profile shape must match the device (axis count) to be reused. */
  bool fits(const PhysicalDevice &d) const {
    return device.sameModel(d.identity) && axes.size() == d.axes.size();
  }

  juce::var toVar() const;
  static bool fromVar(const juce::var &v, CalibrationProfile &out);
};

/**
  Holds the live profile. Readers (polling thread) take a snapshot per tick;
  re-calibration swaps the whole object so nobody sees a half-updated profile.
*/
class ProfileSlot {
public:
  using Ptr = std::shared_ptr<const CalibrationProfile>;

  Ptr get() const { return std::atomic_load(&current); }

  Ptr replace(Ptr next) { return std::atomic_exchange(&current, std::move(next)); }

private:
  Ptr current;
};
