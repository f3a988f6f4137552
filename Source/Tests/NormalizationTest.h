/*
  ==============================================================================
    Source/Tests/NormalizationTest.h
    Role: Axis normalization: deadzone is exactly zero, ends map to +/-1,
    monotonic in between, pedals one-sided.
  ==============================================================================
*/
#pragma once
#include "../Services/CalibrationProfile.h"
#include <cmath>

struct NormalizationTest {
  static AxisCalibration steering10Bit() {
    AxisCalibration a;
    a.role = AxisRole::Steering;
    a.center = 512;
    a.deadzone = 0.03 * 511.5;
    a.effectiveMin = 0;
    a.effectiveMax = 1023;
    return a;
  }

  /** 512 -> 0, 1023 -> 1, 0 -> -1 with the default 3% deadzone. */
  static bool run() {
    auto a = steering10Bit();
    if (!a.isValid())
      return false;
    if (normalizeAxis(a, 512) != 0.0f)
      return false;
    if (normalizeAxis(a, 1023) != 1.0f)
      return false;
    if (normalizeAxis(a, 0) != -1.0f)
      return false;
    // Beyond the effective range clamps
    return normalizeAxis(a, 5000) == 1.0f && normalizeAxis(a, -5000) == -1.0f;
  }

  /** Every raw value within the deadzone radius is exactly 0. */
  static bool runDeadzone() {
    auto a = steering10Bit();
    for (int r = 0; r <= 1023; ++r) {
      const float n = normalizeAxis(a, r);
      const bool inside = std::abs((double)r - a.center) <= a.deadzone;
      if (inside && n != 0.0f)
        return false;
      if (!inside && n == 0.0f)
        return false;
    }
    return true;
  }

  /** In range and non-decreasing over the whole raw span; reversed when inverted. */
  static bool runMonotonic() {
    auto a = steering10Bit();
    a.center = 300; // off-center rest: both halves still reach +/-1
    float previous = -2.0f;
    for (int r = a.effectiveMin; r <= a.effectiveMax; ++r) {
      const float n = normalizeAxis(a, r);
      if (n < -1.0f || n > 1.0f || n < previous)
        return false;
      previous = n;
    }

    a.inverted = true;
    return normalizeAxis(a, 0) == 1.0f && normalizeAxis(a, 1023) == -1.0f;
  }

  static bool runPedal() {
    AxisCalibration p;
    p.role = AxisRole::Throttle;
    p.center = 0;
    p.deadzone = 0.03 * 127.5;
    p.effectiveMin = 0;
    p.effectiveMax = 255;
    if (normalizePedal(p, 0) != 0.0f || normalizePedal(p, 255) != 1.0f)
      return false;
    if (normalizePedal(p, 3) != 0.0f)
      return false;
    float previous = 0.0f;
    for (int r = 0; r <= 255; ++r) {
      const float n = normalizePedal(p, r);
      if (n < previous || n > 1.0f)
        return false;
      previous = n;
    }

    // Pedal that rests at the top of its range and reads lower when pressed
    p.center = 255;
    if (normalizePedal(p, 255) != 0.0f || normalizePedal(p, 0) != 1.0f ||
        normalizePedal(p, 128) <= 0.4f || normalizePedal(p, 128) >= 0.6f)
      return false;

    // Mid-range rest: the farther extreme wins unless marked inverted
    p.center = 100;
    if (normalizePedal(p, 255) != 1.0f || normalizePedal(p, 0) != 0.0f)
      return false;
    p.inverted = true;
    return normalizePedal(p, 0) == 1.0f && normalizePedal(p, 255) == 0.0f;
  }
};
