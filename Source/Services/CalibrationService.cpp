/*
  ==============================================================================
    Source/Services/CalibrationService.cpp
    Role: Range tracking and profile derivation.
  ==============================================================================
*/
#include "CalibrationService.h"
#include "../Core/LogService.h"
#include "../Devices/DeviceBackend.h"
#include <cmath>

AxisRangeCalibrator::AxisRangeCalibrator(const PhysicalDevice &d, std::vector<AxisRole> r,
                                         const BridgeConfig &config)
    : device(d), roles(std::move(r)), deadzoneFraction(config.deadzoneFraction),
      marginFraction(config.rangeMarginFraction),
      minMovementFraction(config.minMovementFraction), observed(d.axes.size()) {
  roles.resize(device.axes.size(), AxisRole::Unmapped);
}

void AxisRangeCalibrator::track(const RawSample &s) {
  const size_t n = juce::jmin(observed.size(), (size_t)s.numAxes);
  for (size_t i = 0; i < n; ++i) {
    auto &o = observed[i];
    const int32_t v = s.axes[i];
    if (!o.seen) {
      o.min = o.max = v;
      o.seen = true;
    } else {
      o.min = juce::jmin(o.min, v);
      o.max = juce::jmax(o.max, v);
    }
  }
}

void AxisRangeCalibrator::addRestingSample(const RawSample &s) {
  track(s);
  const size_t n = juce::jmin(observed.size(), (size_t)s.numAxes);
  for (size_t i = 0; i < n; ++i) {
    observed[i].restSum += s.axes[i];
    observed[i].restCount++;
  }
}

void AxisRangeCalibrator::addMotionSample(const RawSample &s) { track(s); }

BridgeResult AxisRangeCalibrator::finish(CalibrationProfile &out) const {
  CalibrationProfile profile;
  profile.device = device.identity;

  for (size_t i = 0; i < device.axes.size(); ++i) {
    const auto &desc = device.axes[i];
    const auto &o = observed[i];
    AxisCalibration axis;
    axis.role = roles[i];

    int32_t rest;
    if (o.restCount > 0)
      rest = (int32_t)std::llround((double)o.restSum / o.restCount);
    else if (o.seen)
      rest = (int32_t)(((int64_t)o.min + o.max) / 2);
    else
      rest = (int32_t)(((int64_t)desc.rawMin + desc.rawMax) / 2);

    const int64_t rawSpan = desc.getSpan();
    const int64_t observedSpan = o.seen ? (int64_t)o.max - o.min : 0;
    const bool enoughMovement = (double)observedSpan >= (double)minMovementFraction * (double)rawSpan &&
                                observedSpan > 0;

    if (!enoughMovement) {
      if (axis.role != AxisRole::Unmapped)
        return BridgeResult::fail(ErrorKind::InsufficientMovement,
                                  "Axis " + desc.name + " (" + axisRoleName(axis.role) + ") moved " +
                                      juce::String((juce::int64)observedSpan) + " of " + juce::String((juce::int64)rawSpan));
      // Unused axis: keep the hardware range so the profile stays valid
      axis.effectiveMin = desc.rawMin;
      axis.effectiveMax = desc.rawMax;
    } else {
      const int64_t margin = (int64_t)std::llround(marginFraction * (double)observedSpan);
      axis.effectiveMin = (int32_t)juce::jmax((int64_t)desc.rawMin, (int64_t)o.min - margin);
      axis.effectiveMax = (int32_t)juce::jmin((int64_t)desc.rawMax, (int64_t)o.max + margin);
    }

    axis.center = juce::jlimit(axis.effectiveMin, axis.effectiveMax, rest);
    const double halfRange = ((double)axis.effectiveMax - (double)axis.effectiveMin) / 2.0;
    axis.deadzone = juce::jmax(0.0, deadzoneFraction * halfRange);
    if (axis.deadzone >= halfRange)
      axis.deadzone = halfRange * 0.5;

    profile.axes.push_back(axis);
  }

  if (!profile.isValid())
    return BridgeResult::fail(ErrorKind::InsufficientMovement, "Device reported a degenerate axis range");

  out = std::move(profile);
  return BridgeResult::ok();
}

std::vector<AxisRole> CalibrationService::defaultRoles(const PhysicalDevice &device) {
  std::vector<AxisRole> roles;
  for (auto &a : device.axes)
    roles.push_back(a.role);
  return roles;
}

BridgeResult CalibrationService::calibrate(ScopedDevice &device, const std::vector<AxisRole> &roles,
                                           const CalibrationWindow &window, const BridgeConfig &config,
                                           CalibrationProfile &out,
                                           const std::function<void(Phase)> &onPhase) {
  AxisRangeCalibrator calibrator(device.getDescription(), roles, config);
  RawSample sample;

  auto capture = [&](int durationMs, bool resting) {
    const auto end = juce::Time::getMillisecondCounterHiRes() + durationMs;
    do {
      auto r = device.poll(window.pollTimeoutMs, sample);
      if (r.failed())
        return r;
      if (resting)
        calibrator.addRestingSample(sample);
      else
        calibrator.addMotionSample(sample);
    } while (juce::Time::getMillisecondCounterHiRes() < end);
    return BridgeResult::ok();
  };

  if (onPhase)
    onPhase(Phase::Resting);
  auto r = capture(window.restMs, true);
  if (r.failed())
    return r;

  if (onPhase)
    onPhase(Phase::Motion);
  r = capture(window.motionMs, false);
  if (r.failed())
    return r;

  r = calibrator.finish(out);
  if (r.wasOk()) {
    for (size_t i = 0; i < out.axes.size(); ++i) {
      const auto &a = out.axes[i];
      if (a.role != AxisRole::Unmapped)
        LogService::instance().info(juce::String(axisRoleName(a.role)) + ": range [" +
                                    juce::String(a.effectiveMin) + ", " + juce::String(a.effectiveMax) +
                                    "], center " + juce::String(a.center) + ", deadzone " +
                                    juce::String(a.deadzone, 1));
    }
  }
  return r;
}
