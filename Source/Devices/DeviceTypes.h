/*
  ==============================================================================
    Source/Devices/DeviceTypes.h
    Role: Platform-neutral description of a wheel (identity, axes, buttons,
    FFB capability), raw samples, and the native 16-bit effect encoding.
  ==============================================================================
*/
#pragma once

#include <array>
#include <bitset>
#include <cstdint>
#include <vector>
#include <juce_core/juce_core.h>

enum class AxisRole { Unmapped, Steering, Throttle, Brake, Clutch };

inline const char *axisRoleName(AxisRole role) {
  switch (role) {
  case AxisRole::Steering: return "steering";
  case AxisRole::Throttle: return "throttle";
  case AxisRole::Brake:    return "brake";
  case AxisRole::Clutch:   return "clutch";
  default:                 return "unmapped";
  }
}

inline AxisRole axisRoleFromName(const juce::String &name) {
  if (name == "steering") return AxisRole::Steering;
  if (name == "throttle") return AxisRole::Throttle;
  if (name == "brake")    return AxisRole::Brake;
  if (name == "clutch")   return AxisRole::Clutch;
  return AxisRole::Unmapped;
}

/** Pedals report 0..1 from their resting end; steering is two-sided. */
inline bool isPedalRole(AxisRole role) {
  return role == AxisRole::Throttle || role == AxisRole::Brake || role == AxisRole::Clutch;
}

struct DeviceIdentity {
  uint16_t vendorId = 0;
  uint16_t productId = 0;
  juce::String path; // evdev node or DirectInput instance GUID

  /** "vvvv:pppp", lower-case hex. Key for stored calibration. */
  juce::String getModelKey() const {
    return juce::String::toHexString((int)vendorId).paddedLeft('0', 4) + ":" +
           juce::String::toHexString((int)productId).paddedLeft('0', 4);
  }

  bool sameModel(const DeviceIdentity &other) const {
    return vendorId == other.vendorId && productId == other.productId;
  }

  /** Reconnect match: vendor, product and path. */
  bool matches(const DeviceIdentity &other) const {
    return sameModel(other) && path == other.path;
  }
};

struct AxisDescriptor {
  int code = 0; // ABS_* on evdev, DIJOYSTATE2 field index on DirectInput
  juce::String name;
  int32_t rawMin = 0;
  int32_t rawMax = 0;
  AxisRole role = AxisRole::Unmapped;

  int64_t getSpan() const { return (int64_t)rawMax - (int64_t)rawMin; }
};

struct ButtonDescriptor {
  int code = 0;
  juce::String name;
};

struct PhysicalDevice {
  DeviceIdentity identity;
  juce::String name;
  std::vector<AxisDescriptor> axes;
  std::vector<ButtonDescriptor> buttons;
  bool hasForceFeedback = false;
  int effectSlots = 0; // concurrent effects the driver accepts, 0 if unknown

  int findAxis(AxisRole role) const {
    for (size_t i = 0; i < axes.size(); ++i)
      if (axes[i].role == role)
        return (int)i;
    return -1;
  }
};

static constexpr int kMaxAxes = 8;
static constexpr int kMaxButtons = 128;

/** One poll result. Indices match PhysicalDevice::axes / buttons. */
struct RawSample {
  std::array<int32_t, kMaxAxes> axes{};
  int numAxes = 0;
  std::bitset<kMaxButtons> buttons;
  uint32_t sequence = 0;
};

using DeviceHandle = int;
using NativeEffectHandle = int;
static constexpr int kInvalidHandle = -1;

enum class NativeEffectType { Constant, Periodic, Spring, Damper, Ramp, Rumble };
enum class Waveform { Sine, Square, Triangle, SawUp, SawDown };

/**
  Native force-feedback parameters in the 16-bit integer encoding used by the
  Linux FF API (direction 0x4000 = 90 degrees, levels in [-0x7fff, 0x7fff],
  times in ms). The DirectInput backend rescales from this to DI units.
*/
struct NativeEffect {
  NativeEffectType type = NativeEffectType::Constant;
  uint16_t direction = 0;
  uint16_t replayLength = 0; // ms, 0 = infinite
  uint16_t replayDelay = 0;

  uint16_t attackLength = 0;
  uint16_t attackLevel = 0;
  uint16_t fadeLength = 0;
  uint16_t fadeLevel = 0;

  int16_t level = 0;    // constant level, periodic magnitude, ramp start, condition coefficient
  int16_t endLevel = 0; // ramp end

  Waveform waveform = Waveform::Sine;
  uint16_t period = 0; // ms
  int16_t offset = 0;

  uint16_t saturation = 0xffff;
  uint16_t deadband = 0;
  int16_t center = 0;

  uint16_t strongMagnitude = 0; // rumble only
  uint16_t weakMagnitude = 0;

  bool hasEnvelope() const {
    return attackLength != 0 || attackLevel != 0 || fadeLength != 0 || fadeLevel != 0;
  }
};
