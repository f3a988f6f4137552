/*
  ==============================================================================
    Source/Services/EffectCommand.h
    Role: Backend-agnostic force-feedback command. Magnitudes are signed and
    normalized to [-1, 1]; direction is degrees, 90 = pull left, 270 = right.
  ==============================================================================
*/
#pragma once
#include "../Devices/DeviceTypes.h"
#include <optional>

enum class EffectKind { ConstantForce, Periodic, Spring, Ramp, Stop };

inline const char *effectKindName(EffectKind k) {
  switch (k) {
  case EffectKind::ConstantForce: return "ConstantForce";
  case EffectKind::Periodic:      return "Periodic";
  case EffectKind::Spring:        return "Spring";
  case EffectKind::Ramp:          return "Ramp";
  case EffectKind::Stop:          return "Stop";
  }
  return "Unknown";
}

struct EffectEnvelope {
  int attackMs = 0;
  float attackLevel = 0.0f; // [0, 1]
  float sustainLevel = 0.0f;
  int releaseMs = 0;
  float releaseLevel = 0.0f;
};

struct EffectCommand {
  EffectKind kind = EffectKind::ConstantForce;
  float magnitude = 0.0f;       // periodic amplitude, spring coefficient, ramp start
  double directionDeg = 0.0;    // [0, 360)
  std::optional<int> durationMs; // empty = until stopped
  std::optional<EffectEnvelope> envelope;
  int delayMs = 0;

  // Periodic
  Waveform waveform = Waveform::Sine;
  int periodMs = 0;
  float offset = 0.0f;

  // Spring / damper
  bool damper = false;
  float saturation = 1.0f; // [0, 1]
  float deadband = 0.0f;   // [0, 1]
  float center = 0.0f;     // [-1, 1]

  // Ramp
  float endMagnitude = 0.0f;
};
