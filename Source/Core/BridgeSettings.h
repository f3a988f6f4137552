#pragma once
#include <atomic>
#include <cstdint>
#include <juce_core/juce_core.h>

/**
 * BridgeConfig
 *
 * Immutable policy snapshot handed to the session and its workers at start.
 * Produced by ConfigManager::snapshot(); never mutated after a session
 * starts. This header MUST NOT include any other project headers.
 */
struct BridgeConfig {
  // Input cadence (>= 125 Hz for racing input)
  double tickRateHz = 250.0;

  // Calibration policy
  float deadzoneFraction = 0.03f;     // of half-range
  float rangeMarginFraction = 0.01f;  // outward, clamped to raw range
  float minMovementFraction = 0.05f;  // of raw span, per mapped axis
  int restCaptureMs = 500;
  int motionCaptureMs = 5000;

  // Resilience
  int reconnectGraceMs = 5000;
  int ioRetryCount = 3;

  // Force feedback
  int effectSlots = 16;
  int effectWaitMs = 10;
  float ffGain = 1.0f;

  // Layout
  bool dedicatedSteeringAxis = false;
  juce::String preferredDevice;

  int getTickPeriodMs() const {
    return juce::jmax(1, juce::roundToInt(1000.0 / tickRateHz));
  }
};

enum class SessionState { Idle, Enumerated, Calibrating, Active, Suspended, Terminated, Error };

inline const char *sessionStateName(SessionState s) {
  switch (s) {
  case SessionState::Idle:        return "Idle";
  case SessionState::Enumerated:  return "Enumerated";
  case SessionState::Calibrating: return "Calibrating";
  case SessionState::Active:      return "Active";
  case SessionState::Suspended:   return "Suspended";
  case SessionState::Terminated:  return "Terminated";
  case SessionState::Error:       return "Error";
  }
  return "Unknown";
}

/**
 * SessionStatus
 *
 * Thread-safe mirror of the coordinator's state for the operator surface.
 * Written by BridgeSession, read by anyone.
 */
struct SessionStatus {
  std::atomic<int> state{static_cast<int>(SessionState::Idle)};
  std::atomic<int> lastError{0}; // ErrorKind
  std::atomic<uint32_t> publishedFrames{0};
  std::atomic<uint32_t> forwardedEffects{0};
  std::atomic<int> activeEffects{0};

  // Loop counters of the two workers (thread health)
  std::atomic<uint32_t> pollerHeartbeat{0};
  std::atomic<uint32_t> forwarderHeartbeat{0};
};
