/*
  ==============================================================================
    Source/Core/BridgeResult.h
    Role: Error taxonomy (device / calibration / backend) and a Result-style
    return value carrying the failure kind.
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>

enum class ErrorKind {
  None = 0,
  // Device
  NotFound,
  PermissionDenied,
  AlreadyOpen,
  Disconnected,
  IOError,
  Unsupported,
  ResourceExhausted,
  // Calibration
  InsufficientMovement,
  // Backend
  DriverUnavailable,
  VirtualControllerCreationFailed
};

enum class ErrorDomain { None, Device, Calibration, Backend };

inline ErrorDomain domainOf(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return ErrorDomain::None;
  case ErrorKind::InsufficientMovement:
    return ErrorDomain::Calibration;
  case ErrorKind::DriverUnavailable:
  case ErrorKind::VirtualControllerCreationFailed:
    return ErrorDomain::Backend;
  default:
    return ErrorDomain::Device;
  }
}

inline const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:                            return "None";
  case ErrorKind::NotFound:                        return "NotFound";
  case ErrorKind::PermissionDenied:                return "PermissionDenied";
  case ErrorKind::AlreadyOpen:                     return "AlreadyOpen";
  case ErrorKind::Disconnected:                    return "Disconnected";
  case ErrorKind::IOError:                         return "IOError";
  case ErrorKind::Unsupported:                     return "Unsupported";
  case ErrorKind::ResourceExhausted:               return "ResourceExhausted";
  case ErrorKind::InsufficientMovement:            return "InsufficientMovement";
  case ErrorKind::DriverUnavailable:               return "DriverUnavailable";
  case ErrorKind::VirtualControllerCreationFailed: return "VirtualControllerCreationFailed";
  }
  return "Unknown";
}

/** Failures that need a human (permissions, missing driver, slot pool). Never retried. */
inline bool requiresOperator(ErrorKind kind) {
  return kind == ErrorKind::PermissionDenied ||
         kind == ErrorKind::DriverUnavailable ||
         kind == ErrorKind::ResourceExhausted;
}

/**
  Same shape as juce::Result, plus the ErrorKind so callers can branch on
  Disconnected / IOError without string matching.
*/
class BridgeResult {
public:
  static BridgeResult ok() { return BridgeResult(ErrorKind::None, {}); }

  static BridgeResult fail(ErrorKind kind, const juce::String &message) {
    jassert(kind != ErrorKind::None);
    return BridgeResult(kind, message.isEmpty() ? juce::String(errorKindName(kind))
                                                : message);
  }

  bool wasOk() const noexcept { return errorKind == ErrorKind::None; }
  bool failed() const noexcept { return errorKind != ErrorKind::None; }
  explicit operator bool() const noexcept { return wasOk(); }

  ErrorKind kind() const noexcept { return errorKind; }
  ErrorDomain domain() const noexcept { return domainOf(errorKind); }
  bool is(ErrorKind k) const noexcept { return errorKind == k; }

  const juce::String &getErrorMessage() const noexcept { return message; }

  /** "Kind: message" for log lines. */
  juce::String describe() const {
    if (wasOk())
      return "OK";
    return juce::String(errorKindName(errorKind)) + ": " + message;
  }

private:
  BridgeResult(ErrorKind k, juce::String msg) : errorKind(k), message(std::move(msg)) {}

  ErrorKind errorKind = ErrorKind::None;
  juce::String message;
};
