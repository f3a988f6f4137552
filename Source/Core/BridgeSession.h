/*
  ==============================================================================
    Source/Core/BridgeSession.h
    Role: Coordinator and aggregate root of one wheel <-> virtual pad bridge.
    Owns the opened wheel, the live calibration profile, the virtual pad,
    the effect table and both workers, and drives the session state machine.
    All public methods are called from one thread (the entry point's).
  ==============================================================================
*/
#pragma once

#include "../Devices/DeviceBackend.h"
#include "../Devices/VirtualGamepad.h"
#include "../Services/CalibrationService.h"
#include "../Services/RoleWizard.h"
#include "BridgeSettings.h"
#include "SignalQueue.h"
#include <functional>
#include <memory>

class ForceFeedbackTranslator;
class EffectForwardingWorker;
class InputPollingWorker;

class BridgeSession {
public:
  BridgeSession(InputDeviceBackend &inputBackend, VirtualGamepadBackend &padBackend,
                const BridgeConfig &config);
  ~BridgeSession();

  // Idle -> Enumerated. NotFound when no wheel is attached.
  BridgeResult discover();

  // Enumerated -> Calibrating. Opens (and grabs) the selected wheel.
  BridgeResult beginCalibration();

  /**
    Captures rest + full motion and installs the resulting profile. Stays in
    Calibrating; InsufficientMovement leaves any previous profile in place.
    Roles come from the assignment when given, else from the device's guesses.
  */
  BridgeResult calibrate(const CalibrationWindow &window,
                         const RoleAssignment *assignment = nullptr);

  // Calibrating only. Skips the capture for a wheel model seen before.
  BridgeResult useStoredProfile(const CalibrationProfile &profile);

  // Active / Suspended: swaps the live profile without pausing the poller.
  BridgeResult recalibrate(const CalibrationProfile &profile);

  // Calibrating -> Active. Creates the virtual pad and starts both workers.
  BridgeResult activate();

  /**
    Waits up to timeoutMs for worker signals and acts on all of them before
    returning (disconnects suspend, host release terminates, backend
    failures go through Error). Returns the number handled.
  */
  int dispatchSignals(int timeoutMs);

  // Reconnect detection and grace-period expiry while Suspended.
  void tick();

  // Idempotent, from any non-terminal state. Stops every effect and
  // destroys the pad before returning.
  void shutdown();

  SessionState getState() const { return state; }
  ErrorKind getLastError() const { return lastError; }
  /**
    Lifecycle edges: Idle -> Enumerated -> Calibrating -> Active <-> Suspended,
    Active / Suspended -> Terminated, any non-terminal state other than Error
    -> Error, Error -> Terminated. Idle, Enumerated and Calibrating may also go
    straight to Terminated so that shutdown() before activation releases the
    opened wheel without passing through Error.
  */
  static bool isValidTransition(SessionState from, SessionState to);

  /** Reads the opened wheel directly; Calibrating only (role wizard). */
  BridgeResult readSample(int timeoutMs, RawSample &sample);

  const std::vector<PhysicalDevice> &getCandidates() const { return candidates; }
  const PhysicalDevice &getSelectedDevice() const { return selected; }
  ProfileSlot::Ptr getProfile() const { return profile.get(); }
  int getCalibrationRuns() const { return calibrationRuns; }
  const SessionStatus &getStatus() const { return status; }
  const BridgeConfig &getConfig() const { return config; }

  std::function<void(SessionState from, SessionState to)> onStateChanged;
  std::function<void(CalibrationService::Phase)> onCalibrationPhase;

private:
  bool transitionTo(SessionState next);
  void fail(ErrorKind kind, const juce::String &why);
  void handleSignal(const SessionSignal &s);
  void suspend();
  bool tryReconnect();
  void startPoller();
  void teardown();
  int effectCapacity() const;

  InputDeviceBackend &inputBackend;
  VirtualGamepadBackend &padBackend;
  const BridgeConfig config;

  SessionState state = SessionState::Idle;
  ErrorKind lastError = ErrorKind::None;
  SessionStatus status;
  SignalQueue signals;

  std::vector<PhysicalDevice> candidates;
  PhysicalDevice selected;
  ProfileSlot profile;
  int calibrationRuns = 0;

  double suspendedAtMs = 0.0;
  double lastReconnectAttemptMs = 0.0;

  // Destroyed bottom-up: workers first, wheel last
  std::unique_ptr<ScopedDevice> device;
  std::unique_ptr<VirtualController> pad;
  std::unique_ptr<ForceFeedbackTranslator> translator;
  std::unique_ptr<EffectForwardingWorker> forwarder;
  std::unique_ptr<InputPollingWorker> poller;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(BridgeSession)
};
