/*
  ==============================================================================
    Source/Tests/BridgeSessionTest.h
    Role: Coordinator state machine end to end over the mock backends:
    calibration, disconnect / reconnect, grace expiry, host release,
    backend failures.
  ==============================================================================
*/
#pragma once
#include "../Core/BridgeSession.h"
#include "MockBackends.h"

struct BridgeSessionTest {
  static BridgeConfig testConfig(int graceMs = 5000) {
    BridgeConfig c;
    c.restCaptureMs = 20;
    c.motionCaptureMs = 40;
    c.reconnectGraceMs = graceMs;
    c.effectWaitMs = 5;
    return c;
  }

  static CalibrationProfile storedProfile() {
    CalibrationProfile p;
    p.device = TestData::makeWheel().identity;
    for (auto &d : TestData::makeWheel().axes) {
      AxisCalibration a;
      a.role = d.role;
      a.effectiveMin = d.rawMin;
      a.effectiveMax = d.rawMax;
      a.center = d.role == AxisRole::Steering ? 512 : 0;
      a.deadzone = 0.03 * (d.rawMax - d.rawMin) / 2.0;
      p.axes.push_back(a);
    }
    return p;
  }

  /** Idle -> Enumerated -> Calibrating -> Active with a stored profile. */
  static bool activateStored(BridgeSession &session) {
    return session.discover().wasOk() && session.beginCalibration().wasOk() &&
           session.useStoredProfile(storedProfile()).wasOk() && session.activate().wasOk() &&
           session.getState() == SessionState::Active;
  }

  static void dispatchWhile(BridgeSession &session, SessionState state, int rounds = 200) {
    for (int i = 0; i < rounds && session.getState() == state; ++i)
      session.dispatchSignals(10);
  }

  static bool runTransitions() {
    using S = SessionState;
    return BridgeSession::isValidTransition(S::Idle, S::Enumerated) &&
           BridgeSession::isValidTransition(S::Enumerated, S::Calibrating) &&
           BridgeSession::isValidTransition(S::Calibrating, S::Active) &&
           BridgeSession::isValidTransition(S::Active, S::Suspended) &&
           BridgeSession::isValidTransition(S::Suspended, S::Active) &&
           BridgeSession::isValidTransition(S::Active, S::Terminated) &&
           BridgeSession::isValidTransition(S::Suspended, S::Terminated) &&
           BridgeSession::isValidTransition(S::Calibrating, S::Error) &&
           BridgeSession::isValidTransition(S::Error, S::Terminated) &&
           BridgeSession::isValidTransition(S::Idle, S::Terminated) &&
           BridgeSession::isValidTransition(S::Enumerated, S::Terminated) &&
           BridgeSession::isValidTransition(S::Calibrating, S::Terminated) &&
           !BridgeSession::isValidTransition(S::Error, S::Error) &&
           !BridgeSession::isValidTransition(S::Idle, S::Active) &&
           !BridgeSession::isValidTransition(S::Enumerated, S::Active) &&
           !BridgeSession::isValidTransition(S::Suspended, S::Calibrating) &&
           !BridgeSession::isValidTransition(S::Terminated, S::Active) &&
           !BridgeSession::isValidTransition(S::Terminated, S::Error) &&
           !BridgeSession::isValidTransition(S::Error, S::Active);
  }

  /** Calibrate a [0, 1023] wheel resting at 512, then bridge it. */
  static bool runSessionScenario() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());

    if (session.discover().failed() || session.getState() != SessionState::Enumerated)
      return false;
    if (session.beginCalibration().failed() || session.getState() != SessionState::Calibrating)
      return false;

    session.onCalibrationPhase = [&wheel](CalibrationService::Phase p) {
      wheel.setSweeping(p == CalibrationService::Phase::Motion);
    };
    auto r = session.calibrate(CalibrationWindow::fromConfig(session.getConfig()));
    wheel.setSweeping(false);
    if (r.failed())
      return false;

    auto profile = session.getProfile();
    const auto &steer = profile->axes[(size_t)profile->findAxis(AxisRole::Steering)];
    if (steer.effectiveMin != 0 || steer.effectiveMax != 1023 || steer.center != 512)
      return false;
    if (normalizeAxis(steer, 512) != 0.0f || normalizeAxis(steer, 1023) != 1.0f ||
        normalizeAxis(steer, 0) != -1.0f)
      return false;

    if (session.activate().failed() || session.getState() != SessionState::Active)
      return false;
    if (!waitUntil([&] { return pads.publishedFrames() > 5; }))
      return false;
    if (pads.lastState().axes[GamepadState::LeftStickX] != 0.0f)
      return false;

    wheel.setSample(TestData::makeSample(1023, 255, 0));
    if (!waitUntil([&] {
          auto gs = pads.lastState();
          return gs.axes[GamepadState::LeftStickX] == 1.0f &&
                 gs.axes[GamepadState::RightTrigger] == 1.0f;
        }))
      return false;

    session.shutdown();
    session.shutdown();
    return session.getState() == SessionState::Terminated && pads.isDestroyed() &&
           !wheel.deviceOpen() && session.getLastError() == ErrorKind::None;
  }

  /** Two live effects, wheel unplugged: both stopped and Suspended on return. */
  static bool runDisconnect() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());
    if (!activateStored(session))
      return false;

    pads.inject(MockVirtualGamepadBackend::constantUpload(1, 8000));
    pads.inject(MockVirtualGamepadBackend::constantUpload(2, -8000));
    if (!waitUntil([&] { return wheel.playingCount() == 2; }))
      return false;
    auto handles = wheel.playingHandles();

    wheel.unplug();
    dispatchWhile(session, SessionState::Active);

    if (session.getState() != SessionState::Suspended)
      return false;
    for (auto h : handles)
      if (!wheel.wasCalled(MockInputBackend::Call::Stop, h))
        return false;
    return wheel.playingCount() == 0 && !pads.isDestroyed() && !wheel.deviceOpen();
  }

  /** Same wheel back within the grace period: Active again, same profile. */
  static bool runReconnect() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());
    if (!activateStored(session))
      return false;

    auto before = session.getProfile();
    const int runs = session.getCalibrationRuns();

    wheel.unplug();
    dispatchWhile(session, SessionState::Active);
    if (session.getState() != SessionState::Suspended)
      return false;

    session.tick(); // still gone
    if (session.getState() != SessionState::Suspended)
      return false;

    wheel.plugBackIn();
    for (int i = 0; i < 100 && session.getState() == SessionState::Suspended; ++i) {
      session.tick();
      juce::Thread::sleep(10);
    }
    if (session.getState() != SessionState::Active)
      return false;
    if (session.getProfile().get() != before.get() || session.getCalibrationRuns() != runs)
      return false;
    if (wheel.openCount() != 2)
      return false;

    // Polling resumes with the kept profile
    wheel.setSample(TestData::makeSample(0, 0, 0));
    return waitUntil([&] { return pads.lastState().axes[GamepadState::LeftStickX] == -1.0f; });
  }

  /** Nobody plugs it back in: Terminated once the grace period runs out. */
  static bool runGraceExpiry() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig(30));
    if (!activateStored(session))
      return false;

    wheel.unplug();
    dispatchWhile(session, SessionState::Active);
    if (session.getState() != SessionState::Suspended)
      return false;

    juce::Thread::sleep(60);
    session.tick();
    return session.getState() == SessionState::Terminated && pads.isDestroyed() &&
           session.getLastError() == ErrorKind::Disconnected;
  }

  /** Host releases the pad: every effect stops and the session ends. */
  static bool runHostRelease() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());
    if (!activateStored(session))
      return false;

    pads.inject(MockVirtualGamepadBackend::constantUpload(5, 12000));
    if (!waitUntil([&] { return wheel.playingCount() == 1; }))
      return false;

    pads.inject(MockVirtualGamepadBackend::hostGone());
    dispatchWhile(session, SessionState::Active);
    return session.getState() == SessionState::Terminated && wheel.playingCount() == 0 &&
           wheel.loadedCount() == 0 && pads.isDestroyed() && !wheel.deviceOpen();
  }

  /** Slot pool exhausted: reported to the operator, bridge keeps running. */
  static bool runEffectExhaustion() {
    MockInputBackend wheel(TestData::makeWheel(), 4);
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());
    if (!activateStored(session))
      return false;
    if (pads.lastOptions.effectSlots != 4)
      return false;

    for (int id = 1; id <= 5; ++id)
      pads.inject(MockVirtualGamepadBackend::constantUpload(id, 1000));

    for (int i = 0; i < 200 && session.getLastError() == ErrorKind::None; ++i)
      session.dispatchSignals(10);
    return session.getLastError() == ErrorKind::ResourceExhausted &&
           session.getState() == SessionState::Active && wheel.playingCount() == 4;
  }

  /** Shutdown before activation releases the wheel and ends the session. */
  static bool runShutdownWhileCalibrating() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());
    if (session.discover().failed() || session.beginCalibration().failed() || !wheel.deviceOpen())
      return false;
    session.shutdown();
    return session.getState() == SessionState::Terminated && !wheel.deviceOpen() &&
           session.getLastError() == ErrorKind::None;
  }

  /** A burst of effect errors nobody drained still leaves room for the disconnect. */
  static bool runDisconnectAfterEffectErrors() {
    MockInputBackend wheel(TestData::makeWheel(), 4);
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());
    if (!activateStored(session))
      return false;

    for (int id = 1; id <= SignalQueue::capacity + 16; ++id)
      pads.inject(MockVirtualGamepadBackend::constantUpload(id, 1000));

    // Queue handed over, then one more full forwarder loop
    const auto &status = session.getStatus();
    if (!waitUntil([&] { return pads.pendingEvents() == 0; }))
      return false;
    const uint32_t beat = status.forwarderHeartbeat.load();
    if (!waitUntil([&] { return status.forwarderHeartbeat.load() > beat; }))
      return false;

    wheel.unplug();
    dispatchWhile(session, SessionState::Active);
    return session.getState() == SessionState::Suspended &&
           session.getLastError() == ErrorKind::ResourceExhausted && wheel.playingCount() == 0;
  }

  /** Virtual pad driver missing: Error, then everything released. */
  static bool runActivateFailure() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    pads.createFailure = ErrorKind::DriverUnavailable;
    BridgeSession session(wheel, pads, testConfig());

    bool sawError = false;
    session.onStateChanged = [&](SessionState, SessionState to) {
      if (to == SessionState::Error)
        sawError = true;
    };

    if (session.discover().failed() || session.beginCalibration().failed() ||
        session.useStoredProfile(storedProfile()).failed())
      return false;
    auto r = session.activate();
    return r.is(ErrorKind::DriverUnavailable) && r.domain() == ErrorDomain::Backend && sawError &&
           session.getState() == SessionState::Terminated &&
           session.getLastError() == ErrorKind::DriverUnavailable && !wheel.deviceOpen();
  }

  /** Open failures surface without leaving Enumerated; out-of-order calls are refused. */
  static bool runOpenFailures() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());

    if (session.activate().wasOk() || session.beginCalibration().wasOk())
      return false;
    if (session.discover().failed())
      return false;

    wheel.setDenyOpen(true);
    auto r = session.beginCalibration();
    if (!r.is(ErrorKind::PermissionDenied) || !requiresOperator(r.kind()) ||
        session.getState() != SessionState::Enumerated)
      return false;

    wheel.setDenyOpen(false);
    if (session.beginCalibration().failed())
      return false;
    // Calibration is required before activation
    return session.activate().failed() && session.getState() == SessionState::Calibrating;
  }

  /** Transient read errors are retried; the session never notices. */
  static bool runTransientIO() {
    MockInputBackend wheel(TestData::makeWheel());
    MockVirtualGamepadBackend pads;
    BridgeSession session(wheel, pads, testConfig());
    if (!activateStored(session))
      return false;

    const auto frames = pads.publishedFrames();
    wheel.injectIOErrors(2);
    if (!waitUntil([&] { return pads.publishedFrames() > frames + 10; }))
      return false;
    session.dispatchSignals(0);
    return session.getState() == SessionState::Active;
  }
};
